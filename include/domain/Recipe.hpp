#pragma once

#include "Decimal.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Строка техкарты: сколько товара на единицу блюда
 *
 * modifierOptionId задан для ингредиентов модификатора: они учитываются
 * только если модификатор выбран.
 */
struct RecipeIngredient {
    std::string itemId;
    Decimal qtyPerUnit;
    std::optional<std::string> modifierOptionId;
};

struct ModifierSelection {
    std::string id;
    bool selected = false;
};

struct ItemCostingRequest {
    std::string orgId;
    std::string targetId;
    Decimal quantity;
    Decimal unitPrice;
    Decimal modifiersPrice;
    Decimal discount;
    std::vector<ModifierSelection> modifiers;
};

/**
 * @brief Себестоимость и маржа строки заказа
 */
struct ItemCosting {
    Decimal costUnit;
    Decimal costTotal;
    Decimal marginTotal;
    Decimal marginPct;
};

} // namespace inventory::domain
