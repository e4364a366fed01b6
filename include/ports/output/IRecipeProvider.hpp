#pragma once

#include "domain/Recipe.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Источник техкарт (рецептур) для расчёта себестоимости
 */
class IRecipeProvider {
public:
    virtual ~IRecipeProvider() = default;

    /**
     * @brief Ингредиенты блюда; пустой вектор, если техкарты нет
     */
    virtual std::vector<domain::RecipeIngredient> getIngredients(
        const std::string& orgId, const std::string& targetId) = 0;
};

} // namespace inventory::ports::output
