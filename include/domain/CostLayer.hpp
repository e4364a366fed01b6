#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Слой себестоимости: количество и цена одного прихода
 *
 * WAC = Σ(unitCost × qtyRemaining) / Σ qtyRemaining по слоям с остатком.
 */
struct CostLayer {
    std::string id;
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;
    Decimal qtyReceived;
    Decimal qtyRemaining;
    Decimal unitCost;
    std::string sourceType;
    std::optional<std::string> sourceId;
    Timestamp createdAt;
    std::optional<std::string> createdBy;
};

struct CostLayerInput {
    std::string itemId;
    std::string locationId;
    Decimal qtyReceived;
    Decimal unitCost;
    std::string sourceType;
    std::optional<std::string> sourceId;
};

struct CostLayerResult {
    CostLayer layer;
    Decimal wacAfter;
};

/**
 * @brief Сколько списано из конкретного слоя
 */
struct LayerConsumption {
    std::string layerId;
    Decimal qty;
};

struct CostConsumption {
    Decimal value;                           ///< Себестоимость списанного
    std::vector<LayerConsumption> consumed;
};

/**
 * @brief Фильтр слоёв себестоимости (порядок выдачи: старые первыми)
 */
struct CostLayerQuery {
    std::string orgId;
    std::optional<std::string> branchId;
    std::optional<std::string> itemId;
    std::optional<std::string> locationId;
    bool onlyRemaining = true;
    bool forUpdate = false;      ///< Блокировать строки до конца транзакции
};

struct ValuationRow {
    std::string itemId;
    Decimal qty;
    Decimal wac;
    Decimal value;
};

} // namespace inventory::domain
