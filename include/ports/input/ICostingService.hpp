#pragma once

#include "domain/CostLayer.hpp"
#include "domain/Recipe.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Себестоимость по средневзвешенной цене (WAC)
 */
class ICostingService {
public:
    virtual ~ICostingService() = default;

    /**
     * @brief WAC товара; 0, если количества нет
     */
    virtual domain::Decimal getWac(
        const std::string& orgId,
        const std::string& itemId,
        const std::optional<std::string>& branchId = std::nullopt) = 0;

    virtual domain::Decimal getRecipeCost(
        const std::string& orgId,
        const std::string& targetId,
        const std::vector<domain::ModifierSelection>& modifiers = {}) = 0;

    virtual domain::ItemCosting calculateItemCosting(const domain::ItemCostingRequest& request) = 0;

    virtual domain::CostLayerResult createCostLayer(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& actor,
        const domain::CostLayerInput& input) = 0;

    virtual std::vector<domain::ValuationRow> getValuation(const std::string& orgId, const std::string& branchId) = 0;
};

} // namespace inventory::ports::input
