#pragma once

#include "ports/input/ICostingService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IRecipeProvider.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис себестоимости
 *
 * WAC = Σ(unitCost × qtyRemaining) / Σ qtyRemaining по слоям с остатком.
 * Расход снимает количество со слоёв от старых к новым, поэтому стоимость
 * запасов по слоям всегда совпадает с суммой проведённых движений.
 */
class CostingService : public ports::input::ICostingService {
public:
    CostingService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IRecipeProvider> recipes,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , recipes_(std::move(recipes))
      , clock_(std::move(clock))
    {
        std::cout << "[CostingService] Created" << std::endl;
    }

    // ========================================================================
    // WAC
    // ========================================================================

    domain::Decimal getWac(
        const std::string& orgId,
        const std::string& itemId,
        const std::optional<std::string>& branchId = std::nullopt) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return getWac(session, orgId, itemId, branchId);
        });
    }

    domain::Decimal getWac(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& itemId,
        const std::optional<std::string>& branchId = std::nullopt)
    {
        domain::CostLayerQuery query;
        query.orgId = orgId;
        query.branchId = branchId;
        query.itemId = itemId;
        return weightedAverage(session.findCostLayers(query));
    }

    // ========================================================================
    // Техкарты и маржа
    // ========================================================================

    /**
     * @brief Себестоимость единицы блюда
     *
     * Ингредиенты невыбранных модификаторов исключаются целиком.
     */
    domain::Decimal getRecipeCost(
        const std::string& orgId,
        const std::string& targetId,
        const std::vector<domain::ModifierSelection>& modifiers = {}) override
    {
        auto ingredients = recipes_->getIngredients(orgId, targetId);

        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::Decimal cost;
            std::map<std::string, domain::Decimal> wacCache;

            for (const auto& ingredient : ingredients) {
                if (ingredient.modifierOptionId && !isSelected(modifiers, *ingredient.modifierOptionId)) {
                    continue;
                }
                auto it = wacCache.find(ingredient.itemId);
                if (it == wacCache.end()) {
                    it = wacCache.emplace(ingredient.itemId, getWac(session, orgId, ingredient.itemId)).first;
                }
                cost += ingredient.qtyPerUnit * it->second;
            }
            return cost;
        });
    }

    /**
     * @brief Себестоимость и маржа строки заказа
     *
     * lineNet = unitPrice × quantity + modifiersPrice - discount;
     * marginPct = 0, если lineNet == 0.
     */
    domain::ItemCosting calculateItemCosting(const domain::ItemCostingRequest& request) override {
        if (request.quantity.isNegative()) {
            throw domain::ValidationError("Costing quantity must not be negative");
        }

        domain::ItemCosting costing;
        costing.costUnit = getRecipeCost(request.orgId, request.targetId, request.modifiers);
        costing.costTotal = costing.costUnit * request.quantity;

        domain::Decimal lineNet = request.unitPrice * request.quantity + request.modifiersPrice - request.discount;
        costing.marginTotal = lineNet - costing.costTotal;
        costing.marginPct = lineNet.isZero()
            ? domain::Decimal::zero()
            : (costing.marginTotal * 100).divide(lineNet);

        return costing;
    }

    // ========================================================================
    // Слои себестоимости
    // ========================================================================

    domain::CostLayerResult createCostLayer(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& actor,
        const domain::CostLayerInput& input) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return createCostLayer(session, orgId, branchId, actor, input);
        });
    }

    domain::CostLayerResult createCostLayer(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& actor,
        const domain::CostLayerInput& input)
    {
        if (!input.qtyReceived.isPositive()) {
            throw domain::ValidationError("Cost layer quantity must be positive");
        }
        if (input.unitCost.isNegative()) {
            throw domain::ValidationError("Cost layer unit cost must not be negative");
        }

        domain::CostLayer layer;
        layer.id = utils::IdGenerator::uuid();
        layer.orgId = orgId;
        layer.branchId = branchId;
        layer.itemId = input.itemId;
        layer.locationId = input.locationId;
        layer.qtyReceived = input.qtyReceived;
        layer.qtyRemaining = input.qtyReceived;
        layer.unitCost = input.unitCost;
        layer.sourceType = input.sourceType;
        layer.sourceId = input.sourceId;
        layer.createdAt = clock_->now();
        layer.createdBy = actor;
        session.insertCostLayer(layer);

        domain::Decimal wacAfter = getWac(session, orgId, input.itemId, branchId);
        std::cout << "[CostingService] Layer " << layer.id << " " << input.itemId << " "
                  << layer.qtyReceived << " @ " << layer.unitCost << ", WAC " << wacAfter.toString(4) << std::endl;

        return domain::CostLayerResult{std::move(layer), wacAfter};
    }

    /**
     * @brief Снять qty со слоёв складского места, старые первыми
     *
     * Количество, не покрытое слоями, оценивается по текущему WAC филиала.
     * Складское место блокируется до чтения слоёв.
     */
    domain::CostConsumption consumeCostLayers(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId,
        const domain::Decimal& qty)
    {
        if (!qty.isPositive()) {
            throw domain::ValidationError("Consumed quantity must be positive");
        }

        session.lockStockKey({orgId, branchId, itemId, locationId});
        domain::Decimal wac = getWac(session, orgId, itemId, branchId);

        domain::CostLayerQuery query;
        query.orgId = orgId;
        query.branchId = branchId;
        query.itemId = itemId;
        query.locationId = locationId;
        query.forUpdate = true;

        domain::CostConsumption consumption;
        domain::Decimal remaining = qty;
        for (const auto& layer : session.findCostLayers(query)) {
            if (!remaining.isPositive()) break;
            domain::Decimal take = domain::Decimal::min(remaining, layer.qtyRemaining);
            session.updateCostLayerRemaining(layer.id, layer.qtyRemaining - take);
            consumption.consumed.push_back({layer.id, take});
            consumption.value += take * layer.unitCost;
            remaining -= take;
        }

        if (remaining.isPositive()) {
            std::cout << "[CostingService] " << remaining << " of " << itemId
                      << " not covered by cost layers, valued at WAC " << wac.toString(4) << std::endl;
            consumption.value += remaining * wac;
        }
        return consumption;
    }

    /**
     * @brief Вернуть ранее снятое количество в слои
     *
     * @throws InvariantViolationError остаток слоя превысил бы qtyReceived
     */
    void restoreCostLayers(ports::output::IStoreSession& session, const std::vector<domain::LayerConsumption>& consumed) {
        for (const auto& part : consumed) {
            auto layer = session.findCostLayer(part.layerId);
            if (!layer) {
                throw domain::NotFoundError("Cost layer " + part.layerId + " not found");
            }
            domain::Decimal restored = layer->qtyRemaining + part.qty;
            if (restored > layer->qtyReceived) {
                throw domain::InvariantViolationError(
                    "Cost layer " + part.layerId + " would exceed received quantity");
            }
            session.updateCostLayerRemaining(layer->id, restored);
        }
    }

    /**
     * @brief Оценка запасов филиала по товарам
     */
    std::vector<domain::ValuationRow> getValuation(const std::string& orgId, const std::string& branchId) override {
        auto layers = store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::CostLayerQuery query;
            query.orgId = orgId;
            query.branchId = branchId;
            return session.findCostLayers(query);
        });

        std::map<std::string, std::vector<domain::CostLayer>> byItem;
        for (auto& layer : layers) {
            byItem[layer.itemId].push_back(std::move(layer));
        }

        std::vector<domain::ValuationRow> rows;
        for (const auto& [itemId, itemLayers] : byItem) {
            domain::ValuationRow row;
            row.itemId = itemId;
            for (const auto& layer : itemLayers) {
                row.qty += layer.qtyRemaining;
                row.value += layer.qtyRemaining * layer.unitCost;
            }
            row.wac = weightedAverage(itemLayers);
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IRecipeProvider> recipes_;
    std::shared_ptr<ports::output::IClock> clock_;

    static domain::Decimal weightedAverage(const std::vector<domain::CostLayer>& layers) {
        domain::Decimal totalQty;
        domain::Decimal totalValue;
        for (const auto& layer : layers) {
            if (!layer.qtyRemaining.isPositive()) continue;
            totalQty += layer.qtyRemaining;
            totalValue += layer.qtyRemaining * layer.unitCost;
        }
        if (totalQty.isZero()) {
            return domain::Decimal::zero();
        }
        return totalValue.divide(totalQty);
    }

    static bool isSelected(const std::vector<domain::ModifierSelection>& modifiers, const std::string& optionId) {
        return std::any_of(modifiers.begin(), modifiers.end(),
            [&](const domain::ModifierSelection& m) { return m.id == optionId && m.selected; });
    }
};

} // namespace inventory::application
