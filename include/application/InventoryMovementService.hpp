#pragma once

#include "ports/input/IInventoryMovementService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "application/CostingService.hpp"
#include "application/GlPostingService.hpp"
#include "application/LedgerService.hpp"
#include "application/LotService.hpp"
#include "domain/Errors.hpp"
#include "domain/enums/SourceType.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <variant>

namespace inventory::application {

/**
 * @brief Оркестратор складских движений
 *
 * Каждая операция захватывает ключ идемпотентности документа и проводит
 * журнал, партии, слои себестоимости и GL в одной транзакции хранилища.
 *
 * - Нет маппинга GL: результат GL = FAILED, склад фиксируется
 * - Закрытый период: PeriodLockedError, не фиксируется ничего
 */
class InventoryMovementService : public ports::input::IInventoryMovementService {
public:
    static constexpr const char* kGoodsReceiptOp = "GOODS_RECEIPT";
    static constexpr const char* kDepletionOp = "DEPLETION";
    static constexpr const char* kWasteOp = "WASTE";
    static constexpr const char* kWasteVoidOp = "WASTE_VOID";
    static constexpr const char* kStocktakeOp = "STOCKTAKE";

    InventoryMovementService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<LedgerService> ledger,
        std::shared_ptr<LotService> lots,
        std::shared_ptr<CostingService> costing,
        std::shared_ptr<GlPostingService> gl,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , ledger_(std::move(ledger))
      , lots_(std::move(lots))
      , costing_(std::move(costing))
      , gl_(std::move(gl))
      , clock_(std::move(clock))
    {
        std::cout << "[InventoryMovementService] Created" << std::endl;
    }

    // ========================================================================
    // Приход
    // ========================================================================

    domain::ReceiptResult receiveGoods(const domain::ReceiptRequest& request) override {
        requireDocument(request.orgId, request.branchId, request.receiptId, "receiptId");
        if (request.lines.empty()) {
            throw domain::ValidationError("Goods receipt " + request.receiptId + " has no lines");
        }
        for (const auto& line : request.lines) {
            if (!line.qty.isPositive()) {
                throw domain::ValidationError("Receipt quantity must be positive for item " + line.itemId);
            }
            if (line.unitCost.isNegative()) {
                throw domain::ValidationError("Receipt unit cost must not be negative for item " + line.itemId);
            }
        }

        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            if (!claim(session, request.orgId, kGoodsReceiptOp, request.receiptId)) {
                return replayReceipt(session, request);
            }

            domain::ReceiptResult result;
            result.receiptId = request.receiptId;

            for (const auto& line : request.lines) {
                domain::Decimal value = line.qty * line.unitCost;

                auto layer = costing_->createCostLayer(session, request.orgId, request.branchId, request.actor, {
                    line.itemId, line.locationId, line.qty, line.unitCost,
                    domain::source_type::GOODS_RECEIPT, request.receiptId});

                std::optional<std::string> lotId;
                if (line.lotNumber) {
                    domain::CreateLotInput lot;
                    lot.orgId = request.orgId;
                    lot.branchId = request.branchId;
                    lot.itemId = line.itemId;
                    lot.locationId = line.locationId;
                    lot.lotNumber = *line.lotNumber;
                    lot.receivedQty = line.qty;
                    lot.unitCost = line.unitCost;
                    lot.expiryDate = line.expiryDate;
                    lot.sourceType = domain::source_type::GOODS_RECEIPT;
                    lot.sourceId = request.receiptId;
                    lot.createdBy = request.actor;
                    lotId = lots_->createLot(session, lot).id;
                }

                domain::RecordLedgerEntryRequest entry;
                entry.itemId = line.itemId;
                entry.locationId = line.locationId;
                entry.qty = line.qty;
                entry.reason = domain::LedgerReason::PURCHASE;
                entry.sourceType = domain::source_type::GOODS_RECEIPT;
                entry.sourceId = request.receiptId;
                entry.createdBy = request.actor;
                entry.metadata["value"] = value.toString();
                entry.metadata["unitCost"] = line.unitCost.toString();
                entry.metadata["costLayerId"] = layer.layer.id;
                if (lotId) entry.metadata["lotId"] = *lotId;

                auto posted = ledger_->recordEntry(session, request.orgId, request.branchId, entry);

                result.lines.push_back({posted.entry.id, layer.layer.id, lotId, posted.onHandAfter});
                result.ledgerEntryIds.push_back(posted.entry.id);
                result.totalValue += value;
            }

            result.gl = gl_->post(session, request.orgId, request.branchId, request.receiptId,
                                  domain::GoodsReceiptDocument{result.totalValue}, request.actor);

            std::cout << "[InventoryMovementService] Receipt " << request.receiptId << ": "
                      << result.lines.size() << " lines, value " << result.totalValue.toString(2)
                      << ", GL " << domain::toString(result.gl.status) << std::endl;
            return result;
        });
    }

    // ========================================================================
    // Списание
    // ========================================================================

    domain::IssueResult recordDepletion(const domain::IssueRequest& request) override {
        return issue(request, kDepletionOp, domain::LedgerReason::SALE, domain::source_type::ORDER,
                     [](const domain::Decimal& value) { return domain::GlDocument{domain::DepletionDocument{value}}; });
    }

    domain::IssueResult recordWaste(const domain::IssueRequest& request) override {
        return issue(request, kWasteOp, domain::LedgerReason::WASTAGE, domain::source_type::WASTAGE,
                     [](const domain::Decimal& value) { return domain::GlDocument{domain::WasteDocument{value}}; });
    }

    /**
     * @brief Отмена списания порчи
     *
     * Противоположные записи ADJUSTMENT (WASTAGE_VOID), возврат в партии
     * и слои себестоимости, сторно проводки GL.
     *
     * @throws NotFoundError документ порчи не найден
     */
    domain::VoidResult voidWaste(
        const std::string& orgId, const std::string& branchId,
        const std::string& wasteId, const std::string& actor) override
    {
        requireDocument(orgId, branchId, wasteId, "wasteId");

        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::VoidResult result;
            result.documentId = wasteId;

            if (!claim(session, orgId, kWasteVoidOp, wasteId)) {
                result.isAlreadyPosted = true;
                for (const auto& entry : documentEntries(session, orgId, branchId,
                                                         domain::source_type::WASTAGE_VOID, wasteId)) {
                    result.ledgerEntryIds.push_back(entry.id);
                    result.restoredValue += entry.value();
                }
                result.gl = replayGl(session, orgId, domain::WasteDocument::kVoidSource, wasteId);
                return result;
            }

            auto wasteEntries = documentEntries(session, orgId, branchId, domain::source_type::WASTAGE, wasteId);
            if (wasteEntries.empty()) {
                throw domain::NotFoundError("Waste document " + wasteId + " not found");
            }

            for (const auto& original : wasteEntries) {
                domain::RecordLedgerEntryRequest entry;
                entry.itemId = original.itemId;
                entry.locationId = original.locationId;
                entry.qty = -original.qty;
                entry.reason = domain::LedgerReason::ADJUSTMENT;
                entry.sourceType = domain::source_type::WASTAGE_VOID;
                entry.sourceId = wasteId;
                entry.notes = "Void of waste " + wasteId;
                entry.createdBy = actor;
                entry.metadata["value"] = (-original.value()).toString();
                entry.metadata["reversesEntryId"] = original.id;

                auto posted = ledger_->recordEntry(session, orgId, branchId, entry);
                result.ledgerEntryIds.push_back(posted.entry.id);
                result.restoredValue += -original.value();

                costing_->restoreCostLayers(session, consumedLayers(original));
            }

            for (const auto& allocation : session.findAllocationsBySource(orgId, domain::source_type::WASTAGE, wasteId)) {
                result.restoredLots.push_back(lots_->incrementLot(
                    session, orgId, allocation.lotId, allocation.allocatedQty,
                    domain::source_type::WASTAGE_VOID, wasteId));
            }

            result.gl = gl_->reverse<domain::WasteDocument>(session, orgId, branchId, wasteId, actor);

            std::cout << "[InventoryMovementService] Voided waste " << wasteId << ": "
                      << result.ledgerEntryIds.size() << " entries, value " << result.restoredValue.toString(2)
                      << ", GL " << domain::toString(result.gl.status) << std::endl;
            return result;
        });
    }

    // ========================================================================
    // Инвентаризация
    // ========================================================================

    /**
     * @brief Применить результаты пересчёта
     *
     * Излишек создаёт слой по текущему WAC, недостача снимает слои.
     * Итоговое отклонение (со знаком) проводится в GL одной проводкой.
     */
    domain::StocktakeResult applyStocktake(const domain::StocktakeRequest& request) override {
        requireDocument(request.orgId, request.branchId, request.sessionId, "sessionId");
        for (const auto& line : request.lines) {
            if (line.countedQty.isNegative()) {
                throw domain::ValidationError("Counted quantity must not be negative for item " + line.itemId);
            }
        }

        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::StocktakeResult result;
            result.sessionId = request.sessionId;

            if (!claim(session, request.orgId, kStocktakeOp, request.sessionId)) {
                result.isAlreadyPosted = true;
                for (const auto& entry : documentEntries(session, request.orgId, request.branchId,
                                                         domain::source_type::COUNT_SESSION, request.sessionId)) {
                    domain::StocktakeLineResult line;
                    line.itemId = entry.itemId;
                    line.locationId = entry.locationId;
                    line.delta = entry.qty;
                    line.value = entry.value();
                    line.ledgerEntryId = entry.id;
                    result.lines.push_back(line);
                    result.totalVariance += line.value;
                }
                result.gl = replayGl(session, request.orgId, domain::StocktakeDocument::kSource, request.sessionId);
                return result;
            }

            for (const auto& counted : request.lines) {
                domain::StockKey key{request.orgId, request.branchId, counted.itemId, counted.locationId};
                session.lockStockKey(key);

                domain::StocktakeLineResult line;
                line.itemId = counted.itemId;
                line.locationId = counted.locationId;
                line.expectedQty = session.sumOnHand(key);
                line.countedQty = counted.countedQty;
                line.delta = counted.countedQty - line.expectedQty;

                if (line.delta.isZero()) {
                    result.lines.push_back(line);
                    continue;
                }

                nlohmann::json metadata;
                metadata["expectedQty"] = line.expectedQty.toString();
                metadata["countedQty"] = line.countedQty.toString();

                if (line.delta.isPositive()) {
                    domain::Decimal wac = costing_->getWac(session, request.orgId, counted.itemId, request.branchId);
                    line.value = line.delta * wac;
                    metadata["unitCost"] = wac.toString();
                    if (wac.isPositive()) {
                        auto layer = costing_->createCostLayer(session, request.orgId, request.branchId, request.actor, {
                            counted.itemId, counted.locationId, line.delta, wac,
                            domain::source_type::COUNT_SESSION, request.sessionId});
                        metadata["costLayerId"] = layer.layer.id;
                    }
                } else {
                    auto consumption = costing_->consumeCostLayers(
                        session, request.orgId, request.branchId, counted.itemId, counted.locationId, line.delta.abs());
                    line.value = -consumption.value;
                    metadata["costLayers"] = toJson(consumption.consumed);
                }
                metadata["value"] = line.value.toString();

                auto posted = ledger_->recordCountAdjustment(
                    session, request.orgId, request.branchId, counted.itemId, counted.locationId,
                    line.delta, request.sessionId, request.actor, metadata);
                line.ledgerEntryId = posted.entry.id;

                result.totalVariance += line.value;
                result.lines.push_back(line);
            }

            result.gl = gl_->post(session, request.orgId, request.branchId, request.sessionId,
                                  domain::StocktakeDocument{result.totalVariance}, request.actor);

            std::cout << "[InventoryMovementService] Stocktake " << request.sessionId << ": "
                      << result.lines.size() << " lines, variance " << result.totalVariance.toString(2)
                      << ", GL " << domain::toString(result.gl.status) << std::endl;
            return result;
        });
    }

private:
    static constexpr size_t kReplayLimit = 10000;

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<LedgerService> ledger_;
    std::shared_ptr<LotService> lots_;
    std::shared_ptr<CostingService> costing_;
    std::shared_ptr<GlPostingService> gl_;
    std::shared_ptr<ports::output::IClock> clock_;

    template <typename MakeDocument>
    domain::IssueResult issue(
        const domain::IssueRequest& request,
        const char* operation,
        domain::LedgerReason reason,
        const char* sourceType,
        MakeDocument makeDocument)
    {
        requireDocument(request.orgId, request.branchId, request.documentId, "documentId");
        if (request.lines.empty()) {
            throw domain::ValidationError(std::string(operation) + " " + request.documentId + " has no lines");
        }
        for (const auto& line : request.lines) {
            if (!line.qty.isPositive()) {
                throw domain::ValidationError("Issued quantity must be positive for item " + line.itemId);
            }
        }

        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            if (!claim(session, request.orgId, operation, request.documentId)) {
                return replayIssue(session, request, sourceType, makeDocument(domain::Decimal::zero()));
            }

            domain::IssueResult result;
            result.documentId = request.documentId;

            for (const auto& line : request.lines) {
                auto consumption = costing_->consumeCostLayers(
                    session, request.orgId, request.branchId, line.itemId, line.locationId, line.qty);

                domain::RecordLedgerEntryRequest entry;
                entry.itemId = line.itemId;
                entry.locationId = line.locationId;
                entry.qty = -line.qty;
                entry.reason = reason;
                entry.sourceType = sourceType;
                entry.sourceId = request.documentId;
                entry.createdBy = request.actor;
                entry.metadata["value"] = (-consumption.value).toString();
                entry.metadata["costLayers"] = toJson(consumption.consumed);

                auto posted = ledger_->recordEntry(session, request.orgId, request.branchId, entry);

                auto fefo = lots_->allocateAndDecrement(
                    session,
                    {request.orgId, request.branchId, line.itemId, line.locationId, line.qty, true},
                    sourceType, request.documentId, posted.entry.id);
                if (fefo.shortfall.isPositive()) {
                    std::cout << "[InventoryMovementService] " << fefo.shortfall << " of " << line.itemId
                              << " not tracked by lots" << std::endl;
                }

                result.lines.push_back({posted.entry.id, posted.onHandAfter, fefo.allocations,
                                        fefo.shortfall, consumption.value});
                result.ledgerEntryIds.push_back(posted.entry.id);
                result.totalValue += consumption.value;
            }

            result.gl = gl_->post(session, request.orgId, request.branchId, request.documentId,
                                  makeDocument(result.totalValue), request.actor);

            std::cout << "[InventoryMovementService] " << operation << " " << request.documentId << ": "
                      << result.lines.size() << " lines, value " << result.totalValue.toString(2)
                      << ", GL " << domain::toString(result.gl.status) << std::endl;
            return result;
        });
    }

    bool claim(ports::output::IStoreSession& session, const std::string& orgId,
               const std::string& operation, const std::string& key)
    {
        bool claimed = session.claimIdempotencyKey({orgId, operation, key, clock_->now()});
        if (!claimed) {
            std::cout << "[InventoryMovementService] " << operation << " " << key
                      << " already processed, returning existing result" << std::endl;
        }
        return claimed;
    }

    static void requireDocument(const std::string& orgId, const std::string& branchId,
                                const std::string& documentId, const char* name)
    {
        if (orgId.empty() || branchId.empty()) {
            throw domain::ValidationError("orgId and branchId are required");
        }
        if (documentId.empty()) {
            throw domain::ValidationError(std::string(name) + " is required");
        }
    }

    /**
     * @brief Записи журнала документа в порядке создания
     */
    static std::vector<domain::LedgerEntry> documentEntries(
        ports::output::IStoreSession& session, const std::string& orgId, const std::string& branchId,
        const std::string& sourceType, const std::string& sourceId)
    {
        domain::LedgerQuery query;
        query.orgId = orgId;
        query.branchId = branchId;
        query.sourceType = sourceType;
        query.sourceId = sourceId;
        query.limit = kReplayLimit;

        auto entries = session.findLedgerEntries(query).entries;
        std::reverse(entries.begin(), entries.end());
        return entries;
    }

    static domain::GlPostingResult replayGl(
        ports::output::IStoreSession& session, const std::string& orgId,
        const std::string& source, const std::string& sourceId)
    {
        if (auto journal = session.findJournalBySource(orgId, source, sourceId)) {
            return domain::GlPostingResult{journal->id, domain::GlPostingStatus::POSTED, std::nullopt, true};
        }
        return domain::GlPostingResult{
            std::nullopt, domain::GlPostingStatus::SKIPPED, std::string("No journal entry for document"), true};
    }

    domain::ReceiptResult replayReceipt(ports::output::IStoreSession& session, const domain::ReceiptRequest& request) {
        domain::ReceiptResult result;
        result.receiptId = request.receiptId;
        result.isAlreadyPosted = true;

        for (const auto& entry : documentEntries(session, request.orgId, request.branchId,
                                                 domain::source_type::GOODS_RECEIPT, request.receiptId)) {
            domain::ReceiptLineResult line;
            line.ledgerEntryId = entry.id;
            line.costLayerId = entry.metadata.value("costLayerId", std::string());
            if (entry.metadata.contains("lotId")) {
                line.lotId = entry.metadata["lotId"].get<std::string>();
            }
            line.onHandAfter = session.sumOnHand({entry.orgId, entry.branchId, entry.itemId, entry.locationId});
            result.lines.push_back(line);
            result.ledgerEntryIds.push_back(entry.id);
            result.totalValue += entry.value();
        }

        result.gl = replayGl(session, request.orgId, domain::GoodsReceiptDocument::kSource, request.receiptId);
        return result;
    }

    domain::IssueResult replayIssue(
        ports::output::IStoreSession& session, const domain::IssueRequest& request,
        const std::string& sourceType, const domain::GlDocument& kind)
    {
        domain::IssueResult result;
        result.documentId = request.documentId;
        result.isAlreadyPosted = true;

        auto allocations = session.findAllocationsBySource(request.orgId, sourceType, request.documentId);

        for (const auto& entry : documentEntries(session, request.orgId, request.branchId, sourceType, request.documentId)) {
            domain::IssueLineResult line;
            line.ledgerEntryId = entry.id;
            line.onHandAfter = session.sumOnHand({entry.orgId, entry.branchId, entry.itemId, entry.locationId});
            line.value = -entry.value();

            domain::Decimal allocated;
            for (const auto& allocation : allocations) {
                if (allocation.ledgerEntryId != entry.id) continue;
                auto lot = session.findLot(allocation.lotId, false);
                line.lotAllocations.push_back({
                    allocation.lotId, lot ? lot->lotNumber : std::string(), allocation.allocatedQty,
                    lot ? lot->expiryDate : std::nullopt, allocation.allocationOrder});
                allocated += allocation.allocatedQty;
            }
            line.lotShortfall = entry.qty.abs() - allocated;

            result.lines.push_back(line);
            result.ledgerEntryIds.push_back(entry.id);
            result.totalValue += line.value;
        }

        std::string source = std::visit([](const auto& doc) { return std::string(doc.kSource); }, kind);
        result.gl = replayGl(session, request.orgId, source, request.documentId);
        return result;
    }

    static nlohmann::json toJson(const std::vector<domain::LayerConsumption>& consumed) {
        nlohmann::json layers = nlohmann::json::array();
        for (const auto& part : consumed) {
            layers.push_back({{"layerId", part.layerId}, {"qty", part.qty.toString()}});
        }
        return layers;
    }

    static std::vector<domain::LayerConsumption> consumedLayers(const domain::LedgerEntry& entry) {
        std::vector<domain::LayerConsumption> consumed;
        if (!entry.metadata.contains("costLayers")) {
            return consumed;
        }
        for (const auto& part : entry.metadata["costLayers"]) {
            consumed.push_back({part["layerId"].get<std::string>(),
                                domain::Decimal::parse(part["qty"].get<std::string>())});
        }
        return consumed;
    }
};

} // namespace inventory::application
