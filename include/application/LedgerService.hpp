#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "domain/Errors.hpp"
#include "domain/enums/SourceType.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис складского журнала
 *
 * Остаток нигде не хранится: каждый запрос считает Σqty по журналу.
 * Проверка неотрицательности и вставка выполняются в одной транзакции
 * под блокировкой ключа (org, branch, item, location).
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , clock_(std::move(clock))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    domain::LedgerPostingResult recordEntry(
        const std::string& orgId,
        const std::string& branchId,
        const domain::RecordLedgerEntryRequest& request,
        const domain::RecordOptions& options = {}) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return recordEntry(session, orgId, branchId, request, options);
        });
    }

    /**
     * @brief Записать движение в транзакции вызывающего
     *
     * @throws ValidationError нулевое количество или знак, не совпадающий с причиной
     * @throws InsufficientStockError остаток ушёл бы в минус без allowNegative
     */
    domain::LedgerPostingResult recordEntry(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const domain::RecordLedgerEntryRequest& request,
        const domain::RecordOptions& options = {})
    {
        validate(orgId, branchId, request);

        domain::StockKey key{orgId, branchId, request.itemId, request.locationId};
        session.lockStockKey(key);

        domain::Decimal onHand = session.sumOnHand(key);
        domain::Decimal onHandAfter = onHand + request.qty;

        if (request.qty.isNegative() && !options.allowNegative && onHandAfter.isNegative()) {
            std::cout << "[LedgerService] REJECTED: " << key.toString()
                      << " on hand " << onHand << ", requested " << request.qty.abs() << std::endl;
            throw domain::InsufficientStockError(
                "Insufficient stock for item " + request.itemId + " at location " + request.locationId +
                ": on hand " + onHand.toString() + ", requested " + request.qty.abs().toString());
        }

        domain::LedgerEntry entry;
        entry.id = utils::IdGenerator::uuid();
        entry.orgId = orgId;
        entry.branchId = branchId;
        entry.itemId = request.itemId;
        entry.locationId = request.locationId;
        entry.qty = request.qty;
        entry.reason = request.reason;
        entry.sourceType = request.sourceType;
        entry.sourceId = request.sourceId;
        entry.notes = request.notes;
        entry.createdAt = clock_->now();
        entry.createdBy = request.createdBy;
        entry.metadata = request.metadata;

        session.insertLedgerEntry(entry);

        std::cout << "[LedgerService] " << domain::toString(entry.reason) << " " << entry.qty
                  << " " << key.toString() << " -> on hand " << onHandAfter << std::endl;

        return domain::LedgerPostingResult{std::move(entry), onHandAfter};
    }

    domain::Decimal getOnHand(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.sumOnHand({orgId, branchId, itemId, locationId});
        });
    }

    std::vector<domain::OnHandRow> getOnHandByLocation(
        const std::string& orgId, const std::string& branchId, const std::string& itemId) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.sumOnHandByLocation(orgId, branchId, itemId);
        });
    }

    std::vector<domain::OnHandRow> getOnHandByBranch(
        const std::string& orgId,
        const std::string& branchId,
        const std::optional<std::string>& locationId = std::nullopt) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.sumOnHandByBranch(orgId, branchId, locationId);
        });
    }

    domain::LedgerPage getLedgerEntries(const domain::LedgerQuery& query) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.findLedgerEntries(query);
        });
    }

    /**
     * @brief Ручная корректировка (любой знак, без ухода в минус)
     */
    domain::LedgerPostingResult recordAdjustment(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId,
        const domain::Decimal& qty,
        const std::string& actor,
        const std::optional<std::string>& notes = std::nullopt) override
    {
        domain::RecordLedgerEntryRequest request;
        request.itemId = itemId;
        request.locationId = locationId;
        request.qty = qty;
        request.reason = domain::LedgerReason::ADJUSTMENT;
        request.sourceType = domain::source_type::STOCK_ADJUSTMENT;
        request.notes = notes;
        request.createdBy = actor;
        return recordEntry(orgId, branchId, request);
    }

    /**
     * @brief Корректировка по результатам пересчёта: пересчёт и есть правда,
     * поэтому отрицательный итог допускается
     */
    domain::LedgerPostingResult recordCountAdjustment(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId,
        const domain::Decimal& delta,
        const std::string& countSessionId,
        const std::string& actor,
        nlohmann::json metadata = nlohmann::json::object())
    {
        domain::RecordLedgerEntryRequest request;
        request.itemId = itemId;
        request.locationId = locationId;
        request.qty = delta;
        request.reason = domain::LedgerReason::COUNT_ADJUSTMENT;
        request.sourceType = domain::source_type::COUNT_SESSION;
        request.sourceId = countSessionId;
        request.createdBy = actor;
        request.metadata = std::move(metadata);
        return recordEntry(session, orgId, branchId, request, domain::RecordOptions{true});
    }

    /**
     * @brief Сторно записи: новая запись с противоположным количеством
     *
     * Записи, владеющие слоями себестоимости или партиями (документы
     * прихода, списания, порчи, пересчёта), так не сторнируются: их
     * отменяет операция документа, например voidWaste().
     *
     * @throws NotFoundError запись не найдена
     * @throws ConflictError запись уже сторнирована или принадлежит документу
     */
    domain::LedgerPostingResult reverseEntry(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& entryId,
        const std::string& actor) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            auto original = session.findLedgerEntry(orgId, entryId);
            if (!original || original->branchId != branchId) {
                throw domain::NotFoundError("Ledger entry " + entryId + " not found");
            }
            if (ownsCostOrLots(*original)) {
                throw domain::ConflictError(
                    "Ledger entry " + entryId + " belongs to " + original->sourceType +
                    " document; void the document instead");
            }

            session.lockStockKey({orgId, branchId, original->itemId, original->locationId});
            if (!session.claimIdempotencyKey({orgId, kReversalOp, entryId, clock_->now()})) {
                throw domain::ConflictError("Ledger entry " + entryId + " is already reversed");
            }

            domain::RecordLedgerEntryRequest request;
            request.itemId = original->itemId;
            request.locationId = original->locationId;
            request.qty = -original->qty;
            request.reason = domain::LedgerReason::ADJUSTMENT;
            request.sourceType = domain::source_type::STOCK_ADJUSTMENT;
            request.sourceId = entryId;
            request.notes = "Reversal of " + entryId;
            request.createdBy = actor;
            request.metadata["reversesEntryId"] = entryId;
            if (!original->value().isZero()) {
                request.metadata["value"] = (-original->value()).toString();
            }
            return recordEntry(session, orgId, branchId, request);
        });
    }

private:
    static constexpr const char* kReversalOp = "LEDGER_REVERSAL";

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;

    static bool ownsCostOrLots(const domain::LedgerEntry& entry) {
        return entry.metadata.contains("costLayerId") || entry.metadata.contains("costLayers") ||
               entry.metadata.contains("lotId") || entry.sourceType == domain::source_type::WASTAGE_VOID;
    }

    static void validate(
        const std::string& orgId,
        const std::string& branchId,
        const domain::RecordLedgerEntryRequest& request)
    {
        if (orgId.empty() || branchId.empty() || request.itemId.empty() || request.locationId.empty()) {
            throw domain::ValidationError("orgId, branchId, itemId and locationId are required");
        }
        if (request.sourceType.empty()) {
            throw domain::ValidationError("sourceType is required");
        }
        if (request.qty.isZero()) {
            throw domain::ValidationError("Ledger quantity must be non-zero");
        }
        if (domain::isInboundReason(request.reason) && !request.qty.isPositive()) {
            throw domain::ValidationError(
                "Reason " + domain::toString(request.reason) + " requires a positive quantity");
        }
        if (domain::isOutboundReason(request.reason) && !request.qty.isNegative()) {
            throw domain::ValidationError(
                "Reason " + domain::toString(request.reason) + " requires a negative quantity");
        }
        if (!request.metadata.is_object()) {
            throw domain::ValidationError("Ledger metadata must be a JSON object");
        }
    }
};

} // namespace inventory::application
