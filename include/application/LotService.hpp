#pragma once

#include "ports/input/ILotService.hpp"
#include "ports/output/IAuditSink.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "application/AuditHook.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис партий (FEFO)
 *
 * Каждое изменение remainingQty идёт вместе со строкой следа
 * (LotAllocation или LotIncrement) в одной транзакции, поэтому
 * remainingQty == receivedQty - Σallocated + Σincremented всегда.
 */
class LotService : public ports::input::ILotService {
public:
    LotService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IAuditSink> audit
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , audit_(std::move(audit))
    {
        std::cout << "[LotService] Created" << std::endl;
    }

    // ========================================================================
    // Создание
    // ========================================================================

    domain::CreateLotResult createLot(const domain::CreateLotInput& input) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return createLot(session, input);
        });
    }

    /**
     * @brief Создать партию
     *
     * Повтор с тем же (номер партии, sourceType, sourceId) возвращает
     * существующую партию с isIdempotent = true. Гарантию даёт уникальный
     * ключ хранилища; предварительное чтение только экономит вставку.
     *
     * @throws ConflictError номер партии занят другим источником
     */
    domain::CreateLotResult createLot(ports::output::IStoreSession& session, const domain::CreateLotInput& input) {
        if (input.orgId.empty() || input.branchId.empty() || input.itemId.empty() || input.locationId.empty()) {
            throw domain::ValidationError("orgId, branchId, itemId and locationId are required");
        }
        if (!input.receivedQty.isPositive()) {
            throw domain::ValidationError("Lot received quantity must be positive");
        }
        if (input.unitCost && input.unitCost->isNegative()) {
            throw domain::ValidationError("Lot unit cost must not be negative");
        }

        domain::Timestamp now = clock_->now();
        std::string lotNumber = input.lotNumber.empty()
            ? utils::IdGenerator::lotNumber(compactDate(now))
            : input.lotNumber;
        domain::StockKey key{input.orgId, input.branchId, input.itemId, input.locationId};

        if (auto existing = session.findLotByNumber(key, lotNumber)) {
            return resolveExisting(*existing, input);
        }

        domain::Lot lot;
        lot.id = utils::IdGenerator::uuid();
        lot.orgId = input.orgId;
        lot.branchId = input.branchId;
        lot.itemId = input.itemId;
        lot.locationId = input.locationId;
        lot.lotNumber = lotNumber;
        lot.receivedQty = input.receivedQty;
        lot.remainingQty = input.receivedQty;
        lot.unitCost = input.unitCost;
        lot.expiryDate = input.expiryDate;
        lot.sourceType = input.sourceType;
        lot.sourceId = input.sourceId;
        lot.createdAt = now;
        lot.createdBy = input.createdBy;
        lot.status = lot.derivedStatus(now);

        if (!session.insertLot(lot)) {
            // Параллельная вставка выиграла гонку
            auto winner = session.findLotByNumber(key, lotNumber);
            if (!winner) {
                throw domain::InvariantViolationError("Lot " + lotNumber + " conflicted but cannot be read back");
            }
            return resolveExisting(*winner, input);
        }

        std::cout << "[LotService] Created lot " << lot.lotNumber << " (" << lot.id << ") "
                  << key.toString() << " qty " << lot.receivedQty << std::endl;

        nlohmann::json metadata;
        metadata["lotNumber"] = lot.lotNumber;
        metadata["itemId"] = lot.itemId;
        metadata["receivedQty"] = lot.receivedQty.toString();
        if (lot.expiryDate) metadata["expiryDate"] = lot.expiryDate->toDateString();
        metadata["sourceType"] = lot.sourceType;
        if (lot.sourceId) metadata["sourceId"] = *lot.sourceId;
        auditAfterCommit(session, audit_, {
            lot.orgId, lot.branchId, lot.createdBy.value_or("system"),
            "LOT_CREATED", "InventoryLot", lot.id, metadata, now});

        return domain::CreateLotResult{lot.id, lot.lotNumber, false};
    }

    // ========================================================================
    // Чтение
    // ========================================================================

    std::optional<domain::Lot> getLot(const std::string& orgId, const std::string& lotId) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) -> std::optional<domain::Lot> {
            auto lot = session.findLot(lotId, false);
            if (!lot || lot->orgId != orgId) return std::nullopt;
            return lot;
        });
    }

    domain::LotPage listLots(const domain::LotQuery& query) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.findLots(query);
        });
    }

    /**
     * @brief ACTIVE партии с остатком, срок которых наступает в ближайшие days дней
     */
    std::vector<domain::Lot> getExpiringSoon(
        const std::string& orgId, const std::optional<std::string>& branchId, int days) override
    {
        if (days < 0) {
            throw domain::ValidationError("days must not be negative");
        }
        domain::Timestamp now = clock_->now();
        auto lots = store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.findActiveLotsExpiringBy(orgId, branchId, now.plusDays(days));
        });
        lots.erase(std::remove_if(lots.begin(), lots.end(),
                       [&](const domain::Lot& lot) { return *lot.expiryDate < now; }),
                   lots.end());
        return lots;
    }

    std::vector<domain::LotAllocation> getAllocationsForSource(
        const std::string& orgId, const std::string& sourceType, const std::string& sourceId) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.findAllocationsBySource(orgId, sourceType, sourceId);
        });
    }

    domain::LotTraceability getTraceability(const std::string& orgId, const std::string& lotId) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::LotTraceability trace;
            trace.lot = requireLot(session, orgId, lotId, false);
            trace.allocations = session.findAllocationsByLot(lotId);
            trace.increments = session.findIncrementsByLot(lotId);

            for (const auto& allocation : trace.allocations) {
                trace.totalAllocated += allocation.allocatedQty;
                trace.allocatedBySourceType[allocation.sourceType] += allocation.allocatedQty;
            }
            for (const auto& increment : trace.increments) {
                trace.totalIncremented += increment.qty;
            }

            trace.identityHolds =
                trace.lot.remainingQty == trace.lot.receivedQty - trace.totalAllocated + trace.totalIncremented;
            return trace;
        });
    }

    // ========================================================================
    // FEFO
    // ========================================================================

    domain::FefoResult allocateFEFO(const domain::FefoRequest& request) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return allocateFEFO(session, request);
        });
    }

    /**
     * @brief Чистый расчёт FEFO: ничего не изменяет
     *
     * Порядок: срок годности по возрастанию, партии без срока строго
     * последними, затем время создания и id.
     */
    domain::FefoResult allocateFEFO(ports::output::IStoreSession& session, const domain::FefoRequest& request) {
        if (!requireQty(request)) {
            return domain::FefoResult{};
        }
        return plan(candidateLots(session, request, false), request.qtyNeeded);
    }

    /**
     * @brief FEFO-распределение и списание по партиям в транзакции вызывающего
     *
     * Недостача по партиям не ошибка: остаток может быть вне партий.
     */
    domain::FefoResult allocateAndDecrement(
        ports::output::IStoreSession& session,
        const domain::FefoRequest& request,
        const std::string& sourceType,
        const std::string& sourceId,
        const std::optional<std::string>& ledgerEntryId = std::nullopt)
    {
        if (!requireQty(request)) {
            return domain::FefoResult{};
        }
        auto result = plan(candidateLots(session, request, true), request.qtyNeeded);
        for (const auto& allocation : result.allocations) {
            decrementLot(session, request.orgId, allocation.lotId, allocation.allocatedQty,
                         sourceType, sourceId, allocation.allocationOrder, ledgerEntryId);
        }
        return result;
    }

    // ========================================================================
    // Мутации
    // ========================================================================

    domain::LotMutationResult decrementLot(
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::string& sourceId,
        int allocationOrder = 1,
        const std::optional<std::string>& ledgerEntryId = std::nullopt) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return decrementLot(session, orgId, lotId, qty, sourceType, sourceId, allocationOrder, ledgerEntryId);
        });
    }

    /**
     * @throws InsufficientStockError qty больше остатка партии
     */
    domain::LotMutationResult decrementLot(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::string& sourceId,
        int allocationOrder = 1,
        const std::optional<std::string>& ledgerEntryId = std::nullopt)
    {
        if (!qty.isPositive()) {
            throw domain::ValidationError("Lot decrement quantity must be positive");
        }

        domain::Lot lot = requireLot(session, orgId, lotId, true);
        if (qty > lot.remainingQty) {
            throw domain::InsufficientStockError(
                "Cannot decrement " + qty.toString() + " from lot " + lot.lotNumber +
                " - only " + lot.remainingQty.toString() + " remaining");
        }

        domain::Timestamp now = clock_->now();
        lot.remainingQty -= qty;
        lot.status = lot.derivedStatus(now);
        session.updateLot(lot);

        domain::LotAllocation allocation;
        allocation.id = utils::IdGenerator::uuid();
        allocation.orgId = lot.orgId;
        allocation.lotId = lot.id;
        allocation.allocatedQty = qty;
        allocation.sourceType = sourceType;
        allocation.sourceId = sourceId;
        allocation.allocationOrder = allocationOrder;
        allocation.ledgerEntryId = ledgerEntryId;
        allocation.createdAt = now;
        session.insertLotAllocation(allocation);

        std::cout << "[LotService] Decremented lot " << lot.lotNumber << " by " << qty
                  << " -> " << lot.remainingQty << " (" << domain::toString(lot.status) << ")" << std::endl;

        return domain::LotMutationResult{lot.id, lot.remainingQty, lot.status, allocation.id};
    }

    domain::LotMutationResult incrementLot(
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::optional<std::string>& sourceId = std::nullopt) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return incrementLot(session, orgId, lotId, qty, sourceType, sourceId);
        });
    }

    /**
     * @brief Вернуть количество в партию (отмена списания, приход перемещения)
     *
     * DEPLETED партия снова становится ACTIVE (или EXPIRED по сроку).
     *
     * @throws InvariantViolationError остаток превысил бы receivedQty
     */
    domain::LotMutationResult incrementLot(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::optional<std::string>& sourceId = std::nullopt)
    {
        if (!qty.isPositive()) {
            throw domain::ValidationError("Lot increment quantity must be positive");
        }

        domain::Lot lot = requireLot(session, orgId, lotId, true);
        if (lot.remainingQty + qty > lot.receivedQty) {
            throw domain::InvariantViolationError(
                "Cannot increment lot " + lot.lotNumber + " by " + qty.toString() +
                ": remaining would exceed received quantity " + lot.receivedQty.toString());
        }

        domain::Timestamp now = clock_->now();
        lot.remainingQty += qty;
        lot.status = lot.derivedStatus(now);
        session.updateLot(lot);

        domain::LotIncrement increment;
        increment.id = utils::IdGenerator::uuid();
        increment.orgId = lot.orgId;
        increment.lotId = lot.id;
        increment.qty = qty;
        increment.sourceType = sourceType;
        increment.sourceId = sourceId;
        increment.createdAt = now;
        session.insertLotIncrement(increment);

        std::cout << "[LotService] Incremented lot " << lot.lotNumber << " by " << qty
                  << " -> " << lot.remainingQty << " (" << domain::toString(lot.status) << ")" << std::endl;

        return domain::LotMutationResult{lot.id, lot.remainingQty, lot.status, increment.id};
    }

    size_t updateExpiredLots(const std::string& orgId) override {
        domain::Timestamp now = clock_->now();
        size_t updated = store_->inTransaction([&](ports::output::IStoreSession& session) {
            size_t count = 0;
            for (auto lot : session.findActiveLotsExpiringBy(orgId, std::nullopt, now)) {
                if (!lot.isExpiredAt(now)) continue;
                auto locked = session.findLot(lot.id, true);
                if (!locked || locked->status != domain::LotStatus::ACTIVE) continue;
                locked->status = domain::LotStatus::EXPIRED;
                session.updateLot(*locked);
                ++count;
            }
            return count;
        });

        if (updated > 0) {
            std::cout << "[LotService] Marked " << updated << " lots EXPIRED for org " << orgId << std::endl;
        }
        return updated;
    }

    domain::LotMutationResult quarantineLot(
        const std::string& orgId, const std::string& lotId, const std::string& actor) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::Lot lot = requireLot(session, orgId, lotId, true);
            domain::LotStatus previous = lot.status;
            lot.status = domain::LotStatus::QUARANTINE;
            session.updateLot(lot);

            std::cout << "[LotService] Lot " << lot.lotNumber << " quarantined by " << actor << std::endl;

            nlohmann::json metadata;
            metadata["lotNumber"] = lot.lotNumber;
            metadata["previousStatus"] = domain::toString(previous);
            auditAfterCommit(session, audit_, {
                lot.orgId, lot.branchId, actor, "LOT_QUARANTINED", "InventoryLot", lot.id,
                metadata, clock_->now()});

            return domain::LotMutationResult{lot.id, lot.remainingQty, lot.status, std::nullopt};
        });
    }

    /**
     * @throws ValidationError партия не на карантине
     */
    domain::LotMutationResult releaseLot(
        const std::string& orgId, const std::string& lotId, const std::string& actor) override
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            domain::Lot lot = requireLot(session, orgId, lotId, true);
            if (lot.status != domain::LotStatus::QUARANTINE) {
                throw domain::ValidationError("Lot " + lot.lotNumber + " is not in quarantine");
            }

            domain::Timestamp now = clock_->now();
            lot.status = domain::LotStatus::ACTIVE;
            lot.status = lot.derivedStatus(now);
            session.updateLot(lot);

            std::cout << "[LotService] Lot " << lot.lotNumber << " released -> "
                      << domain::toString(lot.status) << std::endl;

            nlohmann::json metadata;
            metadata["lotNumber"] = lot.lotNumber;
            metadata["newStatus"] = domain::toString(lot.status);
            auditAfterCommit(session, audit_, {
                lot.orgId, lot.branchId, actor, "LOT_RELEASED", "InventoryLot", lot.id, metadata, now});

            return domain::LotMutationResult{lot.id, lot.remainingQty, lot.status, std::nullopt};
        });
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IAuditSink> audit_;

    static domain::Lot requireLot(
        ports::output::IStoreSession& session, const std::string& orgId, const std::string& lotId, bool forUpdate)
    {
        auto lot = session.findLot(lotId, forUpdate);
        if (!lot || lot->orgId != orgId) {
            throw domain::NotFoundError("Lot " + lotId + " not found");
        }
        return *lot;
    }

    static domain::CreateLotResult resolveExisting(const domain::Lot& existing, const domain::CreateLotInput& input) {
        if (existing.sourceType == input.sourceType && existing.sourceId == input.sourceId) {
            std::cout << "[LotService] Lot " << existing.lotNumber << " already exists for source, reusing" << std::endl;
            return domain::CreateLotResult{existing.id, existing.lotNumber, true};
        }
        throw domain::ConflictError(
            "Lot " + existing.lotNumber + " already exists for this item at this location");
    }

    /**
     * @return false, если распределять нечего (qtyNeeded == 0)
     * @throws ValidationError отрицательное количество
     */
    static bool requireQty(const domain::FefoRequest& request) {
        if (request.qtyNeeded.isNegative()) {
            throw domain::ValidationError("qtyNeeded must not be negative");
        }
        return !request.qtyNeeded.isZero();
    }

    /**
     * @brief Партии, доступные для FEFO, в порядке списания
     *
     * Участвуют только ACTIVE с остатком. excludeExpired отсекает партии,
     * срок которых уже прошёл, но статус ещё не обновлён.
     */
    std::vector<domain::Lot> candidateLots(
        ports::output::IStoreSession& session, const domain::FefoRequest& request, bool forUpdate)
    {
        domain::Timestamp now = clock_->now();
        domain::StockKey key{request.orgId, request.branchId, request.itemId, request.locationId};

        std::vector<domain::Lot> candidates;
        for (auto& lot : session.findLotsWithStock(key, forUpdate)) {
            if (lot.status != domain::LotStatus::ACTIVE || !lot.remainingQty.isPositive()) continue;
            if (request.excludeExpired && lot.isExpiredAt(now)) continue;
            candidates.push_back(std::move(lot));
        }

        std::sort(candidates.begin(), candidates.end(),
            [](const domain::Lot& a, const domain::Lot& b) { return domain::fefoKey(a) < domain::fefoKey(b); });
        return candidates;
    }

    static domain::FefoResult plan(const std::vector<domain::Lot>& lots, const domain::Decimal& qtyNeeded) {
        domain::FefoResult result;
        domain::Decimal remaining = qtyNeeded;
        int order = 1;

        for (const auto& lot : lots) {
            if (!remaining.isPositive()) break;
            domain::Decimal take = domain::Decimal::min(remaining, lot.remainingQty);
            result.allocations.push_back({lot.id, lot.lotNumber, take, lot.expiryDate, order++});
            result.totalAllocated += take;
            remaining -= take;
        }

        result.shortfall = remaining;
        return result;
    }

    static std::string compactDate(const domain::Timestamp& ts) {
        std::string date = ts.toDateString();
        date.erase(std::remove(date.begin(), date.end(), '-'), date.end());
        return date;
    }
};

} // namespace inventory::application
