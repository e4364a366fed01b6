#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/LotStatus.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace inventory::domain {

/**
 * @brief Партия товара (FEFO)
 *
 * Инвариант: 0 <= remainingQty <= receivedQty.
 * Уникальна по (orgId, branchId, itemId, locationId, lotNumber).
 */
struct Lot {
    std::string id;
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;
    std::string lotNumber;
    Decimal receivedQty;
    Decimal remainingQty;
    std::optional<Decimal> unitCost;
    std::optional<Timestamp> expiryDate;
    LotStatus status = LotStatus::ACTIVE;
    std::string sourceType;
    std::optional<std::string> sourceId;
    Timestamp createdAt;
    std::optional<std::string> createdBy;

    bool isExpiredAt(const Timestamp& now) const {
        return expiryDate.has_value() && *expiryDate < now;
    }

    /**
     * @brief Вывести статус из остатка и срока годности
     *
     * QUARANTINE сохраняется до явного releaseLot().
     */
    LotStatus derivedStatus(const Timestamp& now) const {
        if (status == LotStatus::QUARANTINE) {
            return LotStatus::QUARANTINE;
        }
        if (!remainingQty.isPositive()) {
            return LotStatus::DEPLETED;
        }
        if (isExpiredAt(now)) {
            return LotStatus::EXPIRED;
        }
        return LotStatus::ACTIVE;
    }
};

/**
 * @brief Ключ сортировки FEFO
 *
 * Партии без срока годности идут строго после любых датированных,
 * затем по времени создания и id.
 */
inline auto fefoKey(const Lot& lot) {
    return std::make_tuple(
        !lot.expiryDate.has_value(),
        lot.expiryDate.has_value() ? lot.expiryDate->toEpochMicros() : int64_t{0},
        lot.createdAt.toEpochMicros(),
        lot.id);
}

/**
 * @brief След списания из партии (immutable)
 */
struct LotAllocation {
    std::string id;
    std::string orgId;
    std::string lotId;
    Decimal allocatedQty;
    std::string sourceType;
    std::string sourceId;
    int allocationOrder = 1;
    std::optional<std::string> ledgerEntryId;
    Timestamp createdAt;
};

/**
 * @brief Возврат количества в партию (immutable)
 */
struct LotIncrement {
    std::string id;
    std::string orgId;
    std::string lotId;
    Decimal qty;
    std::string sourceType;
    std::optional<std::string> sourceId;
    Timestamp createdAt;
};

struct CreateLotInput {
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;
    std::string lotNumber;
    Decimal receivedQty;
    std::optional<Decimal> unitCost;
    std::optional<Timestamp> expiryDate;
    std::string sourceType;
    std::optional<std::string> sourceId;
    std::optional<std::string> createdBy;
};

struct CreateLotResult {
    std::string id;
    std::string lotNumber;
    bool isIdempotent = false;
};

struct FefoAllocation {
    std::string lotId;
    std::string lotNumber;
    Decimal allocatedQty;
    std::optional<Timestamp> expiryDate;
    int allocationOrder = 1;
};

struct FefoResult {
    std::vector<FefoAllocation> allocations;
    Decimal totalAllocated;
    Decimal shortfall;
};

struct FefoRequest {
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;
    Decimal qtyNeeded;
    bool excludeExpired = true;
};

/**
 * @brief Свежее состояние партии после мутации
 */
struct LotMutationResult {
    std::string lotId;
    Decimal remainingQty;
    LotStatus status = LotStatus::ACTIVE;
    std::optional<std::string> traceId;     ///< id LotAllocation / LotIncrement
};

struct LotQuery {
    std::string orgId;
    std::optional<std::string> branchId;
    std::optional<std::string> itemId;
    std::optional<std::string> locationId;
    std::vector<LotStatus> statuses;        ///< Пусто: все статусы
    size_t limit = 50;
    size_t offset = 0;
};

struct LotPage {
    std::vector<Lot> lots;
    size_t total = 0;
};

/**
 * @brief Полная история партии
 *
 * identityHolds: remainingQty == receivedQty - Σallocated + Σincremented.
 */
struct LotTraceability {
    Lot lot;
    std::vector<LotAllocation> allocations;
    std::vector<LotIncrement> increments;
    Decimal totalAllocated;
    Decimal totalIncremented;
    std::map<std::string, Decimal> allocatedBySourceType;
    bool identityHolds = false;
};

} // namespace inventory::domain
