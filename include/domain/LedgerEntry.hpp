#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/LedgerReason.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Запись складского журнала (append-only)
 *
 * Единственный источник истины для остатков: on-hand = Σqty.
 * Запись никогда не изменяется; исправление — новая запись с обратным знаком.
 */
struct LedgerEntry {
    std::string id;
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;
    Decimal qty;                              ///< Знаковое количество
    LedgerReason reason = LedgerReason::ADJUSTMENT;
    std::string sourceType;
    std::optional<std::string> sourceId;
    std::optional<std::string> notes;
    Timestamp createdAt;
    std::optional<std::string> createdBy;
    nlohmann::json metadata = nlohmann::json::object();

    /**
     * @brief Стоимость движения из metadata["value"] (0, если не записана)
     */
    Decimal value() const {
        if (metadata.is_object() && metadata.contains("value") && metadata["value"].is_string()) {
            return Decimal::parse(metadata["value"].get<std::string>());
        }
        return Decimal::zero();
    }
};

/**
 * @brief Ключ остатка: товар на складском месте филиала
 */
struct StockKey {
    std::string orgId;
    std::string branchId;
    std::string itemId;
    std::string locationId;

    std::string toString() const {
        return orgId + "/" + branchId + "/" + itemId + "/" + locationId;
    }
};

/**
 * @brief Агрегированный остаток (строка группировки по журналу)
 */
struct OnHandRow {
    std::string itemId;
    std::string locationId;
    std::string branchId;
    Decimal onHand;
};

/**
 * @brief Фильтр выборки журнала
 */
struct LedgerQuery {
    std::string orgId;
    std::string branchId;
    std::optional<std::string> itemId;
    std::optional<std::string> locationId;
    std::optional<LedgerReason> reason;
    std::optional<std::string> sourceType;
    std::optional<std::string> sourceId;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    size_t limit = 100;
    size_t offset = 0;
};

struct LedgerPage {
    std::vector<LedgerEntry> entries;   ///< Новые первыми
    size_t total = 0;
};

/**
 * @brief Запрос на запись движения
 */
struct RecordLedgerEntryRequest {
    std::string itemId;
    std::string locationId;
    Decimal qty;
    LedgerReason reason = LedgerReason::ADJUSTMENT;
    std::string sourceType;
    std::optional<std::string> sourceId;
    std::optional<std::string> notes;
    std::optional<std::string> createdBy;
    nlohmann::json metadata = nlohmann::json::object();
};

struct RecordOptions {
    bool allowNegative = false;
};

/**
 * @brief Результат записи: сама запись и свежий остаток
 */
struct LedgerPostingResult {
    LedgerEntry entry;
    Decimal onHandAfter;
};

} // namespace inventory::domain
