#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/JournalStatus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

struct JournalLine {
    std::string accountId;
    Decimal debit;
    Decimal credit;
    nlohmann::json meta = nlohmann::json::object();
};

/**
 * @brief Проводка двойной записи
 *
 * Инвариант: Σdebit == Σcredit (точное десятичное равенство).
 * (orgId, source, sourceId) уникален — ключ идемпотентности.
 */
struct JournalEntry {
    std::string id;
    std::string orgId;
    std::string branchId;
    Timestamp date;
    std::string memo;
    std::string source;
    std::string sourceId;
    JournalStatus status = JournalStatus::POSTED;
    std::optional<std::string> postedBy;
    std::optional<std::string> reversesEntryId;
    std::optional<std::string> reversedBy;
    std::optional<Timestamp> reversedAt;
    std::vector<JournalLine> lines;

    Decimal totalDebit() const {
        Decimal total;
        for (const auto& line : lines) {
            total += line.debit;
        }
        return total;
    }

    Decimal totalCredit() const {
        Decimal total;
        for (const auto& line : lines) {
            total += line.credit;
        }
        return total;
    }

    bool isBalanced() const {
        return totalDebit() == totalCredit();
    }
};

struct JournalQuery {
    std::string orgId;
    std::optional<std::string> branchId;
    std::vector<std::string> sources;      ///< Пусто: все источники
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
};

} // namespace inventory::domain
