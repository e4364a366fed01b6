#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/ReconciliationStatus.hpp"
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Допустимое расхождение склада и GL
 *
 * tolerance = max(absolute, relative × |inventoryValue|)
 */
struct TolerancePolicy {
    Decimal absolute = Decimal::parse("0.01");
    Decimal relative;

    Decimal toleranceFor(const Decimal& inventoryValue) const {
        return Decimal::max(absolute, relative * inventoryValue.abs());
    }
};

struct ReconciliationCategory {
    std::string category;            ///< RECEIPTS, DEPLETION, WASTE, STOCKTAKE
    Decimal inventoryValue;          ///< Σ value по журналу движений
    Decimal glDebitTotal;
    Decimal glCreditTotal;
    Decimal glNetValue;              ///< debit - credit по счёту Inventory Asset
    Decimal delta;
    Decimal tolerance;
    ReconciliationStatus status = ReconciliationStatus::MATCH;
    std::vector<std::string> warnings;
    std::vector<std::string> journalEntryIds;
};

struct ReconciliationResult {
    std::string orgId;
    std::string branchId;
    Timestamp from;
    Timestamp to;
    std::vector<ReconciliationCategory> categories;
    ReconciliationStatus overallStatus = ReconciliationStatus::MATCH;
    Timestamp generatedAt;
};

} // namespace inventory::domain
