#pragma once

#include "domain/LedgerEntry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Складской журнал движений: единственный источник остатков
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    virtual domain::LedgerPostingResult recordEntry(
        const std::string& orgId,
        const std::string& branchId,
        const domain::RecordLedgerEntryRequest& request,
        const domain::RecordOptions& options = {}) = 0;

    virtual domain::Decimal getOnHand(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId) = 0;

    virtual std::vector<domain::OnHandRow> getOnHandByLocation(
        const std::string& orgId, const std::string& branchId, const std::string& itemId) = 0;

    virtual std::vector<domain::OnHandRow> getOnHandByBranch(
        const std::string& orgId,
        const std::string& branchId,
        const std::optional<std::string>& locationId = std::nullopt) = 0;

    virtual domain::LedgerPage getLedgerEntries(const domain::LedgerQuery& query) = 0;

    virtual domain::LedgerPostingResult recordAdjustment(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& itemId,
        const std::string& locationId,
        const domain::Decimal& qty,
        const std::string& actor,
        const std::optional<std::string>& notes = std::nullopt) = 0;

    virtual domain::LedgerPostingResult reverseEntry(
        const std::string& orgId,
        const std::string& branchId,
        const std::string& entryId,
        const std::string& actor) = 0;
};

} // namespace inventory::ports::input
