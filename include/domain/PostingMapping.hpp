#pragma once

#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Маппинг складских документов на счета GL
 *
 * branchId == nullopt — значение по умолчанию для организации.
 */
struct PostingMapping {
    std::string orgId;
    std::optional<std::string> branchId;
    std::string inventoryAssetAccountId;
    std::string cogsAccountId;
    std::string wasteExpenseAccountId;
    std::string shrinkExpenseAccountId;
    std::string grniAccountId;
    std::optional<std::string> inventoryGainAccountId;

    bool isOrgDefault() const { return !branchId.has_value(); }
};

} // namespace inventory::domain
