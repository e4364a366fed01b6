#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Маппинг документов на счета GL: филиал, затем умолчание организации
 */
class PostingMappingResolver {
public:
    explicit PostingMappingResolver(std::shared_ptr<ports::output::IInventoryStore> store)
        : store_(std::move(store))
    {
        std::cout << "[PostingMappingResolver] Created" << std::endl;
    }

    /**
     * @throws UnconfiguredError нет ни маппинга филиала, ни умолчания организации
     */
    domain::PostingMapping resolveMapping(
        ports::output::IStoreSession& session, const std::string& orgId, const std::string& branchId) const
    {
        if (auto branchMapping = session.findPostingMapping(orgId, branchId)) {
            return *branchMapping;
        }
        if (auto orgDefault = session.findPostingMapping(orgId, std::nullopt)) {
            return *orgDefault;
        }
        throw domain::UnconfiguredError(
            "GL posting mapping not configured for org " + orgId + ", branch " + branchId);
    }

    domain::PostingMapping resolveMapping(const std::string& orgId, const std::string& branchId) const {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return resolveMapping(session, orgId, branchId);
        });
    }

    /**
     * @brief Сохранить маппинг (branchId = nullopt для умолчания организации)
     */
    void saveMapping(const domain::PostingMapping& mapping) {
        if (mapping.orgId.empty()) {
            throw domain::ValidationError("Posting mapping requires orgId");
        }
        if (mapping.inventoryAssetAccountId.empty() || mapping.cogsAccountId.empty() ||
            mapping.wasteExpenseAccountId.empty() || mapping.shrinkExpenseAccountId.empty() ||
            mapping.grniAccountId.empty()) {
            throw domain::ValidationError("Posting mapping requires asset, COGS, waste, shrink and GRNI accounts");
        }

        store_->transact([&](ports::output::IStoreSession& session) {
            session.upsertPostingMapping(mapping);
        });
        std::cout << "[PostingMappingResolver] Saved mapping for org " << mapping.orgId
                  << (mapping.branchId ? ", branch " + *mapping.branchId : std::string(" (org default)")) << std::endl;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
};

} // namespace inventory::application
