#pragma once

#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace inventory::domain {

/**
 * @brief Событие аудита (append-only, fire-and-forget)
 */
struct AuditEvent {
    std::string orgId;
    std::string branchId;
    std::string actor;
    std::string action;          ///< LOT_CREATED, gl.posting.created, ...
    std::string resourceType;
    std::string resourceId;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp timestamp;

    std::string toJson() const {
        nlohmann::json j;
        j["org_id"] = orgId;
        j["branch_id"] = branchId;
        j["actor"] = actor;
        j["action"] = action;
        j["resource_type"] = resourceType;
        j["resource_id"] = resourceId;
        j["metadata"] = metadata;
        j["timestamp"] = timestamp.toString();
        return j.dump();
    }
};

} // namespace inventory::domain
