#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

enum class LotStatus {
    ACTIVE,
    QUARANTINE,
    EXPIRED,
    DEPLETED
};

inline std::string toString(LotStatus status) {
    switch (status) {
        case LotStatus::ACTIVE: return "ACTIVE";
        case LotStatus::QUARANTINE: return "QUARANTINE";
        case LotStatus::EXPIRED: return "EXPIRED";
        case LotStatus::DEPLETED: return "DEPLETED";
    }
    return "UNKNOWN";
}

inline LotStatus parseLotStatus(const std::string& str) {
    if (str == "ACTIVE") return LotStatus::ACTIVE;
    if (str == "QUARANTINE") return LotStatus::QUARANTINE;
    if (str == "EXPIRED") return LotStatus::EXPIRED;
    if (str == "DEPLETED") return LotStatus::DEPLETED;
    throw std::invalid_argument("Unknown lot status: " + str);
}

} // namespace inventory::domain
