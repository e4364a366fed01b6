#pragma once

#include <string>

namespace inventory::domain {

enum class ReconciliationStatus {
    MATCH,
    WARN
};

inline std::string toString(ReconciliationStatus status) {
    switch (status) {
        case ReconciliationStatus::MATCH: return "MATCH";
        case ReconciliationStatus::WARN: return "WARN";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
