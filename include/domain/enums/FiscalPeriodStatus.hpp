#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

enum class FiscalPeriodStatus {
    OPEN,
    CLOSED,
    LOCKED
};

inline std::string toString(FiscalPeriodStatus status) {
    switch (status) {
        case FiscalPeriodStatus::OPEN: return "OPEN";
        case FiscalPeriodStatus::CLOSED: return "CLOSED";
        case FiscalPeriodStatus::LOCKED: return "LOCKED";
    }
    return "UNKNOWN";
}

inline FiscalPeriodStatus parseFiscalPeriodStatus(const std::string& str) {
    if (str == "OPEN") return FiscalPeriodStatus::OPEN;
    if (str == "CLOSED") return FiscalPeriodStatus::CLOSED;
    if (str == "LOCKED") return FiscalPeriodStatus::LOCKED;
    throw std::invalid_argument("Unknown fiscal period status: " + str);
}

} // namespace inventory::domain
