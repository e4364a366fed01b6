#pragma once

#include "Timestamp.hpp"
#include "enums/FiscalPeriodStatus.hpp"
#include <string>

namespace inventory::domain {

struct FiscalPeriod {
    std::string id;
    std::string orgId;
    std::string name;
    Timestamp startsAt;
    Timestamp endsAt;
    FiscalPeriodStatus status = FiscalPeriodStatus::OPEN;

    bool contains(const Timestamp& date) const {
        return startsAt <= date && date <= endsAt;
    }
};

} // namespace inventory::domain
