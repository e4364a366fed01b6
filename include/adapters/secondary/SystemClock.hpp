#pragma once

#include "ports/output/IClock.hpp"

namespace inventory::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace inventory::adapters::secondary
