#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

enum class JournalStatus {
    POSTED,
    REVERSED
};

inline std::string toString(JournalStatus status) {
    switch (status) {
        case JournalStatus::POSTED: return "POSTED";
        case JournalStatus::REVERSED: return "REVERSED";
    }
    return "UNKNOWN";
}

inline JournalStatus parseJournalStatus(const std::string& str) {
    if (str == "POSTED") return JournalStatus::POSTED;
    if (str == "REVERSED") return JournalStatus::REVERSED;
    throw std::invalid_argument("Unknown journal status: " + str);
}

} // namespace inventory::domain
