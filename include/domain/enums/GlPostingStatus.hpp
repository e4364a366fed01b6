#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Итог попытки проводки в GL
 *
 * FAILED не откатывает складскую операцию: GL вспомогательный.
 */
enum class GlPostingStatus {
    POSTED,
    SKIPPED,
    FAILED
};

inline std::string toString(GlPostingStatus status) {
    switch (status) {
        case GlPostingStatus::POSTED: return "POSTED";
        case GlPostingStatus::SKIPPED: return "SKIPPED";
        case GlPostingStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
