#pragma once

#include "Timestamp.hpp"
#include <string>

namespace inventory::domain {

/**
 * @brief Ключ идемпотентности бизнес-операции
 *
 * Уникален по (orgId, operation, key). Захватывается один раз на документ.
 */
struct IdempotencyRecord {
    std::string orgId;
    std::string operation;       ///< GOODS_RECEIPT, DEPLETION, WASTE, ...
    std::string key;
    Timestamp createdAt;
};

} // namespace inventory::domain
