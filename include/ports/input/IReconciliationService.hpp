#pragma once

#include "domain/Reconciliation.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Сверка стоимости движений склада с проводками GL
 */
class IReconciliationService {
public:
    virtual ~IReconciliationService() = default;

    virtual domain::ReconciliationResult reconcile(
        const std::string& orgId,
        const std::string& branchId,
        const domain::Timestamp& from,
        const domain::Timestamp& to) = 0;
};

} // namespace inventory::ports::input
