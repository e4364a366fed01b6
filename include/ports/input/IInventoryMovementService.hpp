#pragma once

#include "domain/Movement.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Бизнес-операции склада: каждая в одной транзакции, с ключом идемпотентности
 *
 * Повторный вызов с тем же документом возвращает isAlreadyPosted = true
 * и идентификаторы строк, созданных первым вызовом.
 */
class IInventoryMovementService {
public:
    virtual ~IInventoryMovementService() = default;

    virtual domain::ReceiptResult receiveGoods(const domain::ReceiptRequest& request) = 0;

    virtual domain::IssueResult recordDepletion(const domain::IssueRequest& request) = 0;

    virtual domain::IssueResult recordWaste(const domain::IssueRequest& request) = 0;

    virtual domain::VoidResult voidWaste(
        const std::string& orgId, const std::string& branchId,
        const std::string& wasteId, const std::string& actor) = 0;

    virtual domain::StocktakeResult applyStocktake(const domain::StocktakeRequest& request) = 0;
};

} // namespace inventory::ports::input
