#pragma once

#include "domain/Lot.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Партии товара и FEFO-распределение
 */
class ILotService {
public:
    virtual ~ILotService() = default;

    virtual domain::CreateLotResult createLot(const domain::CreateLotInput& input) = 0;

    virtual std::optional<domain::Lot> getLot(const std::string& orgId, const std::string& lotId) = 0;

    virtual domain::LotPage listLots(const domain::LotQuery& query) = 0;

    virtual std::vector<domain::Lot> getExpiringSoon(
        const std::string& orgId, const std::optional<std::string>& branchId, int days) = 0;

    /**
     * @brief Расчёт FEFO без изменений
     */
    virtual domain::FefoResult allocateFEFO(const domain::FefoRequest& request) = 0;

    virtual domain::LotMutationResult decrementLot(
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::string& sourceId,
        int allocationOrder = 1,
        const std::optional<std::string>& ledgerEntryId = std::nullopt) = 0;

    virtual domain::LotMutationResult incrementLot(
        const std::string& orgId,
        const std::string& lotId,
        const domain::Decimal& qty,
        const std::string& sourceType,
        const std::optional<std::string>& sourceId = std::nullopt) = 0;

    virtual domain::LotTraceability getTraceability(const std::string& orgId, const std::string& lotId) = 0;

    virtual std::vector<domain::LotAllocation> getAllocationsForSource(
        const std::string& orgId, const std::string& sourceType, const std::string& sourceId) = 0;

    /**
     * @return количество партий, переведённых в EXPIRED
     */
    virtual size_t updateExpiredLots(const std::string& orgId) = 0;

    virtual domain::LotMutationResult quarantineLot(
        const std::string& orgId, const std::string& lotId, const std::string& actor) = 0;

    virtual domain::LotMutationResult releaseLot(
        const std::string& orgId, const std::string& lotId, const std::string& actor) = 0;
};

} // namespace inventory::ports::input
