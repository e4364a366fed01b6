#pragma once

#include "domain/FiscalPeriod.hpp"
#include "domain/GlDocument.hpp"
#include "domain/JournalEntry.hpp"
#include <optional>
#include <string>

namespace inventory::ports::input {

/**
 * @brief Идемпотентные проводки двойной записи по складским документам
 *
 * Ошибки GL, кроме закрытого периода, возвращаются статусом FAILED.
 */
class IGlPostingService {
public:
    virtual ~IGlPostingService() = default;

    virtual domain::GlPostingResult postGoodsReceipt(
        const std::string& orgId, const std::string& branchId, const std::string& receiptId,
        const domain::Decimal& amount, const std::string& actor) = 0;

    virtual domain::GlPostingResult postDepletion(
        const std::string& orgId, const std::string& branchId, const std::string& depletionId,
        const domain::Decimal& amount, const std::string& actor) = 0;

    virtual domain::GlPostingResult postWaste(
        const std::string& orgId, const std::string& branchId, const std::string& wasteId,
        const domain::Decimal& amount, const std::string& actor) = 0;

    virtual domain::GlPostingResult postStocktake(
        const std::string& orgId, const std::string& branchId, const std::string& sessionId,
        const domain::Decimal& variance, const std::string& actor) = 0;

    virtual domain::GlPostingResult voidGoodsReceipt(
        const std::string& orgId, const std::string& branchId, const std::string& receiptId,
        const std::string& actor) = 0;

    virtual domain::GlPostingResult voidDepletion(
        const std::string& orgId, const std::string& branchId, const std::string& depletionId,
        const std::string& actor) = 0;

    virtual domain::GlPostingResult voidWaste(
        const std::string& orgId, const std::string& branchId, const std::string& wasteId,
        const std::string& actor) = 0;

    virtual domain::GlPostingResult voidStocktake(
        const std::string& orgId, const std::string& branchId, const std::string& sessionId,
        const std::string& actor) = 0;

    /**
     * @brief Строки проводки без записи
     * @throws UnconfiguredError маппинг счетов не настроен
     */
    virtual domain::GlPreview previewPosting(
        const std::string& orgId, const std::string& branchId, const domain::GlDocument& document) = 0;

    virtual std::optional<domain::JournalEntry> getJournalEntry(
        const std::string& orgId, const std::string& entryId) = 0;

    virtual void saveFiscalPeriod(const domain::FiscalPeriod& period) = 0;
};

} // namespace inventory::ports::input
