#pragma once

#include "ports/input/IGlPostingService.hpp"
#include "ports/output/IAuditSink.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "application/AuditHook.hpp"
#include "application/PostingMappingResolver.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <memory>
#include <variant>

namespace inventory::application {

/**
 * @brief Проводки складских документов в GL
 *
 * Порядок для каждого документа:
 * 1. Существующая проводка (orgId, source, sourceId) -> isIdempotent
 * 2. Нулевая сумма -> SKIPPED
 * 3. Дата в LOCKED периоде -> PeriodLockedError (откат всей транзакции)
 * 4. Нет маппинга -> FAILED
 * 5. Сбалансированные строки, вставка под уникальным ключом
 */
class GlPostingService : public ports::input::IGlPostingService {
public:
    GlPostingService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<PostingMappingResolver> mappings,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IAuditSink> audit
    ) : store_(std::move(store))
      , mappings_(std::move(mappings))
      , clock_(std::move(clock))
      , audit_(std::move(audit))
    {
        std::cout << "[GlPostingService] Created" << std::endl;
    }

    // ========================================================================
    // Проводки
    // ========================================================================

    domain::GlPostingResult postGoodsReceipt(
        const std::string& orgId, const std::string& branchId, const std::string& receiptId,
        const domain::Decimal& amount, const std::string& actor) override
    {
        return postInTransaction(orgId, branchId, receiptId, domain::GoodsReceiptDocument{amount}, actor);
    }

    domain::GlPostingResult postDepletion(
        const std::string& orgId, const std::string& branchId, const std::string& depletionId,
        const domain::Decimal& amount, const std::string& actor) override
    {
        return postInTransaction(orgId, branchId, depletionId, domain::DepletionDocument{amount}, actor);
    }

    domain::GlPostingResult postWaste(
        const std::string& orgId, const std::string& branchId, const std::string& wasteId,
        const domain::Decimal& amount, const std::string& actor) override
    {
        return postInTransaction(orgId, branchId, wasteId, domain::WasteDocument{amount}, actor);
    }

    domain::GlPostingResult postStocktake(
        const std::string& orgId, const std::string& branchId, const std::string& sessionId,
        const domain::Decimal& variance, const std::string& actor) override
    {
        return postInTransaction(orgId, branchId, sessionId, domain::StocktakeDocument{variance}, actor);
    }

    /**
     * @brief Провести документ в транзакции вызывающего
     *
     * @throws PeriodLockedError дата проводки в закрытом периоде
     * @throws InvariantViolationError строки не сбалансированы
     */
    template <typename Document>
    domain::GlPostingResult post(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& sourceId,
        const Document& document,
        const std::string& actor)
    {
        if (auto existing = session.findJournalBySource(orgId, Document::kSource, sourceId)) {
            std::cout << "[GlPostingService] " << Document::kSource << " " << sourceId
                      << " already posted as " << existing->id << std::endl;
            return domain::GlPostingResult{existing->id, domain::GlPostingStatus::POSTED, std::nullopt, true};
        }

        if (auto reason = domain::skipReason(document)) {
            std::cout << "[GlPostingService] SKIPPED " << Document::kSource << " " << sourceId
                      << ": " << *reason << std::endl;
            return domain::GlPostingResult{std::nullopt, domain::GlPostingStatus::SKIPPED, reason, false};
        }

        domain::Timestamp date = clock_->now();
        ensurePeriodOpen(session, orgId, date);

        domain::PostingMapping mapping;
        try {
            mapping = mappings_->resolveMapping(session, orgId, branchId);
        } catch (const domain::UnconfiguredError& e) {
            std::cerr << "[GlPostingService] FAILED " << Document::kSource << " " << sourceId
                      << ": " << e.what() << std::endl;
            return domain::GlPostingResult{std::nullopt, domain::GlPostingStatus::FAILED, std::string(e.what()), false};
        }

        domain::JournalEntry entry;
        entry.id = utils::IdGenerator::uuid();
        entry.orgId = orgId;
        entry.branchId = branchId;
        entry.date = date;
        entry.memo = domain::memoFor(document, sourceId);
        entry.source = Document::kSource;
        entry.sourceId = sourceId;
        entry.status = domain::JournalStatus::POSTED;
        entry.postedBy = actor;
        entry.lines = domain::journalLines(document, mapping);

        ensureBalanced(entry);

        if (!session.insertJournalEntry(entry)) {
            auto winner = session.findJournalBySource(orgId, Document::kSource, sourceId);
            if (!winner) {
                throw domain::InvariantViolationError(
                    std::string("Journal ") + Document::kSource + " " + sourceId + " conflicted but cannot be read back");
            }
            return domain::GlPostingResult{winner->id, domain::GlPostingStatus::POSTED, std::nullopt, true};
        }

        std::cout << "[GlPostingService] Posted " << Document::kSource << " " << sourceId
                  << " amount " << domain::documentAmount(document) << " as " << entry.id << std::endl;

        nlohmann::json metadata;
        metadata["source"] = entry.source;
        metadata["sourceId"] = sourceId;
        metadata["documentType"] = Document::kType;
        metadata["amount"] = domain::documentAmount(document).toString();
        auditAfterCommit(session, audit_, {
            orgId, branchId, actor, "gl.posting.created", "JournalEntry", entry.id, metadata, date});

        return domain::GlPostingResult{entry.id, domain::GlPostingStatus::POSTED, std::nullopt, false};
    }

    domain::GlPostingResult post(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& sourceId,
        const domain::GlDocument& document,
        const std::string& actor)
    {
        return std::visit([&](const auto& doc) {
            return post(session, orgId, branchId, sourceId, doc, actor);
        }, document);
    }

    // ========================================================================
    // Сторно
    // ========================================================================

    domain::GlPostingResult voidGoodsReceipt(
        const std::string& orgId, const std::string& branchId, const std::string& receiptId,
        const std::string& actor) override
    {
        return reverseInTransaction<domain::GoodsReceiptDocument>(orgId, branchId, receiptId, actor);
    }

    domain::GlPostingResult voidDepletion(
        const std::string& orgId, const std::string& branchId, const std::string& depletionId,
        const std::string& actor) override
    {
        return reverseInTransaction<domain::DepletionDocument>(orgId, branchId, depletionId, actor);
    }

    domain::GlPostingResult voidWaste(
        const std::string& orgId, const std::string& branchId, const std::string& wasteId,
        const std::string& actor) override
    {
        return reverseInTransaction<domain::WasteDocument>(orgId, branchId, wasteId, actor);
    }

    domain::GlPostingResult voidStocktake(
        const std::string& orgId, const std::string& branchId, const std::string& sessionId,
        const std::string& actor) override
    {
        return reverseInTransaction<domain::StocktakeDocument>(orgId, branchId, sessionId, actor);
    }

    /**
     * @brief Сторно проводки документа в транзакции вызывающего
     *
     * Строки оригинала с переставленными дебетом и кредитом; оригинал
     * помечается REVERSED. Нет оригинала или он уже сторнирован -> SKIPPED.
     */
    template <typename Document>
    domain::GlPostingResult reverse(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::string& sourceId,
        const std::string& actor)
    {
        auto original = session.findJournalBySource(orgId, Document::kSource, sourceId);
        if (!original) {
            std::cout << "[GlPostingService] SKIPPED void " << Document::kSource << " " << sourceId
                      << ": no original entry" << std::endl;
            return domain::GlPostingResult{
                std::nullopt, domain::GlPostingStatus::SKIPPED, std::string("Original entry not found"), true};
        }
        if (original->status == domain::JournalStatus::REVERSED ||
            session.findJournalBySource(orgId, Document::kVoidSource, sourceId)) {
            std::cout << "[GlPostingService] SKIPPED void " << Document::kSource << " " << sourceId
                      << ": already reversed" << std::endl;
            return domain::GlPostingResult{
                original->reversedBy, domain::GlPostingStatus::SKIPPED, std::string("Entry already reversed"), true};
        }

        domain::Timestamp date = clock_->now();
        ensurePeriodOpen(session, orgId, date);

        domain::JournalEntry reversal;
        reversal.id = utils::IdGenerator::uuid();
        reversal.orgId = orgId;
        reversal.branchId = original->branchId;
        reversal.date = date;
        reversal.memo = std::string(Document::kVoidMemo) + ": " + sourceId;
        reversal.source = Document::kVoidSource;
        reversal.sourceId = sourceId;
        reversal.status = domain::JournalStatus::POSTED;
        reversal.postedBy = actor;
        reversal.reversesEntryId = original->id;
        for (const auto& line : original->lines) {
            domain::JournalLine swapped = line;
            swapped.debit = line.credit;
            swapped.credit = line.debit;
            reversal.lines.push_back(std::move(swapped));
        }

        ensureBalanced(reversal);

        if (!session.insertJournalEntry(reversal)) {
            return domain::GlPostingResult{
                std::nullopt, domain::GlPostingStatus::SKIPPED, std::string("Entry already reversed"), true};
        }
        session.markJournalReversed(original->id, reversal.id, date);

        std::cout << "[GlPostingService] Reversed " << original->id << " (" << Document::kSource << " "
                  << sourceId << ") with " << reversal.id << std::endl;

        nlohmann::json metadata;
        metadata["source"] = reversal.source;
        metadata["sourceId"] = sourceId;
        metadata["reversesEntryId"] = original->id;
        auditAfterCommit(session, audit_, {
            orgId, branchId, actor, "gl.posting.reversed", "JournalEntry", reversal.id, metadata, date});

        return domain::GlPostingResult{reversal.id, domain::GlPostingStatus::POSTED, std::nullopt, false};
    }

    // ========================================================================
    // Чтение и настройка
    // ========================================================================

    domain::GlPreview previewPosting(
        const std::string& orgId, const std::string& branchId, const domain::GlDocument& document) override
    {
        auto mapping = mappings_->resolveMapping(orgId, branchId);

        domain::GlPreview preview;
        std::visit([&](const auto& doc) {
            using Document = std::decay_t<decltype(doc)>;
            preview.documentType = Document::kType;
            preview.lines = domain::journalLines(doc, mapping);
        }, document);

        for (const auto& line : preview.lines) {
            preview.totalDebit += line.debit;
            preview.totalCredit += line.credit;
        }
        preview.balanced = preview.totalDebit == preview.totalCredit;
        return preview;
    }

    std::optional<domain::JournalEntry> getJournalEntry(const std::string& orgId, const std::string& entryId) override {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return session.findJournalById(orgId, entryId);
        });
    }

    void saveFiscalPeriod(const domain::FiscalPeriod& period) override {
        if (period.endsAt < period.startsAt) {
            throw domain::ValidationError("Fiscal period ends before it starts");
        }
        store_->transact([&](ports::output::IStoreSession& session) {
            session.upsertFiscalPeriod(period);
        });
        std::cout << "[GlPostingService] Fiscal period " << period.name << " -> "
                  << domain::toString(period.status) << std::endl;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<PostingMappingResolver> mappings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IAuditSink> audit_;

    template <typename Document>
    domain::GlPostingResult postInTransaction(
        const std::string& orgId, const std::string& branchId, const std::string& sourceId,
        const Document& document, const std::string& actor)
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return post(session, orgId, branchId, sourceId, document, actor);
        });
    }

    template <typename Document>
    domain::GlPostingResult reverseInTransaction(
        const std::string& orgId, const std::string& branchId, const std::string& sourceId,
        const std::string& actor)
    {
        return store_->inTransaction([&](ports::output::IStoreSession& session) {
            return reverse<Document>(session, orgId, branchId, sourceId, actor);
        });
    }

    static void ensurePeriodOpen(ports::output::IStoreSession& session, const std::string& orgId,
                                 const domain::Timestamp& date) {
        auto period = session.findFiscalPeriod(orgId, date);
        if (period && period->status == domain::FiscalPeriodStatus::LOCKED) {
            std::cerr << "[GlPostingService] Period " << period->name << " is LOCKED for "
                      << date.toDateString() << std::endl;
            throw domain::PeriodLockedError(
                "Cannot post to locked fiscal period " + period->name + " (" + date.toDateString() + ")");
        }
    }

    static void ensureBalanced(const domain::JournalEntry& entry) {
        if (!entry.isBalanced()) {
            throw domain::InvariantViolationError(
                "Unbalanced journal entry " + entry.source + " " + entry.sourceId +
                ": debit " + entry.totalDebit().toString() + " != credit " + entry.totalCredit().toString());
        }
    }
};

} // namespace inventory::application
