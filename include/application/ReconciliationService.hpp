#pragma once

#include "ports/input/IReconciliationService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "application/PostingMappingResolver.hpp"
#include "domain/Errors.hpp"
#include "domain/GlDocument.hpp"
#include "domain/enums/SourceType.hpp"
#include "settings/EngineSettings.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сверка склада и GL по категориям документов
 *
 * Склад: Σ value записей журнала категории за период.
 * GL: Σ(debit - credit) по счёту Inventory Asset в проводках категории,
 * включая сторнированные и сами сторно.
 */
class ReconciliationService : public ports::input::IReconciliationService {
public:
    ReconciliationService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<PostingMappingResolver> mappings,
        std::shared_ptr<settings::EngineSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , mappings_(std::move(mappings))
      , settings_(std::move(settings))
      , clock_(std::move(clock))
    {
        std::cout << "[ReconciliationService] Created" << std::endl;
    }

    domain::ReconciliationResult reconcile(
        const std::string& orgId,
        const std::string& branchId,
        const domain::Timestamp& from,
        const domain::Timestamp& to) override
    {
        if (to < from) {
            throw domain::ValidationError("Reconciliation window ends before it starts");
        }

        const auto& policy = settings_->getTolerancePolicy();

        domain::ReconciliationResult result;
        result.orgId = orgId;
        result.branchId = branchId;
        result.from = from;
        result.to = to;
        result.generatedAt = clock_->now();

        store_->transact([&](ports::output::IStoreSession& session) {
            std::optional<domain::PostingMapping> mapping;
            try {
                mapping = mappings_->resolveMapping(session, orgId, branchId);
            } catch (const domain::UnconfiguredError& e) {
                std::cerr << "[ReconciliationService] " << e.what() << std::endl;
            }

            for (const auto& category : categories()) {
                domain::ReconciliationCategory row;
                row.category = category.name;
                row.inventoryValue = inventoryValue(session, orgId, branchId, category.ledgerSources, from, to);
                row.tolerance = policy.toleranceFor(row.inventoryValue);

                if (!mapping) {
                    row.delta = row.inventoryValue;
                    row.status = domain::ReconciliationStatus::WARN;
                    row.warnings.push_back("GL posting mapping not configured");
                    result.categories.push_back(std::move(row));
                    continue;
                }

                domain::JournalQuery query;
                query.orgId = orgId;
                query.branchId = branchId;
                query.sources = category.journalSources;
                query.from = from;
                query.to = to;

                for (const auto& journal : session.findJournalEntries(query)) {
                    row.journalEntryIds.push_back(journal.id);
                    for (const auto& line : journal.lines) {
                        if (line.accountId != mapping->inventoryAssetAccountId) continue;
                        row.glDebitTotal += line.debit;
                        row.glCreditTotal += line.credit;
                    }
                }

                row.glNetValue = row.glDebitTotal - row.glCreditTotal;
                row.delta = row.inventoryValue - row.glNetValue;
                if (row.delta.abs() > row.tolerance) {
                    row.status = domain::ReconciliationStatus::WARN;
                    row.warnings.push_back(
                        "Inventory value " + row.inventoryValue.toString(2) + " differs from GL " +
                        row.glNetValue.toString(2) + " by " + row.delta.toString(2));
                }
                result.categories.push_back(std::move(row));
            }
        });

        for (const auto& row : result.categories) {
            if (row.status == domain::ReconciliationStatus::WARN) {
                result.overallStatus = domain::ReconciliationStatus::WARN;
            }
        }

        std::cout << "[ReconciliationService] " << orgId << "/" << branchId << " "
                  << from.toDateString() << ".." << to.toDateString() << " -> "
                  << domain::toString(result.overallStatus) << std::endl;
        return result;
    }

private:
    static constexpr size_t kPageSize = 500;

    struct Category {
        std::string name;
        std::vector<std::string> ledgerSources;
        std::vector<std::string> journalSources;
    };

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<PostingMappingResolver> mappings_;
    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    static const std::vector<Category>& categories() {
        static const std::vector<Category> kCategories = {
            {"RECEIPTS",
             {domain::source_type::GOODS_RECEIPT},
             {domain::GoodsReceiptDocument::kSource, domain::GoodsReceiptDocument::kVoidSource}},
            {"DEPLETION",
             {domain::source_type::ORDER},
             {domain::DepletionDocument::kSource, domain::DepletionDocument::kVoidSource}},
            {"WASTE",
             {domain::source_type::WASTAGE, domain::source_type::WASTAGE_VOID},
             {domain::WasteDocument::kSource, domain::WasteDocument::kVoidSource}},
            {"STOCKTAKE",
             {domain::source_type::COUNT_SESSION},
             {domain::StocktakeDocument::kSource, domain::StocktakeDocument::kVoidSource}},
        };
        return kCategories;
    }

    static domain::Decimal inventoryValue(
        ports::output::IStoreSession& session,
        const std::string& orgId,
        const std::string& branchId,
        const std::vector<std::string>& sourceTypes,
        const domain::Timestamp& from,
        const domain::Timestamp& to)
    {
        domain::Decimal total;
        for (const auto& sourceType : sourceTypes) {
            domain::LedgerQuery query;
            query.orgId = orgId;
            query.branchId = branchId;
            query.sourceType = sourceType;
            query.from = from;
            query.to = to;
            query.limit = kPageSize;

            for (;;) {
                auto page = session.findLedgerEntries(query);
                for (const auto& entry : page.entries) {
                    total += entry.value();
                }
                query.offset += page.entries.size();
                if (page.entries.empty() || query.offset >= page.total) break;
            }
        }
        return total;
    }
};

} // namespace inventory::application
