/**
 * @file ReconciliationServiceTest.cpp
 * @brief Unit tests for ReconciliationService
 */

#include <gtest/gtest.h>
#include "application/InventoryMovementService.hpp"
#include "application/ReconciliationService.hpp"
#include "adapters/secondary/InMemoryInventoryStore.hpp"
#include "adapters/secondary/InMemoryRecipeProvider.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/MockAuditSink.hpp"
#include <stdexcept>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using domain::Decimal;
using domain::ReconciliationStatus;
using domain::Timestamp;

class ReconciliationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryInventoryStore>();
        clock_ = std::make_shared<FixedClock>(Timestamp::fromString("2024-01-10T09:00:00"));
        auto audit = std::make_shared<MockAuditSink>();
        auto recipes = std::make_shared<adapters::secondary::InMemoryRecipeProvider>();
        settings_ = std::make_shared<settings::EngineSettings>();
        settings_->setTolerancePolicy(domain::TolerancePolicy{Decimal::parse("0.01"), Decimal::zero()});

        mappings_ = std::make_shared<PostingMappingResolver>(store_);
        auto ledger = std::make_shared<LedgerService>(store_, clock_);
        auto lots = std::make_shared<LotService>(store_, clock_, audit);
        auto costing = std::make_shared<CostingService>(store_, recipes, clock_);
        gl_ = std::make_shared<GlPostingService>(store_, mappings_, clock_, audit);
        movements_ = std::make_shared<InventoryMovementService>(store_, ledger, lots, costing, gl_, clock_);
        reconciliation_ = std::make_shared<ReconciliationService>(store_, mappings_, settings_, clock_);
    }

    void configureMapping() {
        domain::PostingMapping mapping;
        mapping.orgId = "org-1";
        mapping.inventoryAssetAccountId = "1400";
        mapping.cogsAccountId = "5000";
        mapping.wasteExpenseAccountId = "5100";
        mapping.shrinkExpenseAccountId = "5200";
        mapping.grniAccountId = "2100";
        mappings_->saveMapping(mapping);
    }

    void receive(const std::string& receiptId, const std::string& itemId, const Decimal& qty, const Decimal& unitCost) {
        movements_->receiveGoods({"org-1", "br-1", receiptId, "user-1", {{itemId, "loc-main", qty, unitCost}}});
    }

    domain::ReconciliationResult reconcileJanuary() {
        return reconciliation_->reconcile("org-1", "br-1",
                                          Timestamp::fromString("2024-01-01"),
                                          Timestamp::fromString("2024-01-31T23:59:59"));
    }

    static const domain::ReconciliationCategory& category(const domain::ReconciliationResult& result,
                                                          const std::string& name) {
        for (const auto& row : result.categories) {
            if (row.category == name) return row;
        }
        throw std::runtime_error("category not found: " + name);
    }

    std::shared_ptr<adapters::secondary::InMemoryInventoryStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<PostingMappingResolver> mappings_;
    std::shared_ptr<GlPostingService> gl_;
    std::shared_ptr<InventoryMovementService> movements_;
    std::shared_ptr<ReconciliationService> reconciliation_;
};

// ============================================================================
// MATCH TESTS
// ============================================================================

TEST_F(ReconciliationServiceTest, Reconcile_ConsistentPostings_AllCategoriesMatch) {
    configureMapping();
    receive("gr-1", "beef", Decimal(10), Decimal(100));
    receive("gr-2", "flour", Decimal(10), Decimal(5));
    movements_->recordDepletion({"org-1", "br-1", "ord-1", "user-1", {{"beef", "loc-main", Decimal(3)}}});
    movements_->recordWaste({"org-1", "br-1", "w-1", "user-1", {{"beef", "loc-main", Decimal(1)}}});
    movements_->voidWaste("org-1", "br-1", "w-1", "user-1");
    movements_->applyStocktake({"org-1", "br-1", "cs-1", "user-1", {
        {"beef", "loc-main", Decimal(6)},
        {"flour", "loc-main", Decimal(12)},
    }});

    auto result = reconcileJanuary();

    EXPECT_EQ(result.overallStatus, ReconciliationStatus::MATCH);
    ASSERT_EQ(result.categories.size(), 4u);

    const auto& receipts = category(result, "RECEIPTS");
    EXPECT_EQ(receipts.inventoryValue, Decimal(1050));
    EXPECT_EQ(receipts.glNetValue, Decimal(1050));
    EXPECT_EQ(receipts.journalEntryIds.size(), 2u);

    const auto& depletion = category(result, "DEPLETION");
    EXPECT_EQ(depletion.inventoryValue, Decimal(-300));
    EXPECT_EQ(depletion.glCreditTotal, Decimal(300));

    const auto& waste = category(result, "WASTE");
    EXPECT_TRUE(waste.inventoryValue.isZero());
    EXPECT_EQ(waste.glDebitTotal, Decimal(100));
    EXPECT_EQ(waste.glCreditTotal, Decimal(100));
    EXPECT_EQ(waste.journalEntryIds.size(), 2u);

    const auto& stocktake = category(result, "STOCKTAKE");
    EXPECT_EQ(stocktake.inventoryValue, Decimal(-90));
    EXPECT_EQ(stocktake.glNetValue, Decimal(-90));
    EXPECT_TRUE(stocktake.delta.isZero());
}

TEST_F(ReconciliationServiceTest, Reconcile_EmptyWindow_Matches) {
    configureMapping();
    receive("gr-1", "beef", Decimal(10), Decimal(100));

    auto result = reconciliation_->reconcile("org-1", "br-1",
                                             Timestamp::fromString("2024-02-01"),
                                             Timestamp::fromString("2024-02-29T23:59:59"));

    EXPECT_EQ(result.overallStatus, ReconciliationStatus::MATCH);
    EXPECT_TRUE(category(result, "RECEIPTS").inventoryValue.isZero());
    EXPECT_TRUE(category(result, "RECEIPTS").journalEntryIds.empty());
}

// ============================================================================
// WARN TESTS
// ============================================================================

TEST_F(ReconciliationServiceTest, Reconcile_NoMapping_AllCategoriesWarn) {
    receive("gr-1", "beef", Decimal(10), Decimal(100));

    auto result = reconcileJanuary();

    EXPECT_EQ(result.overallStatus, ReconciliationStatus::WARN);
    for (const auto& row : result.categories) {
        EXPECT_EQ(row.status, ReconciliationStatus::WARN) << row.category;
        EXPECT_FALSE(row.warnings.empty());
    }
    EXPECT_EQ(category(result, "RECEIPTS").delta, Decimal(1000));
}

TEST_F(ReconciliationServiceTest, Reconcile_GlWithoutStockMovement_Warns) {
    configureMapping();
    receive("gr-1", "beef", Decimal(10), Decimal(100));
    gl_->postGoodsReceipt("org-1", "br-1", "gr-manual", Decimal(50), "user-1");

    auto result = reconcileJanuary();

    const auto& receipts = category(result, "RECEIPTS");
    EXPECT_EQ(receipts.status, ReconciliationStatus::WARN);
    EXPECT_EQ(receipts.delta, Decimal(-50));
    EXPECT_EQ(receipts.warnings.size(), 1u);
    EXPECT_EQ(category(result, "DEPLETION").status, ReconciliationStatus::MATCH);
    EXPECT_EQ(result.overallStatus, ReconciliationStatus::WARN);
}

TEST_F(ReconciliationServiceTest, Reconcile_RelativeTolerance_AbsorbsSmallDelta) {
    configureMapping();
    settings_->setTolerancePolicy(domain::TolerancePolicy{Decimal::parse("0.01"), Decimal::parse("0.1")});
    receive("gr-1", "beef", Decimal(10), Decimal(100));
    gl_->postGoodsReceipt("org-1", "br-1", "gr-manual", Decimal(50), "user-1");

    auto result = reconcileJanuary();

    const auto& receipts = category(result, "RECEIPTS");
    EXPECT_EQ(receipts.tolerance, Decimal(100));
    EXPECT_EQ(receipts.status, ReconciliationStatus::MATCH);
    EXPECT_EQ(result.overallStatus, ReconciliationStatus::MATCH);
}

TEST_F(ReconciliationServiceTest, Reconcile_WindowEndsBeforeStart_ThrowsValidation) {
    EXPECT_THROW(reconciliation_->reconcile("org-1", "br-1",
                                            Timestamp::fromString("2024-02-01"),
                                            Timestamp::fromString("2024-01-01")),
                 domain::ValidationError);
}
