/**
 * @file StockLockingTest.cpp
 * @brief Stock-key locking order across movements and reversals
 *
 * Изменение остатка и слоёв допустимо только после блокировки складского
 * места, иначе две параллельные транзакции Postgres читают одни и те же
 * остатки слоёв.
 */

#include <gtest/gtest.h>
#include "application/InventoryMovementService.hpp"
#include "adapters/secondary/InMemoryInventoryStore.hpp"
#include "adapters/secondary/InMemoryRecipeProvider.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/LockTrackingStore.hpp"
#include "../mocks/MockAuditSink.hpp"

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using domain::Decimal;
using domain::Timestamp;

class StockLockingTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<LockTrackingStore>(
            std::make_shared<adapters::secondary::InMemoryInventoryStore>());
        clock_ = std::make_shared<FixedClock>(Timestamp::fromString("2024-01-01T09:00:00"));
        auto audit = std::make_shared<MockAuditSink>();
        auto recipes = std::make_shared<adapters::secondary::InMemoryRecipeProvider>();

        auto mappings = std::make_shared<PostingMappingResolver>(store_);
        ledger_ = std::make_shared<LedgerService>(store_, clock_);
        auto lots = std::make_shared<LotService>(store_, clock_, audit);
        auto costing = std::make_shared<CostingService>(store_, recipes, clock_);
        auto gl = std::make_shared<GlPostingService>(store_, mappings, clock_, audit);
        movements_ = std::make_shared<InventoryMovementService>(store_, ledger_, lots, costing, gl, clock_);

        movements_->receiveGoods({"org-1", "br-1", "gr-1", "user-1", {
            {"beef", "loc-main", Decimal(10), Decimal(100), std::string("L-1"), Timestamp::fromString("2024-02-01")},
        }});
        store_->clearEvents();
    }

    domain::IssueRequest issue(const std::string& documentId, const Decimal& qty) {
        return domain::IssueRequest{"org-1", "br-1", documentId, "user-1", {{"beef", "loc-main", qty}}};
    }

    void expectLockedBeforeLayers() {
        int lock = store_->indexOf("lock:" + kBeef);
        int layers = store_->indexOf("layers:" + kBeef);
        ASSERT_GE(lock, 0);
        ASSERT_GE(layers, 0);
        EXPECT_LT(lock, layers);

        auto events = store_->getEvents();
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].rfind("layer-update:", 0) == 0) {
                EXPECT_LT(lock, static_cast<int>(i)) << events[i];
            }
        }
    }

    const std::string kBeef = "org-1/br-1/beef/loc-main";

    std::shared_ptr<LockTrackingStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<LedgerService> ledger_;
    std::shared_ptr<InventoryMovementService> movements_;
};

// ============================================================================
// ISSUE TESTS
// ============================================================================

TEST_F(StockLockingTest, RecordDepletion_LocksStockKeyBeforeReadingLayers) {
    movements_->recordDepletion(issue("ord-1", Decimal(3)));

    expectLockedBeforeLayers();
}

TEST_F(StockLockingTest, RecordWaste_LocksStockKeyBeforeReadingLayers) {
    movements_->recordWaste(issue("w-1", Decimal(2)));

    expectLockedBeforeLayers();
}

TEST_F(StockLockingTest, ApplyStocktakeLoss_LocksStockKeyBeforeReadingLayers) {
    movements_->applyStocktake({"org-1", "br-1", "cs-1", "user-1", {{"beef", "loc-main", Decimal(7)}}});

    expectLockedBeforeLayers();
}

TEST_F(StockLockingTest, VoidWaste_RestoresLayersUnderLock) {
    movements_->recordWaste(issue("w-1", Decimal(2)));
    store_->clearEvents();

    movements_->voidWaste("org-1", "br-1", "w-1", "user-1");

    int lock = store_->indexOf("lock:" + kBeef);
    ASSERT_GE(lock, 0);
    auto events = store_->getEvents();
    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].rfind("layer-update:", 0) == 0) {
            EXPECT_LT(lock, static_cast<int>(i)) << events[i];
        }
    }
}

// ============================================================================
// REVERSAL TESTS
// ============================================================================

TEST_F(StockLockingTest, ReverseEntry_ClaimsReversalUnderLock) {
    auto adjustment = ledger_->recordAdjustment("org-1", "br-1", "beef", "loc-main", Decimal(2), "user-1");
    store_->clearEvents();

    ledger_->reverseEntry("org-1", "br-1", adjustment.entry.id, "user-2");

    int lock = store_->indexOf("lock:" + kBeef);
    int claim = store_->indexOf("claim:LEDGER_REVERSAL:" + adjustment.entry.id);
    int insert = store_->indexOf("ledger-insert:" + kBeef);
    ASSERT_GE(lock, 0);
    ASSERT_GE(claim, 0);
    EXPECT_LT(lock, claim);
    EXPECT_LT(claim, insert);
}
