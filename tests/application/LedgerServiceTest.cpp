/**
 * @file LedgerServiceTest.cpp
 * @brief Unit tests for LedgerService
 */

#include <gtest/gtest.h>
#include "application/LedgerService.hpp"
#include "adapters/secondary/InMemoryInventoryStore.hpp"
#include "../mocks/FixedClock.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using domain::Decimal;
using domain::LedgerReason;

class LedgerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryInventoryStore>();
        clock_ = std::make_shared<FixedClock>();
        ledger_ = std::make_shared<LedgerService>(store_, clock_);
    }

    domain::RecordLedgerEntryRequest entry(const std::string& itemId, const Decimal& qty, LedgerReason reason,
                                           const std::string& locationId = "loc-main") {
        domain::RecordLedgerEntryRequest request;
        request.itemId = itemId;
        request.locationId = locationId;
        request.qty = qty;
        request.reason = reason;
        request.sourceType = domain::source_type::MANUAL;
        request.createdBy = "user-1";
        return request;
    }

    Decimal onHand(const std::string& itemId, const std::string& locationId = "loc-main") {
        return ledger_->getOnHand("org-1", "br-1", itemId, locationId);
    }

    std::shared_ptr<adapters::secondary::InMemoryInventoryStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<LedgerService> ledger_;
};

// ============================================================================
// RECORD ENTRY TESTS
// ============================================================================

TEST_F(LedgerServiceTest, RecordEntry_Purchase_IncreasesOnHand) {
    auto result = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(10), LedgerReason::PURCHASE));

    EXPECT_FALSE(result.entry.id.empty());
    EXPECT_EQ(result.onHandAfter, Decimal(10));
    EXPECT_EQ(onHand("flour"), Decimal(10));
}

TEST_F(LedgerServiceTest, RecordEntry_SaleWithinStock_ReturnsFreshOnHand) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(10), LedgerReason::PURCHASE));

    auto result = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal::parse("-2.5"), LedgerReason::SALE));

    EXPECT_EQ(result.onHandAfter, Decimal::parse("7.5"));
    EXPECT_EQ(onHand("flour"), Decimal::parse("7.5"));
}

TEST_F(LedgerServiceTest, RecordEntry_SaleBeyondStock_ThrowsAndWritesNothing) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(3), LedgerReason::PURCHASE));

    EXPECT_THROW(
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-5), LedgerReason::SALE)),
        domain::InsufficientStockError);

    EXPECT_EQ(store_->ledgerEntryCount(), 1u);
    EXPECT_EQ(onHand("flour"), Decimal(3));
}

TEST_F(LedgerServiceTest, RecordEntry_AllowNegative_PermitsDeficit) {
    auto result = ledger_->recordEntry(
        "org-1", "br-1", entry("flour", Decimal(-4), LedgerReason::COUNT_ADJUSTMENT), domain::RecordOptions{true});

    EXPECT_EQ(result.onHandAfter, Decimal(-4));
}

TEST_F(LedgerServiceTest, RecordEntry_ZeroQty_ThrowsValidation) {
    EXPECT_THROW(
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal::zero(), LedgerReason::ADJUSTMENT)),
        domain::ValidationError);
}

TEST_F(LedgerServiceTest, RecordEntry_SignMismatch_ThrowsValidation) {
    EXPECT_THROW(
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-1), LedgerReason::PURCHASE)),
        domain::ValidationError);
    EXPECT_THROW(
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(1), LedgerReason::WASTAGE)),
        domain::ValidationError);
}

TEST_F(LedgerServiceTest, RecordEntry_MissingSourceType_ThrowsValidation) {
    auto request = entry("flour", Decimal(1), LedgerReason::PURCHASE);
    request.sourceType.clear();

    EXPECT_THROW(ledger_->recordEntry("org-1", "br-1", request), domain::ValidationError);
}

TEST_F(LedgerServiceTest, RecordEntry_StockIsolatedPerLocation) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(5), LedgerReason::PURCHASE, "loc-a"));

    EXPECT_THROW(
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-1), LedgerReason::SALE, "loc-b")),
        domain::InsufficientStockError);
    EXPECT_EQ(onHand("flour", "loc-a"), Decimal(5));
}

// ============================================================================
// QUERY TESTS
// ============================================================================

TEST_F(LedgerServiceTest, OnHandByLocation_GroupsPerLocation) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(5), LedgerReason::PURCHASE, "loc-a"));
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(7), LedgerReason::PURCHASE, "loc-b"));
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-2), LedgerReason::SALE, "loc-b"));

    auto rows = ledger_->getOnHandByLocation("org-1", "br-1", "flour");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].locationId, "loc-a");
    EXPECT_EQ(rows[0].onHand, Decimal(5));
    EXPECT_EQ(rows[1].locationId, "loc-b");
    EXPECT_EQ(rows[1].onHand, Decimal(5));
}

TEST_F(LedgerServiceTest, OnHandByBranch_FiltersByLocation) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(5), LedgerReason::PURCHASE, "loc-a"));
    ledger_->recordEntry("org-1", "br-1", entry("sugar", Decimal(3), LedgerReason::PURCHASE, "loc-a"));
    ledger_->recordEntry("org-1", "br-1", entry("sugar", Decimal(9), LedgerReason::PURCHASE, "loc-b"));

    EXPECT_EQ(ledger_->getOnHandByBranch("org-1", "br-1").size(), 3u);

    auto rows = ledger_->getOnHandByBranch("org-1", "br-1", std::string("loc-a"));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].itemId, "flour");
    EXPECT_EQ(rows[1].itemId, "sugar");
}

TEST_F(LedgerServiceTest, GetLedgerEntries_NewestFirstWithTotal) {
    for (int i = 1; i <= 5; ++i) {
        ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(i), LedgerReason::PURCHASE));
        clock_->advanceMicros(1000);
    }

    domain::LedgerQuery query;
    query.orgId = "org-1";
    query.branchId = "br-1";
    query.itemId = "flour";
    query.limit = 2;
    query.offset = 1;

    auto page = ledger_->getLedgerEntries(query);

    EXPECT_EQ(page.total, 5u);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].qty, Decimal(4));
    EXPECT_EQ(page.entries[1].qty, Decimal(3));
}

// ============================================================================
// ADJUSTMENT AND REVERSAL TESTS
// ============================================================================

TEST_F(LedgerServiceTest, RecordAdjustment_BelowZero_Throws) {
    ledger_->recordAdjustment("org-1", "br-1", "flour", "loc-main", Decimal(2), "user-1");

    EXPECT_THROW(
        ledger_->recordAdjustment("org-1", "br-1", "flour", "loc-main", Decimal(-3), "user-1"),
        domain::InsufficientStockError);
    EXPECT_EQ(onHand("flour"), Decimal(2));
}

TEST_F(LedgerServiceTest, ReverseEntry_PostsOppositeQuantityOnce) {
    auto original = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(6), LedgerReason::PURCHASE));

    auto reversal = ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2");

    EXPECT_EQ(reversal.entry.qty, Decimal(-6));
    ASSERT_TRUE(reversal.entry.sourceId.has_value());
    EXPECT_EQ(*reversal.entry.sourceId, original.entry.id);
    EXPECT_EQ(reversal.onHandAfter, Decimal::zero());

    EXPECT_THROW(ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2"), domain::ConflictError);
    EXPECT_THROW(ledger_->reverseEntry("org-1", "br-1", "missing", "user-2"), domain::NotFoundError);
}

TEST_F(LedgerServiceTest, ReverseEntry_WouldGoNegative_Throws) {
    auto original = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(6), LedgerReason::PURCHASE));
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-5), LedgerReason::SALE));

    EXPECT_THROW(ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2"),
                 domain::InsufficientStockError);
}

TEST_F(LedgerServiceTest, ReverseEntry_DocumentOwnedEntry_ThrowsConflict) {
    auto request = entry("flour", Decimal(6), LedgerReason::PURCHASE);
    request.sourceType = domain::source_type::GOODS_RECEIPT;
    request.metadata["costLayerId"] = "layer-1";
    request.metadata["value"] = "60";
    auto received = ledger_->recordEntry("org-1", "br-1", request);

    EXPECT_THROW(ledger_->reverseEntry("org-1", "br-1", received.entry.id, "user-2"), domain::ConflictError);
    EXPECT_EQ(store_->ledgerEntryCount(), 1u);
    EXPECT_EQ(onHand("flour"), Decimal(6));
}

TEST_F(LedgerServiceTest, ReverseEntry_AfterFailedAttempt_CanBeRetried) {
    auto original = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(6), LedgerReason::PURCHASE));
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-5), LedgerReason::SALE));

    EXPECT_THROW(ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2"),
                 domain::InsufficientStockError);

    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(5), LedgerReason::PURCHASE));
    auto reversal = ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2");

    EXPECT_EQ(reversal.onHandAfter, Decimal::zero());
}

// ============================================================================
// CONCURRENCY TESTS
// ============================================================================

TEST_F(LedgerServiceTest, ConcurrentSales_NeverDriveOnHandNegative) {
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(10), LedgerReason::PURCHASE));

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 25; ++i) {
        threads.emplace_back([&]() {
            try {
                ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(-1), LedgerReason::SALE));
                ++succeeded;
            } catch (const domain::InsufficientStockError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 10);
    EXPECT_EQ(rejected.load(), 15);
    EXPECT_EQ(onHand("flour"), Decimal::zero());
}

TEST_F(LedgerServiceTest, ConcurrentReversals_ApplyExactlyOnce) {
    auto original = ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(4), LedgerReason::PURCHASE));
    ledger_->recordEntry("org-1", "br-1", entry("flour", Decimal(10), LedgerReason::PURCHASE));

    std::atomic<int> succeeded{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                ledger_->reverseEntry("org-1", "br-1", original.entry.id, "user-2");
                ++succeeded;
            } catch (const domain::ConflictError&) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
    EXPECT_EQ(onHand("flour"), Decimal(10));
}
