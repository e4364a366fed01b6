/**
 * @file InMemoryInventoryStoreTest.cpp
 * @brief Unit tests for InMemoryInventoryStore
 */

#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryInventoryStore.hpp"
#include <stdexcept>

using namespace inventory;
using namespace inventory::adapters::secondary;
using inventory::ports::output::IStoreSession;
using domain::Decimal;
using domain::Timestamp;

class InMemoryInventoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<InMemoryInventoryStore>();
    }

    static domain::LedgerEntry entry(const std::string& id, const Decimal& qty) {
        domain::LedgerEntry e;
        e.id = id;
        e.orgId = "org-1";
        e.branchId = "br-1";
        e.itemId = "flour";
        e.locationId = "loc-main";
        e.qty = qty;
        e.reason = domain::LedgerReason::PURCHASE;
        e.sourceType = "MANUAL";
        e.createdAt = Timestamp::fromString("2024-01-01T09:00:00");
        return e;
    }

    static domain::StockKey key() {
        return {"org-1", "br-1", "flour", "loc-main"};
    }

    std::unique_ptr<InMemoryInventoryStore> store_;
};

TEST_F(InMemoryInventoryStoreTest, Transact_Commit_PersistsWrites) {
    store_->transact([](IStoreSession& session) {
        session.insertLedgerEntry(entry("le-1", Decimal(5)));
    });

    EXPECT_EQ(store_->ledgerEntryCount(), 1u);
    auto total = store_->inTransaction([](IStoreSession& session) {
        return session.sumOnHand(key());
    });
    EXPECT_EQ(total, Decimal(5));
}

TEST_F(InMemoryInventoryStoreTest, Transact_Exception_RollsBackAndRethrows) {
    EXPECT_THROW(
        store_->transact([](IStoreSession& session) {
            session.insertLedgerEntry(entry("le-1", Decimal(5)));
            session.claimIdempotencyKey({"org-1", "GOODS_RECEIPT", "gr-1", Timestamp::fromString("2024-01-01")});
            throw std::runtime_error("boom");
        }),
        std::runtime_error);

    EXPECT_EQ(store_->ledgerEntryCount(), 0u);
    bool claimed = store_->inTransaction([](IStoreSession& session) {
        return session.claimIdempotencyKey({"org-1", "GOODS_RECEIPT", "gr-1", Timestamp::fromString("2024-01-01")});
    });
    EXPECT_TRUE(claimed);
}

TEST_F(InMemoryInventoryStoreTest, OnCommit_RunsOnlyAfterSuccessfulCommit) {
    int committed = 0;
    int rolledBack = 0;

    store_->transact([&](IStoreSession& session) {
        session.onCommit([&]() { ++committed; });
        EXPECT_EQ(committed, 0);
    });

    EXPECT_THROW(
        store_->transact([&](IStoreSession& session) {
            session.onCommit([&]() { ++rolledBack; });
            throw std::runtime_error("boom");
        }),
        std::runtime_error);

    EXPECT_EQ(committed, 1);
    EXPECT_EQ(rolledBack, 0);
}

TEST_F(InMemoryInventoryStoreTest, ClaimIdempotencyKey_SecondClaimReturnsFalse) {
    domain::IdempotencyRecord record{"org-1", "WASTE", "w-1", Timestamp::fromString("2024-01-01")};

    bool first = store_->inTransaction([&](IStoreSession& session) { return session.claimIdempotencyKey(record); });
    bool second = store_->inTransaction([&](IStoreSession& session) { return session.claimIdempotencyKey(record); });

    EXPECT_TRUE(first);
    EXPECT_FALSE(second);

    record.orgId = "org-2";
    bool otherOrg = store_->inTransaction([&](IStoreSession& session) { return session.claimIdempotencyKey(record); });
    EXPECT_TRUE(otherOrg);
}

TEST_F(InMemoryInventoryStoreTest, FindLedgerEntries_NewestFirstAndFiltered) {
    store_->transact([](IStoreSession& session) {
        auto first = entry("le-1", Decimal(1));
        auto second = entry("le-2", Decimal(2));
        second.createdAt = Timestamp::fromString("2024-01-02T09:00:00");
        auto other = entry("le-3", Decimal(3));
        other.itemId = "sugar";
        session.insertLedgerEntry(first);
        session.insertLedgerEntry(second);
        session.insertLedgerEntry(other);
    });

    auto page = store_->inTransaction([](IStoreSession& session) {
        domain::LedgerQuery query;
        query.orgId = "org-1";
        query.branchId = "br-1";
        query.itemId = "flour";
        return session.findLedgerEntries(query);
    });

    EXPECT_EQ(page.total, 2u);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].id, "le-2");
    EXPECT_EQ(page.entries[1].id, "le-1");
}
