/**
 * @file GlPostingServiceTest.cpp
 * @brief Unit tests for GlPostingService
 */

#include <gtest/gtest.h>
#include "application/GlPostingService.hpp"
#include "adapters/secondary/InMemoryInventoryStore.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/MockAuditSink.hpp"
#include <map>
#include <set>
#include <thread>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using domain::Decimal;
using domain::GlPostingStatus;
using domain::Timestamp;

class GlPostingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryInventoryStore>();
        clock_ = std::make_shared<FixedClock>(Timestamp::fromString("2024-03-15T12:00:00"));
        audit_ = std::make_shared<MockAuditSink>();
        mappings_ = std::make_shared<PostingMappingResolver>(store_);
        gl_ = std::make_shared<GlPostingService>(store_, mappings_, clock_, audit_);
    }

    domain::PostingMapping mapping(std::optional<std::string> branchId = std::nullopt,
                                   const std::string& assetAccount = "1400") {
        domain::PostingMapping m;
        m.orgId = "org-1";
        m.branchId = branchId;
        m.inventoryAssetAccountId = assetAccount;
        m.cogsAccountId = "5000";
        m.wasteExpenseAccountId = "5100";
        m.shrinkExpenseAccountId = "5200";
        m.grniAccountId = "2100";
        return m;
    }

    void savePeriod(domain::FiscalPeriodStatus status) {
        domain::FiscalPeriod period;
        period.id = "fp-2024-03";
        period.orgId = "org-1";
        period.name = "March 2024";
        period.startsAt = Timestamp::fromString("2024-03-01");
        period.endsAt = Timestamp::fromString("2024-03-31T23:59:59");
        period.status = status;
        gl_->saveFiscalPeriod(period);
    }

    domain::JournalEntry journal(const std::optional<std::string>& id) {
        EXPECT_TRUE(id.has_value());
        auto entry = gl_->getJournalEntry("org-1", id.value_or(""));
        EXPECT_TRUE(entry.has_value());
        return entry.value_or(domain::JournalEntry{});
    }

    std::shared_ptr<adapters::secondary::InMemoryInventoryStore> store_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<MockAuditSink> audit_;
    std::shared_ptr<PostingMappingResolver> mappings_;
    std::shared_ptr<GlPostingService> gl_;
};

// ============================================================================
// POSTING TESTS
// ============================================================================

TEST_F(GlPostingServiceTest, PostGoodsReceipt_CreatesBalancedEntry) {
    mappings_->saveMapping(mapping());

    auto result = gl_->postGoodsReceipt("org-1", "br-1", "gr-1", Decimal(1600), "user-1");

    EXPECT_EQ(result.status, GlPostingStatus::POSTED);
    EXPECT_FALSE(result.isIdempotent);

    auto entry = journal(result.journalEntryId);
    EXPECT_TRUE(entry.isBalanced());
    EXPECT_EQ(entry.source, "INV_GOODS_RECEIPT");
    EXPECT_EQ(entry.memo, "Goods Receipt: gr-1");
    EXPECT_EQ(entry.totalDebit(), Decimal(1600));
    EXPECT_EQ(audit_->countAction("gl.posting.created"), 1);
}

TEST_F(GlPostingServiceTest, PostDepletion_Retry_ReturnsSameEntry) {
    mappings_->saveMapping(mapping());

    auto first = gl_->postDepletion("org-1", "br-1", "ord-1", Decimal(42), "user-1");
    auto second = gl_->postDepletion("org-1", "br-1", "ord-1", Decimal(42), "user-1");

    EXPECT_EQ(second.status, GlPostingStatus::POSTED);
    EXPECT_TRUE(second.isIdempotent);
    EXPECT_EQ(second.journalEntryId, first.journalEntryId);
    EXPECT_EQ(store_->journalEntryCount(), 1u);
    EXPECT_EQ(audit_->countAction("gl.posting.created"), 1);
}

TEST_F(GlPostingServiceTest, PostWaste_ZeroAmount_Skipped) {
    mappings_->saveMapping(mapping());

    auto result = gl_->postWaste("org-1", "br-1", "w-1", Decimal::zero(), "user-1");

    EXPECT_EQ(result.status, GlPostingStatus::SKIPPED);
    EXPECT_FALSE(result.journalEntryId.has_value());
    EXPECT_EQ(store_->journalEntryCount(), 0u);
}

TEST_F(GlPostingServiceTest, Post_NoMapping_ReturnsFailed) {
    auto result = gl_->postWaste("org-1", "br-1", "w-1", Decimal(10), "user-1");

    EXPECT_EQ(result.status, GlPostingStatus::FAILED);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("not configured"), std::string::npos);
    EXPECT_EQ(store_->journalEntryCount(), 0u);
}

TEST_F(GlPostingServiceTest, Post_BranchMappingPreferredOverOrgDefault) {
    mappings_->saveMapping(mapping(std::nullopt, "1400"));
    mappings_->saveMapping(mapping(std::string("br-1"), "1401"));

    auto branchEntry = journal(gl_->postGoodsReceipt("org-1", "br-1", "gr-1", Decimal(5), "u").journalEntryId);
    auto defaultEntry = journal(gl_->postGoodsReceipt("org-1", "br-2", "gr-2", Decimal(5), "u").journalEntryId);

    EXPECT_EQ(branchEntry.lines[0].accountId, "1401");
    EXPECT_EQ(defaultEntry.lines[0].accountId, "1400");
}

TEST_F(GlPostingServiceTest, PostStocktake_GainAndShrink) {
    mappings_->saveMapping(mapping());

    auto gain = journal(gl_->postStocktake("org-1", "br-1", "cs-1", Decimal(12), "u").journalEntryId);
    auto shrink = journal(gl_->postStocktake("org-1", "br-1", "cs-2", Decimal(-7), "u").journalEntryId);

    EXPECT_EQ(gain.lines[0].accountId, "1400");
    EXPECT_EQ(gain.lines[0].debit, Decimal(12));
    EXPECT_EQ(shrink.lines[0].accountId, "5200");
    EXPECT_EQ(shrink.lines[0].debit, Decimal(7));
}

// ============================================================================
// FISCAL PERIOD TESTS
// ============================================================================

TEST_F(GlPostingServiceTest, Post_LockedPeriod_Throws) {
    mappings_->saveMapping(mapping());
    savePeriod(domain::FiscalPeriodStatus::LOCKED);

    EXPECT_THROW(gl_->postGoodsReceipt("org-1", "br-1", "gr-1", Decimal(10), "u"), domain::PeriodLockedError);
    EXPECT_EQ(store_->journalEntryCount(), 0u);
}

TEST_F(GlPostingServiceTest, Post_LockedPeriodWithoutMapping_StillThrows) {
    savePeriod(domain::FiscalPeriodStatus::LOCKED);

    EXPECT_THROW(gl_->postWaste("org-1", "br-1", "w-1", Decimal(10), "u"), domain::PeriodLockedError);
}

TEST_F(GlPostingServiceTest, Post_ClosedPeriod_StillPosts) {
    mappings_->saveMapping(mapping());
    savePeriod(domain::FiscalPeriodStatus::CLOSED);

    auto result = gl_->postGoodsReceipt("org-1", "br-1", "gr-1", Decimal(10), "u");

    EXPECT_EQ(result.status, GlPostingStatus::POSTED);
}

TEST_F(GlPostingServiceTest, SaveFiscalPeriod_EndBeforeStart_ThrowsValidation) {
    domain::FiscalPeriod period;
    period.id = "fp-bad";
    period.orgId = "org-1";
    period.name = "Bad";
    period.startsAt = Timestamp::fromString("2024-03-31");
    period.endsAt = Timestamp::fromString("2024-03-01");

    EXPECT_THROW(gl_->saveFiscalPeriod(period), domain::ValidationError);
}

// ============================================================================
// REVERSAL TESTS
// ============================================================================

TEST_F(GlPostingServiceTest, VoidWaste_SwapsLinesAndMarksOriginal) {
    mappings_->saveMapping(mapping());
    auto posted = gl_->postWaste("org-1", "br-1", "w-1", Decimal(30), "user-1");

    auto voided = gl_->voidWaste("org-1", "br-1", "w-1", "user-2");

    EXPECT_EQ(voided.status, GlPostingStatus::POSTED);
    auto original = journal(posted.journalEntryId);
    auto reversal = journal(voided.journalEntryId);

    EXPECT_EQ(original.status, domain::JournalStatus::REVERSED);
    ASSERT_TRUE(original.reversedBy.has_value());
    EXPECT_EQ(*original.reversedBy, reversal.id);
    ASSERT_TRUE(reversal.reversesEntryId.has_value());
    EXPECT_EQ(*reversal.reversesEntryId, original.id);
    EXPECT_EQ(reversal.source, "INV_WASTE_VOID");
    EXPECT_TRUE(reversal.isBalanced());

    std::map<std::string, Decimal> net;
    for (const auto& e : {original, reversal}) {
        for (const auto& line : e.lines) {
            net[line.accountId] += line.debit - line.credit;
        }
    }
    for (const auto& [account, value] : net) {
        EXPECT_TRUE(value.isZero()) << account;
    }
    EXPECT_EQ(audit_->countAction("gl.posting.reversed"), 1);
}

TEST_F(GlPostingServiceTest, VoidWaste_Twice_SecondIsIdempotentSkip) {
    mappings_->saveMapping(mapping());
    gl_->postWaste("org-1", "br-1", "w-1", Decimal(30), "user-1");
    gl_->voidWaste("org-1", "br-1", "w-1", "user-2");

    auto again = gl_->voidWaste("org-1", "br-1", "w-1", "user-2");

    EXPECT_EQ(again.status, GlPostingStatus::SKIPPED);
    EXPECT_TRUE(again.isIdempotent);
    EXPECT_EQ(store_->journalEntryCount(), 2u);
}

TEST_F(GlPostingServiceTest, VoidGoodsReceipt_NoOriginal_Skipped) {
    auto result = gl_->voidGoodsReceipt("org-1", "br-1", "gr-404", "user-1");

    EXPECT_EQ(result.status, GlPostingStatus::SKIPPED);
    EXPECT_EQ(store_->journalEntryCount(), 0u);
}

TEST_F(GlPostingServiceTest, VoidDepletion_LockedPeriod_Throws) {
    mappings_->saveMapping(mapping());
    gl_->postDepletion("org-1", "br-1", "ord-1", Decimal(10), "user-1");
    savePeriod(domain::FiscalPeriodStatus::LOCKED);

    EXPECT_THROW(gl_->voidDepletion("org-1", "br-1", "ord-1", "user-1"), domain::PeriodLockedError);
    EXPECT_EQ(store_->journalEntryCount(), 1u);
}

// ============================================================================
// PREVIEW AND MAPPING TESTS
// ============================================================================

TEST_F(GlPostingServiceTest, PreviewPosting_DoesNotWrite) {
    mappings_->saveMapping(mapping());

    auto preview = gl_->previewPosting("org-1", "br-1", domain::StocktakeDocument{Decimal(-3)});

    EXPECT_EQ(preview.documentType, "STOCKTAKE");
    EXPECT_TRUE(preview.balanced);
    EXPECT_EQ(preview.totalDebit, Decimal(3));
    EXPECT_EQ(store_->journalEntryCount(), 0u);
}

TEST_F(GlPostingServiceTest, PreviewPosting_NoMapping_ThrowsUnconfigured) {
    EXPECT_THROW(gl_->previewPosting("org-1", "br-1", domain::WasteDocument{Decimal(1)}),
                 domain::UnconfiguredError);
}

TEST_F(GlPostingServiceTest, SaveMapping_MissingAccount_ThrowsValidation) {
    auto m = mapping();
    m.grniAccountId.clear();

    EXPECT_THROW(mappings_->saveMapping(m), domain::ValidationError);
}

// ============================================================================
// CONCURRENCY TESTS
// ============================================================================

TEST_F(GlPostingServiceTest, ConcurrentPosts_SameSource_SingleJournal) {
    mappings_->saveMapping(mapping());

    std::vector<std::thread> threads;
    std::vector<std::optional<std::string>> ids(10);
    for (size_t i = 0; i < ids.size(); ++i) {
        threads.emplace_back([this, &ids, i]() {
            ids[i] = gl_->postDepletion("org-1", "br-1", "ord-1", Decimal(15), "user-1").journalEntryId;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store_->journalEntryCount(), 1u);
    std::set<std::string> distinct;
    for (const auto& id : ids) {
        ASSERT_TRUE(id.has_value());
        distinct.insert(*id);
    }
    EXPECT_EQ(distinct.size(), 1u);
}
