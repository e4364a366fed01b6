/**
 * @file GlDocumentTest.cpp
 * @brief Unit tests for GL document pairing rules
 */

#include <gtest/gtest.h>
#include "domain/GlDocument.hpp"
#include "domain/Lot.hpp"

using namespace inventory::domain;

class GlDocumentTest : public ::testing::Test {
protected:
    void SetUp() override {
        mapping_.orgId = "org-1";
        mapping_.inventoryAssetAccountId = "1400";
        mapping_.cogsAccountId = "5000";
        mapping_.wasteExpenseAccountId = "5100";
        mapping_.shrinkExpenseAccountId = "5200";
        mapping_.grniAccountId = "2100";
    }

    static Decimal sumDebit(const std::vector<JournalLine>& lines) {
        Decimal total;
        for (const auto& line : lines) total += line.debit;
        return total;
    }

    static Decimal sumCredit(const std::vector<JournalLine>& lines) {
        Decimal total;
        for (const auto& line : lines) total += line.credit;
        return total;
    }

    PostingMapping mapping_;
};

// ============================================================================
// PAIRING RULES
// ============================================================================

TEST_F(GlDocumentTest, GoodsReceipt_DebitsAssetCreditsGrni) {
    auto lines = journalLines(GoodsReceiptDocument{Decimal::parse("1600")}, mapping_);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].accountId, "1400");
    EXPECT_EQ(lines[0].debit, Decimal(1600));
    EXPECT_EQ(lines[1].accountId, "2100");
    EXPECT_EQ(lines[1].credit, Decimal(1600));
    EXPECT_EQ(sumDebit(lines), sumCredit(lines));
}

TEST_F(GlDocumentTest, Depletion_NegativeAmount_NormalizedToAbsolute) {
    auto lines = journalLines(DepletionDocument{Decimal::parse("-42.5")}, mapping_);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].accountId, "5000");
    EXPECT_EQ(lines[0].debit, Decimal::parse("42.5"));
    EXPECT_EQ(lines[1].accountId, "1400");
    EXPECT_EQ(lines[1].credit, Decimal::parse("42.5"));
}

TEST_F(GlDocumentTest, Waste_DebitsWasteExpense) {
    auto lines = journalLines(WasteDocument{Decimal(30)}, mapping_);

    EXPECT_EQ(lines[0].accountId, "5100");
    EXPECT_EQ(lines[1].accountId, "1400");
    EXPECT_EQ(lines[0].meta["type"], "WASTE_EXPENSE");
}

TEST_F(GlDocumentTest, StocktakeGain_WithoutGainAccount_UsesShrinkAccount) {
    auto lines = journalLines(StocktakeDocument{Decimal(12)}, mapping_);

    EXPECT_EQ(lines[0].accountId, "1400");
    EXPECT_EQ(lines[0].debit, Decimal(12));
    EXPECT_EQ(lines[1].accountId, "5200");
    EXPECT_EQ(lines[1].credit, Decimal(12));
}

TEST_F(GlDocumentTest, StocktakeGain_WithGainAccount_CreditsGain) {
    mapping_.inventoryGainAccountId = "4900";

    auto lines = journalLines(StocktakeDocument{Decimal(12)}, mapping_);

    EXPECT_EQ(lines[1].accountId, "4900");
}

TEST_F(GlDocumentTest, StocktakeShrink_DebitsShrinkCreditsAsset) {
    auto lines = journalLines(StocktakeDocument{Decimal(-8)}, mapping_);

    EXPECT_EQ(lines[0].accountId, "5200");
    EXPECT_EQ(lines[0].debit, Decimal(8));
    EXPECT_EQ(lines[1].accountId, "1400");
    EXPECT_EQ(lines[1].credit, Decimal(8));
}

// ============================================================================
// SKIP RULES
// ============================================================================

TEST_F(GlDocumentTest, SkipReason_ZeroAmounts) {
    EXPECT_TRUE(skipReason(GoodsReceiptDocument{Decimal::zero()}).has_value());
    EXPECT_TRUE(skipReason(DepletionDocument{Decimal::zero()}).has_value());
    EXPECT_TRUE(skipReason(WasteDocument{Decimal::zero()}).has_value());
    EXPECT_TRUE(skipReason(StocktakeDocument{Decimal::zero()}).has_value());

    EXPECT_FALSE(skipReason(WasteDocument{Decimal(1)}).has_value());
    EXPECT_FALSE(skipReason(StocktakeDocument{Decimal(-1)}).has_value());
}

TEST_F(GlDocumentTest, MemoFor_StocktakeNamesDirection) {
    EXPECT_EQ(memoFor(StocktakeDocument{Decimal(1)}, "cs-1"), "Stocktake Variance: cs-1 (Gain)");
    EXPECT_EQ(memoFor(StocktakeDocument{Decimal(-1)}, "cs-1"), "Stocktake Variance: cs-1 (Shrinkage)");
}

// ============================================================================
// LOT ORDERING AND STATUS
// ============================================================================

TEST(LotTest, FefoKey_UndatedLotsSortAfterDatedOnes) {
    Lot dated;
    dated.id = "b";
    dated.expiryDate = Timestamp::fromString("2030-12-31");
    dated.createdAt = Timestamp::fromString("2024-01-02");

    Lot undated;
    undated.id = "a";
    undated.createdAt = Timestamp::fromString("2024-01-01");

    EXPECT_LT(fefoKey(dated), fefoKey(undated));
}

TEST(LotTest, DerivedStatus_FollowsRemainingAndExpiry) {
    Timestamp now = Timestamp::fromString("2024-02-01");

    Lot lot;
    lot.receivedQty = Decimal(10);
    lot.remainingQty = Decimal(10);
    lot.expiryDate = Timestamp::fromString("2024-01-15");
    EXPECT_EQ(lot.derivedStatus(now), LotStatus::EXPIRED);

    lot.remainingQty = Decimal::zero();
    EXPECT_EQ(lot.derivedStatus(now), LotStatus::DEPLETED);

    lot.status = LotStatus::QUARANTINE;
    EXPECT_EQ(lot.derivedStatus(now), LotStatus::QUARANTINE);

    lot.status = LotStatus::ACTIVE;
    lot.remainingQty = Decimal(1);
    lot.expiryDate = Timestamp::fromString("2024-03-01");
    EXPECT_EQ(lot.derivedStatus(now), LotStatus::ACTIVE);
}
