// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/pricing/price_quote.hpp"
#include "src/pricing/reference_schedule.hpp"
#include <memory>
#include <vector>

namespace spendcalc {
namespace {

class PriceQuoteTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto table = make_reference_table();
        ASSERT_TRUE(table.has_value()) << table.error();
        auto engine = PricingEngine::create(*table);
        ASSERT_TRUE(engine.has_value()) << engine.error();
        engine_ = std::make_unique<PricingEngine>(std::move(*engine));
    }

    std::unique_ptr<PricingEngine> engine_;
};

// ===========================================================================
// quote()
// ===========================================================================

TEST_F(PriceQuoteTest, ZeroCommitmentHasNoSavings) {
    auto q = quote(*engine_, 500000.0, 0.0);
    ASSERT_TRUE(q.has_value()) << q.error();

    EXPECT_EQ(q->flex_cost, q->commit_cost);
    EXPECT_DOUBLE_EQ(q->savings, 0.0);
    EXPECT_FALSE(q->has_savings());
}

TEST_F(PriceQuoteTest, GoodCommitmentSaves) {
    auto q = quote(*engine_, 500000.0, 416667.0);
    ASSERT_TRUE(q.has_value()) << q.error();

    EXPECT_DOUBLE_EQ(q->flex_cost, engine_->flex_price(500000.0).value());
    EXPECT_DOUBLE_EQ(q->commit_cost, engine_->commit_price(500000.0, 416667.0).value());
    EXPECT_DOUBLE_EQ(q->savings, q->flex_cost - q->commit_cost);
    EXPECT_TRUE(q->has_savings());
}

TEST_F(PriceQuoteTest, PoorCommitmentHasNegativeSavings) {
    auto q = quote(*engine_, 130000.0, 125000.0);
    ASSERT_TRUE(q.has_value()) << q.error();
    EXPECT_LT(q->savings, 0.0);
    EXPECT_FALSE(q->has_savings());
}

TEST_F(PriceQuoteTest, CarriesRecommendation) {
    auto q = quote(*engine_, 110000.0, 0.0);
    ASSERT_TRUE(q.has_value()) << q.error();
    EXPECT_DOUBLE_EQ(q->recommended_commit, 250000.0);
    // Recommendation exceeds spend, so it caps the commitment range
    EXPECT_DOUBLE_EQ(q->max_commit_amount, 250000.0);
}

TEST_F(PriceQuoteTest, MaxCommitFollowsSpendAboveTable) {
    auto q = quote(*engine_, 300'000'000.0, 0.0);
    ASSERT_TRUE(q.has_value()) << q.error();
    EXPECT_DOUBLE_EQ(q->recommended_commit, 250'000'000.0);
    EXPECT_DOUBLE_EQ(q->max_commit_amount, 300'000'000.0);
}

TEST_F(PriceQuoteTest, EchoesInputs) {
    auto q = quote(*engine_, 777777.0, 500000.0);
    ASSERT_TRUE(q.has_value()) << q.error();
    EXPECT_DOUBLE_EQ(q->spend, 777777.0);
    EXPECT_DOUBLE_EQ(q->commit_amount, 500000.0);
}

TEST_F(PriceQuoteTest, PropagatesInvalidArgument) {
    auto bad_spend = quote(*engine_, -1.0, 0.0);
    ASSERT_FALSE(bad_spend.has_value());
    EXPECT_EQ(bad_spend.error().code, ArgumentErrorCode::NegativeSpend);

    auto bad_commit = quote(*engine_, 1000.0, -1.0);
    ASSERT_FALSE(bad_commit.has_value());
    EXPECT_EQ(bad_commit.error().code, ArgumentErrorCode::NegativeCommitment);
}

// ===========================================================================
// quote_batch()
// ===========================================================================

TEST_F(PriceQuoteTest, BatchReportsFailuresPerEntry) {
    std::vector<QuoteRequest> requests = {
        {.spend = 50000.0, .commit_amount = 0.0},
        {.spend = -10.0, .commit_amount = 0.0},
        {.spend = 500000.0, .commit_amount = 416667.0},
        {.spend = 1000.0, .commit_amount = -1.0},
    };

    auto result = quote_batch(*engine_, requests);

    ASSERT_EQ(result.quotes.size(), requests.size());
    EXPECT_EQ(result.failed_count, 2u);

    ASSERT_TRUE(result.quotes[0].has_value());
    EXPECT_DOUBLE_EQ(result.quotes[0]->flex_cost, 2500.0);
    EXPECT_FALSE(result.quotes[1].has_value());
    ASSERT_TRUE(result.quotes[2].has_value());
    EXPECT_TRUE(result.quotes[2]->has_savings());
    ASSERT_FALSE(result.quotes[3].has_value());
    EXPECT_EQ(result.quotes[3].error().code, ArgumentErrorCode::NegativeCommitment);
}

TEST_F(PriceQuoteTest, EmptyBatch) {
    auto result = quote_batch(*engine_, {});
    EXPECT_TRUE(result.quotes.empty());
    EXPECT_EQ(result.failed_count, 0u);
}

} // namespace
} // namespace spendcalc
