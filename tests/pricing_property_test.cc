// SPDX-License-Identifier: MIT
/**
 * @file pricing_property_test.cc
 * @brief Invariant sweeps over the shipped tier table
 *
 * Properties tested:
 * - Monotonicity: more spend never yields a lower flex cost
 * - Floor: spend up to the floor ceiling costs at least the minimum invoice
 * - Zero commitment prices exactly as flex
 * - A commitment covering all spend bills spend at the commitment tier rate
 * - Recommendations stay inside the table and never fall below the
 *   spend's own tier
 */

#include <gtest/gtest.h>
#include "src/pricing/pricing_engine.hpp"
#include "src/pricing/reference_schedule.hpp"
#include <algorithm>
#include <memory>
#include <vector>

using namespace spendcalc;

// ============================================================================
// Test Fixtures
// ============================================================================

class PricingPropertyTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto table = make_reference_table();
        ASSERT_TRUE(table.has_value()) << table.error();
        table_ = *table;
        auto engine = PricingEngine::create(table_);
        ASSERT_TRUE(engine.has_value()) << engine.error();
        engine_ = std::make_unique<PricingEngine>(std::move(*engine));
    }

    /// Spend samples: a coarse sweep past the table maximum plus every tier
    /// boundary and its neighbours
    std::vector<double> spend_samples() const {
        std::vector<double> samples;
        for (double s = 0.0; s <= 260'000'000.0; s += 97'531.0) {
            samples.push_back(s);
        }
        for (const Tier& tier : table_->tiers()) {
            for (double d : {-1.0, -0.5, 0.0, 0.5, 1.0}) {
                samples.push_back(std::max(0.0, static_cast<double>(tier.lower) + d));
                samples.push_back(std::max(0.0, static_cast<double>(tier.upper) + d));
            }
        }
        std::sort(samples.begin(), samples.end());
        samples.erase(std::unique(samples.begin(), samples.end()), samples.end());
        return samples;
    }

    std::shared_ptr<const TierTable> table_;
    std::unique_ptr<PricingEngine> engine_;
};

// ============================================================================
// Flex pricing
// ============================================================================

TEST_F(PricingPropertyTest, FlexIsMonotonic) {
    double previous = 0.0;
    for (double spend : spend_samples()) {
        auto cost = engine_->flex_price(spend);
        ASSERT_TRUE(cost.has_value()) << cost.error();
        EXPECT_GE(*cost, previous) << "spend=" << spend;
        previous = *cost;
    }
}

TEST_F(PricingPropertyTest, FlexRespectsMinimumInvoice) {
    for (double spend = 0.0; spend <= 125'000.0; spend += 1'250.0) {
        auto cost = engine_->flex_price(spend);
        ASSERT_TRUE(cost.has_value());
        EXPECT_GE(*cost, 2500.0) << "spend=" << spend;
    }
}

TEST_F(PricingPropertyTest, FlexIsNonNegative) {
    for (double spend : spend_samples()) {
        EXPECT_GE(engine_->flex_price(spend).value(), 0.0) << "spend=" << spend;
    }
}

// ============================================================================
// Commit pricing
// ============================================================================

TEST_F(PricingPropertyTest, ZeroCommitmentMatchesFlexExactly) {
    for (double spend : spend_samples()) {
        EXPECT_EQ(engine_->commit_price(spend, 0.0).value(),
                  engine_->flex_price(spend).value()) << "spend=" << spend;
    }
}

TEST_F(PricingPropertyTest, FullCommitmentHasNoOverflow) {
    const std::vector<double> commitments = {
        1.0, 125'000.0, 300'000.0, 5'000'000.0, 99'999'999.0, 250'000'000.0, 400'000'000.0};

    for (double commit : commitments) {
        const double rate = (*table_)[table_->index_at_or_above(commit)].rate;
        for (double fraction : {0.0, 0.1, 0.5, 0.99, 1.0}) {
            const double spend = commit * fraction;
            EXPECT_DOUBLE_EQ(engine_->commit_price(spend, commit).value(), spend * rate)
                << "spend=" << spend << " commit=" << commit;
        }
    }
}

TEST_F(PricingPropertyTest, CommitIsNonDecreasingInSpend) {
    const double commit = 2'500'000.0;
    double previous = 0.0;
    for (double spend : spend_samples()) {
        double cost = engine_->commit_price(spend, commit).value();
        EXPECT_GE(cost, previous) << "spend=" << spend;
        previous = cost;
    }
}

// ============================================================================
// Recommendation
// ============================================================================

TEST_F(PricingPropertyTest, RecommendationStaysWithinTable) {
    const double max_upper = static_cast<double>(table_->max_upper());
    for (double spend : spend_samples()) {
        const Tier& current = (*table_)[table_->index_containing(spend)];
        double recommended = engine_->recommend_commit_tier(spend).value();

        EXPECT_GE(recommended, static_cast<double>(current.lower)) << "spend=" << spend;
        EXPECT_LE(recommended, max_upper) << "spend=" << spend;
    }
}

TEST_F(PricingPropertyTest, RecommendationIsATierUpperBound) {
    for (double spend : spend_samples()) {
        double recommended = engine_->recommend_commit_tier(spend).value();
        auto tiers = table_->tiers();
        bool found = std::any_of(tiers.begin(), tiers.end(), [&](const Tier& t) {
            return static_cast<double>(t.upper) == recommended;
        });
        EXPECT_TRUE(found) << "spend=" << spend << " recommended=" << recommended;
    }
}

TEST_F(PricingPropertyTest, RecommendationCoversSpendInsideTable) {
    const double max_upper = static_cast<double>(table_->max_upper());
    for (double spend : spend_samples()) {
        if (spend > max_upper) {
            continue;
        }
        EXPECT_GE(engine_->recommend_commit_tier(spend).value(), spend) << "spend=" << spend;
    }
}
