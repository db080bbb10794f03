// SPDX-License-Identifier: MIT
/**
 * @file price_quote.hpp
 * @brief Flex vs commit comparison for a spend/commitment pair
 */

#pragma once

#include "src/pricing/pricing_engine.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace spendcalc {

/// Both pricing models evaluated for one spend level
struct PriceQuote {
    double spend = 0.0;
    double commit_amount = 0.0;
    double flex_cost = 0.0;
    double commit_cost = 0.0;
    double savings = 0.0;             ///< flex_cost - commit_cost (negative when commit costs more)
    double recommended_commit = 0.0;  ///< recommend_commit_tier(spend)
    double max_commit_amount = 0.0;   ///< max(spend, recommended_commit)

    [[nodiscard]] bool has_savings() const noexcept { return savings > 0.0; }
};

struct QuoteRequest {
    double spend = 0.0;
    double commit_amount = 0.0;
};

/// Result for a batch of quotes, one entry per request
struct BatchQuoteResult {
    std::vector<std::expected<PriceQuote, InvalidArgument>> quotes;
    size_t failed_count = 0;
};

/// Price one spend/commitment pair under both models
///
/// @return Quote, or the first InvalidArgument raised by the engine
std::expected<PriceQuote, InvalidArgument> quote(
    const PricingEngine& engine, double spend, double commit_amount);

/// Price a batch of requests; failures are reported per entry
BatchQuoteResult quote_batch(const PricingEngine& engine,
                             const std::vector<QuoteRequest>& requests);

}  // namespace spendcalc
