// SPDX-License-Identifier: MIT
#include "src/pricing/price_quote.hpp"
#include "src/support/spendcalc_trace.h"
#include <algorithm>
#include <utility>

namespace spendcalc {

std::expected<PriceQuote, InvalidArgument> quote(
    const PricingEngine& engine, double spend, double commit_amount)
{
    auto flex = engine.flex_price(spend);
    if (!flex.has_value()) {
        return std::unexpected(flex.error());
    }

    auto commit = engine.commit_price(spend, commit_amount);
    if (!commit.has_value()) {
        return std::unexpected(commit.error());
    }

    auto recommended = engine.recommend_commit_tier(spend);
    if (!recommended.has_value()) {
        return std::unexpected(recommended.error());
    }

    PriceQuote result;
    result.spend = spend;
    result.commit_amount = commit_amount;
    result.flex_cost = *flex;
    result.commit_cost = *commit;
    result.savings = *flex - *commit;
    result.recommended_commit = *recommended;
    result.max_commit_amount = std::max(spend, *recommended);
    return result;
}

BatchQuoteResult quote_batch(const PricingEngine& engine,
                             const std::vector<QuoteRequest>& requests)
{
    SPENDCALC_TRACE_ALGO_START(MODULE_PRICE_QUOTE, requests.size(), 0);

    BatchQuoteResult result;
    result.quotes.reserve(requests.size());

    for (const auto& request : requests) {
        auto q = quote(engine, request.spend, request.commit_amount);
        if (!q.has_value()) {
            ++result.failed_count;
        }
        result.quotes.push_back(std::move(q));
    }

    SPENDCALC_TRACE_ALGO_COMPLETE(MODULE_PRICE_QUOTE, requests.size(), result.failed_count);
    return result;
}

}  // namespace spendcalc
