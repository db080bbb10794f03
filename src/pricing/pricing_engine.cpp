// SPDX-License-Identifier: MIT
#include "src/pricing/pricing_engine.hpp"
#include "src/support/spendcalc_trace.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace spendcalc {

namespace {

std::expected<void, InvalidArgument> validate_spend(double spend, [[maybe_unused]] int module_id) {
    if (!std::isfinite(spend)) {
        SPENDCALC_TRACE_VALIDATION_ERROR(module_id,
            static_cast<int>(ArgumentErrorCode::NonFiniteSpend), spend);
        return std::unexpected(InvalidArgument(ArgumentErrorCode::NonFiniteSpend, spend));
    }
    if (spend < 0.0) {
        SPENDCALC_TRACE_VALIDATION_ERROR(module_id,
            static_cast<int>(ArgumentErrorCode::NegativeSpend), spend);
        return std::unexpected(InvalidArgument(ArgumentErrorCode::NegativeSpend, spend));
    }
    return {};
}

std::expected<void, InvalidArgument> validate_commitment(double commit_amount) {
    if (!std::isfinite(commit_amount)) {
        SPENDCALC_TRACE_VALIDATION_ERROR(MODULE_COMMIT_PRICE,
            static_cast<int>(ArgumentErrorCode::NonFiniteCommitment), commit_amount);
        return std::unexpected(
            InvalidArgument(ArgumentErrorCode::NonFiniteCommitment, commit_amount));
    }
    if (commit_amount < 0.0) {
        SPENDCALC_TRACE_VALIDATION_ERROR(MODULE_COMMIT_PRICE,
            static_cast<int>(ArgumentErrorCode::NegativeCommitment), commit_amount);
        return std::unexpected(
            InvalidArgument(ArgumentErrorCode::NegativeCommitment, commit_amount));
    }
    return {};
}

}  // namespace

std::expected<PricingEngine, ConfigurationError> PricingEngine::create(
    std::shared_ptr<const TierTable> table,
    PricingConfig config)
{
    if (!table) {
        SPENDCALC_TRACE_CONFIG_ERROR(MODULE_PRICING_CONFIG,
            static_cast<int>(ConfigErrorCode::MissingTable), 0);
        return std::unexpected(ConfigurationError(ConfigErrorCode::MissingTable));
    }

    auto validation = validate_pricing_config(config);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }

    return PricingEngine(std::move(table), config);
}

std::expected<double, InvalidArgument> PricingEngine::flex_price(double spend) const {
    auto validation = validate_spend(spend, MODULE_FLEX_PRICE);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return flex_cost(spend);
}

std::expected<double, InvalidArgument> PricingEngine::commit_price(
    double spend, double commit_amount) const
{
    auto spend_ok = validate_spend(spend, MODULE_COMMIT_PRICE);
    if (!spend_ok.has_value()) {
        return std::unexpected(spend_ok.error());
    }
    auto commit_ok = validate_commitment(commit_amount);
    if (!commit_ok.has_value()) {
        return std::unexpected(commit_ok.error());
    }

    if (commit_amount == 0.0) {
        return flex_cost(spend);
    }

    const size_t tier_index = table_->index_at_or_above(commit_amount);
    const double committed = std::min(spend, commit_amount) * (*table_)[tier_index].rate;

    // Overflow restarts at the first tier; it does not continue from the
    // tiers the commitment covers.
    const double overflow = spend > commit_amount ? flex_cost(spend - commit_amount) : 0.0;

    const double cost = committed + overflow;
    SPENDCALC_TRACE_COMMIT_PRICE(spend, commit_amount, tier_index, cost);
    return cost;
}

std::expected<double, InvalidArgument> PricingEngine::recommend_commit_tier(double spend) const {
    auto validation = validate_spend(spend, MODULE_RECOMMEND);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }

    const size_t index = table_->index_containing(spend);
    const Tier& current = (*table_)[index];

    double recommended = static_cast<double>(current.upper);
    if (index + 1 < table_->size() &&
        spend > static_cast<double>(current.upper) * config_.recommend_headroom) {
        recommended = static_cast<double>((*table_)[index + 1].upper);
    }

    SPENDCALC_TRACE_RECOMMEND(spend, index, recommended);
    return recommended;
}

double PricingEngine::flex_cost(double spend) const noexcept {
    double total = 0.0;
    double remaining = spend;
    size_t tiers_used = 0;

    for (const Tier& tier : table_->tiers()) {
        if (remaining <= 0.0) {
            break;
        }
        const double tier_spend = std::min(remaining, static_cast<double>(tier.capacity()));
        total += tier_spend * tier.rate;
        remaining -= tier_spend;
        ++tiers_used;
    }

    // Spend beyond the table's reach is not billed
    if (remaining > 0.0) {
        SPENDCALC_TRACE_UNBILLED_SPEND(spend, remaining);
    }

    bool floored = false;
    if (spend <= config_.minimum_invoice_ceiling && total < config_.minimum_invoice) {
        total = config_.minimum_invoice;
        floored = true;
    }

    SPENDCALC_TRACE_FLEX_PRICE(spend, total, tiers_used, floored ? 1 : 0);
    return total;
}

} // namespace spendcalc
