// SPDX-License-Identifier: MIT
/**
 * @file pricing_engine.hpp
 * @brief Flex and commit pricing over a tier table
 *
 * Three operations, all pure functions of their inputs and the table:
 *
 * - flex_price(): spend is spread across tiers in ascending order, each
 *   tier billing up to its width (upper - lower) at its own rate. Spend at
 *   or below the minimum invoice ceiling is billed at least the minimum
 *   invoice.
 *
 * - commit_price(): the committed block is billed at the rate of the tier
 *   that covers the commitment; spend above the commitment is priced as a
 *   fresh flex purchase starting from the first tier.
 *
 * - recommend_commit_tier(): the upper bound of the tier holding the spend,
 *   or of the next tier once spend passes the headroom fraction of the
 *   current tier's upper bound.
 *
 * The engine never mutates its table and keeps no per-call state, so one
 * instance can be shared across threads.
 */

#pragma once

#include "src/pricing/pricing_config.hpp"
#include "src/pricing/tier_table.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <memory>
#include <span>
#include <utility>

namespace spendcalc {

class PricingEngine {
public:
    /// Bind an engine to a validated table
    ///
    /// @param table Shared tier table (must be non-null)
    /// @param config Commercial constants (validated here)
    /// @return Engine on success, ConfigurationError on null table or bad config
    [[nodiscard]] static std::expected<PricingEngine, ConfigurationError> create(
        std::shared_ptr<const TierTable> table,
        PricingConfig config = {});

    /// Flex cost of a monthly spend
    ///
    /// @param spend Monthly spend in dollars, >= 0
    /// @return Cost in dollars, InvalidArgument on negative or non-finite spend
    [[nodiscard]] std::expected<double, InvalidArgument> flex_price(double spend) const;

    /// Commit cost of a monthly spend against a commitment
    ///
    /// A zero commitment prices exactly as flex_price(spend). Otherwise
    /// min(spend, commit_amount) is billed at the commitment tier's rate
    /// and any excess at flex_price(spend - commit_amount).
    ///
    /// @param spend Monthly spend in dollars, >= 0
    /// @param commit_amount Committed monthly spend in dollars, >= 0
    /// @return Cost in dollars, InvalidArgument on negative or non-finite input
    [[nodiscard]] std::expected<double, InvalidArgument> commit_price(
        double spend, double commit_amount) const;

    /// Suggested commitment (a tier upper bound) for a monthly spend
    [[nodiscard]] std::expected<double, InvalidArgument> recommend_commit_tier(double spend) const;

    /// Tiers in ascending order, for display
    [[nodiscard]] std::span<const Tier> list_tiers() const noexcept { return table_->tiers(); }

    [[nodiscard]] const TierTable& table() const noexcept { return *table_; }
    [[nodiscard]] const PricingConfig& config() const noexcept { return config_; }

private:
    PricingEngine(std::shared_ptr<const TierTable> table, PricingConfig config)
        : table_(std::move(table)), config_(config) {}

    /// Flex accumulation for already-validated spend
    double flex_cost(double spend) const noexcept;

    std::shared_ptr<const TierTable> table_;
    PricingConfig config_;
};

} // namespace spendcalc
