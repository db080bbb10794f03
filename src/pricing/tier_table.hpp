// SPDX-License-Identifier: MIT
/**
 * @file tier_table.hpp
 * @brief Ordered, validated table of spend rate tiers
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

namespace spendcalc {

/// One pricing bracket: spend in [lower, upper] is billed at `rate` per dollar
struct Tier {
    int64_t lower = 0;   ///< Inclusive lower bound of monthly spend (dollars)
    int64_t upper = 0;   ///< Inclusive upper bound of monthly spend (dollars)
    double rate = 0.0;   ///< Price per dollar of spend (e.g. 0.033)

    /// Dollar width of the bracket as billed by flex accumulation
    [[nodiscard]] int64_t capacity() const noexcept { return upper - lower; }

    [[nodiscard]] bool contains(double spend) const noexcept {
        return spend >= static_cast<double>(lower) && spend <= static_cast<double>(upper);
    }
};

/// Immutable tier schedule
///
/// Invariants established by create() and never broken afterwards:
/// - at least one tier
/// - first tier starts at 0
/// - tiers are ascending and contiguous: tier[i+1].lower == tier[i].upper + 1
/// - every tier has upper > lower and a finite positive rate
///
/// Decreasing rates (the volume discount) are not enforced here; pricing
/// stays well defined without it. Use is_volume_discounted() to check.
class TierTable {
public:
    /// Validate and take ownership of a tier list
    ///
    /// @return Table on success, ConfigurationError naming the first
    ///         violated invariant and the index of the offending tier
    [[nodiscard]] static std::expected<TierTable, ConfigurationError> create(std::vector<Tier> tiers);

    [[nodiscard]] std::span<const Tier> tiers() const noexcept { return tiers_; }
    [[nodiscard]] size_t size() const noexcept { return tiers_.size(); }
    [[nodiscard]] const Tier& operator[](size_t i) const { return tiers_[i]; }

    /// Highest spend covered by the table
    [[nodiscard]] int64_t max_upper() const noexcept { return tiers_.back().upper; }

    /// Index of the first tier whose upper bound is >= amount
    ///
    /// Amounts above the table maximum map to the last tier. Binary search
    /// over the sorted upper bounds.
    [[nodiscard]] size_t index_at_or_above(double amount) const noexcept;

    /// Index of the first tier whose [lower, upper] contains amount
    ///
    /// Amounts no tier contains (above the maximum, or a fractional amount
    /// between one tier's upper and the next tier's lower) map to the last tier.
    [[nodiscard]] size_t index_containing(double amount) const noexcept;

    /// True when every tier's rate is strictly below the previous tier's
    [[nodiscard]] bool is_volume_discounted() const noexcept;

private:
    explicit TierTable(std::vector<Tier> tiers) : tiers_(std::move(tiers)) {}

    std::vector<Tier> tiers_;
};

} // namespace spendcalc
