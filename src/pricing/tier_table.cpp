// SPDX-License-Identifier: MIT
#include "src/pricing/tier_table.hpp"
#include "src/support/spendcalc_trace.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace spendcalc {

namespace {

std::unexpected<ConfigurationError> reject(ConfigErrorCode code, size_t index, double value) {
    SPENDCALC_TRACE_CONFIG_ERROR(MODULE_TIER_TABLE, static_cast<int>(code), index);
    return std::unexpected(ConfigurationError(code, index, value));
}

}  // namespace

std::expected<TierTable, ConfigurationError> TierTable::create(std::vector<Tier> tiers) {
    SPENDCALC_TRACE_ALGO_START(MODULE_TIER_TABLE, tiers.size(), 0);

    if (tiers.empty()) {
        return reject(ConfigErrorCode::EmptyTable, 0, 0.0);
    }

    if (tiers.front().lower != 0) {
        return reject(ConfigErrorCode::NonZeroStart, 0,
                      static_cast<double>(tiers.front().lower));
    }

    for (size_t i = 0; i < tiers.size(); ++i) {
        const Tier& tier = tiers[i];

        if (i > 0) {
            const Tier& prev = tiers[i - 1];
            if (tier.lower <= prev.lower) {
                return reject(ConfigErrorCode::NonAscendingBounds, i,
                              static_cast<double>(tier.lower));
            }
            // Bounds are inclusive, so the next tier starts one dollar later
            if (tier.lower > prev.upper + 1) {
                return reject(ConfigErrorCode::GapBetweenTiers, i,
                              static_cast<double>(tier.lower));
            }
            if (tier.lower < prev.upper + 1) {
                return reject(ConfigErrorCode::OverlappingTiers, i,
                              static_cast<double>(tier.lower));
            }
        }

        if (tier.upper <= tier.lower) {
            return reject(ConfigErrorCode::EmptyTier, i, static_cast<double>(tier.upper));
        }

        if (!std::isfinite(tier.rate) || tier.rate <= 0.0) {
            return reject(ConfigErrorCode::InvalidRate, i, tier.rate);
        }
    }

    SPENDCALC_TRACE_ALGO_COMPLETE(MODULE_TIER_TABLE, tiers.size(), 0);
    return TierTable(std::move(tiers));
}

size_t TierTable::index_at_or_above(double amount) const noexcept {
    auto it = std::lower_bound(tiers_.begin(), tiers_.end(), amount,
        [](const Tier& tier, double value) { return static_cast<double>(tier.upper) < value; });

    if (it == tiers_.end()) {
        return tiers_.size() - 1;
    }
    return static_cast<size_t>(std::distance(tiers_.begin(), it));
}

size_t TierTable::index_containing(double amount) const noexcept {
    auto it = std::find_if(tiers_.begin(), tiers_.end(),
        [amount](const Tier& tier) { return tier.contains(amount); });

    if (it == tiers_.end()) {
        return tiers_.size() - 1;
    }
    return static_cast<size_t>(std::distance(tiers_.begin(), it));
}

bool TierTable::is_volume_discounted() const noexcept {
    return std::adjacent_find(tiers_.begin(), tiers_.end(),
        [](const Tier& a, const Tier& b) { return b.rate >= a.rate; }) == tiers_.end();
}

} // namespace spendcalc
