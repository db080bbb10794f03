// SPDX-License-Identifier: MIT
/**
 * @file reference_schedule.hpp
 * @brief Shipped 26-tier rate schedule ($0 to $250M monthly spend)
 */

#pragma once

#include "src/pricing/tier_table.hpp"
#include <expected>
#include <memory>
#include <string_view>
#include <vector>

namespace spendcalc {

/// Identifies the shipped schedule; bump when any bound or rate changes
inline constexpr std::string_view kReferenceScheduleVersion = "2024.1";

/// Raw tiers of the shipped schedule, ascending
std::vector<Tier> reference_tiers();

/// Validated shared table built from reference_tiers()
std::expected<std::shared_ptr<const TierTable>, ConfigurationError> make_reference_table();

}  // namespace spendcalc
