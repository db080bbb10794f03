// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <expected>

namespace spendcalc {

/// Commercial constants applied on top of the tier table
struct PricingConfig {
    double minimum_invoice = 2500.0;             ///< Flex floor (dollars)
    double minimum_invoice_ceiling = 125000.0;   ///< Floor applies to spend <= this
    double recommend_headroom = 0.8;             ///< Fraction of tier upper that triggers next-tier advice
};

/// Validate pricing config
///
/// Floor amount and ceiling must be finite and non-negative; headroom must
/// lie in (0, 1].
///
/// @return void on success, ConfigurationError on failure
std::expected<void, ConfigurationError> validate_pricing_config(const PricingConfig& config);

} // namespace spendcalc
