// SPDX-License-Identifier: MIT
#include "src/pricing/pricing_config.hpp"
#include "src/support/spendcalc_trace.h"
#include <cmath>

namespace spendcalc {

std::expected<void, ConfigurationError> validate_pricing_config(const PricingConfig& config) {
    if (!std::isfinite(config.minimum_invoice) || config.minimum_invoice < 0.0) {
        SPENDCALC_TRACE_CONFIG_ERROR(MODULE_PRICING_CONFIG,
            static_cast<int>(ConfigErrorCode::InvalidMinimumInvoice), 0);
        return std::unexpected(ConfigurationError(
            ConfigErrorCode::InvalidMinimumInvoice, 0, config.minimum_invoice));
    }

    if (!std::isfinite(config.minimum_invoice_ceiling) || config.minimum_invoice_ceiling < 0.0) {
        SPENDCALC_TRACE_CONFIG_ERROR(MODULE_PRICING_CONFIG,
            static_cast<int>(ConfigErrorCode::InvalidMinimumInvoiceCeiling), 0);
        return std::unexpected(ConfigurationError(
            ConfigErrorCode::InvalidMinimumInvoiceCeiling, 0, config.minimum_invoice_ceiling));
    }

    // NaN fails both comparisons
    if (!(config.recommend_headroom > 0.0 && config.recommend_headroom <= 1.0)) {
        SPENDCALC_TRACE_CONFIG_ERROR(MODULE_PRICING_CONFIG,
            static_cast<int>(ConfigErrorCode::InvalidRecommendHeadroom), 0);
        return std::unexpected(ConfigurationError(
            ConfigErrorCode::InvalidRecommendHeadroom, 0, config.recommend_headroom));
    }

    return {};
}

} // namespace spendcalc
