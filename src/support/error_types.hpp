// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>

namespace spendcalc {

/// Configuration failure categories (tier table and pricing config)
enum class ConfigErrorCode {
    EmptyTable,
    NonZeroStart,
    EmptyTier,
    NonAscendingBounds,
    GapBetweenTiers,
    OverlappingTiers,
    InvalidRate,
    InvalidMinimumInvoice,
    InvalidMinimumInvoiceCeiling,
    InvalidRecommendHeadroom,
    MissingTable
};

/// Detailed configuration error raised once at startup
///
/// `index` names the offending tier (0 when the error is not tier-specific),
/// `value` carries the rejected bound, rate or config value.
struct ConfigurationError {
    ConfigErrorCode code;
    size_t index;
    double value;

    ConfigurationError(ConfigErrorCode code,
                       size_t index = 0,
                       double value = 0.0)
        : code(code), index(index), value(value) {}
};

/// Per-call argument failure categories
enum class ArgumentErrorCode {
    NegativeSpend,
    NonFiniteSpend,
    NegativeCommitment,
    NonFiniteCommitment
};

/// Invalid input passed to a pricing operation
struct InvalidArgument {
    ArgumentErrorCode code;
    double value;  // The rejected input

    InvalidArgument(ArgumentErrorCode code, double value = 0.0)
        : code(code), value(value) {}
};

inline const char* to_string(ConfigErrorCode code) {
    switch (code) {
        case ConfigErrorCode::EmptyTable:               return "EmptyTable";
        case ConfigErrorCode::NonZeroStart:             return "NonZeroStart";
        case ConfigErrorCode::EmptyTier:                return "EmptyTier";
        case ConfigErrorCode::NonAscendingBounds:       return "NonAscendingBounds";
        case ConfigErrorCode::GapBetweenTiers:          return "GapBetweenTiers";
        case ConfigErrorCode::OverlappingTiers:         return "OverlappingTiers";
        case ConfigErrorCode::InvalidRate:              return "InvalidRate";
        case ConfigErrorCode::InvalidMinimumInvoice:    return "InvalidMinimumInvoice";
        case ConfigErrorCode::InvalidMinimumInvoiceCeiling: return "InvalidMinimumInvoiceCeiling";
        case ConfigErrorCode::InvalidRecommendHeadroom: return "InvalidRecommendHeadroom";
        case ConfigErrorCode::MissingTable:             return "MissingTable";
    }
    return "Unknown";
}

inline const char* to_string(ArgumentErrorCode code) {
    switch (code) {
        case ArgumentErrorCode::NegativeSpend:       return "NegativeSpend";
        case ArgumentErrorCode::NonFiniteSpend:      return "NonFiniteSpend";
        case ArgumentErrorCode::NegativeCommitment:  return "NegativeCommitment";
        case ArgumentErrorCode::NonFiniteCommitment: return "NonFiniteCommitment";
    }
    return "Unknown";
}

/// Output stream operator for ConfigurationError
inline std::ostream& operator<<(std::ostream& os, const ConfigurationError& err) {
    os << "ConfigurationError{code=" << to_string(err.code)
       << ", index=" << err.index
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for InvalidArgument
inline std::ostream& operator<<(std::ostream& os, const InvalidArgument& err) {
    os << "InvalidArgument{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

} // namespace spendcalc
