// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace bsm {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidDividend,
    InvalidBounds,
    InvalidTolerance,
    InvalidIterationCount
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided

    ValidationError(ValidationErrorCode code, double value = 0.0)
        : code(code), value(value) {}
};

/// IV solver error categories
enum class IVErrorCode {
    // Precondition violations
    InvalidSpot,
    InvalidStrike,
    InvalidMaturity,
    InvalidRate,
    InvalidDividend,
    InvalidMarketPrice,

    // No volatility can reproduce the price
    BelowIntrinsic,

    // Convergence errors
    MaxIterationsExceeded,
    BracketingFailed,
    NumericalInstability
};

/// Detailed IV solver error with diagnostics
struct IVError {
    IVErrorCode code;
    size_t iterations = 0;           ///< Iterations before failure
    double final_error = 0.0;        ///< Residual at failure
    std::optional<double> last_vol;  ///< Last volatility candidate tried
    std::optional<double> bound;     ///< Intrinsic value (BelowIntrinsic only)
};

/// True for the "numerical search failed" family
constexpr bool is_convergence_failure(IVErrorCode code) noexcept {
    return code == IVErrorCode::MaxIterationsExceeded ||
           code == IVErrorCode::BracketingFailed ||
           code == IVErrorCode::NumericalInstability;
}

/// True for errors raised before any pricing took place
constexpr bool is_precondition_violation(IVErrorCode code) noexcept {
    switch (code) {
        case IVErrorCode::InvalidSpot:
        case IVErrorCode::InvalidStrike:
        case IVErrorCode::InvalidMaturity:
        case IVErrorCode::InvalidRate:
        case IVErrorCode::InvalidDividend:
        case IVErrorCode::InvalidMarketPrice:
            return true;
        default:
            return false;
    }
}

constexpr std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice:      return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike:         return "InvalidStrike";
        case ValidationErrorCode::InvalidMaturity:       return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility:     return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate:           return "InvalidRate";
        case ValidationErrorCode::InvalidDividend:       return "InvalidDividend";
        case ValidationErrorCode::InvalidBounds:         return "InvalidBounds";
        case ValidationErrorCode::InvalidTolerance:      return "InvalidTolerance";
        case ValidationErrorCode::InvalidIterationCount: return "InvalidIterationCount";
    }
    return "Unknown";
}

constexpr std::string_view to_string(IVErrorCode code) noexcept {
    switch (code) {
        case IVErrorCode::InvalidSpot:           return "InvalidSpot";
        case IVErrorCode::InvalidStrike:         return "InvalidStrike";
        case IVErrorCode::InvalidMaturity:       return "InvalidMaturity";
        case IVErrorCode::InvalidRate:           return "InvalidRate";
        case IVErrorCode::InvalidDividend:       return "InvalidDividend";
        case IVErrorCode::InvalidMarketPrice:    return "InvalidMarketPrice";
        case IVErrorCode::BelowIntrinsic:        return "BelowIntrinsic";
        case IVErrorCode::MaxIterationsExceeded: return "MaxIterationsExceeded";
        case IVErrorCode::BracketingFailed:      return "BracketingFailed";
        case IVErrorCode::NumericalInstability:  return "NumericalInstability";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

/// Output stream operator for IVError
inline std::ostream& operator<<(std::ostream& os, const IVError& err) {
    os << "IVError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error;
    if (err.last_vol) {
        os << ", last_vol=" << *err.last_vol;
    }
    if (err.bound) {
        os << ", bound=" << *err.bound;
    }
    os << "}";
    return os;
}

} // namespace bsm
