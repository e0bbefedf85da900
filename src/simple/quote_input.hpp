// SPDX-License-Identifier: MIT
/**
 * @file quote_input.hpp
 * @brief Text-to-number boundary between a user-facing front end and the core
 *
 * Parses raw text fields, applies the default dividend yield, converts days
 * to years and rejects non-positive inputs before anything reaches the
 * pricing engine.
 */

#pragma once

#include "bsm/option/option_spec.hpp"
#include <expected>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace bsm::simple {

/// Calendar convention for days-to-expiry input
inline constexpr double kDaysPerYear = 365.0;

/// Input error categories
enum class InputErrorCode {
    Empty,             ///< Required field left blank
    NotANumber,        ///< Text is not a decimal number
    NonFinite,         ///< Parsed to Inf or NaN
    NonPositiveInput   ///< Spot, strike, days or volatility <= 0
};

/// Input error with the offending field name (or raw text)
struct InputError {
    InputErrorCode code;
    std::string field;
};

std::ostream& operator<<(std::ostream& os, const InputError& err);

/// Parse a required decimal number
///
/// Leading and trailing whitespace is ignored; anything else after the
/// number is an error.
std::expected<double, InputError> parse_number(std::string_view text);

/// Parse an optional decimal number: blank text yields std::nullopt
std::expected<std::optional<double>, InputError> parse_optional_number(std::string_view text);

/// Raw quote as entered by a user
struct QuoteInput {
    double spot = 0.0;
    double strike = 0.0;
    double days_to_expiry = 0.0;
    double rate = 0.0;
    double volatility = 0.0;
    std::optional<double> dividend_yield;  ///< Defaults to 0 when absent
    std::optional<double> market_price;    ///< Absent: skip implied vol
};

/// Fractional years from calendar days
constexpr double days_to_years(double days) noexcept {
    return days / kDaysPerYear;
}

/// Convert a quote to pricing parameters
///
/// Rejects spot, strike, days_to_expiry or volatility <= 0 with
/// InputErrorCode::NonPositiveInput.
std::expected<PricingParams, InputError> to_pricing_params(const QuoteInput& input);

}  // namespace bsm::simple
