// SPDX-License-Identifier: MIT
/**
 * @file report.hpp
 * @brief Plain-text rendering of pricing and implied volatility results
 *
 * Every function is pure: display options arrive through ReportStyle and the
 * result is returned as a string, so nothing here touches global state or
 * the terminal directly.
 */

#pragma once

#include "bsm/option/european_option.hpp"
#include "bsm/option/iv_result.hpp"
#include <string>
#include <string_view>

namespace bsm::simple {

/// Display options
struct ReportStyle {
    bool color = false;  ///< Emit ANSI color escapes
    int width = 72;      ///< Frame and rule width in columns
};

/// Semantic color roles
enum class Tone {
    Title,
    Label,
    Value,
    Sub,
    Ok,
    Error
};

/// Wrap text in the ANSI sequence for a tone (unchanged when color is off)
std::string paint(const ReportStyle& style, Tone tone, std::string_view text);

/// Fixed-point with thousands separators: 1234.5 -> "1,234.50" (decimals = 2)
std::string format_fixed(double value, int decimals);

/// Currency: "$1,234.57"
std::string format_money(double value);

/// Volatility fraction as percentage: 0.2 -> "20.00%"
std::string format_percent(double fraction);

/// Boxed, centered program title (three lines)
std::string render_header(const ReportStyle& style, std::string_view title);

/// d1, d2, call and put prices; prices below zero display as zero
std::string render_results(const ReportStyle& style, const EuropeanGreeks& greeks);

/// Greek / Call / Put table; gamma and vega are shown once
std::string render_greeks_table(const ReportStyle& style, const EuropeanGreeks& greeks);

/// Market price and the call-side and put-side implied vols
///
/// A failed side shows why: below intrinsic value, no convergence or
/// invalid input.
std::string render_implied_vol(const ReportStyle& style, double market_price,
                               const CallPutIV& iv);

/// One-line message for a failed implied-vol solve
std::string describe_iv_failure(const IVError& error);

}  // namespace bsm::simple
