// SPDX-License-Identifier: MIT
#include "bsm/simple/report.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bsm::simple {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr int kLabelWidth = 28;
constexpr int kValueWidth = 12;
constexpr int kGreekNameWidth = 14;
constexpr int kGreekColumnWidth = 18;

std::string_view tone_code(Tone tone) {
    switch (tone) {
        case Tone::Title: return "\033[1m\033[33m";
        case Tone::Label: return "\033[1m\033[37m";
        case Tone::Value: return "\033[1m\033[32m";
        case Tone::Sub:   return "\033[36m";
        case Tone::Ok:    return "\033[1m\033[32m";
        case Tone::Error: return "\033[1m\033[31m";
    }
    return "";
}

std::string repeat(std::string_view unit, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

std::string center(std::string_view text, int width) {
    const int len = static_cast<int>(text.size());
    if (len >= width) {
        return std::string(text);
    }
    const int left = (width - len) / 2;
    const int right = width - len - left;
    return std::string(left, ' ') + std::string(text) + std::string(right, ' ');
}

std::string pad_left(std::string_view text, int width) {
    std::ostringstream os;
    os << std::left << std::setw(width) << text;
    return os.str();
}

std::string pad_right(std::string_view text, int width) {
    std::ostringstream os;
    os << std::right << std::setw(width) << text;
    return os.str();
}

std::string section_title(const ReportStyle& style, std::string_view title) {
    const std::string rule = repeat("─", style.width);
    std::string out;
    out += paint(style, Tone::Sub, rule) + "\n";
    out += paint(style, Tone::Title, center(title, style.width)) + "\n";
    out += paint(style, Tone::Sub, rule) + "\n";
    return out;
}

std::string labelled_row(const ReportStyle& style, std::string_view label, std::string_view value) {
    return paint(style, Tone::Label, pad_left(label, kLabelWidth)) +
           paint(style, Tone::Value, pad_right(value, kValueWidth)) + "\n";
}

std::string greek_row(const ReportStyle& style, std::string_view name,
                      std::string_view call, std::string_view put) {
    return paint(style, Tone::Label, pad_left(name, kGreekNameWidth)) +
           paint(style, Tone::Value, pad_right(call, kGreekColumnWidth)) +
           paint(style, Tone::Value, pad_right(put, kGreekColumnWidth)) + "\n";
}

std::string iv_cell(const IVResult& result) {
    if (result.has_value()) {
        return format_percent(result->implied_vol);
    }
    return describe_iv_failure(result.error());
}

}  // namespace

std::string paint(const ReportStyle& style, Tone tone, std::string_view text) {
    if (!style.color) {
        return std::string(text);
    }
    std::string out(tone_code(tone));
    out += text;
    out += kReset;
    return out;
}

std::string format_fixed(double value, int decimals) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(std::max(decimals, 0)) << std::abs(value);
    std::string digits = os.str();

    const auto dot = digits.find('.');
    const auto int_end = (dot == std::string::npos) ? digits.size() : dot;
    for (auto pos = int_end; pos > 3; pos -= 3) {
        digits.insert(pos - 3, 1, ',');
    }

    // Suppress "-0.00"
    const bool all_zero = digits.find_first_of("123456789") == std::string::npos;
    if (std::signbit(value) && !all_zero) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

std::string format_money(double value) {
    return "$" + format_fixed(value, 2);
}

std::string format_percent(double fraction) {
    return format_fixed(fraction * 100.0, 2) + "%";
}

std::string describe_iv_failure(const IVError& error) {
    if (error.code == IVErrorCode::BelowIntrinsic) {
        return "n/a (below intrinsic value)";
    }
    if (is_convergence_failure(error.code)) {
        return "n/a (solver did not converge)";
    }
    return "n/a (invalid input)";
}

std::string render_header(const ReportStyle& style, std::string_view title) {
    const int inner = std::max(style.width - 2, 0);
    std::string out;
    out += paint(style, Tone::Title, "┌" + repeat("─", inner) + "┐") + "\n";
    out += paint(style, Tone::Title, "│" + center(title, inner) + "│") + "\n";
    out += paint(style, Tone::Title, "└" + repeat("─", inner) + "┘") + "\n";
    return out;
}

std::string render_results(const ReportStyle& style, const EuropeanGreeks& greeks) {
    std::string out = section_title(style, " RESULTS ");
    out += labelled_row(style, "Moneyness factor (d1)", format_fixed(greeks.d1, 4));
    out += labelled_row(style, "Risk-adjusted moneyness (d2)", format_fixed(greeks.d2, 4));
    out += labelled_row(style, "Call Price", format_money(std::max(greeks.call, 0.0)));
    out += labelled_row(style, "Put Price", format_money(std::max(greeks.put, 0.0)));
    return out;
}

std::string render_greeks_table(const ReportStyle& style, const EuropeanGreeks& greeks) {
    std::string out = section_title(style, " GREEKS ");
    out += paint(style, Tone::Label,
                 pad_left("Greek", kGreekNameWidth) +
                 pad_right("Call", kGreekColumnWidth) +
                 pad_right("Put", kGreekColumnWidth)) + "\n";
    out += std::string(static_cast<size_t>(std::max(style.width, 0)), '-') + "\n";
    out += greek_row(style, "Delta", format_fixed(greeks.delta_call, 4), format_fixed(greeks.delta_put, 4));
    out += greek_row(style, "Gamma", format_fixed(greeks.gamma, 6), "");
    out += greek_row(style, "Vega", format_fixed(greeks.vega, 4), "");
    out += greek_row(style, "Theta", format_fixed(greeks.theta_call, 4), format_fixed(greeks.theta_put, 4));
    out += greek_row(style, "Rho", format_fixed(greeks.rho_call, 4), format_fixed(greeks.rho_put, 4));
    return out;
}

std::string render_implied_vol(const ReportStyle& style, double market_price,
                               const CallPutIV& iv) {
    std::string out = section_title(style, " IMPLIED VOLATILITY ");
    out += paint(style, Tone::Label, pad_left("Market Price", kLabelWidth)) +
           paint(style, Tone::Value, format_money(market_price)) + "\n";
    out += paint(style, Tone::Label, pad_left("IV (Call)", kLabelWidth)) +
           paint(style, iv.call ? Tone::Value : Tone::Error, iv_cell(iv.call)) + "\n";
    out += paint(style, Tone::Label, pad_left("IV (Put)", kLabelWidth)) +
           paint(style, iv.put ? Tone::Value : Tone::Error, iv_cell(iv.put)) + "\n";
    return out;
}

}  // namespace bsm::simple
