// SPDX-License-Identifier: MIT
#include "bsm/simple/quote_input.hpp"
#include <charconv>
#include <cmath>
#include <utility>

namespace bsm::simple {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string_view code_name(InputErrorCode code) {
    switch (code) {
        case InputErrorCode::Empty:            return "Empty";
        case InputErrorCode::NotANumber:       return "NotANumber";
        case InputErrorCode::NonFinite:        return "NonFinite";
        case InputErrorCode::NonPositiveInput: return "NonPositiveInput";
    }
    return "Unknown";
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const InputError& err) {
    os << "InputError{code=" << code_name(err.code) << ", field=" << err.field << "}";
    return os;
}

std::expected<double, InputError> parse_number(std::string_view text) {
    const auto s = trim(text);
    if (s.empty()) {
        return std::unexpected(InputError{InputErrorCode::Empty, std::string(text)});
    }

    // from_chars does not accept a leading '+'
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') {
        ++first;
        // from_chars would take the sign of "+-5"
        if (first == last || *first == '-') {
            return std::unexpected(InputError{InputErrorCode::NotANumber, std::string(s)});
        }
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::unexpected(InputError{InputErrorCode::NotANumber, std::string(s)});
    }
    if (!std::isfinite(value)) {
        return std::unexpected(InputError{InputErrorCode::NonFinite, std::string(s)});
    }
    return value;
}

std::expected<std::optional<double>, InputError> parse_optional_number(std::string_view text) {
    if (trim(text).empty()) {
        return std::optional<double>{};
    }
    auto value = parse_number(text);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<double>{*value};
}

std::expected<PricingParams, InputError> to_pricing_params(const QuoteInput& input) {
    const std::pair<const char*, double> positive_fields[] = {
        {"spot", input.spot},
        {"strike", input.strike},
        {"days_to_expiry", input.days_to_expiry},
        {"volatility", input.volatility},
    };
    for (const auto& [name, value] : positive_fields) {
        if (!(value > 0.0)) {
            return std::unexpected(InputError{InputErrorCode::NonPositiveInput, name});
        }
    }

    return PricingParams(input.spot,
                         input.strike,
                         days_to_years(input.days_to_expiry),
                         input.rate,
                         input.dividend_yield.value_or(0.0),
                         input.volatility);
}

}  // namespace bsm::simple
