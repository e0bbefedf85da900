// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "bsm/simple/quote_input.hpp"
#include <sstream>

namespace bsm::simple {
namespace {

TEST(QuoteInputTest, ParseNumberAcceptsDecimals) {
    EXPECT_DOUBLE_EQ(parse_number("100").value(), 100.0);
    EXPECT_DOUBLE_EQ(parse_number("  0.05 ").value(), 0.05);
    EXPECT_DOUBLE_EQ(parse_number("-0.01").value(), -0.01);
    EXPECT_DOUBLE_EQ(parse_number("+2.5").value(), 2.5);
    EXPECT_DOUBLE_EQ(parse_number("1e-3\n").value(), 1e-3);
}

TEST(QuoteInputTest, ParseNumberRejectsBlank) {
    auto result = parse_number("   ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, InputErrorCode::Empty);
}

TEST(QuoteInputTest, ParseNumberRejectsGarbage) {
    for (const char* text : {"abc", "12abc", "1.2.3", "$100", "--1", "+-5", "+", "++1"}) {
        auto result = parse_number(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().code, InputErrorCode::NotANumber) << text;
    }
}

TEST(QuoteInputTest, ParseNumberRejectsNonFinite) {
    for (const char* text : {"inf", "nan", "-inf"}) {
        auto result = parse_number(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().code, InputErrorCode::NonFinite) << text;
    }
}

TEST(QuoteInputTest, ParseOptionalNumber) {
    auto blank = parse_optional_number("");
    ASSERT_TRUE(blank.has_value());
    EXPECT_FALSE(blank->has_value());

    auto value = parse_optional_number(" 0.02 ");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_DOUBLE_EQ(**value, 0.02);

    auto bad = parse_optional_number("x");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, InputErrorCode::NotANumber);
}

TEST(QuoteInputTest, DaysConvertOnActual365) {
    static_assert(days_to_years(365.0) == 1.0);
    EXPECT_DOUBLE_EQ(days_to_years(30.0), 30.0 / 365.0);
}

TEST(QuoteInputTest, ToPricingParams) {
    QuoteInput input{
        .spot = 100.0,
        .strike = 105.0,
        .days_to_expiry = 73.0,
        .rate = 0.05,
        .volatility = 0.25,
        .dividend_yield = 0.01,
        .market_price = std::nullopt
    };

    auto params = to_pricing_params(input);
    ASSERT_TRUE(params.has_value());
    EXPECT_DOUBLE_EQ(params->spot, 100.0);
    EXPECT_DOUBLE_EQ(params->strike, 105.0);
    EXPECT_DOUBLE_EQ(params->maturity, 0.2);
    EXPECT_DOUBLE_EQ(params->rate, 0.05);
    EXPECT_DOUBLE_EQ(params->dividend_yield, 0.01);
    EXPECT_DOUBLE_EQ(params->volatility, 0.25);
}

TEST(QuoteInputTest, MissingDividendDefaultsToZero) {
    QuoteInput input{.spot = 100.0, .strike = 100.0, .days_to_expiry = 365.0,
                     .rate = 0.05, .volatility = 0.2};
    auto params = to_pricing_params(input);
    ASSERT_TRUE(params.has_value());
    EXPECT_DOUBLE_EQ(params->dividend_yield, 0.0);
}

TEST(QuoteInputTest, RejectsNonPositiveFields) {
    const QuoteInput good{.spot = 100.0, .strike = 100.0, .days_to_expiry = 30.0,
                          .rate = 0.05, .volatility = 0.2};

    QuoteInput input = good;
    input.spot = 0.0;
    auto result = to_pricing_params(input);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, InputErrorCode::NonPositiveInput);
    EXPECT_EQ(result.error().field, "spot");

    input = good;
    input.days_to_expiry = -1.0;
    result = to_pricing_params(input);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field, "days_to_expiry");

    input = good;
    input.volatility = 0.0;
    result = to_pricing_params(input);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field, "volatility");

    // Rates may be zero or negative
    input = good;
    input.rate = -0.01;
    EXPECT_TRUE(to_pricing_params(input).has_value());
}

TEST(QuoteInputTest, InputErrorStream) {
    std::ostringstream os;
    os << InputError{InputErrorCode::NonPositiveInput, "strike"};
    EXPECT_EQ(os.str(), "InputError{code=NonPositiveInput, field=strike}");
}

}  // namespace
}  // namespace bsm::simple
