// SPDX-License-Identifier: MIT
/**
 * @file bsm_terminal.cc
 * @brief Interactive Black-Scholes-Merton calculator
 *
 * Demonstrates:
 * - Parsing raw text input into PricingParams (days -> years, default q = 0)
 * - Price and Greeks for both sides from one evaluation
 * - Call-side and put-side implied volatility for an optional market price
 *
 * Pass --color for ANSI colored output.
 */

#include "bsm/option/european_option.hpp"
#include "bsm/option/iv_solver.hpp"
#include "bsm/simple/quote_input.hpp"
#include "bsm/simple/report.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace bsm;
using namespace bsm::simple;

namespace {

std::string prompt(const ReportStyle& style, std::string_view label) {
    std::cout << paint(style, Tone::Label, label) << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        line.clear();
    }
    return line;
}

int fail(const ReportStyle& style, const std::string& message) {
    std::cerr << paint(style, Tone::Error, "Input error: " + message) << "\n";
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    ReportStyle style;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--color") {
            style.color = true;
        }
    }

    std::cout << render_header(style, " BLACK-SCHOLES OPTION PRICING MODEL ");

    QuoteInput input;
    const std::pair<std::string_view, double*> required[] = {
        {"Underlying price (S): ", &input.spot},
        {"Strike price (K): ", &input.strike},
        {"Time to expiration (days): ", &input.days_to_expiry},
        {"Risk-free rate r (decimal): ", &input.rate},
        {"Volatility σ (decimal): ", &input.volatility},
    };
    for (const auto& [label, target] : required) {
        auto value = parse_number(prompt(style, label));
        if (!value) {
            std::cerr << value.error() << "\n";
            return fail(style, "missing or malformed numeric input");
        }
        *target = *value;
    }

    auto dividend = parse_optional_number(prompt(style, "Dividend yield q (decimal) [default 0]: "));
    if (!dividend) {
        return fail(style, "malformed dividend yield");
    }
    input.dividend_yield = *dividend;

    auto market = parse_optional_number(prompt(style, "Market price for IV (blank to skip): "));
    if (!market) {
        return fail(style, "malformed market price");
    }
    input.market_price = *market;

    auto params = to_pricing_params(input);
    if (!params) {
        return fail(style, "Inputs must be positive; days and σ > 0.");
    }

    auto greeks = greeks_european(*params);
    if (!greeks) {
        std::cerr << greeks.error() << "\n";
        return fail(style, "parameters rejected by the pricing engine");
    }

    std::cout << "\n" << render_results(style, *greeks);
    std::cout << "\n" << render_greeks_table(style, *greeks);

    if (input.market_price.has_value()) {
        auto solver = IVSolver::create(IVSolverConfig{});
        if (!solver) {
            std::cerr << solver.error() << "\n";
            return EXIT_FAILURE;
        }
        auto iv = solver->solve_call_put(*params, *input.market_price);
        std::cout << "\n" << render_implied_vol(style, *input.market_price, iv);
    }

    std::cout << "\n" << paint(style, Tone::Ok, "Done.") << "\n";
    return EXIT_SUCCESS;
}
