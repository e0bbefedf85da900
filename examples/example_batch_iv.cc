// SPDX-License-Identifier: MIT
/**
 * @file example_batch_iv.cc
 * @brief Batch implied volatility over a strike chain
 *
 * Demonstrates:
 * - Generating market prices from a volatility smile
 * - Solving the whole chain with IVSolver::solve_batch (OpenMP when enabled)
 * - Reading per-query success/failure from BatchIVResult
 */

#include "bsm/math/black_scholes_analytics.hpp"
#include "bsm/option/iv_solver.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace bsm;

int main() {
    std::cout << "=== Batch Implied Volatility Example ===\n\n";

    const double spot = 100.0;
    const double maturity = 0.5;
    const double rate = 0.03;
    const double dividend_yield = 0.01;

    std::vector<double> strikes;
    std::vector<double> true_vols;
    std::vector<IVQuery> queries;

    for (double strike = 70.0; strike <= 130.0; strike += 5.0) {
        // Simple skew: vol rises for low strikes
        const double m = std::log(strike / spot);
        const double vol = 0.22 - 0.15 * m + 0.30 * m * m;
        const OptionType type = (strike < spot) ? OptionType::PUT : OptionType::CALL;
        const double price = bs_price(spot, strike, maturity, vol, rate, dividend_yield, type);

        strikes.push_back(strike);
        true_vols.push_back(vol);
        queries.emplace_back(spot, strike, maturity, rate, dividend_yield, type, price);
    }

    // Deliberately inconsistent quote: deep ITM call below its intrinsic value
    strikes.push_back(60.0);
    true_vols.push_back(0.0);
    queries.emplace_back(spot, 60.0, maturity, rate, dividend_yield, OptionType::CALL, 30.0);

    auto solver = IVSolver::create(IVSolverConfig{});
    if (!solver) {
        std::cerr << "Invalid solver configuration: " << solver.error() << "\n";
        return EXIT_FAILURE;
    }

    auto batch = solver->solve_batch(queries);

    std::cout << std::setw(10) << "Strike"
              << std::setw(8) << "Side"
              << std::setw(12) << "Price"
              << std::setw(12) << "True vol"
              << std::setw(12) << "Implied"
              << std::setw(8) << "Iters" << "\n";
    std::cout << std::string(62, '-') << "\n";

    for (size_t i = 0; i < queries.size(); ++i) {
        const auto& q = queries[i];
        std::cout << std::fixed << std::setprecision(2)
                  << std::setw(10) << strikes[i]
                  << std::setw(8) << (q.type == OptionType::CALL ? "C" : "P")
                  << std::setprecision(4)
                  << std::setw(12) << q.market_price
                  << std::setw(12) << true_vols[i];
        const auto& result = batch.results[i];
        if (result.has_value()) {
            std::cout << std::setw(12) << result->implied_vol
                      << std::setw(8) << result->iterations << "\n";
        } else {
            std::cout << "  " << result.error() << "\n";
        }
    }

    std::cout << "\nFailed: " << batch.failed_count << " of " << queries.size() << "\n";
    return EXIT_SUCCESS;
}
