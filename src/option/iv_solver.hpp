// SPDX-License-Identifier: MIT
/**
 * @file iv_solver.hpp
 * @brief Implied volatility solver for European options
 *
 * Inverts the closed-form Black-Scholes-Merton price over volatility with
 * Brent's method.
 *
 * Error Handling:
 * - Precondition violations (InvalidSpot, InvalidStrike, InvalidMaturity,
 *   InvalidRate, InvalidDividend, InvalidMarketPrice)
 * - BelowIntrinsic: price under the discounted intrinsic value, no search is run
 * - MaxIterationsExceeded, BracketingFailed, NumericalInstability: the search
 *   failed (see is_convergence_failure())
 *
 * Example:
 * @code
 * auto solver = IVSolver::create(IVSolverConfig{});
 * IVQuery query(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 10.45);
 * auto result = solver->solve(query);
 *
 * if (result.has_value()) {
 *     std::cout << "IV: " << result->implied_vol << "\n";
 * } else {
 *     std::cerr << "Error: " << result.error() << "\n";
 * }
 * @endcode
 */

#pragma once

#include "bsm/option/option_spec.hpp"
#include "bsm/option/iv_result.hpp"
#include "bsm/math/root_finding.hpp"
#include "bsm/support/error_types.hpp"
#include <expected>
#include <vector>

namespace bsm {

/// Configuration for the implied volatility solver
struct IVSolverConfig {
    /// Brent's method parameters
    RootFindingConfig root_config{.max_iter = 200, .x_tol_abs = 1e-10};

    /// Lower end of the volatility search bracket
    double vol_lower = 1e-6;

    /// Upper end of the volatility search bracket (500% annualized)
    double vol_upper = 5.0;
};

/// Validate solver configuration
///
/// Requires 0 < vol_lower < vol_upper (finite), max_iter > 0 and positive,
/// finite x tolerances.
std::expected<void, ValidationError> validate_iv_solver_config(const IVSolverConfig& config);

/// Implied volatility solver
///
/// Finds σ with price(S, K, T, r, q, σ, type) = market_price strictly inside
/// (vol_lower, vol_upper). The price is strictly increasing in σ, so the
/// bracket holds at most one root. A root on either bound is reported as
/// BracketingFailed.
///
/// **Thread Safety:** all methods are const and share no mutable state;
/// one solver may serve any number of threads.
///
/// **USDT Tracing:**
/// - iv_start / iv_complete around each solve
/// - below_intrinsic when the intrinsic check rejects a price
/// - validation_error for invalid queries
/// - convergence_failed when Brent gives up
class IVSolver {
public:
    /// Construct solver with configuration (no validation)
    explicit IVSolver(const IVSolverConfig& config);

    /// Factory with validation via validate_iv_solver_config()
    static std::expected<IVSolver, ValidationError> create(const IVSolverConfig& config);

    /// Solve for implied volatility (single query)
    ///
    /// @param query Option specification, side and market price
    /// @return IVSuccess with the volatility, or IVError with the failure kind
    IVResult solve(const IVQuery& query) const;

    /// Solve both sides for one observed price
    CallPutIV solve_call_put(const OptionSpec& spec, double market_price) const;

    /// Solve for implied volatility (batch with OpenMP)
    ///
    /// Each query is independent; results[i] belongs to queries[i].
    BatchIVResult solve_batch(const std::vector<IVQuery>& queries) const;

    const IVSolverConfig& config() const { return config_; }

private:
    IVSolverConfig config_;

    /// Validate spot, strike, maturity, rate, dividend and market price
    std::expected<void, IVError> validate_query(const IVQuery& query) const;

    /// Run Brent solver on f(σ) = price(σ) - market_price
    IVResult solve_brent(const IVQuery& query) const;
};

}  // namespace bsm
