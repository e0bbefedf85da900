// SPDX-License-Identifier: MIT
/**
 * @file european_option.hpp
 * @brief European option pricing with closed-form Black-Scholes-Merton formulas
 *
 * Provides EuropeanOptionSolver, which validates PricingParams once and then
 * evaluates price and Greeks analytically for either side.
 *
 * Error handling: invalid parameters (spot, strike, maturity or volatility
 * not strictly positive, or any non-finite input) are rejected by create()
 * and by the free functions with a ValidationError before any computation.
 * A solver built through the unchecked constructor assumes valid input.
 */

#pragma once

#include "bsm/option/option_spec.hpp"
#include "bsm/support/error_types.hpp"
#include <expected>

namespace bsm {

/// Price and Greeks for one option side
struct PricingResult {
    double price;   ///< Raw model value (not clamped at zero)
    double delta;   ///< ∂V/∂S
    double gamma;   ///< ∂²V/∂S²
    double vega;    ///< ∂V/∂σ, per unit volatility
    double theta;   ///< ∂V/∂t, per year
    double rho;     ///< ∂V/∂r, per unit rate
    double d1;
    double d2;
};

/**
 * @brief Call and put values computed from a single set of d1/d2 terms
 *
 * Gamma and vega do not depend on the option side, so they are stored once.
 */
struct EuropeanGreeks {
    double call;
    double put;
    double d1;
    double d2;
    double delta_call;
    double delta_put;
    double gamma;
    double vega;
    double theta_call;
    double theta_put;
    double rho_call;
    double rho_put;

    /// Project onto one side
    PricingResult result(OptionType type) const;
};

/**
 * @brief European option solver using closed-form Black-Scholes
 *
 * Lightweight value type; all methods are const and thread-safe.
 */
class EuropeanOptionSolver {
public:
    /// Construct solver from pricing parameters (no validation)
    explicit EuropeanOptionSolver(const PricingParams& params);

    /// Construct from option spec + volatility (no validation)
    EuropeanOptionSolver(const OptionSpec& spec, double sigma);

    /// Factory with validation via validate_pricing_params()
    static std::expected<EuropeanOptionSolver, ValidationError>
    create(const PricingParams& params) noexcept;

    /// Option price for one side
    double price(OptionType type) const;

    /// Price and Greeks for both sides
    EuropeanGreeks greeks() const;

    /// Price and Greeks for one side
    PricingResult solve(OptionType type) const;

    const PricingParams& params() const { return params_; }

private:
    PricingParams params_;
};

/// Validated one-shot price
std::expected<double, ValidationError>
price_european(const PricingParams& params, OptionType type);

/// Validated one-shot Greeks for both sides
std::expected<EuropeanGreeks, ValidationError>
greeks_european(const PricingParams& params);

}  // namespace bsm
