// SPDX-License-Identifier: MIT
/**
 * @file black_scholes_analytics.hpp
 * @brief Closed-form Black-Scholes-Merton kernels with continuous dividend yield
 *
 * Unchecked building blocks shared by the European pricer and the implied
 * volatility objective. Callers validate inputs (see validate_pricing_params());
 * for sigma <= 0 or tau <= 0 the kernels return the deterministic limit
 * instead of dividing by zero.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>

#include "bsm/option/option_spec.hpp"

namespace bsm {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = std::numbers::inv_sqrtpi / std::numbers::sqrt2;
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x) = erfc(-x/√2) / 2
///
/// erfc keeps full relative precision in the lower tail, where 1 - erf(x)
/// would cancel.
inline double norm_cdf(double x) {
    static constexpr double kInvSqrt2 = 1.0 / std::numbers::sqrt2;
    return 0.5 * std::erfc(-x * kInvSqrt2);
}

/// Black-Scholes d1 term
/// d1 = [ln(S/K) + (r - q + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate,
                    double dividend_yield = 0.0) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate - dividend_yield + 0.5 * sigma * sigma) * tau) /
           sigma_sqrt_tau;
}

/// Intermediate quantities shared by price and every Greek
struct BlackScholesTerms {
    double sqrt_tau;   ///< √τ
    double d1;         ///< Moneyness factor
    double d2;         ///< d1 - σ√τ
    double disc_r;     ///< e^(-rτ), strike leg
    double disc_q;     ///< e^(-qτ), spot leg
};

/// Compute d1, d2 and both discount factors once
///
/// Requires sigma > 0 and tau > 0.
inline BlackScholesTerms bs_terms(double spot, double strike, double tau, double sigma,
                                  double rate, double dividend_yield) {
    const double sqrt_tau = std::sqrt(tau);
    const double d1 = bs_d1(spot, strike, tau, sigma, rate, dividend_yield);
    return BlackScholesTerms{
        .sqrt_tau = sqrt_tau,
        .d1 = d1,
        .d2 = d1 - sigma * sqrt_tau,
        .disc_r = std::exp(-rate * tau),
        .disc_q = std::exp(-dividend_yield * tau)
    };
}

/// Discounted intrinsic value: the zero-volatility price and no-arbitrage floor
///
/// Call: max(0, S·e^(-qτ) - K·e^(-rτ)), Put: max(0, K·e^(-rτ) - S·e^(-qτ))
inline double discounted_intrinsic(double spot, double strike, double tau, double rate,
                                   double dividend_yield, OptionType option_type) {
    const double s_fwd = spot * std::exp(-dividend_yield * tau);
    const double k_disc = strike * std::exp(-rate * tau);
    if (option_type == OptionType::PUT) {
        return std::max(0.0, k_disc - s_fwd);
    }
    return std::max(0.0, s_fwd - k_disc);
}

/// Black-Scholes Vega: ∂V/∂σ = S · e^(-qτ) · √τ · φ(d1)
/// Same for puts and calls
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param rate Risk-free rate
/// @param dividend_yield Continuous dividend yield (default = 0.0)
/// @return Vega (price change per unit volatility change)
inline double bs_vega(double spot, double strike, double tau, double sigma, double rate,
                      double dividend_yield = 0.0) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate, dividend_yield);
    return spot * std::exp(-dividend_yield * tau) * std::sqrt(tau) * norm_pdf(d1);
}

/// Black-Scholes European option price
///
/// Returns the raw formula value; near zero it may be a tiny negative number.
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param rate Risk-free rate
/// @param dividend_yield Continuous dividend yield
/// @param option_type PUT or CALL
/// @return European option price
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       double dividend_yield, OptionType option_type) {
    // Edge cases: zero maturity or zero vol -> intrinsic value
    if (tau <= 0.0 || sigma <= 0.0) {
        return discounted_intrinsic(spot, strike, std::max(tau, 0.0), rate, dividend_yield,
                                    option_type);
    }

    const auto t = bs_terms(spot, strike, tau, sigma, rate, dividend_yield);

    if (option_type == OptionType::PUT) {
        return strike * t.disc_r * norm_cdf(-t.d2) - spot * t.disc_q * norm_cdf(-t.d1);
    } else {
        return spot * t.disc_q * norm_cdf(t.d1) - strike * t.disc_r * norm_cdf(t.d2);
    }
}

}  // namespace bsm
