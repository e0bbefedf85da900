// SPDX-License-Identifier: MIT
#include "bsm/option/european_option.hpp"
#include "bsm/math/black_scholes_analytics.hpp"
#include "bsm/support/bsm_trace.h"
#include <cmath>

namespace bsm {

// ===========================================================================
// EuropeanGreeks
// ===========================================================================

PricingResult EuropeanGreeks::result(OptionType type) const {
    if (type == OptionType::PUT) {
        return PricingResult{
            .price = put, .delta = delta_put, .gamma = gamma, .vega = vega,
            .theta = theta_put, .rho = rho_put, .d1 = d1, .d2 = d2
        };
    }
    return PricingResult{
        .price = call, .delta = delta_call, .gamma = gamma, .vega = vega,
        .theta = theta_call, .rho = rho_call, .d1 = d1, .d2 = d2
    };
}

// ===========================================================================
// EuropeanOptionSolver
// ===========================================================================

EuropeanOptionSolver::EuropeanOptionSolver(const PricingParams& params)
    : params_(params)
{}

EuropeanOptionSolver::EuropeanOptionSolver(const OptionSpec& spec, double sigma)
    : params_(spec, sigma)
{}

std::expected<EuropeanOptionSolver, ValidationError>
EuropeanOptionSolver::create(const PricingParams& params) noexcept {
    auto validation = validate_pricing_params(params);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return EuropeanOptionSolver(params);
}

double EuropeanOptionSolver::price(OptionType type) const {
    return bs_price(params_.spot, params_.strike, params_.maturity, params_.volatility,
                    params_.rate, params_.dividend_yield, type);
}

EuropeanGreeks EuropeanOptionSolver::greeks() const {
    const double S = params_.spot;
    const double K = params_.strike;
    const double tau = params_.maturity;
    const double sigma = params_.volatility;
    const double r = params_.rate;
    const double q = params_.dividend_yield;

    BSM_TRACE_ALGO_START(BSM_MODULE_PRICING, S, K, sigma);

    const auto t = bs_terms(S, K, tau, sigma, r, q);
    const double pdf_d1 = norm_pdf(t.d1);
    const double cdf_d1 = norm_cdf(t.d1);
    const double cdf_d2 = norm_cdf(t.d2);
    const double cdf_neg_d1 = norm_cdf(-t.d1);
    const double cdf_neg_d2 = norm_cdf(-t.d2);

    const double s_disc = S * t.disc_q;
    const double k_disc = K * t.disc_r;

    // Common theta term: -S·e^(-qτ)·φ(d1)·σ/(2√τ)
    const double theta_common = -s_disc * pdf_d1 * sigma / (2.0 * t.sqrt_tau);

    EuropeanGreeks g{
        .call = s_disc * cdf_d1 - k_disc * cdf_d2,
        .put = k_disc * cdf_neg_d2 - s_disc * cdf_neg_d1,
        .d1 = t.d1,
        .d2 = t.d2,
        .delta_call = t.disc_q * cdf_d1,
        .delta_put = t.disc_q * (cdf_d1 - 1.0),
        .gamma = t.disc_q * pdf_d1 / (S * sigma * t.sqrt_tau),
        .vega = s_disc * pdf_d1 * t.sqrt_tau,
        .theta_call = theta_common - r * k_disc * cdf_d2 + q * s_disc * cdf_d1,
        .theta_put = theta_common + r * k_disc * cdf_neg_d2 - q * s_disc * cdf_neg_d1,
        .rho_call = K * tau * t.disc_r * cdf_d2,
        .rho_put = -K * tau * t.disc_r * cdf_neg_d2
    };

    BSM_TRACE_ALGO_COMPLETE(BSM_MODULE_PRICING, 1, g.call);
    return g;
}

PricingResult EuropeanOptionSolver::solve(OptionType type) const {
    return greeks().result(type);
}

// ===========================================================================
// Validated free functions
// ===========================================================================

std::expected<double, ValidationError>
price_european(const PricingParams& params, OptionType type) {
    auto solver = EuropeanOptionSolver::create(params);
    if (!solver.has_value()) {
        return std::unexpected(solver.error());
    }
    return solver->price(type);
}

std::expected<EuropeanGreeks, ValidationError>
greeks_european(const PricingParams& params) {
    auto solver = EuropeanOptionSolver::create(params);
    if (!solver.has_value()) {
        return std::unexpected(solver.error());
    }
    return solver->greeks();
}

}  // namespace bsm
