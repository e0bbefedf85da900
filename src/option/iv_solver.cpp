// SPDX-License-Identifier: MIT
#include "bsm/option/iv_solver.hpp"
#include "bsm/math/black_scholes_analytics.hpp"
#include "bsm/math/root_finding.hpp"
#include "bsm/support/bsm_trace.h"
#include "bsm/support/parallel.hpp"
#include <algorithm>
#include <cmath>

namespace bsm {

namespace {

std::unexpected<IVError> reject_query(IVErrorCode code, double value) {
    BSM_TRACE_VALIDATION_ERROR(BSM_MODULE_IMPLIED_VOL, static_cast<int>(code), value);
    return std::unexpected(IVError{.code = code});
}

IVErrorCode to_iv_error_code(RootFindingFailure failure) {
    switch (failure) {
        case RootFindingFailure::MaxIterations:
            return IVErrorCode::MaxIterationsExceeded;
        case RootFindingFailure::NonFiniteValue:
            return IVErrorCode::NumericalInstability;
        case RootFindingFailure::InvalidBracket:
        case RootFindingFailure::NotBracketed:
            return IVErrorCode::BracketingFailed;
    }
    return IVErrorCode::BracketingFailed;
}

}  // namespace

std::expected<void, ValidationError> validate_iv_solver_config(const IVSolverConfig& config) {
    if (!std::isfinite(config.vol_lower) || config.vol_lower <= 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, config.vol_lower));
    }
    if (!std::isfinite(config.vol_upper) || config.vol_upper <= config.vol_lower) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, config.vol_upper));
    }
    if (config.root_config.max_iter == 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidIterationCount, 0.0));
    }
    const auto& rc = config.root_config;
    if (!std::isfinite(rc.x_tol_abs) || rc.x_tol_abs <= 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTolerance, rc.x_tol_abs));
    }
    if (!std::isfinite(rc.x_tol_rel) || rc.x_tol_rel < 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTolerance, rc.x_tol_rel));
    }
    if (!std::isfinite(rc.f_tol_abs) || rc.f_tol_abs < 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTolerance, rc.f_tol_abs));
    }
    return {};
}

IVSolver::IVSolver(const IVSolverConfig& config)
    : config_(config)
{}

std::expected<IVSolver, ValidationError> IVSolver::create(const IVSolverConfig& config) {
    auto validation = validate_iv_solver_config(config);
    if (!validation) {
        BSM_TRACE_VALIDATION_ERROR(BSM_MODULE_IMPLIED_VOL,
                                   static_cast<int>(validation.error().code),
                                   validation.error().value);
        return std::unexpected(validation.error());
    }
    return IVSolver(config);
}

std::expected<void, IVError> IVSolver::validate_query(const IVQuery& query) const {
    if (query.spot <= 0.0 || !std::isfinite(query.spot)) {
        return reject_query(IVErrorCode::InvalidSpot, query.spot);
    }
    if (query.strike <= 0.0 || !std::isfinite(query.strike)) {
        return reject_query(IVErrorCode::InvalidStrike, query.strike);
    }
    if (query.maturity <= 0.0 || !std::isfinite(query.maturity)) {
        return reject_query(IVErrorCode::InvalidMaturity, query.maturity);
    }
    if (!std::isfinite(query.rate)) {
        return reject_query(IVErrorCode::InvalidRate, query.rate);
    }
    if (!std::isfinite(query.dividend_yield)) {
        return reject_query(IVErrorCode::InvalidDividend, query.dividend_yield);
    }
    if (query.market_price <= 0.0 || !std::isfinite(query.market_price)) {
        return reject_query(IVErrorCode::InvalidMarketPrice, query.market_price);
    }
    return {};
}

IVResult IVSolver::solve_brent(const IVQuery& query) const {
    auto objective = [&query](double vol) -> double {
        return bs_price(query.spot, query.strike, query.maturity, vol,
                        query.rate, query.dividend_yield, query.type) - query.market_price;
    };

    auto brent_result = brent_find_root(objective, config_.vol_lower, config_.vol_upper,
                                        config_.root_config);

    if (!brent_result.converged) {
        const IVErrorCode code = to_iv_error_code(
            brent_result.failure.value_or(RootFindingFailure::MaxIterations));
        BSM_TRACE_CONVERGENCE_FAILED(BSM_MODULE_IMPLIED_VOL, brent_result.iterations,
                                     brent_result.final_error);
        return std::unexpected(IVError{
            .code = code,
            .iterations = brent_result.iterations,
            .final_error = brent_result.final_error,
            .last_vol = brent_result.root,
            .bound = std::nullopt
        });
    }

    // A root on the bracket edge means the price sits at a limit of the
    // search domain, not at an interior volatility
    const double vol = brent_result.root.value();
    if (!(vol > config_.vol_lower && vol < config_.vol_upper)) {
        BSM_TRACE_CONVERGENCE_FAILED(BSM_MODULE_IMPLIED_VOL, brent_result.iterations,
                                     brent_result.final_error);
        return std::unexpected(IVError{
            .code = IVErrorCode::BracketingFailed,
            .iterations = brent_result.iterations,
            .final_error = brent_result.final_error,
            .last_vol = vol,
            .bound = std::nullopt
        });
    }

    return IVSuccess{
        .implied_vol = vol,
        .iterations = brent_result.iterations,
        .final_error = brent_result.final_error,
        .vega = bs_vega(query.spot, query.strike, query.maturity, vol,
                        query.rate, query.dividend_yield)
    };
}

IVResult IVSolver::solve(const IVQuery& query) const {
    BSM_TRACE_IV_START(query.spot, query.strike, query.maturity, query.market_price);

    auto validation = validate_query(query);
    if (!validation) {
        return std::unexpected(validation.error());
    }

    // No volatility can price below the zero-vol limit
    const double intrinsic = discounted_intrinsic(query.spot, query.strike, query.maturity,
                                                  query.rate, query.dividend_yield, query.type);
    if (query.market_price < intrinsic) {
        BSM_TRACE_IV_BELOW_INTRINSIC(query.market_price, intrinsic);
        return std::unexpected(IVError{
            .code = IVErrorCode::BelowIntrinsic,
            .iterations = 0,
            .final_error = intrinsic - query.market_price,
            .last_vol = std::nullopt,
            .bound = intrinsic
        });
    }

    auto result = solve_brent(query);
    BSM_TRACE_IV_COMPLETE(result ? result->implied_vol : result.error().last_vol.value_or(0.0),
                          result ? result->iterations : result.error().iterations,
                          result.has_value() ? 1 : 0);
    return result;
}

CallPutIV IVSolver::solve_call_put(const OptionSpec& spec, double market_price) const {
    return CallPutIV{
        .call = solve(IVQuery(spec, OptionType::CALL, market_price)),
        .put = solve(IVQuery(spec, OptionType::PUT, market_price))
    };
}

BatchIVResult IVSolver::solve_batch(const std::vector<IVQuery>& queries) const {
    BatchIVResult batch{
        .results = std::vector<IVResult>(queries.size()),
        .failed_count = 0
    };

    BSM_TRACE_ALGO_START(BSM_MODULE_BATCH, queries.size(), config_.vol_lower, config_.vol_upper);

    BSM_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < queries.size(); ++i) {
        batch.results[i] = solve(queries[i]);
    }

    batch.failed_count = static_cast<size_t>(
        std::count_if(batch.results.begin(), batch.results.end(),
                      [](const IVResult& r) { return !r.has_value(); }));

    BSM_TRACE_ALGO_COMPLETE(BSM_MODULE_BATCH, queries.size(), batch.failed_count);
    return batch;
}

}  // namespace bsm
