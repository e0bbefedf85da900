// SPDX-License-Identifier: MIT
#pragma once

#include "bsm/support/bsm_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>

namespace bsm {

/// Configuration for bracketed root finding
struct RootFindingConfig {
    /// Maximum iterations (function evaluations after the two endpoints)
    size_t max_iter = 100;

    /// Absolute tolerance on x
    double x_tol_abs = 1e-10;

    /// Relative tolerance on x (scaled by |x|)
    double x_tol_rel = 4.0 * std::numeric_limits<double>::epsilon();

    /// Accept x once |f(x)| <= f_tol_abs (0 disables: only an exact zero)
    double f_tol_abs = 0.0;
};

/// Why a root-finding call gave up
enum class RootFindingFailure {
    InvalidBracket,   ///< a >= b or non-finite bounds
    NonFiniteValue,   ///< f returned NaN or Inf
    NotBracketed,     ///< f(a) and f(b) have the same sign
    MaxIterations     ///< Iteration budget exhausted
};

constexpr std::string_view to_string(RootFindingFailure failure) noexcept {
    switch (failure) {
        case RootFindingFailure::InvalidBracket: return "Invalid bracket";
        case RootFindingFailure::NonFiniteValue: return "Function returned non-finite value (NaN or Inf)";
        case RootFindingFailure::NotBracketed:   return "Root not bracketed";
        case RootFindingFailure::MaxIterations:  return "Max iterations reached";
    }
    return "Unknown";
}

/// Result from a root-finding method
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// |f(root)| at the final estimate (NaN if f blew up)
    double final_error;

    /// Set when converged == false
    std::optional<RootFindingFailure> failure;

    /// Root on success, last estimate on MaxIterations, empty otherwise
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
///
/// Works with any callable that takes a double and returns a double.
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Find root using Brent's method
///
/// Combines bisection, secant, and inverse quadratic interpolation for robust
/// scalar root-finding without derivatives. Every iterate stays inside the
/// initial bracket [a, b].
///
/// **Convergence:** the half-width of the current bracket drops below
/// (x_tol_abs + x_tol_rel·|x|)/2, or |f(x)| <= f_tol_abs.
///
/// **Precondition:** a < b, f(a) and f(b) have opposite signs (or one is zero)
///
/// @tparam F Function type satisfying ObjectiveFunction
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration
/// @return Result with root (if converged) and convergence status
///
/// Reference: Brent, R. (1973). "Algorithms for Minimization without Derivatives"
template<ObjectiveFunction F>
RootFindingResult brent_find_root(F&& f, double a, double b,
                                  const RootFindingConfig& config) {
    BSM_TRACE_BRENT_START(a, b, config.x_tol_abs, config.max_iter);

    if (!std::isfinite(a) || !std::isfinite(b) || !(a < b)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure = RootFindingFailure::InvalidBracket,
            .root = std::nullopt
        };
    }

    double x_pre = a;
    double x_cur = b;
    double f_pre = f(x_pre);
    double f_cur = f(x_cur);

    // Check for NaN/Inf at endpoints (indicates invalid input or function failure)
    if (!std::isfinite(f_pre) || !std::isfinite(f_cur)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure = RootFindingFailure::NonFiniteValue,
            .root = std::nullopt
        };
    }

    if (f_pre * f_cur > 0.0) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::min(std::abs(f_pre), std::abs(f_cur)),
            .failure = RootFindingFailure::NotBracketed,
            .root = std::nullopt
        };
    }

    // Endpoints that are already roots
    if (f_pre == 0.0) {
        BSM_TRACE_BRENT_COMPLETE(x_pre, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = 0.0,
            .failure = std::nullopt, .root = x_pre
        };
    }
    if (f_cur == 0.0) {
        BSM_TRACE_BRENT_COMPLETE(x_cur, 0, 1);
        return RootFindingResult{
            .converged = true, .iterations = 0, .final_error = 0.0,
            .failure = std::nullopt, .root = x_cur
        };
    }

    // x_blk is the contrapoint: f(x_blk) and f(x_cur) always differ in sign
    double x_blk = 0.0;
    double f_blk = 0.0;
    double s_pre = 0.0;
    double s_cur = 0.0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        if (f_pre * f_cur < 0.0) {
            x_blk = x_pre;
            f_blk = f_pre;
            s_pre = s_cur = x_cur - x_pre;
        }

        // Keep the best estimate in x_cur
        if (std::abs(f_blk) < std::abs(f_cur)) {
            x_pre = x_cur;
            x_cur = x_blk;
            x_blk = x_pre;

            f_pre = f_cur;
            f_cur = f_blk;
            f_blk = f_pre;
        }

        const double delta = 0.5 * (config.x_tol_abs + config.x_tol_rel * std::abs(x_cur));
        const double s_bis = 0.5 * (x_blk - x_cur);

        BSM_TRACE_BRENT_ITER(iter, x_cur, f_cur, std::abs(x_blk - x_cur));

        if (f_cur == 0.0 || std::abs(f_cur) <= config.f_tol_abs || std::abs(s_bis) < delta) {
            BSM_TRACE_BRENT_COMPLETE(x_cur, iter + 1, 1);
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(f_cur),
                .failure = std::nullopt,
                .root = x_cur
            };
        }

        if (std::abs(s_pre) > delta && std::abs(f_cur) < std::abs(f_pre)) {
            double s_try;
            if (x_pre == x_blk) {
                // Secant
                s_try = -f_cur * (x_cur - x_pre) / (f_cur - f_pre);
            } else {
                // Inverse quadratic extrapolation
                const double d_pre = (f_pre - f_cur) / (x_pre - x_cur);
                const double d_blk = (f_blk - f_cur) / (x_blk - x_cur);
                s_try = -f_cur * (f_blk * d_blk - f_pre * d_pre) /
                        (d_blk * d_pre * (f_blk - f_pre));
            }

            // Accept the interpolated step only if it shrinks fast enough
            if (2.0 * std::abs(s_try) < std::min(std::abs(s_pre), 3.0 * std::abs(s_bis) - delta)) {
                s_pre = s_cur;
                s_cur = s_try;
            } else {
                s_pre = s_bis;
                s_cur = s_bis;
            }
        } else {
            s_pre = s_bis;
            s_cur = s_bis;
        }

        x_pre = x_cur;
        f_pre = f_cur;
        if (std::abs(s_cur) > delta) {
            x_cur += s_cur;
        } else {
            x_cur += (s_bis > 0.0 ? delta : -delta);
        }

        f_cur = f(x_cur);

        if (!std::isfinite(f_cur)) {
            BSM_TRACE_BRENT_COMPLETE(x_cur, iter + 1, 0);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure = RootFindingFailure::NonFiniteValue,
                .root = std::nullopt
            };
        }
    }

    // Max iterations reached
    BSM_TRACE_CONVERGENCE_FAILED(BSM_MODULE_BRENT_ROOT, config.max_iter, std::abs(f_cur));
    BSM_TRACE_BRENT_COMPLETE(x_cur, config.max_iter, 0);
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(f_cur),
        .failure = RootFindingFailure::MaxIterations,
        .root = x_cur
    };
}

}  // namespace bsm
