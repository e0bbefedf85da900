// SPDX-License-Identifier: MIT
/**
 * @file iv_result.hpp
 * @brief IV solver result types for std::expected API
 */

#pragma once

#include <cstddef>
#include <expected>
#include <vector>
#include "bsm/support/error_types.hpp"

namespace bsm {

/// Success result from IV solver
struct IVSuccess {
    double implied_vol;   ///< Solved implied volatility
    size_t iterations;    ///< Number of Brent iterations taken
    double final_error;   ///< |Price(σ) - Market_Price|
    double vega;          ///< Analytic vega at the solution
};

/// Outcome of a single implied volatility solve
using IVResult = std::expected<IVSuccess, IVError>;

/// Call-side and put-side implied vols for one observed price
///
/// The two sides are solved independently and need not agree.
struct CallPutIV {
    IVResult call;
    IVResult put;
};

/// Batch IV solver result
struct BatchIVResult {
    std::vector<IVResult> results;  ///< Individual results, same order as the queries
    size_t failed_count;            ///< Number of failures

    /// Check if all results succeeded
    bool all_succeeded() const {
        return failed_count == 0;
    }
};

}  // namespace bsm
