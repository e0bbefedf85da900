// SPDX-License-Identifier: MIT
/**
 * @file bsm_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the bsm library
 *
 * Probes compile to single NOP instructions until a tracer attaches to them,
 * so the pricing and implied-volatility hot paths carry no logging cost.
 *
 * Example usage with bpftrace:
 *   # Every implied-vol solve with its outcome
 *   sudo bpftrace -e 'usdt:./libbsm.so:bsm:iv_complete { printf("%f %d %d\n", arg0, arg1, arg2); }'
 *
 *   # Below-intrinsic market quotes
 *   sudo bpftrace -e 'usdt:./libbsm.so:bsm:below_intrinsic { ... }'
 */

#ifndef BSM_TRACE_H
#define BSM_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * With systemtap-sdt-dev installed the build defines HAVE_SYSTEMTAP_SDT and
 * the probes come from sys/sdt.h. Otherwise they expand to nothing.
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all bsm library probes
 */
#define BSM_PROVIDER bsm

/**
 * Module identifiers, passed as the first argument of the generic probes
 */
#define BSM_MODULE_PRICING      1
#define BSM_MODULE_IMPLIED_VOL  2
#define BSM_MODULE_BRENT_ROOT   3
#define BSM_MODULE_VALIDATION   4
#define BSM_MODULE_BATCH        5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (BSM_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., batch size, max_iter)
 * @param param2: Module-specific parameter
 * @param param3: Module-specific parameter
 */
#define BSM_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(BSM_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Work units completed
 * @param final_metric: Module-specific final metric
 */
#define BSM_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(BSM_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Validation and Convergence Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Numeric value of the error code enum
 * @param value: Offending input value
 */
#define BSM_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(BSM_PROVIDER, validation_error, module_id, error_code, value)

/**
 * Fired when an iterative method gives up
 * @param module_id: Module identifier
 * @param iterations: Iterations performed
 * @param final_error: Residual at failure
 */
#define BSM_TRACE_CONVERGENCE_FAILED(module_id, iterations, final_error) \
    DTRACE_PROBE3(BSM_PROVIDER, convergence_failed, module_id, iterations, final_error)

/**
 * ============================================================================
 * Module-Specific Probes: Implied Volatility
 * ============================================================================
 */

/**
 * Fired when IV calculation begins
 * @param spot: Spot price
 * @param strike: Strike price
 * @param maturity: Time to maturity (years)
 * @param market_price: Observed price to match
 */
#define BSM_TRACE_IV_START(spot, strike, maturity, market_price) \
    DTRACE_PROBE4(BSM_PROVIDER, iv_start, spot, strike, maturity, market_price)

/**
 * Fired when IV calculation completes
 * @param implied_vol: Result (last candidate on failure)
 * @param iterations: Brent iterations
 * @param converged: 1 if converged, 0 otherwise
 */
#define BSM_TRACE_IV_COMPLETE(implied_vol, iterations, converged) \
    DTRACE_PROBE3(BSM_PROVIDER, iv_complete, implied_vol, iterations, converged)

/**
 * Fired when a market price is below the discounted intrinsic value
 * @param market_price: Observed price
 * @param intrinsic: Discounted intrinsic lower bound
 */
#define BSM_TRACE_IV_BELOW_INTRINSIC(market_price, intrinsic) \
    DTRACE_PROBE2(BSM_PROVIDER, below_intrinsic, market_price, intrinsic)

/**
 * ============================================================================
 * Module-Specific Probes: Brent's Method
 * ============================================================================
 */

/**
 * Fired when root finding begins
 * @param a: Left bracket
 * @param b: Right bracket
 * @param tolerance: Absolute x tolerance
 * @param max_iter: Iteration cap
 */
#define BSM_TRACE_BRENT_START(a, b, tolerance, max_iter) \
    DTRACE_PROBE4(BSM_PROVIDER, brent_start, a, b, tolerance, max_iter)

/**
 * Fired on each Brent iteration
 * @param iter: Iteration number
 * @param x: Current best estimate
 * @param fx: Function value at x
 * @param interval_width: Current bracket width
 */
#define BSM_TRACE_BRENT_ITER(iter, x, fx, interval_width) \
    DTRACE_PROBE4(BSM_PROVIDER, brent_iter, iter, x, fx, interval_width)

/**
 * Fired when root finding completes
 * @param root: Final estimate
 * @param iterations: Iterations performed
 * @param converged: 1 if converged, 0 otherwise
 */
#define BSM_TRACE_BRENT_COMPLETE(root, iterations, converged) \
    DTRACE_PROBE3(BSM_PROVIDER, brent_complete, root, iterations, converged)

#endif // BSM_TRACE_H
