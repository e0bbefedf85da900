// SPDX-License-Identifier: MIT
/// @file bsm_latency.cc
/// @brief Latency benchmark: closed-form price, full Greeks, implied vol
///
/// Reports ns/query for a single ATM point, plus batch throughput over a
/// strike chain with and without OpenMP.
///
/// Usage:
///   ./build/benchmarks/bsm_latency --benchmark_filter=IV

#include "bsm/math/black_scholes_analytics.hpp"
#include "bsm/option/european_option.hpp"
#include "bsm/option/iv_solver.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <vector>

using namespace bsm;

namespace {

// Shared query point
constexpr double S = 100.0, K = 100.0, tau = 0.5, sigma = 0.20, rate = 0.05, q = 0.02;

PricingParams MakeParams() {
    return PricingParams(
        OptionSpec{.spot = S, .strike = K, .maturity = tau,
            .rate = rate, .dividend_yield = q},
        sigma);
}

std::vector<IVQuery> MakeChain(size_t n) {
    std::vector<IVQuery> queries;
    queries.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double strike = 60.0 + 80.0 * static_cast<double>(i) / static_cast<double>(n);
        const double vol = 0.15 + 0.10 * std::abs(strike - S) / S;
        const OptionType type = strike < S ? OptionType::PUT : OptionType::CALL;
        queries.emplace_back(S, strike, tau, rate, q, type,
                             bs_price(S, strike, tau, vol, rate, q, type));
    }
    return queries;
}

// ===========================================================================
// Pricing
// ===========================================================================

static void BM_BsPrice(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, K, tau, sigma, rate, q, OptionType::CALL));
    }
}
BENCHMARK(BM_BsPrice);

static void BM_SolverPrice(benchmark::State& state) {
    EuropeanOptionSolver solver(MakeParams());
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.price(OptionType::PUT));
    }
}
BENCHMARK(BM_SolverPrice);

static void BM_AllGreeks(benchmark::State& state) {
    EuropeanOptionSolver solver(MakeParams());
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.greeks());
    }
}
BENCHMARK(BM_AllGreeks);

static void BM_CheckedGreeks(benchmark::State& state) {
    const auto params = MakeParams();
    for (auto _ : state) {
        benchmark::DoNotOptimize(greeks_european(params));
    }
}
BENCHMARK(BM_CheckedGreeks);

// ===========================================================================
// Implied volatility
// ===========================================================================

static void BM_IV_ATM(benchmark::State& state) {
    IVSolver solver(IVSolverConfig{});
    const IVQuery query(S, K, tau, rate, q, OptionType::CALL,
                        bs_price(S, K, tau, sigma, rate, q, OptionType::CALL));
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.solve(query));
    }
}
BENCHMARK(BM_IV_ATM);

static void BM_IV_DeepOTM(benchmark::State& state) {
    IVSolver solver(IVSolverConfig{});
    const IVQuery query(S, 140.0, tau, rate, q, OptionType::CALL,
                        bs_price(S, 140.0, tau, 0.35, rate, q, OptionType::CALL));
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.solve(query));
    }
}
BENCHMARK(BM_IV_DeepOTM);

static void BM_IV_Batch(benchmark::State& state) {
    IVSolver solver(IVSolverConfig{});
    const auto queries = MakeChain(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.solve_batch(queries));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_IV_Batch)->Arg(64)->Arg(1024)->Arg(16384)->Unit(benchmark::kMicrosecond);

}  // namespace

BENCHMARK_MAIN();
