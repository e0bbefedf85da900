// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "bsm/option/iv_solver.hpp"
#include "bsm/math/black_scholes_analytics.hpp"
#include <cmath>
#include <limits>
#include <tuple>
#include <vector>

namespace bsm {
namespace {

class IVSolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        // ATM call priced at σ = 0.20
        query = IVQuery(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 10.450583572185565);
    }

    IVQuery query;
    IVSolverConfig config;
};

TEST_F(IVSolverTest, CreateWithDefaultConfigSucceeds) {
    auto solver = IVSolver::create(config);
    ASSERT_TRUE(solver.has_value());
    EXPECT_DOUBLE_EQ(solver->config().vol_lower, 1e-6);
    EXPECT_DOUBLE_EQ(solver->config().vol_upper, 5.0);
    EXPECT_EQ(solver->config().root_config.max_iter, 200u);
}

TEST_F(IVSolverTest, ATMCallIVCalculation) {
    IVSolver solver(config);
    auto result = solver.solve(query);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(result->implied_vol, 0.20, 1e-8);
    EXPECT_GT(result->iterations, 0u);
    EXPECT_LT(result->final_error, 1e-8);
    EXPECT_NEAR(result->vega, bs_vega(100.0, 100.0, 1.0, result->implied_vol, 0.05), 1e-12);
}

TEST_F(IVSolverTest, ATMPutIVCalculation) {
    query.type = OptionType::PUT;
    query.market_price = 5.573526022256971;

    auto result = IVSolver(config).solve(query);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(result->implied_vol, 0.20, 1e-8);
}

TEST_F(IVSolverTest, DividendPayingUnderlying) {
    query.dividend_yield = 0.03;
    query.market_price = 8.652528553942709;

    auto result = IVSolver(config).solve(query);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(result->implied_vol, 0.20, 1e-8);
}

// ============================================================================
// Round trip over a volatility grid
// ============================================================================

struct RoundTripCase {
    double maturity;
    double rate;
    double dividend;
    OptionType type;
};

class IVRoundTripTest : public ::testing::TestWithParam<RoundTripCase> {};

TEST_P(IVRoundTripTest, RecoversPricingVolatility) {
    const auto c = GetParam();
    const double spot = 100.0;
    // Forward-ATM strike keeps vega well away from zero over the whole grid
    const double strike = spot * std::exp((c.rate - c.dividend) * c.maturity);
    IVSolver solver(IVSolverConfig{});

    for (double sigma : {0.01, 0.05, 0.1, 0.2, 0.35, 0.5, 0.8, 1.2, 2.0, 3.0}) {
        const double price = bs_price(spot, strike, c.maturity, sigma, c.rate, c.dividend, c.type);
        auto result = solver.solve(IVQuery(spot, strike, c.maturity, c.rate, c.dividend,
                                           c.type, price));

        ASSERT_TRUE(result.has_value()) << "sigma=" << sigma << " " << result.error();
        EXPECT_NEAR(result->implied_vol, sigma, 1e-6) << "sigma=" << sigma;
    }
}

INSTANTIATE_TEST_SUITE_P(
    ForwardATM,
    IVRoundTripTest,
    ::testing::Values(
        RoundTripCase{1.0, 0.05, 0.00, OptionType::CALL},
        RoundTripCase{1.0, 0.05, 0.00, OptionType::PUT},
        RoundTripCase{0.25, 0.02, 0.01, OptionType::CALL},
        RoundTripCase{2.0, 0.03, 0.04, OptionType::PUT},
        RoundTripCase{0.5, -0.01, 0.0, OptionType::CALL}
    )
);

// Off-ATM strikes over the same grid, skipping points where vega is too small
// for the price to pin down σ
class IVMoneynessRoundTripTest
    : public ::testing::TestWithParam<std::tuple<double, double, OptionType>> {};

TEST_P(IVMoneynessRoundTripTest, RecoversPricingVolatility) {
    const auto [strike, maturity, type] = GetParam();
    const double spot = 100.0;
    const double rate = 0.03;
    const double dividend = 0.01;
    IVSolver solver(IVSolverConfig{});

    size_t checked = 0;
    for (double sigma : {0.01, 0.05, 0.1, 0.2, 0.35, 0.5, 0.8, 1.2, 2.0, 3.0}) {
        if (bs_vega(spot, strike, maturity, sigma, rate, dividend) < 1e-3) {
            continue;
        }
        const double price = bs_price(spot, strike, maturity, sigma, rate, dividend, type);
        auto result = solver.solve(IVQuery(spot, strike, maturity, rate, dividend, type, price));

        ASSERT_TRUE(result.has_value()) << "K=" << strike << " T=" << maturity
                                        << " sigma=" << sigma << " " << result.error();
        EXPECT_NEAR(result->implied_vol, sigma, 1e-6)
            << "K=" << strike << " T=" << maturity << " sigma=" << sigma;
        ++checked;
    }
    // The high-vol end of the grid always has usable vega
    EXPECT_GE(checked, 4u);
}

INSTANTIATE_TEST_SUITE_P(
    ITMAndOTM,
    IVMoneynessRoundTripTest,
    ::testing::Combine(
        ::testing::Values(60.0, 75.0, 90.0, 110.0, 130.0, 160.0),
        ::testing::Values(0.25, 1.0, 2.0),
        ::testing::Values(OptionType::CALL, OptionType::PUT)
    )
);

TEST_F(IVSolverTest, OTMOptionsRecoverVolatility) {
    IVSolver solver(config);
    for (double strike : {80.0, 90.0, 110.0, 125.0}) {
        const OptionType type = strike < 100.0 ? OptionType::PUT : OptionType::CALL;
        const double price = bs_price(100.0, strike, 0.5, 0.3, 0.04, 0.01, type);
        auto result = solver.solve(IVQuery(100.0, strike, 0.5, 0.04, 0.01, type, price));

        ASSERT_TRUE(result.has_value()) << "K=" << strike;
        EXPECT_NEAR(result->implied_vol, 0.3, 1e-7) << "K=" << strike;
    }
}

// ============================================================================
// Prices outside the attainable range
// ============================================================================

TEST_F(IVSolverTest, BelowIntrinsicSkipsSearch) {
    // Deep ITM call: intrinsic = 100 - 60·e^(-0.05) ≈ 42.93
    IVQuery itm(100.0, 60.0, 1.0, 0.05, 0.0, OptionType::CALL, 30.0);
    auto result = IVSolver(config).solve(itm);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BelowIntrinsic);
    EXPECT_EQ(result.error().iterations, 0u);
    ASSERT_TRUE(result.error().bound.has_value());
    const double intrinsic = 100.0 - 60.0 * std::exp(-0.05);
    EXPECT_NEAR(*result.error().bound, intrinsic, 1e-12);
    EXPECT_NEAR(result.error().final_error, intrinsic - 30.0, 1e-12);
    EXPECT_FALSE(is_convergence_failure(result.error().code));
}

TEST_F(IVSolverTest, PutBelowIntrinsic) {
    IVQuery itm(80.0, 100.0, 1.0, 0.05, 0.0, OptionType::PUT, 10.0);
    auto result = IVSolver(config).solve(itm);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BelowIntrinsic);
}

TEST_F(IVSolverTest, CallAboveUpperBoundFailsBracketing) {
    // No volatility in (0, 5] prices an ATM call at 99.5 when S = 100
    query.market_price = 99.5;
    auto result = IVSolver(config).solve(query);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
    EXPECT_TRUE(is_convergence_failure(result.error().code));
}

TEST_F(IVSolverTest, PutAboveDiscountedStrikeFailsBracketing) {
    query.type = OptionType::PUT;
    query.market_price = 96.0;  // K·e^(-rT) ≈ 95.12
    auto result = IVSolver(config).solve(query);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
}

TEST_F(IVSolverTest, NarrowBracketFailsWhenRootOutside) {
    config.vol_lower = 0.3;
    config.vol_upper = 0.6;
    auto result = IVSolver(config).solve(query);  // true vol is 0.20

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
}

TEST_F(IVSolverTest, RootAtLowerBracketEdgeIsRejected) {
    config.vol_lower = 0.20;
    config.vol_upper = 1.0;
    query.market_price = bs_price(100.0, 100.0, 1.0, 0.20, 0.05, 0.0, OptionType::CALL);

    auto result = IVSolver(config).solve(query);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
    ASSERT_TRUE(result.error().last_vol.has_value());
    EXPECT_DOUBLE_EQ(*result.error().last_vol, 0.20);
}

TEST_F(IVSolverTest, RootAtUpperBracketEdgeIsRejected) {
    config.vol_lower = 0.05;
    config.vol_upper = 0.20;
    query.market_price = bs_price(100.0, 100.0, 1.0, 0.20, 0.05, 0.0, OptionType::CALL);

    auto result = IVSolver(config).solve(query);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
}

TEST_F(IVSolverTest, PriceAtDiscountedIntrinsicIsNotAVolatility) {
    // Deep ITM call quoted exactly at its zero-volatility value
    const double intrinsic = discounted_intrinsic(100.0, 60.0, 1.0, 0.05, 0.0, OptionType::CALL);
    IVQuery itm(100.0, 60.0, 1.0, 0.05, 0.0, OptionType::CALL, intrinsic);

    auto result = IVSolver(config).solve(itm);
    ASSERT_FALSE(result.has_value())
        << "implied_vol=" << result->implied_vol << " at vol_lower=" << config.vol_lower;
    EXPECT_EQ(result.error().code, IVErrorCode::BracketingFailed);
    EXPECT_TRUE(is_convergence_failure(result.error().code));
}

TEST_F(IVSolverTest, SuccessfulSolvesStayStrictlyInsideBracket) {
    IVSolver solver(config);
    for (double strike : {50.0, 60.0, 80.0, 100.0, 120.0}) {
        for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
            const double floor = discounted_intrinsic(100.0, strike, 1.0, 0.05, 0.0, type);
            for (double premium : {0.0, 1e-12, 1e-6, 0.5}) {
                const double price = floor + premium;
                if (price <= 0.0) {
                    continue;
                }
                auto result = solver.solve(IVQuery(100.0, strike, 1.0, 0.05, 0.0, type, price));
                if (result.has_value()) {
                    EXPECT_GT(result->implied_vol, config.vol_lower) << "K=" << strike;
                    EXPECT_LT(result->implied_vol, config.vol_upper) << "K=" << strike;
                }
            }
        }
    }
}

TEST_F(IVSolverTest, MaxIterationsExceeded) {
    config.root_config.max_iter = 1;
    auto result = IVSolver(config).solve(query);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, IVErrorCode::MaxIterationsExceeded);
    EXPECT_EQ(result.error().iterations, 1u);
    ASSERT_TRUE(result.error().last_vol.has_value());
    EXPECT_GE(*result.error().last_vol, config.vol_lower);
    EXPECT_LE(*result.error().last_vol, config.vol_upper);
}

// ============================================================================
// Query validation
// ============================================================================

TEST_F(IVSolverTest, InvalidQueriesRejectedBeforePricing) {
    struct Case {
        IVQuery query;
        IVErrorCode expected;
    };
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    const std::vector<Case> cases = {
        {IVQuery(-100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 10.0), IVErrorCode::InvalidSpot},
        {IVQuery(100.0, 0.0, 1.0, 0.05, 0.0, OptionType::CALL, 10.0), IVErrorCode::InvalidStrike},
        {IVQuery(100.0, 100.0, 0.0, 0.05, 0.0, OptionType::CALL, 10.0), IVErrorCode::InvalidMaturity},
        {IVQuery(100.0, 100.0, 1.0, nan, 0.0, OptionType::CALL, 10.0), IVErrorCode::InvalidRate},
        {IVQuery(100.0, 100.0, 1.0, 0.05, inf, OptionType::CALL, 10.0), IVErrorCode::InvalidDividend},
        {IVQuery(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.0), IVErrorCode::InvalidMarketPrice},
        {IVQuery(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, -1.0), IVErrorCode::InvalidMarketPrice},
        {IVQuery(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, nan), IVErrorCode::InvalidMarketPrice},
    };

    IVSolver solver(config);
    for (const auto& c : cases) {
        auto result = solver.solve(c.query);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, c.expected) << result.error();
        EXPECT_TRUE(is_precondition_violation(result.error().code));
        EXPECT_EQ(result.error().iterations, 0u);
    }
}

// ============================================================================
// Configuration validation
// ============================================================================

TEST_F(IVSolverTest, CreateRejectsInvalidConfig) {
    struct Case {
        IVSolverConfig config;
        ValidationErrorCode expected;
    };
    std::vector<Case> cases;

    IVSolverConfig c = config;
    c.vol_lower = 0.0;
    cases.push_back({c, ValidationErrorCode::InvalidBounds});

    c = config;
    c.vol_upper = c.vol_lower;
    cases.push_back({c, ValidationErrorCode::InvalidBounds});

    c = config;
    c.vol_upper = std::numeric_limits<double>::infinity();
    cases.push_back({c, ValidationErrorCode::InvalidBounds});

    c = config;
    c.root_config.max_iter = 0;
    cases.push_back({c, ValidationErrorCode::InvalidIterationCount});

    c = config;
    c.root_config.x_tol_abs = 0.0;
    cases.push_back({c, ValidationErrorCode::InvalidTolerance});

    c = config;
    c.root_config.x_tol_rel = -1e-12;
    cases.push_back({c, ValidationErrorCode::InvalidTolerance});

    c = config;
    c.root_config.f_tol_abs = -1.0;
    cases.push_back({c, ValidationErrorCode::InvalidTolerance});

    for (const auto& tc : cases) {
        auto solver = IVSolver::create(tc.config);
        ASSERT_FALSE(solver.has_value());
        EXPECT_EQ(solver.error().code, tc.expected) << solver.error();
    }
}

// ============================================================================
// Call/put and batch
// ============================================================================

TEST_F(IVSolverTest, CallPutSolvedIndependently) {
    OptionSpec spec{.spot = 100.0, .strike = 100.0, .maturity = 1.0,
                    .rate = 0.05, .dividend_yield = 0.0};
    auto iv = IVSolver(config).solve_call_put(spec, 10.450583572185565);

    ASSERT_TRUE(iv.call.has_value());
    ASSERT_TRUE(iv.put.has_value());
    EXPECT_NEAR(iv.call->implied_vol, 0.20, 1e-8);
    // Same price is worth more volatility on the cheaper put side
    EXPECT_GT(iv.put->implied_vol, iv.call->implied_vol);
    EXPECT_NEAR(bs_price(100.0, 100.0, 1.0, iv.put->implied_vol, 0.05, 0.0, OptionType::PUT),
                10.450583572185565, 1e-8);
}

TEST_F(IVSolverTest, CallPutOneSideFails) {
    // 30 is below the call's intrinsic (~42.93) but a valid put price
    OptionSpec spec{.spot = 100.0, .strike = 60.0, .maturity = 1.0,
                    .rate = 0.05, .dividend_yield = 0.0};
    auto iv = IVSolver(config).solve_call_put(spec, 30.0);

    ASSERT_FALSE(iv.call.has_value());
    EXPECT_EQ(iv.call.error().code, IVErrorCode::BelowIntrinsic);
    EXPECT_TRUE(iv.put.has_value());
}

TEST_F(IVSolverTest, BatchMatchesSingleSolves) {
    std::vector<IVQuery> queries;
    for (double strike = 80.0; strike <= 120.0; strike += 5.0) {
        const double price = bs_price(100.0, strike, 0.75, 0.25, 0.03, 0.01, OptionType::CALL);
        queries.emplace_back(100.0, strike, 0.75, 0.03, 0.01, OptionType::CALL, price);
    }

    IVSolver solver(config);
    auto batch = solver.solve_batch(queries);

    ASSERT_EQ(batch.results.size(), queries.size());
    EXPECT_EQ(batch.failed_count, 0u);
    EXPECT_TRUE(batch.all_succeeded());
    for (size_t i = 0; i < queries.size(); ++i) {
        auto single = solver.solve(queries[i]);
        ASSERT_TRUE(batch.results[i].has_value());
        ASSERT_TRUE(single.has_value());
        EXPECT_DOUBLE_EQ(batch.results[i]->implied_vol, single->implied_vol);
        EXPECT_NEAR(batch.results[i]->implied_vol, 0.25, 1e-7);
    }
}

TEST_F(IVSolverTest, BatchCountsFailures) {
    std::vector<IVQuery> queries = {
        query,
        IVQuery(100.0, 60.0, 1.0, 0.05, 0.0, OptionType::CALL, 30.0),    // below intrinsic
        IVQuery(-1.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 10.0),    // invalid spot
        IVQuery(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 99.5),   // above upper bound
    };

    auto batch = IVSolver(config).solve_batch(queries);

    ASSERT_EQ(batch.results.size(), 4u);
    EXPECT_EQ(batch.failed_count, 3u);
    EXPECT_FALSE(batch.all_succeeded());
    EXPECT_TRUE(batch.results[0].has_value());
    EXPECT_EQ(batch.results[1].error().code, IVErrorCode::BelowIntrinsic);
    EXPECT_EQ(batch.results[2].error().code, IVErrorCode::InvalidSpot);
    EXPECT_EQ(batch.results[3].error().code, IVErrorCode::BracketingFailed);
}

TEST_F(IVSolverTest, EmptyBatch) {
    auto batch = IVSolver(config).solve_batch({});
    EXPECT_TRUE(batch.results.empty());
    EXPECT_TRUE(batch.all_succeeded());
}

}  // namespace
}  // namespace bsm
