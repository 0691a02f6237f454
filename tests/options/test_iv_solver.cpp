#include <gtest/gtest.h>
#include <vector>
#include "../core/test_base.hpp"
#include "chain_fixtures.hpp"
#include "chain_risk/options/black_scholes.hpp"
#include "chain_risk/options/chain_filter.hpp"
#include "chain_risk/options/iv_solver.hpp"

using namespace chain_risk;
using namespace chain_risk::options;
using namespace chain_risk::testing;

class IvSolverTest : public TestBase {
protected:
    const double r = 0.04;
    const double q = 0.012;

    std::vector<Contract> synthetic_contracts() const {
        SyntheticChain chain;
        auto built = build_contracts(chain.rows(76.0, 124.0, 2.0));
        return built.value();
    }
};

TEST_F(IvSolverTest, CallRoundTrip) {
    double price = black_scholes_call(100, 100, 1, r, q, 0.25);
    EXPECT_NEAR(implied_volatility_call(price, 100, 100, 1, r, q), 0.25, 0.001);

    double otm = black_scholes_call(100, 105, 0.5, r, q, 0.35);
    EXPECT_NEAR(implied_volatility_call(otm, 100, 105, 0.5, r, q), 0.35, 0.001);
}

TEST_F(IvSolverTest, PutRoundTrip) {
    double price = black_scholes_put(100, 100, 1, r, q, 0.25);
    EXPECT_NEAR(implied_volatility_put(price, 100, 100, 1, r, q), 0.25, 0.001);

    double otm = black_scholes_put(100, 92, 0.25, r, q, 0.30);
    EXPECT_NEAR(implied_volatility_put(otm, 100, 92, 0.25, r, q), 0.30, 0.001);
}

TEST_F(IvSolverTest, DeepInTheMoneyShortCircuit) {
    EXPECT_EQ(implied_volatility_call(31.0, 130, 100, 1, r, q), 0.18);
    EXPECT_EQ(implied_volatility_put(31.0, 70, 100, 1, r, q), 0.20);
}

TEST_F(IvSolverTest, NonPositiveInputsGiveSentinel) {
    EXPECT_EQ(implied_volatility_call(0.0, 100, 100, 1, r, q), 0.0);
    EXPECT_EQ(implied_volatility_call(-1.0, 100, 100, 1, r, q), 0.0);
    EXPECT_EQ(implied_volatility_call(5.0, 100, 100, 0, r, q), 0.0);
    EXPECT_EQ(implied_volatility_put(5.0, 100, 100, -1, r, q), 0.0);
}

TEST_F(IvSolverTest, UpperBoundReturnsDeepItmDefault) {
    double call = black_scholes_call(100, 100, 1, r, q, 0.8);
    double put = black_scholes_put(100, 100, 1, r, q, 0.8);
    EXPECT_EQ(implied_volatility_call(call, 100, 100, 1, r, q), 0.18);
    EXPECT_EQ(implied_volatility_put(put, 100, 100, 1, r, q), 0.20);
}

TEST_F(IvSolverTest, PriceBelowFloorNeverConverges) {
    double call = black_scholes_call(100, 100, 1, r, q, 0.01);
    EXPECT_EQ(implied_volatility_call(call, 100, 100, 1, r, q), 0.0);
}

TEST_F(IvSolverTest, FloorValueItselfIsAccepted) {
    double call = black_scholes_call(100, 100, 1, r, q, 0.05);
    EXPECT_NEAR(implied_volatility_call(call, 100, 100, 1, r, q), 0.05, 1e-6);
}

TEST_F(IvSolverTest, VanishingVegaGivesSentinel) {
    EXPECT_EQ(implied_volatility_call(0.5, 100, 119, 1.0 / 365.0, r, q), 0.0);
}

TEST_F(IvSolverTest, ConfigOverridesDefaults) {
    IvSolverConfig config;
    config.call_deep_itm_volatility = 0.30;
    config.call_deep_itm_moneyness = 1.5;
    EXPECT_EQ(implied_volatility_call(60.0, 160, 100, 1, r, q, config), 0.30);

    // 1.3 is no longer deep ITM, so the solver iterates
    double price = black_scholes_call(130, 100, 1, r, q, 0.25);
    EXPECT_NEAR(implied_volatility_call(price, 130, 100, 1, r, q, config), 0.25, 0.001);
}

TEST_F(IvSolverTest, SolveContractsFillsBothSides) {
    auto contracts = synthetic_contracts();
    IvSolveSummary summary = solve_contract_ivs(contracts, 100.0, 1.0, r, q, IvSolverConfig(),
                                                LiquidityConfig());

    EXPECT_EQ(summary.call_attempts, contracts.size());
    EXPECT_EQ(summary.put_attempts, contracts.size());
    EXPECT_EQ(summary.call_solved, contracts.size());
    EXPECT_EQ(summary.put_solved, contracts.size());

    for (const auto& c : contracts) {
        if (c.strike < 100.0 / 1.2) {
            EXPECT_EQ(c.call_iv, 0.18) << c.strike;
        } else {
            EXPECT_NEAR(c.call_iv, 0.20, 0.001) << c.strike;
        }
        EXPECT_NEAR(c.put_iv, 0.20, 0.001) << c.strike;
    }
}

TEST_F(IvSolverTest, IlliquidSideIsNotSolved) {
    std::vector<Contract> contracts = {make_contract(100.0, 9.20, 0.0)};
    contracts[0].call_bid = 9.0;
    contracts[0].call_ask = 9.4;
    contracts[0].put_iv = 0.5;  // Stale value is cleared

    IvSolveSummary summary =
        solve_contract_ivs(contracts, 100.0, 1.0, r, q, IvSolverConfig(), LiquidityConfig());

    EXPECT_EQ(summary.put_attempts, 0u);
    EXPECT_EQ(contracts[0].put_iv, 0.0);
    EXPECT_GT(contracts[0].call_iv, 0.0);
}

TEST_F(IvSolverTest, ParallelMatchesSequential) {
    auto sequential = synthetic_contracts();
    auto parallel = sequential;

    IvSolverConfig config;
    solve_contract_ivs(sequential, 100.0, 1.0, r, q, config, LiquidityConfig());

    config.parallel = true;
    config.parallel_chunk_size = 4;
    IvSolveSummary summary =
        solve_contract_ivs(parallel, 100.0, 1.0, r, q, config, LiquidityConfig());

    ASSERT_EQ(parallel.size(), sequential.size());
    EXPECT_EQ(summary.call_attempts, parallel.size());
    for (size_t i = 0; i < parallel.size(); ++i) {
        EXPECT_EQ(parallel[i].strike, sequential[i].strike);
        EXPECT_EQ(parallel[i].call_iv, sequential[i].call_iv);
        EXPECT_EQ(parallel[i].put_iv, sequential[i].put_iv);
    }
}

TEST_F(IvSolverTest, SelectPricedUsesRelevantSide) {
    Contract below = make_contract(95.0, 6.0, 2.0);
    below.put_iv = 0.21;
    below.call_iv = 0.0;

    Contract below_no_put_iv = make_contract(97.0, 5.0, 3.0);
    below_no_put_iv.call_iv = 0.2;

    Contract above = make_contract(105.0, 2.5, 6.0);
    above.call_iv = 0.19;

    Contract above_illiquid = make_contract(110.0, 0.04, 10.0);
    above_illiquid.call_iv = 0.19;

    auto priced = select_priced_contracts({below, below_no_put_iv, above, above_illiquid}, 100.0,
                                          LiquidityConfig());
    ASSERT_EQ(priced.size(), 2u);
    EXPECT_DOUBLE_EQ(priced[0].strike, 95.0);
    EXPECT_DOUBLE_EQ(priced[1].strike, 105.0);
}
