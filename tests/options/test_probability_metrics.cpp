#include <gtest/gtest.h>
#include <vector>
#include "../core/test_base.hpp"
#include "chain_fixtures.hpp"
#include "chain_risk/options/chain_filter.hpp"
#include "chain_risk/options/iv_solver.hpp"
#include "chain_risk/options/probability_metrics.hpp"

using namespace chain_risk;
using namespace chain_risk::options;
using namespace chain_risk::testing;

class ProbabilityMetricsTest : public TestBase {
protected:
    AnalysisConfig config;

    // Priced contracts of the flat 20% chain, strikes 76..124 step 2
    std::vector<Contract> priced_synthetic() const {
        SyntheticChain chain;
        auto contracts = build_contracts(chain.rows(76.0, 124.0, 2.0)).value();
        solve_contract_ivs(contracts, chain.spot, 1.0, config.risk_free_rate, config.dividend_yield,
                           config.solver, config.liquidity);
        return select_priced_contracts(contracts, chain.spot, config.liquidity);
    }

    static std::vector<Contract> ladder(double first, double last, double step) {
        std::vector<Contract> out;
        for (double k = first; k <= last + 1e-9; k += step) {
            out.push_back(make_contract(k, 1.0, 1.0));
        }
        return out;
    }
};

TEST_F(ProbabilityMetricsTest, TooFewContractsGivesZeros) {
    auto contracts = ladder(95.0, 100.0, 5.0);
    contracts[0].put_iv = 0.2;
    contracts[1].put_iv = 0.2;

    ProbabilityEstimate estimate = calculate_probabilities(contracts, 100.0, 1.0, config);
    EXPECT_FALSE(estimate.sufficient_data);
    EXPECT_EQ(estimate.probabilities.gain_0, 0.0);
    EXPECT_EQ(estimate.probabilities.loss_0, 0.0);
    EXPECT_EQ(estimate.probabilities.gain_15, 0.0);
    EXPECT_EQ(estimate.probabilities.loss_15, 0.0);
}

TEST_F(ProbabilityMetricsTest, FlatChainProbabilities) {
    auto priced = priced_synthetic();
    ASSERT_EQ(priced.size(), 25u);

    ProbabilityEstimate estimate = calculate_probabilities(priced, 100.0, 1.0, config);
    ASSERT_TRUE(estimate.sufficient_data);
    EXPECT_EQ(estimate.cdf_points, 25u);
    EXPECT_NEAR(estimate.atm_iv, 0.20, 1e-4);

    const auto& p = estimate.probabilities;
    EXPECT_NEAR(p.gain_0 + p.loss_0, 1.0, 0.01);
    EXPECT_NEAR(p.loss_0, 0.48405, 1e-4);
    EXPECT_NEAR(p.gain_0, 0.51595, 1e-4);
    EXPECT_NEAR(p.loss_5, 0.38349, 1e-4);
    EXPECT_NEAR(p.gain_5, 0.41937, 1e-4);
    EXPECT_NEAR(p.loss_10, 0.28543, 1e-4);
    EXPECT_NEAR(p.gain_10, 0.33122, 1e-4);
    EXPECT_NEAR(p.loss_15, 0.19726, 1e-4);
    EXPECT_NEAR(p.gain_15, 0.25527, 1e-4);

    // Wider moves are less likely
    EXPECT_GT(p.gain_0, p.gain_5);
    EXPECT_GT(p.gain_5, p.gain_10);
    EXPECT_GT(p.loss_5, p.loss_10);
    EXPECT_GT(p.loss_10, p.loss_15);
}

TEST_F(ProbabilityMetricsTest, LevelsBeyondChainAreClamped) {
    auto contracts = ladder(98.0, 102.0, 1.0);
    for (auto& c : contracts) {
        c.put_iv = 0.2;
        c.call_iv = 0.2;
    }

    ProbabilityEstimate estimate = calculate_probabilities(contracts, 100.0, 1.0, config);
    ASSERT_TRUE(estimate.sufficient_data);
    EXPECT_EQ(estimate.probabilities.loss_5, 0.0);
    EXPECT_EQ(estimate.probabilities.loss_15, 0.0);
    EXPECT_EQ(estimate.probabilities.gain_5, 0.0);
    EXPECT_EQ(estimate.probabilities.gain_15, 0.0);
}

TEST_F(ProbabilityMetricsTest, TermStructureLabels) {
    EXPECT_EQ(term_structure_label(30, ""), "30-day");
    EXPECT_EQ(term_structure_label(44, "2025-11-30"), "44-day (2025-11-30)");
    EXPECT_EQ(term_structure_label(45, ""), "1-month");
    EXPECT_EQ(term_structure_label(427, "2026-12-18"), "14-month (2026-12-18)");
}

TEST_F(ProbabilityMetricsTest, IvMetricsAveragesAtmSides) {
    auto contracts = ladder(80.0, 120.0, 10.0);
    contracts[0].put_iv = 0.30;
    contracts[1].put_iv = 0.26;
    contracts[2].put_iv = 0.22;
    contracts[2].call_iv = 0.18;
    contracts[3].call_iv = 0.17;
    contracts[4].call_iv = 0.16;

    IvMetrics metrics = calculate_iv_metrics(contracts, 100.0, 30, "2025-11-16");
    EXPECT_NEAR(metrics.atm_iv_pct, 20.0, 1e-9);
    EXPECT_NEAR(metrics.vix_equivalent_pct, 20.0, 1e-9);
    EXPECT_NEAR(metrics.iv_skew, 9.0, 1e-9);
    EXPECT_EQ(metrics.term_structure, "30-day (2025-11-16)");
}

TEST_F(ProbabilityMetricsTest, IvMetricsWithoutContracts) {
    IvMetrics metrics = calculate_iv_metrics({}, 100.0, 60, "");
    EXPECT_EQ(metrics.atm_iv_pct, 0.0);
    EXPECT_EQ(metrics.iv_skew, 0.0);
    EXPECT_EQ(metrics.term_structure, "2-month");
}

TEST_F(ProbabilityMetricsTest, FlatChainIvMetrics) {
    IvMetrics metrics = calculate_iv_metrics(priced_synthetic(), 100.0, 365, "2026-12-18");
    EXPECT_NEAR(metrics.atm_iv_pct, 20.0, 0.01);
    EXPECT_NEAR(metrics.iv_skew, 0.0, 0.05);
    EXPECT_EQ(metrics.term_structure, "12-month (2026-12-18)");
}

TEST_F(ProbabilityMetricsTest, TailRiskNeedsEnoughStrikes) {
    TailRisk small = calculate_tail_risk(ladder(90.0, 108.0, 2.0), 100.0);
    EXPECT_EQ(small.left_tail_pct, 0.0);
    EXPECT_EQ(small.right_tail_pct, 0.0);
    EXPECT_EQ(small.expected_shortfall_pct, 0.0);
    EXPECT_EQ(small.kurtosis_proxy, 0.0);
}

TEST_F(ProbabilityMetricsTest, TailRiskPercentiles) {
    TailRisk risk = calculate_tail_risk(ladder(76.0, 124.0, 2.0), 100.0);
    EXPECT_DOUBLE_EQ(risk.left_tail_pct, -22.0);
    EXPECT_DOUBLE_EQ(risk.right_tail_pct, 22.0);
    EXPECT_DOUBLE_EQ(risk.expected_shortfall_pct, -24.0);
    EXPECT_DOUBLE_EQ(risk.kurtosis_proxy, 1.0);
}

TEST_F(ProbabilityMetricsTest, SkewUsesFirstWingsAndCentralButterfly) {
    std::vector<Contract> contracts = {
        make_contract(80.0, 21.0, 0.5), make_contract(85.0, 16.5, 1.0),
        make_contract(100.0, 7.0, 6.0), make_contract(115.0, 4.0, 17.0),
        make_contract(120.0, 2.0, 21.0),
    };
    contracts[0].put_iv = 0.28;
    contracts[1].put_iv = 0.26;
    contracts[3].call_iv = 0.17;
    contracts[4].call_iv = 0.16;

    SkewMetrics skew = calculate_skew_metrics(contracts, 100.0);
    EXPECT_NEAR(skew.risk_reversal, 11.0, 1e-9);
    EXPECT_NEAR(skew.skewness_estimate, 0.11, 1e-11);
    // 16.5 - 2 * 7 + 4
    EXPECT_NEAR(skew.butterfly_spread, 6.5, 1e-12);
}

TEST_F(ProbabilityMetricsTest, SkewWithoutWingsOrZeroMids) {
    std::vector<Contract> contracts = {
        make_contract(95.0, 6.0, 1.0), make_contract(100.0, 0.0, 3.0),
        make_contract(105.0, 1.0, 6.0), make_contract(108.0, 0.5, 8.0),
    };
    SkewMetrics skew = calculate_skew_metrics(contracts, 100.0);
    EXPECT_EQ(skew.risk_reversal, 0.0);
    EXPECT_EQ(skew.butterfly_spread, 0.0);
    EXPECT_EQ(skew.skewness_estimate, 0.0);
}

TEST_F(ProbabilityMetricsTest, ExpectedReturnIsRiskNeutralDrift) {
    EXPECT_NEAR(calculate_expected_return({}, 100.0, 30, config), 2.8, 1e-12);
    EXPECT_NEAR(calculate_expected_return(priced_synthetic(), 250.0, 427, config), 2.8, 1e-12);

    config.risk_free_rate = 0.05;
    config.dividend_yield = 0.0;
    EXPECT_NEAR(calculate_expected_return({}, 100.0, 30, config), 5.0, 1e-12);
}

TEST_F(ProbabilityMetricsTest, PutCallRatio) {
    auto contracts = ladder(90.0, 110.0, 10.0);
    for (auto& c : contracts) {
        c.call_open_interest = 200.0;
        c.put_open_interest = 300.0;
    }
    EXPECT_DOUBLE_EQ(calculate_put_call_ratio(contracts), 1.5);

    for (auto& c : contracts) {
        c.call_open_interest = 0.0;
    }
    EXPECT_DOUBLE_EQ(calculate_put_call_ratio(contracts), 0.0);
    EXPECT_DOUBLE_EQ(calculate_put_call_ratio({}), 0.0);
}
