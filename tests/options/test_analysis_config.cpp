#include <gtest/gtest.h>
#include <filesystem>
#include <limits>
#include "chain_risk/options/analysis_config.hpp"

using namespace chain_risk;
using namespace chain_risk::options;

class AnalysisConfigTest : public ::testing::Test {};

TEST_F(AnalysisConfigTest, Defaults) {
    AnalysisConfig config;
    EXPECT_DOUBLE_EQ(config.risk_free_rate, 0.04);
    EXPECT_DOUBLE_EQ(config.dividend_yield, 0.012);
    EXPECT_DOUBLE_EQ(config.fallback_atm_iv, 0.20);
    EXPECT_EQ(config.min_options_for_probabilities, 3u);
    EXPECT_EQ(config.min_options_for_tail_risk, 10u);
    EXPECT_EQ(config.limited_data_threshold, 20u);
    EXPECT_DOUBLE_EQ(config.wide_spread_threshold_pct, 5.0);

    EXPECT_DOUBLE_EQ(config.solver.tolerance, 1e-4);
    EXPECT_EQ(config.solver.max_iterations, 50);
    EXPECT_DOUBLE_EQ(config.solver.min_volatility, 0.05);
    EXPECT_DOUBLE_EQ(config.solver.max_volatility, 0.5);
    EXPECT_FALSE(config.solver.parallel);

    EXPECT_DOUBLE_EQ(config.liquidity.min_mid_price, 0.05);
    EXPECT_DOUBLE_EQ(config.liquidity.max_spread_ratio, 0.35);

    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(AnalysisConfigTest, JsonRoundTrip) {
    AnalysisConfig config;
    config.risk_free_rate = 0.05;
    config.dividend_yield = 0.0;
    config.limited_data_threshold = 30;
    config.solver.parallel = true;
    config.solver.parallel_chunk_size = 16;
    config.solver.call_guess_atm = 0.25;
    config.liquidity.max_spread_ratio = 0.5;

    AnalysisConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_DOUBLE_EQ(loaded.risk_free_rate, 0.05);
    EXPECT_DOUBLE_EQ(loaded.dividend_yield, 0.0);
    EXPECT_EQ(loaded.limited_data_threshold, 30u);
    EXPECT_TRUE(loaded.solver.parallel);
    EXPECT_EQ(loaded.solver.parallel_chunk_size, 16u);
    EXPECT_DOUBLE_EQ(loaded.solver.call_guess_atm, 0.25);
    EXPECT_DOUBLE_EQ(loaded.liquidity.max_spread_ratio, 0.5);
    EXPECT_EQ(loaded.to_json(), config.to_json());
}

TEST_F(AnalysisConfigTest, PartialJsonKeepsDefaults) {
    AnalysisConfig config;
    config.from_json(nlohmann::json::parse(R"({
        "risk_free_rate": 0.045,
        "solver": {"max_iterations": 80},
        "liquidity": {"min_mid_price": 0.10}
    })"));

    EXPECT_DOUBLE_EQ(config.risk_free_rate, 0.045);
    EXPECT_DOUBLE_EQ(config.dividend_yield, 0.012);
    EXPECT_EQ(config.solver.max_iterations, 80);
    EXPECT_DOUBLE_EQ(config.solver.tolerance, 1e-4);
    EXPECT_DOUBLE_EQ(config.liquidity.min_mid_price, 0.10);
    EXPECT_DOUBLE_EQ(config.liquidity.max_spread_ratio, 0.35);
}

TEST_F(AnalysisConfigTest, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "analysis_config_test.json";

    AnalysisConfig config;
    config.fallback_atm_iv = 0.3;
    ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

    AnalysisConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path.string()).is_ok());
    EXPECT_DOUBLE_EQ(loaded.fallback_atm_iv, 0.3);

    std::filesystem::remove(path);
}

TEST_F(AnalysisConfigTest, ValidationRejectsBadValues) {
    auto expect_invalid = [](const AnalysisConfig& config) {
        auto result = config.validate();
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    };

    AnalysisConfig config;
    config.risk_free_rate = std::numeric_limits<double>::quiet_NaN();
    expect_invalid(config);

    config = AnalysisConfig();
    config.fallback_atm_iv = 0.0;
    expect_invalid(config);

    config = AnalysisConfig();
    config.solver.max_iterations = 0;
    expect_invalid(config);

    config = AnalysisConfig();
    config.solver.min_volatility = 0.6;
    expect_invalid(config);

    config = AnalysisConfig();
    config.solver.parallel = true;
    config.solver.parallel_chunk_size = 0;
    expect_invalid(config);

    config = AnalysisConfig();
    config.liquidity.min_mid_price = -0.01;
    expect_invalid(config);
}

TEST_F(AnalysisConfigTest, NegativeRatesAreAllowed) {
    AnalysisConfig config;
    config.risk_free_rate = -0.005;
    EXPECT_TRUE(config.validate().is_ok());
}
