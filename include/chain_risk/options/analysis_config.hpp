// include/chain_risk/options/analysis_config.hpp
#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include "chain_risk/core/config_base.hpp"
#include "chain_risk/core/error.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Newton-Raphson implied volatility solver settings
 */
struct IvSolverConfig : public ConfigBase {
    double tolerance{1e-4};       // Absolute price difference accepted as converged
    int max_iterations{50};
    double min_volatility{0.05};  // Floor applied after every step
    double max_volatility{0.5};   // Reaching this returns the deep-ITM default
    double min_vega{1e-3};        // Below this the step is abandoned

    // Calls with S/K above this, or puts with S/K below put_deep_itm_moneyness,
    // skip iteration and use the default
    double call_deep_itm_moneyness{1.2};
    double put_deep_itm_moneyness{0.8};
    double call_deep_itm_volatility{0.18};
    double put_deep_itm_volatility{0.20};

    // Initial guesses by moneyness bucket
    double call_guess_itm{0.17};  // S/K > 1.1
    double call_guess_otm{0.22};  // S/K < 0.9
    double call_guess_atm{0.19};
    double put_guess_itm{0.22};   // S/K < 0.9
    double put_guess_otm{0.25};   // S/K > 1.1
    double put_guess_atm{0.21};

    bool parallel{false};
    size_t parallel_chunk_size{64};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["tolerance"] = tolerance;
        j["max_iterations"] = max_iterations;
        j["min_volatility"] = min_volatility;
        j["max_volatility"] = max_volatility;
        j["min_vega"] = min_vega;
        j["call_deep_itm_moneyness"] = call_deep_itm_moneyness;
        j["put_deep_itm_moneyness"] = put_deep_itm_moneyness;
        j["call_deep_itm_volatility"] = call_deep_itm_volatility;
        j["put_deep_itm_volatility"] = put_deep_itm_volatility;
        j["call_guess_itm"] = call_guess_itm;
        j["call_guess_otm"] = call_guess_otm;
        j["call_guess_atm"] = call_guess_atm;
        j["put_guess_itm"] = put_guess_itm;
        j["put_guess_otm"] = put_guess_otm;
        j["put_guess_atm"] = put_guess_atm;
        j["parallel"] = parallel;
        j["parallel_chunk_size"] = parallel_chunk_size;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("tolerance"))
            tolerance = j.at("tolerance").get<double>();
        if (j.contains("max_iterations"))
            max_iterations = j.at("max_iterations").get<int>();
        if (j.contains("min_volatility"))
            min_volatility = j.at("min_volatility").get<double>();
        if (j.contains("max_volatility"))
            max_volatility = j.at("max_volatility").get<double>();
        if (j.contains("min_vega"))
            min_vega = j.at("min_vega").get<double>();
        if (j.contains("call_deep_itm_moneyness"))
            call_deep_itm_moneyness = j.at("call_deep_itm_moneyness").get<double>();
        if (j.contains("put_deep_itm_moneyness"))
            put_deep_itm_moneyness = j.at("put_deep_itm_moneyness").get<double>();
        if (j.contains("call_deep_itm_volatility"))
            call_deep_itm_volatility = j.at("call_deep_itm_volatility").get<double>();
        if (j.contains("put_deep_itm_volatility"))
            put_deep_itm_volatility = j.at("put_deep_itm_volatility").get<double>();
        if (j.contains("call_guess_itm"))
            call_guess_itm = j.at("call_guess_itm").get<double>();
        if (j.contains("call_guess_otm"))
            call_guess_otm = j.at("call_guess_otm").get<double>();
        if (j.contains("call_guess_atm"))
            call_guess_atm = j.at("call_guess_atm").get<double>();
        if (j.contains("put_guess_itm"))
            put_guess_itm = j.at("put_guess_itm").get<double>();
        if (j.contains("put_guess_otm"))
            put_guess_otm = j.at("put_guess_otm").get<double>();
        if (j.contains("put_guess_atm"))
            put_guess_atm = j.at("put_guess_atm").get<double>();
        if (j.contains("parallel"))
            parallel = j.at("parallel").get<bool>();
        if (j.contains("parallel_chunk_size"))
            parallel_chunk_size = j.at("parallel_chunk_size").get<size_t>();
    }
};

/**
 * @brief Liquidity gate applied before solving for IV
 */
struct LiquidityConfig : public ConfigBase {
    double min_mid_price{0.05};
    double max_spread_ratio{0.35};  // (ask - bid) / mid

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_mid_price"] = min_mid_price;
        j["max_spread_ratio"] = max_spread_ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_mid_price"))
            min_mid_price = j.at("min_mid_price").get<double>();
        if (j.contains("max_spread_ratio"))
            max_spread_ratio = j.at("max_spread_ratio").get<double>();
    }
};

/**
 * @brief Policy constants for one chain analysis
 *
 * Rates are fixed inputs rather than market data; tune them here instead of
 * in the solver or metric code.
 */
struct AnalysisConfig : public ConfigBase {
    double risk_free_rate{0.04};
    double dividend_yield{0.012};

    double fallback_atm_iv{0.20};          // Used when no contract near spot has an IV
    size_t min_options_for_probabilities{3};
    size_t min_options_for_tail_risk{10};  // Tail percentiles need strictly more
    size_t limited_data_threshold{20};
    double wide_spread_threshold_pct{5.0};

    IvSolverConfig solver;
    LiquidityConfig liquidity;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check that the values describe a usable analysis
     * @return INVALID_ARGUMENT naming the first offending field
     */
    Result<void> validate() const;
};

}  // namespace options
}  // namespace chain_risk
