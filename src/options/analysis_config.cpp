// src/options/analysis_config.cpp

#include "chain_risk/options/analysis_config.hpp"
#include <cmath>

namespace chain_risk {
namespace options {

namespace {

Result<void> invalid(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "AnalysisConfig");
}

}  // anonymous namespace

nlohmann::json AnalysisConfig::to_json() const {
    nlohmann::json j;
    j["risk_free_rate"] = risk_free_rate;
    j["dividend_yield"] = dividend_yield;
    j["fallback_atm_iv"] = fallback_atm_iv;
    j["min_options_for_probabilities"] = min_options_for_probabilities;
    j["min_options_for_tail_risk"] = min_options_for_tail_risk;
    j["limited_data_threshold"] = limited_data_threshold;
    j["wide_spread_threshold_pct"] = wide_spread_threshold_pct;
    j["solver"] = solver.to_json();
    j["liquidity"] = liquidity.to_json();
    j["version"] = version;
    return j;
}

void AnalysisConfig::from_json(const nlohmann::json& j) {
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("dividend_yield"))
        dividend_yield = j.at("dividend_yield").get<double>();
    if (j.contains("fallback_atm_iv"))
        fallback_atm_iv = j.at("fallback_atm_iv").get<double>();
    if (j.contains("min_options_for_probabilities"))
        min_options_for_probabilities = j.at("min_options_for_probabilities").get<size_t>();
    if (j.contains("min_options_for_tail_risk"))
        min_options_for_tail_risk = j.at("min_options_for_tail_risk").get<size_t>();
    if (j.contains("limited_data_threshold"))
        limited_data_threshold = j.at("limited_data_threshold").get<size_t>();
    if (j.contains("wide_spread_threshold_pct"))
        wide_spread_threshold_pct = j.at("wide_spread_threshold_pct").get<double>();
    if (j.contains("solver"))
        solver.from_json(j.at("solver"));
    if (j.contains("liquidity"))
        liquidity.from_json(j.at("liquidity"));
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> AnalysisConfig::validate() const {
    if (!std::isfinite(risk_free_rate))
        return invalid("risk_free_rate must be finite");
    if (!std::isfinite(dividend_yield))
        return invalid("dividend_yield must be finite");
    if (!(fallback_atm_iv > 0.0))
        return invalid("fallback_atm_iv must be positive");

    if (!(solver.tolerance > 0.0))
        return invalid("solver.tolerance must be positive");
    if (solver.max_iterations <= 0)
        return invalid("solver.max_iterations must be positive");
    if (!(solver.min_volatility > 0.0) || !(solver.max_volatility > solver.min_volatility))
        return invalid("solver volatility bounds must satisfy 0 < min_volatility < max_volatility");
    if (solver.min_vega < 0.0)
        return invalid("solver.min_vega must not be negative");
    if (solver.parallel && solver.parallel_chunk_size == 0)
        return invalid("solver.parallel_chunk_size must be positive when parallel is enabled");

    if (liquidity.min_mid_price < 0.0)
        return invalid("liquidity.min_mid_price must not be negative");
    if (!(liquidity.max_spread_ratio >= 0.0))
        return invalid("liquidity.max_spread_ratio must not be negative");

    return Result<void>();
}

}  // namespace options
}  // namespace chain_risk
