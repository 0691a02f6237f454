// src/data/report_serializer.cpp

#include "chain_risk/data/report_serializer.hpp"

#include <fstream>

#include "chain_risk/core/logger.hpp"
#include "chain_risk/core/time_utils.hpp"

namespace chain_risk {

nlohmann::json ReportSerializer::to_json(const options::RiskAnalysisResult& result,
                                         const std::string& timestamp) {
    nlohmann::json j;
    j["timestamp"] = timestamp.empty() ? core::get_formatted_time("%Y-%m-%dT%H:%M:%SZ", false)
                                       : timestamp;
    j["symbol"] = result.symbol;
    j["expiry_date"] = result.expiry_date;
    j["current_price"] = result.spot;
    j["spot_source"] = options::spot_source_to_string(result.spot_source);
    j["parity_pair_count"] = result.parity_pair_count;
    j["days_to_expiry"] = result.days_to_expiry;

    const auto& p = result.probabilities;
    j["risk_neutral_probabilities"] = {
        {"prob_gain_0pct_plus", p.gain_0},   {"prob_gain_5pct_plus", p.gain_5},
        {"prob_gain_10pct_plus", p.gain_10}, {"prob_gain_15pct_plus", p.gain_15},
        {"prob_loss_0pct_plus", p.loss_0},   {"prob_loss_5pct_plus", p.loss_5},
        {"prob_loss_10pct_plus", p.loss_10}, {"prob_loss_15pct_plus", p.loss_15}};

    const auto& iv = result.iv_metrics;
    j["implied_volatility_metrics"] = {{"atm_implied_vol_percent", iv.atm_iv_pct},
                                       {"iv_skew", iv.iv_skew},
                                       {"iv_term_structure", iv.term_structure},
                                       {"vix_equivalent_percent", iv.vix_equivalent_pct}};

    j["market_expected_return_percent"] = result.expected_return_pct;

    const auto& tail = result.tail_risk;
    j["tail_risk_metrics"] = {{"left_tail_risk_5pct", tail.left_tail_pct},
                              {"right_tail_risk_95pct", tail.right_tail_pct},
                              {"expected_shortfall_percent", tail.expected_shortfall_pct},
                              {"kurtosis_proxy", tail.kurtosis_proxy}};

    const auto& skew = result.skew;
    j["skew_metrics"] = {{"risk_reversal_25delta", skew.risk_reversal},
                         {"butterfly_spread", skew.butterfly_spread},
                         {"skewness_estimate", skew.skewness_estimate}};

    j["put_call_ratio"] = result.put_call_ratio;

    const auto& quality = result.data_quality;
    j["data_quality"] = {{"options_analyzed", quality.options_analyzed},
                         {"strike_range", quality.strike_range},
                         {"avg_bid_ask_spread_percent", quality.avg_bid_ask_spread_pct},
                         {"warnings", quality.warnings}};
    return j;
}

Result<void> ReportSerializer::save_to_file(const options::RiskAnalysisResult& result,
                                            const std::filesystem::path& file_path) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open report file for writing: " + file_path.string(),
                                "ReportSerializer");
    }

    file << to_json(result).dump(2) << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to write report file: " + file_path.string(),
                                "ReportSerializer");
    }

    INFO("Wrote report to " << file_path.string());
    return Result<void>();
}

}  // namespace chain_risk
