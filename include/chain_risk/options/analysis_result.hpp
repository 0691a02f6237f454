// include/chain_risk/options/analysis_result.hpp
#pragma once

#include <string>
#include <vector>
#include "chain_risk/options/spot_estimator.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Risk-neutral probabilities of moves by expiry, each in [0, 1]
 *
 * gain_X is P(S_T > S * (1 + X)) and loss_X is P(S_T < S * (1 - X)).
 * When computed, gain_0 + loss_0 == 1; a degraded result is all zero.
 */
struct RiskNeutralProbabilities {
    double gain_0{0.0};
    double gain_5{0.0};
    double gain_10{0.0};
    double gain_15{0.0};
    double loss_0{0.0};
    double loss_5{0.0};
    double loss_10{0.0};
    double loss_15{0.0};
};

struct IvMetrics {
    double atm_iv_pct{0.0};
    double iv_skew{0.0};  // OTM put IV minus OTM call IV, in vol points
    double vix_equivalent_pct{0.0};
    std::string term_structure;
};

/**
 * @brief Strike-percentile tail measures as % deviation from spot
 */
struct TailRisk {
    double left_tail_pct{0.0};   // 5th percentile strike
    double right_tail_pct{0.0};  // 95th percentile strike
    double expected_shortfall_pct{0.0};
    double kurtosis_proxy{0.0};
};

struct SkewMetrics {
    double risk_reversal{0.0};
    double butterfly_spread{0.0};
    double skewness_estimate{0.0};
};

struct DataQuality {
    size_t options_analyzed{0};
    std::string strike_range;
    double avg_bid_ask_spread_pct{0.0};
    std::vector<std::string> warnings;
};

/**
 * @brief Complete output of one chain analysis
 */
struct RiskAnalysisResult {
    std::string symbol;
    std::string expiry_date;
    double spot{0.0};
    SpotSource spot_source{SpotSource::LAST_TRADE};
    size_t parity_pair_count{0};
    int days_to_expiry{0};

    RiskNeutralProbabilities probabilities;
    IvMetrics iv_metrics;
    double expected_return_pct{0.0};
    TailRisk tail_risk;
    SkewMetrics skew;
    double put_call_ratio{0.0};
    DataQuality data_quality;
};

}  // namespace options
}  // namespace chain_risk
