// include/chain_risk/options/probability_metrics.hpp
#pragma once

#include <string>
#include <vector>
#include "chain_risk/core/types.hpp"
#include "chain_risk/options/analysis_config.hpp"
#include "chain_risk/options/analysis_result.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Directional probabilities plus the inputs that produced them
 */
struct ProbabilityEstimate {
    RiskNeutralProbabilities probabilities;
    double atm_iv{0.0};
    size_t cdf_points{0};
    bool sufficient_data{false};  // false means probabilities are all zero
};

/**
 * @brief Gain/loss probabilities from a constant-ATM-IV CDF
 *
 * Needs at least config.min_options_for_probabilities contracts and two CDF
 * points, otherwise every probability is 0 and sufficient_data is false.
 *
 * @param contracts Priced contracts sorted by strike
 * @param spot Spot price
 * @param T Time to expiry in years
 * @param config Rates and thresholds
 */
ProbabilityEstimate calculate_probabilities(const std::vector<Contract>& contracts, double spot,
                                            double T, const AnalysisConfig& config);

/**
 * @brief "<N>-day" below 45 days, else "<M>-month" with M = round(days / 30.44)
 *
 * The expiry date is appended in parentheses when not empty.
 */
std::string term_structure_label(int days_to_expiry, const std::string& expiry_date);

/**
 * @brief ATM IV, VIX-equivalent and 90/110 wing skew
 */
IvMetrics calculate_iv_metrics(const std::vector<Contract>& contracts, double spot,
                               int days_to_expiry, const std::string& expiry_date);

/**
 * @brief Strike-percentile tails; zero unless more than min_options contracts
 */
TailRisk calculate_tail_risk(const std::vector<Contract>& contracts, double spot,
                             size_t min_options = 10);

SkewMetrics calculate_skew_metrics(const std::vector<Contract>& contracts, double spot);

/**
 * @brief Risk-neutral drift (r - q) in percent per year
 *
 * Deliberately independent of the chain, spot and horizon.
 */
double calculate_expected_return(const std::vector<Contract>& contracts, double spot,
                                 int days_to_expiry, const AnalysisConfig& config);

/**
 * @brief Total put open interest over total call open interest; 0 without call OI
 */
double calculate_put_call_ratio(const std::vector<Contract>& contracts);

}  // namespace options
}  // namespace chain_risk
