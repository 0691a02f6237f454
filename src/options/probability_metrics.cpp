// src/options/probability_metrics.cpp

#include "chain_risk/options/probability_metrics.hpp"
#include <cmath>
#include "chain_risk/core/logger.hpp"
#include "chain_risk/options/risk_neutral_cdf.hpp"
#include "chain_risk/options/spot_estimator.hpp"

namespace chain_risk {
namespace options {

namespace {
constexpr int SHORT_TERM_DAYS = 45;
constexpr double DAYS_PER_MONTH = 30.44;
}  // anonymous namespace

ProbabilityEstimate calculate_probabilities(const std::vector<Contract>& contracts, double spot,
                                            double T, const AnalysisConfig& config) {
    ProbabilityEstimate estimate;

    if (contracts.size() < config.min_options_for_probabilities) {
        WARN("Insufficient options for probability calculation: " << contracts.size());
        return estimate;
    }

    estimate.atm_iv = find_atm_iv(contracts, spot, config.fallback_atm_iv);
    INFO("Using ATM IV " << estimate.atm_iv * 100.0 << "% for all strikes");

    auto cdf = build_constant_iv_cdf(contracts, spot, estimate.atm_iv, config.risk_free_rate,
                                     config.dividend_yield, T);
    estimate.cdf_points = cdf.size();
    if (cdf.size() < 2) {
        WARN("Insufficient CDF points: " << cdf.size());
        return estimate;
    }

    DEBUG("CDF built with " << cdf.size() << " points, first " << cdf.front().strike << " -> "
                            << cdf.front().cdf << ", last " << cdf.back().strike << " -> "
                            << cdf.back().cdf);

    auto at = [&](double level) { return clamp(interpolate_cdf(cdf, level), 0.0, 1.0); };

    RiskNeutralProbabilities& p = estimate.probabilities;
    p.loss_0 = at(spot);
    p.gain_0 = 1.0 - p.loss_0;
    p.loss_5 = at(spot * 0.95);
    p.loss_10 = at(spot * 0.90);
    p.loss_15 = at(spot * 0.85);
    p.gain_5 = 1.0 - at(spot * 1.05);
    p.gain_10 = 1.0 - at(spot * 1.10);
    p.gain_15 = 1.0 - at(spot * 1.15);
    estimate.sufficient_data = true;

    INFO("Probabilities: gain0 " << p.gain_0 << ", gain5 " << p.gain_5 << ", gain10 " << p.gain_10
                                 << ", loss0 " << p.loss_0 << ", loss5 " << p.loss_5
                                 << ", loss10 " << p.loss_10);
    return estimate;
}

std::string term_structure_label(int days_to_expiry, const std::string& expiry_date) {
    std::string label;
    if (days_to_expiry < SHORT_TERM_DAYS) {
        label = std::to_string(days_to_expiry) + "-day";
    } else {
        long months = std::lround(days_to_expiry / DAYS_PER_MONTH);
        label = std::to_string(months) + "-month";
    }

    if (!expiry_date.empty()) {
        label += " (" + expiry_date + ")";
    }
    return label;
}

IvMetrics calculate_iv_metrics(const std::vector<Contract>& contracts, double spot,
                               int days_to_expiry, const std::string& expiry_date) {
    IvMetrics metrics;
    metrics.term_structure = term_structure_label(days_to_expiry, expiry_date);

    if (contracts.empty()) {
        return metrics;
    }

    ATMOption atm = find_atm_option(contracts, spot);
    double atm_iv = 0.0;
    if (atm.has_call_iv && atm.has_put_iv) {
        atm_iv = (atm.call_iv + atm.put_iv) / 2.0;
    } else if (atm.has_call_iv) {
        atm_iv = atm.call_iv;
    } else if (atm.has_put_iv) {
        atm_iv = atm.put_iv;
    }

    metrics.atm_iv_pct = atm_iv * 100.0;
    // Reported at the chain's own horizon, not rescaled to 30 days
    metrics.vix_equivalent_pct = atm_iv * 100.0;

    OTMOptions otm = find_otm_options(contracts, spot);
    if (otm.has_put && otm.has_call) {
        metrics.iv_skew = (otm.put_iv - otm.call_iv) * 100.0;
    }

    INFO("IV metrics: ATM " << metrics.atm_iv_pct << "%, skew " << metrics.iv_skew << ", OTM put "
                            << otm.put_iv * 100.0 << "%, OTM call " << otm.call_iv * 100.0 << "%");
    return metrics;
}

TailRisk calculate_tail_risk(const std::vector<Contract>& contracts, double spot,
                             size_t min_options) {
    TailRisk risk;
    const size_t n = contracts.size();
    if (spot <= 0.0) {
        return risk;
    }

    if (n > min_options) {
        size_t idx5 = n / 20;
        size_t idx95 = n * 19 / 20;
        if (idx5 < n && idx95 < n) {
            risk.left_tail_pct = (contracts[idx5].strike - spot) / spot * 100.0;
            risk.right_tail_pct = (contracts[idx95].strike - spot) / spot * 100.0;
        }
    }

    // Average of the lowest 5% of strikes
    size_t cutoff = n / 20;
    if (cutoff > 0 && cutoff < n) {
        double sum = 0.0;
        for (size_t i = 0; i < cutoff; ++i) {
            sum += contracts[i].strike;
        }
        double avg_worst = sum / static_cast<double>(cutoff);
        risk.expected_shortfall_pct = (avg_worst - spot) / spot * 100.0;
    }

    if (risk.right_tail_pct != 0.0 && risk.left_tail_pct != 0.0) {
        risk.kurtosis_proxy = std::abs(risk.left_tail_pct) / risk.right_tail_pct;
    }

    return risk;
}

SkewMetrics calculate_skew_metrics(const std::vector<Contract>& contracts, double spot) {
    SkewMetrics metrics;

    const Contract* otm_put = nullptr;
    const Contract* otm_call = nullptr;
    for (const auto& c : contracts) {
        if (!otm_put && c.strike < spot * 0.9 && c.put_iv > 0.0) {
            otm_put = &c;
        }
        if (!otm_call && c.strike > spot * 1.1 && c.call_iv > 0.0) {
            otm_call = &c;
        }
    }

    if (otm_put && otm_call) {
        metrics.risk_reversal = (otm_put->put_iv - otm_call->call_iv) * 100.0;
    }

    const size_t n = contracts.size();
    if (n > 3) {
        size_t mid = n / 2;
        double c1 = contracts[mid - 1].call_mid;
        double c2 = contracts[mid].call_mid;
        double c3 = contracts[mid + 1].call_mid;
        if (c1 > 0.0 && c2 > 0.0 && c3 > 0.0) {
            metrics.butterfly_spread = c1 - 2.0 * c2 + c3;
        }
    }

    metrics.skewness_estimate = metrics.risk_reversal / 100.0;
    return metrics;
}

double calculate_expected_return(const std::vector<Contract>& /*contracts*/, double /*spot*/,
                                 int days_to_expiry, const AnalysisConfig& config) {
    double annualized = (config.risk_free_rate - config.dividend_yield) * 100.0;
    DEBUG("Risk-neutral expected return " << annualized << "% (r " << config.risk_free_rate
                                          << ", q " << config.dividend_yield << ", T "
                                          << days_to_expiry / 365.0 << "y)");
    return annualized;
}

double calculate_put_call_ratio(const std::vector<Contract>& contracts) {
    double total_put_oi = 0.0;
    double total_call_oi = 0.0;
    for (const auto& c : contracts) {
        total_put_oi += c.put_open_interest;
        total_call_oi += c.call_open_interest;
    }

    if (total_call_oi > 0.0) {
        return total_put_oi / total_call_oi;
    }
    return 0.0;
}

}  // namespace options
}  // namespace chain_risk
