// src/options/analysis_engine.cpp

#include "chain_risk/options/analysis_engine.hpp"
#include <cstdio>
#include <utility>
#include "chain_risk/core/logger.hpp"
#include "chain_risk/options/chain_filter.hpp"
#include "chain_risk/options/iv_solver.hpp"
#include "chain_risk/options/probability_metrics.hpp"
#include "chain_risk/options/quote_sanitizer.hpp"
#include "chain_risk/options/spot_estimator.hpp"

namespace chain_risk {
namespace options {

namespace {
constexpr double DAYS_PER_YEAR = 365.0;
}  // anonymous namespace

AnalysisEngine::AnalysisEngine(AnalysisConfig config) : config_(std::move(config)) {}

Result<RiskAnalysisResult> AnalysisEngine::analyze(const ChainSnapshot& snapshot,
                                                   int days_to_expiry) const {
    if (days_to_expiry < 0) {
        return make_error<RiskAnalysisResult>(
            ErrorCode::INVALID_ARGUMENT,
            "Days to expiry must not be negative: " + std::to_string(days_to_expiry),
            "AnalysisEngine");
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<RiskAnalysisResult>(*valid.error(), "AnalysisEngine");
    }

    try {
        INFO("Analyzing " << (snapshot.symbol.empty() ? "chain" : snapshot.symbol) << ": "
                          << snapshot.rows.size() << " rows, " << days_to_expiry
                          << " days to expiry");

        auto contracts_result = build_contracts(snapshot.rows);
        if (contracts_result.is_error()) {
            return forward_error<RiskAnalysisResult>(*contracts_result.error(),
                                                     "AnalysisEngine");
        }
        std::vector<Contract> contracts = contracts_result.value();

        RiskAnalysisResult result;
        result.symbol = snapshot.symbol;
        result.expiry_date = snapshot.expiry_date;
        result.days_to_expiry = days_to_expiry;

        double last_trade = parse_last_trade_price(snapshot.last_trade);
        if (last_trade > 0.0) {
            result.spot = last_trade;
            result.spot_source = SpotSource::LAST_TRADE;
            INFO("Using last trade spot " << result.spot);
        } else {
            SpotEstimate estimate = estimate_spot_from_put_call_parity(contracts);
            result.spot = estimate.spot;
            result.parity_pair_count = estimate.pair_count;
            result.spot_source = estimate.pair_count > 0 ? SpotSource::PUT_CALL_PARITY
                                                         : SpotSource::MIDDLE_STRIKE;
            INFO("Estimated spot " << result.spot << " from put-call parity ("
                                   << estimate.pair_count << " pairs)");
        }

        const double T = days_to_expiry / DAYS_PER_YEAR;
        const double r = config_.risk_free_rate;
        const double q = config_.dividend_yield;

        IvSolveSummary summary = solve_contract_ivs(contracts, result.spot, T, r, q,
                                                    config_.solver, config_.liquidity);
        DEBUG("IV solve: calls " << summary.call_solved << "/" << summary.call_attempts
                                 << ", puts " << summary.put_solved << "/"
                                 << summary.put_attempts);

        std::vector<Contract> priced = select_priced_contracts(contracts, result.spot,
                                                               config_.liquidity);
        if (priced.empty()) {
            WARN("No contracts survived liquidity and IV filtering out of " << contracts.size());
            return make_error<RiskAnalysisResult>(ErrorCode::NO_VALID_OPTIONS_DATA,
                                                  "No valid options data found", "AnalysisEngine");
        }

        INFO("Filtering complete: " << contracts.size() << " contracts, " << priced.size()
                                    << " priced, strikes " << priced.front().strike << " - "
                                    << priced.back().strike << ", spot " << result.spot);

        ProbabilityEstimate estimate = calculate_probabilities(priced, result.spot, T, config_);
        result.probabilities = estimate.probabilities;
        result.iv_metrics = calculate_iv_metrics(priced, result.spot, days_to_expiry,
                                                 snapshot.expiry_date);
        result.expected_return_pct = calculate_expected_return(priced, result.spot,
                                                               days_to_expiry, config_);
        result.tail_risk = calculate_tail_risk(priced, result.spot,
                                               config_.min_options_for_tail_risk);
        result.skew = calculate_skew_metrics(priced, result.spot);
        result.put_call_ratio = calculate_put_call_ratio(priced);

        add_data_quality(result, priced, !estimate.sufficient_data);

        return result;

    } catch (const std::exception& e) {
        ERROR("Chain analysis failed: " << e.what());
        return make_error<RiskAnalysisResult>(ErrorCode::UNKNOWN_ERROR,
                                              std::string("Chain analysis failed: ") + e.what(),
                                              "AnalysisEngine");
    }
}

void AnalysisEngine::add_data_quality(RiskAnalysisResult& result,
                                      const std::vector<Contract>& contracts,
                                      bool probabilities_degraded) const {
    DataQuality& quality = result.data_quality;
    quality.options_analyzed = contracts.size();

    if (contracts.empty()) {
        return;
    }

    char range[96];
    std::snprintf(range, sizeof(range), "$%.2f - $%.2f", contracts.front().strike,
                  contracts.back().strike);
    quality.strike_range = range;

    double total_spread = 0.0;
    size_t count = 0;
    for (const auto& c : contracts) {
        if (c.call_ask > 0.0 && c.call_bid > 0.0) {
            total_spread += (c.call_ask - c.call_bid) / c.call_mid * 100.0;
            ++count;
        }
    }
    if (count > 0) {
        quality.avg_bid_ask_spread_pct = total_spread / static_cast<double>(count);
    }

    if (quality.options_analyzed < config_.limited_data_threshold) {
        quality.warnings.push_back("Limited options data available - results may be less reliable");
    }
    if (quality.avg_bid_ask_spread_pct > config_.wide_spread_threshold_pct) {
        quality.warnings.push_back("Wide bid-ask spreads detected - liquidity may be low");
    }
    if (probabilities_degraded) {
        quality.warnings.push_back("Insufficient options for probability calculation");
    }

    for (const auto& warning : quality.warnings) {
        WARN(warning);
    }
}

}  // namespace options
}  // namespace chain_risk
