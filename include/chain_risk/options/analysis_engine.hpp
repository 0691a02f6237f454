// include/chain_risk/options/analysis_engine.hpp
#pragma once

#include <vector>
#include "chain_risk/core/error.hpp"
#include "chain_risk/core/types.hpp"
#include "chain_risk/options/analysis_config.hpp"
#include "chain_risk/options/analysis_result.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Runs the full chain analysis pipeline on one snapshot
 *
 * Stateless apart from its configuration: every call to analyze() starts
 * from the raw rows and returns a fresh result.
 */
class AnalysisEngine {
public:
    explicit AnalysisEngine(AnalysisConfig config = AnalysisConfig());

    /**
     * @brief Analyze a chain snapshot
     *
     * Steps: build contracts, choose spot (last trade, else put-call parity),
     * solve liquidity-gated IVs, keep priced contracts, then compute
     * probabilities, IV metrics, expected return, tail risk, skew, put/call
     * ratio and data-quality diagnostics.
     *
     * @param snapshot Chain for a single expiry
     * @param days_to_expiry Whole days until expiry, must not be negative
     * @return Result, or NO_VALID_OPTIONS_DATA when no contract survives
     *         sanitizing or IV gating, INVALID_ARGUMENT for bad inputs
     */
    Result<RiskAnalysisResult> analyze(const ChainSnapshot& snapshot, int days_to_expiry) const;

    const AnalysisConfig& config() const {
        return config_;
    }

private:
    void add_data_quality(RiskAnalysisResult& result, const std::vector<Contract>& contracts,
                          bool probabilities_degraded) const;

    AnalysisConfig config_;
};

}  // namespace options
}  // namespace chain_risk
