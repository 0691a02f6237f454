// src/options/spot_estimator.cpp

#include "chain_risk/options/spot_estimator.hpp"
#include <algorithm>

namespace chain_risk {
namespace options {

std::string spot_source_to_string(SpotSource source) {
    switch (source) {
        case SpotSource::LAST_TRADE:
            return "last_trade";
        case SpotSource::PUT_CALL_PARITY:
            return "put_call_parity";
        case SpotSource::MIDDLE_STRIKE:
            return "middle_strike";
        default:
            return "unknown";
    }
}

SpotEstimate estimate_spot_from_put_call_parity(const std::vector<Contract>& contracts) {
    std::vector<double> estimates;
    estimates.reserve(contracts.size());

    for (const auto& contract : contracts) {
        if (contract.call_mid > 0.0 && contract.put_mid > 0.0) {
            double implied = contract.strike + contract.call_mid - contract.put_mid;
            if (implied > 0.0) {
                estimates.push_back(implied);
            }
        }
    }

    SpotEstimate estimate;
    if (estimates.empty()) {
        if (!contracts.empty()) {
            estimate.spot = contracts[contracts.size() / 2].strike;
        }
        return estimate;
    }

    std::sort(estimates.begin(), estimates.end());
    estimate.spot = median_by_index(estimates);
    estimate.pair_count = estimates.size();
    return estimate;
}

double median_by_index(const std::vector<double>& sorted) {
    if (sorted.empty()) {
        return 0.0;
    }
    return sorted[sorted.size() / 2];
}

double clamp(double value, double lo, double hi) {
    if (value < lo) {
        return lo;
    }
    if (value > hi) {
        return hi;
    }
    return value;
}

}  // namespace options
}  // namespace chain_risk
