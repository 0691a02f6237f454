// include/chain_risk/options/spot_estimator.hpp
#pragma once

#include <string>
#include <vector>
#include "chain_risk/core/types.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Where the analysis spot price came from
 */
enum class SpotSource {
    LAST_TRADE,
    PUT_CALL_PARITY,
    MIDDLE_STRIKE
};

std::string spot_source_to_string(SpotSource source);

/**
 * @brief Spot estimate together with the number of parity pairs behind it
 */
struct SpotEstimate {
    double spot{0.0};
    size_t pair_count{0};
};

/**
 * @brief Estimate spot from S ~= K + C - P across strikes
 *
 * Uses every contract with call_mid > 0 and put_mid > 0 whose implied spot is
 * positive and takes median_by_index of the sorted estimates. Without any
 * pair, falls back to the strike of contracts[size / 2] with pair_count 0.
 *
 * @param contracts Contracts sorted ascending by strike
 * @return {0, 0} for an empty input
 */
SpotEstimate estimate_spot_from_put_call_parity(const std::vector<Contract>& contracts);

/**
 * @brief Element at index size / 2 of a sorted vector
 *
 * For even sizes this is the upper of the two middle elements, not their
 * average. Returns 0 for an empty vector.
 */
double median_by_index(const std::vector<double>& sorted);

/**
 * @brief Restrict value to [lo, hi]
 */
double clamp(double value, double lo, double hi);

}  // namespace options
}  // namespace chain_risk
