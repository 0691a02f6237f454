// include/chain_risk/options/chain_filter.hpp
#pragma once

#include <vector>
#include "chain_risk/core/error.hpp"
#include "chain_risk/core/types.hpp"
#include "chain_risk/options/analysis_config.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Convert raw exchange rows into sorted, strike-unique contracts
 *
 * A row is dropped when its strike is empty, "null" or parses to 0, or when
 * call bid, call ask, put bid and put ask all parse to 0. When two rows share
 * a strike the first one received is kept.
 *
 * @param rows Rows in exchange order
 * @return Contracts sorted ascending by strike, or NO_VALID_OPTIONS_DATA
 *         when nothing survives
 */
Result<std::vector<Contract>> build_contracts(const std::vector<RawQuoteRow>& rows);

/**
 * @brief Bid-ask spread as a fraction of mid; 0 when mid <= 0
 */
double bid_ask_spread_ratio(double bid, double ask, double mid);

/**
 * @brief Liquidity test for one explicit side of a contract
 * @return true iff mid >= min_price and spread ratio <= max_spread_ratio
 */
bool is_side_liquid(double bid, double ask, double mid, double min_price,
                    double max_spread_ratio);

/**
 * @brief Which side represents a strike: puts at or below spot, calls above
 */
OptionSide relevant_side(const Contract& contract, double spot);

/**
 * @brief Liquidity test on the contract's relevant side
 */
bool is_liquid(const Contract& contract, double spot, double min_price, double max_spread_ratio);

inline bool is_liquid(const Contract& contract, double spot, const LiquidityConfig& config) {
    return is_liquid(contract, spot, config.min_mid_price, config.max_spread_ratio);
}

}  // namespace options
}  // namespace chain_risk
