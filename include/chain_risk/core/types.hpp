// include/chain_risk/core/types.hpp

#pragma once

#include <string>
#include <vector>

namespace chain_risk {

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Option side enumeration
 */
enum class OptionSide {
    CALL,
    PUT
};

/**
 * @brief One strike's quote data exactly as received from the exchange
 *
 * All numeric fields are text and may be empty, "--", "N/A" or carry
 * "$"/"%" decoration.
 */
struct RawQuoteRow {
    std::string strike;

    std::string call_last;
    std::string call_bid;
    std::string call_ask;
    std::string call_volume;
    std::string call_open_interest;

    std::string put_last;
    std::string put_bid;
    std::string put_ask;
    std::string put_volume;
    std::string put_open_interest;

    std::string expiry_group;  // Exchange grouping header, informational
    std::string expiry_date;   // Informational
};

/**
 * @brief Parsed option chain for a single expiry
 */
struct ChainSnapshot {
    std::string symbol;
    std::string expiry_date;  // "YYYY-MM-DD" when known
    std::string last_trade;   // Free text, e.g. "LAST TRADE: $663.32 (AS OF ...)"
    std::vector<RawQuoteRow> rows;
};

/**
 * @brief Canonical per-strike call/put pair
 *
 * Mids are (bid + ask) / 2 even when one leg is zero. An IV of 0 means the
 * volatility was not computed or was rejected by the solver.
 */
struct Contract {
    Price strike{0.0};

    Price call_bid{0.0};
    Price call_ask{0.0};
    Price call_mid{0.0};
    Price put_bid{0.0};
    Price put_ask{0.0};
    Price put_mid{0.0};

    double call_volume{0.0};
    double put_volume{0.0};
    double call_open_interest{0.0};
    double put_open_interest{0.0};

    double call_iv{0.0};
    double put_iv{0.0};
};

/**
 * @brief Point on a risk-neutral CDF: P(S_T < strike)
 */
struct CDFPoint {
    Price strike{0.0};
    double cdf{0.0};
};

}  // namespace chain_risk
