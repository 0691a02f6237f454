// include/chain_risk/options/quote_sanitizer.hpp
#pragma once

#include <string>

namespace chain_risk {
namespace options {

/**
 * @brief Parse an exchange quote field into a number
 *
 * Removes every '$' and '%', trims whitespace, and reads the leading
 * floating-point token; anything after the token is ignored. Empty, "--",
 * "N/A" and unparsable or non-finite input all yield 0.
 *
 * Examples: "$12.50" -> 12.5, "1.5%" -> 1.5, "N/A" -> 0
 */
double parse_numeric(const std::string& text);

/**
 * @brief Extract the price from an exchange "last trade" banner
 *
 * Takes the text after the first '$' up to the first space or '(' and parses
 * it with parse_numeric. Returns 0 if there is no '$'.
 *
 * "LAST TRADE: $663.32 (AS OF OCT 16, 2025 1:39 PM ET)" -> 663.32
 */
double parse_last_trade_price(const std::string& last_trade);

}  // namespace options
}  // namespace chain_risk
