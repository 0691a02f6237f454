// src/options/chain_filter.cpp

#include "chain_risk/options/chain_filter.hpp"
#include <algorithm>
#include "chain_risk/core/logger.hpp"
#include "chain_risk/options/quote_sanitizer.hpp"

namespace chain_risk {
namespace options {

Result<std::vector<Contract>> build_contracts(const std::vector<RawQuoteRow>& rows) {
    std::vector<Contract> contracts;
    contracts.reserve(rows.size());
    size_t missing_strike = 0;
    size_t unquoted = 0;

    for (const auto& row : rows) {
        if (row.strike.empty() || row.strike == "null") {
            ++missing_strike;
            continue;
        }

        Contract contract;
        contract.strike = parse_numeric(row.strike);
        if (contract.strike <= 0.0) {
            ++missing_strike;
            continue;
        }

        contract.call_bid = parse_numeric(row.call_bid);
        contract.call_ask = parse_numeric(row.call_ask);
        contract.put_bid = parse_numeric(row.put_bid);
        contract.put_ask = parse_numeric(row.put_ask);

        if (contract.call_bid == 0.0 && contract.call_ask == 0.0 && contract.put_bid == 0.0 &&
            contract.put_ask == 0.0) {
            ++unquoted;
            continue;
        }

        // One-legged quotes still produce a non-zero mid
        contract.call_mid = (contract.call_bid + contract.call_ask) / 2.0;
        contract.put_mid = (contract.put_bid + contract.put_ask) / 2.0;

        contract.call_volume = parse_numeric(row.call_volume);
        contract.put_volume = parse_numeric(row.put_volume);
        contract.call_open_interest = parse_numeric(row.call_open_interest);
        contract.put_open_interest = parse_numeric(row.put_open_interest);

        contracts.push_back(contract);
    }

    if (contracts.empty()) {
        WARN("No usable contracts in " << rows.size() << " rows (" << missing_strike
                                       << " without strike, " << unquoted << " unquoted)");
        return make_error<std::vector<Contract>>(ErrorCode::NO_VALID_OPTIONS_DATA,
                                                 "No valid options data found", "ChainFilter");
    }

    std::stable_sort(contracts.begin(), contracts.end(),
                     [](const Contract& a, const Contract& b) { return a.strike < b.strike; });

    auto last = std::unique(contracts.begin(), contracts.end(),
                            [](const Contract& a, const Contract& b) { return a.strike == b.strike; });
    size_t duplicates = static_cast<size_t>(std::distance(last, contracts.end()));
    contracts.erase(last, contracts.end());

    DEBUG("Built " << contracts.size() << " contracts from " << rows.size() << " rows ("
                   << missing_strike << " without strike, " << unquoted << " unquoted, "
                   << duplicates << " duplicate strikes)");

    return contracts;
}

double bid_ask_spread_ratio(double bid, double ask, double mid) {
    if (mid <= 0.0) {
        return 0.0;
    }
    return (ask - bid) / mid;
}

bool is_side_liquid(double bid, double ask, double mid, double min_price,
                    double max_spread_ratio) {
    return mid >= min_price && bid_ask_spread_ratio(bid, ask, mid) <= max_spread_ratio;
}

OptionSide relevant_side(const Contract& contract, double spot) {
    return contract.strike <= spot ? OptionSide::PUT : OptionSide::CALL;
}

bool is_liquid(const Contract& contract, double spot, double min_price, double max_spread_ratio) {
    if (relevant_side(contract, spot) == OptionSide::PUT) {
        return is_side_liquid(contract.put_bid, contract.put_ask, contract.put_mid, min_price,
                              max_spread_ratio);
    }
    return is_side_liquid(contract.call_bid, contract.call_ask, contract.call_mid, min_price,
                          max_spread_ratio);
}

}  // namespace options
}  // namespace chain_risk
