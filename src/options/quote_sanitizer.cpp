// src/options/quote_sanitizer.cpp

#include "chain_risk/options/quote_sanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace chain_risk {
namespace options {

namespace {

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // anonymous namespace

double parse_numeric(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != '$' && c != '%') {
            cleaned.push_back(c);
        }
    }
    cleaned = trim(cleaned);

    if (cleaned.empty() || cleaned == "--" || cleaned == "N/A") {
        return 0.0;
    }

    const char* begin = cleaned.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value)) {
        return 0.0;
    }
    return value;
}

double parse_last_trade_price(const std::string& last_trade) {
    auto dollar = last_trade.find('$');
    if (dollar == std::string::npos) {
        return 0.0;
    }

    std::string price = last_trade.substr(dollar + 1);
    auto stop = price.find_first_of(" (");
    if (stop != std::string::npos) {
        price.resize(stop);
    }
    return parse_numeric(price);
}

}  // namespace options
}  // namespace chain_risk
