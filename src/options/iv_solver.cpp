// src/options/iv_solver.cpp

#include "chain_risk/options/iv_solver.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include "chain_risk/options/black_scholes.hpp"
#include "chain_risk/options/chain_filter.hpp"

namespace chain_risk {
namespace options {

namespace {

using PriceFunction = double (*)(double, double, double, double, double, double);

// Shared Newton-Raphson loop. ceiling_value is returned when an iterate
// reaches max_volatility.
double newton_solve(PriceFunction pricer, double price, double S, double K, double T, double r,
                    double q, double sigma, double ceiling_value, const IvSolverConfig& config) {
    for (int i = 0; i < config.max_iterations; ++i) {
        double diff = pricer(S, K, T, r, q, sigma) - price;

        if (std::abs(diff) < config.tolerance) {
            if (sigma > config.max_volatility || sigma < config.min_volatility) {
                return 0.0;
            }
            return sigma;
        }

        double vega = black_scholes_vega(S, K, T, r, q, sigma);
        if (vega < config.min_vega) {
            break;
        }

        sigma -= diff / vega;

        if (sigma <= config.min_volatility) {
            sigma = config.min_volatility;
        }
        if (sigma >= config.max_volatility) {
            return ceiling_value;
        }
    }

    return 0.0;
}

void solve_range(std::vector<Contract>::iterator begin, std::vector<Contract>::iterator end,
                 double spot, double T, double r, double q, const IvSolverConfig& solver,
                 const LiquidityConfig& liquidity, IvSolveSummary& summary) {
    for (auto it = begin; it != end; ++it) {
        Contract& c = *it;
        c.call_iv = 0.0;
        c.put_iv = 0.0;

        if (is_side_liquid(c.call_bid, c.call_ask, c.call_mid, liquidity.min_mid_price,
                           liquidity.max_spread_ratio)) {
            ++summary.call_attempts;
            c.call_iv = implied_volatility_call(c.call_mid, spot, c.strike, T, r, q, solver);
            if (c.call_iv > 0.0)
                ++summary.call_solved;
        }

        if (is_side_liquid(c.put_bid, c.put_ask, c.put_mid, liquidity.min_mid_price,
                           liquidity.max_spread_ratio)) {
            ++summary.put_attempts;
            c.put_iv = implied_volatility_put(c.put_mid, spot, c.strike, T, r, q, solver);
            if (c.put_iv > 0.0)
                ++summary.put_solved;
        }
    }
}

}  // anonymous namespace

double implied_volatility_call(double price, double S, double K, double T, double r, double q,
                               const IvSolverConfig& config) {
    if (price <= 0.0 || T <= 0.0) {
        return 0.0;
    }

    double moneyness = S / K;
    if (moneyness > config.call_deep_itm_moneyness) {
        // Almost no time value left to invert
        return config.call_deep_itm_volatility;
    }

    double sigma;
    if (moneyness > 1.1) {
        sigma = config.call_guess_itm;
    } else if (moneyness < 0.9) {
        sigma = config.call_guess_otm;
    } else {
        sigma = config.call_guess_atm;
    }

    return newton_solve(&black_scholes_call, price, S, K, T, r, q, sigma,
                        config.call_deep_itm_volatility, config);
}

double implied_volatility_put(double price, double S, double K, double T, double r, double q,
                              const IvSolverConfig& config) {
    if (price <= 0.0 || T <= 0.0) {
        return 0.0;
    }

    double moneyness = S / K;
    if (moneyness < config.put_deep_itm_moneyness) {
        return config.put_deep_itm_volatility;
    }

    double sigma;
    if (moneyness < 0.9) {
        sigma = config.put_guess_itm;
    } else if (moneyness > 1.1) {
        sigma = config.put_guess_otm;
    } else {
        sigma = config.put_guess_atm;
    }

    return newton_solve(&black_scholes_put, price, S, K, T, r, q, sigma,
                        config.put_deep_itm_volatility, config);
}

IvSolveSummary solve_contract_ivs(std::vector<Contract>& contracts, double spot, double T, double r,
                                  double q, const IvSolverConfig& solver,
                                  const LiquidityConfig& liquidity) {
    IvSolveSummary summary;

    if (!solver.parallel || solver.parallel_chunk_size == 0 ||
        contracts.size() <= solver.parallel_chunk_size) {
        solve_range(contracts.begin(), contracts.end(), spot, T, r, q, solver, liquidity, summary);
        return summary;
    }

    size_t chunk_count = (contracts.size() + solver.parallel_chunk_size - 1) /
                         solver.parallel_chunk_size;
    std::vector<IvSolveSummary> partials(chunk_count);
    std::vector<std::future<void>> tasks;
    tasks.reserve(chunk_count);

    for (size_t chunk = 0; chunk < chunk_count; ++chunk) {
        size_t first = chunk * solver.parallel_chunk_size;
        size_t last = std::min(first + solver.parallel_chunk_size, contracts.size());
        auto begin = contracts.begin() + static_cast<std::ptrdiff_t>(first);
        auto end = contracts.begin() + static_cast<std::ptrdiff_t>(last);
        IvSolveSummary& partial = partials[chunk];

        tasks.push_back(std::async(std::launch::async, [=, &solver, &liquidity, &partial]() {
            solve_range(begin, end, spot, T, r, q, solver, liquidity, partial);
        }));
    }

    for (auto& task : tasks) {
        task.get();
    }

    for (const auto& partial : partials) {
        summary.call_attempts += partial.call_attempts;
        summary.call_solved += partial.call_solved;
        summary.put_attempts += partial.put_attempts;
        summary.put_solved += partial.put_solved;
    }
    return summary;
}

std::vector<Contract> select_priced_contracts(const std::vector<Contract>& contracts, double spot,
                                              const LiquidityConfig& liquidity) {
    std::vector<Contract> priced;
    priced.reserve(contracts.size());

    for (const auto& c : contracts) {
        if (!is_liquid(c, spot, liquidity)) {
            continue;
        }
        double relevant_iv = relevant_side(c, spot) == OptionSide::PUT ? c.put_iv : c.call_iv;
        if (relevant_iv > 0.0) {
            priced.push_back(c);
        }
    }
    return priced;
}

}  // namespace options
}  // namespace chain_risk
