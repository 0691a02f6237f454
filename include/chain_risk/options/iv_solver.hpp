// include/chain_risk/options/iv_solver.hpp
#pragma once

#include <vector>
#include "chain_risk/core/types.hpp"
#include "chain_risk/options/analysis_config.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Implied volatility of a call by safeguarded Newton-Raphson
 *
 * Returns 0 when the price or T is not positive, when vega collapses, when
 * the iteration budget runs out, or when a converged value falls outside
 * [min_volatility, max_volatility]. Calls deeper in the money than
 * call_deep_itm_moneyness (S/K) return call_deep_itm_volatility without
 * iterating; an iterate reaching max_volatility returns the same default.
 */
double implied_volatility_call(double price, double S, double K, double T, double r, double q,
                               const IvSolverConfig& config = IvSolverConfig());

/**
 * @brief Implied volatility of a put; mirror image of implied_volatility_call
 *
 * Deep-ITM test is S/K < put_deep_itm_moneyness and the default is
 * put_deep_itm_volatility.
 */
double implied_volatility_put(double price, double S, double K, double T, double r, double q,
                              const IvSolverConfig& config = IvSolverConfig());

/**
 * @brief Counters from one solve_contract_ivs pass
 */
struct IvSolveSummary {
    size_t call_attempts{0};
    size_t call_solved{0};
    size_t put_attempts{0};
    size_t put_solved{0};
};

/**
 * @brief Fill call_iv/put_iv for every contract in place
 *
 * A side is solved only when is_side_liquid holds for it; otherwise its IV
 * is reset to 0. With config.parallel the contracts are split into
 * contiguous chunks solved on separate tasks; each task only touches its
 * own chunk, so the result equals the sequential pass.
 */
IvSolveSummary solve_contract_ivs(std::vector<Contract>& contracts, double spot, double T, double r,
                                  double q, const IvSolverConfig& solver,
                                  const LiquidityConfig& liquidity);

/**
 * @brief Contracts whose relevant side is liquid and has a positive IV
 *
 * Order is preserved, so the output stays sorted by strike.
 */
std::vector<Contract> select_priced_contracts(const std::vector<Contract>& contracts, double spot,
                                              const LiquidityConfig& liquidity);

}  // namespace options
}  // namespace chain_risk
