// include/chain_risk/options/risk_neutral_cdf.hpp
#pragma once

#include <vector>
#include "chain_risk/core/types.hpp"

namespace chain_risk {
namespace options {

/**
 * @brief Contract nearest spot that carries any implied volatility
 */
struct ATMOption {
    Price strike{0.0};
    double call_iv{0.0};
    double put_iv{0.0};
    double distance{0.0};
    bool has_call_iv{false};
    bool has_put_iv{false};

    bool found() const {
        return has_call_iv || has_put_iv;
    }
};

/**
 * @brief OTM wings used for skew: put nearest 0.9 * spot, call nearest 1.1 * spot
 */
struct OTMOptions {
    Price put_strike{0.0};
    double put_iv{0.0};
    Price call_strike{0.0};
    double call_iv{0.0};
    bool has_put{false};
    bool has_call{false};
};

/**
 * @brief Smile-aware CDF: P(S_T < K) = N(-d2) with each contract's own IV
 *
 * Uses put_iv at or below spot and call_iv above it; contracts whose
 * relevant IV is not positive are skipped. The result is not guaranteed to
 * be monotone since the smile varies the IV per strike.
 */
std::vector<CDFPoint> build_cdf_from_ivs(const std::vector<Contract>& contracts, double spot,
                                         double r, double q, double T);

/**
 * @brief Relevant-side IV of the contract closest to spot
 * @return fallback when no contract has a relevant-side IV
 */
double find_atm_iv(const std::vector<Contract>& contracts, double spot, double fallback);

/**
 * @brief Log-normal CDF with one volatility for every strike
 *
 * Non-decreasing in strike for ascending input. With T <= 0 or iv <= 0 the
 * distribution collapses onto spot and each point is 0 below spot and 1
 * above it.
 */
std::vector<CDFPoint> build_constant_iv_cdf(const std::vector<Contract>& contracts, double spot,
                                            double iv, double r, double q, double T);

/**
 * @brief Linear interpolation of a CDF sorted by strike
 *
 * Empty input gives 0.5. Below the first strike gives 0, above the last
 * gives 1; with a single point the strike itself also gives 1.
 */
double interpolate_cdf(const std::vector<CDFPoint>& points, double strike);

ATMOption find_atm_option(const std::vector<Contract>& contracts, double spot);

OTMOptions find_otm_options(const std::vector<Contract>& contracts, double spot);

}  // namespace options
}  // namespace chain_risk
