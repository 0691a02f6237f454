// src/options/risk_neutral_cdf.cpp

#include "chain_risk/options/risk_neutral_cdf.hpp"
#include <cmath>
#include <limits>
#include "chain_risk/options/black_scholes.hpp"

namespace chain_risk {
namespace options {

namespace {

// P(S_T < K) under the Black-Scholes measure
double probability_below(double spot, double strike, double r, double q, double T, double iv) {
    if (T <= 0.0 || iv <= 0.0) {
        return strike > spot ? 1.0 : 0.0;
    }
    return norm_cdf(-bs_d2(spot, strike, T, r, q, iv));
}

}  // anonymous namespace

std::vector<CDFPoint> build_cdf_from_ivs(const std::vector<Contract>& contracts, double spot,
                                         double r, double q, double T) {
    std::vector<CDFPoint> points;
    points.reserve(contracts.size());

    for (const auto& c : contracts) {
        double iv = c.strike <= spot ? c.put_iv : c.call_iv;
        if (iv <= 0.0) {
            continue;
        }
        points.push_back({c.strike, probability_below(spot, c.strike, r, q, T, iv)});
    }
    return points;
}

double find_atm_iv(const std::vector<Contract>& contracts, double spot, double fallback) {
    double atm_iv = fallback;
    double min_diff = std::numeric_limits<double>::max();

    for (const auto& c : contracts) {
        double diff = std::abs(c.strike - spot);
        if (diff >= min_diff) {
            continue;
        }

        double candidate = 0.0;
        if (c.strike <= spot && c.put_iv > 0.0) {
            candidate = c.put_iv;
        } else if (c.strike > spot && c.call_iv > 0.0) {
            candidate = c.call_iv;
        }

        if (candidate > 0.0) {
            atm_iv = candidate;
            min_diff = diff;
        }
    }
    return atm_iv;
}

std::vector<CDFPoint> build_constant_iv_cdf(const std::vector<Contract>& contracts, double spot,
                                            double iv, double r, double q, double T) {
    std::vector<CDFPoint> points;
    points.reserve(contracts.size());

    for (const auto& c : contracts) {
        points.push_back({c.strike, probability_below(spot, c.strike, r, q, T, iv)});
    }
    return points;
}

double interpolate_cdf(const std::vector<CDFPoint>& points, double strike) {
    if (points.empty()) {
        return 0.5;
    }
    if (strike < points.front().strike) {
        return 0.0;
    }
    if (strike > points.back().strike) {
        return 1.0;
    }

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const CDFPoint& lo = points[i];
        const CDFPoint& hi = points[i + 1];
        if (strike >= lo.strike && strike <= hi.strike) {
            double width = hi.strike - lo.strike;
            if (width <= 0.0) {
                return lo.cdf;
            }
            double fraction = (strike - lo.strike) / width;
            return lo.cdf + fraction * (hi.cdf - lo.cdf);
        }
    }

    return 1.0;
}

ATMOption find_atm_option(const std::vector<Contract>& contracts, double spot) {
    ATMOption atm;
    double min_dist = std::numeric_limits<double>::max();

    for (const auto& c : contracts) {
        double dist = std::abs(c.strike - spot);
        if (dist >= min_dist) {
            continue;
        }

        bool has_call_iv = c.call_iv > 0.0;
        bool has_put_iv = c.put_iv > 0.0;
        if (has_call_iv || has_put_iv) {
            atm.strike = c.strike;
            atm.call_iv = c.call_iv;
            atm.put_iv = c.put_iv;
            atm.distance = dist;
            atm.has_call_iv = has_call_iv;
            atm.has_put_iv = has_put_iv;
            min_dist = dist;
        }
    }
    return atm;
}

OTMOptions find_otm_options(const std::vector<Contract>& contracts, double spot) {
    const double put_target = spot * 0.90;
    const double call_target = spot * 1.10;
    double min_put_dist = std::numeric_limits<double>::max();
    double min_call_dist = std::numeric_limits<double>::max();
    OTMOptions otm;

    for (const auto& c : contracts) {
        if (c.strike < spot && c.put_iv > 0.0) {
            double dist = std::abs(c.strike - put_target);
            if (dist < min_put_dist) {
                otm.put_strike = c.strike;
                otm.put_iv = c.put_iv;
                otm.has_put = true;
                min_put_dist = dist;
            }
        }

        if (c.strike > spot && c.call_iv > 0.0) {
            double dist = std::abs(c.strike - call_target);
            if (dist < min_call_dist) {
                otm.call_strike = c.strike;
                otm.call_iv = c.call_iv;
                otm.has_call = true;
                min_call_dist = dist;
            }
        }
    }
    return otm;
}

}  // namespace options
}  // namespace chain_risk
