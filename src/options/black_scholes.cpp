// src/options/black_scholes.cpp

#include "chain_risk/options/black_scholes.hpp"
#include <algorithm>
#include <cmath>

namespace chain_risk {
namespace options {

namespace {
constexpr double SQRT_2PI = 2.506628274631000502415765284811045253006;
constexpr double SQRT_2 = 1.414213562373095048801688724209698078570;
}  // anonymous namespace

double norm_cdf(double x) {
    return 0.5 * (1.0 + std::erf(x / SQRT_2));
}

double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

double bs_d1(double S, double K, double T, double r, double q, double sigma) {
    return (std::log(S / K) + (r - q + 0.5 * sigma * sigma) * T) / (sigma * std::sqrt(T));
}

double bs_d2(double S, double K, double T, double r, double q, double sigma) {
    return bs_d1(S, K, T, r, q, sigma) - sigma * std::sqrt(T);
}

double black_scholes_call(double S, double K, double T, double r, double q, double sigma) {
    if (sigma <= 0.0 || T <= 0.0) {
        return std::max(S - K, 0.0);
    }

    double d1 = bs_d1(S, K, T, r, q, sigma);
    double d2 = d1 - sigma * std::sqrt(T);
    return S * std::exp(-q * T) * norm_cdf(d1) - K * std::exp(-r * T) * norm_cdf(d2);
}

double black_scholes_put(double S, double K, double T, double r, double q, double sigma) {
    if (sigma <= 0.0 || T <= 0.0) {
        return std::max(K - S, 0.0);
    }

    double d1 = bs_d1(S, K, T, r, q, sigma);
    double d2 = d1 - sigma * std::sqrt(T);
    return K * std::exp(-r * T) * norm_cdf(-d2) - S * std::exp(-q * T) * norm_cdf(-d1);
}

double black_scholes_vega(double S, double K, double T, double r, double q, double sigma) {
    if (sigma <= 0.0 || T <= 0.0) {
        return 0.0;
    }

    double d1 = bs_d1(S, K, T, r, q, sigma);
    return S * std::exp(-q * T) * norm_pdf(d1) * std::sqrt(T);
}

}  // namespace options
}  // namespace chain_risk
