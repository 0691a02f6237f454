// include/chain_risk/options/black_scholes.hpp
#pragma once

namespace chain_risk {
namespace options {

/**
 * @brief Standard normal cumulative distribution function
 */
double norm_cdf(double x);

/**
 * @brief Standard normal probability density function
 */
double norm_pdf(double x);

/**
 * @brief Black-Scholes d1 with continuous dividend yield
 * @param S Spot price
 * @param K Strike
 * @param T Time to expiry in years, must be > 0
 * @param r Risk-free rate
 * @param q Dividend yield
 * @param sigma Volatility, must be > 0
 */
double bs_d1(double S, double K, double T, double r, double q, double sigma);

/**
 * @brief d1 - sigma * sqrt(T)
 */
double bs_d2(double S, double K, double T, double r, double q, double sigma);

/**
 * @brief European call value; intrinsic max(S - K, 0) when sigma <= 0 or T <= 0
 */
double black_scholes_call(double S, double K, double T, double r, double q, double sigma);

/**
 * @brief European put value; intrinsic max(K - S, 0) when sigma <= 0 or T <= 0
 */
double black_scholes_put(double S, double K, double T, double r, double q, double sigma);

/**
 * @brief dPrice/dSigma, identical for calls and puts
 *
 * Raw vega (per unit of volatility), 0 when sigma <= 0 or T <= 0.
 */
double black_scholes_vega(double S, double K, double T, double r, double q, double sigma);

}  // namespace options
}  // namespace chain_risk
