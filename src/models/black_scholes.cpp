#include "black_scholes.hpp"
#include "../core/errors.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>

namespace optval {

std::string toString(OptionType type) {
    return type == OptionType::Call ? "call" : "put";
}

PricingResult BlackScholes::price(double S, double K, double T, double r, double sigma,
                                  OptionType type, double q) {
    if (T <= 0) {
        return intrinsic(S, K, type);
    }
    if (S <= 0 || K <= 0 || sigma <= 0) {
        throw ValidationError("Spot, strike and volatility must be positive");
    }

    double d1_val = d1(S, K, T, r, sigma, q);
    double d2_val = d2(S, K, T, r, sigma, q);
    double sqrt_t = std::sqrt(T);
    double disc_q = std::exp(-q * T);
    double disc_r = std::exp(-r * T);

    PricingResult result;
    Greeks& g = result.greeks;

    g.gamma = disc_q * n(d1_val) / (S * sigma * sqrt_t);
    g.vega = S * disc_q * n(d1_val) * sqrt_t / 100.0; // Per 1% change in volatility

    double theta_common = -(S * n(d1_val) * sigma * disc_q) / (2.0 * sqrt_t);

    if (type == OptionType::Call) {
        result.price = S * disc_q * N(d1_val) - K * disc_r * N(d2_val);
        g.delta = disc_q * N(d1_val);
        g.theta = (theta_common - r * K * disc_r * N(d2_val) + q * S * disc_q * N(d1_val)) / 365.0;
        g.rho = K * T * disc_r * N(d2_val) / 100.0;
    } else {
        result.price = K * disc_r * N(-d2_val) - S * disc_q * N(-d1_val);
        g.delta = -disc_q * N(-d1_val);
        g.theta = (theta_common + r * K * disc_r * N(-d2_val) - q * S * disc_q * N(-d1_val)) / 365.0;
        g.rho = -K * T * disc_r * N(-d2_val) / 100.0;
    }

    return result;
}

double BlackScholes::impliedVolFromHistorical(double historical_vol, double multiplier) {
    return historical_vol * multiplier;
}

PricingResult BlackScholes::intrinsic(double S, double K, OptionType type) {
    PricingResult result;
    if (type == OptionType::Call) {
        result.price = std::max(0.0, S - K);
        result.greeks.delta = S > K ? 1.0 : 0.0;
    } else {
        result.price = std::max(0.0, K - S);
        result.greeks.delta = S < K ? -1.0 : 0.0;
    }
    return result;
}

double BlackScholes::N(double x) {
    return Statistics::normalCdf(x);
}

double BlackScholes::n(double x) {
    return Statistics::normalPdf(x);
}

double BlackScholes::d1(double S, double K, double T, double r, double sigma, double q) {
    return (std::log(S / K) + (r - q + 0.5 * sigma * sigma) * T) / (sigma * std::sqrt(T));
}

double BlackScholes::d2(double S, double K, double T, double r, double sigma, double q) {
    return d1(S, K, T, r, sigma, q) - sigma * std::sqrt(T);
}

} // namespace optval
