#pragma once

#include <string>

namespace optval {

enum class OptionType {
    Call,
    Put
};

std::string toString(OptionType type);

struct Greeks {
    double delta;
    double gamma;
    double theta; // per calendar day
    double vega;  // per 1 vol point
    double rho;   // per 1 rate point

    Greeks() : delta(0), gamma(0), theta(0), vega(0), rho(0) {}
};

struct PricingResult {
    double price;
    Greeks greeks;

    PricingResult() : price(0) {}
};

class BlackScholes {
public:
    // Black-Scholes-Merton price and Greeks with continuous dividend yield.
    // At or past expiry (T <= 0) returns intrinsic value; delta is 0 or +/-1 and
    // every other Greek is 0.
    static PricingResult price(double S, double K, double T, double r, double sigma,
                               OptionType type, double q = 0.0);

    // Linear premium over historical volatility when no quoted IV is available
    static double impliedVolFromHistorical(double historical_vol, double multiplier = 1.2);

private:
    static PricingResult intrinsic(double S, double K, OptionType type);

    // Cumulative standard normal distribution
    static double N(double x);

    // Standard normal probability density function
    static double n(double x);

    // Calculate d1 and d2 parameters
    static double d1(double S, double K, double T, double r, double sigma, double q);
    static double d2(double S, double K, double T, double r, double sigma, double q);
};

} // namespace optval
