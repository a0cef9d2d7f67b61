#pragma once

#include "price_history.hpp"
#include <memory>
#include <string>
#include <vector>

namespace optval {

class VolatilityModel {
public:
    // Annotate bars with daily returns, rolling HV20/30/60 (annualized by sqrt(252))
    // and an implied-volatility estimate of HV30 * iv_multiplier
    static PriceHistory buildHistory(const std::string& symbol, const std::vector<PriceBar>& bars,
                                     double iv_multiplier = 1.2);

    // Rolling sample standard deviation over a trailing window, annualized.
    // Entries without a full window of finite values are NaN.
    static std::vector<double> rollingVolatility(const std::vector<double>& returns, size_t window,
                                                 double annualization = 252.0);
};

// Forecasts next-period volatility (per-period, not annualized) from a return sample
class VolatilityEstimator {
public:
    virtual ~VolatilityEstimator() = default;

    virtual double forecastVolatility(const std::vector<double>& returns) const = 0;
    virtual std::string name() const = 0;
};

// Population standard deviation of the sample
class ConstantVolatilityEstimator : public VolatilityEstimator {
public:
    double forecastVolatility(const std::vector<double>& returns) const override;
    std::string name() const override { return "constant"; }
};

struct GarchFit {
    double omega;
    double alpha;
    double beta;
    double log_likelihood;
    double last_variance;
    double last_residual;

    GarchFit() : omega(0), alpha(0), beta(0), log_likelihood(0), last_variance(0), last_residual(0) {}

    double persistence() const { return alpha + beta; }
};

// GARCH(1,1) with Gaussian innovations, fitted by variance-targeted maximum likelihood:
//   sigma2[t] = omega + alpha * eps[t-1]^2 + beta * sigma2[t-1]
//   omega     = s2 * (1 - alpha - beta)
class Garch11Estimator : public VolatilityEstimator {
public:
    // Throws NumericalFitError when the likelihood cannot be maximized
    GarchFit fit(const std::vector<double>& returns) const;

    // One-step-ahead volatility forecast
    double forecastVolatility(const std::vector<double>& returns) const override;
    std::string name() const override { return "garch11"; }

private:
    static double logLikelihood(const std::vector<double>& residuals, double sample_variance,
                                double alpha, double beta, double* last_variance);
};

} // namespace optval
