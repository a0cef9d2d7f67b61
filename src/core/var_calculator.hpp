#pragma once

#include "volatility_model.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace optval {

enum class VaRMethod {
    Historical,
    Parametric,
    MonteCarlo
};

std::string toString(VaRMethod method);

// Parse "historical", "parametric" or "monte_carlo"; throws ValidationError otherwise
VaRMethod varMethodFromString(const std::string& name);

// What calculateVaR does with fewer than the minimum number of returns
enum class InsufficientDataPolicy {
    ZeroResult, // log a warning and return an all-zero result
    Throw       // throw InsufficientDataError
};

struct VaRConfig {
    VaRMethod method;
    int horizon_days;
    int num_simulations;
    uint64_t seed;
    size_t garch_min_observations; // parametric σ uses GARCH(1,1) from this sample size
    InsufficientDataPolicy insufficient_data_policy;

    VaRConfig() : method(VaRMethod::Historical), horizon_days(1), num_simulations(10000), seed(42),
                  garch_min_observations(100),
                  insufficient_data_policy(InsufficientDataPolicy::ZeroResult) {}
};

// Dollar values are signed: a negative VaR is a loss
struct VaRResult {
    double var_95;
    double var_99;
    double cvar_95;
    double cvar_99;
    VaRMethod method;
    int horizon_days;
    double portfolio_value;
    std::map<double, double> confidence_levels; // confidence -> VaR in dollars
    std::string volatility_model;               // estimator used by the parametric method

    VaRResult() : var_95(0), var_99(0), cvar_95(0), cvar_99(0), method(VaRMethod::Historical),
                  horizon_days(1), portfolio_value(0) {}

    // 95% VaR as a positive loss percentage of the portfolio value
    double var95LossPct() const { return portfolio_value > 0 ? -var_95 / portfolio_value * 100.0 : 0.0; }
    double var99LossPct() const { return portfolio_value > 0 ? -var_99 / portfolio_value * 100.0 : 0.0; }
};

class VaRCalculator {
public:
    static constexpr size_t kMinObservations = 20;

    explicit VaRCalculator(VaRConfig config = VaRConfig());

    VaRResult calculateVaR(const std::vector<double>& returns, double portfolio_value,
                           const std::vector<double>& confidence_levels = {0.95, 0.99}) const;

    // Replace the estimators used by the parametric method
    void setVolatilityEstimators(std::shared_ptr<VolatilityEstimator> garch,
                                 std::shared_ptr<VolatilityEstimator> fallback);

    const VaRConfig& config() const { return config_; }

private:
    struct TailEstimate {
        double var;
        double cvar;
    };

    std::map<double, TailEstimate> historicalVaR(const std::vector<double>& returns,
                                                 const std::vector<double>& levels) const;
    std::map<double, TailEstimate> parametricVaR(const std::vector<double>& returns,
                                                 const std::vector<double>& levels,
                                                 std::string* model_used) const;
    std::map<double, TailEstimate> monteCarloVaR(const std::vector<double>& returns,
                                                 const std::vector<double>& levels) const;

    // GARCH when the sample is large enough, constant otherwise; falls back on a failed fit
    double forecastSigma(const std::vector<double>& returns, std::string* model_used) const;

    VaRResult emptyResult(double portfolio_value) const;

    VaRConfig config_;
    std::shared_ptr<VolatilityEstimator> garch_;
    std::shared_ptr<VolatilityEstimator> constant_;
};

} // namespace optval
