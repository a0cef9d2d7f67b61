#include "var_calculator.hpp"
#include "errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/random_source.hpp"
#include "../utils/statistics.hpp"
#include <cmath>

namespace optval {

namespace {

const char* kSource = "VaRCalculator";

} // namespace

std::string toString(VaRMethod method) {
    switch (method) {
        case VaRMethod::Historical: return "historical";
        case VaRMethod::Parametric: return "parametric";
        case VaRMethod::MonteCarlo: return "monte_carlo";
    }
    return "unknown";
}

VaRMethod varMethodFromString(const std::string& name) {
    if (name == "historical") return VaRMethod::Historical;
    if (name == "parametric") return VaRMethod::Parametric;
    if (name == "monte_carlo") return VaRMethod::MonteCarlo;
    throw ValidationError("Unknown VaR method: " + name);
}

VaRCalculator::VaRCalculator(VaRConfig config)
    : config_(config),
      garch_(std::make_shared<Garch11Estimator>()),
      constant_(std::make_shared<ConstantVolatilityEstimator>()) {
    if (config_.horizon_days < 1) {
        throw ValidationError("VaR horizon must be at least one day");
    }
    if (config_.num_simulations < 1) {
        throw ValidationError("VaR Monte Carlo needs at least one simulation");
    }

    Logger::instance().debug(kSource, "Initialized: method=" + toString(config_.method) +
                                      ", horizon=" + std::to_string(config_.horizon_days) +
                                      "d, simulations=" + std::to_string(config_.num_simulations));
}

VaRResult VaRCalculator::calculateVaR(const std::vector<double>& returns, double portfolio_value,
                                      const std::vector<double>& confidence_levels) const {
    for (double level : confidence_levels) {
        if (!(level > 0 && level < 1)) {
            throw ValidationError("Confidence level must be in (0, 1)");
        }
    }

    auto clean = Statistics::finiteOnly(returns);
    if (clean.size() < kMinObservations) {
        std::string message = "Insufficient data for VaR: " + std::to_string(clean.size()) +
                              " returns (need >= " + std::to_string(kMinObservations) + ")";
        if (config_.insufficient_data_policy == InsufficientDataPolicy::Throw) {
            throw InsufficientDataError(message, clean.size(), kMinObservations);
        }
        Logger::instance().warning(kSource, message);
        return emptyResult(portfolio_value);
    }

    // Square-root-of-time scaling
    if (config_.horizon_days > 1) {
        double scale = std::sqrt(static_cast<double>(config_.horizon_days));
        for (double& r : clean) {
            r *= scale;
        }
    }

    // 95% and 99% are always reported
    std::vector<double> levels = confidence_levels;
    for (double required : {0.95, 0.99}) {
        bool present = false;
        for (double level : levels) {
            if (std::abs(level - required) < 1e-12) present = true;
        }
        if (!present) levels.push_back(required);
    }

    VaRResult result = emptyResult(portfolio_value);

    std::map<double, TailEstimate> estimates;
    switch (config_.method) {
        case VaRMethod::Historical:
            estimates = historicalVaR(clean, levels);
            break;
        case VaRMethod::Parametric:
            estimates = parametricVaR(clean, levels, &result.volatility_model);
            break;
        case VaRMethod::MonteCarlo:
            estimates = monteCarloVaR(clean, levels);
            break;
    }

    auto lookup = [&estimates](double level) {
        for (const auto& [cl, tail] : estimates) {
            if (std::abs(cl - level) < 1e-12) return tail;
        }
        return TailEstimate{0.0, 0.0};
    };

    result.var_95 = lookup(0.95).var * portfolio_value;
    result.var_99 = lookup(0.99).var * portfolio_value;
    result.cvar_95 = lookup(0.95).cvar * portfolio_value;
    result.cvar_99 = lookup(0.99).cvar * portfolio_value;

    for (double level : confidence_levels) {
        result.confidence_levels[level] = lookup(level).var * portfolio_value;
    }

    return result;
}

void VaRCalculator::setVolatilityEstimators(std::shared_ptr<VolatilityEstimator> garch,
                                            std::shared_ptr<VolatilityEstimator> fallback) {
    if (!garch || !fallback) {
        throw ValidationError("Volatility estimators must not be null");
    }
    garch_ = std::move(garch);
    constant_ = std::move(fallback);
}

std::map<double, VaRCalculator::TailEstimate> VaRCalculator::historicalVaR(
    const std::vector<double>& returns, const std::vector<double>& levels) const {
    std::map<double, TailEstimate> estimates;
    for (double cl : levels) {
        double var = Statistics::percentile(returns, 1.0 - cl);
        estimates[cl] = TailEstimate{var, Statistics::tailMean(returns, var)};
    }
    return estimates;
}

std::map<double, VaRCalculator::TailEstimate> VaRCalculator::parametricVaR(
    const std::vector<double>& returns, const std::vector<double>& levels,
    std::string* model_used) const {
    double mu = Statistics::mean(returns);
    double sigma = forecastSigma(returns, model_used);

    std::map<double, TailEstimate> estimates;
    for (double cl : levels) {
        double z = Statistics::normalQuantile(1.0 - cl);
        double var = mu + z * sigma;
        double cvar = mu - sigma * Statistics::normalPdf(z) / (1.0 - cl);
        estimates[cl] = TailEstimate{var, cvar};
    }
    return estimates;
}

std::map<double, VaRCalculator::TailEstimate> VaRCalculator::monteCarloVaR(
    const std::vector<double>& returns, const std::vector<double>& levels) const {
    RandomSource random(config_.seed);
    auto simulated = random.normals(static_cast<size_t>(config_.num_simulations),
                                    Statistics::mean(returns),
                                    Statistics::populationStdDev(returns));
    return historicalVaR(simulated, levels);
}

double VaRCalculator::forecastSigma(const std::vector<double>& returns,
                                    std::string* model_used) const {
    if (returns.size() >= config_.garch_min_observations) {
        try {
            double sigma = garch_->forecastVolatility(returns);
            if (model_used) *model_used = garch_->name();
            return sigma;
        } catch (const NumericalFitError& e) {
            Logger::instance().debug(kSource, std::string("GARCH fit failed, using constant volatility: ") +
                                              e.what());
        }
    }

    if (model_used) *model_used = constant_->name();
    return constant_->forecastVolatility(returns);
}

VaRResult VaRCalculator::emptyResult(double portfolio_value) const {
    VaRResult result;
    result.method = config_.method;
    result.horizon_days = config_.horizon_days;
    result.portfolio_value = portfolio_value;
    return result;
}

} // namespace optval
