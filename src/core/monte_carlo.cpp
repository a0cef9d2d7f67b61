#include "monte_carlo.hpp"
#include "errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>

namespace optval {

namespace {

const char* kSource = "MonteCarlo";

} // namespace

std::string toString(SimulationMethod method) {
    switch (method) {
        case SimulationMethod::Shuffle: return "shuffle";
        case SimulationMethod::Bootstrap: return "bootstrap";
        case SimulationMethod::Parametric: return "parametric";
    }
    return "unknown";
}

SimulationMethod simulationMethodFromString(const std::string& name) {
    if (name == "shuffle") return SimulationMethod::Shuffle;
    if (name == "bootstrap") return SimulationMethod::Bootstrap;
    if (name == "parametric") return SimulationMethod::Parametric;
    throw ValidationError("Unknown simulation method: " + name);
}

MonteCarloSimulator::MonteCarloSimulator(MonteCarloConfig config)
    : config_(config), random_(std::make_shared<RandomSource>(config.seed)) {
    if (config_.num_simulations < 1) {
        throw ValidationError("Monte Carlo needs at least one simulation");
    }
}

MonteCarloResult MonteCarloSimulator::simulateFromReturns(const std::vector<double>& returns,
                                                          double initial_capital,
                                                          SimulationMethod method) {
    auto clean = Statistics::finiteOnly(returns);
    if (clean.size() < kMinObservations) {
        throw InsufficientDataError("Monte Carlo needs at least " + std::to_string(kMinObservations) +
                                        " returns, got " + std::to_string(clean.size()),
                                    clean.size(), kMinObservations);
    }

    Logger::instance().info(kSource, "Running " + std::to_string(config_.num_simulations) + " " +
                                     toString(method) + " simulations on " +
                                     std::to_string(clean.size()) + " returns (capital $" +
                                     std::to_string(static_cast<long long>(initial_capital)) + ")");

    double mean = Statistics::mean(clean);
    double std_dev = Statistics::stdDev(clean);

    std::vector<double> sharpes;
    std::vector<double> total_returns;
    std::vector<double> drawdowns;
    sharpes.reserve(config_.num_simulations);
    total_returns.reserve(config_.num_simulations);
    drawdowns.reserve(config_.num_simulations);

    for (int i = 0; i < config_.num_simulations; ++i) {
        auto path = generatePath(clean, method, mean, std_dev);
        sharpes.push_back(sharpeRatio(path));
        total_returns.push_back(totalReturn(path));
        drawdowns.push_back(maxDrawdown(path));
    }

    MonteCarloResult result;
    result.method = method;
    result.num_simulations = config_.num_simulations;
    result.num_observations = clean.size();

    result.sharpe = summarize(sharpeRatio(clean), sharpes, 0.025, 0.975);
    result.total_return = summarize(totalReturn(clean), total_returns, 0.025, 0.975);
    result.max_drawdown = summarize(maxDrawdown(clean), drawdowns, 0.025, 0.95);

    double n = static_cast<double>(config_.num_simulations);
    result.prob_loss = std::count_if(total_returns.begin(), total_returns.end(),
                                     [](double r) { return r < 0; }) / n;
    result.prob_ruin = std::count_if(drawdowns.begin(), drawdowns.end(),
                                     [this](double dd) { return dd > config_.ruin_threshold; }) / n;

    result.var_95 = Statistics::percentile(total_returns, 0.05);
    result.expected_shortfall_95 = Statistics::tailMean(total_returns, result.var_95);

    double band_width = std::max(result.sharpe.upper_95 - result.sharpe.lower_95, 0.1);
    result.path_dependency_score =
        std::min(1.0, std::abs(result.sharpe.original - result.sharpe.mean) / band_width);

    return result;
}

MonteCarloResult MonteCarloSimulator::simulateFromEquityCurve(const std::vector<double>& equity_curve,
                                                              SimulationMethod method) {
    if (equity_curve.empty()) {
        throw InsufficientDataError("Equity curve is empty", 0, kMinObservations + 1);
    }
    return simulateFromReturns(Statistics::returnsFromEquity(equity_curve), equity_curve.front(),
                               method);
}

std::map<std::string, MonteCarloResult> MonteCarloSimulator::stressTestScenarios(
    const std::vector<double>& returns, const std::vector<StressScenario>& scenarios,
    SimulationMethod method) {
    auto clean = Statistics::finiteOnly(returns);
    double mean = Statistics::mean(clean);

    std::map<std::string, MonteCarloResult> results;
    for (const auto& scenario : scenarios) {
        std::vector<double> stressed;
        stressed.reserve(clean.size());
        for (double r : clean) {
            stressed.push_back(mean + scenario.daily_shock + (r - mean) * scenario.vol_multiplier);
        }

        Logger::instance().info(kSource, "Stress scenario " + scenario.name);
        results[scenario.name] = simulateFromReturns(stressed, 100000.0, method);
    }
    return results;
}

std::vector<StressScenario> MonteCarloSimulator::defaultScenarios() {
    return {
        {"base", 0.0, 1.0},
        {"mild", -0.0005, 1.25},
        {"moderate", -0.001, 1.5},
        {"severe", -0.002, 2.0},
        {"historical_crisis", -0.003, 2.5},
        {"flash_crash", -0.005, 3.0},
    };
}

double MonteCarloSimulator::sharpeRatio(const std::vector<double>& returns) const {
    double std_dev = Statistics::stdDev(returns);
    if (!(std_dev > 0)) return 0.0;

    double excess = Statistics::mean(returns) - config_.risk_free_rate / 252.0;
    return excess / std_dev * std::sqrt(252.0);
}

double MonteCarloSimulator::totalReturn(const std::vector<double>& returns) {
    double growth = 1.0;
    for (double r : returns) {
        growth *= 1.0 + r;
    }
    return growth - 1.0;
}

double MonteCarloSimulator::maxDrawdown(const std::vector<double>& returns) {
    double value = 1.0;
    double peak = 1.0;
    double worst = 0.0;
    for (double r : returns) {
        value *= 1.0 + r;
        peak = std::max(peak, value);
        if (peak > 0) {
            worst = std::max(worst, (peak - value) / peak);
        }
    }
    return worst;
}

void MonteCarloSimulator::setRandomSource(std::shared_ptr<RandomSource> source) {
    if (!source) {
        throw ValidationError("Random source must not be null");
    }
    random_ = std::move(source);
}

std::vector<double> MonteCarloSimulator::generatePath(const std::vector<double>& returns,
                                                      SimulationMethod method, double mean,
                                                      double std_dev) {
    switch (method) {
        case SimulationMethod::Shuffle: {
            std::vector<double> path = returns;
            random_->shuffle(path);
            return path;
        }
        case SimulationMethod::Bootstrap:
            return random_->resample(returns);
        case SimulationMethod::Parametric:
            return random_->normals(returns.size(), mean, std_dev);
    }
    return returns;
}

MetricDistribution MonteCarloSimulator::summarize(double original, const std::vector<double>& samples,
                                                  double lower_p, double upper_p) {
    MetricDistribution dist;
    dist.original = original;
    dist.mean = Statistics::mean(samples);
    dist.std = Statistics::stdDev(samples);
    dist.lower_95 = Statistics::percentile(samples, lower_p);
    dist.upper_95 = Statistics::percentile(samples, upper_p);
    return dist;
}

} // namespace optval
