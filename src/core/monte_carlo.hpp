#pragma once

#include "../utils/random_source.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace optval {

struct MonteCarloConfig {
    int num_simulations;
    double ruin_threshold; // drawdown fraction counted as ruin
    double risk_free_rate;
    uint64_t seed;

    MonteCarloConfig() : num_simulations(1000), ruin_threshold(0.20), risk_free_rate(0.04), seed(42) {}
};

enum class SimulationMethod {
    Shuffle,   // permute the observed returns
    Bootstrap, // resample with replacement
    Parametric // i.i.d. normal with the sample mean and std
};

std::string toString(SimulationMethod method);

// Parse "shuffle", "bootstrap" or "parametric"; throws ValidationError otherwise
SimulationMethod simulationMethodFromString(const std::string& name);

struct MetricDistribution {
    double original;
    double mean;
    double std;
    double lower_95;
    double upper_95;

    MetricDistribution() : original(0), mean(0), std(0), lower_95(0), upper_95(0) {}
};

struct MonteCarloResult {
    MetricDistribution sharpe;
    MetricDistribution total_return; // fraction
    MetricDistribution max_drawdown; // positive fraction; upper_95 is the 95th percentile

    double prob_loss;
    double prob_ruin;
    double var_95;               // 5th percentile of simulated total returns
    double expected_shortfall_95;

    double path_dependency_score; // 0 = robust to ordering, 1 = highly path dependent

    SimulationMethod method;
    int num_simulations;
    size_t num_observations;

    MonteCarloResult() : prob_loss(0), prob_ruin(0), var_95(0), expected_shortfall_95(0),
                         path_dependency_score(0), method(SimulationMethod::Shuffle),
                         num_simulations(0), num_observations(0) {}
};

struct StressScenario {
    std::string name;
    double daily_shock;    // added to the mean daily return
    double vol_multiplier; // applied to deviations from the mean

    StressScenario() : daily_shock(0), vol_multiplier(1) {}
    StressScenario(std::string n, double shock, double vol_mult)
        : name(std::move(n)), daily_shock(shock), vol_multiplier(vol_mult) {}
};

class MonteCarloSimulator {
public:
    static constexpr size_t kMinObservations = 20;

    explicit MonteCarloSimulator(MonteCarloConfig config = MonteCarloConfig());

    // Non-finite values are dropped; throws InsufficientDataError with fewer than 20 left
    MonteCarloResult simulateFromReturns(const std::vector<double>& returns,
                                         double initial_capital = 100000.0,
                                         SimulationMethod method = SimulationMethod::Shuffle);

    // Convert an equity curve to simple returns and simulate with E[0] as capital
    MonteCarloResult simulateFromEquityCurve(const std::vector<double>& equity_curve,
                                             SimulationMethod method = SimulationMethod::Shuffle);

    std::map<std::string, MonteCarloResult> stressTestScenarios(
        const std::vector<double>& returns,
        const std::vector<StressScenario>& scenarios = defaultScenarios(),
        SimulationMethod method = SimulationMethod::Shuffle);

    static std::vector<StressScenario> defaultScenarios();

    // Metrics of a single return path
    double sharpeRatio(const std::vector<double>& returns) const;
    static double totalReturn(const std::vector<double>& returns);
    static double maxDrawdown(const std::vector<double>& returns);

    void setRandomSource(std::shared_ptr<RandomSource> source);
    const MonteCarloConfig& config() const { return config_; }

private:
    std::vector<double> generatePath(const std::vector<double>& returns, SimulationMethod method,
                                     double mean, double std_dev);

    static MetricDistribution summarize(double original, const std::vector<double>& samples,
                                        double lower_p, double upper_p);

    MonteCarloConfig config_;
    std::shared_ptr<RandomSource> random_;
};

} // namespace optval
