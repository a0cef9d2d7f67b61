#pragma once

#include "backtest_engine.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace optval {

enum class WindowMethod {
    Expanding, // training window anchored at the first date and growing
    Rolling    // fixed-size training window moving forward
};

std::string toString(WindowMethod method);

// Parse "expanding" (or "anchored") and "rolling"; throws ValidationError otherwise
WindowMethod windowMethodFromString(const std::string& name);

// Window sizes are counted in trading days (weekdays)
struct WalkForwardConfig {
    int train_days;
    int test_days;
    int step_days;
    WindowMethod method;
    int trade_frequency_days;

    WalkForwardConfig() : train_days(252), test_days(63), step_days(21),
                          method(WindowMethod::Expanding), trade_frequency_days(7) {}
};

struct WalkForwardFold {
    int number;
    Date train_start;
    Date train_end; // inclusive
    Date test_start;
    Date test_end;  // inclusive

    WalkForwardFold() : number(0) {}
};

using ParameterSet = std::map<std::string, double>;
using ParameterGrid = std::map<std::string, std::vector<double>>;

// Builds a strategy from one point of the parameter grid
using StrategyFactory = std::function<StrategyFunction(const ParameterSet&)>;

struct FoldResult {
    WalkForwardFold fold;
    ParameterSet params; // best in-sample parameters
    BacktestMetrics in_sample;
    BacktestMetrics out_of_sample;
    double efficiency_ratio;  // out-of-sample Sharpe / in-sample Sharpe
    double param_stability;   // 1 = same parameters as the previous fold

    FoldResult() : efficiency_ratio(0), param_stability(1) {}
};

struct WalkForwardResult {
    std::vector<FoldResult> folds;
    double mean_efficiency_ratio;
    double overfitting_score; // 0 = none, 1 = severe
    double degradation;       // 1 - mean OOS return / mean IS return
    double mean_param_stability;
    double fold_consistency;  // fraction of folds with a positive OOS return

    WalkForwardResult() : mean_efficiency_ratio(0), overfitting_score(0), degradation(0),
                          mean_param_stability(0), fold_consistency(0) {}
};

// Optimizes strategy parameters on each in-sample window by Sharpe ratio and
// replays the winner on the following out-of-sample window.
class WalkForwardValidator {
public:
    WalkForwardValidator(BacktestConfig backtest_config,
                         std::shared_ptr<PriceHistoryProvider> provider,
                         WalkForwardConfig config = WalkForwardConfig());

    // Folds over the weekdays of [start, end]. Throws InsufficientDataError when
    // fewer than train_days + test_days trading days are available.
    static std::vector<WalkForwardFold> createFolds(const Date& start, const Date& end,
                                                    const WalkForwardConfig& config);

    // Folds span the backtest config's date range
    WalkForwardResult run(const StrategyFactory& factory, const ParameterGrid& grid,
                          const std::vector<std::string>& symbols) const;

    // Cartesian product; an empty grid yields one empty parameter set
    static std::vector<ParameterSet> expandGrid(const ParameterGrid& grid);

    // Mean per-parameter closeness in [0, 1]
    static double parameterStability(const ParameterSet& previous, const ParameterSet& current);

    // Mean of: efficiency shortfall, declining efficiency trend (3+ folds),
    // in-sample to out-of-sample return gap, parameter instability
    static double overfittingScore(const std::vector<FoldResult>& folds);

    const WalkForwardConfig& config() const { return config_; }

private:
    // Throws ValidationError when the window cannot be backtested
    BacktestMetrics runWindow(const StrategyFunction& strategy, const std::vector<std::string>& symbols,
                              const Date& start, const Date& end) const;

    static BacktestMetrics emptyMetrics(const Date& start, const Date& end);

    BacktestConfig backtest_config_;
    std::shared_ptr<PriceHistoryProvider> provider_;
    WalkForwardConfig config_;
};

} // namespace optval
