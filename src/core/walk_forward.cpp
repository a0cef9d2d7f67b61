#include "walk_forward.hpp"
#include "errors.hpp"
#include "../utils/format_utils.hpp"
#include "../utils/logger.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace optval {

namespace {

const char* kSource = "WalkForward";

double slope(const std::vector<double>& values) {
    double mean_x = (values.size() - 1) / 2.0;
    double mean_y = Statistics::mean(values);

    double cov = 0.0;
    double var = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        double dx = static_cast<double>(i) - mean_x;
        cov += dx * (values[i] - mean_y);
        var += dx * dx;
    }
    return var > 0 ? cov / var : 0.0;
}

std::string describe(const ParameterSet& params) {
    if (params.empty()) return "{}";

    std::string text = "{";
    for (const auto& [name, value] : params) {
        if (text.size() > 1) text += ", ";
        text += name + "=" + FormatUtils::fixed(value, 4);
    }
    return text + "}";
}

} // namespace

std::string toString(WindowMethod method) {
    switch (method) {
        case WindowMethod::Expanding: return "expanding";
        case WindowMethod::Rolling: return "rolling";
    }
    return "unknown";
}

WindowMethod windowMethodFromString(const std::string& name) {
    if (name == "expanding" || name == "anchored") return WindowMethod::Expanding;
    if (name == "rolling") return WindowMethod::Rolling;
    throw ValidationError("Unknown walk-forward method: " + name);
}

WalkForwardValidator::WalkForwardValidator(BacktestConfig backtest_config,
                                           std::shared_ptr<PriceHistoryProvider> provider,
                                           WalkForwardConfig config)
    : backtest_config_(std::move(backtest_config)), provider_(std::move(provider)), config_(config) {
    if (!provider_) {
        throw ValidationError("WalkForwardValidator requires a price history provider");
    }
    if (config_.trade_frequency_days < 1) {
        throw ValidationError("Trade frequency must be at least one day");
    }
}

std::vector<WalkForwardFold> WalkForwardValidator::createFolds(const Date& start, const Date& end,
                                                               const WalkForwardConfig& config) {
    if (config.train_days < 1 || config.test_days < 1 || config.step_days < 1) {
        throw ValidationError("Walk-forward windows and step must be at least one day");
    }

    std::vector<Date> dates;
    for (Date current = start; current <= end; current = DateUtils::addDays(current, 1)) {
        if (!DateUtils::isWeekend(current)) {
            dates.push_back(current);
        }
    }

    size_t train = static_cast<size_t>(config.train_days);
    size_t test = static_cast<size_t>(config.test_days);
    size_t step = static_cast<size_t>(config.step_days);
    if (dates.size() < train + test) {
        throw InsufficientDataError("Walk-forward needs at least " + std::to_string(train + test) +
                                    " trading days, got " + std::to_string(dates.size()),
                                    dates.size(), train + test);
    }

    std::vector<WalkForwardFold> folds;
    size_t train_start = 0;
    size_t train_end = train; // exclusive

    while (train_end + test <= dates.size()) {
        WalkForwardFold fold;
        fold.number = static_cast<int>(folds.size());
        fold.train_start = dates[train_start];
        fold.train_end = dates[train_end - 1];
        fold.test_start = dates[train_end];
        fold.test_end = dates[train_end + test - 1];
        folds.push_back(fold);

        if (config.method == WindowMethod::Rolling) {
            train_start += step;
        }
        train_end += step;
    }

    Logger::instance().info(kSource, "Created " + std::to_string(folds.size()) + " walk-forward folds");
    return folds;
}

WalkForwardResult WalkForwardValidator::run(const StrategyFactory& factory, const ParameterGrid& grid,
                                            const std::vector<std::string>& symbols) const {
    if (!factory) {
        throw ValidationError("Walk-forward requires a strategy factory");
    }

    auto folds = createFolds(backtest_config_.start_date, backtest_config_.end_date, config_);
    auto candidates = expandGrid(grid);

    ParameterSet defaults;
    for (const auto& [name, values] : grid) {
        if (!values.empty()) defaults[name] = values.front();
    }

    WalkForwardResult result;

    for (const auto& fold : folds) {
        Logger::instance().info(kSource, "Fold " + std::to_string(fold.number + 1) + "/" +
                                         std::to_string(folds.size()) + ": train " +
                                         DateUtils::formatDate(fold.train_start) + " to " +
                                         DateUtils::formatDate(fold.train_end) + ", test " +
                                         DateUtils::formatDate(fold.test_start) + " to " +
                                         DateUtils::formatDate(fold.test_end));

        FoldResult detail;
        detail.fold = fold;

        // In-sample optimization on Sharpe
        double best_sharpe = -std::numeric_limits<double>::infinity();
        bool found = false;
        for (const auto& params : candidates) {
            try {
                BacktestMetrics metrics = runWindow(factory(params), symbols, fold.train_start,
                                                    fold.train_end);
                if (metrics.sharpe_ratio > best_sharpe) {
                    best_sharpe = metrics.sharpe_ratio;
                    detail.params = params;
                    detail.in_sample = metrics;
                    found = true;
                }
            } catch (const ValidationError& e) {
                Logger::instance().warning(kSource, "Failed to evaluate params " + describe(params) +
                                                    ": " + e.what());
            }
        }
        if (!found) {
            detail.params = defaults;
            detail.in_sample = emptyMetrics(fold.train_start, fold.train_end);
        }

        // Out-of-sample replay with the chosen parameters
        try {
            detail.out_of_sample = runWindow(factory(detail.params), symbols, fold.test_start,
                                             fold.test_end);
        } catch (const ValidationError& e) {
            Logger::instance().warning(kSource, std::string("Out-of-sample backtest failed: ") + e.what());
            detail.out_of_sample = emptyMetrics(fold.test_start, fold.test_end);
        }

        double is_sharpe = detail.in_sample.sharpe_ratio;
        double oos_sharpe = detail.out_of_sample.sharpe_ratio;
        if (is_sharpe != 0.0) {
            detail.efficiency_ratio = oos_sharpe / is_sharpe;
        } else {
            detail.efficiency_ratio = oos_sharpe <= 0.0 ? 0.0 : 1.0;
        }

        detail.param_stability = result.folds.empty()
            ? 1.0
            : parameterStability(result.folds.back().params, detail.params);

        result.folds.push_back(detail);
    }

    std::vector<double> efficiencies;
    std::vector<double> stabilities;
    std::vector<double> is_returns;
    std::vector<double> oos_returns;
    int positive = 0;
    for (const auto& detail : result.folds) {
        efficiencies.push_back(detail.efficiency_ratio);
        stabilities.push_back(detail.param_stability);
        is_returns.push_back(detail.in_sample.total_return);
        oos_returns.push_back(detail.out_of_sample.total_return);
        if (detail.out_of_sample.total_return > 0) ++positive;
    }

    result.mean_efficiency_ratio = Statistics::mean(efficiencies);
    result.mean_param_stability = Statistics::mean(stabilities);
    result.overfitting_score = overfittingScore(result.folds);
    result.fold_consistency = result.folds.empty()
        ? 0.0
        : static_cast<double>(positive) / result.folds.size();

    double mean_is = Statistics::mean(is_returns);
    result.degradation = mean_is != 0.0 ? 1.0 - Statistics::mean(oos_returns) / mean_is : 0.0;

    Logger::instance().info(kSource, "Walk-forward complete: efficiency " +
                                     FormatUtils::fixed(result.mean_efficiency_ratio) +
                                     ", overfitting " + FormatUtils::fixed(result.overfitting_score) +
                                     ", consistency " +
                                     FormatUtils::percent(result.fold_consistency * 100.0, 0));
    return result;
}

std::vector<ParameterSet> WalkForwardValidator::expandGrid(const ParameterGrid& grid) {
    std::vector<ParameterSet> combinations(1);

    for (const auto& [name, values] : grid) {
        std::vector<ParameterSet> next;
        next.reserve(combinations.size() * values.size());
        for (const auto& partial : combinations) {
            for (double value : values) {
                ParameterSet params = partial;
                params[name] = value;
                next.push_back(std::move(params));
            }
        }
        combinations = std::move(next);
    }
    return combinations;
}

double WalkForwardValidator::parameterStability(const ParameterSet& previous, const ParameterSet& current) {
    if (previous.empty() || current.empty()) return 1.0;

    double matching = 0.0;
    int total = 0;
    for (const auto& [name, prev_value] : previous) {
        auto it = current.find(name);
        if (it == current.end()) continue;

        ++total;
        if (prev_value != 0.0) {
            double diff = std::abs(it->second - prev_value) / std::abs(prev_value);
            matching += std::max(0.0, 1.0 - diff);
        } else {
            matching += it->second == 0.0 ? 1.0 : 0.0;
        }
    }
    return total > 0 ? matching / total : 1.0;
}

double WalkForwardValidator::overfittingScore(const std::vector<FoldResult>& folds) {
    if (folds.empty()) return 0.0;

    std::vector<double> efficiencies;
    std::vector<double> stabilities;
    std::vector<double> is_returns;
    std::vector<double> oos_returns;
    for (const auto& detail : folds) {
        efficiencies.push_back(detail.efficiency_ratio);
        stabilities.push_back(detail.param_stability);
        is_returns.push_back(detail.in_sample.total_return);
        oos_returns.push_back(detail.out_of_sample.total_return);
    }

    std::vector<double> indicators;
    indicators.push_back(std::max(0.0, 1.0 - Statistics::mean(efficiencies)));

    if (efficiencies.size() >= 3) {
        indicators.push_back(std::min(1.0, std::max(0.0, -slope(efficiencies)) * 5.0));
    }

    double mean_is = Statistics::mean(is_returns);
    if (mean_is != 0.0) {
        double gap = (mean_is - Statistics::mean(oos_returns)) / std::abs(mean_is);
        indicators.push_back(std::clamp(gap, 0.0, 1.0));
    }

    indicators.push_back(1.0 - Statistics::mean(stabilities));

    return Statistics::mean(indicators);
}

BacktestMetrics WalkForwardValidator::runWindow(const StrategyFunction& strategy,
                                                const std::vector<std::string>& symbols,
                                                const Date& start, const Date& end) const {
    BacktestConfig window = backtest_config_;
    window.start_date = start;
    window.end_date = end;

    BacktestEngine engine(window, provider_);
    return engine.runBacktest(strategy, symbols, config_.trade_frequency_days);
}

BacktestMetrics WalkForwardValidator::emptyMetrics(const Date& start, const Date& end) {
    BacktestMetrics metrics;
    metrics.start_date = DateUtils::formatDate(start);
    metrics.end_date = DateUtils::formatDate(end);
    return metrics;
}

} // namespace optval
