#include "extended_validator.hpp"
#include "errors.hpp"
#include "../utils/format_utils.hpp"
#include "../utils/logger.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>

namespace optval {

namespace {

const char* kSource = "ExtendedValidator";

} // namespace

ExtendedValidator::ExtendedValidator(BacktestConfig backtest_config,
                                     std::shared_ptr<PriceHistoryProvider> provider,
                                     ValidationCriteria criteria,
                                     MonteCarloConfig monte_carlo_config)
    : backtest_config_(std::move(backtest_config)), provider_(std::move(provider)),
      criteria_(criteria), monte_carlo_config_(monte_carlo_config),
      cost_model_(std::make_shared<TransactionCostModel>(AssetClass::Option)),
      regime_classifier_(std::make_shared<RegimeDetector>()) {
    if (!provider_) {
        throw ValidationError("ExtendedValidator requires a price history provider");
    }
}

ExtendedValidationResult ExtendedValidator::validate(const StrategyFunction& strategy,
                                                     const std::vector<std::string>& symbols,
                                                     int trade_frequency_days) {
    Logger::instance().info(kSource, "Starting extended validation on " +
                                     std::to_string(symbols.size()) + " symbol(s)");

    // 1. Backtest
    BacktestEngine engine(backtest_config_, provider_);
    BacktestMetrics metrics;
    try {
        metrics = engine.runBacktest(strategy, symbols, trade_frequency_days);
    } catch (const ValidationError& e) {
        Logger::instance().error(kSource, std::string("Basic backtest failed: ") + e.what());
        return failedResult(std::string("Backtest failed: ") + e.what());
    }

    ExtendedValidationResult result;
    result.backtest = metrics;
    result.gross_return = metrics.total_return;
    result.net_return = metrics.total_return;
    result.cost_adjusted_sharpe = metrics.sharpe_ratio;

    // 2. Basic criteria
    auto basic_failures = checkBasicMetrics(metrics);
    result.all_failures.insert(result.all_failures.end(), basic_failures.begin(), basic_failures.end());

    // 3. Monte Carlo on the equity curve
    if (metrics.total_trades > 0) {
        try {
            MonteCarloSimulator simulator(monte_carlo_config_);
            MonteCarloResult mc = simulator.simulateFromEquityCurve(engine.equityCurve(),
                                                                    SimulationMethod::Shuffle);
            result.monte_carlo_failures = checkMonteCarlo(mc);
            result.monte_carlo_valid = result.monte_carlo_failures.empty();
            result.monte_carlo = mc;
        } catch (const InsufficientDataError& e) {
            Logger::instance().error(kSource, std::string("Monte Carlo failed: ") + e.what());
            result.monte_carlo_valid = false;
            result.monte_carlo_failures.push_back(std::string("Monte Carlo simulation failed: ") +
                                                  e.what());
        }

        result.all_failures.insert(result.all_failures.end(), result.monte_carlo_failures.begin(),
                                   result.monte_carlo_failures.end());
        if (!result.monte_carlo_valid) {
            result.recommendations.push_back("Monte Carlo failed: Consider reviewing trade quality");
        }
    }

    // 4. Walk-forward optimization
    if (walkForwardEnabled()) {
        try {
            WalkForwardValidator walk_forward(backtest_config_, provider_, walk_forward_config_);
            WalkForwardResult wf = walk_forward.run(walk_forward_factory_, walk_forward_grid_, symbols);
            result.walk_forward_failures = checkWalkForward(wf);
            result.walk_forward_valid = result.walk_forward_failures.empty();
            result.walk_forward = wf;
        } catch (const ValidationError& e) {
            Logger::instance().error(kSource, std::string("Walk-forward failed: ") + e.what());
            result.walk_forward_valid = false;
            result.walk_forward_failures.push_back(std::string("Walk-forward analysis failed: ") +
                                                   e.what());
        }

        result.all_failures.insert(result.all_failures.end(), result.walk_forward_failures.begin(),
                                   result.walk_forward_failures.end());
        if (!result.walk_forward_valid) {
            result.recommendations.push_back("Walk-forward failed: Strategy may be overfit");
        }
    }

    // 5. Tail risk on the equity-curve returns
    const auto& curve = engine.equityCurve();
    VaRCalculator var_calculator;
    VaRResult var = var_calculator.calculateVaR(Statistics::returnsFromEquity(curve), curve.back());
    result.var = var;
    if (var.var95LossPct() > criteria_.max_var_95_pct) {
        result.all_failures.push_back("VaR 95% " + FormatUtils::percent(var.var95LossPct(), 2) +
                                      " > " + FormatUtils::percent(criteria_.max_var_95_pct, 1));
        result.recommendations.push_back("Tail risk too high: Reduce position sizes or hedge exposure");
    }

    // 6. Transaction costs
    if (!engine.closedPositions().empty()) {
        runCostAnalysis(engine, metrics, result);
    }

    // 7. Regime of the first symbol
    result.regime_adjusted_score = 1.0;
    if (!symbols.empty() && engine.hasPriceHistory(symbols.front())) {
        RegimeState regime = regime_classifier_->detectRegime(engine.priceHistory(symbols.front()).closes());
        result.regime = regime;
        result.regime_adjusted_score = regime.recommended_position_scale;

        if (regime.recommended_position_scale < 0.5) {
            result.recommendations.push_back("Current regime (" + toString(regime.market_regime) +
                                             ") suggests reduced position sizes");
        }
    }

    // 8. Score and verdict
    result.overall_score = calculateOverallScore(metrics,
                                                 result.monte_carlo ? &*result.monte_carlo : nullptr,
                                                 result.walk_forward ? &*result.walk_forward : nullptr,
                                                 result.cost_adjusted_sharpe,
                                                 result.regime_adjusted_score);

    result.is_valid_for_live_trading = result.all_failures.empty() &&
                                       result.overall_score >= criteria_.min_score &&
                                       result.monte_carlo.has_value() && result.monte_carlo_valid &&
                                       (!walkForwardEnabled() || result.walk_forward_valid);

    result.validation_summary = generateSummary(result.is_valid_for_live_trading,
                                                result.overall_score, result.all_failures.size());

    Logger::instance().info(kSource, result.validation_summary);
    return result;
}

void ExtendedValidator::setCostModel(std::shared_ptr<CostModel> cost_model) {
    if (!cost_model) {
        throw ValidationError("Cost model must not be null");
    }
    cost_model_ = std::move(cost_model);
}

void ExtendedValidator::setRegimeClassifier(std::shared_ptr<RegimeClassifier> classifier) {
    if (!classifier) {
        throw ValidationError("Regime classifier must not be null");
    }
    regime_classifier_ = std::move(classifier);
}

void ExtendedValidator::setWalkForward(StrategyFactory factory, ParameterGrid grid,
                                       WalkForwardConfig config) {
    if (!factory) {
        throw ValidationError("Walk-forward strategy factory must not be null");
    }
    walk_forward_factory_ = std::move(factory);
    walk_forward_grid_ = std::move(grid);
    walk_forward_config_ = config;
}

double ExtendedValidator::calculateOverallScore(const BacktestMetrics& backtest,
                                                const MonteCarloResult* monte_carlo,
                                                const WalkForwardResult* walk_forward,
                                                double cost_adjusted_sharpe, double regime_score) {
    std::vector<double> scores;
    std::vector<double> weights;

    double bt_score = std::min(1.0, backtest.sharpe_ratio / 2.0) * 40.0 +
                      std::min(1.0, backtest.win_rate / 60.0) * 30.0 +
                      std::max(0.0, 1.0 - backtest.max_drawdown / 30.0) * 30.0;
    scores.push_back(std::clamp(bt_score, 0.0, 100.0));
    weights.push_back(0.25);

    if (monte_carlo) {
        double mc_score = (1.0 - monte_carlo->prob_loss) * 50.0 +
                          std::max(0.0, 1.0 - monte_carlo->prob_ruin * 10.0) * 30.0 +
                          std::max(0.0, 1.0 - monte_carlo->max_drawdown.upper_95 / 0.5) * 20.0;
        scores.push_back(mc_score);
        weights.push_back(0.25);
    }

    if (walk_forward) {
        double wf_score = std::min(1.0, walk_forward->mean_efficiency_ratio) * 40.0 +
                          std::max(0.0, 1.0 - walk_forward->overfitting_score) * 40.0 +
                          walk_forward->mean_param_stability * 20.0;
        scores.push_back(std::clamp(wf_score, 0.0, 100.0));
        weights.push_back(0.25);
    }

    double misc_score = std::min(1.0, std::max(0.0, cost_adjusted_sharpe / 1.5)) * 50.0 +
                        regime_score * 50.0;
    scores.push_back(misc_score);
    weights.push_back(0.25);

    double total_weight = 0.0;
    for (double w : weights) total_weight += w;

    double overall = 0.0;
    for (size_t i = 0; i < scores.size(); ++i) {
        overall += scores[i] * weights[i] / total_weight;
    }
    return std::clamp(overall, 0.0, 100.0);
}

std::string ExtendedValidator::generateSummary(bool is_valid, double score, size_t num_failures) {
    std::string score_text = FormatUtils::fixed(score, 0) + "/100";
    if (is_valid) {
        return "PASS: Strategy validated for live trading (Score: " + score_text + ")";
    }
    return "FAIL: Strategy not ready for live trading (Score: " + score_text + ", " +
           std::to_string(num_failures) + " issues)";
}

std::vector<TradeRecord> ExtendedValidator::toTradeRecords(const std::vector<OptionsPosition>& positions) {
    std::vector<TradeRecord> trades;
    trades.reserve(positions.size());

    for (const auto& position : positions) {
        double units = position.totalContracts() * kContractMultiplier;
        if (units <= 0) continue;

        TradeRecord trade;
        trade.symbol = position.symbol();
        trade.quantity = position.entryCost() < 0 ? -units : units;
        trade.entry_price = std::abs(position.entryCost()) / units;
        trade.exit_price = std::abs(position.exitValue()) / units;
        trade.holding_days = std::max(1, position.daysInTrade());
        trade.pnl = position.pnl();
        trades.push_back(trade);
    }
    return trades;
}

std::vector<std::string> ExtendedValidator::checkBasicMetrics(const BacktestMetrics& metrics) const {
    std::vector<std::string> failures;

    if (metrics.sharpe_ratio < criteria_.min_sharpe) {
        failures.push_back("Sharpe " + FormatUtils::fixed(metrics.sharpe_ratio) + " < " +
                           FormatUtils::fixed(criteria_.min_sharpe, 1));
    }
    if (metrics.max_drawdown > criteria_.max_drawdown * 100.0) {
        failures.push_back("Drawdown " + FormatUtils::percent(metrics.max_drawdown) + " > " +
                           FormatUtils::percent(criteria_.max_drawdown * 100.0, 0));
    }
    if (metrics.win_rate < criteria_.min_win_rate * 100.0) {
        failures.push_back("Win rate " + FormatUtils::percent(metrics.win_rate) + " < " +
                           FormatUtils::percent(criteria_.min_win_rate * 100.0, 0));
    }
    if (metrics.total_trades < criteria_.min_trades) {
        failures.push_back("Only " + std::to_string(metrics.total_trades) + " trades < " +
                           std::to_string(criteria_.min_trades) + " minimum");
    }
    return failures;
}

std::vector<std::string> ExtendedValidator::checkMonteCarlo(const MonteCarloResult& result) const {
    std::vector<std::string> failures;

    double profit_probability = 1.0 - result.prob_loss;
    if (profit_probability < criteria_.min_profit_probability) {
        failures.push_back("Profit probability " + FormatUtils::percent(profit_probability * 100.0) +
                           " < " + FormatUtils::percent(criteria_.min_profit_probability * 100.0, 0));
    }
    if (result.prob_ruin > criteria_.max_ruin_probability) {
        failures.push_back("Ruin probability " + FormatUtils::percent(result.prob_ruin * 100.0) +
                           " > " + FormatUtils::percent(criteria_.max_ruin_probability * 100.0, 0));
    }
    if (result.sharpe.mean < criteria_.min_median_sharpe) {
        failures.push_back("Mean Sharpe " + FormatUtils::fixed(result.sharpe.mean) + " < " +
                           FormatUtils::fixed(criteria_.min_median_sharpe, 1));
    }
    return failures;
}

std::vector<std::string> ExtendedValidator::checkWalkForward(const WalkForwardResult& result) const {
    std::vector<std::string> failures;

    if (result.mean_efficiency_ratio < criteria_.min_efficiency_ratio) {
        failures.push_back("Efficiency ratio " + FormatUtils::fixed(result.mean_efficiency_ratio) + " < " +
                           FormatUtils::fixed(criteria_.min_efficiency_ratio, 1));
    }
    if (result.overfitting_score > criteria_.max_overfitting_score) {
        failures.push_back("Overfitting score " + FormatUtils::fixed(result.overfitting_score) + " > " +
                           FormatUtils::fixed(criteria_.max_overfitting_score, 1));
    }
    if (result.fold_consistency < criteria_.min_fold_consistency) {
        failures.push_back("Fold consistency " + FormatUtils::percent(result.fold_consistency * 100.0, 0) +
                           " < " + FormatUtils::percent(criteria_.min_fold_consistency * 100.0, 0));
    }
    return failures;
}

void ExtendedValidator::runCostAnalysis(const BacktestEngine& engine, const BacktestMetrics& metrics,
                                        ExtendedValidationResult& result) const {
    auto adjusted = cost_model_->adjustReturns(toTradeRecords(engine.closedPositions()));

    double gross_pnl = 0.0;
    for (const auto& position : engine.closedPositions()) {
        gross_pnl += position.pnl();
    }

    double total_costs = 0.0;
    for (const auto& trade : adjusted) {
        total_costs += trade.transaction_costs;
    }

    double net_pnl = gross_pnl - total_costs;
    result.total_costs = total_costs;
    result.net_return = engine.config().initial_capital > 0
        ? net_pnl / engine.config().initial_capital * 100.0
        : 0.0;
    result.cost_drag_pct = gross_pnl != 0 ? total_costs / std::abs(gross_pnl) * 100.0 : 0.0;
    result.cost_adjusted_sharpe = metrics.sharpe_ratio > 0
        ? metrics.sharpe_ratio * (1.0 - result.cost_drag_pct / 100.0)
        : metrics.sharpe_ratio;

    if (result.cost_drag_pct > criteria_.max_cost_drag_pct) {
        result.all_failures.push_back("Cost drag " + FormatUtils::percent(result.cost_drag_pct) + " > " +
                                      FormatUtils::percent(criteria_.max_cost_drag_pct, 0));
        result.recommendations.push_back("High transaction costs: Consider fewer trades or larger positions");
    }
    if (result.cost_adjusted_sharpe < criteria_.min_cost_adjusted_sharpe) {
        result.all_failures.push_back("Cost-adjusted Sharpe " + FormatUtils::fixed(result.cost_adjusted_sharpe) +
                                      " < " + FormatUtils::fixed(criteria_.min_cost_adjusted_sharpe, 1));
    }
}

ExtendedValidationResult ExtendedValidator::failedResult(const std::string& reason) {
    ExtendedValidationResult result;
    result.validation_summary = "FAIL: " + reason;
    result.all_failures.push_back(reason);
    result.recommendations.push_back("Fix the underlying issue and retry validation");
    return result;
}

} // namespace optval
