#pragma once

#include "backtest_engine.hpp"
#include "monte_carlo.hpp"
#include "regime_detector.hpp"
#include "transaction_costs.hpp"
#include "var_calculator.hpp"
#include "walk_forward.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace optval {

// Thresholds a strategy must meet before live trading. Fractions unless noted.
struct ValidationCriteria {
    // Monte Carlo
    double min_profit_probability;
    double max_ruin_probability;
    double min_median_sharpe;

    // Walk-forward
    double min_efficiency_ratio;
    double max_overfitting_score;
    double min_fold_consistency;

    // Costs
    double min_cost_adjusted_sharpe;
    double max_cost_drag_pct; // percent

    // Backtest
    double min_sharpe;
    double max_drawdown;
    double min_win_rate;
    int min_trades;

    // Tail risk and overall verdict
    double max_var_95_pct; // percent of final equity
    double min_score;      // 0-100

    ValidationCriteria() : min_profit_probability(0.6), max_ruin_probability(0.05),
                           min_median_sharpe(0.5), min_efficiency_ratio(0.5),
                           max_overfitting_score(0.5), min_fold_consistency(0.5),
                           min_cost_adjusted_sharpe(0.3),
                           max_cost_drag_pct(30.0), min_sharpe(1.0), max_drawdown(0.20),
                           min_win_rate(0.45), min_trades(50), max_var_95_pct(5.0),
                           min_score(60.0) {}
};

struct ExtendedValidationResult {
    std::optional<BacktestMetrics> backtest;

    std::optional<MonteCarloResult> monte_carlo;
    bool monte_carlo_valid;
    std::vector<std::string> monte_carlo_failures;

    std::optional<WalkForwardResult> walk_forward;
    bool walk_forward_valid;
    std::vector<std::string> walk_forward_failures;

    std::optional<VaRResult> var;

    double gross_return; // percent
    double net_return;   // percent, after transaction costs
    double total_costs;  // dollars
    double cost_drag_pct;
    double cost_adjusted_sharpe;

    std::optional<RegimeState> regime;
    double regime_adjusted_score;

    double overall_score; // 0-100
    bool is_valid_for_live_trading;
    std::string validation_summary;

    std::vector<std::string> all_failures;
    std::vector<std::string> recommendations;

    ExtendedValidationResult() : monte_carlo_valid(false), walk_forward_valid(false),
                                 gross_return(0), net_return(0),
                                 total_costs(0), cost_drag_pct(0), cost_adjusted_sharpe(0),
                                 regime_adjusted_score(0), overall_score(0),
                                 is_valid_for_live_trading(false) {}
};

// Backtest, Monte Carlo, walk-forward, VaR, cost and regime checks rolled into one 0-100 score
class ExtendedValidator {
public:
    ExtendedValidator(BacktestConfig backtest_config,
                      std::shared_ptr<PriceHistoryProvider> provider,
                      ValidationCriteria criteria = ValidationCriteria(),
                      MonteCarloConfig monte_carlo_config = MonteCarloConfig());

    ExtendedValidationResult validate(const StrategyFunction& strategy,
                                      const std::vector<std::string>& symbols,
                                      int trade_frequency_days = 7);

    // Defaults are an option-class TransactionCostModel and a RegimeDetector
    void setCostModel(std::shared_ptr<CostModel> cost_model);
    void setRegimeClassifier(std::shared_ptr<RegimeClassifier> classifier);

    // Enables walk-forward optimization over grid on every validate() call.
    // Throws ValidationError for a null factory.
    void setWalkForward(StrategyFactory factory, ParameterGrid grid,
                        WalkForwardConfig config = WalkForwardConfig());
    bool walkForwardEnabled() const { return static_cast<bool>(walk_forward_factory_); }

    const ValidationCriteria& criteria() const { return criteria_; }

    // Weighted 0-100 score; the Monte Carlo and walk-forward components are
    // skipped when absent and the remaining weights renormalized
    static double calculateOverallScore(const BacktestMetrics& backtest,
                                        const MonteCarloResult* monte_carlo,
                                        const WalkForwardResult* walk_forward,
                                        double cost_adjusted_sharpe, double regime_score);

    static std::string generateSummary(bool is_valid, double score, size_t num_failures);

    // Convert closed positions into cost-model trades: 100 units per contract,
    // short when the position opened for a net credit
    static std::vector<TradeRecord> toTradeRecords(const std::vector<OptionsPosition>& positions);

private:
    std::vector<std::string> checkBasicMetrics(const BacktestMetrics& metrics) const;
    std::vector<std::string> checkMonteCarlo(const MonteCarloResult& result) const;
    std::vector<std::string> checkWalkForward(const WalkForwardResult& result) const;
    void runCostAnalysis(const BacktestEngine& engine, const BacktestMetrics& metrics,
                         ExtendedValidationResult& result) const;

    static ExtendedValidationResult failedResult(const std::string& reason);

    BacktestConfig backtest_config_;
    std::shared_ptr<PriceHistoryProvider> provider_;
    ValidationCriteria criteria_;
    MonteCarloConfig monte_carlo_config_;
    std::shared_ptr<CostModel> cost_model_;
    std::shared_ptr<RegimeClassifier> regime_classifier_;

    StrategyFactory walk_forward_factory_;
    ParameterGrid walk_forward_grid_;
    WalkForwardConfig walk_forward_config_;
};

} // namespace optval
