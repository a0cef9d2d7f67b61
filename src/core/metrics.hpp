#pragma once

#include "options_position.hpp"
#include <map>
#include <string>
#include <vector>

namespace optval {

struct StrategyPerformance {
    int trades;
    double pnl;      // dollars
    double win_rate; // percent
    double avg_pnl;  // dollars

    StrategyPerformance() : trades(0), pnl(0), win_rate(0), avg_pnl(0) {}
};

// Summary of a completed backtest. Percent fields are in 0-100 units,
// money fields in dollars; avg_loss and largest_loss are positive magnitudes.
struct BacktestMetrics {
    std::string start_date;
    std::string end_date;
    int trading_days;

    // Returns
    double total_return;     // percent
    double cagr;             // percent
    double avg_daily_return; // fraction

    // Risk
    double sharpe_ratio;
    double sortino_ratio;
    double max_drawdown; // percent
    double avg_drawdown; // percent
    double calmar_ratio;

    // Trades
    int total_trades;
    int winning_trades;
    int losing_trades;
    double win_rate; // percent
    double profit_factor;
    double avg_win;
    double avg_loss;
    double avg_trade;
    double largest_win;
    double largest_loss;

    // Options-specific
    double avg_days_in_trade;
    double total_commissions;
    double commission_pct; // percent of net P&L

    // Average net Greeks per position at entry
    double avg_delta_exposure;
    double avg_gamma_exposure;
    double avg_theta_income;
    double avg_vega_exposure;

    std::map<std::string, StrategyPerformance> strategy_performance;

    BacktestMetrics() : trading_days(0), total_return(0), cagr(0), avg_daily_return(0),
                        sharpe_ratio(0), sortino_ratio(0), max_drawdown(0), avg_drawdown(0),
                        calmar_ratio(0), total_trades(0), winning_trades(0), losing_trades(0),
                        win_rate(0), profit_factor(0), avg_win(0), avg_loss(0), avg_trade(0),
                        largest_win(0), largest_loss(0), avg_days_in_trade(0),
                        total_commissions(0), commission_pct(0), avg_delta_exposure(0),
                        avg_gamma_exposure(0), avg_theta_income(0), avg_vega_exposure(0) {}
};

struct MetricsInput {
    const std::vector<OptionsPosition>* positions;
    const std::vector<double>* equity_curve;
    Date start_date;
    Date end_date;
    double initial_capital;
    double risk_free_rate;
    int trading_days;

    MetricsInput() : positions(nullptr), equity_curve(nullptr), initial_capital(0),
                     risk_free_rate(0), trading_days(0) {}
};

class MetricsCalculator {
public:
    // Reduce closed positions and the equity curve into a metrics record.
    // With no closed positions every numeric field is zero.
    static BacktestMetrics calculateBacktestMetrics(const MetricsInput& input);

    // Annualized Sharpe from daily returns; population std, rf subtracted per day
    static double calculateSharpeRatio(const std::vector<double>& returns,
                                       double risk_free_rate = 0.04);

    // Annualized Sortino; needs at least two negative returns
    static double calculateSortinoRatio(const std::vector<double>& returns,
                                        double risk_free_rate = 0.04);

    // Fractional drawdown of each point from its running peak (<= 0)
    static std::vector<double> calculateDrawdowns(const std::vector<double>& equity_curve);

    // Largest peak-to-trough decline as a positive fraction
    static double calculateMaxDrawdown(const std::vector<double>& equity_curve);

    static double calculateWinRate(const std::vector<OptionsPosition>& positions);

    static double calculateProfitFactor(const std::vector<OptionsPosition>& positions);

    static std::map<std::string, StrategyPerformance> calculateStrategyBreakdown(
        const std::vector<OptionsPosition>& positions);

private:
    static std::pair<std::vector<double>, std::vector<double>> splitWinsLosses(
        const std::vector<OptionsPosition>& positions);
};

} // namespace optval
