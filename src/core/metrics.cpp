#include "metrics.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace optval {

BacktestMetrics MetricsCalculator::calculateBacktestMetrics(const MetricsInput& input) {
    BacktestMetrics metrics;
    metrics.start_date = DateUtils::formatDate(input.start_date);
    metrics.end_date = DateUtils::formatDate(input.end_date);

    if (!input.positions || input.positions->empty()) {
        return metrics;
    }

    const auto& positions = *input.positions;
    const std::vector<double> empty_curve;
    const auto& equity_curve = input.equity_curve ? *input.equity_curve : empty_curve;

    metrics.trading_days = input.trading_days;

    // Trade statistics
    auto [wins, losses] = splitWinsLosses(positions);
    double total_pnl = 0.0;
    for (const auto& p : positions) {
        total_pnl += p.pnl();
    }

    metrics.total_trades = static_cast<int>(positions.size());
    metrics.winning_trades = static_cast<int>(wins.size());
    metrics.losing_trades = static_cast<int>(losses.size());
    metrics.win_rate = calculateWinRate(positions);
    metrics.profit_factor = calculateProfitFactor(positions);
    metrics.avg_win = Statistics::mean(wins);
    metrics.avg_loss = Statistics::mean(losses);
    metrics.largest_win = wins.empty() ? 0.0 : *std::max_element(wins.begin(), wins.end());
    metrics.largest_loss = losses.empty() ? 0.0 : *std::max_element(losses.begin(), losses.end());
    metrics.avg_trade = total_pnl / metrics.total_trades;

    // Returns
    double final_capital = input.initial_capital + total_pnl;
    if (input.initial_capital > 0) {
        metrics.total_return = total_pnl / input.initial_capital * 100.0;

        double years = DateUtils::yearsBetween(input.start_date, input.end_date);
        if (years > 0 && final_capital > 0) {
            metrics.cagr = (std::pow(final_capital / input.initial_capital, 1.0 / years) - 1.0) * 100.0;
        }
    }

    auto daily_returns = Statistics::returnsFromEquity(equity_curve);
    metrics.avg_daily_return = Statistics::mean(daily_returns);
    metrics.sharpe_ratio = calculateSharpeRatio(daily_returns, input.risk_free_rate);
    metrics.sortino_ratio = calculateSortinoRatio(daily_returns, input.risk_free_rate);

    // Drawdown analysis
    auto drawdowns = calculateDrawdowns(equity_curve);
    metrics.max_drawdown = calculateMaxDrawdown(equity_curve) * 100.0;

    std::vector<double> underwater;
    for (double dd : drawdowns) {
        if (dd < 0) underwater.push_back(dd);
    }
    metrics.avg_drawdown = underwater.empty() ? 0.0 : std::abs(Statistics::mean(underwater)) * 100.0;
    metrics.calmar_ratio = metrics.max_drawdown > 0 ? std::abs(metrics.cagr / metrics.max_drawdown) : 0.0;

    // Options-specific metrics
    double days_sum = 0.0;
    Greeks greek_sum;
    for (const auto& p : positions) {
        days_sum += p.daysInTrade();
        metrics.total_commissions += p.commission();
        greek_sum.delta += p.netGreeks().delta;
        greek_sum.gamma += p.netGreeks().gamma;
        greek_sum.theta += p.netGreeks().theta;
        greek_sum.vega += p.netGreeks().vega;
    }

    double n = static_cast<double>(positions.size());
    metrics.avg_days_in_trade = days_sum / n;
    metrics.commission_pct = total_pnl > 0 ? metrics.total_commissions / total_pnl * 100.0 : 0.0;
    metrics.avg_delta_exposure = greek_sum.delta / n;
    metrics.avg_gamma_exposure = greek_sum.gamma / n;
    metrics.avg_theta_income = greek_sum.theta / n;
    metrics.avg_vega_exposure = greek_sum.vega / n;

    metrics.strategy_performance = calculateStrategyBreakdown(positions);

    return metrics;
}

double MetricsCalculator::calculateSharpeRatio(const std::vector<double>& returns,
                                               double risk_free_rate) {
    if (returns.size() < 2) return 0.0;

    double std_return = Statistics::populationStdDev(returns);
    if (std_return <= 0) return 0.0;

    double excess = Statistics::mean(returns) - risk_free_rate / 252.0;
    return excess / std_return * std::sqrt(252.0);
}

double MetricsCalculator::calculateSortinoRatio(const std::vector<double>& returns,
                                                double risk_free_rate) {
    std::vector<double> negative_returns;
    for (double r : returns) {
        if (r < 0) negative_returns.push_back(r);
    }
    if (negative_returns.size() < 2) return 0.0;

    double downside_std = Statistics::populationStdDev(negative_returns);
    if (downside_std <= 0) return 0.0;

    double excess = Statistics::mean(returns) - risk_free_rate / 252.0;
    return excess / downside_std * std::sqrt(252.0);
}

std::vector<double> MetricsCalculator::calculateDrawdowns(const std::vector<double>& equity_curve) {
    std::vector<double> drawdowns;
    drawdowns.reserve(equity_curve.size());

    double peak = equity_curve.empty() ? 0.0 : equity_curve.front();
    for (double value : equity_curve) {
        peak = std::max(peak, value);
        drawdowns.push_back(peak > 0 ? (value - peak) / peak : 0.0);
    }
    return drawdowns;
}

double MetricsCalculator::calculateMaxDrawdown(const std::vector<double>& equity_curve) {
    auto drawdowns = calculateDrawdowns(equity_curve);
    if (drawdowns.empty()) return 0.0;
    return std::abs(*std::min_element(drawdowns.begin(), drawdowns.end()));
}

double MetricsCalculator::calculateWinRate(const std::vector<OptionsPosition>& positions) {
    if (positions.empty()) return 0.0;

    auto winners = std::count_if(positions.begin(), positions.end(),
                                 [](const OptionsPosition& p) { return p.pnl() > 0; });
    return static_cast<double>(winners) / positions.size() * 100.0;
}

double MetricsCalculator::calculateProfitFactor(const std::vector<OptionsPosition>& positions) {
    auto [wins, losses] = splitWinsLosses(positions);
    double gross_profit = std::accumulate(wins.begin(), wins.end(), 0.0);
    double gross_loss = std::accumulate(losses.begin(), losses.end(), 0.0);
    return gross_loss > 0 ? gross_profit / gross_loss : 0.0;
}

std::map<std::string, StrategyPerformance> MetricsCalculator::calculateStrategyBreakdown(
    const std::vector<OptionsPosition>& positions) {
    std::map<std::string, StrategyPerformance> breakdown;
    std::map<std::string, int> winners;

    for (const auto& p : positions) {
        auto& perf = breakdown[toString(p.category())];
        perf.trades += 1;
        perf.pnl += p.pnl();
        if (p.pnl() > 0) {
            winners[toString(p.category())] += 1;
        }
    }

    for (auto& [name, perf] : breakdown) {
        perf.win_rate = static_cast<double>(winners[name]) / perf.trades * 100.0;
        perf.avg_pnl = perf.pnl / perf.trades;
    }
    return breakdown;
}

std::pair<std::vector<double>, std::vector<double>> MetricsCalculator::splitWinsLosses(
    const std::vector<OptionsPosition>& positions) {
    std::vector<double> wins;
    std::vector<double> losses;
    for (const auto& p : positions) {
        if (p.pnl() > 0) {
            wins.push_back(p.pnl());
        } else if (p.pnl() < 0) {
            losses.push_back(std::abs(p.pnl()));
        }
    }
    return {wins, losses};
}

} // namespace optval
