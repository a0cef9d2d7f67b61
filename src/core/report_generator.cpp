#include "report_generator.hpp"
#include "../utils/format_utils.hpp"
#include <iomanip>
#include <sstream>

namespace optval {

namespace {

constexpr int kWidth = 80;

// How a strategy should trade in the given regime
std::vector<std::string> regimeImplications(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BullLowVol:
            return {"Favorable for trend-following and short premium",
                    "Full position sizes acceptable"};
        case MarketRegime::BullHighVol:
            return {"Trend intact but wider swings expected",
                    "Reduce size and widen strikes"};
        case MarketRegime::BearLowVol:
            return {"Orderly decline; favor bearish or neutral structures",
                    "Avoid naked short puts"};
        case MarketRegime::BearHighVol:
            return {"Elevated risk of sharp moves",
                    "Use defined-risk spreads and small sizes"};
        case MarketRegime::RangingLowVol:
            return {"Mean-reversion and premium selling favored",
                    "Iron condors and credit spreads fit this regime"};
        case MarketRegime::RangingHighVol:
            return {"Choppy conditions with large intraday ranges",
                    "Reduce trading frequency"};
        case MarketRegime::Crisis:
            return {"CRISIS MODE: Minimize exposure",
                    "Consider hedging or moving to cash"};
    }
    return {};
}

} // namespace

std::string ReportGenerator::rule(char c) {
    return std::string(kWidth, c) + "\n";
}

std::string ReportGenerator::row(const std::string& label, const std::string& value) {
    std::ostringstream oss;
    oss << "  " << std::left << std::setw(28) << label << value << "\n";
    return oss.str();
}

std::string ReportGenerator::backtestReport(const BacktestMetrics& m) {
    std::ostringstream out;

    out << rule() << "OPTIONS BACKTEST REPORT\n" << rule();
    out << "\nPeriod: " << m.start_date << " to " << m.end_date
        << " (" << m.trading_days << " periods)\n";

    out << "\nRETURNS\n" << rule('-');
    out << row("Total Return:", FormatUtils::percent(m.total_return, 2));
    out << row("CAGR:", FormatUtils::percent(m.cagr, 2));
    out << row("Avg Period Return:", FormatUtils::percent(m.avg_daily_return * 100.0, 3));

    out << "\nRISK\n" << rule('-');
    out << row("Sharpe Ratio:", FormatUtils::fixed(m.sharpe_ratio));
    out << row("Sortino Ratio:", FormatUtils::fixed(m.sortino_ratio));
    out << row("Max Drawdown:", FormatUtils::percent(m.max_drawdown, 2));
    out << row("Avg Drawdown:", FormatUtils::percent(m.avg_drawdown, 2));
    out << row("Calmar Ratio:", FormatUtils::fixed(m.calmar_ratio));

    out << "\nTRADE STATISTICS\n" << rule('-');
    out << row("Total Trades:", std::to_string(m.total_trades));
    out << row("Winning / Losing:", std::to_string(m.winning_trades) + " / " +
                                    std::to_string(m.losing_trades));
    out << row("Win Rate:", FormatUtils::percent(m.win_rate));
    out << row("Profit Factor:", FormatUtils::fixed(m.profit_factor));
    out << row("Avg Win:", FormatUtils::money(m.avg_win));
    out << row("Avg Loss:", FormatUtils::money(m.avg_loss));
    out << row("Avg Trade:", FormatUtils::money(m.avg_trade));
    out << row("Largest Win:", FormatUtils::money(m.largest_win));
    out << row("Largest Loss:", FormatUtils::money(m.largest_loss));

    out << "\nOPTIONS ANALYTICS\n" << rule('-');
    out << row("Avg Days in Trade:", FormatUtils::fixed(m.avg_days_in_trade, 1));
    out << row("Total Commissions:", FormatUtils::money(m.total_commissions));
    out << row("Commission % of P/L:", FormatUtils::percent(m.commission_pct));
    out << row("Avg Delta:", FormatUtils::fixed(m.avg_delta_exposure, 4));
    out << row("Avg Gamma:", FormatUtils::fixed(m.avg_gamma_exposure, 4));
    out << row("Avg Theta:", FormatUtils::fixed(m.avg_theta_income, 4));
    out << row("Avg Vega:", FormatUtils::fixed(m.avg_vega_exposure, 4));

    if (!m.strategy_performance.empty()) {
        out << "\nSTRATEGY PERFORMANCE\n" << rule('-');
        for (const auto& [name, perf] : m.strategy_performance) {
            out << "  " << name << ": " << perf.trades << " trades, P/L "
                << FormatUtils::money(perf.pnl) << ", win rate "
                << FormatUtils::percent(perf.win_rate) << ", avg "
                << FormatUtils::money(perf.avg_pnl) << "\n";
        }
    }

    out << rule();
    return out.str();
}

std::string ReportGenerator::monteCarloReport(const MonteCarloResult& r) {
    std::ostringstream out;

    out << rule() << "MONTE CARLO SIMULATION\n" << rule();
    out << "Method: " << toString(r.method) << ", " << r.num_simulations << " simulations over "
        << r.num_observations << " observations\n\n";

    auto band = [](const MetricDistribution& d, int precision, double scale) {
        return FormatUtils::fixed(d.original * scale, precision) + " (mean " +
               FormatUtils::fixed(d.mean * scale, precision) + ", 95% CI [" +
               FormatUtils::fixed(d.lower_95 * scale, precision) + ", " +
               FormatUtils::fixed(d.upper_95 * scale, precision) + "])";
    };

    out << row("Sharpe:", band(r.sharpe, 2, 1.0));
    out << row("Total Return %:", band(r.total_return, 2, 100.0));
    out << row("Max Drawdown %:", band(r.max_drawdown, 2, 100.0));
    out << row("Probability of Loss:", FormatUtils::percent(r.prob_loss * 100.0));
    out << row("Probability of Ruin:", FormatUtils::percent(r.prob_ruin * 100.0));
    out << row("VaR 95% (return):", FormatUtils::percent(r.var_95 * 100.0, 2));
    out << row("Expected Shortfall 95%:", FormatUtils::percent(r.expected_shortfall_95 * 100.0, 2));
    out << row("Path Dependency:", FormatUtils::fixed(r.path_dependency_score, 3));

    out << rule();
    return out.str();
}

std::string ReportGenerator::stressReport(const std::map<std::string, MonteCarloResult>& results) {
    std::ostringstream out;

    out << rule() << "STRESS TEST SCENARIOS\n" << rule();
    out << "  " << std::left << std::setw(20) << "Scenario" << std::right
        << std::setw(12) << "Sharpe" << std::setw(14) << "Return %"
        << std::setw(14) << "P(Loss) %" << std::setw(14) << "P(Ruin) %" << "\n";
    out << rule('-');

    for (const auto& [name, r] : results) {
        out << "  " << std::left << std::setw(20) << name << std::right
            << std::setw(12) << FormatUtils::fixed(r.sharpe.mean)
            << std::setw(14) << FormatUtils::fixed(r.total_return.mean * 100.0)
            << std::setw(14) << FormatUtils::fixed(r.prob_loss * 100.0, 1)
            << std::setw(14) << FormatUtils::fixed(r.prob_ruin * 100.0, 1) << "\n";
    }

    out << rule();
    return out.str();
}

std::string ReportGenerator::varReport(const VaRResult& r) {
    std::ostringstream out;

    out << rule() << "VALUE AT RISK\n" << rule();
    out << row("Method:", toString(r.method));
    if (!r.volatility_model.empty()) {
        out << row("Volatility Model:", r.volatility_model);
    }
    out << row("Horizon:", std::to_string(r.horizon_days) + " day(s)");
    out << row("Portfolio Value:", FormatUtils::money(r.portfolio_value));
    out << "\n";
    out << row("VaR 95%:", FormatUtils::money(r.var_95) + " (" + FormatUtils::percent(r.var95LossPct(), 2) + ")");
    out << row("VaR 99%:", FormatUtils::money(r.var_99) + " (" + FormatUtils::percent(r.var99LossPct(), 2) + ")");
    out << row("CVaR 95%:", FormatUtils::money(r.cvar_95));
    out << row("CVaR 99%:", FormatUtils::money(r.cvar_99));

    if (r.confidence_levels.size() > 2) {
        out << "\nAll confidence levels:\n";
        for (const auto& [level, value] : r.confidence_levels) {
            out << row(FormatUtils::percent(level * 100.0) + ":", FormatUtils::money(value));
        }
    }

    out << rule();
    return out.str();
}

std::string ReportGenerator::regimeReport(const RegimeState& regime) {
    std::ostringstream out;

    out << row("Regime:", toString(regime.market_regime));
    out << row("Volatility:", toString(regime.volatility_regime) + " (" +
                              FormatUtils::fixed(regime.volatility_percentile, 0) + "th percentile)");
    out << row("Trend:", toString(regime.trend_regime) + " (strength " +
                         FormatUtils::signedFixed(regime.trend_strength) + ")");
    out << row("Confidence:", FormatUtils::percent(regime.regime_confidence * 100.0, 0));
    out << row("Position Scale:", FormatUtils::percent(regime.recommended_position_scale * 100.0, 0));

    out << "\n  Trading implications:\n";
    for (const auto& line : regimeImplications(regime.market_regime)) {
        out << "    - " << line << "\n";
    }
    return out.str();
}

std::string ReportGenerator::validationReport(const ExtendedValidationResult& result) {
    std::ostringstream out;

    out << rule() << "EXTENDED STRATEGY VALIDATION REPORT\n" << rule();

    out << "\nOVERALL ASSESSMENT\n" << rule('-');
    out << "  " << result.validation_summary << "\n";
    out << row("Overall Score:", FormatUtils::fixed(result.overall_score, 1) + "/100");
    out << row("Ready for Live Trading:", result.is_valid_for_live_trading ? "YES" : "NO");

    if (result.backtest) {
        const auto& m = *result.backtest;
        out << "\nBASIC BACKTEST METRICS\n" << rule('-');
        out << row("Total Return:", FormatUtils::percent(m.total_return, 2));
        out << row("Sharpe Ratio:", FormatUtils::fixed(m.sharpe_ratio));
        out << row("Max Drawdown:", FormatUtils::percent(m.max_drawdown, 2));
        out << row("Win Rate:", FormatUtils::percent(m.win_rate));
        out << row("Total Trades:", std::to_string(m.total_trades));
    }

    if (result.monte_carlo) {
        const auto& mc = *result.monte_carlo;
        out << "\nMONTE CARLO SIMULATION (" << mc.num_simulations << " runs)\n" << rule('-');
        out << row("Mean Sharpe:", FormatUtils::fixed(mc.sharpe.mean));
        out << row("Sharpe 95% CI:", "[" + FormatUtils::fixed(mc.sharpe.lower_95) + ", " +
                                     FormatUtils::fixed(mc.sharpe.upper_95) + "]");
        out << row("Probability of Profit:", FormatUtils::percent((1.0 - mc.prob_loss) * 100.0));
        out << row("Probability of Ruin:", FormatUtils::percent(mc.prob_ruin * 100.0));
        out << row("Path Dependency:", FormatUtils::fixed(mc.path_dependency_score, 3));
        out << row("Status:", result.monte_carlo_valid ? "PASSED" : "FAILED");
    }

    if (result.walk_forward) {
        const auto& wf = *result.walk_forward;
        out << "\nWALK-FORWARD ANALYSIS (" << wf.folds.size() << " folds)\n" << rule('-');
        out << row("Efficiency Ratio:", FormatUtils::fixed(wf.mean_efficiency_ratio));
        out << row("Overfitting Score:", FormatUtils::fixed(wf.overfitting_score));
        out << row("IS to OOS Degradation:", FormatUtils::percent(wf.degradation * 100.0));
        out << row("Parameter Stability:", FormatUtils::fixed(wf.mean_param_stability));
        out << row("Fold Consistency:", FormatUtils::percent(wf.fold_consistency * 100.0, 0));
        out << row("Status:", result.walk_forward_valid ? "PASSED" : "FAILED");
    }

    if (result.var) {
        const auto& v = *result.var;
        out << "\nVALUE AT RISK\n" << rule('-');
        out << row("VaR 95%:", FormatUtils::money(v.var_95) + " (" + FormatUtils::percent(v.var95LossPct(), 2) + ")");
        out << row("CVaR 95%:", FormatUtils::money(v.cvar_95));
    }

    out << "\nTRANSACTION COST ANALYSIS\n" << rule('-');
    out << row("Gross Return:", FormatUtils::percent(result.gross_return, 2));
    out << row("Net Return:", FormatUtils::percent(result.net_return, 2));
    out << row("Total Costs:", FormatUtils::money(result.total_costs));
    out << row("Cost Drag:", FormatUtils::percent(result.cost_drag_pct));
    out << row("Cost-Adjusted Sharpe:", FormatUtils::fixed(result.cost_adjusted_sharpe));

    if (result.regime) {
        out << "\nMARKET REGIME ANALYSIS\n" << rule('-');
        out << regimeReport(*result.regime);
    }

    if (!result.all_failures.empty()) {
        out << "\nALL VALIDATION FAILURES\n" << rule('-');
        for (size_t i = 0; i < result.all_failures.size(); ++i) {
            out << "  " << (i + 1) << ". " << result.all_failures[i] << "\n";
        }
    }

    if (!result.recommendations.empty()) {
        out << "\nRECOMMENDATIONS\n" << rule('-');
        for (const auto& rec : result.recommendations) {
            out << "  - " << rec << "\n";
        }
    }

    out << rule();
    return out.str();
}

} // namespace optval
