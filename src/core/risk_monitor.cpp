#include "risk_monitor.hpp"
#include "../utils/format_utils.hpp"
#include "../utils/logger.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace optval {

namespace {

const char* kSource = "RiskMonitor";

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace

std::string toString(AlertLevel level) {
    switch (level) {
        case AlertLevel::Warning: return "warning";
        case AlertLevel::Critical: return "critical";
        case AlertLevel::Emergency: return "emergency";
    }
    return "unknown";
}

RiskMonitor::RiskMonitor(RiskLimits limits)
    : limits_(limits), var_calculator_(VaRConfig()), peak_value_(0), daily_starting_value_(0),
      paused_(false), halted_(false) {
    Logger::instance().info(kSource, "Initialized: VaR limit=" + FormatUtils::fixed(limits_.var_limit_pct, 1) +
                                     "%, daily loss=" + FormatUtils::fixed(limits_.daily_loss_limit_pct, 1) +
                                     "%, drawdown=" + FormatUtils::fixed(limits_.drawdown_limit_pct, 1) + "%");
}

std::vector<RiskAlert> RiskMonitor::checkRisk(double portfolio_value,
                                              const std::vector<double>& returns,
                                              const std::map<std::string, double>& positions) {
    std::vector<RiskAlert> alerts;

    if (portfolio_value > peak_value_) {
        peak_value_ = portfolio_value;
    }

    // VaR
    VaRResult var_result = var_calculator_.calculateVaR(returns, portfolio_value);
    double var_pct = var_result.var95LossPct();
    if (var_pct > limits_.var_limit_pct) {
        AlertLevel level = var_pct < limits_.var_limit_pct * 1.5 ? AlertLevel::Warning
                                                                 : AlertLevel::Critical;
        alerts.push_back(makeAlert(level, "var_95",
                                   "VaR 95% (" + FormatUtils::fixed(var_pct) + "%) exceeds limit (" +
                                       FormatUtils::fixed(limits_.var_limit_pct, 1) + "%)",
                                   var_pct, limits_.var_limit_pct,
                                   "Reduce position sizes or hedge exposure"));
    }

    // Daily loss
    if (daily_starting_value_ > 0) {
        double daily_pnl_pct = (portfolio_value - daily_starting_value_) / daily_starting_value_ * 100.0;
        if (daily_pnl_pct < -limits_.daily_loss_limit_pct) {
            alerts.push_back(makeAlert(AlertLevel::Critical, "daily_pnl",
                                       "Daily loss (" + FormatUtils::fixed(daily_pnl_pct) + "%) exceeds limit (" +
                                           FormatUtils::fixed(-limits_.daily_loss_limit_pct, 1) + "%)",
                                       daily_pnl_pct, -limits_.daily_loss_limit_pct,
                                       "PAUSE trading for remainder of day"));
            paused_ = true;
        }
    }

    // Drawdown from peak
    if (peak_value_ > 0) {
        double drawdown_pct = (peak_value_ - portfolio_value) / peak_value_ * 100.0;
        if (drawdown_pct > limits_.drawdown_limit_pct) {
            alerts.push_back(makeAlert(AlertLevel::Emergency, "drawdown",
                                       "Drawdown (" + FormatUtils::fixed(drawdown_pct) + "%) exceeds limit (" +
                                           FormatUtils::fixed(limits_.drawdown_limit_pct, 1) + "%)",
                                       drawdown_pct, limits_.drawdown_limit_pct,
                                       "HALT all trading. Manual review required."));
            halted_ = true;
        }
    }

    // Concentration
    if (!positions.empty()) {
        double total_value = 0.0;
        for (const auto& [symbol, value] : positions) {
            total_value += std::abs(value);
        }
        for (const auto& [symbol, value] : positions) {
            double concentration = total_value > 0 ? std::abs(value) / total_value * 100.0 : 0.0;
            if (concentration > limits_.position_limit_pct) {
                alerts.push_back(makeAlert(AlertLevel::Warning, "concentration",
                                           symbol + " concentration (" + FormatUtils::fixed(concentration, 1) +
                                               "%) exceeds limit (" +
                                               FormatUtils::fixed(limits_.position_limit_pct, 1) + "%)",
                                           concentration, limits_.position_limit_pct,
                                           "Reduce " + symbol + " position or diversify"));
            }
        }
    }

    for (const auto& alert : alerts) {
        LogLevel log_level = alert.level == AlertLevel::Warning ? LogLevel::Warning : LogLevel::Error;
        Logger::instance().write(log_level, kSource,
                                 "[" + toString(alert.level) + "] " + alert.message);
    }

    alerts_.insert(alerts_.end(), alerts.begin(), alerts.end());
    return alerts;
}

void RiskMonitor::startNewDay(double portfolio_value) {
    daily_starting_value_ = portfolio_value;
    paused_ = false;

    Logger::instance().info(kSource, "New trading day started. Portfolio: " +
                                     FormatUtils::money(portfolio_value));
}

bool RiskMonitor::canTrade() const {
    return !halted_ && !paused_;
}

std::string RiskMonitor::tradingStatus() const {
    if (halted_) return "Trading HALTED due to drawdown limit breach";
    if (paused_) return "Trading PAUSED due to daily loss limit breach";
    return "Trading allowed";
}

RiskSummary RiskMonitor::riskSummary(double portfolio_value, const std::vector<double>& returns) const {
    VaRResult var_result = var_calculator_.calculateVaR(returns, portfolio_value);

    RiskSummary summary;
    summary.portfolio_value = portfolio_value;
    summary.var_95 = var_result.var_95;
    summary.var_95_pct = var_result.var95LossPct();
    summary.var_99 = var_result.var_99;
    summary.cvar_95 = var_result.cvar_95;
    summary.cvar_99 = var_result.cvar_99;
    summary.current_drawdown_pct = peak_value_ > 0 ? (peak_value_ - portfolio_value) / peak_value_ * 100.0 : 0.0;
    summary.max_drawdown_limit_pct = limits_.drawdown_limit_pct;
    summary.daily_pnl_pct = daily_starting_value_ > 0
        ? (portfolio_value - daily_starting_value_) / daily_starting_value_ * 100.0
        : 0.0;
    summary.daily_loss_limit_pct = limits_.daily_loss_limit_pct;
    summary.peak_value = peak_value_;
    summary.can_trade = canTrade();
    summary.trading_status = tradingStatus();
    summary.active_alerts = alerts_.size();
    summary.timestamp = isoTimestamp();
    return summary;
}

size_t RiskMonitor::resetAlerts() {
    size_t count = alerts_.size();
    alerts_.clear();
    return count;
}

RiskAlert RiskMonitor::makeAlert(AlertLevel level, const std::string& metric,
                                 const std::string& message, double current_value,
                                 double threshold, const std::string& action) {
    RiskAlert alert;
    alert.level = level;
    alert.metric = metric;
    alert.message = message;
    alert.current_value = current_value;
    alert.threshold = threshold;
    alert.timestamp = isoTimestamp();
    alert.action_required = action;
    return alert;
}

} // namespace optval
