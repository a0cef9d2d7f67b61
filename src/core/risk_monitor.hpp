#pragma once

#include "var_calculator.hpp"
#include <map>
#include <string>
#include <vector>

namespace optval {

// Limits in percent
struct RiskLimits {
    double var_limit_pct;
    double daily_loss_limit_pct;
    double drawdown_limit_pct;
    double position_limit_pct;

    RiskLimits() : var_limit_pct(5.0), daily_loss_limit_pct(2.0), drawdown_limit_pct(10.0),
                   position_limit_pct(25.0) {}
};

enum class AlertLevel {
    Warning,
    Critical,
    Emergency
};

std::string toString(AlertLevel level);

struct RiskAlert {
    AlertLevel level;
    std::string message;
    std::string metric;
    double current_value;
    double threshold;
    std::string timestamp;
    std::string action_required;

    RiskAlert() : level(AlertLevel::Warning), current_value(0), threshold(0) {}
};

struct RiskSummary {
    double portfolio_value;
    double var_95;
    double var_95_pct; // positive loss percentage
    double var_99;
    double cvar_95;
    double cvar_99;
    double current_drawdown_pct;
    double max_drawdown_limit_pct;
    double daily_pnl_pct;
    double daily_loss_limit_pct;
    double peak_value;
    bool can_trade;
    std::string trading_status;
    size_t active_alerts;
    std::string timestamp;

    RiskSummary() : portfolio_value(0), var_95(0), var_95_pct(0), var_99(0), cvar_95(0), cvar_99(0),
                    current_drawdown_pct(0), max_drawdown_limit_pct(0), daily_pnl_pct(0),
                    daily_loss_limit_pct(0), peak_value(0), can_trade(true), active_alerts(0) {}
};

// Stateful session guard: tracks the peak and the day's starting value and
// pauses or halts trading when limits are breached
class RiskMonitor {
public:
    explicit RiskMonitor(RiskLimits limits = RiskLimits());

    // Run every check, append the new alerts to the log and return them.
    // positions maps symbol -> position value.
    std::vector<RiskAlert> checkRisk(double portfolio_value, const std::vector<double>& returns,
                                     const std::map<std::string, double>& positions = {});

    // Reset the daily baseline and clear a pause; a halt stays in force
    void startNewDay(double portfolio_value);

    bool canTrade() const;
    std::string tradingStatus() const;

    RiskSummary riskSummary(double portfolio_value, const std::vector<double>& returns) const;

    // Clear the alert log, returning how many alerts were removed
    size_t resetAlerts();

    const std::vector<RiskAlert>& alerts() const { return alerts_; }
    const RiskLimits& limits() const { return limits_; }
    bool isPaused() const { return paused_; }
    bool isHalted() const { return halted_; }
    double peakValue() const { return peak_value_; }

private:
    static RiskAlert makeAlert(AlertLevel level, const std::string& metric, const std::string& message,
                               double current_value, double threshold, const std::string& action);

    RiskLimits limits_;
    VaRCalculator var_calculator_;

    double peak_value_;
    double daily_starting_value_;
    bool paused_;
    bool halted_;
    std::vector<RiskAlert> alerts_;
};

} // namespace optval
