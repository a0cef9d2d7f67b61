#include "core/risk_monitor.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>

using namespace optval;

class RiskMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Disabled);
        calm = std::vector<double>(60, 0.001);
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::Info);
    }

    std::vector<double> calm;
};

TEST_F(RiskMonitorTest, CalmMarketRaisesNothing) {
    RiskMonitor monitor;
    auto alerts = monitor.checkRisk(100000.0, calm);

    EXPECT_TRUE(alerts.empty());
    EXPECT_TRUE(monitor.canTrade());
    EXPECT_EQ(monitor.tradingStatus(), "Trading allowed");
    EXPECT_DOUBLE_EQ(monitor.peakValue(), 100000.0);
}

TEST_F(RiskMonitorTest, VaRBreachSeverityTiers) {
    RiskMonitor monitor;

    auto warning = monitor.checkRisk(100000.0, std::vector<double>(30, -0.06));
    ASSERT_EQ(warning.size(), 1u);
    EXPECT_EQ(warning[0].metric, "var_95");
    EXPECT_EQ(warning[0].level, AlertLevel::Warning);
    EXPECT_NEAR(warning[0].current_value, 6.0, 1e-9);
    EXPECT_DOUBLE_EQ(warning[0].threshold, 5.0);
    EXPECT_FALSE(warning[0].timestamp.empty());

    auto critical = monitor.checkRisk(100000.0, std::vector<double>(30, -0.09));
    ASSERT_EQ(critical.size(), 1u);
    EXPECT_EQ(critical[0].level, AlertLevel::Critical);

    // VaR alerts never stop trading on their own
    EXPECT_TRUE(monitor.canTrade());
    EXPECT_EQ(monitor.alerts().size(), 2u);
}

TEST_F(RiskMonitorTest, DailyLossPausesUntilNextDay) {
    RiskMonitor monitor;
    monitor.startNewDay(100000.0);

    auto alerts = monitor.checkRisk(97000.0, calm);

    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].metric, "daily_pnl");
    EXPECT_EQ(alerts[0].level, AlertLevel::Critical);
    EXPECT_NEAR(alerts[0].current_value, -3.0, 1e-9);
    EXPECT_TRUE(monitor.isPaused());
    EXPECT_FALSE(monitor.canTrade());
    EXPECT_EQ(monitor.tradingStatus(), "Trading PAUSED due to daily loss limit breach");

    monitor.startNewDay(97000.0);
    EXPECT_TRUE(monitor.canTrade());
}

TEST_F(RiskMonitorTest, DrawdownHaltSurvivesNewDay) {
    RiskMonitor monitor;
    monitor.checkRisk(120000.0, calm);

    auto alerts = monitor.checkRisk(102000.0, calm);

    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].metric, "drawdown");
    EXPECT_EQ(alerts[0].level, AlertLevel::Emergency);
    EXPECT_NEAR(alerts[0].current_value, 15.0, 1e-9);
    EXPECT_TRUE(monitor.isHalted());

    monitor.startNewDay(102000.0);
    EXPECT_FALSE(monitor.canTrade());
    EXPECT_EQ(monitor.tradingStatus(), "Trading HALTED due to drawdown limit breach");
    EXPECT_DOUBLE_EQ(monitor.peakValue(), 120000.0);
}

TEST_F(RiskMonitorTest, ConcentrationPerSymbol) {
    RiskMonitor monitor;
    std::map<std::string, double> positions{{"SPY", 60000.0}, {"QQQ", -20000.0}, {"IWM", 20000.0}};

    auto alerts = monitor.checkRisk(100000.0, calm, positions);

    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].metric, "concentration");
    EXPECT_EQ(alerts[0].level, AlertLevel::Warning);
    EXPECT_NEAR(alerts[0].current_value, 60.0, 1e-9);
    EXPECT_NE(alerts[0].message.find("SPY"), std::string::npos);
    EXPECT_TRUE(monitor.canTrade());
}

TEST_F(RiskMonitorTest, CustomLimits) {
    RiskLimits limits;
    limits.daily_loss_limit_pct = 5.0;
    RiskMonitor monitor(limits);
    monitor.startNewDay(100000.0);

    EXPECT_TRUE(monitor.checkRisk(97000.0, calm).empty());
    EXPECT_DOUBLE_EQ(monitor.limits().daily_loss_limit_pct, 5.0);
}

TEST_F(RiskMonitorTest, SummaryAndReset) {
    RiskMonitor monitor;
    monitor.startNewDay(100000.0);
    monitor.checkRisk(100000.0, std::vector<double>(30, -0.06));
    monitor.checkRisk(99000.0, std::vector<double>(30, -0.06));

    auto summary = monitor.riskSummary(99000.0, std::vector<double>(30, -0.06));
    EXPECT_NEAR(summary.var_95, -0.06 * 99000.0, 1e-6);
    EXPECT_NEAR(summary.var_95_pct, 6.0, 1e-9);
    EXPECT_NEAR(summary.current_drawdown_pct, 1.0, 1e-9);
    EXPECT_NEAR(summary.daily_pnl_pct, -1.0, 1e-9);
    EXPECT_DOUBLE_EQ(summary.peak_value, 100000.0);
    EXPECT_TRUE(summary.can_trade);
    EXPECT_EQ(summary.active_alerts, 2u);

    EXPECT_EQ(monitor.resetAlerts(), 2u);
    EXPECT_TRUE(monitor.alerts().empty());
    EXPECT_EQ(monitor.resetAlerts(), 0u);
}

TEST_F(RiskMonitorTest, ShortReturnHistorySkipsVaR) {
    RiskMonitor monitor;
    auto alerts = monitor.checkRisk(100000.0, {-0.5, -0.5});
    EXPECT_TRUE(alerts.empty());

    auto summary = monitor.riskSummary(100000.0, {});
    EXPECT_DOUBLE_EQ(summary.var_95, 0.0);
}
