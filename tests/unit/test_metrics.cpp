#include "core/metrics.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace optval;

class MetricsCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        start = DateUtils::parseDate("2024-01-01");
        end = DateUtils::parseDate("2025-01-01");

        // Two winners and one loser from the same short call
        positions.push_back(closedShortCall(StrategyCategory::CoveredCall, 0.0));
        positions.push_back(closedShortCall(StrategyCategory::CoveredCall, 5.0));
        positions.push_back(closedShortCall(StrategyCategory::CashSecuredPut, 0.0));

        equity = {100000.0, 100248.70, 99997.40, 100246.10};
    }

    OptionsPosition closedShortCall(StrategyCategory category, double exit_premium) {
        Date entry = DateUtils::parseDate("2024-03-01");
        Date expiry = DateUtils::parseDate("2024-03-31");
        Greeks g;
        g.delta = 0.3;
        std::vector<OptionLeg> legs{OptionLeg(OptionType::Call, 105.0, expiry, -1, 2.50, g)};
        OptionsPosition position("SPY", category, legs, entry, 100.0);
        position.calculateEntryCost(0.65);
        position.setExit(expiry, 100.0);
        position.calculatePnl({exit_premium}, 0.65);
        return position;
    }

    MetricsInput input() const {
        MetricsInput in;
        in.positions = &positions;
        in.equity_curve = &equity;
        in.start_date = start;
        in.end_date = end;
        in.initial_capital = 100000.0;
        in.risk_free_rate = 0.04;
        in.trading_days = static_cast<int>(equity.size()) - 1;
        return in;
    }

    Date start;
    Date end;
    std::vector<OptionsPosition> positions;
    std::vector<double> equity;
};

TEST_F(MetricsCalculatorTest, TradeStatistics) {
    auto m = MetricsCalculator::calculateBacktestMetrics(input());

    EXPECT_EQ(m.total_trades, 3);
    EXPECT_EQ(m.winning_trades, 2);
    EXPECT_EQ(m.losing_trades, 1);
    EXPECT_NEAR(m.win_rate, 200.0 / 3.0, 1e-9);
    EXPECT_NEAR(m.avg_win, 248.70, 1e-9);
    EXPECT_NEAR(m.avg_loss, 251.30, 1e-9);
    EXPECT_NEAR(m.largest_loss, 251.30, 1e-9);
    EXPECT_NEAR(m.profit_factor, 2 * 248.70 / 251.30, 1e-9);
    EXPECT_NEAR(m.avg_trade, 246.10 / 3.0, 1e-9);
    EXPECT_EQ(m.trading_days, 3);
    EXPECT_EQ(m.start_date, "2024-01-01");
}

TEST_F(MetricsCalculatorTest, ReturnsAndDrawdowns) {
    auto m = MetricsCalculator::calculateBacktestMetrics(input());

    EXPECT_NEAR(m.total_return, 0.2461, 1e-9);
    EXPECT_GT(m.cagr, 0.0);
    EXPECT_NEAR(m.max_drawdown, (100248.70 - 99997.40) / 100248.70 * 100.0, 1e-9);
    EXPECT_GT(m.avg_drawdown, 0.0);
    EXPECT_NEAR(m.calmar_ratio, std::abs(m.cagr / m.max_drawdown), 1e-12);
}

TEST_F(MetricsCalculatorTest, OptionsAnalytics) {
    auto m = MetricsCalculator::calculateBacktestMetrics(input());

    EXPECT_NEAR(m.avg_days_in_trade, 30.0, 1e-12);
    EXPECT_NEAR(m.total_commissions, 3 * 1.30, 1e-9);
    EXPECT_NEAR(m.commission_pct, 3.90 / 246.10 * 100.0, 1e-9);
    EXPECT_NEAR(m.avg_delta_exposure, -0.3, 1e-12);

    ASSERT_EQ(m.strategy_performance.size(), 2u);
    const auto& cc = m.strategy_performance.at("covered_call");
    EXPECT_EQ(cc.trades, 2);
    EXPECT_NEAR(cc.pnl, 248.70 - 251.30, 1e-9);
    EXPECT_NEAR(cc.win_rate, 50.0, 1e-12);
    EXPECT_NEAR(m.strategy_performance.at("cash_secured_put").win_rate, 100.0, 1e-12);
}

TEST_F(MetricsCalculatorTest, NoPositionsGivesZeroRecord) {
    std::vector<OptionsPosition> none;
    MetricsInput in = input();
    in.positions = &none;

    auto m = MetricsCalculator::calculateBacktestMetrics(in);

    EXPECT_EQ(m.total_trades, 0);
    EXPECT_DOUBLE_EQ(m.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(m.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(m.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(m.total_return, 0.0);
    EXPECT_TRUE(m.strategy_performance.empty());
    EXPECT_EQ(m.end_date, "2025-01-01");
}

TEST(MetricsRatiosTest, SharpeUsesPopulationStdDev) {
    std::vector<double> returns{0.01, -0.005, 0.002, 0.008, -0.003};
    double mean = 0.0024;
    double var = 0.0;
    for (double r : returns) var += (r - mean) * (r - mean);
    double pop_std = std::sqrt(var / returns.size());

    EXPECT_NEAR(MetricsCalculator::calculateSharpeRatio(returns, 0.0), mean / pop_std * std::sqrt(252.0), 1e-9);
    EXPECT_DOUBLE_EQ(MetricsCalculator::calculateSharpeRatio({0.01}), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::calculateSharpeRatio({0.5, 0.5, 0.5}), 0.0);
}

TEST(MetricsRatiosTest, SortinoNeedsTwoLosses) {
    EXPECT_DOUBLE_EQ(MetricsCalculator::calculateSortinoRatio({0.01, -0.01, 0.02}), 0.0);
    EXPECT_GT(MetricsCalculator::calculateSortinoRatio({0.02, -0.01, 0.03, -0.02}, 0.0), 0.0);
}

TEST(MetricsRatiosTest, DrawdownSeries) {
    std::vector<double> curve{100.0, 120.0, 90.0, 130.0};
    auto dd = MetricsCalculator::calculateDrawdowns(curve);

    ASSERT_EQ(dd.size(), 4u);
    EXPECT_DOUBLE_EQ(dd[1], 0.0);
    EXPECT_NEAR(dd[2], -0.25, 1e-12);
    EXPECT_DOUBLE_EQ(dd[3], 0.0);
    EXPECT_NEAR(MetricsCalculator::calculateMaxDrawdown(curve), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(MetricsCalculator::calculateMaxDrawdown({}), 0.0);
}
