#include "core/backtest_engine.hpp"
#include "core/errors.hpp"
#include "core/strategies.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace optval;

namespace {

// Constant-price weekday bars; an empty symbol list means every symbol has data
class FlatPriceProvider : public PriceHistoryProvider {
public:
    explicit FlatPriceProvider(double price, std::vector<std::string> known = {})
        : price_(price), known_(std::move(known)) {}

    std::vector<PriceBar> fetch(const std::string& symbol, const Date& start, const Date& end) override {
        std::vector<PriceBar> bars;
        if (!known_.empty() && std::find(known_.begin(), known_.end(), symbol) == known_.end()) {
            return bars;
        }
        for (Date day = start; day <= end; day = DateUtils::addDays(day, 1)) {
            if (DateUtils::isWeekend(day)) continue;
            PriceBar bar;
            bar.date = day;
            bar.open = bar.high = bar.low = bar.close = price_;
            bar.volume = 1000000;
            bars.push_back(bar);
        }
        return bars;
    }

    std::string name() const override { return "flat"; }

private:
    double price_;
    std::vector<std::string> known_;
};

} // namespace

class BacktestEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Error);

        config.start_date = DateUtils::parseDate("2023-01-02");
        config.end_date = DateUtils::parseDate("2023-06-30");
        config.initial_capital = 100000.0;
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::Info);
    }

    BacktestConfig config;
};

TEST_F(BacktestEngineTest, ConstructorValidatesConfig) {
    auto provider = std::make_shared<FlatPriceProvider>(100.0);

    EXPECT_THROW(BacktestEngine(config, nullptr), ValidationError);

    BacktestConfig reversed = config;
    std::swap(reversed.start_date, reversed.end_date);
    EXPECT_THROW(BacktestEngine(reversed, provider), ValidationError);

    BacktestConfig broke = config;
    broke.initial_capital = 0.0;
    EXPECT_THROW(BacktestEngine(broke, provider), ValidationError);

    BacktestEngine engine(config, provider);
    EXPECT_EQ(engine.state(), EngineState::Configured);
    ASSERT_EQ(engine.equityCurve().size(), 1u);
    EXPECT_DOUBLE_EQ(engine.equityCurve().front(), 100000.0);
}

TEST_F(BacktestEngineTest, StrategyWithNoTradesGivesZeroMetrics) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));
    StrategyFunction never = [](const std::string&, const Date&, const PriceHistory&) {
        return std::optional<OptionsPosition>();
    };

    BacktestMetrics metrics;
    EXPECT_NO_THROW(metrics = engine.runBacktest(never, {"SPY"}));

    EXPECT_EQ(metrics.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(metrics.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(metrics.calmar_ratio, 0.0);
    EXPECT_DOUBLE_EQ(metrics.total_return, 0.0);
    EXPECT_EQ(engine.state(), EngineState::Completed);
    EXPECT_EQ(engine.equityCurve().size(), engine.dates().size());
    for (double value : engine.equityCurve()) {
        EXPECT_DOUBLE_EQ(value, 100000.0);
    }
}

TEST_F(BacktestEngineTest, CoveredCallOnSyntheticData) {
    BacktestEngine engine(config, std::make_shared<SyntheticPriceHistoryProvider>(42));
    auto metrics = engine.runBacktest(Strategies::coveredCall(), {"SPY"}, 7);

    ASSERT_GT(metrics.total_trades, 0);
    EXPECT_EQ(static_cast<size_t>(metrics.total_trades), engine.closedPositions().size());
    EXPECT_LE(metrics.winning_trades + metrics.losing_trades, metrics.total_trades);
    EXPECT_EQ(engine.equityCurve().size(), engine.dates().size());
    EXPECT_EQ(metrics.trading_days, static_cast<int>(engine.dates().size()) - 1);

    double total_pnl = 0.0;
    for (const auto& position : engine.closedPositions()) {
        EXPECT_TRUE(position.isClosed());
        EXPECT_LT(position.entryCost(), 0.0); // short call opens for a credit
        EXPECT_EQ(position.category(), StrategyCategory::CoveredCall);
        total_pnl += position.pnl();
    }
    EXPECT_NEAR(engine.equityCurve().back(), 100000.0 + total_pnl, 1e-6);
    EXPECT_NEAR(metrics.total_return, total_pnl / 1000.0, 1e-9);
    EXPECT_GE(metrics.max_drawdown, 0.0);
    EXPECT_NEAR(metrics.avg_days_in_trade, 30.0, 1e-9);
}

TEST_F(BacktestEngineTest, FrequencyControlsEvaluationDates) {
    BacktestEngine weekly(config, std::make_shared<FlatPriceProvider>(100.0));
    weekly.runBacktest(Strategies::straddle(), {"SPY"}, 7);

    BacktestEngine biweekly(config, std::make_shared<FlatPriceProvider>(100.0));
    biweekly.runBacktest(Strategies::straddle(), {"SPY"}, 14);

    EXPECT_GT(weekly.closedPositions().size(), biweekly.closedPositions().size());
    EXPECT_THROW(BacktestEngine(config, std::make_shared<FlatPriceProvider>(100.0))
                     .runBacktest(Strategies::straddle(), {"SPY"}, 0),
                 ValidationError);
}

TEST_F(BacktestEngineTest, ShortCallExpiringWorthlessOnFlatPrices) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));
    engine.loadPriceHistory("SPY");
    EXPECT_EQ(engine.state(), EngineState::LoadedData);

    Date entry = DateUtils::parseDate("2023-03-01");
    Date expiry = DateUtils::parseDate("2023-03-31");
    std::vector<OptionLeg> legs{OptionLeg(OptionType::Call, 110.0, expiry, -1, 2.50)};
    OptionsPosition position("SPY", StrategyCategory::CoveredCall, legs, entry, 100.0);
    position.calculateEntryCost(0.65);

    auto closed = engine.simulateTrade(position);

    EXPECT_TRUE(closed.isClosed());
    ASSERT_TRUE(closed.exitDate().has_value());
    EXPECT_EQ(*closed.exitDate(), expiry);
    EXPECT_NEAR(closed.pnl(), 248.70, 1e-9);
    // The engine works on a copy
    EXPECT_FALSE(position.isClosed());
}

TEST_F(BacktestEngineTest, PositionWithoutEntryCostIsRejected) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));
    engine.loadPriceHistory("SPY");

    std::vector<OptionLeg> legs{OptionLeg(OptionType::Call, 110.0, DateUtils::parseDate("2023-03-31"), -1, 2.50)};
    OptionsPosition position("SPY", StrategyCategory::CoveredCall, legs, DateUtils::parseDate("2023-03-01"), 100.0);

    EXPECT_THROW(engine.simulateTrade(position), PositionStateError);
}

TEST_F(BacktestEngineTest, MissingDataForSymbolAbortsRun) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0, std::vector<std::string>{"SPY"}));

    EXPECT_THROW(engine.runBacktest(Strategies::coveredCall(), {"SPY", "NOPE"}), MissingMarketDataError);
    EXPECT_THROW(engine.priceHistory("NOPE"), MissingMarketDataError);
    EXPECT_TRUE(engine.hasPriceHistory("SPY"));
    EXPECT_FALSE(engine.hasPriceHistory("NOPE"));
}

TEST_F(BacktestEngineTest, EntryBeforeHistoryIsMissingMarketData) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));
    engine.loadPriceHistory("SPY", DateUtils::parseDate("2023-01-02"), DateUtils::parseDate("2023-06-30"));

    Date entry = DateUtils::parseDate("2022-06-01");
    std::vector<OptionLeg> legs{OptionLeg(OptionType::Put, 95.0, DateUtils::parseDate("2022-07-01"), -1, 1.0)};
    OptionsPosition position("SPY", StrategyCategory::CashSecuredPut, legs, entry, 100.0);

    EXPECT_THROW(engine.simulateTrade(position), MissingMarketDataError);
}

TEST_F(BacktestEngineTest, LifecycleRules) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));

    std::vector<OptionLeg> legs{OptionLeg(OptionType::Call, 110.0, DateUtils::parseDate("2023-03-31"), -1, 2.5)};
    OptionsPosition position("SPY", StrategyCategory::CoveredCall, legs, DateUtils::parseDate("2023-03-01"), 100.0);

    // Nothing loaded yet
    EXPECT_THROW(engine.simulateTrade(position), ValidationError);

    engine.runBacktest(Strategies::coveredCall(), {"SPY"});
    EXPECT_EQ(engine.state(), EngineState::Completed);

    EXPECT_THROW(engine.runBacktest(Strategies::coveredCall(), {"SPY"}), ValidationError);
    EXPECT_THROW(engine.loadPriceHistory("QQQ"), ValidationError);
    EXPECT_THROW(engine.simulateTrade(position), ValidationError);
    EXPECT_NO_THROW(engine.calculateMetrics());
}

TEST_F(BacktestEngineTest, ThrowingTradeIsSkipped) {
    BacktestEngine engine(config, std::make_shared<FlatPriceProvider>(100.0));

    // Every other position is for a symbol that was never loaded
    int calls = 0;
    StrategyFunction flaky = [&calls](const std::string& symbol, const Date& date,
                                      const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto position = Strategies::coveredCall()(symbol, date, history);
        if (!position || calls++ % 2 == 0) return position;
        return OptionsPosition("UNLOADED", position->category(), position->legs(), date, 100.0);
    };

    auto metrics = engine.runBacktest(flaky, {"SPY"});

    EXPECT_GT(metrics.total_trades, 0);
    EXPECT_LT(metrics.total_trades, calls);
}
