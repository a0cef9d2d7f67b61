#include "core/strategies.hpp"
#include "core/errors.hpp"
#include "core/volatility_model.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace optval;

class StrategiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<PriceBar> bars;
        Date day = DateUtils::parseDate("2024-01-02");
        for (int i = 0; i < 80; ++i, day = DateUtils::addDays(day, 1)) {
            PriceBar bar;
            bar.date = day;
            bar.open = bar.high = bar.low = bar.close = 400.0;
            bar.volume = 1000000;
            bars.push_back(bar);
        }
        history = VolatilityModel::buildHistory("SPY", bars);
        today = history.back().bar.date;
    }

    PriceHistory history;
    Date today;
};

TEST_F(StrategiesTest, CoveredCallSellsOutOfTheMoneyCall) {
    auto position = Strategies::coveredCall()("SPY", today, history);

    ASSERT_TRUE(position.has_value());
    ASSERT_EQ(position->legs().size(), 1u);
    const auto& leg = position->legs()[0];
    EXPECT_EQ(leg.type(), OptionType::Call);
    EXPECT_EQ(leg.quantity(), -1);
    EXPECT_DOUBLE_EQ(leg.strike(), 420.0);
    EXPECT_EQ(DateUtils::daysBetween(today, leg.expiration()), 30);
    EXPECT_DOUBLE_EQ(leg.entryIV(), 0.20);
    EXPECT_LT(position->entryCost(), 0.0);
    EXPECT_DOUBLE_EQ(position->entryPrice(), 400.0);
}

TEST_F(StrategiesTest, CashSecuredPutSellsBelowSpot) {
    auto position = Strategies::cashSecuredPut()("SPY", today, history);

    ASSERT_TRUE(position.has_value());
    const auto& leg = position->legs()[0];
    EXPECT_EQ(leg.type(), OptionType::Put);
    EXPECT_EQ(leg.quantity(), -1);
    EXPECT_DOUBLE_EQ(leg.strike(), 380.0);
}

TEST_F(StrategiesTest, CreditSpreadBuysProtectiveWing) {
    auto position = Strategies::creditSpread()("SPY", today, history);

    ASSERT_TRUE(position.has_value());
    ASSERT_EQ(position->legs().size(), 2u);
    EXPECT_DOUBLE_EQ(position->legs()[0].strike(), 380.0);
    EXPECT_EQ(position->legs()[0].quantity(), -1);
    EXPECT_DOUBLE_EQ(position->legs()[1].strike(), 360.0);
    EXPECT_EQ(position->legs()[1].quantity(), 1);
    // Short leg is worth more than the wing
    EXPECT_LT(position->entryCost(), 0.0);
}

TEST_F(StrategiesTest, IronCondorHasFourBalancedLegs) {
    StrategyParams params;
    params.contracts = 2;
    auto position = Strategies::ironCondor(params)("SPY", today, history);

    ASSERT_TRUE(position.has_value());
    ASSERT_EQ(position->legs().size(), 4u);
    int net_quantity = 0;
    for (const auto& leg : position->legs()) {
        EXPECT_EQ(std::abs(leg.quantity()), 2);
        net_quantity += leg.quantity();
    }
    EXPECT_EQ(net_quantity, 0);
    EXPECT_EQ(position->totalContracts(), 8);
    EXPECT_EQ(position->category(), StrategyCategory::IronCondor);
}

TEST_F(StrategiesTest, StraddleIsLongAtTheMoney) {
    auto position = Strategies::straddle()("SPY", today, history);

    ASSERT_TRUE(position.has_value());
    ASSERT_EQ(position->legs().size(), 2u);
    for (const auto& leg : position->legs()) {
        EXPECT_DOUBLE_EQ(leg.strike(), 400.0);
        EXPECT_EQ(leg.quantity(), 1);
    }
    EXPECT_GT(position->entryCost(), 0.0);
}

TEST_F(StrategiesTest, EmptyHistoryOpensNothing) {
    PriceHistory empty;
    for (const auto& name : Strategies::names()) {
        EXPECT_FALSE(Strategies::fromName(name)("SPY", today, empty).has_value()) << name;
    }
}

TEST(StrategiesLookupTest, UnknownNameThrows) {
    EXPECT_EQ(Strategies::names().size(), 5u);
    EXPECT_THROW(Strategies::fromName("butterfly"), ValidationError);
}
