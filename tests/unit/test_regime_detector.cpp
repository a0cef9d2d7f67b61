#include "core/regime_detector.hpp"
#include "core/errors.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>

using namespace optval;

namespace {

// A choppy year followed by a quiet, steady move of `drift` per day
std::vector<double> choppyThenSteady(double drift) {
    std::vector<double> prices{100.0};
    for (int i = 0; i < 260; ++i) {
        prices.push_back(prices.back() * (1.0 + (i % 2 == 0 ? 0.02 : -0.02)));
    }
    for (int i = 0; i < 40; ++i) {
        prices.push_back(prices.back() * (1.0 + drift + (i % 2 == 0 ? 0.001 : -0.001)));
    }
    return prices;
}

} // namespace

class RegimeDetectorTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().setLevel(LogLevel::Error); }
    void TearDown() override { Logger::instance().setLevel(LogLevel::Info); }
};

TEST_F(RegimeDetectorTest, ShortHistoryGivesDefaultState) {
    RegimeDetector detector;
    auto state = detector.detectRegime(std::vector<double>(100, 50.0));

    EXPECT_EQ(state.volatility_regime, VolatilityRegime::Medium);
    EXPECT_EQ(state.trend_regime, TrendRegime::Ranging);
    EXPECT_EQ(state.market_regime, MarketRegime::RangingLowVol);
    EXPECT_DOUBLE_EQ(state.volatility_percentile, 50.0);
    EXPECT_DOUBLE_EQ(state.recommended_position_scale, 0.5);
    EXPECT_EQ(detector.transitionCount(), 0u);
}

TEST_F(RegimeDetectorTest, QuietRallyIsBullLowVol) {
    RegimeDetector detector;
    auto state = detector.detectRegime(choppyThenSteady(0.006));

    EXPECT_EQ(state.volatility_regime, VolatilityRegime::Low);
    EXPECT_LT(state.volatility_percentile, 25.0);
    EXPECT_EQ(state.trend_regime, TrendRegime::StrongUptrend);
    EXPECT_GT(state.trend_strength, 0.5);
    EXPECT_EQ(state.market_regime, MarketRegime::BullLowVol);
    EXPECT_GE(state.regime_confidence, 0.0);
    EXPECT_LE(state.regime_confidence, 1.0);
    EXPECT_GE(state.recommended_position_scale, 0.5);
    EXPECT_LE(state.recommended_position_scale, 1.0);
}

TEST_F(RegimeDetectorTest, QuietSelloffIsBearLowVol) {
    RegimeDetector detector;
    auto state = detector.detectRegime(choppyThenSteady(-0.006));

    EXPECT_EQ(state.trend_regime, TrendRegime::StrongDowntrend);
    EXPECT_LT(state.trend_strength, -0.5);
    EXPECT_EQ(state.market_regime, MarketRegime::BearLowVol);
    EXPECT_LE(state.recommended_position_scale, 0.3);
}

TEST_F(RegimeDetectorTest, CountsRegimeTransitions) {
    RegimeDetector detector;
    auto rally = choppyThenSteady(0.006);
    auto selloff = choppyThenSteady(-0.006);

    detector.detectRegime(rally);
    EXPECT_EQ(detector.transitionCount(), 0u);
    detector.detectRegime(rally);
    EXPECT_EQ(detector.transitionCount(), 0u);
    detector.detectRegime(selloff);
    EXPECT_EQ(detector.transitionCount(), 1u);
    detector.detectRegime(rally);
    EXPECT_EQ(detector.transitionCount(), 2u);
}

TEST_F(RegimeDetectorTest, RejectsBadWindows) {
    EXPECT_THROW(RegimeDetector(1), ValidationError);
    EXPECT_THROW(RegimeDetector(20, 10), ValidationError);
    EXPECT_THROW(RegimeDetector(20, 50, 40), ValidationError);
}

TEST(RegimeNamesTest, SnakeCaseNames) {
    EXPECT_EQ(toString(MarketRegime::BullHighVol), "bull_high_vol");
    EXPECT_EQ(toString(TrendRegime::WeakDowntrend), "weak_downtrend");
    EXPECT_EQ(toString(VolatilityRegime::Extreme), "extreme");
}
