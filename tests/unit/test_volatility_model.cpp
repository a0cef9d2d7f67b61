#include "core/volatility_model.hpp"
#include "core/data_loader.hpp"
#include "core/errors.hpp"
#include "utils/random_source.hpp"
#include "utils/statistics.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace optval;

class VolatilityModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        SyntheticPriceHistoryProvider provider(11);
        bars = provider.fetch("SPY", DateUtils::parseDate("2023-01-02"), DateUtils::parseDate("2023-12-29"));
    }

    std::vector<PriceBar> bars;
};

TEST_F(VolatilityModelTest, BuildHistoryAnnotatesRows) {
    auto history = VolatilityModel::buildHistory("SPY", bars);

    ASSERT_EQ(history.size(), bars.size());
    EXPECT_TRUE(std::isnan(history[0].daily_return));
    EXPECT_NEAR(history[1].daily_return, bars[1].close / bars[0].close - 1.0, 1e-12);

    // HV30 needs 30 finite returns, the first of which is at row 1
    EXPECT_TRUE(std::isnan(history[29].hv_30));
    EXPECT_TRUE(std::isfinite(history[30].hv_30));
    EXPECT_NEAR(history[30].iv_estimate, history[30].hv_30 * 1.2, 1e-12);
    EXPECT_TRUE(std::isfinite(history.back().hv_60));
}

TEST_F(VolatilityModelTest, HistoryQueriesByDate) {
    auto history = VolatilityModel::buildHistory("SPY", bars);
    Date mid = bars[100].date;

    auto visible = history.upTo(mid);
    EXPECT_EQ(visible.size(), 101u);
    EXPECT_EQ(visible.back().bar.date, mid);

    // A Sunday resolves to the preceding Friday
    const HistoryRow* row = history.lastOnOrBefore(DateUtils::parseDate("2023-06-04"));
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(DateUtils::formatDate(row->bar.date), "2023-06-02");

    EXPECT_EQ(history.lastOnOrBefore(DateUtils::parseDate("2022-12-31")), nullptr);
    EXPECT_EQ(history.returns().size(), bars.size() - 1);
}

TEST(RollingVolatilityTest, ConstantReturnsHaveZeroVolatility) {
    std::vector<double> returns(40, 0.001);
    auto vol = VolatilityModel::rollingVolatility(returns, 20);

    EXPECT_TRUE(std::isnan(vol[18]));
    EXPECT_NEAR(vol[19], 0.0, 1e-15);
    EXPECT_NEAR(vol[39], 0.0, 1e-15);
}

TEST(ConstantVolatilityEstimatorTest, UsesPopulationStdDev) {
    ConstantVolatilityEstimator estimator;
    std::vector<double> returns{0.01, -0.01, 0.02, -0.02};

    EXPECT_NEAR(estimator.forecastVolatility(returns), Statistics::populationStdDev(returns), 1e-15);
    EXPECT_EQ(estimator.name(), "constant");
}

TEST(Garch11EstimatorTest, FitsSimulatedGarchSeries) {
    // Simulate GARCH(1,1) with omega = 2e-6, alpha = 0.08, beta = 0.90
    RandomSource random(2024);
    std::vector<double> returns;
    double variance = 2e-6 / (1.0 - 0.98);
    double prev = 0.0;
    for (int t = 0; t < 1500; ++t) {
        variance = 2e-6 + 0.08 * prev * prev + 0.90 * variance;
        prev = std::sqrt(variance) * random.normal();
        returns.push_back(prev);
    }

    Garch11Estimator estimator;
    GarchFit fit = estimator.fit(returns);

    EXPECT_GT(fit.alpha, 0.0);
    EXPECT_LT(fit.alpha, 0.5);
    EXPECT_GT(fit.beta, 0.0);
    EXPECT_LT(fit.persistence(), 0.999);
    EXPECT_GT(fit.omega, 0.0);

    double sigma = estimator.forecastVolatility(returns);
    EXPECT_GT(sigma, 0.0);
    EXPECT_LT(sigma, 0.1);
}

TEST(Garch11EstimatorTest, DegenerateSamplesThrow) {
    Garch11Estimator estimator;

    EXPECT_THROW(estimator.fit({0.01, 0.02}), NumericalFitError);
    EXPECT_THROW(estimator.fit(std::vector<double>(150, 0.0078125)), NumericalFitError);
}
