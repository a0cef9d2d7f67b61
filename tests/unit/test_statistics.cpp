#include "utils/statistics.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace optval;

TEST(StatisticsTest, MeanAndStdDev) {
    std::vector<double> data{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    EXPECT_DOUBLE_EQ(Statistics::mean(data), 5.0);
    EXPECT_NEAR(Statistics::populationStdDev(data), 2.0, 1e-12);
    EXPECT_NEAR(Statistics::stdDev(data), std::sqrt(32.0 / 7.0), 1e-12);
}

TEST(StatisticsTest, DegenerateInputs) {
    EXPECT_DOUBLE_EQ(Statistics::mean({}), 0.0);
    EXPECT_DOUBLE_EQ(Statistics::stdDev({1.0}), 0.0);
    EXPECT_DOUBLE_EQ(Statistics::populationStdDev({}), 0.0);
    EXPECT_DOUBLE_EQ(Statistics::percentile({}, 0.5), 0.0);
}

TEST(StatisticsTest, PercentileInterpolatesLinearly) {
    std::vector<double> data{5.0, 1.0, 4.0, 2.0, 3.0};

    EXPECT_DOUBLE_EQ(Statistics::percentile(data, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(Statistics::percentile(data, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(Statistics::percentile(data, 1.0), 5.0);
    EXPECT_NEAR(Statistics::percentile(data, 0.1), 1.4, 1e-12);
}

TEST(StatisticsTest, TailMeanAveragesAtOrBelowThreshold) {
    std::vector<double> data{-0.05, -0.03, -0.01, 0.02, 0.04};

    EXPECT_NEAR(Statistics::tailMean(data, -0.03), -0.04, 1e-12);
    // No observation in the tail: the threshold itself
    EXPECT_DOUBLE_EQ(Statistics::tailMean(data, -0.10), -0.10);
}

TEST(StatisticsTest, ReturnsFromEquitySkipsZeroBase) {
    auto returns = Statistics::returnsFromEquity({100.0, 110.0, 99.0});
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.10, 1e-12);
    EXPECT_NEAR(returns[1], -0.10, 1e-12);

    EXPECT_EQ(Statistics::returnsFromEquity({0.0, 10.0, 20.0}).size(), 1u);
    EXPECT_TRUE(Statistics::returnsFromEquity({100.0}).empty());
}

TEST(StatisticsTest, FiniteOnlyDropsNaNAndInfinity) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();

    auto clean = Statistics::finiteOnly({1.0, nan, 2.0, inf, -inf});
    ASSERT_EQ(clean.size(), 2u);
    EXPECT_DOUBLE_EQ(clean[1], 2.0);
}

TEST(StatisticsTest, NormalDistributionFunctions) {
    EXPECT_NEAR(Statistics::normalCdf(0.0), 0.5, 1e-12);
    EXPECT_NEAR(Statistics::normalCdf(1.959964), 0.975, 1e-6);
    EXPECT_NEAR(Statistics::normalPdf(0.0), 0.3989422804, 1e-9);

    EXPECT_NEAR(Statistics::normalQuantile(0.05), -1.644854, 1e-5);
    EXPECT_NEAR(Statistics::normalQuantile(0.01), -2.326348, 1e-5);
    EXPECT_NEAR(Statistics::normalQuantile(0.5), 0.0, 1e-9);

    for (double p : {0.001, 0.2, 0.7, 0.999}) {
        EXPECT_NEAR(Statistics::normalCdf(Statistics::normalQuantile(p)), p, 1e-8);
    }
}
