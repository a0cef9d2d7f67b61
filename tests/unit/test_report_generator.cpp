#include "core/report_generator.hpp"
#include <gtest/gtest.h>

using namespace optval;

namespace {

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

TEST(ReportGeneratorTest, BacktestReportSections) {
    BacktestMetrics metrics;
    metrics.start_date = "2024-01-01";
    metrics.end_date = "2024-12-31";
    metrics.total_trades = 40;
    metrics.avg_win = 1234.5;

    std::string report = ReportGenerator::backtestReport(metrics);

    EXPECT_TRUE(has(report, "OPTIONS BACKTEST REPORT"));
    EXPECT_TRUE(has(report, "TRADE STATISTICS"));
    EXPECT_TRUE(has(report, "OPTIONS ANALYTICS"));
    EXPECT_TRUE(has(report, "$1,234.50"));
    EXPECT_FALSE(has(report, "STRATEGY PERFORMANCE"));
}

TEST(ReportGeneratorTest, StressReportHasRowPerScenario) {
    std::map<std::string, MonteCarloResult> results;
    results["base"] = MonteCarloResult();
    results["flash_crash"] = MonteCarloResult();

    std::string report = ReportGenerator::stressReport(results);

    EXPECT_TRUE(has(report, "STRESS TEST SCENARIOS"));
    EXPECT_TRUE(has(report, "base"));
    EXPECT_TRUE(has(report, "flash_crash"));
}

TEST(ReportGeneratorTest, VaRReportShowsLossPercent) {
    VaRResult result;
    result.portfolio_value = 100000.0;
    result.var_95 = -2500.0;

    std::string report = ReportGenerator::varReport(result);

    EXPECT_TRUE(has(report, "VALUE AT RISK"));
    EXPECT_TRUE(has(report, "-$2,500.00 (2.50%)"));
}

TEST(ReportGeneratorTest, ValidationReportListsFailuresAndRecommendations) {
    ExtendedValidationResult result;
    result.validation_summary = "FAIL: Strategy not ready for live trading (Score: 35/100, 2 issues)";
    result.overall_score = 35.0;
    result.backtest = BacktestMetrics();
    result.regime = RegimeState();
    result.all_failures = {"Sharpe 0.40 < 1.0", "Only 12 trades < 50 minimum"};
    result.recommendations = {"Tail risk too high: Reduce position sizes or hedge exposure"};

    std::string report = ReportGenerator::validationReport(result);

    EXPECT_TRUE(has(report, "EXTENDED STRATEGY VALIDATION REPORT"));
    EXPECT_TRUE(has(report, result.validation_summary));
    EXPECT_TRUE(has(report, "NO"));
    EXPECT_TRUE(has(report, "BASIC BACKTEST METRICS"));
    EXPECT_FALSE(has(report, "MONTE CARLO SIMULATION"));
    EXPECT_TRUE(has(report, "MARKET REGIME ANALYSIS"));
    EXPECT_TRUE(has(report, "Trading implications"));
    EXPECT_TRUE(has(report, "  1. Sharpe 0.40 < 1.0\n"));
    EXPECT_TRUE(has(report, "  2. Only 12 trades < 50 minimum\n"));
    EXPECT_TRUE(has(report, "  - Tail risk too high"));
}
