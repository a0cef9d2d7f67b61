#include "core/walk_forward.hpp"
#include "core/errors.hpp"
#include "core/strategies.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>

using namespace optval;

namespace {

WalkForwardConfig smallWindows(WindowMethod method) {
    WalkForwardConfig config;
    config.train_days = 10;
    config.test_days = 5;
    config.step_days = 5;
    config.method = method;
    return config;
}

FoldResult foldWith(double efficiency, double is_return, double oos_return, double stability) {
    FoldResult fold;
    fold.efficiency_ratio = efficiency;
    fold.in_sample.total_return = is_return;
    fold.out_of_sample.total_return = oos_return;
    fold.param_stability = stability;
    return fold;
}

} // namespace

class WalkForwardTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Disabled);

        config.start_date = DateUtils::parseDate("2023-01-02");
        config.end_date = DateUtils::parseDate("2023-06-30");
        provider = std::make_shared<SyntheticPriceHistoryProvider>(42);

        wf_config.train_days = 40;
        wf_config.test_days = 20;
        wf_config.step_days = 20;
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::Info);
    }

    BacktestConfig config;
    std::shared_ptr<PriceHistoryProvider> provider;
    WalkForwardConfig wf_config;
};

TEST(WalkForwardFoldTest, ExpandingFoldsAnchorAtStart) {
    auto folds = WalkForwardValidator::createFolds(DateUtils::parseDate("2023-01-02"),
                                                   DateUtils::parseDate("2023-02-03"),
                                                   smallWindows(WindowMethod::Expanding));

    ASSERT_EQ(folds.size(), 3u);
    EXPECT_EQ(DateUtils::formatDate(folds[0].train_start), "2023-01-02");
    EXPECT_EQ(DateUtils::formatDate(folds[0].train_end), "2023-01-13");
    EXPECT_EQ(DateUtils::formatDate(folds[0].test_start), "2023-01-16");
    EXPECT_EQ(DateUtils::formatDate(folds[0].test_end), "2023-01-20");

    EXPECT_EQ(DateUtils::formatDate(folds[1].train_start), "2023-01-02");
    EXPECT_EQ(DateUtils::formatDate(folds[1].train_end), "2023-01-20");
    EXPECT_EQ(DateUtils::formatDate(folds[1].test_start), "2023-01-23");

    EXPECT_EQ(folds[2].number, 2);
    EXPECT_EQ(DateUtils::formatDate(folds[2].train_start), "2023-01-02");
    EXPECT_EQ(DateUtils::formatDate(folds[2].test_start), "2023-01-30");
    EXPECT_EQ(DateUtils::formatDate(folds[2].test_end), "2023-02-03");
}

TEST(WalkForwardFoldTest, RollingFoldsMoveTrainingStart) {
    auto folds = WalkForwardValidator::createFolds(DateUtils::parseDate("2023-01-02"),
                                                   DateUtils::parseDate("2023-02-03"),
                                                   smallWindows(WindowMethod::Rolling));

    ASSERT_EQ(folds.size(), 3u);
    EXPECT_EQ(DateUtils::formatDate(folds[1].train_start), "2023-01-09");
    EXPECT_EQ(DateUtils::formatDate(folds[1].train_end), "2023-01-20");
    EXPECT_EQ(DateUtils::formatDate(folds[2].train_start), "2023-01-16");
    EXPECT_EQ(DateUtils::formatDate(folds[2].train_end), "2023-01-27");

    for (const auto& fold : folds) {
        EXPECT_LT(DateUtils::formatDate(fold.train_end), DateUtils::formatDate(fold.test_start));
    }
}

TEST(WalkForwardFoldTest, TooFewTradingDaysThrows) {
    try {
        WalkForwardValidator::createFolds(DateUtils::parseDate("2023-01-02"),
                                          DateUtils::parseDate("2023-01-13"),
                                          smallWindows(WindowMethod::Expanding));
        FAIL() << "Expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.available(), 10u);
        EXPECT_EQ(e.required(), 15u);
    }

    WalkForwardConfig bad = smallWindows(WindowMethod::Expanding);
    bad.step_days = 0;
    EXPECT_THROW(WalkForwardValidator::createFolds(DateUtils::parseDate("2023-01-02"),
                                                   DateUtils::parseDate("2023-06-30"), bad),
                 ValidationError);
}

TEST(WalkForwardFoldTest, WindowMethodNames) {
    EXPECT_EQ(windowMethodFromString("anchored"), WindowMethod::Expanding);
    EXPECT_EQ(windowMethodFromString("rolling"), WindowMethod::Rolling);
    EXPECT_EQ(toString(WindowMethod::Expanding), "expanding");
    EXPECT_THROW(windowMethodFromString("sliding"), ValidationError);
}

TEST(WalkForwardGridTest, CartesianProduct) {
    ParameterGrid grid{{"a", {1.0, 2.0}}, {"b", {10.0, 20.0, 30.0}}};
    auto combos = WalkForwardValidator::expandGrid(grid);

    ASSERT_EQ(combos.size(), 6u);
    EXPECT_DOUBLE_EQ(combos[0].at("a"), 1.0);
    EXPECT_DOUBLE_EQ(combos[0].at("b"), 10.0);
    EXPECT_DOUBLE_EQ(combos[5].at("a"), 2.0);
    EXPECT_DOUBLE_EQ(combos[5].at("b"), 30.0);

    auto single = WalkForwardValidator::expandGrid({});
    ASSERT_EQ(single.size(), 1u);
    EXPECT_TRUE(single[0].empty());

    EXPECT_TRUE(WalkForwardValidator::expandGrid({{"a", {}}}).empty());
}

TEST(WalkForwardGridTest, ParameterStability) {
    EXPECT_DOUBLE_EQ(WalkForwardValidator::parameterStability({{"a", 1.0}, {"b", 10.0}},
                                                              {{"a", 1.5}, {"b", 10.0}}),
                     0.75);
    EXPECT_DOUBLE_EQ(WalkForwardValidator::parameterStability({{"a", 0.0}}, {{"a", 0.0}}), 1.0);
    EXPECT_DOUBLE_EQ(WalkForwardValidator::parameterStability({{"a", 0.0}}, {{"a", 1.0}}), 0.0);
    EXPECT_DOUBLE_EQ(WalkForwardValidator::parameterStability({{"a", 1.0}}, {{"a", 5.0}}), 0.0);
    EXPECT_DOUBLE_EQ(WalkForwardValidator::parameterStability({}, {{"a", 1.0}}), 1.0);
}

TEST(WalkForwardScoreTest, OverfittingIndicators) {
    EXPECT_DOUBLE_EQ(WalkForwardValidator::overfittingScore({}), 0.0);

    // Efficiency shortfall 0.5, declining trend capped at 1, return gap 0.5, stable params
    std::vector<FoldResult> declining{foldWith(1.0, 10.0, 5.0, 1.0), foldWith(0.5, 10.0, 5.0, 1.0),
                                      foldWith(0.0, 10.0, 5.0, 1.0)};
    EXPECT_NEAR(WalkForwardValidator::overfittingScore(declining), 0.5, 1e-12);

    // Two folds skip the trend; zero in-sample return skips the gap
    std::vector<FoldResult> robust{foldWith(1.0, 0.0, 3.0, 1.0), foldWith(1.2, 0.0, 4.0, 0.5)};
    EXPECT_NEAR(WalkForwardValidator::overfittingScore(robust), 0.25 / 2.0, 1e-12);
}

TEST_F(WalkForwardTest, OptimizesEachFoldInSample) {
    WalkForwardValidator validator(config, provider, wf_config);
    int calls = 0;
    StrategyFactory factory = [&calls](const ParameterSet& params) {
        ++calls;
        StrategyParams strategy_params;
        strategy_params.otm_pct = params.at("otm_pct");
        return Strategies::coveredCall(strategy_params);
    };

    auto result = validator.run(factory, {{"otm_pct", {0.03, 0.05}}}, {"SPY"});

    ASSERT_EQ(result.folds.size(), 4u);
    EXPECT_EQ(calls, 4 * 3);
    for (const auto& fold : result.folds) {
        double otm = fold.params.at("otm_pct");
        EXPECT_TRUE(otm == 0.03 || otm == 0.05);
        EXPECT_EQ(fold.in_sample.start_date, DateUtils::formatDate(fold.fold.train_start));
        EXPECT_EQ(fold.out_of_sample.start_date, DateUtils::formatDate(fold.fold.test_start));
        EXPECT_EQ(fold.out_of_sample.end_date, DateUtils::formatDate(fold.fold.test_end));
    }
    EXPECT_DOUBLE_EQ(result.folds[0].param_stability, 1.0);
    EXPECT_GE(result.fold_consistency, 0.0);
    EXPECT_LE(result.fold_consistency, 1.0);
    EXPECT_GE(result.overfitting_score, 0.0);
    EXPECT_LE(result.overfitting_score, 1.0);
}

TEST_F(WalkForwardTest, FailingStrategyYieldsEmptyFolds) {
    WalkForwardValidator validator(config, provider, wf_config);
    StrategyFactory factory = [](const ParameterSet&) -> StrategyFunction {
        throw ValidationError("bad parameters");
    };

    auto result = validator.run(factory, {{"otm_pct", {0.03, 0.05}}}, {"SPY"});

    ASSERT_EQ(result.folds.size(), 4u);
    for (const auto& fold : result.folds) {
        EXPECT_DOUBLE_EQ(fold.params.at("otm_pct"), 0.03);
        EXPECT_EQ(fold.in_sample.total_trades, 0);
        EXPECT_DOUBLE_EQ(fold.efficiency_ratio, 0.0);
        EXPECT_DOUBLE_EQ(fold.param_stability, 1.0);
    }
    EXPECT_DOUBLE_EQ(result.mean_efficiency_ratio, 0.0);
    EXPECT_DOUBLE_EQ(result.fold_consistency, 0.0);
    EXPECT_DOUBLE_EQ(result.degradation, 0.0);
    // Efficiency shortfall 1, flat trend 0, no gap term, stable params 0
    EXPECT_NEAR(result.overfitting_score, 1.0 / 3.0, 1e-12);
}

TEST_F(WalkForwardTest, RejectsMissingCollaborators) {
    EXPECT_THROW(WalkForwardValidator(config, nullptr), ValidationError);

    WalkForwardValidator validator(config, provider, wf_config);
    EXPECT_THROW(validator.run(StrategyFactory(), {}, {"SPY"}), ValidationError);
}
