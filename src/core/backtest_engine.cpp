#include "backtest_engine.hpp"
#include "errors.hpp"
#include "volatility_model.hpp"
#include "../models/black_scholes.hpp"
#include "../utils/format_utils.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace optval {

namespace {

const char* kSource = "BacktestEngine";
constexpr double kDefaultIV = 0.20;

} // namespace

std::string toString(EngineState state) {
    switch (state) {
        case EngineState::Configured: return "configured";
        case EngineState::LoadedData: return "loaded_data";
        case EngineState::Running: return "running";
        case EngineState::Completed: return "completed";
    }
    return "unknown";
}

BacktestEngine::BacktestEngine(BacktestConfig config, std::shared_ptr<PriceHistoryProvider> provider)
    : config_(std::move(config)), provider_(std::move(provider)), state_(EngineState::Configured) {
    if (!provider_) {
        throw ValidationError("BacktestEngine requires a price history provider");
    }
    if (config_.end_date < config_.start_date) {
        throw ValidationError("Backtest end date " + DateUtils::formatDate(config_.end_date) +
                              " precedes start date " + DateUtils::formatDate(config_.start_date));
    }
    if (config_.initial_capital <= 0) {
        throw ValidationError("Initial capital must be positive");
    }

    equity_curve_.push_back(config_.initial_capital);
    dates_.push_back(config_.start_date);

    Logger::instance().info(kSource, "Initialized: " + DateUtils::formatDate(config_.start_date) +
                                     " to " + DateUtils::formatDate(config_.end_date));
    Logger::instance().info(kSource, "Initial capital: " + FormatUtils::money(config_.initial_capital));
}

const PriceHistory& BacktestEngine::loadPriceHistory(const std::string& symbol,
                                                     std::optional<Date> start,
                                                     std::optional<Date> end) {
    requireState(state_ != EngineState::Completed, "loadPriceHistory");

    auto cached = price_data_.find(symbol);
    if (cached != price_data_.end()) {
        return cached->second;
    }

    Date from = start.value_or(DateUtils::addDays(config_.start_date, -config_.lookback_days));
    Date to = end.value_or(config_.end_date);

    Logger::instance().info(kSource, "Loading historical data for " + symbol + " from " +
                                     provider_->name());

    auto bars = provider_->fetch(symbol, from, to);
    if (bars.empty()) {
        Logger::instance().error(kSource, "Failed to load data for " + symbol);
        throw MissingMarketDataError("No data available for " + symbol);
    }

    auto inserted = price_data_.emplace(symbol, VolatilityModel::buildHistory(symbol, bars));
    Logger::instance().info(kSource, "Loaded " + std::to_string(bars.size()) + " bars for " + symbol);

    if (state_ == EngineState::Configured) {
        state_ = EngineState::LoadedData;
    }
    return inserted.first->second;
}

OptionsPosition BacktestEngine::simulateTrade(OptionsPosition position) const {
    requireState(state_ == EngineState::LoadedData || state_ == EngineState::Running,
                 "simulateTrade");

    const PriceHistory& history = priceHistory(position.symbol());

    if (!history.lastOnOrBefore(position.entryDate())) {
        throw MissingMarketDataError("No data available for entry date " +
                                     DateUtils::formatDate(position.entryDate()));
    }

    Date exit_date = position.exitDate().value_or(position.lastExpiration());
    const HistoryRow* exit_row = history.lastOnOrBefore(exit_date);
    if (!exit_row) {
        throw MissingMarketDataError("No data available for exit date " +
                                     DateUtils::formatDate(exit_date));
    }

    double exit_price = exit_row->bar.close;
    double iv = exit_row->iv_estimate;
    if (!std::isfinite(iv) || iv <= 0) {
        iv = kDefaultIV;
    }

    std::vector<double> exit_premiums;
    exit_premiums.reserve(position.legs().size());
    for (const auto& leg : position.legs()) {
        double T = std::max(0.0, DateUtils::daysBetween(exit_date, leg.expiration()) / 365.0);
        auto result = BlackScholes::price(exit_price, leg.strike(), T, config_.risk_free_rate, iv,
                                          leg.type());
        exit_premiums.push_back(result.price);
    }

    position.setExit(exit_date, exit_price);
    position.calculatePnl(exit_premiums, config_.commission_per_contract);
    return position;
}

BacktestMetrics BacktestEngine::runBacktest(const StrategyFunction& strategy,
                                            const std::vector<std::string>& symbols,
                                            int trade_frequency_days) {
    requireState(state_ == EngineState::Configured || state_ == EngineState::LoadedData,
                 "runBacktest");
    if (!strategy) {
        throw ValidationError("runBacktest requires a strategy function");
    }
    if (trade_frequency_days < 1) {
        throw ValidationError("Trade frequency must be at least one day");
    }

    Logger::instance().info(kSource, std::string(80, '='));
    Logger::instance().info(kSource, "STARTING OPTIONS BACKTEST");
    Logger::instance().info(kSource, std::string(80, '='));

    for (const auto& symbol : symbols) {
        loadPriceHistory(symbol);
    }

    state_ = EngineState::Running;
    int trade_count = 0;
    double realized_pnl = 0.0;

    Date current = config_.start_date;
    while (current <= config_.end_date) {
        if (DateUtils::isWeekend(current)) {
            current = DateUtils::addDays(current, 1);
            continue;
        }

        for (const auto& symbol : symbols) {
            PriceHistory visible = price_data_.at(symbol).upTo(current);
            if (visible.size() < config_.min_history_bars) {
                continue;
            }

            auto position = strategy(symbol, current, visible);
            if (!position) {
                continue;
            }

            try {
                OptionsPosition completed = simulateTrade(std::move(*position));
                realized_pnl += completed.pnl();
                ++trade_count;

                Logger::instance().info(kSource, DateUtils::formatDate(current) + ": " + symbol +
                                                 " " + toString(completed.category()) +
                                                 " - P/L: " + FormatUtils::money(completed.pnl()));
                closed_positions_.push_back(std::move(completed));
            } catch (const ValidationError& e) {
                Logger::instance().warning(kSource, std::string("Trade simulation failed: ") + e.what());
            }
        }

        equity_curve_.push_back(config_.initial_capital + realized_pnl);
        dates_.push_back(current);

        current = DateUtils::addDays(current, trade_frequency_days);
    }

    state_ = EngineState::Completed;

    Logger::instance().info(kSource, std::string(80, '='));
    Logger::instance().info(kSource, "BACKTEST COMPLETE - " + std::to_string(trade_count) +
                                     " trades executed");
    Logger::instance().info(kSource, std::string(80, '='));

    return calculateMetrics();
}

BacktestMetrics BacktestEngine::calculateMetrics() const {
    if (closed_positions_.empty()) {
        Logger::instance().warning(kSource, "No closed positions to calculate metrics");
    }

    MetricsInput input;
    input.positions = &closed_positions_;
    input.equity_curve = &equity_curve_;
    input.start_date = config_.start_date;
    input.end_date = config_.end_date;
    input.initial_capital = config_.initial_capital;
    input.risk_free_rate = config_.risk_free_rate;
    input.trading_days = static_cast<int>(dates_.size()) - 1;

    return MetricsCalculator::calculateBacktestMetrics(input);
}

const PriceHistory& BacktestEngine::priceHistory(const std::string& symbol) const {
    auto it = price_data_.find(symbol);
    if (it == price_data_.end()) {
        throw MissingMarketDataError("No data loaded for " + symbol);
    }
    return it->second;
}

bool BacktestEngine::hasPriceHistory(const std::string& symbol) const {
    return price_data_.count(symbol) > 0;
}

void BacktestEngine::requireState(bool allowed, const std::string& operation) const {
    if (!allowed) {
        throw ValidationError(operation + " is not allowed while the engine is " +
                              toString(state_));
    }
}

} // namespace optval
