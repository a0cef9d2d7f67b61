#pragma once

#include "data_loader.hpp"
#include "metrics.hpp"
#include "options_position.hpp"
#include "price_history.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace optval {

struct BacktestConfig {
    Date start_date;
    Date end_date;
    double initial_capital;
    double risk_free_rate;
    double commission_per_contract;
    size_t min_history_bars; // bars required before a symbol is traded
    int lookback_days;       // calendar days loaded ahead of start_date

    BacktestConfig() : initial_capital(100000.0), risk_free_rate(0.04),
                       commission_per_contract(0.65), min_history_bars(60), lookback_days(252) {}
};

enum class EngineState {
    Configured,
    LoadedData,
    Running,
    Completed
};

std::string toString(EngineState state);

// Strategy callback: (symbol, evaluation date, history up to that date) -> new position or none
using StrategyFunction = std::function<std::optional<OptionsPosition>(
    const std::string&, const Date&, const PriceHistory&)>;

class BacktestEngine {
public:
    // Throws ValidationError if end_date precedes start_date or capital is not positive
    BacktestEngine(BacktestConfig config, std::shared_ptr<PriceHistoryProvider> provider);

    // Fetch, annotate and cache a symbol's history. Default window is
    // [start_date - lookback_days, end_date]. Throws MissingMarketDataError if the
    // provider returns no bars.
    const PriceHistory& loadPriceHistory(const std::string& symbol,
                                         std::optional<Date> start = std::nullopt,
                                         std::optional<Date> end = std::nullopt);

    // Price each leg at the exit date and close the position
    OptionsPosition simulateTrade(OptionsPosition position) const;

    // Step through the backtest window, calling the strategy for every symbol
    BacktestMetrics runBacktest(const StrategyFunction& strategy,
                                const std::vector<std::string>& symbols,
                                int trade_frequency_days = 7);

    // Reduce the closed positions to metrics; all zeros when nothing closed
    BacktestMetrics calculateMetrics() const;

    const BacktestConfig& config() const { return config_; }
    EngineState state() const { return state_; }
    const std::vector<OptionsPosition>& closedPositions() const { return closed_positions_; }
    const std::vector<double>& equityCurve() const { return equity_curve_; }
    const std::vector<Date>& dates() const { return dates_; }

    // Cached history; throws MissingMarketDataError if the symbol was never loaded
    const PriceHistory& priceHistory(const std::string& symbol) const;
    bool hasPriceHistory(const std::string& symbol) const;

private:
    void requireState(bool allowed, const std::string& operation) const;

    BacktestConfig config_;
    std::shared_ptr<PriceHistoryProvider> provider_;
    EngineState state_;

    std::map<std::string, PriceHistory> price_data_;
    std::vector<OptionsPosition> closed_positions_;
    std::vector<double> equity_curve_;
    std::vector<Date> dates_;
};

} // namespace optval
