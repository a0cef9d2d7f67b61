#include "regime_detector.hpp"
#include "errors.hpp"
#include "../utils/logger.hpp"
#include "../utils/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace optval {

namespace {

const char* kSource = "RegimeDetector";

bool isUp(TrendRegime trend) {
    return trend == TrendRegime::StrongUptrend || trend == TrendRegime::WeakUptrend;
}

bool isDown(TrendRegime trend) {
    return trend == TrendRegime::StrongDowntrend || trend == TrendRegime::WeakDowntrend;
}

double tailMean(const std::vector<double>& values, size_t count) {
    std::vector<double> tail(values.end() - static_cast<long>(std::min(count, values.size())), values.end());
    return Statistics::mean(tail);
}

} // namespace

std::string toString(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::Low: return "low";
        case VolatilityRegime::Medium: return "medium";
        case VolatilityRegime::High: return "high";
        case VolatilityRegime::Extreme: return "extreme";
    }
    return "unknown";
}

std::string toString(TrendRegime regime) {
    switch (regime) {
        case TrendRegime::StrongUptrend: return "strong_uptrend";
        case TrendRegime::WeakUptrend: return "weak_uptrend";
        case TrendRegime::Ranging: return "ranging";
        case TrendRegime::WeakDowntrend: return "weak_downtrend";
        case TrendRegime::StrongDowntrend: return "strong_downtrend";
    }
    return "unknown";
}

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BullLowVol: return "bull_low_vol";
        case MarketRegime::BullHighVol: return "bull_high_vol";
        case MarketRegime::BearLowVol: return "bear_low_vol";
        case MarketRegime::BearHighVol: return "bear_high_vol";
        case MarketRegime::RangingLowVol: return "ranging_low_vol";
        case MarketRegime::RangingHighVol: return "ranging_high_vol";
        case MarketRegime::Crisis: return "crisis";
    }
    return "unknown";
}

RegimeDetector::RegimeDetector(size_t volatility_window, size_t trend_window, size_t history_window,
                               double vol_percentile_low, double vol_percentile_high)
    : volatility_window_(volatility_window), trend_window_(trend_window),
      history_window_(history_window), vol_percentile_low_(vol_percentile_low),
      vol_percentile_high_(vol_percentile_high), has_regime_(false),
      current_regime_(MarketRegime::RangingLowVol), transitions_(0) {
    if (volatility_window_ < 2 || trend_window_ < 20 || history_window_ < trend_window_) {
        throw ValidationError("Regime windows must satisfy 2 <= volatility, 20 <= trend <= history");
    }
}

RegimeState RegimeDetector::detectRegime(const std::vector<double>& prices) {
    auto returns = Statistics::finiteOnly(Statistics::returnsFromEquity(prices));
    if (returns.size() < history_window_) {
        Logger::instance().warning(kSource, "Insufficient data: " + std::to_string(returns.size()) +
                                            " < " + std::to_string(history_window_));
        return RegimeState();
    }

    auto rolling_vol = rollingStd(returns);

    RegimeState state;
    state.volatility_regime = classifyVolatility(rolling_vol, &state.volatility_percentile);
    state.trend_regime = classifyTrend(prices, &state.trend_strength);
    state.market_regime = combine(state.volatility_regime, state.trend_regime);
    state.regime_confidence = confidence(rolling_vol, prices);
    state.recommended_position_scale = positionScale(state.volatility_regime, state.trend_regime,
                                                     state.regime_confidence);

    if (!has_regime_ || current_regime_ != state.market_regime) {
        if (has_regime_) {
            ++transitions_;
            Logger::instance().info(kSource, "Regime transition: " + toString(current_regime_) +
                                             " -> " + toString(state.market_regime));
        }
        current_regime_ = state.market_regime;
        has_regime_ = true;
    }

    return state;
}

std::vector<double> RegimeDetector::rollingStd(const std::vector<double>& returns) const {
    std::vector<double> result(returns.size(), std::numeric_limits<double>::quiet_NaN());
    for (size_t i = volatility_window_ - 1; i < returns.size(); ++i) {
        std::vector<double> window(returns.begin() + static_cast<long>(i + 1 - volatility_window_),
                                   returns.begin() + static_cast<long>(i + 1));
        result[i] = Statistics::stdDev(window);
    }
    return result;
}

VolatilityRegime RegimeDetector::classifyVolatility(const std::vector<double>& rolling_vol,
                                                    double* percentile) const {
    double current = rolling_vol.back();

    // Warm-up NaNs count in the denominator but never below the current value
    size_t start = rolling_vol.size() - std::min(history_window_, rolling_vol.size());
    size_t below = 0;
    for (size_t i = start; i < rolling_vol.size(); ++i) {
        if (rolling_vol[i] < current) ++below;
    }
    double pct = static_cast<double>(below) / (rolling_vol.size() - start) * 100.0;
    *percentile = pct;

    if (pct < vol_percentile_low_) return VolatilityRegime::Low;
    if (pct < vol_percentile_high_) return VolatilityRegime::Medium;
    if (pct < 95.0) return VolatilityRegime::High;
    return VolatilityRegime::Extreme;
}

TrendRegime RegimeDetector::classifyTrend(const std::vector<double>& prices, double* strength) const {
    double short_ma = tailMean(prices, 20);
    double long_ma = tailMean(prices, trend_window_);

    auto window_begin = prices.end() - static_cast<long>(trend_window_);
    auto [min_it, max_it] = std::minmax_element(window_begin, prices.end());
    double price_range = *max_it - *min_it;
    double ma_diff = price_range > 0 ? (short_ma - long_ma) / price_range : 0.0;

    double reference = *window_begin;
    double roc = reference != 0 ? (prices.back() - reference) / reference : 0.0;

    double trend = std::clamp((ma_diff + roc) / 2.0 * 5.0, -1.0, 1.0);
    *strength = trend;

    if (trend > 0.5) return TrendRegime::StrongUptrend;
    if (trend > 0.1) return TrendRegime::WeakUptrend;
    if (trend > -0.1) return TrendRegime::Ranging;
    if (trend > -0.5) return TrendRegime::WeakDowntrend;
    return TrendRegime::StrongDowntrend;
}

MarketRegime RegimeDetector::combine(VolatilityRegime vol, TrendRegime trend) {
    bool high_vol = vol == VolatilityRegime::High || vol == VolatilityRegime::Extreme;

    if (vol == VolatilityRegime::Extreme && isDown(trend)) return MarketRegime::Crisis;
    if (isUp(trend)) return high_vol ? MarketRegime::BullHighVol : MarketRegime::BullLowVol;
    if (isDown(trend)) return high_vol ? MarketRegime::BearHighVol : MarketRegime::BearLowVol;
    return high_vol ? MarketRegime::RangingHighVol : MarketRegime::RangingLowVol;
}

double RegimeDetector::confidence(const std::vector<double>& rolling_vol,
                                  const std::vector<double>& prices) const {
    // Volatility stability: 1 - coefficient of variation of the last 20 rolling vols
    std::vector<double> recent_vol(rolling_vol.end() - static_cast<long>(std::min<size_t>(20, rolling_vol.size())),
                                   rolling_vol.end());
    recent_vol = Statistics::finiteOnly(recent_vol);
    double vol_mean = Statistics::mean(recent_vol);
    double vol_stability = 1.0 - (vol_mean > 0 ? Statistics::stdDev(recent_vol) / vol_mean : 1.0);

    // Trend clarity: R^2 of the last trend_window prices against time
    std::vector<double> recent(prices.end() - static_cast<long>(trend_window_), prices.end());
    double n = static_cast<double>(recent.size());
    double x_mean = (n - 1.0) / 2.0;
    double y_mean = Statistics::mean(recent);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < recent.size(); ++i) {
        double dx = static_cast<double>(i) - x_mean;
        double dy = recent[i] - y_mean;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    double trend_clarity = (sxx > 0 && syy > 0) ? (sxy * sxy) / (sxx * syy) : 0.0;

    double result = (vol_stability + trend_clarity) / 2.0;
    return std::isfinite(result) ? std::clamp(result, 0.0, 1.0) : 0.0;
}

double RegimeDetector::positionScale(VolatilityRegime vol, TrendRegime trend, double confidence) {
    double vol_scale = 1.0;
    switch (vol) {
        case VolatilityRegime::Low: vol_scale = 1.0; break;
        case VolatilityRegime::Medium: vol_scale = 0.8; break;
        case VolatilityRegime::High: vol_scale = 0.5; break;
        case VolatilityRegime::Extreme: vol_scale = 0.25; break;
    }

    double trend_scale = 1.0;
    switch (trend) {
        case TrendRegime::StrongUptrend: trend_scale = 1.0; break;
        case TrendRegime::WeakUptrend: trend_scale = 0.8; break;
        case TrendRegime::Ranging: trend_scale = 0.6; break;
        case TrendRegime::WeakDowntrend: trend_scale = 0.5; break;
        case TrendRegime::StrongDowntrend: trend_scale = 0.3; break;
    }

    double scale = vol_scale * trend_scale * (0.5 + 0.5 * confidence);
    return std::clamp(scale, 0.1, 1.0);
}

} // namespace optval
