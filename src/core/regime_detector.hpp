#pragma once

#include <string>
#include <vector>

namespace optval {

enum class VolatilityRegime {
    Low,
    Medium,
    High,
    Extreme
};

enum class TrendRegime {
    StrongUptrend,
    WeakUptrend,
    Ranging,
    WeakDowntrend,
    StrongDowntrend
};

enum class MarketRegime {
    BullLowVol,
    BullHighVol,
    BearLowVol,
    BearHighVol,
    RangingLowVol,
    RangingHighVol,
    Crisis
};

std::string toString(VolatilityRegime regime);
std::string toString(TrendRegime regime);
std::string toString(MarketRegime regime);

struct RegimeState {
    VolatilityRegime volatility_regime;
    TrendRegime trend_regime;
    MarketRegime market_regime;
    double volatility_percentile;      // 0-100
    double trend_strength;             // -1 strong down .. +1 strong up
    double regime_confidence;          // 0-1
    double recommended_position_scale; // 0.1-1

    RegimeState() : volatility_regime(VolatilityRegime::Medium), trend_regime(TrendRegime::Ranging),
                    market_regime(MarketRegime::RangingLowVol), volatility_percentile(50.0),
                    trend_strength(0.0), regime_confidence(0.0), recommended_position_scale(0.5) {}
};

class RegimeClassifier {
public:
    virtual ~RegimeClassifier() = default;

    // Classify the market from a date-ordered close series
    virtual RegimeState detectRegime(const std::vector<double>& prices) = 0;
};

class RegimeDetector : public RegimeClassifier {
public:
    RegimeDetector(size_t volatility_window = 20, size_t trend_window = 50,
                   size_t history_window = 252, double vol_percentile_low = 25.0,
                   double vol_percentile_high = 75.0);

    // Fewer than history_window returns yields the default (medium / ranging) state
    RegimeState detectRegime(const std::vector<double>& prices) override;

    // Number of market-regime changes seen across detectRegime calls
    size_t transitionCount() const { return transitions_; }

private:
    std::vector<double> rollingStd(const std::vector<double>& returns) const;

    VolatilityRegime classifyVolatility(const std::vector<double>& rolling_vol, double* percentile) const;
    TrendRegime classifyTrend(const std::vector<double>& prices, double* strength) const;
    static MarketRegime combine(VolatilityRegime vol, TrendRegime trend);
    double confidence(const std::vector<double>& rolling_vol, const std::vector<double>& prices) const;
    static double positionScale(VolatilityRegime vol, TrendRegime trend, double confidence);

    size_t volatility_window_;
    size_t trend_window_;
    size_t history_window_;
    double vol_percentile_low_;
    double vol_percentile_high_;

    bool has_regime_;
    MarketRegime current_regime_;
    size_t transitions_;
};

} // namespace optval
