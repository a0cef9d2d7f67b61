#include "strategies.hpp"
#include "errors.hpp"
#include <cmath>

namespace optval {

namespace {

constexpr double kDefaultIV = 0.20;

struct LegSpec {
    OptionType type;
    double strike;
    int quantity;
};

// Spot and volatility seen by the strategy on the evaluation date
struct MarketSnapshot {
    double spot;
    double iv;
};

std::optional<MarketSnapshot> snapshot(const PriceHistory& history) {
    if (history.empty()) return std::nullopt;

    const HistoryRow& last = history.back();
    if (!std::isfinite(last.bar.close) || last.bar.close <= 0) return std::nullopt;

    double iv = last.iv_estimate;
    if (!std::isfinite(iv) || iv <= 0) {
        iv = kDefaultIV;
    }
    return MarketSnapshot{last.bar.close, iv};
}

OptionsPosition buildPosition(const std::string& symbol, StrategyCategory category,
                              const Date& date, const MarketSnapshot& market,
                              const std::vector<LegSpec>& specs, const StrategyParams& params) {
    Date expiration = DateUtils::addDays(date, params.days_to_expiry);
    double T = params.days_to_expiry / 365.0;

    std::vector<OptionLeg> legs;
    for (const auto& spec : specs) {
        auto priced = BlackScholes::price(market.spot, spec.strike, T, params.risk_free_rate,
                                          market.iv, spec.type);
        legs.emplace_back(spec.type, spec.strike, expiration, spec.quantity, priced.price,
                          priced.greeks, market.iv);
    }

    OptionsPosition position(symbol, category, std::move(legs), date, market.spot);
    position.calculateEntryCost(params.commission_per_contract);
    return position;
}

double strikeAt(double spot, double offset_pct) {
    return std::round(spot * (1.0 + offset_pct));
}

} // namespace

StrategyFunction Strategies::coveredCall(const StrategyParams& params) {
    return [params](const std::string& symbol, const Date& date,
                    const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto market = snapshot(history);
        if (!market) return std::nullopt;

        double strike = strikeAt(market->spot, params.otm_pct);
        return buildPosition(symbol, StrategyCategory::CoveredCall, date, *market,
                             {{OptionType::Call, strike, -params.contracts}}, params);
    };
}

StrategyFunction Strategies::cashSecuredPut(const StrategyParams& params) {
    return [params](const std::string& symbol, const Date& date,
                    const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto market = snapshot(history);
        if (!market) return std::nullopt;

        double strike = strikeAt(market->spot, -params.otm_pct);
        return buildPosition(symbol, StrategyCategory::CashSecuredPut, date, *market,
                             {{OptionType::Put, strike, -params.contracts}}, params);
    };
}

StrategyFunction Strategies::creditSpread(const StrategyParams& params) {
    return [params](const std::string& symbol, const Date& date,
                    const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto market = snapshot(history);
        if (!market) return std::nullopt;

        double short_strike = strikeAt(market->spot, -params.otm_pct);
        double long_strike = strikeAt(market->spot, -(params.otm_pct + params.spread_width_pct));
        if (long_strike >= short_strike) return std::nullopt;

        return buildPosition(symbol, StrategyCategory::CreditSpread, date, *market,
                             {{OptionType::Put, short_strike, -params.contracts},
                              {OptionType::Put, long_strike, params.contracts}},
                             params);
    };
}

StrategyFunction Strategies::ironCondor(const StrategyParams& params) {
    return [params](const std::string& symbol, const Date& date,
                    const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto market = snapshot(history);
        if (!market) return std::nullopt;

        double wing = params.otm_pct + params.spread_width_pct;
        double short_put = strikeAt(market->spot, -params.otm_pct);
        double long_put = strikeAt(market->spot, -wing);
        double short_call = strikeAt(market->spot, params.otm_pct);
        double long_call = strikeAt(market->spot, wing);
        if (long_put >= short_put || long_call <= short_call || long_put <= 0) return std::nullopt;

        return buildPosition(symbol, StrategyCategory::IronCondor, date, *market,
                             {{OptionType::Put, long_put, params.contracts},
                              {OptionType::Put, short_put, -params.contracts},
                              {OptionType::Call, short_call, -params.contracts},
                              {OptionType::Call, long_call, params.contracts}},
                             params);
    };
}

StrategyFunction Strategies::straddle(const StrategyParams& params) {
    return [params](const std::string& symbol, const Date& date,
                    const PriceHistory& history) -> std::optional<OptionsPosition> {
        auto market = snapshot(history);
        if (!market) return std::nullopt;

        double strike = strikeAt(market->spot, 0.0);
        return buildPosition(symbol, StrategyCategory::Straddle, date, *market,
                             {{OptionType::Call, strike, params.contracts},
                              {OptionType::Put, strike, params.contracts}},
                             params);
    };
}

StrategyFunction Strategies::fromName(const std::string& name, const StrategyParams& params) {
    if (name == "covered_call") return coveredCall(params);
    if (name == "cash_secured_put") return cashSecuredPut(params);
    if (name == "credit_spread") return creditSpread(params);
    if (name == "iron_condor") return ironCondor(params);
    if (name == "straddle") return straddle(params);

    throw ValidationError("Unknown strategy: " + name);
}

std::vector<std::string> Strategies::names() {
    return {"covered_call", "cash_secured_put", "credit_spread", "iron_condor", "straddle"};
}

} // namespace optval
