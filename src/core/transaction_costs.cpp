#include "transaction_costs.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cmath>

namespace optval {

std::string toString(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::Equity: return "us_equity";
        case AssetClass::ETF: return "etf";
        case AssetClass::Option: return "option";
        case AssetClass::Crypto: return "crypto";
        case AssetClass::Forex: return "forex";
    }
    return "unknown";
}

CostModelParams CostModelParams::forAssetClass(AssetClass asset_class) {
    CostModelParams params;
    switch (asset_class) {
        case AssetClass::Equity:
            params.base_spread_bps = 2.0;
            params.impact_coefficient = 0.1;
            params.base_slippage_bps = 1.0;
            break;
        case AssetClass::ETF:
            params.base_spread_bps = 1.0;
            params.impact_coefficient = 0.05;
            params.base_slippage_bps = 0.5;
            break;
        case AssetClass::Option:
            params.base_spread_bps = 20.0;
            params.impact_coefficient = 0.3;
            params.base_slippage_bps = 5.0;
            break;
        case AssetClass::Crypto:
            params.base_spread_bps = 5.0;
            params.impact_coefficient = 0.2;
            params.base_slippage_bps = 3.0;
            break;
        case AssetClass::Forex:
            params.base_spread_bps = 0.5;
            params.impact_coefficient = 0.02;
            params.base_slippage_bps = 0.3;
            break;
    }
    return params;
}

TransactionCostModel::TransactionCostModel(AssetClass asset_class)
    : TransactionCostModel(asset_class, CostModelParams::forAssetClass(asset_class)) {}

TransactionCostModel::TransactionCostModel(AssetClass asset_class, CostModelParams params)
    : asset_class_(asset_class), params_(params) {
    Logger::instance().debug("TransactionCostModel", "Initialized cost model for " + toString(asset_class_));
}

TransactionCost TransactionCostModel::estimateCost(double quantity, double price, bool is_buy,
                                                   double volatility, double avg_daily_volume,
                                                   int holding_days, OrderType order_type) const {
    TransactionCost cost;
    double trade_value = std::abs(quantity * price);
    if (trade_value == 0) {
        return cost;
    }

    cost.spread_cost = trade_value * (spreadBps(volatility) / 10000.0) / 2.0;

    if (avg_daily_volume > 0) {
        cost.market_impact = marketImpact(quantity, price, avg_daily_volume, volatility);
    } else {
        double impact_bps = params_.impact_coefficient * std::sqrt(trade_value / 100000.0) * 10.0;
        cost.market_impact = trade_value * (impact_bps / 10000.0);
    }

    cost.slippage = slippage(trade_value, volatility, order_type);
    cost.commission = std::max(params_.min_commission, std::abs(quantity) * params_.commission_per_share);

    if (!is_buy && holding_days > 0) {
        cost.borrowing_cost = borrowCost(trade_value, holding_days);
    }

    cost.total_cost = cost.spread_cost + cost.market_impact + cost.slippage + cost.commission +
                      cost.borrowing_cost;

    cost.spread_cost_pct = cost.spread_cost / trade_value * 100.0;
    cost.market_impact_pct = cost.market_impact / trade_value * 100.0;
    cost.slippage_pct = cost.slippage / trade_value * 100.0;
    cost.commission_pct = cost.commission / trade_value * 100.0;
    cost.borrowing_cost_pct = cost.borrowing_cost / trade_value * 100.0;
    cost.total_cost_pct = cost.total_cost / trade_value * 100.0;
    return cost;
}

RoundTripCost TransactionCostModel::estimateRoundTripCost(double quantity, double entry_price,
                                                          double exit_price, int holding_days,
                                                          double volatility) const {
    bool is_long = quantity > 0;

    RoundTripCost result;
    // Borrow for the whole holding period is charged on the opening sell of a short
    result.entry = estimateCost(std::abs(quantity), entry_price, is_long, volatility, 0.0,
                                is_long ? 0 : holding_days);
    result.exit = estimateCost(std::abs(quantity), exit_price, !is_long, volatility, 0.0, 0);
    result.total = result.entry.total_cost + result.exit.total_cost;
    return result;
}

std::vector<TradeRecord> TransactionCostModel::adjustReturns(const std::vector<TradeRecord>& trades) const {
    std::vector<TradeRecord> adjusted;
    adjusted.reserve(trades.size());

    for (const auto& trade : trades) {
        TradeRecord copy = trade;
        auto cost = estimateRoundTripCost(trade.quantity, trade.entry_price, trade.exit_price,
                                          trade.holding_days);
        copy.transaction_costs = cost.total;
        copy.adjusted_pnl = trade.pnl - cost.total;
        adjusted.push_back(copy);
    }
    return adjusted;
}

double TransactionCostModel::spreadBps(double volatility) const {
    return params_.base_spread_bps * (1.0 + params_.volatility_multiplier * (volatility / 0.20));
}

double TransactionCostModel::marketImpact(double quantity, double price, double avg_daily_volume,
                                          double volatility) const {
    if (avg_daily_volume <= 0) return 0.0;

    double trade_value = std::abs(quantity * price);
    double participation = std::abs(quantity) / avg_daily_volume;
    return trade_value * params_.impact_coefficient * volatility * std::sqrt(participation);
}

double TransactionCostModel::slippage(double trade_value, double volatility, OrderType order_type) const {
    double slippage_bps = params_.base_slippage_bps *
                          (1.0 + params_.volatility_slippage_mult * (volatility / 0.20));
    if (order_type == OrderType::Limit) {
        slippage_bps *= 0.3;
    } else if (order_type == OrderType::Stop) {
        slippage_bps *= 2.0;
    }
    return trade_value * (slippage_bps / 10000.0);
}

double TransactionCostModel::borrowCost(double trade_value, int holding_days) const {
    return trade_value * (params_.borrow_rate_annual / 252.0) * holding_days;
}

} // namespace optval
