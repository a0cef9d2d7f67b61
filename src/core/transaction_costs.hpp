#pragma once

#include <string>
#include <vector>

namespace optval {

enum class OrderType {
    Market,
    Limit,
    Stop,
    StopLimit
};

enum class AssetClass {
    Equity,
    ETF,
    Option,
    Crypto,
    Forex
};

std::string toString(AssetClass asset_class);

struct CostModelParams {
    double base_spread_bps;
    double volatility_multiplier;    // spread widening per unit of vol / 20%
    double impact_coefficient;
    double base_slippage_bps;
    double volatility_slippage_mult;
    double commission_per_share;
    double min_commission;
    double borrow_rate_annual;

    CostModelParams() : base_spread_bps(2.0), volatility_multiplier(0.5), impact_coefficient(0.1),
                        base_slippage_bps(1.0), volatility_slippage_mult(0.3),
                        commission_per_share(0.0), min_commission(0.0), borrow_rate_annual(0.02) {}

    static CostModelParams forAssetClass(AssetClass asset_class);
};

// Breakdown of one execution; *_pct fields are percent of trade value
struct TransactionCost {
    double spread_cost;
    double market_impact;
    double slippage;
    double commission;
    double borrowing_cost;
    double total_cost;

    double spread_cost_pct;
    double market_impact_pct;
    double slippage_pct;
    double commission_pct;
    double borrowing_cost_pct;
    double total_cost_pct;

    TransactionCost() : spread_cost(0), market_impact(0), slippage(0), commission(0),
                        borrowing_cost(0), total_cost(0), spread_cost_pct(0), market_impact_pct(0),
                        slippage_pct(0), commission_pct(0), borrowing_cost_pct(0), total_cost_pct(0) {}
};

struct RoundTripCost {
    double total;
    TransactionCost entry;
    TransactionCost exit;

    RoundTripCost() : total(0) {}
};

// A closed trade in cost-model units. quantity is signed (negative = short).
struct TradeRecord {
    std::string symbol;
    double quantity;
    double entry_price;
    double exit_price;
    int holding_days;
    double pnl;

    // Filled by adjustReturns
    double transaction_costs;
    double adjusted_pnl;

    TradeRecord() : quantity(0), entry_price(0), exit_price(0), holding_days(1), pnl(0),
                    transaction_costs(0), adjusted_pnl(0) {}
};

class CostModel {
public:
    virtual ~CostModel() = default;

    virtual RoundTripCost estimateRoundTripCost(double quantity, double entry_price,
                                                double exit_price, int holding_days = 1,
                                                double volatility = 0.20) const = 0;

    // Copy of the trades with transaction_costs and adjusted_pnl filled in
    virtual std::vector<TradeRecord> adjustReturns(const std::vector<TradeRecord>& trades) const = 0;
};

// Spread, square-root impact, slippage, commission and short borrow
class TransactionCostModel : public CostModel {
public:
    explicit TransactionCostModel(AssetClass asset_class = AssetClass::Equity);
    TransactionCostModel(AssetClass asset_class, CostModelParams params);

    // Cost of one execution. avg_daily_volume <= 0 selects the value-based impact estimate.
    TransactionCost estimateCost(double quantity, double price, bool is_buy,
                                 double volatility = 0.20, double avg_daily_volume = 0.0,
                                 int holding_days = 0, OrderType order_type = OrderType::Market) const;

    RoundTripCost estimateRoundTripCost(double quantity, double entry_price, double exit_price,
                                        int holding_days = 1,
                                        double volatility = 0.20) const override;

    std::vector<TradeRecord> adjustReturns(const std::vector<TradeRecord>& trades) const override;

    AssetClass assetClass() const { return asset_class_; }
    const CostModelParams& params() const { return params_; }

private:
    double spreadBps(double volatility) const;
    double marketImpact(double quantity, double price, double avg_daily_volume,
                        double volatility) const;
    double slippage(double trade_value, double volatility, OrderType order_type) const;
    double borrowCost(double trade_value, int holding_days) const;

    AssetClass asset_class_;
    CostModelParams params_;
};

} // namespace optval
