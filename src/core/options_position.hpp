#pragma once

#include "../models/black_scholes.hpp"
#include "../utils/date_utils.hpp"
#include <optional>
#include <string>
#include <vector>

namespace optval {

// Contract multiplier for US equity options
constexpr double kContractMultiplier = 100.0;

enum class StrategyCategory {
    CoveredCall,
    CashSecuredPut,
    IronCondor,
    CreditSpread,
    DebitSpread,
    Straddle,
    Strangle,
    CalendarSpread,
    VerticalSpread
};

std::string toString(StrategyCategory category);

enum class PositionState {
    Open,
    Closed
};

// One option contract within a position. Immutable once created.
class OptionLeg {
public:
    OptionLeg(OptionType type, double strike, Date expiration, int quantity,
              double entry_premium, const Greeks& entry_greeks = Greeks(), double entry_iv = 0.0);

    OptionType type() const { return type_; }
    double strike() const { return strike_; }
    Date expiration() const { return expiration_; }
    int quantity() const { return quantity_; }
    double entryPremium() const { return entry_premium_; }
    const Greeks& entryGreeks() const { return entry_greeks_; }
    double entryIV() const { return entry_iv_; }

    bool isLong() const { return quantity_ > 0; }
    bool isShort() const { return quantity_ < 0; }

private:
    OptionType type_;
    double strike_;
    Date expiration_;
    int quantity_; // Positive for long, negative for short
    double entry_premium_;
    Greeks entry_greeks_;
    double entry_iv_;
};

class OptionsPosition {
public:
    OptionsPosition(std::string symbol, StrategyCategory category, std::vector<OptionLeg> legs,
                    Date entry_date, double entry_price);

    // Sum leg premiums (credit for short legs, debit for long legs), add commission
    // and snapshot net Greeks. Negative entry cost means a net credit.
    void calculateEntryCost(double commission_per_contract = 0.65);

    // Close the position at the given per-leg exit premiums (same order as legs).
    // Throws ArgumentMismatchError on a count mismatch and PositionStateError if
    // the position is already closed or its entry cost was never calculated.
    double calculatePnl(const std::vector<double>& exit_premiums,
                        double commission_per_contract = 0.65);

    // Exit date minus entry date when closed, otherwise today minus entry date
    int daysInTrade() const;

    void setExit(Date exit_date, double exit_price);

    const std::string& symbol() const { return symbol_; }
    StrategyCategory category() const { return category_; }
    const std::vector<OptionLeg>& legs() const { return legs_; }
    Date entryDate() const { return entry_date_; }
    double entryPrice() const { return entry_price_; }
    const std::optional<Date>& exitDate() const { return exit_date_; }
    const std::optional<double>& exitPrice() const { return exit_price_; }

    PositionState state() const { return state_; }
    bool isClosed() const { return state_ == PositionState::Closed; }

    double entryCost() const { return entry_cost_; }
    double exitValue() const { return exit_value_; }
    double commission() const { return commission_; }
    double pnl() const { return pnl_; }
    int totalContracts() const;

    const Greeks& netGreeks() const { return net_greeks_; }

    // Latest expiration among the legs
    Date lastExpiration() const;

private:
    std::string symbol_;
    StrategyCategory category_;
    std::vector<OptionLeg> legs_;
    Date entry_date_;
    double entry_price_; // Underlying price at entry

    std::optional<Date> exit_date_;
    std::optional<double> exit_price_;
    PositionState state_;

    bool entry_cost_calculated_;
    double entry_cost_;
    double exit_value_;
    double commission_;
    double pnl_;
    Greeks net_greeks_;
};

} // namespace optval
