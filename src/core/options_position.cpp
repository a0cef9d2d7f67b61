#include "options_position.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdlib>

namespace optval {

std::string toString(StrategyCategory category) {
    switch (category) {
        case StrategyCategory::CoveredCall: return "covered_call";
        case StrategyCategory::CashSecuredPut: return "cash_secured_put";
        case StrategyCategory::IronCondor: return "iron_condor";
        case StrategyCategory::CreditSpread: return "credit_spread";
        case StrategyCategory::DebitSpread: return "debit_spread";
        case StrategyCategory::Straddle: return "straddle";
        case StrategyCategory::Strangle: return "strangle";
        case StrategyCategory::CalendarSpread: return "calendar_spread";
        case StrategyCategory::VerticalSpread: return "vertical_spread";
    }
    return "unknown";
}

OptionLeg::OptionLeg(OptionType type, double strike, Date expiration, int quantity,
                     double entry_premium, const Greeks& entry_greeks, double entry_iv)
    : type_(type), strike_(strike), expiration_(expiration), quantity_(quantity),
      entry_premium_(entry_premium), entry_greeks_(entry_greeks), entry_iv_(entry_iv) {
    if (quantity == 0) {
        throw ValidationError("Option leg quantity must be non-zero");
    }
    if (strike <= 0) {
        throw ValidationError("Option leg strike must be positive");
    }
}

OptionsPosition::OptionsPosition(std::string symbol, StrategyCategory category,
                                 std::vector<OptionLeg> legs, Date entry_date, double entry_price)
    : symbol_(std::move(symbol)), category_(category), legs_(std::move(legs)),
      entry_date_(entry_date), entry_price_(entry_price), state_(PositionState::Open),
      entry_cost_calculated_(false), entry_cost_(0), exit_value_(0), commission_(0), pnl_(0) {
    if (legs_.empty()) {
        throw ValidationError("Position for " + symbol_ + " must have at least one leg");
    }
}

void OptionsPosition::calculateEntryCost(double commission_per_contract) {
    double total_premium = 0.0;
    Greeks net;

    for (const auto& leg : legs_) {
        double leg_value = leg.entryPremium() * kContractMultiplier * std::abs(leg.quantity());

        if (leg.isShort()) {
            total_premium -= leg_value; // credit received
        } else {
            total_premium += leg_value; // debit paid
        }

        const Greeks& g = leg.entryGreeks();
        net.delta += g.delta * leg.quantity();
        net.gamma += g.gamma * leg.quantity();
        net.theta += g.theta * leg.quantity();
        net.vega += g.vega * leg.quantity();
        net.rho += g.rho * leg.quantity();
    }

    commission_ = totalContracts() * commission_per_contract;
    entry_cost_ = total_premium + commission_;
    net_greeks_ = net;
    entry_cost_calculated_ = true;
}

double OptionsPosition::calculatePnl(const std::vector<double>& exit_premiums,
                                     double commission_per_contract) {
    if (state_ == PositionState::Closed) {
        throw PositionStateError("Position in " + symbol_ + " is already closed");
    }
    if (!entry_cost_calculated_) {
        throw PositionStateError("Entry cost for " + symbol_ + " has not been calculated");
    }
    if (exit_premiums.size() != legs_.size()) {
        throw ArgumentMismatchError("Exit premiums (" + std::to_string(exit_premiums.size()) +
                                    ") must match number of legs (" +
                                    std::to_string(legs_.size()) + ")");
    }

    double total_exit_value = 0.0;
    for (size_t i = 0; i < legs_.size(); ++i) {
        double leg_value = exit_premiums[i] * kContractMultiplier * std::abs(legs_[i].quantity());

        if (legs_[i].isShort()) {
            total_exit_value -= leg_value; // buy back
        } else {
            total_exit_value += leg_value; // sell to close
        }
    }

    double exit_commission = totalContracts() * commission_per_contract;
    exit_value_ = total_exit_value - exit_commission;
    pnl_ = exit_value_ - entry_cost_;
    commission_ += exit_commission;
    state_ = PositionState::Closed;

    return pnl_;
}

int OptionsPosition::daysInTrade() const {
    if (state_ == PositionState::Closed && exit_date_) {
        return DateUtils::daysBetween(entry_date_, *exit_date_);
    }
    return DateUtils::daysBetween(entry_date_, DateUtils::today());
}

void OptionsPosition::setExit(Date exit_date, double exit_price) {
    if (state_ == PositionState::Closed) {
        throw PositionStateError("Cannot change exit of closed position in " + symbol_);
    }
    exit_date_ = exit_date;
    exit_price_ = exit_price;
}

int OptionsPosition::totalContracts() const {
    int contracts = 0;
    for (const auto& leg : legs_) {
        contracts += std::abs(leg.quantity());
    }
    return contracts;
}

Date OptionsPosition::lastExpiration() const {
    Date latest = legs_.front().expiration();
    for (const auto& leg : legs_) {
        latest = std::max(latest, leg.expiration());
    }
    return latest;
}

} // namespace optval
