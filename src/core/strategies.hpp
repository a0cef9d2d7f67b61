#pragma once

#include "backtest_engine.hpp"
#include <string>
#include <vector>

namespace optval {

struct StrategyParams {
    int days_to_expiry;
    double otm_pct;          // distance of the short strike from spot
    double spread_width_pct; // distance of the protective wing beyond the short strike
    int contracts;
    double risk_free_rate;
    double commission_per_contract;

    StrategyParams() : days_to_expiry(30), otm_pct(0.05), spread_width_pct(0.05), contracts(1),
                       risk_free_rate(0.04), commission_per_contract(0.65) {}
};

// Sample strategy factories. Each returned function opens one position per call,
// priced with Black-Scholes at the last close and the latest IV estimate.
class Strategies {
public:
    static StrategyFunction coveredCall(const StrategyParams& params = StrategyParams());
    static StrategyFunction cashSecuredPut(const StrategyParams& params = StrategyParams());

    // Bull put spread: short put below spot, long put a further width below
    static StrategyFunction creditSpread(const StrategyParams& params = StrategyParams());

    static StrategyFunction ironCondor(const StrategyParams& params = StrategyParams());

    // Long ATM call and put
    static StrategyFunction straddle(const StrategyParams& params = StrategyParams());

    // Look up a factory by name ("covered_call", "iron_condor", ...);
    // throws ValidationError for unknown names
    static StrategyFunction fromName(const std::string& name,
                                     const StrategyParams& params = StrategyParams());

    static std::vector<std::string> names();
};

} // namespace optval
