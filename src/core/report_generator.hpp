#pragma once

#include "extended_validator.hpp"
#include "metrics.hpp"
#include "monte_carlo.hpp"
#include "var_calculator.hpp"
#include <map>
#include <string>

namespace optval {

// Plain-text reports for the terminal
class ReportGenerator {
public:
    static std::string backtestReport(const BacktestMetrics& metrics);
    static std::string monteCarloReport(const MonteCarloResult& result);
    static std::string stressReport(const std::map<std::string, MonteCarloResult>& results);
    static std::string varReport(const VaRResult& result);
    static std::string regimeReport(const RegimeState& regime);
    static std::string validationReport(const ExtendedValidationResult& result);

private:
    static std::string rule(char c = '=');
    static std::string row(const std::string& label, const std::string& value);
};

} // namespace optval
