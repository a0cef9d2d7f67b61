#pragma once

#include "extended_validator.hpp"
#include "metrics.hpp"
#include "monte_carlo.hpp"
#include "options_position.hpp"
#include "risk_monitor.hpp"
#include "var_calculator.hpp"
#include "../utils/date_utils.hpp"
#include <string>
#include <vector>

namespace optval {

class Exporter {
public:
    Exporter(const std::string& output_dir = "");

    // Export backtest metrics
    bool exportBacktestMetrics(const BacktestMetrics& metrics, const std::string& filename);

    // Export Monte Carlo distributions
    bool exportMonteCarlo(const MonteCarloResult& result, const std::string& filename);

    bool exportVaR(const VaRResult& result, const std::string& filename);
    bool exportAlerts(const std::vector<RiskAlert>& alerts, const std::string& filename);
    bool exportValidation(const ExtendedValidationResult& result, const std::string& filename);

    // Export CSV timeseries data
    bool exportEquityCurveCSV(const std::vector<Date>& dates, const std::vector<double>& equity,
                              const std::string& filename);

    // Export closed trades
    bool exportTradesCSV(const std::vector<OptionsPosition>& positions, const std::string& filename);

    // JSON export helpers
    std::string generateBacktestMetricsJSON(const BacktestMetrics& metrics);
    std::string generateMonteCarloJSON(const MonteCarloResult& result);
    std::string generateVaRJSON(const VaRResult& result);
    std::string generateAlertsJSON(const std::vector<RiskAlert>& alerts);
    std::string generateValidationJSON(const ExtendedValidationResult& result);

    // CSV export helpers
    std::string generateEquityCurveCSV(const std::vector<Date>& dates, const std::vector<double>& equity);
    std::string generateTradesCSV(const std::vector<OptionsPosition>& positions);

    // Write content to a path relative to the output directory
    bool writeToFile(const std::string& filename, const std::string& content);

private:
    std::string output_directory_;

    // Utility functions
    std::string escapeJSON(const std::string& str);
    std::string formatDouble(double value, int precision = 6);
    std::string vectorToJSONArray(const std::vector<std::string>& vec);
    std::string distributionJSON(const MetricDistribution& dist);

    // Path utilities
    std::string getFullPath(const std::string& filename);
    bool createDirectoryIfNotExists(const std::string& dir_path);
};

} // namespace optval
