#include "exporter.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

namespace optval {

Exporter::Exporter(const std::string& output_dir) : output_directory_(output_dir) {
    if (!output_directory_.empty()) {
        if (output_directory_.back() != '/') {
            output_directory_ += '/';
        }
        if (!createDirectoryIfNotExists(output_directory_)) {
            Logger::instance().warning("Exporter", "Cannot create output directory " + output_directory_);
        }
    }
}

bool Exporter::exportBacktestMetrics(const BacktestMetrics& metrics, const std::string& filename) {
    return writeToFile(filename, generateBacktestMetricsJSON(metrics));
}

bool Exporter::exportMonteCarlo(const MonteCarloResult& result, const std::string& filename) {
    return writeToFile(filename, generateMonteCarloJSON(result));
}

bool Exporter::exportVaR(const VaRResult& result, const std::string& filename) {
    return writeToFile(filename, generateVaRJSON(result));
}

bool Exporter::exportAlerts(const std::vector<RiskAlert>& alerts, const std::string& filename) {
    return writeToFile(filename, generateAlertsJSON(alerts));
}

bool Exporter::exportValidation(const ExtendedValidationResult& result, const std::string& filename) {
    return writeToFile(filename, generateValidationJSON(result));
}

bool Exporter::exportEquityCurveCSV(const std::vector<Date>& dates, const std::vector<double>& equity,
                                    const std::string& filename) {
    return writeToFile(filename, generateEquityCurveCSV(dates, equity));
}

bool Exporter::exportTradesCSV(const std::vector<OptionsPosition>& positions, const std::string& filename) {
    return writeToFile(filename, generateTradesCSV(positions));
}

std::string Exporter::generateBacktestMetricsJSON(const BacktestMetrics& m) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"start_date\": \"" << escapeJSON(m.start_date) << "\",\n";
    json << "  \"end_date\": \"" << escapeJSON(m.end_date) << "\",\n";
    json << "  \"trading_days\": " << m.trading_days << ",\n";
    json << "  \"returns\": {\n";
    json << "    \"total_return\": " << formatDouble(m.total_return) << ",\n";
    json << "    \"cagr\": " << formatDouble(m.cagr) << ",\n";
    json << "    \"avg_daily_return\": " << formatDouble(m.avg_daily_return, 8) << "\n";
    json << "  },\n";
    json << "  \"risk\": {\n";
    json << "    \"sharpe_ratio\": " << formatDouble(m.sharpe_ratio) << ",\n";
    json << "    \"sortino_ratio\": " << formatDouble(m.sortino_ratio) << ",\n";
    json << "    \"max_drawdown\": " << formatDouble(m.max_drawdown) << ",\n";
    json << "    \"avg_drawdown\": " << formatDouble(m.avg_drawdown) << ",\n";
    json << "    \"calmar_ratio\": " << formatDouble(m.calmar_ratio) << "\n";
    json << "  },\n";
    json << "  \"trades\": {\n";
    json << "    \"total_trades\": " << m.total_trades << ",\n";
    json << "    \"winning_trades\": " << m.winning_trades << ",\n";
    json << "    \"losing_trades\": " << m.losing_trades << ",\n";
    json << "    \"win_rate\": " << formatDouble(m.win_rate) << ",\n";
    json << "    \"profit_factor\": " << formatDouble(m.profit_factor) << ",\n";
    json << "    \"avg_win\": " << formatDouble(m.avg_win) << ",\n";
    json << "    \"avg_loss\": " << formatDouble(m.avg_loss) << ",\n";
    json << "    \"avg_trade\": " << formatDouble(m.avg_trade) << ",\n";
    json << "    \"largest_win\": " << formatDouble(m.largest_win) << ",\n";
    json << "    \"largest_loss\": " << formatDouble(m.largest_loss) << "\n";
    json << "  },\n";
    json << "  \"options\": {\n";
    json << "    \"avg_days_in_trade\": " << formatDouble(m.avg_days_in_trade) << ",\n";
    json << "    \"total_commissions\": " << formatDouble(m.total_commissions) << ",\n";
    json << "    \"commission_pct\": " << formatDouble(m.commission_pct) << ",\n";
    json << "    \"avg_delta_exposure\": " << formatDouble(m.avg_delta_exposure) << ",\n";
    json << "    \"avg_gamma_exposure\": " << formatDouble(m.avg_gamma_exposure) << ",\n";
    json << "    \"avg_theta_income\": " << formatDouble(m.avg_theta_income) << ",\n";
    json << "    \"avg_vega_exposure\": " << formatDouble(m.avg_vega_exposure) << "\n";
    json << "  },\n";
    json << "  \"strategy_performance\": {";

    size_t i = 0;
    for (const auto& [name, perf] : m.strategy_performance) {
        json << (i == 0 ? "\n" : ",\n");
        json << "    \"" << escapeJSON(name) << "\": {";
        json << "\"trades\": " << perf.trades << ", ";
        json << "\"pnl\": " << formatDouble(perf.pnl) << ", ";
        json << "\"win_rate\": " << formatDouble(perf.win_rate) << ", ";
        json << "\"avg_pnl\": " << formatDouble(perf.avg_pnl) << "}";
        ++i;
    }
    json << (m.strategy_performance.empty() ? "}\n" : "\n  }\n");
    json << "}\n";

    return json.str();
}

std::string Exporter::generateMonteCarloJSON(const MonteCarloResult& r) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"method\": \"" << toString(r.method) << "\",\n";
    json << "  \"num_simulations\": " << r.num_simulations << ",\n";
    json << "  \"num_observations\": " << r.num_observations << ",\n";
    json << "  \"sharpe\": " << distributionJSON(r.sharpe) << ",\n";
    json << "  \"total_return\": " << distributionJSON(r.total_return) << ",\n";
    json << "  \"max_drawdown\": " << distributionJSON(r.max_drawdown) << ",\n";
    json << "  \"prob_loss\": " << formatDouble(r.prob_loss) << ",\n";
    json << "  \"prob_ruin\": " << formatDouble(r.prob_ruin) << ",\n";
    json << "  \"var_95\": " << formatDouble(r.var_95) << ",\n";
    json << "  \"expected_shortfall_95\": " << formatDouble(r.expected_shortfall_95) << ",\n";
    json << "  \"path_dependency_score\": " << formatDouble(r.path_dependency_score) << "\n";
    json << "}\n";

    return json.str();
}

std::string Exporter::generateVaRJSON(const VaRResult& r) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"method\": \"" << toString(r.method) << "\",\n";
    json << "  \"horizon_days\": " << r.horizon_days << ",\n";
    json << "  \"portfolio_value\": " << formatDouble(r.portfolio_value, 2) << ",\n";
    json << "  \"var_95\": " << formatDouble(r.var_95, 2) << ",\n";
    json << "  \"var_99\": " << formatDouble(r.var_99, 2) << ",\n";
    json << "  \"cvar_95\": " << formatDouble(r.cvar_95, 2) << ",\n";
    json << "  \"cvar_99\": " << formatDouble(r.cvar_99, 2) << ",\n";
    if (!r.volatility_model.empty()) {
        json << "  \"volatility_model\": \"" << escapeJSON(r.volatility_model) << "\",\n";
    }
    json << "  \"confidence_levels\": {";

    size_t i = 0;
    for (const auto& [level, value] : r.confidence_levels) {
        json << (i > 0 ? ", " : "") << "\"" << formatDouble(level, 4) << "\": " << formatDouble(value, 2);
        ++i;
    }
    json << "}\n";
    json << "}\n";

    return json.str();
}

std::string Exporter::generateAlertsJSON(const std::vector<RiskAlert>& alerts) {
    std::ostringstream json;

    json << "[";
    for (size_t i = 0; i < alerts.size(); ++i) {
        const auto& a = alerts[i];
        json << (i == 0 ? "\n" : ",\n");
        json << "  {\n";
        json << "    \"level\": \"" << toString(a.level) << "\",\n";
        json << "    \"metric\": \"" << escapeJSON(a.metric) << "\",\n";
        json << "    \"message\": \"" << escapeJSON(a.message) << "\",\n";
        json << "    \"current_value\": " << formatDouble(a.current_value, 4) << ",\n";
        json << "    \"threshold\": " << formatDouble(a.threshold, 4) << ",\n";
        json << "    \"timestamp\": \"" << escapeJSON(a.timestamp) << "\",\n";
        json << "    \"action_required\": \"" << escapeJSON(a.action_required) << "\"\n";
        json << "  }";
    }
    json << (alerts.empty() ? "]\n" : "\n]\n");

    return json.str();
}

std::string Exporter::generateValidationJSON(const ExtendedValidationResult& r) {
    std::ostringstream json;

    json << "{\n";
    json << "  \"is_valid_for_live_trading\": " << (r.is_valid_for_live_trading ? "true" : "false") << ",\n";
    json << "  \"overall_score\": " << formatDouble(r.overall_score, 2) << ",\n";
    json << "  \"summary\": \"" << escapeJSON(r.validation_summary) << "\",\n";
    json << "  \"monte_carlo_valid\": " << (r.monte_carlo_valid ? "true" : "false") << ",\n";
    if (r.walk_forward) {
        json << "  \"walk_forward\": {";
        json << "\"folds\": " << r.walk_forward->folds.size() << ", ";
        json << "\"efficiency_ratio\": " << formatDouble(r.walk_forward->mean_efficiency_ratio) << ", ";
        json << "\"overfitting_score\": " << formatDouble(r.walk_forward->overfitting_score) << ", ";
        json << "\"degradation\": " << formatDouble(r.walk_forward->degradation) << ", ";
        json << "\"param_stability\": " << formatDouble(r.walk_forward->mean_param_stability) << ", ";
        json << "\"fold_consistency\": " << formatDouble(r.walk_forward->fold_consistency) << ", ";
        json << "\"valid\": " << (r.walk_forward_valid ? "true" : "false") << "},\n";
    }
    json << "  \"gross_return\": " << formatDouble(r.gross_return) << ",\n";
    json << "  \"net_return\": " << formatDouble(r.net_return) << ",\n";
    json << "  \"total_costs\": " << formatDouble(r.total_costs, 2) << ",\n";
    json << "  \"cost_drag_pct\": " << formatDouble(r.cost_drag_pct) << ",\n";
    json << "  \"cost_adjusted_sharpe\": " << formatDouble(r.cost_adjusted_sharpe) << ",\n";
    json << "  \"regime_adjusted_score\": " << formatDouble(r.regime_adjusted_score) << ",\n";
    if (r.regime) {
        json << "  \"regime\": \"" << toString(r.regime->market_regime) << "\",\n";
    }
    if (r.var) {
        json << "  \"var_95_pct\": " << formatDouble(r.var->var95LossPct()) << ",\n";
    }
    json << "  \"failures\": " << vectorToJSONArray(r.all_failures) << ",\n";
    json << "  \"recommendations\": " << vectorToJSONArray(r.recommendations) << "\n";
    json << "}\n";

    return json.str();
}

std::string Exporter::generateEquityCurveCSV(const std::vector<Date>& dates,
                                             const std::vector<double>& equity) {
    std::ostringstream csv;

    csv << "date,equity,drawdown\n";

    size_t n = std::min(dates.size(), equity.size());
    double peak = 0.0;
    for (size_t i = 0; i < n; ++i) {
        peak = std::max(peak, equity[i]);
        double drawdown = peak > 0 ? (equity[i] - peak) / peak : 0.0;

        csv << DateUtils::formatDate(dates[i]) << ",";
        csv << formatDouble(equity[i], 2) << ",";
        csv << formatDouble(drawdown) << "\n";
    }

    return csv.str();
}

std::string Exporter::generateTradesCSV(const std::vector<OptionsPosition>& positions) {
    std::ostringstream csv;

    csv << "symbol,strategy,entry_date,exit_date,days,legs,contracts,entry_price,exit_price,"
           "entry_cost,exit_value,commission,pnl\n";

    for (const auto& pos : positions) {
        csv << pos.symbol() << ",";
        csv << toString(pos.category()) << ",";
        csv << DateUtils::formatDate(pos.entryDate()) << ",";
        csv << (pos.exitDate() ? DateUtils::formatDate(*pos.exitDate()) : "") << ",";
        csv << pos.daysInTrade() << ",";
        csv << pos.legs().size() << ",";
        csv << pos.totalContracts() << ",";
        csv << formatDouble(pos.entryPrice(), 2) << ",";
        csv << (pos.exitPrice() ? formatDouble(*pos.exitPrice(), 2) : "") << ",";
        csv << formatDouble(pos.entryCost(), 2) << ",";
        csv << formatDouble(pos.exitValue(), 2) << ",";
        csv << formatDouble(pos.commission(), 2) << ",";
        csv << formatDouble(pos.pnl(), 2) << "\n";
    }

    return csv.str();
}

bool Exporter::writeToFile(const std::string& filename, const std::string& content) {
    std::string filepath = getFullPath(filename);
    std::ofstream file(filepath);

    if (!file.is_open()) {
        Logger::instance().error("Exporter", "Cannot create file " + filepath);
        return false;
    }

    file << content;
    file.close();

    Logger::instance().info("Exporter", "Exported: " + filepath);
    return true;
}

std::string Exporter::escapeJSON(const std::string& str) {
    std::string escaped;
    for (char c : str) {
        switch (c) {
            case '\"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string Exporter::formatDouble(double value, int precision) {
    // JSON has no NaN or infinity
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string Exporter::vectorToJSONArray(const std::vector<std::string>& vec) {
    std::ostringstream json;
    json << "[";

    for (size_t i = 0; i < vec.size(); ++i) {
        json << "\"" << escapeJSON(vec[i]) << "\"";
        if (i < vec.size() - 1) {
            json << ", ";
        }
    }

    json << "]";
    return json.str();
}

std::string Exporter::distributionJSON(const MetricDistribution& dist) {
    std::ostringstream json;
    json << "{\"original\": " << formatDouble(dist.original)
         << ", \"mean\": " << formatDouble(dist.mean)
         << ", \"std\": " << formatDouble(dist.std)
         << ", \"lower_95\": " << formatDouble(dist.lower_95)
         << ", \"upper_95\": " << formatDouble(dist.upper_95) << "}";
    return json.str();
}

std::string Exporter::getFullPath(const std::string& filename) {
    return output_directory_ + filename;
}

bool Exporter::createDirectoryIfNotExists(const std::string& dir_path) {
    struct stat info;

    if (stat(dir_path.c_str(), &info) != 0) {
        return mkdir(dir_path.c_str(), 0755) == 0;
    }
    return (info.st_mode & S_IFDIR) != 0;
}

} // namespace optval
