#include "core/backtest_engine.hpp"
#include "core/data_loader.hpp"
#include "core/errors.hpp"
#include "core/exporter.hpp"
#include "core/extended_validator.hpp"
#include "core/monte_carlo.hpp"
#include "core/report_generator.hpp"
#include "core/risk_monitor.hpp"
#include "core/strategies.hpp"
#include "core/var_calculator.hpp"
#include "core/walk_forward.hpp"
#include "utils/date_utils.hpp"
#include "utils/logger.hpp"
#include "utils/statistics.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace optval;

namespace {

struct CliOptions {
    std::string command;
    std::string target;
    std::vector<std::string> symbols;
    std::string start;
    std::string end;
    double capital;
    std::string data_dir;
    bool synthetic;
    std::string url_template;
    int trials;
    uint64_t seed;
    std::string method;
    int horizon;
    int frequency;
    std::string output;
    std::string log_level;
    std::string walk_forward; // window method; empty disables walk-forward

    CliOptions() : symbols({"SPY"}), capital(100000.0), data_dir("data"), synthetic(false),
                   trials(1000), seed(42), horizon(1), frequency(7), log_level("info") {}
};

void printUsage() {
    std::cout << "Options Validator - Options Strategy Validation Engine\n";
    std::cout << "Usage: options_validator <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  backtest <strategy>     Run strategy backtest\n";
    std::cout << "  montecarlo <strategy>   Backtest, then Monte Carlo and stress scenarios\n";
    std::cout << "  var <strategy>          Backtest, then VaR/CVaR and risk limit checks\n";
    std::cout << "  validate <strategy>     Full extended validation\n";
    std::cout << "  download <symbol>       Download daily bars to the data directory\n\n";
    std::cout << "Options:\n";
    std::cout << "  --symbols A,B           Underlyings to trade (default SPY)\n";
    std::cout << "  --start YYYY-MM-DD      Backtest start (default one year ago)\n";
    std::cout << "  --end YYYY-MM-DD        Backtest end (default today)\n";
    std::cout << "  --capital N             Initial capital (default 100000)\n";
    std::cout << "  --data-dir DIR          Directory of <SYMBOL>.csv files (default data)\n";
    std::cout << "  --synthetic             Use seeded synthetic prices\n";
    std::cout << "  --url-template URL      Fetch CSV over HTTP ({symbol}, {start}, {end})\n";
    std::cout << "  --trials N              Monte Carlo simulations (default 1000)\n";
    std::cout << "  --seed N                Random seed (default 42)\n";
    std::cout << "  --method NAME           shuffle|bootstrap|parametric or historical|parametric|monte_carlo\n";
    std::cout << "  --horizon N             VaR horizon in days (default 1)\n";
    std::cout << "  --frequency N           Days between trade entries (default 7)\n";
    std::cout << "  --walk-forward METHOD   validate: expanding|rolling parameter walk-forward\n";
    std::cout << "  --output FILE           Write JSON results to FILE\n";
    std::cout << "  --log-level LEVEL       debug|info|warning|error|disabled\n\n";
    std::cout << "Strategies:\n";
    for (const auto& name : Strategies::names()) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "\nExamples:\n";
    std::cout << "  options_validator backtest covered_call --synthetic\n";
    std::cout << "  options_validator validate iron_condor --symbols SPY,QQQ --data-dir data\n";
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t begin = 0;
    while (begin <= value.size()) {
        size_t comma = value.find(',', begin);
        if (comma == std::string::npos) comma = value.size();
        if (comma > begin) items.push_back(value.substr(begin, comma - begin));
        begin = comma + 1;
    }
    return items;
}

CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = argv[1];

    int i = 2;
    if (i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        options.target = argv[i++];
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--synthetic") {
            options.synthetic = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw ValidationError("Missing value for " + arg);
        }
        std::string value = argv[++i];

        try {
            if (arg == "--symbols") {
                options.symbols = splitList(value);
            } else if (arg == "--start") {
                options.start = value;
            } else if (arg == "--end") {
                options.end = value;
            } else if (arg == "--capital") {
                options.capital = std::stod(value);
            } else if (arg == "--data-dir") {
                options.data_dir = value;
            } else if (arg == "--url-template") {
                options.url_template = value;
            } else if (arg == "--trials") {
                options.trials = std::stoi(value);
            } else if (arg == "--seed") {
                options.seed = std::stoull(value);
            } else if (arg == "--method") {
                options.method = value;
            } else if (arg == "--horizon") {
                options.horizon = std::stoi(value);
            } else if (arg == "--frequency") {
                options.frequency = std::stoi(value);
            } else if (arg == "--walk-forward") {
                options.walk_forward = value;
            } else if (arg == "--output") {
                options.output = value;
            } else if (arg == "--log-level") {
                options.log_level = value;
            } else {
                throw ValidationError("Unknown option: " + arg);
            }
        } catch (const std::logic_error&) {
            // std::invalid_argument / std::out_of_range from the numeric parsers
            throw ValidationError("Invalid value for " + arg + ": " + value);
        }
    }

    if (options.symbols.empty()) {
        throw ValidationError("--symbols needs at least one symbol");
    }
    return options;
}

std::shared_ptr<PriceHistoryProvider> makeProvider(const CliOptions& options) {
    if (options.synthetic) {
        return std::make_shared<SyntheticPriceHistoryProvider>(options.seed);
    }
    if (!options.url_template.empty()) {
        return std::make_shared<HttpPriceHistoryProvider>(options.url_template);
    }
    return std::make_shared<CsvPriceHistoryProvider>(options.data_dir);
}

BacktestConfig makeBacktestConfig(const CliOptions& options) {
    BacktestConfig config;
    config.end_date = options.end.empty() ? DateUtils::today() : DateUtils::parseDate(options.end);
    config.start_date = options.start.empty() ? DateUtils::addDays(config.end_date, -365)
                                              : DateUtils::parseDate(options.start);
    config.initial_capital = options.capital;
    return config;
}

MonteCarloConfig makeMonteCarloConfig(const CliOptions& options) {
    MonteCarloConfig config;
    config.num_simulations = options.trials;
    config.seed = options.seed;
    return config;
}

void writeOutput(const CliOptions& options, const std::string& content) {
    if (options.output.empty()) return;

    Exporter exporter;
    if (exporter.writeToFile(options.output, content)) {
        std::cout << "✓ Results written to " << options.output << "\n";
    } else {
        std::cout << "✗ Failed to write " << options.output << "\n";
    }
}

bool runBacktestCommand(const CliOptions& options) {
    std::cout << "Running " << options.target << " backtest...\n";

    BacktestEngine engine(makeBacktestConfig(options), makeProvider(options));
    auto metrics = engine.runBacktest(Strategies::fromName(options.target), options.symbols,
                                      options.frequency);

    std::cout << ReportGenerator::backtestReport(metrics);

    Exporter exporter;
    writeOutput(options, exporter.generateBacktestMetricsJSON(metrics));
    return metrics.total_trades > 0;
}

bool runMonteCarloCommand(const CliOptions& options) {
    std::cout << "Running " << options.target << " backtest for Monte Carlo...\n";

    BacktestEngine engine(makeBacktestConfig(options), makeProvider(options));
    engine.runBacktest(Strategies::fromName(options.target), options.symbols, options.frequency);

    SimulationMethod method = options.method.empty() ? SimulationMethod::Shuffle
                                                     : simulationMethodFromString(options.method);

    MonteCarloSimulator simulator(makeMonteCarloConfig(options));
    auto result = simulator.simulateFromEquityCurve(engine.equityCurve(), method);
    std::cout << ReportGenerator::monteCarloReport(result);

    auto returns = Statistics::returnsFromEquity(engine.equityCurve());
    std::cout << ReportGenerator::stressReport(simulator.stressTestScenarios(returns,
                                               MonteCarloSimulator::defaultScenarios(), method));

    Exporter exporter;
    writeOutput(options, exporter.generateMonteCarloJSON(result));
    return true;
}

bool runVaRCommand(const CliOptions& options) {
    std::cout << "Running " << options.target << " backtest for VaR...\n";

    BacktestEngine engine(makeBacktestConfig(options), makeProvider(options));
    engine.runBacktest(Strategies::fromName(options.target), options.symbols, options.frequency);

    VaRConfig config;
    config.method = options.method.empty() ? VaRMethod::Historical : varMethodFromString(options.method);
    config.horizon_days = options.horizon;
    config.seed = options.seed;

    const auto& curve = engine.equityCurve();
    auto returns = Statistics::returnsFromEquity(curve);

    VaRCalculator calculator(config);
    auto result = calculator.calculateVaR(returns, curve.back(), {0.90, 0.95, 0.975, 0.99});
    std::cout << ReportGenerator::varReport(result);

    // Replay the equity curve through the session risk limits
    RiskMonitor monitor;
    std::vector<double> seen;
    for (size_t i = 0; i < curve.size(); ++i) {
        monitor.startNewDay(i > 0 ? curve[i - 1] : curve[i]);
        if (i > 0 && curve[i - 1] != 0) seen.push_back(curve[i] / curve[i - 1] - 1.0);
        monitor.checkRisk(curve[i], seen);
        if (monitor.isHalted()) break;
    }

    std::cout << "Risk monitor: " << monitor.tradingStatus() << " ("
              << monitor.alerts().size() << " alerts)\n";

    Exporter exporter;
    writeOutput(options, exporter.generateVaRJSON(result));
    if (!monitor.alerts().empty() && !options.output.empty()) {
        exporter.writeToFile(options.output + ".alerts.json", exporter.generateAlertsJSON(monitor.alerts()));
    }
    return true;
}

bool runValidateCommand(const CliOptions& options) {
    std::cout << "Validating " << options.target << "...\n";

    ExtendedValidator validator(makeBacktestConfig(options), makeProvider(options),
                                ValidationCriteria(), makeMonteCarloConfig(options));

    if (!options.walk_forward.empty()) {
        WalkForwardConfig wf_config;
        wf_config.method = windowMethodFromString(options.walk_forward);
        wf_config.trade_frequency_days = options.frequency;

        std::string name = options.target;
        StrategyFactory factory = [name](const ParameterSet& params) {
            StrategyParams strategy_params;
            strategy_params.otm_pct = params.at("otm_pct");
            strategy_params.days_to_expiry = static_cast<int>(params.at("days_to_expiry"));
            return Strategies::fromName(name, strategy_params);
        };
        ParameterGrid grid{{"otm_pct", {0.03, 0.05, 0.07}}, {"days_to_expiry", {30, 45}}};
        validator.setWalkForward(factory, grid, wf_config);
    }

    auto result = validator.validate(Strategies::fromName(options.target), options.symbols,
                                     options.frequency);

    std::cout << ReportGenerator::validationReport(result);

    Exporter exporter;
    writeOutput(options, exporter.generateValidationJSON(result));
    return result.is_valid_for_live_trading;
}

bool runDownloadCommand(const CliOptions& options) {
    if (options.url_template.empty()) {
        throw ValidationError("download needs --url-template");
    }

    std::cout << "Downloading daily bars for " << options.target << "...\n";

    BacktestConfig config = makeBacktestConfig(options);
    HttpPriceHistoryProvider provider(options.url_template);
    std::string url = provider.buildUrl(options.target, config.start_date, config.end_date);
    std::string filepath = options.data_dir + "/" + options.target + ".csv";

    if (DataLoader::downloadData(url, filepath)) {
        std::cout << "✓ Downloaded " << options.target << " to " << filepath << "\n";
        return true;
    }
    std::cout << "✗ Failed to download " << options.target << "\n";
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        printUsage();
        return 0;
    }

    try {
        CliOptions options = parseArguments(argc, argv);
        Logger::instance().setLevel(levelFromString(options.log_level));

        if (options.target.empty()) {
            std::cout << "Error: " << command << " requires an argument\n\n";
            printUsage();
            return 1;
        }

        bool success = false;
        if (command == "backtest") {
            success = runBacktestCommand(options);
        } else if (command == "montecarlo") {
            success = runMonteCarloCommand(options);
        } else if (command == "var") {
            success = runVaRCommand(options);
        } else if (command == "validate") {
            success = runValidateCommand(options);
        } else if (command == "download") {
            success = runDownloadCommand(options);
        } else {
            std::cout << "Error: Unknown command '" << command << "'\n\n";
            printUsage();
            return 1;
        }

        return success ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
