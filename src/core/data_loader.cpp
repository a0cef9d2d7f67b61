#include "data_loader.hpp"
#include "errors.hpp"
#include "../utils/http_client.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <random>
#include <sstream>

namespace optval {

namespace {

// FNV-1a, stable across platforms so synthetic series are reproducible
uint64_t hashSymbol(const std::string& symbol) {
    uint64_t hash = 1469598103934665603ULL;
    for (char c : symbol) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::vector<PriceBar> DataLoader::parseCSV(const std::string& content) {
    std::vector<PriceBar> bars;
    std::istringstream stream(content);
    std::string line;

    if (!std::getline(stream, line)) {
        return bars;
    }

    // Map header names to column indices
    std::map<std::string, size_t> columns;
    auto header = split(line, ',');
    for (size_t i = 0; i < header.size(); ++i) {
        columns[toLower(trim(header[i]))] = i;
    }

    auto column = [&columns](const std::string& name) -> long {
        auto it = columns.find(name);
        return it == columns.end() ? -1 : static_cast<long>(it->second);
    };

    long date_col = column("date");
    long open_col = column("open");
    long high_col = column("high");
    long low_col = column("low");
    long close_col = column("close");
    long volume_col = column("volume");

    if (date_col < 0 || close_col < 0) {
        throw DataFetchError("CSV header must contain Date and Close columns");
    }

    size_t line_number = 1;
    while (std::getline(stream, line)) {
        ++line_number;
        if (trim(line).empty()) continue;

        auto fields = split(line, ',');
        auto field = [&fields](long index) -> std::string {
            if (index < 0 || static_cast<size_t>(index) >= fields.size()) return "";
            return fields[static_cast<size_t>(index)];
        };

        std::string date_str = trim(field(date_col)).substr(0, 10);
        if (!DateUtils::isValidDate(date_str)) {
            Logger::instance().debug("DataLoader", "Skipping line " + std::to_string(line_number) +
                                                   ": bad date '" + date_str + "'");
            continue;
        }

        PriceBar bar;
        bar.date = DateUtils::parseDate(date_str);
        bar.close = parseDouble(field(close_col));
        bar.open = open_col >= 0 ? parseDouble(field(open_col)) : bar.close;
        bar.high = high_col >= 0 ? parseDouble(field(high_col)) : bar.close;
        bar.low = low_col >= 0 ? parseDouble(field(low_col)) : bar.close;
        bar.volume = volume_col >= 0 ? parseDouble(field(volume_col)) : 0.0;

        bars.push_back(bar);
    }

    return cleanData(bars);
}

std::vector<PriceBar> DataLoader::loadCSV(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataFetchError("Cannot open file " + filepath);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parseCSV(content.str());
}

bool DataLoader::downloadData(const std::string& url, const std::string& filepath) {
    HttpClient client;
    return client.downloadFile(url, filepath);
}

std::vector<PriceBar> DataLoader::cleanData(const std::vector<PriceBar>& raw_data) {
    std::vector<PriceBar> clean_data;

    for (const auto& bar : raw_data) {
        if (isValidBar(bar)) {
            clean_data.push_back(bar);
        }
    }

    std::stable_sort(clean_data.begin(), clean_data.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });

    std::vector<PriceBar> unique;
    unique.reserve(clean_data.size());
    for (const auto& bar : clean_data) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    return unique;
}

std::vector<PriceBar> DataLoader::filterRange(const std::vector<PriceBar>& bars, const Date& start,
                                              const Date& end) {
    std::vector<PriceBar> result;
    for (const auto& bar : bars) {
        if (bar.date >= start && bar.date <= end) {
            result.push_back(bar);
        }
    }
    return result;
}

std::string DataLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r\n\"");
    return str.substr(start, end - start + 1);
}

std::string DataLoader::toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> DataLoader::split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

bool DataLoader::isValidBar(const PriceBar& bar) {
    return std::isfinite(bar.close) && bar.close > 0 &&
           std::isfinite(bar.open) && std::isfinite(bar.high) && std::isfinite(bar.low) &&
           bar.volume >= 0;
}

double DataLoader::parseDouble(const std::string& str) {
    std::string value = trim(str);
    if (value.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return std::numeric_limits<double>::quiet_NaN();
    }
}

CsvPriceHistoryProvider::CsvPriceHistoryProvider(std::string directory)
    : directory_(std::move(directory)) {
    if (!directory_.empty() && directory_.back() != '/') {
        directory_ += "/";
    }
}

std::vector<PriceBar> CsvPriceHistoryProvider::fetch(const std::string& symbol, const Date& start,
                                                     const Date& end) {
    return DataLoader::filterRange(DataLoader::loadCSV(directory_ + symbol + ".csv"), start, end);
}

HttpPriceHistoryProvider::HttpPriceHistoryProvider(std::string url_template)
    : url_template_(std::move(url_template)) {}

std::string HttpPriceHistoryProvider::buildUrl(const std::string& symbol, const Date& start,
                                               const Date& end) const {
    std::string url = url_template_;
    replaceAll(url, "{symbol}", symbol);
    replaceAll(url, "{start}", DateUtils::formatDate(start));
    replaceAll(url, "{end}", DateUtils::formatDate(end));
    return url;
}

std::vector<PriceBar> HttpPriceHistoryProvider::fetch(const std::string& symbol, const Date& start,
                                                      const Date& end) {
    HttpClient client;
    std::string content = client.fetch(buildUrl(symbol, start, end));
    return DataLoader::filterRange(DataLoader::parseCSV(content), start, end);
}

SyntheticPriceHistoryProvider::SyntheticPriceHistoryProvider(uint64_t seed,
                                                             SyntheticMarketParams params)
    : seed_(seed), params_(params) {}

std::vector<PriceBar> SyntheticPriceHistoryProvider::fetch(const std::string& symbol,
                                                           const Date& start, const Date& end) {
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed_ ^ hashSymbol(symbol)));
    std::normal_distribution<double> norm(0.0, 1.0);

    double daily_mu = params_.annual_return / 252.0;
    double daily_sigma = params_.annual_vol / std::sqrt(252.0);

    std::vector<PriceBar> bars;
    double price = params_.start_price;

    for (Date day = start; day <= end; day = DateUtils::addDays(day, 1)) {
        if (DateUtils::isWeekend(day)) continue;

        double z = norm(rng);
        double ret = (daily_mu - 0.5 * daily_sigma * daily_sigma) + daily_sigma * z;

        PriceBar bar;
        bar.date = day;
        bar.open = price;
        bar.close = price * std::exp(ret);
        double range = std::abs(norm(rng)) * daily_sigma * 0.5;
        bar.high = std::max(bar.open, bar.close) * (1.0 + range);
        bar.low = std::min(bar.open, bar.close) * (1.0 - range);
        bar.volume = std::max(0.0, params_.base_volume * (1.0 + 0.2 * norm(rng)));

        bars.push_back(bar);
        price = bar.close;
    }

    return bars;
}

} // namespace optval
