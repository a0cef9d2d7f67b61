#pragma once

#include "price_history.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace optval {

// Source of daily OHLCV bars for a symbol
class PriceHistoryProvider {
public:
    virtual ~PriceHistoryProvider() = default;

    // Bars dated within [start, end], ascending. Throws DataFetchError when the
    // source cannot be read.
    virtual std::vector<PriceBar> fetch(const std::string& symbol, const Date& start,
                                        const Date& end) = 0;

    virtual std::string name() const = 0;
};

class DataLoader {
public:
    // Parse OHLCV CSV content with a header row (Date,Open,High,Low,Close[,Adj Close],Volume).
    // Column order is taken from the header; malformed rows are skipped.
    static std::vector<PriceBar> parseCSV(const std::string& content);

    // Read and parse a CSV file; throws DataFetchError if it cannot be opened
    static std::vector<PriceBar> loadCSV(const std::string& filepath);

    // Download a CSV file to disk
    static bool downloadData(const std::string& url, const std::string& filepath);

    // Drop invalid bars, sort by date and keep the last bar for duplicate dates
    static std::vector<PriceBar> cleanData(const std::vector<PriceBar>& raw_data);

    // Keep bars dated within [start, end]
    static std::vector<PriceBar> filterRange(const std::vector<PriceBar>& bars, const Date& start,
                                             const Date& end);

private:
    static std::string trim(const std::string& str);
    static std::string toLower(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static bool isValidBar(const PriceBar& bar);
    static double parseDouble(const std::string& str);
};

// Reads <directory>/<SYMBOL>.csv
class CsvPriceHistoryProvider : public PriceHistoryProvider {
public:
    explicit CsvPriceHistoryProvider(std::string directory);

    std::vector<PriceBar> fetch(const std::string& symbol, const Date& start,
                                const Date& end) override;
    std::string name() const override { return "csv:" + directory_; }

private:
    std::string directory_;
};

// Downloads CSV over HTTP. The URL template may contain {symbol}, {start} and {end}.
class HttpPriceHistoryProvider : public PriceHistoryProvider {
public:
    explicit HttpPriceHistoryProvider(std::string url_template);

    std::vector<PriceBar> fetch(const std::string& symbol, const Date& start,
                                const Date& end) override;
    std::string name() const override { return "http"; }

    std::string buildUrl(const std::string& symbol, const Date& start, const Date& end) const;

private:
    std::string url_template_;
};

struct SyntheticMarketParams {
    double start_price;
    double annual_return;
    double annual_vol;
    double base_volume;

    SyntheticMarketParams()
        : start_price(400.0), annual_return(0.08), annual_vol(0.20), base_volume(50000000.0) {}
};

// Geometric Brownian motion bars on weekdays, seeded per symbol
class SyntheticPriceHistoryProvider : public PriceHistoryProvider {
public:
    explicit SyntheticPriceHistoryProvider(uint64_t seed = 42,
                                           SyntheticMarketParams params = SyntheticMarketParams());

    std::vector<PriceBar> fetch(const std::string& symbol, const Date& start,
                                const Date& end) override;
    std::string name() const override { return "synthetic"; }

private:
    uint64_t seed_;
    SyntheticMarketParams params_;
};

} // namespace optval
