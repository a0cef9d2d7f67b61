#pragma once

#include "../utils/date_utils.hpp"
#include <string>
#include <vector>

namespace optval {

struct PriceBar {
    Date date;
    double open;
    double high;
    double low;
    double close;
    double volume;

    PriceBar() : open(0), high(0), low(0), close(0), volume(0) {}
};

// One trading day with derived volatility columns. Undefined values
// (e.g. inside the rolling warm-up window) are NaN.
struct HistoryRow {
    PriceBar bar;
    double daily_return;
    double hv_20;
    double hv_30;
    double hv_60;
    double iv_estimate;

    HistoryRow();
};

// Date-ordered daily series for one symbol
class PriceHistory {
public:
    PriceHistory() = default;
    PriceHistory(std::string symbol, std::vector<HistoryRow> rows);

    const std::string& symbol() const { return symbol_; }
    const std::vector<HistoryRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const HistoryRow& back() const { return rows_.back(); }
    const HistoryRow& operator[](size_t i) const { return rows_[i]; }

    // Rows dated on or before date
    PriceHistory upTo(const Date& date) const;

    // Latest row dated on or before date, nullptr if none
    const HistoryRow* lastOnOrBefore(const Date& date) const;

    std::vector<double> closes() const;
    std::vector<double> returns() const; // finite daily returns only

private:
    size_t countOnOrBefore(const Date& date) const;

    std::string symbol_;
    std::vector<HistoryRow> rows_;
};

} // namespace optval
