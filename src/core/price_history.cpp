#include "price_history.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace optval {

HistoryRow::HistoryRow()
    : daily_return(std::numeric_limits<double>::quiet_NaN()),
      hv_20(std::numeric_limits<double>::quiet_NaN()),
      hv_30(std::numeric_limits<double>::quiet_NaN()),
      hv_60(std::numeric_limits<double>::quiet_NaN()),
      iv_estimate(std::numeric_limits<double>::quiet_NaN()) {}

PriceHistory::PriceHistory(std::string symbol, std::vector<HistoryRow> rows)
    : symbol_(std::move(symbol)), rows_(std::move(rows)) {}

PriceHistory PriceHistory::upTo(const Date& date) const {
    size_t count = countOnOrBefore(date);
    return PriceHistory(symbol_, std::vector<HistoryRow>(rows_.begin(), rows_.begin() + count));
}

const HistoryRow* PriceHistory::lastOnOrBefore(const Date& date) const {
    size_t count = countOnOrBefore(date);
    if (count == 0) return nullptr;
    return &rows_[count - 1];
}

std::vector<double> PriceHistory::closes() const {
    std::vector<double> result;
    result.reserve(rows_.size());
    for (const auto& row : rows_) {
        result.push_back(row.bar.close);
    }
    return result;
}

std::vector<double> PriceHistory::returns() const {
    std::vector<double> result;
    result.reserve(rows_.size());
    for (const auto& row : rows_) {
        if (std::isfinite(row.daily_return)) {
            result.push_back(row.daily_return);
        }
    }
    return result;
}

size_t PriceHistory::countOnOrBefore(const Date& date) const {
    auto it = std::upper_bound(rows_.begin(), rows_.end(), date,
                               [](const Date& d, const HistoryRow& row) { return d < row.bar.date; });
    return static_cast<size_t>(it - rows_.begin());
}

} // namespace optval
