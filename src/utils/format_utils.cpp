#include "format_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace optval {

std::string FormatUtils::fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string FormatUtils::percent(double value, int precision) {
    return fixed(value, precision) + "%";
}

std::string FormatUtils::money(double value, int precision) {
    std::string digits = fixed(std::abs(value), precision);

    size_t point = digits.find('.');
    std::string whole = point == std::string::npos ? digits : digits.substr(0, point);
    std::string fraction = point == std::string::npos ? "" : digits.substr(point);

    std::string grouped_whole;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped_whole.insert(grouped_whole.begin(), ',');
        grouped_whole.insert(grouped_whole.begin(), *it);
        ++count;
    }

    return (value < 0 ? "-$" : "$") + grouped_whole + fraction;
}

std::string FormatUtils::grouped(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) result.insert(result.begin(), ',');
        result.insert(result.begin(), *it);
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

std::string FormatUtils::signedFixed(double value, int precision) {
    return (value >= 0 ? "+" : "") + fixed(value, precision);
}

} // namespace optval
