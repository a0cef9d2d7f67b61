#pragma once

#include <string>

namespace optval {

class FormatUtils {
public:
    // Fixed-point with the given number of decimals
    static std::string fixed(double value, int precision = 2);

    // Fixed-point followed by '%'; value is already in percent
    static std::string percent(double value, int precision = 1);

    // "$1,234.56" / "-$1,234.56"
    static std::string money(double value, int precision = 2);

    // Integer with thousands separators
    static std::string grouped(long long value);

    // Leading '+' for non-negative values
    static std::string signedFixed(double value, int precision = 2);
};

} // namespace optval
