#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace optval {

// Calendar date with day precision
using Date = std::chrono::sys_days;

class DateUtils {
public:
    // Parse YYYY-MM-DD; throws ValidationError on malformed input
    static Date parseDate(const std::string& date_str);

    // Format as YYYY-MM-DD
    static std::string formatDate(const Date& date);

    // Calculate days between two dates (end - start)
    static int daysBetween(const Date& start, const Date& end);

    // Calculate years between two dates on a 365.25-day year
    static double yearsBetween(const Date& start, const Date& end);

    static Date addDays(const Date& date, int days);

    // Saturday or Sunday
    static bool isWeekend(const Date& date);

    // Current UTC date
    static Date today();

    // Check if date string is a valid YYYY-MM-DD calendar date
    static bool isValidDate(const std::string& date_str);

private:
    static std::vector<std::string> splitDate(const std::string& date_str, char delimiter = '-');
};

} // namespace optval
