#include "date_utils.hpp"
#include "../core/errors.hpp"
#include <iomanip>
#include <sstream>

namespace optval {

Date DateUtils::parseDate(const std::string& date_str) {
    auto parts = splitDate(date_str);
    if (parts.size() != 3) {
        throw ValidationError("Invalid date: '" + date_str + "' (expected YYYY-MM-DD)");
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    try {
        year = std::stoi(parts[0]);
        month = static_cast<unsigned>(std::stoi(parts[1]));
        day = static_cast<unsigned>(std::stoi(parts[2]));
    } catch (const std::exception&) {
        throw ValidationError("Invalid date: '" + date_str + "' (expected YYYY-MM-DD)");
    }

    std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok()) {
        throw ValidationError("Invalid calendar date: '" + date_str + "'");
    }
    return Date{ymd};
}

std::string DateUtils::formatDate(const Date& date) {
    std::chrono::year_month_day ymd{date};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-"
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

int DateUtils::daysBetween(const Date& start, const Date& end) {
    return static_cast<int>((end - start).count());
}

double DateUtils::yearsBetween(const Date& start, const Date& end) {
    return static_cast<double>(daysBetween(start, end)) / 365.25;
}

Date DateUtils::addDays(const Date& date, int days) {
    return date + std::chrono::days{days};
}

bool DateUtils::isWeekend(const Date& date) {
    std::chrono::weekday wd{date};
    return wd == std::chrono::Saturday || wd == std::chrono::Sunday;
}

Date DateUtils::today() {
    return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

bool DateUtils::isValidDate(const std::string& date_str) {
    try {
        Date date = parseDate(date_str);
        int year = static_cast<int>(std::chrono::year_month_day{date}.year());
        return year >= 1900 && year <= 2100;
    } catch (const ValidationError&) {
        return false;
    }
}

std::vector<std::string> DateUtils::splitDate(const std::string& date_str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(date_str);
    std::string part;

    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }

    return parts;
}

} // namespace optval
