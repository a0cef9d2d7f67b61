#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace optval {

std::string levelToString(LogLevel level) {
    int value = static_cast<int>(level);
    if (value <= 10) return "DEBUG";
    if (value <= 20) return "INFO";
    if (value <= 30) return "WARNING";
    if (value <= 40) return "ERROR";
    return "CRITICAL";
}

LogLevel levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off" || lower == "disabled") return LogLevel::Disabled;
    return LogLevel::Info;
}

Logger::Logger() : level_(LogLevel::Info) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mutex_);
    return level_;
}

void Logger::setSink(LogSink sink) {
    std::scoped_lock lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::scoped_lock lock(mutex_);
    sink_ = nullptr;
}

void Logger::write(LogLevel level, const std::string& source, const std::string& message) {
    LogSink sink;
    {
        std::scoped_lock lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(level_)) {
            return;
        }
        sink = sink_;
    }

    LogRecord record;
    record.level = level;
    record.source = source.empty() ? "Main" : source;
    record.message = message;
    record.time = formatTime();

    // Called unlocked: a sink may log or replace the sink
    if (sink) {
        sink(record);
    } else {
        defaultSink(record);
    }
}

std::string Logger::formatTime() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&tt, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%m-%d %H:%M:%S");
    return oss.str();
}

void Logger::defaultSink(const LogRecord& record) {
    std::ostringstream line;
    line << "| " << levelToString(record.level) << " | " << record.source
         << " | " << record.message << '\n';
    std::cout << line.str() << std::flush;
}

} // namespace optval
