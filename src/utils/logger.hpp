#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace optval {

// Numeric levels follow the Python logging convention
enum class LogLevel : int {
    Debug = 10,
    Info = 20,
    Warning = 30,
    Error = 40,
    Critical = 50,
    Disabled = 99 // no message has a level >= this
};

struct LogRecord {
    LogLevel level;
    std::string source;
    std::string message;
    std::string time;

    LogRecord() : level(LogLevel::Info) {}
};

using LogSink = std::function<void(const LogRecord&)>;

std::string levelToString(LogLevel level);

// Parse "debug", "info", ... (case-insensitive). Unknown names map to Info.
LogLevel levelFromString(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    // Replace the output sink; the default prints "| LEVEL | source | message" to stdout.
    // The sink is called without the logger's lock held and may log again.
    void setSink(LogSink sink);
    void resetSink();

    void write(LogLevel level, const std::string& source, const std::string& message);

    void debug(const std::string& source, const std::string& message) { write(LogLevel::Debug, source, message); }
    void info(const std::string& source, const std::string& message) { write(LogLevel::Info, source, message); }
    void warning(const std::string& source, const std::string& message) { write(LogLevel::Warning, source, message); }
    void error(const std::string& source, const std::string& message) { write(LogLevel::Error, source, message); }

private:
    Logger();

    static std::string formatTime();
    static void defaultSink(const LogRecord& record);

    mutable std::mutex mutex_;
    LogLevel level_;
    LogSink sink_;
};

} // namespace optval
