#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace common {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
};

std::optional<LogLevel> parseLogLevel(const std::string& text);

// Process-wide logger. Console output goes to stdout/stderr; when a log file is
// attached every accepted line is also appended to it and flushed immediately.
class Logger {
public:
    static Logger& instance();

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

    void setConsoleEnabled(bool enabled);

    // Opens |path| in append mode. Throws std::runtime_error when the file
    // cannot be opened.
    void attachFile(const std::string& path);
    void detachFile();

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;

    static const char* levelTag(LogLevel level);
    static std::string timestamp();

    mutable std::mutex mutex_;
    LogLevel minimumLevel_{LogLevel::Info};
    bool consoleEnabled_{true};
    std::ofstream file_;
};

}  // namespace common

#define LOG_TRACE(message) ::common::Logger::instance().log(::common::LogLevel::Trace, (message))
#define LOG_DEBUG(message) ::common::Logger::instance().log(::common::LogLevel::Debug, (message))
#define LOG_INFO(message) ::common::Logger::instance().log(::common::LogLevel::Info, (message))
#define LOG_WARN(message) ::common::Logger::instance().log(::common::LogLevel::Warn, (message))
#define LOG_ERROR(message) ::common::Logger::instance().log(::common::LogLevel::Error, (message))
