#include "common/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace common {

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") {
        return LogLevel::Trace;
    }
    if (upper == "DEBUG") {
        return LogLevel::Debug;
    }
    if (upper == "INFO") {
        return LogLevel::Info;
    }
    if (upper == "WARN" || upper == "WARNING") {
        return LogLevel::Warn;
    }
    if (upper == "ERROR") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minimumLevel_ = level;
}

LogLevel Logger::minimumLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minimumLevel_;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleEnabled_ = enabled;
}

void Logger::attachFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        throw std::runtime_error("Unable to open log file: " + path);
    }
}

void Logger::detachFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minimumLevel_) {
        return;
    }

    std::ostringstream line;
    line << '[' << timestamp() << "] [" << levelTag(level) << "] " << message << '\n';
    const std::string text = line.str();

    if (consoleEnabled_) {
        std::ostream& stream = level >= LogLevel::Warn ? std::cerr : std::cout;
        stream << text;
    }
    if (file_.is_open()) {
        file_ << text;
        file_.flush();
    }
}

const char* Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm;
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

}  // namespace common
