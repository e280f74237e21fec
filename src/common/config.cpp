#include "common/config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "common/errors.h"

namespace common {
namespace {

constexpr const char* kKnownKeys[] = {
    "BINANCE_API_KEY",     "BINANCE_SECRET_KEY", "BINANCE_BASE_URL",      "BINANCE_RECV_WINDOW",
    "BOT_LOG_FILE",        "BOT_LOG_LEVEL",      "BOT_GRID_POLL_SECONDS", "BOT_OCO_POLL_SECONDS",
};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char front = value.front();
        const char back = value.back();
        if ((front == '"' && back == '"') || (front == '\'' && back == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

long parsePositive(const std::string& key, const std::string& text) {
    long value = 0;
    std::size_t processed = 0;
    try {
        value = std::stol(text, &processed);
    } catch (const std::logic_error&) {
        processed = 0;
    }
    if (processed == 0 || processed != text.size() || value <= 0) {
        throw ValidationError(key + " must be a positive integer, got '" + text + "'");
    }
    return value;
}

}  // namespace

std::unordered_map<std::string, std::string> parseEnvFile(const std::string& content) {
    std::unordered_map<std::string, std::string> values;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto separator = line.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, separator));
        if (key.empty()) {
            continue;
        }
        values[key] = unquote(trim(line.substr(separator + 1)));
    }
    return values;
}

BotConfig configFromValues(const std::unordered_map<std::string, std::string>& values) {
    BotConfig config;
    const auto lookup = [&values](const char* key) -> const std::string* {
        const auto it = values.find(key);
        if (it == values.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    };

    if (const auto* value = lookup("BINANCE_API_KEY")) {
        config.apiKey = *value;
    }
    if (const auto* value = lookup("BINANCE_SECRET_KEY")) {
        config.apiSecret = *value;
    }
    if (const auto* value = lookup("BINANCE_BASE_URL")) {
        config.baseUrl = *value;
    }
    if (const auto* value = lookup("BINANCE_RECV_WINDOW")) {
        config.recvWindowMs = parsePositive("BINANCE_RECV_WINDOW", *value);
    }
    if (const auto* value = lookup("BOT_LOG_FILE")) {
        config.logFile = *value;
    }
    if (const auto* value = lookup("BOT_LOG_LEVEL")) {
        const auto level = parseLogLevel(*value);
        if (!level) {
            throw ValidationError("BOT_LOG_LEVEL must be one of TRACE, DEBUG, INFO, WARN, ERROR");
        }
        config.logLevel = *level;
    }
    if (const auto* value = lookup("BOT_GRID_POLL_SECONDS")) {
        config.gridPollInterval = std::chrono::seconds(parsePositive("BOT_GRID_POLL_SECONDS", *value));
    }
    if (const auto* value = lookup("BOT_OCO_POLL_SECONDS")) {
        config.ocoPollInterval = std::chrono::seconds(parsePositive("BOT_OCO_POLL_SECONDS", *value));
    }
    return config;
}

BotConfig loadConfig(const std::string& envFile) {
    std::unordered_map<std::string, std::string> values;
    if (!envFile.empty()) {
        std::ifstream stream(envFile);
        if (stream) {
            std::stringstream buffer;
            buffer << stream.rdbuf();
            values = parseEnvFile(buffer.str());
        }
    }

    for (const char* key : kKnownKeys) {
        if (const char* value = std::getenv(key)) {
            values[key] = value;
        }
    }

    return configFromValues(values);
}

}  // namespace common
