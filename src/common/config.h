#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

#include "common/logging.h"

namespace common {

struct BotConfig {
    std::string apiKey;
    std::string apiSecret;
    std::string baseUrl{"https://testnet.binancefuture.com"};
    long recvWindowMs{5000};
    std::string logFile{"bot.log"};
    LogLevel logLevel{LogLevel::Info};
    std::chrono::seconds gridPollInterval{60};
    std::chrono::seconds ocoPollInterval{30};
};

// Parses dotenv-style content: KEY=VALUE per line, '#' comments, optional
// "export " prefix and surrounding quotes.
std::unordered_map<std::string, std::string> parseEnvFile(const std::string& content);

// Builds a configuration from |values| (typically the env file merged with the
// process environment). Throws ValidationError on malformed numeric values.
BotConfig configFromValues(const std::unordered_map<std::string, std::string>& values);

// Reads |envFile| when it exists, then lets process environment variables
// override it.
BotConfig loadConfig(const std::string& envFile = ".env");

}  // namespace common
