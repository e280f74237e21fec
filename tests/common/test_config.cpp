#include "common/config.h"
#include "common/errors.h"
#include "common/logging.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "support/test_helpers.h"

using test_support::Expect;

namespace {

bool TestParseEnvFile() {
    const auto values = common::parseEnvFile(
        "# credentials\n"
        "BINANCE_API_KEY=abc123\n"
        "export BINANCE_SECRET_KEY = \"s3cr3t\"\n"
        "\n"
        "BOT_LOG_FILE='run.log'\n"
        "not a pair\n");

    if (!Expect(values.size() == 3, "Expected three parsed entries")) {
        return false;
    }
    if (!Expect(values.at("BINANCE_API_KEY") == "abc123", "Plain value not parsed")) {
        return false;
    }
    if (!Expect(values.at("BINANCE_SECRET_KEY") == "s3cr3t", "Exported quoted value not unquoted")) {
        return false;
    }
    return Expect(values.at("BOT_LOG_FILE") == "run.log", "Single quoted value not unquoted");
}

bool TestDefaults() {
    const auto config = common::configFromValues({});
    if (!Expect(config.baseUrl == "https://testnet.binancefuture.com", "Unexpected default base URL")) {
        return false;
    }
    if (!Expect(config.recvWindowMs == 5000, "Unexpected default recvWindow")) {
        return false;
    }
    if (!Expect(config.logFile == "bot.log", "Unexpected default log file")) {
        return false;
    }
    if (!Expect(config.gridPollInterval == std::chrono::seconds(60), "Grid poll interval should default to 60s")) {
        return false;
    }
    return Expect(config.ocoPollInterval == std::chrono::seconds(30), "OCO poll interval should default to 30s");
}

bool TestOverrides() {
    const auto config = common::configFromValues({
        {"BINANCE_API_KEY", "key"},
        {"BINANCE_SECRET_KEY", "secret"},
        {"BINANCE_BASE_URL", "https://fapi.example.com"},
        {"BINANCE_RECV_WINDOW", "10000"},
        {"BOT_LOG_LEVEL", "debug"},
        {"BOT_GRID_POLL_SECONDS", "5"},
        {"BOT_OCO_POLL_SECONDS", "2"},
    });
    if (!Expect(config.apiKey == "key" && config.apiSecret == "secret", "Credentials not applied")) {
        return false;
    }
    if (!Expect(config.baseUrl == "https://fapi.example.com", "Base URL not applied")) {
        return false;
    }
    if (!Expect(config.recvWindowMs == 10000, "recvWindow not applied")) {
        return false;
    }
    if (!Expect(config.logLevel == common::LogLevel::Debug, "Log level not parsed case-insensitively")) {
        return false;
    }
    return Expect(config.gridPollInterval == std::chrono::seconds(5) &&
                      config.ocoPollInterval == std::chrono::seconds(2),
                  "Poll intervals not applied");
}

bool TestRejectsMalformedValues() {
    bool threw = false;
    try {
        common::configFromValues({{"BINANCE_RECV_WINDOW", "5s"}});
    } catch (const common::ValidationError&) {
        threw = true;
    }
    if (!Expect(threw, "Non numeric recvWindow was accepted")) {
        return false;
    }

    threw = false;
    try {
        common::configFromValues({{"BOT_GRID_POLL_SECONDS", "0"}});
    } catch (const common::ValidationError&) {
        threw = true;
    }
    if (!Expect(threw, "Zero poll interval was accepted")) {
        return false;
    }

    threw = false;
    try {
        common::configFromValues({{"BOT_LOG_LEVEL", "LOUD"}});
    } catch (const common::ValidationError&) {
        threw = true;
    }
    return Expect(threw, "Unknown log level was accepted");
}

bool TestLoadConfigReadsEnvFile() {
    const auto path = std::filesystem::temp_directory_path() / "stratbot_test_config.env";
    {
        std::ofstream out(path);
        out << "BOT_LOG_FILE=from_file.log\nBOT_OCO_POLL_SECONDS=7\n";
    }
    const auto config = common::loadConfig(path.string());
    std::filesystem::remove(path);

    if (std::getenv("BOT_LOG_FILE") == nullptr &&
        !Expect(config.logFile == "from_file.log", "Env file value not loaded")) {
        return false;
    }
    if (std::getenv("BOT_OCO_POLL_SECONDS") == nullptr &&
        !Expect(config.ocoPollInterval == std::chrono::seconds(7), "Env file poll interval not loaded")) {
        return false;
    }
    return true;
}

bool TestLoggerWritesFile() {
    const auto path = std::filesystem::temp_directory_path() / "stratbot_test_logger.log";
    std::filesystem::remove(path);

    auto& logger = common::Logger::instance();
    logger.setConsoleEnabled(false);
    logger.setMinimumLevel(common::LogLevel::Info);
    logger.attachFile(path.string());
    LOG_DEBUG("hidden debug line");
    LOG_INFO("order placed");
    LOG_WARN("status check failed");
    logger.detachFile();
    logger.setConsoleEnabled(true);

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();
    std::filesystem::remove(path);

    if (!Expect(content.find("[INFO] order placed") != std::string::npos, "INFO line missing from log file")) {
        return false;
    }
    if (!Expect(content.find("[WARN] status check failed") != std::string::npos, "WARN line missing from log file")) {
        return false;
    }
    if (!Expect(content.find("hidden debug line") == std::string::npos, "DEBUG line below threshold was written")) {
        return false;
    }
    return Expect(content.front() == '[', "Log line should start with a timestamp");
}

bool TestParseLogLevel() {
    if (!Expect(common::parseLogLevel("warning") == common::LogLevel::Warn, "WARNING alias not accepted")) {
        return false;
    }
    return Expect(!common::parseLogLevel("verbose").has_value(), "Unknown level should not parse");
}

}  // namespace

int main() {
    if (!TestParseEnvFile()) {
        return 1;
    }
    if (!TestDefaults()) {
        return 1;
    }
    if (!TestOverrides()) {
        return 1;
    }
    if (!TestRejectsMalformedValues()) {
        return 1;
    }
    if (!TestLoadConfigReadsEnvFile()) {
        return 1;
    }
    if (!TestLoggerWritesFile()) {
        return 1;
    }
    if (!TestParseLogLevel()) {
        return 1;
    }
    return 0;
}
