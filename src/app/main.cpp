#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "app/cli.h"
#include "common/config.h"
#include "common/errors.h"
#include "common/logging.h"
#include "exchange/binance_client.h"
#include "strategy/clock.h"

namespace {
std::atomic<bool> gStopRequested{false};

extern "C" void handleInterrupt(int) {
    gStopRequested.store(true);
}
}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        const auto command = app::parseCommand(args);
        if (command.kind == app::CommandKind::Help) {
            std::cout << app::usage();
            return 0;
        }

        const auto config = common::loadConfig();
        auto& logger = common::Logger::instance();
        logger.setMinimumLevel(config.logLevel);
        logger.attachFile(config.logFile);

        exchange::BinanceFuturesClient client(config.baseUrl, config.apiKey, config.apiSecret, config.recvWindowMs);
        try {
            client.ping();
        } catch (const exchange::ExchangeError& ex) {
            throw common::ConnectionError(std::string("Failed to connect to ") + config.baseUrl + ": " + ex.what());
        }
        LOG_INFO("Connected to " + config.baseUrl);

        std::signal(SIGINT, handleInterrupt);

        strategy::SteadyClock clock;
        app::CommandRunner runner(client, config, clock, std::cout, gStopRequested);
        return runner.run(command);
    } catch (const common::ValidationError& ex) {
        LOG_ERROR(std::string("Application error: ") + ex.what());
        std::cerr << "Run 'stratbot help' for usage.\n";
        return 1;
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Application error: ") + ex.what());
        return 1;
    }
}
