#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/config.h"
#include "exchange/exchange_client.h"
#include "strategy/clock.h"
#include "strategy/quantization.h"
#include "strategy/registry.h"
#include "strategy/types.h"
#include "strategy/validation.h"
#include "trading/order_service.h"

namespace app {

enum class CommandKind {
    Help,
    Price,
    Status,
    Market,
    Limit,
    OpenOrders,
    StopLimit,
    Oco,
    Twap,
    Grid,
    Cancel,
};

struct Command {
    CommandKind kind{CommandKind::Help};
    std::string symbol;
    exchange::OrderSide side{exchange::OrderSide::Buy};
    double quantity{0.0};
    double price{0.0};
    double stopPrice{0.0};
    double takeProfitPrice{0.0};
    double stopLossPrice{0.0};
    double lowPrice{0.0};
    double highPrice{0.0};
    int levels{0};
    int durationMinutes{0};
    std::optional<double> priceLimit;
    exchange::TimeInForce timeInForce{exchange::TimeInForce::Gtc};
    bool reduceOnly{false};
    bool randomizeTiming{true};
    strategy::PositionSide positionSide{strategy::PositionSide::Long};
    std::optional<std::string> statusSymbol;
    bool showPositions{false};
    bool showOrders{false};
    std::string orderId;
};

// Parses the arguments that follow the program name. Throws
// common::ValidationError on malformed input.
Command parseCommand(const std::vector<std::string>& args);

std::string usage();

// Executes parsed commands against an exchange client. Strategy commands stay
// in the foreground until the strategy finishes or |stopRequested| turns true.
class CommandRunner {
public:
    CommandRunner(exchange::ExchangeClient& client,
                  const common::BotConfig& config,
                  strategy::Clock& clock,
                  std::ostream& out,
                  const std::atomic<bool>& stopRequested,
                  std::chrono::milliseconds foregroundPoll = std::chrono::milliseconds(200));

    // Returns the process exit code.
    int run(const Command& command);

private:
    int runPrice(const Command& command);
    int runStatus(const Command& command);
    int runOpenOrders(const Command& command);
    int runCancel(const Command& command);
    int runTwap(const Command& command);
    int runGrid(const Command& command);
    int runOco(const Command& command);

    int printReceipt(const std::string& title, const trading::OrderReceipt& receipt);
    // Returns false when interrupted by a stop request.
    bool waitWhileActive(const strategy::StrategyId& id);

    exchange::ExchangeClient& client_;
    const common::BotConfig& config_;
    strategy::Clock& clock_;
    std::ostream& out_;
    const std::atomic<bool>& stopRequested_;
    std::chrono::milliseconds foregroundPoll_;

    strategy::SymbolRules rules_;
    strategy::Validator validator_;
    strategy::StrategyRegistry registry_;
    trading::OrderService orders_;
};

}  // namespace app
