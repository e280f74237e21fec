#include "app/cli.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>
#include <unordered_map>

#include "common/errors.h"
#include "strategy/grid_engine.h"
#include "strategy/oco_engine.h"
#include "strategy/services.h"
#include "strategy/twap_engine.h"

namespace app {
namespace {
constexpr const char* kSeparator = "==================================================";

struct Arguments {
    std::vector<std::string> positional;
    std::unordered_map<std::string, std::string> options;
    std::set<std::string> flags;
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Arguments splitArguments(const std::vector<std::string>& args,
                         const std::set<std::string>& valueOptions,
                         const std::set<std::string>& flagOptions) {
    Arguments parsed;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token.rfind("--", 0) != 0) {
            parsed.positional.push_back(token);
            continue;
        }
        if (flagOptions.count(token) != 0) {
            parsed.flags.insert(token);
        } else if (valueOptions.count(token) != 0) {
            if (i + 1 >= args.size()) {
                throw common::ValidationError("Option " + token + " requires a value");
            }
            parsed.options[token] = args[++i];
        } else {
            throw common::ValidationError("Unknown option " + token + " for command " + args[0]);
        }
    }
    return parsed;
}

void requirePositional(const Arguments& parsed, std::size_t count, const std::string& form) {
    if (parsed.positional.size() != count) {
        throw common::ValidationError("Usage: stratbot " + form);
    }
}

std::optional<double> parseDouble(const std::string& token) {
    try {
        size_t processed = 0;
        const double value = std::stod(token, &processed);
        if (processed != token.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double requireNumber(const std::string& token, const std::string& name) {
    const auto value = parseDouble(token);
    if (!value) {
        throw common::ValidationError(name + " must be a number, got '" + token + "'");
    }
    return *value;
}

std::optional<int> parseInteger(const std::string& token) {
    try {
        size_t processed = 0;
        const int value = std::stoi(token, &processed);
        if (processed != token.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int requireInteger(const std::string& token, const std::string& name) {
    const auto value = parseInteger(token);
    if (!value) {
        throw common::ValidationError(name + " must be an integer, got '" + token + "'");
    }
    return *value;
}

exchange::OrderSide requireSide(const std::string& token) {
    const auto side = exchange::parseOrderSide(token);
    if (!side) {
        throw common::ValidationError("Invalid side: " + token + ". Must be BUY or SELL");
    }
    return *side;
}

std::string formatPrice(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}
}  // namespace

std::string usage() {
    std::ostringstream oss;
    oss << "Usage: stratbot <command> [arguments]\n\n"
        << "Commands:\n"
        << "  price SYMBOL                                   Current price and minimum order size\n"
        << "  status [--positions] [--orders] [--symbol S]   Account balance, positions, open orders\n"
        << "  market SYMBOL SIDE QTY                         Market order\n"
        << "  limit SYMBOL SIDE QTY PRICE [--tif GTC|IOC|FOK]\n"
        << "  limit SYMBOL --show-open                       List open orders\n"
        << "  stop-limit SYMBOL SIDE QTY STOP LIMIT [--reduce-only]\n"
        << "  oco SYMBOL QTY TAKE_PROFIT STOP_LOSS [--position LONG|SHORT]\n"
        << "  twap SYMBOL SIDE QTY MINUTES [--price-limit P] [--no-randomize]\n"
        << "  grid SYMBOL LOW HIGH LEVELS QTY\n"
        << "  cancel SYMBOL ORDER_ID\n"
        << "  help\n\n"
        << "Examples:\n"
        << "  stratbot market BTCUSDT BUY 0.001\n"
        << "  stratbot oco BTCUSDT 0.001 50000 40000 --position LONG\n"
        << "  stratbot twap BTCUSDT BUY 0.01 30\n"
        << "  stratbot grid BTCUSDT 40000 50000 10 0.001\n";
    return oss.str();
}

Command parseCommand(const std::vector<std::string>& args) {
    Command command;
    if (args.empty()) {
        return command;
    }

    const std::string name = toLower(args[0]);
    if (name == "help" || name == "--help" || name == "-h") {
        command.kind = CommandKind::Help;
        return command;
    }

    if (name == "price") {
        const auto parsed = splitArguments(args, {}, {});
        requirePositional(parsed, 1, "price SYMBOL");
        command.kind = CommandKind::Price;
        command.symbol = parsed.positional[0];
        return command;
    }

    if (name == "status") {
        const auto parsed = splitArguments(args, {"--symbol"}, {"--positions", "--orders"});
        requirePositional(parsed, 0, "status [--positions] [--orders] [--symbol S]");
        command.kind = CommandKind::Status;
        command.showPositions = parsed.flags.count("--positions") != 0;
        command.showOrders = parsed.flags.count("--orders") != 0;
        const auto symbol = parsed.options.find("--symbol");
        if (symbol != parsed.options.end()) {
            command.statusSymbol = symbol->second;
        }
        return command;
    }

    if (name == "market") {
        const auto parsed = splitArguments(args, {}, {});
        requirePositional(parsed, 3, "market SYMBOL SIDE QTY");
        command.kind = CommandKind::Market;
        command.symbol = parsed.positional[0];
        command.side = requireSide(parsed.positional[1]);
        command.quantity = requireNumber(parsed.positional[2], "Quantity");
        return command;
    }

    if (name == "limit") {
        const auto parsed = splitArguments(args, {"--tif"}, {"--show-open"});
        if (parsed.flags.count("--show-open") != 0) {
            requirePositional(parsed, 1, "limit SYMBOL --show-open");
            command.kind = CommandKind::OpenOrders;
            command.symbol = parsed.positional[0];
            return command;
        }
        requirePositional(parsed, 4, "limit SYMBOL SIDE QTY PRICE [--tif GTC|IOC|FOK]");
        command.kind = CommandKind::Limit;
        command.symbol = parsed.positional[0];
        command.side = requireSide(parsed.positional[1]);
        command.quantity = requireNumber(parsed.positional[2], "Quantity");
        command.price = requireNumber(parsed.positional[3], "Price");
        const auto tif = parsed.options.find("--tif");
        if (tif != parsed.options.end()) {
            const auto value = exchange::parseTimeInForce(tif->second);
            if (!value) {
                throw common::ValidationError("Invalid time in force: " + tif->second + ". Must be GTC, IOC or FOK");
            }
            command.timeInForce = *value;
        }
        return command;
    }

    if (name == "stop-limit") {
        const auto parsed = splitArguments(args, {}, {"--reduce-only"});
        requirePositional(parsed, 5, "stop-limit SYMBOL SIDE QTY STOP LIMIT [--reduce-only]");
        command.kind = CommandKind::StopLimit;
        command.symbol = parsed.positional[0];
        command.side = requireSide(parsed.positional[1]);
        command.quantity = requireNumber(parsed.positional[2], "Quantity");
        command.stopPrice = requireNumber(parsed.positional[3], "Stop price");
        command.price = requireNumber(parsed.positional[4], "Limit price");
        command.reduceOnly = parsed.flags.count("--reduce-only") != 0;
        return command;
    }

    if (name == "oco") {
        const auto parsed = splitArguments(args, {"--position"}, {});
        requirePositional(parsed, 4, "oco SYMBOL QTY TAKE_PROFIT STOP_LOSS [--position LONG|SHORT]");
        command.kind = CommandKind::Oco;
        command.symbol = parsed.positional[0];
        command.quantity = requireNumber(parsed.positional[1], "Quantity");
        command.takeProfitPrice = requireNumber(parsed.positional[2], "Take profit price");
        command.stopLossPrice = requireNumber(parsed.positional[3], "Stop loss price");
        const auto position = parsed.options.find("--position");
        if (position != parsed.options.end()) {
            const auto side = strategy::parsePositionSide(position->second);
            if (!side) {
                throw common::ValidationError("Invalid position side: " + position->second + ". Must be LONG or SHORT");
            }
            command.positionSide = *side;
        }
        return command;
    }

    if (name == "twap") {
        const auto parsed = splitArguments(args, {"--price-limit"}, {"--no-randomize"});
        requirePositional(parsed, 4, "twap SYMBOL SIDE QTY MINUTES [--price-limit P] [--no-randomize]");
        command.kind = CommandKind::Twap;
        command.symbol = parsed.positional[0];
        command.side = requireSide(parsed.positional[1]);
        command.quantity = requireNumber(parsed.positional[2], "Quantity");
        command.durationMinutes = requireInteger(parsed.positional[3], "Duration");
        const auto limit = parsed.options.find("--price-limit");
        if (limit != parsed.options.end()) {
            command.priceLimit = requireNumber(limit->second, "Price limit");
        }
        command.randomizeTiming = parsed.flags.count("--no-randomize") == 0;
        return command;
    }

    if (name == "grid") {
        const auto parsed = splitArguments(args, {}, {});
        requirePositional(parsed, 5, "grid SYMBOL LOW HIGH LEVELS QTY");
        command.kind = CommandKind::Grid;
        command.symbol = parsed.positional[0];
        command.lowPrice = requireNumber(parsed.positional[1], "Low price");
        command.highPrice = requireNumber(parsed.positional[2], "High price");
        command.levels = requireInteger(parsed.positional[3], "Levels");
        command.quantity = requireNumber(parsed.positional[4], "Quantity");
        return command;
    }

    if (name == "cancel") {
        const auto parsed = splitArguments(args, {}, {});
        requirePositional(parsed, 2, "cancel SYMBOL ORDER_ID");
        command.kind = CommandKind::Cancel;
        command.symbol = parsed.positional[0];
        command.orderId = parsed.positional[1];
        return command;
    }

    throw common::ValidationError("Unknown command: " + args[0]);
}

CommandRunner::CommandRunner(exchange::ExchangeClient& client,
                             const common::BotConfig& config,
                             strategy::Clock& clock,
                             std::ostream& out,
                             const std::atomic<bool>& stopRequested,
                             std::chrono::milliseconds foregroundPoll)
    : client_(client),
      config_(config),
      clock_(clock),
      out_(out),
      stopRequested_(stopRequested),
      foregroundPoll_(foregroundPoll),
      rules_(client),
      validator_(client, rules_),
      orders_(client, validator_, rules_) {}

int CommandRunner::run(const Command& command) {
    switch (command.kind) {
        case CommandKind::Help:
            out_ << usage();
            return 0;
        case CommandKind::Price:
            return runPrice(command);
        case CommandKind::Status:
            return runStatus(command);
        case CommandKind::Market:
            return printReceipt("MARKET ORDER", orders_.placeMarket(command.symbol, command.side, command.quantity));
        case CommandKind::Limit:
            return printReceipt("LIMIT ORDER", orders_.placeLimit(command.symbol, command.side, command.quantity,
                                                                  command.price, command.timeInForce));
        case CommandKind::OpenOrders:
            return runOpenOrders(command);
        case CommandKind::StopLimit:
            return printReceipt("STOP-LIMIT ORDER",
                                orders_.placeStopLimit(command.symbol, command.side, command.quantity,
                                                       command.stopPrice, command.price, command.reduceOnly));
        case CommandKind::Oco:
            return runOco(command);
        case CommandKind::Twap:
            return runTwap(command);
        case CommandKind::Grid:
            return runGrid(command);
        case CommandKind::Cancel:
            return runCancel(command);
    }
    return 1;
}

int CommandRunner::printReceipt(const std::string& title, const trading::OrderReceipt& receipt) {
    out_ << "\n" << (receipt.success ? "✅ " : "❌ ") << title << (receipt.success ? " PLACED" : " FAILED") << "\n";
    out_ << kSeparator << "\n";
    for (const auto& warning : receipt.warnings) {
        out_ << "⚠️  WARNING: " << warning << "\n";
    }
    out_ << receipt.message << "\n";
    if (!receipt.orderId.empty()) {
        out_ << "Order ID:         " << receipt.orderId << "\n";
        out_ << "Status:           " << exchange::toString(receipt.status) << "\n";
    }
    if (receipt.referencePrice) {
        out_ << "Current Price:    " << formatPrice(*receipt.referencePrice) << " USDT\n";
    }
    if (receipt.filledQuantity > 0.0) {
        out_ << "Filled:           " << receipt.filledQuantity;
        if (receipt.averagePrice > 0.0) {
            out_ << " @ " << formatPrice(receipt.averagePrice);
        }
        out_ << "\n";
    }
    out_ << kSeparator << "\n";
    return receipt.success ? 0 : 1;
}

int CommandRunner::runPrice(const Command& command) {
    const auto quote = orders_.currentPrice(command.symbol);
    out_ << quote.symbol << " current price: " << formatPrice(quote.price) << " USDT\n";
    out_ << "Minimum quantity for " << trading::OrderService::kMinNotional
         << " USDT notional: " << quote.minimumQuantity << "\n";
    return 0;
}

int CommandRunner::runStatus(const Command& command) {
    const auto report = orders_.status(trading::StatusQuery{command.statusSymbol, command.showPositions,
                                                            command.showOrders});
    out_ << report.summary << "\n";
    if (!report.positions.empty()) {
        out_ << "\nPositions:\n";
        for (const auto& line : report.positions) {
            out_ << "  " << line << "\n";
        }
    }
    if (!report.orders.empty()) {
        out_ << "\nOpen orders:\n";
        for (const auto& line : report.orders) {
            out_ << "  " << line << "\n";
        }
    }
    return 0;
}

int CommandRunner::runOpenOrders(const Command& command) {
    const auto orders = orders_.openOrders(command.symbol);
    const std::string symbol = strategy::normalizeSymbol(command.symbol);
    if (orders.empty()) {
        out_ << "No open orders for " << symbol << "\n";
        return 0;
    }
    out_ << "Open orders for " << symbol << ":\n";
    for (const auto& order : orders) {
        out_ << "  ID: " << order.orderId << ", Side: " << order.side << ", Price: " << formatPrice(order.price)
             << ", Qty: " << order.origQty << "\n";
    }
    return 0;
}

int CommandRunner::runCancel(const Command& command) {
    const auto receipt = orders_.cancel(command.symbol, command.orderId);
    out_ << (receipt.success ? "✅ " : "❌ ") << receipt.message << "\n";
    return receipt.success ? 0 : 1;
}

bool CommandRunner::waitWhileActive(const strategy::StrategyId& id) {
    while (registry_.isActive(id)) {
        if (stopRequested_.load()) {
            return false;
        }
        std::this_thread::sleep_for(foregroundPoll_);
    }
    return true;
}

int CommandRunner::runTwap(const Command& command) {
    strategy::TwapEngine engine(strategy::StrategyServices{client_, rules_, validator_, registry_, clock_});
    strategy::TwapRequest request;
    request.symbol = command.symbol;
    request.side = command.side;
    request.totalQuantity = command.quantity;
    request.durationMinutes = command.durationMinutes;
    request.priceLimit = command.priceLimit;
    request.randomizeTiming = command.randomizeTiming;

    const auto created = engine.createTwap(request);
    out_ << "\nTWAP " << created.id << " started: " << exchange::toString(created.side) << " "
         << created.totalQuantity << " " << created.symbol << " in " << created.chunkCount << " chunks over "
         << created.durationMinutes << " minutes\n";
    for (const auto& chunk : created.chunks) {
        out_ << "  chunk " << chunk.chunkIndex << ": " << chunk.quantity;
        if (chunk.belowMinNotional) {
            out_ << " (below minimum notional)";
        }
        out_ << "\n";
    }

    if (!waitWhileActive(created.id)) {
        out_ << "Interrupted, canceling remaining chunks\n";
        engine.cancelTwap(created.id);
    }
    const auto plan = engine.waitForCompletion(created.id);

    out_ << "\nTWAP " << plan.id << " " << strategy::toString(plan.status) << "\n" << kSeparator << "\n";
    out_ << "Executed quantity: " << plan.executedQuantity << " / " << plan.totalQuantity << "\n";
    for (const auto& chunk : plan.chunks) {
        out_ << "  chunk " << chunk.chunkIndex << ": " << chunk.quantity << " " << strategy::toString(chunk.status);
        if (chunk.executionPrice) {
            out_ << " @ " << formatPrice(*chunk.executionPrice);
        }
        if (chunk.order.lastError) {
            out_ << " (" << *chunk.order.lastError << ")";
        }
        out_ << "\n";
    }
    if (plan.averageExecutionPrice) {
        out_ << "Average price: " << formatPrice(*plan.averageExecutionPrice) << "\n";
    }
    out_ << kSeparator << "\n";
    return plan.status == strategy::TwapStatus::Completed || plan.status == strategy::TwapStatus::Canceled ? 0 : 1;
}

int CommandRunner::runGrid(const Command& command) {
    strategy::GridEngine engine(strategy::StrategyServices{client_, rules_, validator_, registry_, clock_},
                                strategy::GridOptions{config_.gridPollInterval});
    const auto result = engine.createGrid(
        strategy::GridRequest{command.symbol, command.lowPrice, command.highPrice, command.levels, command.quantity});
    const auto& grid = result.strategy;

    out_ << "\nGRID " << grid.id << " " << grid.symbol << "\n" << kSeparator << "\n";
    out_ << "Range: " << formatPrice(grid.lowPrice) << " - " << formatPrice(grid.highPrice) << ", spacing "
         << formatPrice(grid.spacing) << ", current price " << formatPrice(grid.referencePrice) << "\n";
    for (const auto& level : grid.levels) {
        out_ << "  level " << level.levelIndex << ": " << std::setw(7) << std::left << strategy::toString(level.role)
             << std::right << " " << formatPrice(level.price);
        if (level.role != strategy::GridLevelRole::Reference) {
            out_ << " " << exchange::toString(level.order.status);
        }
        out_ << "\n";
    }
    out_ << "Placed " << result.placement.buyPlaced << " buy and " << result.placement.sellPlaced
         << " sell orders\n";
    for (const auto& failure : result.placement.failures) {
        out_ << "  failed " << failure << "\n";
    }
    out_ << kSeparator << "\n";

    if (result.placement.placed() == 0) {
        out_ << "❌ No grid orders were placed\n";
        return 1;
    }
    if (!result.monitoring) {
        return 0;
    }

    out_ << "Monitoring grid (Ctrl+C to stop and cancel resting orders)\n";
    if (!waitWhileActive(grid.id)) {
        const auto report = engine.stopGrid(grid.id, true);
        out_ << "Grid stopped: " << report.canceled << " orders canceled, " << report.cancelFailures
             << " cancel failures\n";
    }
    if (const auto finished = engine.snapshot(grid.id)) {
        out_ << "Grid " << grid.id << " " << strategy::toString(finished->status) << " with "
             << finished->executedTrades.size() << " filled levels\n";
    }
    return 0;
}

int CommandRunner::runOco(const Command& command) {
    strategy::OcoEngine engine(strategy::StrategyServices{client_, rules_, validator_, registry_, clock_},
                               strategy::OcoOptions{config_.ocoPollInterval});
    strategy::OcoPair pair;
    try {
        pair = engine.createOco(strategy::OcoRequest{command.symbol, command.quantity, command.takeProfitPrice,
                                                     command.stopLossPrice, command.positionSide});
    } catch (const strategy::OcoPlacementError& ex) {
        out_ << "❌ OCO ORDER FAILED: " << ex.what() << "\n";
        if (ex.placedTakeProfitId()) {
            out_ << "Take profit order " << *ex.placedTakeProfitId() << " is still open; cancel it with: stratbot cancel "
                 << strategy::normalizeSymbol(command.symbol) << " " << *ex.placedTakeProfitId() << "\n";
        }
        return 1;
    }

    out_ << "\n✅ OCO " << pair.id << " PLACED\n" << kSeparator << "\n";
    out_ << "Position:         " << strategy::toString(pair.positionSide) << " " << pair.quantity << " "
         << pair.symbol << "\n";
    out_ << "Current Price:    " << formatPrice(pair.referencePrice) << " USDT\n";
    out_ << "Take Profit:      " << formatPrice(*pair.takeProfit.intent.price) << " (order "
         << *pair.takeProfit.exchangeOrderId << ")\n";
    out_ << "Stop Loss:        " << formatPrice(*pair.stopLoss.intent.stopPrice) << " (order "
         << *pair.stopLoss.exchangeOrderId << ")\n";
    out_ << kSeparator << "\n";
    out_ << "Monitoring OCO (Ctrl+C to stop monitoring; orders stay open)\n";

    if (!waitWhileActive(pair.id)) {
        engine.cancelOco(pair.id);
        out_ << "OCO monitoring stopped; both orders remain on the exchange\n";
        return 0;
    }

    const auto resolved = engine.waitForResolution(pair.id);
    out_ << "OCO " << resolved.id << " " << strategy::toString(resolved.status);
    if (resolved.filledLeg) {
        out_ << ": " << strategy::toString(*resolved.filledLeg) << " filled";
    } else {
        out_ << ": both orders closed without a fill";
    }
    out_ << "\n";
    return 0;
}

}  // namespace app
