#include "strategy/oco_engine.h"

#include <sstream>

#include "common/errors.h"
#include "common/logging.h"

namespace strategy {
namespace {
bool closedWithoutFill(exchange::OrderStatus status) {
    return status == exchange::OrderStatus::Canceled || status == exchange::OrderStatus::Failed;
}
}  // namespace

OcoEngine::OcoEngine(StrategyServices services, OcoOptions options)
    : services_(services), options_(options) {}

OcoEngine::~OcoEngine() {
    for (const auto& id : tasks_.ids()) {
        services_.registry.remove(id);
    }
    tasks_.joinAll();
}

void OcoEngine::checkPriceOrdering(PositionSide side, double referencePrice, double takeProfit, double stopLoss) {
    std::ostringstream oss;
    if (side == PositionSide::Long) {
        if (!(takeProfit > referencePrice)) {
            oss << "Take profit " << takeProfit << " must be above current price " << referencePrice
                << " for a LONG position";
        } else if (!(stopLoss < referencePrice)) {
            oss << "Stop loss " << stopLoss << " must be below current price " << referencePrice
                << " for a LONG position";
        }
    } else {
        if (!(takeProfit < referencePrice)) {
            oss << "Take profit " << takeProfit << " must be below current price " << referencePrice
                << " for a SHORT position";
        } else if (!(stopLoss > referencePrice)) {
            oss << "Stop loss " << stopLoss << " must be above current price " << referencePrice
                << " for a SHORT position";
        }
    }
    const std::string message = oss.str();
    if (!message.empty()) {
        throw common::ValidationError(message);
    }
}

OcoPair OcoEngine::createOco(const OcoRequest& request) {
    const std::string symbol = normalizeSymbol(request.symbol);
    services_.validator.requireSymbol(symbol);
    services_.validator.validateQuantity(symbol, request.quantity);
    Validator::requirePositivePrice("Take profit price", request.takeProfitPrice);
    Validator::requirePositivePrice("Stop loss price", request.stopLossPrice);

    const double takeProfitPrice = services_.rules.quantizePrice(symbol, request.takeProfitPrice);
    const double stopLossPrice = services_.rules.quantizePrice(symbol, request.stopLossPrice);
    const double referencePrice = services_.client.getCurrentPrice(symbol);
    checkPriceOrdering(request.positionSide, referencePrice, takeProfitPrice, stopLossPrice);

    const auto closingSide =
        request.positionSide == PositionSide::Long ? exchange::OrderSide::Sell : exchange::OrderSide::Buy;

    OcoPair pair;
    pair.symbol = symbol;
    pair.quantity = request.quantity;
    pair.positionSide = request.positionSide;
    pair.referencePrice = referencePrice;

    auto& takeProfit = pair.takeProfit.intent;
    takeProfit.symbol = symbol;
    takeProfit.side = closingSide;
    takeProfit.kind = exchange::OrderKind::Limit;
    takeProfit.quantity = request.quantity;
    takeProfit.price = takeProfitPrice;
    takeProfit.timeInForce = exchange::TimeInForce::Gtc;
    takeProfit.reduceOnly = true;

    auto& stopLoss = pair.stopLoss.intent;
    stopLoss.symbol = symbol;
    stopLoss.side = closingSide;
    stopLoss.kind = exchange::OrderKind::StopMarket;
    stopLoss.quantity = request.quantity;
    stopLoss.stopPrice = stopLossPrice;
    stopLoss.reduceOnly = true;

    {
        std::ostringstream oss;
        oss << "Placing OCO for " << toString(request.positionSide) << " " << request.quantity << " " << symbol
            << ": take profit " << *takeProfit.price << ", stop loss " << *stopLoss.stopPrice << ", current price "
            << referencePrice;
        LOG_INFO(oss.str());
    }

    try {
        const auto ack = services_.client.submitOrder(takeProfit);
        pair.takeProfit.exchangeOrderId = ack.orderId;
        pair.takeProfit.status = ack.status;
        LOG_INFO("Take profit order placed: " + ack.orderId);
    } catch (const exchange::ExchangeError& ex) {
        LOG_ERROR(std::string("Take profit order rejected: ") + ex.what());
        throw OcoPlacementError(std::string("Take profit order rejected: ") + ex.what(), std::nullopt,
                                ex.httpStatus(), ex.apiCode());
    }

    try {
        const auto ack = services_.client.submitOrder(stopLoss);
        pair.stopLoss.exchangeOrderId = ack.orderId;
        pair.stopLoss.status = ack.status;
        LOG_INFO("Stop loss order placed: " + ack.orderId);
    } catch (const exchange::ExchangeError& ex) {
        const std::string message = "Stop loss order rejected; take profit order " +
                                    *pair.takeProfit.exchangeOrderId + " is still open: " + ex.what();
        LOG_ERROR(message);
        throw OcoPlacementError(message, pair.takeProfit.exchangeOrderId, ex.httpStatus(), ex.apiCode());
    }

    pair.createdAt = services_.clock.wallNow();
    pair.id = services_.registry.nextId("oco");

    auto token = services_.registry.add(pair.id, pair);
    LOG_INFO("OCO " + pair.id + " created");
    tasks_.launch(pair.id, [this, pair, token]() mutable { monitor(std::move(pair), std::move(token)); });
    return pair;
}

void OcoEngine::resolve(OcoPair& pair, OcoLeg filledLeg) {
    OrderRecord& filled = filledLeg == OcoLeg::TakeProfit ? pair.takeProfit : pair.stopLoss;
    OrderRecord& other = filledLeg == OcoLeg::TakeProfit ? pair.stopLoss : pair.takeProfit;
    const char* otherName = filledLeg == OcoLeg::TakeProfit ? "stop loss" : "take profit";

    filled.status = exchange::OrderStatus::Filled;
    LOG_INFO(std::string("OCO ") + pair.id + " " + toString(filledLeg) + " filled");

    try {
        services_.client.cancelOrder(pair.symbol, *other.exchangeOrderId);
        other.status = exchange::OrderStatus::Canceled;
        LOG_INFO("OCO " + pair.id + " canceled " + otherName + " order " + *other.exchangeOrderId);
    } catch (const exchange::ExchangeError& ex) {
        ++pair.cancelFailures;
        other.lastError = ex.what();
        LOG_WARN("OCO " + pair.id + " could not cancel " + otherName + " order " + *other.exchangeOrderId +
                 " (may already be closed): " + ex.what());
    }

    pair.filledLeg = filledLeg;
    pair.status = OcoStatus::Resolved;
}

void OcoEngine::monitor(OcoPair pair, std::shared_ptr<CancellationToken> token) {
    LOG_INFO("Monitoring OCO " + pair.id);
    try {
        while (pair.status == OcoStatus::Active) {
            if (!services_.clock.sleepFor(options_.pollInterval, *token)) {
                LOG_INFO("OCO " + pair.id + " monitoring stopped");
                break;
            }

            exchange::OrderStatus takeProfit;
            exchange::OrderStatus stopLoss;
            try {
                takeProfit = services_.client.getOrderStatus(pair.symbol, *pair.takeProfit.exchangeOrderId);
                stopLoss = services_.client.getOrderStatus(pair.symbol, *pair.stopLoss.exchangeOrderId);
            } catch (const exchange::ExchangeError& ex) {
                LOG_WARN("OCO " + pair.id + " status check failed: " + ex.what());
                continue;
            }

            if (takeProfit == exchange::OrderStatus::Filled) {
                resolve(pair, OcoLeg::TakeProfit);
            } else if (stopLoss == exchange::OrderStatus::Filled) {
                resolve(pair, OcoLeg::StopLoss);
            } else if (closedWithoutFill(takeProfit) && closedWithoutFill(stopLoss)) {
                pair.takeProfit.status = takeProfit;
                pair.stopLoss.status = stopLoss;
                pair.status = OcoStatus::Resolved;
                LOG_INFO("OCO " + pair.id + " both legs closed without a fill");
            } else if (takeProfit != pair.takeProfit.status || stopLoss != pair.stopLoss.status) {
                pair.takeProfit.status = takeProfit;
                pair.stopLoss.status = stopLoss;
                services_.registry.publish(pair.id, pair);
            }
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("OCO " + pair.id + " monitor failed: " + ex.what());
    }
    services_.registry.retire(pair.id, pair);
}

OcoPair OcoEngine::waitForResolution(const StrategyId& id) {
    tasks_.join(id);
    auto pair = services_.registry.get<OcoPair>(id);
    if (!pair) {
        throw common::ValidationError("Unknown OCO: " + id);
    }
    return *pair;
}

bool OcoEngine::cancelOco(const StrategyId& id) {
    if (!services_.registry.remove(id)) {
        return false;
    }
    LOG_INFO("OCO " + id + " monitoring canceled; orders remain on the exchange");
    tasks_.join(id);
    return true;
}

std::shared_ptr<const OcoPair> OcoEngine::snapshot(const StrategyId& id) const {
    return services_.registry.get<OcoPair>(id);
}

}  // namespace strategy
