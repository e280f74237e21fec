#include "trading/order_service.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "common/errors.h"
#include "common/logging.h"

namespace trading {

OrderService::OrderService(exchange::ExchangeClient& client,
                           const strategy::Validator& validator,
                           const strategy::SymbolRules& rules)
    : client_(client), validator_(validator), rules_(rules) {}

std::string OrderService::prepare(const std::string& symbol, double quantity) {
    const std::string normalized = strategy::normalizeSymbol(symbol);
    validator_.requireSymbol(normalized);
    validator_.validateQuantity(normalized, quantity);
    return normalized;
}

OrderReceipt OrderService::submit(const exchange::OrderIntent& intent, const std::string& label, OrderReceipt receipt) {
    receipt.quantity = intent.quantity;
    try {
        const auto ack = client_.submitOrder(intent);
        receipt.success = true;
        receipt.orderId = ack.orderId;
        receipt.status = ack.status;
        receipt.filledQuantity = ack.executedQty;
        receipt.averagePrice = ack.averagePrice;

        std::ostringstream oss;
        oss << label << " order placed: " << exchange::toString(intent.side) << " " << intent.quantity << " "
            << intent.symbol << " (order " << ack.orderId << ", status " << exchange::toString(ack.status) << ")";
        receipt.message = oss.str();
        LOG_INFO(receipt.message);
    } catch (const exchange::ExchangeError& ex) {
        receipt.success = false;
        receipt.status = exchange::OrderStatus::Failed;
        receipt.message = label + " order failed: " + ex.what();
        LOG_ERROR(receipt.message);
    }
    return receipt;
}

OrderReceipt OrderService::placeMarket(const std::string& symbol, exchange::OrderSide side, double quantity) {
    const std::string normalized = prepare(symbol, quantity);

    OrderReceipt receipt;
    receipt.referencePrice = client_.getCurrentPrice(normalized);
    {
        std::ostringstream oss;
        oss << "Placing market order: " << exchange::toString(side) << " " << quantity << " " << normalized
            << " at market price ~" << *receipt.referencePrice;
        LOG_INFO(oss.str());
    }

    exchange::OrderIntent intent;
    intent.symbol = normalized;
    intent.side = side;
    intent.kind = exchange::OrderKind::Market;
    intent.quantity = quantity;
    return submit(intent, "Market", std::move(receipt));
}

OrderReceipt OrderService::placeLimit(const std::string& symbol,
                                      exchange::OrderSide side,
                                      double quantity,
                                      double price,
                                      exchange::TimeInForce timeInForce) {
    const std::string normalized = prepare(symbol, quantity);
    strategy::Validator::requirePositivePrice("Limit price", price);

    OrderReceipt receipt;
    const double current = client_.getCurrentPrice(normalized);
    receipt.referencePrice = current;
    const double distance = (price - current) / current;
    if (std::fabs(distance) > kLimitDistanceWarning) {
        std::ostringstream oss;
        oss << "Limit price " << price << " is " << std::fixed << std::setprecision(2) << distance * 100.0
            << "% from current market price " << current;
        receipt.warnings.push_back(oss.str());
        LOG_WARN(oss.str());
    }

    exchange::OrderIntent intent;
    intent.symbol = normalized;
    intent.side = side;
    intent.kind = exchange::OrderKind::Limit;
    intent.quantity = quantity;
    intent.price = rules_.quantizePrice(normalized, price);
    intent.timeInForce = timeInForce;

    {
        std::ostringstream oss;
        oss << "Placing limit order: " << exchange::toString(side) << " " << quantity << " " << normalized << " at "
            << *intent.price << " (" << exchange::toString(timeInForce) << ")";
        LOG_INFO(oss.str());
    }
    return submit(intent, "Limit", std::move(receipt));
}

OrderReceipt OrderService::placeStopLimit(const std::string& symbol,
                                          exchange::OrderSide side,
                                          double quantity,
                                          double stopPrice,
                                          double limitPrice,
                                          bool reduceOnly) {
    const std::string normalized = prepare(symbol, quantity);
    strategy::Validator::requirePositivePrice("Stop price", stopPrice);
    strategy::Validator::requirePositivePrice("Limit price", limitPrice);

    OrderReceipt receipt;
    const double current = client_.getCurrentPrice(normalized);
    receipt.referencePrice = current;
    const bool misplaced = side == exchange::OrderSide::Buy ? stopPrice <= current : stopPrice >= current;
    if (misplaced) {
        std::ostringstream oss;
        oss << exchange::toString(side) << " stop price " << stopPrice << " should be "
            << (side == exchange::OrderSide::Buy ? "above" : "below") << " current price " << current;
        receipt.warnings.push_back(oss.str());
        LOG_WARN(oss.str());
    }

    exchange::OrderIntent intent;
    intent.symbol = normalized;
    intent.side = side;
    intent.kind = exchange::OrderKind::StopLimit;
    intent.quantity = quantity;
    intent.price = rules_.quantizePrice(normalized, limitPrice);
    intent.stopPrice = rules_.quantizePrice(normalized, stopPrice);
    intent.timeInForce = exchange::TimeInForce::Gtc;
    intent.reduceOnly = reduceOnly;

    {
        std::ostringstream oss;
        oss << "Placing stop-limit order: " << exchange::toString(side) << " " << quantity << " " << normalized
            << " stop@" << *intent.stopPrice << " limit@" << *intent.price << (reduceOnly ? " reduce-only" : "");
        LOG_INFO(oss.str());
    }
    return submit(intent, "Stop-limit", std::move(receipt));
}

OrderReceipt OrderService::cancel(const std::string& symbol, const std::string& orderId) {
    const std::string normalized = strategy::normalizeSymbol(symbol);
    if (normalized.empty() || orderId.empty()) {
        throw common::ValidationError("Symbol and order id are required to cancel an order");
    }

    OrderReceipt receipt;
    receipt.orderId = orderId;
    try {
        client_.cancelOrder(normalized, orderId);
        receipt.success = true;
        receipt.status = exchange::OrderStatus::Canceled;
        receipt.message = "Order " + orderId + " cancelled";
        LOG_INFO(receipt.message);
    } catch (const exchange::ExchangeError& ex) {
        receipt.success = false;
        receipt.message = "Error cancelling order " + orderId + ": " + ex.what();
        LOG_ERROR(receipt.message);
    }
    return receipt;
}

PriceQuote OrderService::currentPrice(const std::string& symbol) {
    PriceQuote quote;
    quote.symbol = strategy::normalizeSymbol(symbol);
    validator_.requireSymbol(quote.symbol);
    quote.price = client_.getCurrentPrice(quote.symbol);
    if (quote.price > 0.0) {
        const double step = rules_.filtersFor(quote.symbol).stepSize;
        // Rounded up to the next step.
        quote.minimumQuantity = strategy::roundDecimals(std::ceil(kMinNotional / quote.price / step - 1e-9) * step);
    }
    LOG_INFO("Current price of " + quote.symbol + ": " + std::to_string(quote.price));
    return quote;
}

std::vector<exchange::OpenOrder> OrderService::openOrders(const std::string& symbol) {
    const std::string normalized = strategy::normalizeSymbol(symbol);
    auto orders = client_.getOpenOrders(normalized);
    LOG_INFO("Retrieved " + std::to_string(orders.size()) + " open orders for " + normalized);
    return orders;
}

StatusReport OrderService::status(const StatusQuery& query) {
    StatusReport report;
    std::optional<std::string> symbol;
    if (query.symbol) {
        symbol = strategy::normalizeSymbol(*query.symbol);
    }

    const auto account = client_.getAccountInfo();
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "Wallet balance: " << account.totalWalletBalance
            << " USDT, available: " << account.availableBalance
            << " USDT, unrealized PnL: " << account.totalUnrealizedProfit
            << " USDT, margin balance: " << account.totalMarginBalance << " USDT";
        report.summary = oss.str();
    }

    if (query.positions) {
        const auto positions = client_.getOpenPositions(symbol);
        if (positions.empty()) {
            report.positions.push_back("No open positions.");
        }
        for (const auto& position : positions) {
            std::ostringstream oss;
            oss << position.symbol << " " << (position.positionAmt > 0.0 ? "LONG" : "SHORT") << " "
                << std::fabs(position.positionAmt) << " @ " << position.entryPrice << " PnL " << std::fixed
                << std::setprecision(2) << position.unrealizedProfit << " USDT";
            report.positions.push_back(oss.str());
        }
    }

    if (query.orders) {
        const auto orders = client_.getOpenOrders(symbol);
        if (orders.empty()) {
            report.orders.push_back("No open orders.");
        }
        for (const auto& order : orders) {
            std::ostringstream oss;
            oss << order.orderId << " " << order.symbol << " " << order.side << " " << order.type << " "
                << order.origQty << " @ " << order.price;
            if (order.stopPrice > 0.0) {
                oss << " stop " << order.stopPrice;
            }
            oss << " (" << order.status << ")";
            report.orders.push_back(oss.str());
        }
    }

    LOG_INFO("Status report generated");
    return report;
}

}  // namespace trading
