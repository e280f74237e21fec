#include "exchange/exchange_client.h"

#include <algorithm>
#include <cctype>

namespace exchange {
namespace {
std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}
}  // namespace

const char* toString(OrderSide side) {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

const char* toString(OrderKind kind) {
    switch (kind) {
        case OrderKind::Limit:
            return "LIMIT";
        case OrderKind::Market:
            return "MARKET";
        case OrderKind::StopMarket:
            return "STOP_MARKET";
        case OrderKind::StopLimit:
        default:
            return "STOP";
    }
}

const char* toString(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::Ioc:
            return "IOC";
        case TimeInForce::Fok:
            return "FOK";
        case TimeInForce::Gtc:
        default:
            return "GTC";
    }
}

const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending:
            return "PENDING";
        case OrderStatus::Placed:
            return "PLACED";
        case OrderStatus::Filled:
            return "FILLED";
        case OrderStatus::Canceled:
            return "CANCELED";
        case OrderStatus::Failed:
        default:
            return "FAILED";
    }
}

std::optional<OrderSide> parseOrderSide(const std::string& text) {
    const std::string upper = toUpper(text);
    if (upper == "BUY") {
        return OrderSide::Buy;
    }
    if (upper == "SELL") {
        return OrderSide::Sell;
    }
    return std::nullopt;
}

std::optional<TimeInForce> parseTimeInForce(const std::string& text) {
    const std::string upper = toUpper(text);
    if (upper == "GTC") {
        return TimeInForce::Gtc;
    }
    if (upper == "IOC") {
        return TimeInForce::Ioc;
    }
    if (upper == "FOK") {
        return TimeInForce::Fok;
    }
    return std::nullopt;
}

}  // namespace exchange
