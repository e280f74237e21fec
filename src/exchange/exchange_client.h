#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace exchange {

enum class OrderSide { Buy, Sell };

enum class OrderKind { Limit, Market, StopMarket, StopLimit };

enum class TimeInForce { Gtc, Ioc, Fok };

// Client-side view of an order's lifecycle.
enum class OrderStatus { Pending, Placed, Filled, Canceled, Failed };

const char* toString(OrderSide side);
const char* toString(OrderKind kind);
const char* toString(TimeInForce tif);
const char* toString(OrderStatus status);

std::optional<OrderSide> parseOrderSide(const std::string& text);
std::optional<TimeInForce> parseTimeInForce(const std::string& text);

// Transport failure or exchange-side rejection. |apiCode| is the exchange's
// own error code when the response carried one, 0 otherwise.
class ExchangeError : public std::runtime_error {
public:
    explicit ExchangeError(const std::string& message, long httpStatus = 0, int apiCode = 0)
        : std::runtime_error(message), httpStatus_(httpStatus), apiCode_(apiCode) {}

    long httpStatus() const { return httpStatus_; }
    int apiCode() const { return apiCode_; }

private:
    long httpStatus_;
    int apiCode_;
};

struct SymbolFilters {
    std::string symbol;
    bool trading{false};
    double tickSize{0.0};
    double stepSize{0.0};
    double minQty{0.0};
    double maxQty{0.0};
    double minNotional{0.0};
};

struct OrderIntent {
    std::string symbol;
    OrderSide side{OrderSide::Buy};
    OrderKind kind{OrderKind::Market};
    double quantity{0.0};
    std::optional<double> price;
    std::optional<double> stopPrice;
    std::optional<TimeInForce> timeInForce;
    bool reduceOnly{false};
};

struct OrderAck {
    std::string orderId;
    OrderStatus status{OrderStatus::Placed};
    double executedQty{0.0};
    double averagePrice{0.0};
    double price{0.0};
};

struct AccountInfo {
    double totalWalletBalance{0.0};
    double availableBalance{0.0};
    double totalUnrealizedProfit{0.0};
    double totalMarginBalance{0.0};
};

struct PositionInfo {
    std::string symbol;
    std::string positionSide;
    double positionAmt{0.0};
    double entryPrice{0.0};
    double unrealizedProfit{0.0};
    double leverage{0.0};
};

struct OpenOrder {
    std::string orderId;
    std::string symbol;
    std::string side;
    std::string type;
    std::string status;
    double origQty{0.0};
    double price{0.0};
    double stopPrice{0.0};
};

// Blocking exchange connectivity consumed by the strategy engines. Every call
// may throw ExchangeError.
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual void ping() = 0;

    // Returns std::nullopt when the exchange does not list |symbol|.
    virtual std::optional<SymbolFilters> getSymbolFilters(const std::string& symbol) = 0;
    virtual double getCurrentPrice(const std::string& symbol) = 0;

    virtual OrderAck submitOrder(const OrderIntent& intent) = 0;
    virtual OrderStatus getOrderStatus(const std::string& symbol, const std::string& orderId) = 0;
    virtual void cancelOrder(const std::string& symbol, const std::string& orderId) = 0;

    virtual AccountInfo getAccountInfo() = 0;
    virtual std::vector<PositionInfo> getOpenPositions(const std::optional<std::string>& symbol) = 0;
    virtual std::vector<OpenOrder> getOpenOrders(const std::optional<std::string>& symbol) = 0;
};

}  // namespace exchange
