#pragma once

#include <optional>
#include <string>
#include <vector>

#include "exchange/exchange_client.h"
#include "strategy/quantization.h"
#include "strategy/validation.h"

namespace trading {

struct OrderReceipt {
    bool success{false};
    std::string message;
    std::string orderId;
    exchange::OrderStatus status{exchange::OrderStatus::Pending};
    double quantity{0.0};
    double filledQuantity{0.0};
    double averagePrice{0.0};
    std::optional<double> referencePrice;
    std::vector<std::string> warnings;
};

struct PriceQuote {
    std::string symbol;
    double price{0.0};
    // Smallest quantity whose notional reaches OrderService::kMinNotional.
    double minimumQuantity{0.0};
};

struct StatusQuery {
    std::optional<std::string> symbol;
    bool positions{false};
    bool orders{false};
};

struct StatusReport {
    std::string summary;
    std::vector<std::string> positions;
    std::vector<std::string> orders;
};

// One-shot manual orders and account queries. Validation failures throw
// common::ValidationError; exchange rejections come back as an unsuccessful
// receipt.
class OrderService {
public:
    static constexpr double kMinNotional = 100.0;
    static constexpr double kLimitDistanceWarning = 0.10;

    OrderService(exchange::ExchangeClient& client,
                 const strategy::Validator& validator,
                 const strategy::SymbolRules& rules);

    OrderReceipt placeMarket(const std::string& symbol, exchange::OrderSide side, double quantity);
    OrderReceipt placeLimit(const std::string& symbol,
                            exchange::OrderSide side,
                            double quantity,
                            double price,
                            exchange::TimeInForce timeInForce = exchange::TimeInForce::Gtc);
    OrderReceipt placeStopLimit(const std::string& symbol,
                                exchange::OrderSide side,
                                double quantity,
                                double stopPrice,
                                double limitPrice,
                                bool reduceOnly = false);
    OrderReceipt cancel(const std::string& symbol, const std::string& orderId);

    PriceQuote currentPrice(const std::string& symbol);
    std::vector<exchange::OpenOrder> openOrders(const std::string& symbol);
    StatusReport status(const StatusQuery& query);

private:
    std::string prepare(const std::string& symbol, double quantity);
    OrderReceipt submit(const exchange::OrderIntent& intent, const std::string& label, OrderReceipt receipt);

    exchange::ExchangeClient& client_;
    const strategy::Validator& validator_;
    const strategy::SymbolRules& rules_;
};

}  // namespace trading
