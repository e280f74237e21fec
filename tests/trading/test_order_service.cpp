#include "trading/order_service.h"

#include <string>

#include "common/errors.h"
#include "strategy/quantization.h"
#include "strategy/validation.h"

#include "support/fake_exchange.h"
#include "support/test_helpers.h"

using test_support::Expect;

namespace {

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

struct Service {
    test_support::FakeExchange fake;
    strategy::SymbolRules rules{fake};
    strategy::Validator validator{fake, rules};
    trading::OrderService orders{fake, validator, rules};
};

bool TestMarketOrderReceipt() {
    Service service;
    const auto receipt = service.orders.placeMarket("btcusdt", exchange::OrderSide::Buy, 0.01);
    if (!Expect(receipt.success && receipt.orderId == "1", "Market order should succeed with id 1")) {
        return false;
    }
    if (!Expect(receipt.status == exchange::OrderStatus::Filled && receipt.filledQuantity == 0.01 &&
                    receipt.averagePrice == 45000.0,
                "Market receipt should carry the fill")) {
        return false;
    }
    if (!Expect(receipt.referencePrice && *receipt.referencePrice == 45000.0, "Reference price missing")) {
        return false;
    }
    const auto submitted = service.fake.submitted();
    return Expect(submitted.size() == 1 && submitted.front().symbol == "BTCUSDT" &&
                      submitted.front().kind == exchange::OrderKind::Market,
                  "Market intent should use the normalized symbol");
}

bool TestLimitOrderWarnings() {
    Service service;
    const auto far = service.orders.placeLimit("BTCUSDT", exchange::OrderSide::Buy, 0.01, 30000.0);
    if (!Expect(far.success && far.warnings.size() == 1 && Contains(far.warnings.front(), "-33.33%"),
                "Limit price far from market should warn")) {
        return false;
    }
    if (!Expect(far.status == exchange::OrderStatus::Placed, "Limit order should rest")) {
        return false;
    }

    const auto near = service.orders.placeLimit("BTCUSDT", exchange::OrderSide::Sell, 0.01, 45012.34,
                                                exchange::TimeInForce::Ioc);
    if (!Expect(near.success && near.warnings.empty(), "Nearby limit price should not warn")) {
        return false;
    }
    const auto submitted = service.fake.submitted();
    const auto& intent = submitted.back();
    return Expect(intent.price && *intent.price == strategy::roundToTick(45012.34, 0.1) &&
                      intent.timeInForce == exchange::TimeInForce::Ioc,
                  "Limit price should be quantized and the time in force kept");
}

bool TestStopLimitOrders() {
    Service service;
    const auto misplaced = service.orders.placeStopLimit("BTCUSDT", exchange::OrderSide::Buy, 0.01, 44000.0, 44100.0);
    if (!Expect(misplaced.success && misplaced.warnings.size() == 1, "BUY stop below market should warn")) {
        return false;
    }

    const auto protective =
        service.orders.placeStopLimit("BTCUSDT", exchange::OrderSide::Sell, 0.01, 44000.0, 43900.0, true);
    if (!Expect(protective.success && protective.warnings.empty(), "SELL stop below market should not warn")) {
        return false;
    }
    const auto intent = service.fake.submitted().back();
    return Expect(intent.kind == exchange::OrderKind::StopLimit && intent.reduceOnly && intent.stopPrice &&
                      *intent.stopPrice == 44000.0 && intent.price && *intent.price == 43900.0 &&
                      intent.timeInForce == exchange::TimeInForce::Gtc,
                  "Stop-limit intent should carry both prices");
}

bool TestRejectionIsReported() {
    Service service;
    service.fake.rejectSubmissions([](const exchange::OrderIntent&) { return true; });
    const auto receipt = service.orders.placeMarket("BTCUSDT", exchange::OrderSide::Sell, 0.01);
    if (!Expect(!receipt.success && receipt.status == exchange::OrderStatus::Failed, "Rejection should fail")) {
        return false;
    }
    return Expect(receipt.message.rfind("Market order failed", 0) == 0 && receipt.orderId.empty(),
                  "Rejection message should name the order type");
}

bool TestValidationThrows() {
    Service service;
    bool threw = false;
    try {
        service.orders.placeMarket("BTCUSDT", exchange::OrderSide::Buy, 0.0005);
    } catch (const common::InvalidQuantity&) {
        threw = true;
    }
    if (!Expect(threw, "Quantity below minimum should throw")) {
        return false;
    }

    threw = false;
    try {
        service.orders.placeLimit("DOGEUSDT", exchange::OrderSide::Buy, 1.0, 0.1);
    } catch (const common::ValidationError&) {
        threw = true;
    }
    if (!Expect(threw, "Unknown symbol should throw")) {
        return false;
    }

    threw = false;
    try {
        service.orders.placeLimit("BTCUSDT", exchange::OrderSide::Buy, 0.01, -1.0);
    } catch (const common::ValidationError&) {
        threw = true;
    }
    if (!Expect(threw, "Negative price should throw")) {
        return false;
    }
    return Expect(service.fake.submitted().empty(), "Nothing should be submitted");
}

bool TestCancel() {
    Service service;
    service.orders.placeLimit("BTCUSDT", exchange::OrderSide::Buy, 0.01, 44000.0);
    const auto canceled = service.orders.cancel("btcusdt", "1");
    if (!Expect(canceled.success && canceled.status == exchange::OrderStatus::Canceled, "Cancel should succeed")) {
        return false;
    }
    const auto unknown = service.orders.cancel("BTCUSDT", "99");
    if (!Expect(!unknown.success && Contains(unknown.message, "99"), "Unknown order cancel should fail")) {
        return false;
    }
    bool threw = false;
    try {
        service.orders.cancel("BTCUSDT", "");
    } catch (const common::ValidationError&) {
        threw = true;
    }
    return Expect(threw, "Cancel without an id should throw");
}

bool TestPriceQuote() {
    Service service;
    const auto btc = service.orders.currentPrice("btcusdt");
    if (!Expect(btc.symbol == "BTCUSDT" && btc.price == 45000.0, "BTC quote wrong")) {
        return false;
    }
    if (!Expect(btc.minimumQuantity == 0.003, "BTC minimum quantity should be 0.003")) {
        return false;
    }
    const auto eth = service.orders.currentPrice("ETHUSDT");
    return Expect(eth.minimumQuantity == 0.034, "ETH minimum quantity should be 0.034");
}

bool TestStatusReport() {
    Service service;
    const auto empty = service.orders.status({std::nullopt, true, true});
    if (!Expect(Contains(empty.summary, "Wallet balance: 1000.00 USDT") &&
                    Contains(empty.summary, "unrealized PnL: 12.50 USDT"),
                "Account summary wrong: " + empty.summary)) {
        return false;
    }
    if (!Expect(empty.positions.size() == 1 && empty.positions.front() == "No open positions." &&
                    empty.orders.size() == 1 && empty.orders.front() == "No open orders.",
                "Empty report should say so")) {
        return false;
    }

    service.fake.setPositions({exchange::PositionInfo{"BTCUSDT", "BOTH", -0.01, 46000.0, 10.0, 20.0},
                               exchange::PositionInfo{"ETHUSDT", "BOTH", 1.0, 2900.0, 100.0, 10.0}});
    service.orders.placeLimit("BTCUSDT", exchange::OrderSide::Buy, 0.01, 44000.0);
    service.orders.placeMarket("BTCUSDT", exchange::OrderSide::Buy, 0.01);

    const auto report = service.orders.status({std::string("btcusdt"), true, true});
    if (!Expect(report.positions.size() == 1 && Contains(report.positions.front(), "BTCUSDT SHORT 0.01"),
                "Position filter or side wrong")) {
        return false;
    }
    if (!Expect(report.orders.size() == 1 && Contains(report.orders.front(), "1 BTCUSDT BUY LIMIT"),
                "Only the resting order should be listed")) {
        return false;
    }

    const auto summaryOnly = service.orders.status({});
    return Expect(summaryOnly.positions.empty() && summaryOnly.orders.empty(), "Sections should be optional");
}

}  // namespace

int main() {
    if (!TestMarketOrderReceipt()) {
        return 1;
    }
    if (!TestLimitOrderWarnings()) {
        return 1;
    }
    if (!TestStopLimitOrders()) {
        return 1;
    }
    if (!TestRejectionIsReported()) {
        return 1;
    }
    if (!TestValidationThrows()) {
        return 1;
    }
    if (!TestCancel()) {
        return 1;
    }
    if (!TestPriceQuote()) {
        return 1;
    }
    if (!TestStatusReport()) {
        return 1;
    }
    return 0;
}
