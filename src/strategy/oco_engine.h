#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "strategy/services.h"
#include "strategy/task_group.h"
#include "strategy/types.h"

namespace strategy {

struct OcoRequest {
    std::string symbol;
    double quantity{0.0};
    double takeProfitPrice{0.0};
    double stopLossPrice{0.0};
    PositionSide positionSide{PositionSide::Long};
};

struct OcoOptions {
    std::chrono::seconds pollInterval{30};
};

// A leg of the bracket was rejected. When the stop loss fails after the take
// profit was accepted, the live take profit order id is attached; the engine
// never rolls it back.
class OcoPlacementError : public exchange::ExchangeError {
public:
    OcoPlacementError(const std::string& message,
                      std::optional<std::string> placedTakeProfitId,
                      long httpStatus = 0,
                      int apiCode = 0)
        : exchange::ExchangeError(message, httpStatus, apiCode),
          placedTakeProfitId_(std::move(placedTakeProfitId)) {}

    const std::optional<std::string>& placedTakeProfitId() const { return placedTakeProfitId_; }

private:
    std::optional<std::string> placedTakeProfitId_;
};

// Brackets an open position with a reduce-only take profit limit and a
// reduce-only stop market order, and cancels the survivor once one fills.
class OcoEngine {
public:
    explicit OcoEngine(StrategyServices services, OcoOptions options = {});
    ~OcoEngine();

    OcoEngine(const OcoEngine&) = delete;
    OcoEngine& operator=(const OcoEngine&) = delete;

    OcoPair createOco(const OcoRequest& request);

    // Blocks until the pair resolves (or its monitoring is canceled).
    OcoPair waitForResolution(const StrategyId& id);

    // Stops monitoring. Both orders stay on the exchange.
    bool cancelOco(const StrategyId& id);

    std::shared_ptr<const OcoPair> snapshot(const StrategyId& id) const;

    // LONG: stopLoss < reference < takeProfit. SHORT: takeProfit < reference
    // < stopLoss. Throws common::ValidationError otherwise. createOco() checks
    // the tick-quantized prices.
    static void checkPriceOrdering(PositionSide side, double referencePrice, double takeProfit, double stopLoss);

private:
    void monitor(OcoPair pair, std::shared_ptr<CancellationToken> token);
    void resolve(OcoPair& pair, OcoLeg filledLeg);

    StrategyServices services_;
    OcoOptions options_;
    TaskGroup tasks_;
};

}  // namespace strategy
