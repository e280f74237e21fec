#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "strategy/services.h"
#include "strategy/task_group.h"
#include "strategy/types.h"

namespace strategy {

struct TwapRequest {
    std::string symbol;
    exchange::OrderSide side{exchange::OrderSide::Buy};
    double totalQuantity{0.0};
    int durationMinutes{0};
    std::optional<double> priceLimit;
    bool randomizeTiming{true};
};

// Slices a parent order into evenly spaced chunks executed by a background
// task. Chunks run strictly in order; a failed chunk does not stop the plan.
class TwapEngine {
public:
    // Returns a timing offset as a fraction of the chunk interval. Values are
    // clamped to [-kMaxJitterFraction, kMaxJitterFraction].
    using JitterSource = std::function<double()>;

    static constexpr double kMaxJitterFraction = 0.3;
    static constexpr int kMaxChunks = 10;

    explicit TwapEngine(StrategyServices services, JitterSource jitter = {});
    ~TwapEngine();

    TwapEngine(const TwapEngine&) = delete;
    TwapEngine& operator=(const TwapEngine&) = delete;

    // Validates and schedules the plan, then starts executing it. Throws
    // common::ValidationError (or InvalidQuantity) before any order is sent.
    TwapPlan createTwap(const TwapRequest& request);

    // Blocks until the plan reaches a terminal status and returns it.
    TwapPlan waitForCompletion(const StrategyId& id);

    // Stops a running plan after its current chunk. Returns false when the
    // plan is not running.
    bool cancelTwap(const StrategyId& id);

    std::shared_ptr<const TwapPlan> snapshot(const StrategyId& id) const;

    // round(minutes / 2) clamped to [1, kMaxChunks].
    static int chunkCountFor(int durationMinutes);

    // Equal chunks rounded down to the step; the last one absorbs the residual.
    static std::vector<double> splitQuantity(double totalQuantity, int chunkCount, double stepSize);

private:
    void execute(TwapPlan plan, std::shared_ptr<CancellationToken> token);
    void executeChunk(TwapPlan& plan, TwapChunk& chunk);
    std::optional<double> realizedPrice(const TwapPlan& plan, const exchange::OrderAck& ack);
    double nextJitter();

    StrategyServices services_;
    JitterSource jitter_;
    TaskGroup tasks_;
};

}  // namespace strategy
