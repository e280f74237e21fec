#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "exchange/exchange_client.h"

namespace strategy {

using StrategyId = std::string;
using MonotonicTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// One submitted order. |intent| never changes after submission; |status| is
// only advanced by the task that owns the strategy.
struct OrderRecord {
    exchange::OrderIntent intent;
    std::optional<std::string> exchangeOrderId;
    exchange::OrderStatus status{exchange::OrderStatus::Pending};
    std::optional<std::string> lastError;
};

enum class GridStatus { Active, Stopped };

enum class GridLevelRole { Buy, Sell, Reference };

struct GridLevel {
    // 1-based, ascending with price.
    int levelIndex{0};
    double price{0.0};
    double quantity{0.0};
    GridLevelRole role{GridLevelRole::Reference};
    OrderRecord order;
};

struct GridTrade {
    int levelIndex{0};
    exchange::OrderSide side{exchange::OrderSide::Buy};
    double price{0.0};
    double quantity{0.0};
    std::string orderId;
    WallTime filledAt;
};

struct GridStrategy {
    StrategyId id;
    std::string symbol;
    double lowPrice{0.0};
    double highPrice{0.0};
    int levelCount{0};
    double quantityPerLevel{0.0};
    double spacing{0.0};
    double referencePrice{0.0};
    std::vector<GridLevel> levels;
    std::vector<GridTrade> executedTrades;
    GridStatus status{GridStatus::Active};
    WallTime createdAt;
};

enum class TwapStatus { Active, Completed, Failed, Error, Canceled };

enum class TwapChunkStatus { Pending, Executed, Failed };

struct TwapChunk {
    int chunkIndex{0};
    double quantity{0.0};
    MonotonicTime scheduledAt;
    WallTime scheduledWallTime;
    TwapChunkStatus status{TwapChunkStatus::Pending};
    OrderRecord order;
    std::optional<double> executionPrice;
    bool belowMinNotional{false};
};

struct TwapPlan {
    StrategyId id;
    std::string symbol;
    exchange::OrderSide side{exchange::OrderSide::Buy};
    double totalQuantity{0.0};
    int durationMinutes{0};
    int chunkCount{0};
    std::chrono::duration<double> interval{0.0};
    std::optional<double> priceLimit;
    bool randomizeTiming{true};
    std::vector<TwapChunk> chunks;
    double executedQuantity{0.0};
    std::optional<double> averageExecutionPrice;
    TwapStatus status{TwapStatus::Active};
    WallTime createdAt;
};

enum class PositionSide { Long, Short };

enum class OcoStatus { Active, Resolved };

enum class OcoLeg { TakeProfit, StopLoss };

struct OcoPair {
    StrategyId id;
    std::string symbol;
    double quantity{0.0};
    PositionSide positionSide{PositionSide::Long};
    double referencePrice{0.0};
    OrderRecord takeProfit;
    OrderRecord stopLoss;
    OcoStatus status{OcoStatus::Active};
    std::optional<OcoLeg> filledLeg;
    std::size_t cancelFailures{0};
    WallTime createdAt;
};

const char* toString(GridStatus status);
const char* toString(GridLevelRole role);
const char* toString(TwapStatus status);
const char* toString(TwapChunkStatus status);
const char* toString(PositionSide side);
const char* toString(OcoStatus status);
const char* toString(OcoLeg leg);

std::optional<PositionSide> parsePositionSide(const std::string& text);

}  // namespace strategy
