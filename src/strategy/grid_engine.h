#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "strategy/services.h"
#include "strategy/task_group.h"
#include "strategy/types.h"

namespace strategy {

struct GridRequest {
    std::string symbol;
    double lowPrice{0.0};
    double highPrice{0.0};
    int levelCount{0};
    double quantityPerLevel{0.0};
};

struct GridPlacement {
    int buyPlaced{0};
    int sellPlaced{0};
    int failed{0};
    std::vector<std::string> failures;

    int placed() const { return buyPlaced + sellPlaced; }
};

struct GridResult {
    GridStrategy strategy;
    GridPlacement placement;
    bool monitoring{false};
};

struct GridStopReport {
    int canceled{0};
    int cancelFailures{0};
};

struct GridOptions {
    std::chrono::seconds pollInterval{60};
};

// Ladders resting limit orders across a price range and watches them fill.
// Filled levels are recorded; the mirror order is not placed automatically.
class GridEngine {
public:
    explicit GridEngine(StrategyServices services, GridOptions options = {});
    ~GridEngine();

    GridEngine(const GridEngine&) = delete;
    GridEngine& operator=(const GridEngine&) = delete;

    // Validates, places one limit order per BUY/SELL level and starts the fill
    // monitor. Throws common::ValidationError before any order is submitted.
    // Per-level rejections are reported in GridResult::placement.
    GridResult createGrid(const GridRequest& request);

    // Stops the monitor and, when asked, cancels every level order still
    // resting on the exchange. The grid ends STOPPED.
    GridStopReport stopGrid(const StrategyId& id, bool cancelRestingOrders);

    std::shared_ptr<const GridStrategy> snapshot(const StrategyId& id) const;

    // Equally spaced, tick-rounded levels. The level nearest the reference
    // price (within half a spacing, the upper one on a tie) is the reference
    // level and gets no order; levels below are BUY, levels above SELL.
    static std::vector<GridLevel> planLevels(double lowPrice,
                                             double highPrice,
                                             int levelCount,
                                             double quantity,
                                             double referencePrice,
                                             double tickSize);

private:
    GridPlacement placeOrders(GridStrategy& grid);
    void monitor(GridStrategy grid, std::shared_ptr<CancellationToken> token);
    bool checkFills(GridStrategy& grid);

    StrategyServices services_;
    GridOptions options_;
    TaskGroup tasks_;
};

}  // namespace strategy
