#include "strategy/grid_engine.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

#include "common/errors.h"
#include "common/logging.h"

namespace strategy {
namespace {
constexpr double kRelativeTolerance = 1e-9;

bool hasRestingOrders(const GridStrategy& grid) {
    for (const auto& level : grid.levels) {
        if (level.role != GridLevelRole::Reference && level.order.status == exchange::OrderStatus::Placed) {
            return true;
        }
    }
    return false;
}
}  // namespace

GridEngine::GridEngine(StrategyServices services, GridOptions options)
    : services_(services), options_(options) {}

GridEngine::~GridEngine() {
    for (const auto& id : tasks_.ids()) {
        services_.registry.remove(id);
    }
    tasks_.joinAll();
}

std::vector<GridLevel> GridEngine::planLevels(double lowPrice,
                                              double highPrice,
                                              int levelCount,
                                              double quantity,
                                              double referencePrice,
                                              double tickSize) {
    if (levelCount < 2) {
        throw common::ValidationError("Grid needs at least 2 levels");
    }

    const double spacing = (highPrice - lowPrice) / (levelCount - 1);
    const double halfSpacing = spacing / 2.0 * (1.0 + kRelativeTolerance);

    int referenceIndex = -1;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (int i = 0; i < levelCount; ++i) {
        const double distance = std::fabs(lowPrice + i * spacing - referencePrice);
        if (distance <= halfSpacing && distance <= bestDistance + spacing * kRelativeTolerance) {
            referenceIndex = i;
            bestDistance = distance;
        }
    }

    std::vector<GridLevel> levels;
    levels.reserve(static_cast<std::size_t>(levelCount));
    for (int i = 0; i < levelCount; ++i) {
        GridLevel level;
        level.levelIndex = i + 1;
        level.price = roundToTick(lowPrice + i * spacing, tickSize);
        level.quantity = quantity;
        if (i == referenceIndex) {
            level.role = GridLevelRole::Reference;
        } else if (level.price < referencePrice) {
            level.role = GridLevelRole::Buy;
        } else if (level.price > referencePrice) {
            level.role = GridLevelRole::Sell;
        } else {
            level.role = GridLevelRole::Reference;
        }
        levels.push_back(std::move(level));
    }
    return levels;
}

GridResult GridEngine::createGrid(const GridRequest& request) {
    const std::string symbol = normalizeSymbol(request.symbol);
    services_.validator.requireSymbol(symbol);
    Validator::requirePositivePrice("Low price", request.lowPrice);
    Validator::requirePositivePrice("High price", request.highPrice);
    if (!(request.lowPrice < request.highPrice)) {
        throw common::ValidationError("Low price must be less than high price");
    }
    if (request.levelCount < 2) {
        throw common::ValidationError("Grid needs at least 2 levels");
    }
    services_.validator.validateQuantity(symbol, request.quantityPerLevel);

    const double referencePrice = services_.client.getCurrentPrice(symbol);
    if (!(referencePrice > request.lowPrice && referencePrice < request.highPrice)) {
        std::ostringstream oss;
        oss << "Current price " << referencePrice << " is outside the grid range [" << request.lowPrice << ", "
            << request.highPrice << "]";
        throw common::ValidationError(oss.str());
    }

    const auto filters = services_.rules.filtersFor(symbol);

    GridStrategy grid;
    grid.symbol = symbol;
    grid.lowPrice = request.lowPrice;
    grid.highPrice = request.highPrice;
    grid.levelCount = request.levelCount;
    grid.quantityPerLevel = request.quantityPerLevel;
    grid.spacing = (request.highPrice - request.lowPrice) / (request.levelCount - 1);
    grid.referencePrice = referencePrice;
    grid.levels = planLevels(request.lowPrice, request.highPrice, request.levelCount, request.quantityPerLevel,
                             referencePrice, filters.tickSize);
    for (std::size_t i = 1; i < grid.levels.size(); ++i) {
        if (!(grid.levels[i].price > grid.levels[i - 1].price)) {
            throw common::ValidationError("Grid spacing is smaller than the tick size of " + symbol);
        }
    }
    grid.createdAt = services_.clock.wallNow();
    grid.id = services_.registry.nextId("grid");

    {
        std::ostringstream oss;
        oss << "Creating grid " << grid.id << " for " << symbol << ": " << grid.levelCount << " levels from "
            << grid.lowPrice << " to " << grid.highPrice << ", spacing " << grid.spacing << ", current price "
            << referencePrice;
        LOG_INFO(oss.str());
    }

    GridResult result;
    result.placement = placeOrders(grid);

    {
        std::ostringstream oss;
        oss << "Grid " << grid.id << " placed " << result.placement.buyPlaced << " buy and "
            << result.placement.sellPlaced << " sell orders (" << result.placement.failed << " failed)";
        LOG_INFO(oss.str());
    }

    if (result.placement.placed() == 0 || !hasRestingOrders(grid)) {
        grid.status = GridStatus::Stopped;
        if (result.placement.placed() == 0) {
            LOG_ERROR("Grid " + grid.id + " placed no orders; nothing to monitor");
        }
        services_.registry.add(grid.id, grid);
        services_.registry.retire(grid.id, grid);
        result.strategy = std::move(grid);
        return result;
    }

    auto token = services_.registry.add(grid.id, grid);
    result.strategy = grid;
    result.monitoring = true;
    tasks_.launch(grid.id, [this, grid, token]() mutable { monitor(std::move(grid), std::move(token)); });
    return result;
}

GridPlacement GridEngine::placeOrders(GridStrategy& grid) {
    GridPlacement placement;
    for (auto& level : grid.levels) {
        if (level.role == GridLevelRole::Reference) {
            continue;
        }

        exchange::OrderIntent intent;
        intent.symbol = grid.symbol;
        intent.side = level.role == GridLevelRole::Buy ? exchange::OrderSide::Buy : exchange::OrderSide::Sell;
        intent.kind = exchange::OrderKind::Limit;
        intent.quantity = level.quantity;
        intent.price = level.price;
        intent.timeInForce = exchange::TimeInForce::Gtc;
        level.order.intent = intent;

        try {
            const auto ack = services_.client.submitOrder(intent);
            level.order.exchangeOrderId = ack.orderId;
            level.order.status =
                ack.status == exchange::OrderStatus::Filled ? exchange::OrderStatus::Filled : exchange::OrderStatus::Placed;
            if (level.order.status == exchange::OrderStatus::Filled) {
                grid.executedTrades.push_back(
                    GridTrade{level.levelIndex, intent.side, level.price, level.quantity, ack.orderId,
                              services_.clock.wallNow()});
            }
            if (intent.side == exchange::OrderSide::Buy) {
                ++placement.buyPlaced;
            } else {
                ++placement.sellPlaced;
            }

            std::ostringstream oss;
            oss << "Grid " << grid.id << " level " << level.levelIndex << ": " << exchange::toString(intent.side)
                << " " << level.quantity << " @ " << level.price << " (order " << ack.orderId << ")";
            LOG_INFO(oss.str());
        } catch (const exchange::ExchangeError& ex) {
            level.order.status = exchange::OrderStatus::Failed;
            level.order.lastError = ex.what();
            ++placement.failed;

            std::ostringstream oss;
            oss << "level " << level.levelIndex << " " << exchange::toString(intent.side) << " @ " << level.price
                << ": " << ex.what();
            placement.failures.push_back(oss.str());
            LOG_ERROR("Grid " + grid.id + " failed to place " + oss.str());
        }
    }
    return placement;
}

bool GridEngine::checkFills(GridStrategy& grid) {
    bool changed = false;
    for (auto& level : grid.levels) {
        if (level.role == GridLevelRole::Reference || level.order.status != exchange::OrderStatus::Placed ||
            !level.order.exchangeOrderId) {
            continue;
        }

        exchange::OrderStatus status;
        try {
            status = services_.client.getOrderStatus(grid.symbol, *level.order.exchangeOrderId);
        } catch (const exchange::ExchangeError& ex) {
            LOG_WARN("Grid " + grid.id + " status check failed for order " + *level.order.exchangeOrderId + ": " +
                     ex.what());
            continue;
        }

        if (status == exchange::OrderStatus::Filled) {
            level.order.status = status;
            grid.executedTrades.push_back(GridTrade{level.levelIndex, level.order.intent.side, level.price,
                                                    level.quantity, *level.order.exchangeOrderId,
                                                    services_.clock.wallNow()});
            changed = true;

            std::ostringstream oss;
            oss << "Grid " << grid.id << " level " << level.levelIndex << " filled: "
                << exchange::toString(level.order.intent.side) << " " << level.quantity << " @ " << level.price;
            LOG_INFO(oss.str());
        } else if (status == exchange::OrderStatus::Canceled || status == exchange::OrderStatus::Failed) {
            level.order.status = status;
            changed = true;
            LOG_WARN("Grid " + grid.id + " order " + *level.order.exchangeOrderId + " closed without fill (" +
                     exchange::toString(status) + ")");
        }
    }
    return changed;
}

void GridEngine::monitor(GridStrategy grid, std::shared_ptr<CancellationToken> token) {
    LOG_INFO("Monitoring grid " + grid.id);
    try {
        while (grid.status == GridStatus::Active) {
            if (!services_.clock.sleepFor(options_.pollInterval, *token)) {
                LOG_INFO("Grid " + grid.id + " monitoring stopped");
                break;
            }
            if (checkFills(grid)) {
                services_.registry.publish(grid.id, grid);
            }
            if (!hasRestingOrders(grid)) {
                LOG_INFO("Grid " + grid.id + " has no resting orders left");
                grid.status = GridStatus::Stopped;
            }
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Grid " + grid.id + " monitor failed: " + ex.what());
    }
    grid.status = GridStatus::Stopped;
    services_.registry.retire(grid.id, grid);
}

GridStopReport GridEngine::stopGrid(const StrategyId& id, bool cancelRestingOrders) {
    services_.registry.remove(id);
    tasks_.join(id);

    GridStopReport report;
    auto current = services_.registry.get<GridStrategy>(id);
    if (!current) {
        throw common::ValidationError("Unknown grid: " + id);
    }

    GridStrategy grid = *current;
    grid.status = GridStatus::Stopped;
    if (cancelRestingOrders) {
        for (auto& level : grid.levels) {
            if (level.role == GridLevelRole::Reference || level.order.status != exchange::OrderStatus::Placed ||
                !level.order.exchangeOrderId) {
                continue;
            }
            try {
                services_.client.cancelOrder(grid.symbol, *level.order.exchangeOrderId);
                level.order.status = exchange::OrderStatus::Canceled;
                ++report.canceled;
            } catch (const exchange::ExchangeError& ex) {
                level.order.lastError = ex.what();
                ++report.cancelFailures;
                LOG_WARN("Grid " + id + " failed to cancel order " + *level.order.exchangeOrderId + ": " + ex.what());
            }
        }
    }

    std::ostringstream oss;
    oss << "Grid " << id << " stopped (" << report.canceled << " orders canceled, " << report.cancelFailures
        << " cancel failures)";
    LOG_INFO(oss.str());

    services_.registry.retire(id, grid);
    return report;
}

std::shared_ptr<const GridStrategy> GridEngine::snapshot(const StrategyId& id) const {
    return services_.registry.get<GridStrategy>(id);
}

}  // namespace strategy
