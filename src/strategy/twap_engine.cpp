#include "strategy/twap_engine.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <sstream>
#include <utility>

#include "common/errors.h"
#include "common/logging.h"

namespace strategy {
namespace {
std::string describeChunk(const TwapPlan& plan, const TwapChunk& chunk) {
    std::ostringstream oss;
    oss << "TWAP " << plan.id << " chunk " << chunk.chunkIndex << "/" << plan.chunkCount;
    return oss.str();
}
}  // namespace

TwapEngine::TwapEngine(StrategyServices services, JitterSource jitter)
    : services_(services), jitter_(std::move(jitter)) {
    if (!jitter_) {
        auto generator = std::make_shared<std::mt19937>(std::random_device{}());
        jitter_ = [generator]() {
            std::uniform_real_distribution<double> distribution(-kMaxJitterFraction, kMaxJitterFraction);
            return distribution(*generator);
        };
    }
}

TwapEngine::~TwapEngine() {
    for (const auto& id : tasks_.ids()) {
        services_.registry.remove(id);
    }
    tasks_.joinAll();
}

int TwapEngine::chunkCountFor(int durationMinutes) {
    const long chunks = std::lround(static_cast<double>(durationMinutes) / 2.0);
    return static_cast<int>(std::clamp<long>(chunks, 1, kMaxChunks));
}

std::vector<double> TwapEngine::splitQuantity(double totalQuantity, int chunkCount, double stepSize) {
    if (chunkCount < 1) {
        throw common::ValidationError("TWAP needs at least one chunk");
    }
    if (!(stepSize > 0.0)) {
        throw std::invalid_argument("step size must be positive");
    }
    // Rounded down; the remainder left for the last chunk is never negative.
    const double units = std::floor(roundDecimals(totalQuantity / chunkCount / stepSize));
    const double base = roundDecimals(units * stepSize);
    std::vector<double> quantities(static_cast<std::size_t>(chunkCount), base);
    const double allocated = roundDecimals(base * (chunkCount - 1));
    quantities.back() = roundToStep(totalQuantity - allocated, stepSize);
    return quantities;
}

double TwapEngine::nextJitter() {
    return std::clamp(jitter_(), -kMaxJitterFraction, kMaxJitterFraction);
}

TwapPlan TwapEngine::createTwap(const TwapRequest& request) {
    const std::string symbol = normalizeSymbol(request.symbol);
    services_.validator.requireSymbol(symbol);
    services_.validator.validateQuantity(symbol, request.totalQuantity);
    if (request.durationMinutes <= 0) {
        throw common::ValidationError("TWAP duration must be a positive number of minutes");
    }
    if (request.priceLimit) {
        Validator::requirePositivePrice("Price limit", *request.priceLimit);
    }

    const auto filters = services_.rules.filtersFor(symbol);

    TwapPlan plan;
    plan.symbol = symbol;
    plan.side = request.side;
    plan.totalQuantity = request.totalQuantity;
    plan.durationMinutes = request.durationMinutes;
    plan.chunkCount = chunkCountFor(request.durationMinutes);
    plan.interval = std::chrono::duration<double>(request.durationMinutes * 60.0 / plan.chunkCount);
    if (request.priceLimit) {
        plan.priceLimit = roundToTick(*request.priceLimit, filters.tickSize);
    }
    plan.randomizeTiming = request.randomizeTiming;

    const auto quantities = splitQuantity(request.totalQuantity, plan.chunkCount, filters.stepSize);
    for (int i = 0; i < plan.chunkCount; ++i) {
        try {
            Validator::checkQuantity(filters, quantities[static_cast<std::size_t>(i)]);
        } catch (const common::InvalidQuantity& ex) {
            std::ostringstream oss;
            oss << "TWAP chunk " << (i + 1) << " of " << plan.chunkCount << " is not tradable: " << ex.what();
            throw common::InvalidQuantity(oss.str());
        }
    }

    // Notional is estimated against the limit or the current price; small
    // chunks are flagged rather than refused.
    const double referencePrice = plan.priceLimit ? *plan.priceLimit : services_.client.getCurrentPrice(symbol);

    const MonotonicTime start = services_.clock.now();
    const WallTime wallStart = services_.clock.wallNow();
    plan.createdAt = wallStart;
    plan.id = services_.registry.nextId("twap");

    for (int i = 0; i < plan.chunkCount; ++i) {
        TwapChunk chunk;
        chunk.chunkIndex = i + 1;
        chunk.quantity = quantities[static_cast<std::size_t>(i)];

        double offsetSeconds = i * plan.interval.count();
        if (plan.randomizeTiming && i > 0) {
            offsetSeconds += nextJitter() * plan.interval.count();
        }
        const auto offset = std::chrono::duration_cast<Clock::Duration>(std::chrono::duration<double>(offsetSeconds));
        chunk.scheduledAt = start + offset;
        chunk.scheduledWallTime = wallStart + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);

        if (chunk.quantity * referencePrice < filters.minNotional) {
            chunk.belowMinNotional = true;
            std::ostringstream oss;
            oss << "TWAP " << plan.id << " chunk " << chunk.chunkIndex << " notional "
                << chunk.quantity * referencePrice << " is below the minimum of " << filters.minNotional;
            LOG_WARN(oss.str());
        }
        plan.chunks.push_back(std::move(chunk));
    }

    {
        std::ostringstream oss;
        oss << "Created TWAP " << plan.id << ": " << exchange::toString(plan.side) << " " << plan.totalQuantity << " "
            << symbol << " over " << plan.durationMinutes << " minutes in " << plan.chunkCount << " chunks, "
            << plan.interval.count() << "s apart";
        if (plan.priceLimit) {
            oss << ", limit " << *plan.priceLimit;
        }
        LOG_INFO(oss.str());
    }

    auto token = services_.registry.add(plan.id, plan);
    tasks_.launch(plan.id, [this, plan, token]() mutable { execute(std::move(plan), std::move(token)); });
    return plan;
}

void TwapEngine::execute(TwapPlan plan, std::shared_ptr<CancellationToken> token) {
    LOG_INFO("Starting TWAP execution " + plan.id);
    try {
        bool cancelled = false;
        for (auto& chunk : plan.chunks) {
            if (!services_.clock.sleepUntil(chunk.scheduledAt, *token)) {
                cancelled = true;
                break;
            }
            executeChunk(plan, chunk);
            services_.registry.publish(plan.id, plan);
        }

        double priceSum = 0.0;
        int priced = 0;
        int executed = 0;
        for (const auto& chunk : plan.chunks) {
            if (chunk.status != TwapChunkStatus::Executed) {
                continue;
            }
            ++executed;
            if (chunk.executionPrice) {
                priceSum += *chunk.executionPrice;
                ++priced;
            }
        }
        if (priced > 0) {
            plan.averageExecutionPrice = roundDecimals(priceSum / priced);
        }

        if (cancelled) {
            plan.status = TwapStatus::Canceled;
        } else {
            plan.status = executed > 0 ? TwapStatus::Completed : TwapStatus::Failed;
        }

        std::ostringstream oss;
        oss << "TWAP " << plan.id << " " << toString(plan.status) << ": executed " << plan.executedQuantity << "/"
            << plan.totalQuantity << " in " << executed << " of " << plan.chunkCount << " chunks";
        if (plan.averageExecutionPrice) {
            oss << ", average price " << *plan.averageExecutionPrice;
        }
        LOG_INFO(oss.str());
    } catch (const std::exception& ex) {
        plan.status = TwapStatus::Error;
        LOG_ERROR("TWAP " + plan.id + " execution error: " + ex.what());
    }
    services_.registry.retire(plan.id, plan);
}

void TwapEngine::executeChunk(TwapPlan& plan, TwapChunk& chunk) {
    exchange::OrderIntent intent;
    intent.symbol = plan.symbol;
    intent.side = plan.side;
    intent.quantity = chunk.quantity;
    if (plan.priceLimit) {
        intent.kind = exchange::OrderKind::Limit;
        intent.price = *plan.priceLimit;
        intent.timeInForce = exchange::TimeInForce::Gtc;
    } else {
        intent.kind = exchange::OrderKind::Market;
    }
    chunk.order.intent = intent;

    try {
        const auto ack = services_.client.submitOrder(intent);
        chunk.order.exchangeOrderId = ack.orderId;
        chunk.order.status = ack.status == exchange::OrderStatus::Filled ? exchange::OrderStatus::Filled
                                                                         : exchange::OrderStatus::Placed;
        chunk.status = TwapChunkStatus::Executed;
        chunk.executionPrice = realizedPrice(plan, ack);
        plan.executedQuantity = roundDecimals(plan.executedQuantity + chunk.quantity);

        std::ostringstream oss;
        oss << describeChunk(plan, chunk) << " executed: " << chunk.quantity;
        if (chunk.executionPrice) {
            oss << " @ " << *chunk.executionPrice;
        }
        oss << " (order " << ack.orderId << ", progress " << plan.executedQuantity << "/" << plan.totalQuantity
            << ")";
        LOG_INFO(oss.str());
    } catch (const exchange::ExchangeError& ex) {
        chunk.status = TwapChunkStatus::Failed;
        chunk.order.status = exchange::OrderStatus::Failed;
        chunk.order.lastError = ex.what();
        LOG_ERROR(describeChunk(plan, chunk) + " failed: " + ex.what());
    }
}

std::optional<double> TwapEngine::realizedPrice(const TwapPlan& plan, const exchange::OrderAck& ack) {
    if (ack.averagePrice > 0.0) {
        return ack.averagePrice;
    }
    if (ack.status == exchange::OrderStatus::Filled) {
        try {
            return services_.client.getCurrentPrice(plan.symbol);
        } catch (const exchange::ExchangeError& ex) {
            LOG_WARN("TWAP " + plan.id + " could not price a filled chunk: " + ex.what());
        }
    }
    if (plan.priceLimit) {
        return plan.priceLimit;
    }
    return std::nullopt;
}

TwapPlan TwapEngine::waitForCompletion(const StrategyId& id) {
    tasks_.join(id);
    auto plan = services_.registry.get<TwapPlan>(id);
    if (!plan) {
        throw common::ValidationError("Unknown TWAP: " + id);
    }
    return *plan;
}

bool TwapEngine::cancelTwap(const StrategyId& id) {
    if (!services_.registry.remove(id)) {
        return false;
    }
    LOG_INFO("TWAP " + id + " cancellation requested");
    tasks_.join(id);
    return true;
}

std::shared_ptr<const TwapPlan> TwapEngine::snapshot(const StrategyId& id) const {
    return services_.registry.get<TwapPlan>(id);
}

}  // namespace strategy
