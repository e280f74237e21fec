#include "strategy/twap_engine.h"

#include <chrono>
#include <cmath>
#include <string>

#include "common/errors.h"

#include "support/strategy_harness.h"
#include "support/test_helpers.h"

using test_support::Expect;
using test_support::StrategyHarness;
using test_support::WaitForSleeper;

namespace {

strategy::TwapRequest FixedRequest(double quantity, int minutes) {
    strategy::TwapRequest request;
    request.symbol = "btcusdt";
    request.side = exchange::OrderSide::Buy;
    request.totalQuantity = quantity;
    request.durationMinutes = minutes;
    request.randomizeTiming = false;
    return request;
}

double SecondsBetween(strategy::MonotonicTime from, strategy::MonotonicTime to) {
    return std::chrono::duration<double>(to - from).count();
}

bool TestChunkCount() {
    if (!Expect(strategy::TwapEngine::chunkCountFor(30) == 10, "30 minutes should cap at 10 chunks")) {
        return false;
    }
    if (!Expect(strategy::TwapEngine::chunkCountFor(1) == 1, "1 minute should give 1 chunk")) {
        return false;
    }
    if (!Expect(strategy::TwapEngine::chunkCountFor(4) == 2, "4 minutes should give 2 chunks")) {
        return false;
    }
    if (!Expect(strategy::TwapEngine::chunkCountFor(5) == 3, "5 minutes should round up to 3 chunks")) {
        return false;
    }
    return Expect(strategy::TwapEngine::chunkCountFor(600) == 10, "Long plans should cap at 10 chunks");
}

bool TestSplitQuantityConservesTotal() {
    const double totals[] = {0.01, 0.015, 0.016, 0.019, 0.037, 1.234};
    for (const double total : totals) {
        for (int chunks = 1; chunks <= 10; ++chunks) {
            const auto parts = strategy::TwapEngine::splitQuantity(total, chunks, 0.001);
            double sum = 0.0;
            for (const double part : parts) {
                if (!(part > 0.0)) {
                    return Expect(false, "Split of " + std::to_string(total) + " into " + std::to_string(chunks) +
                                             " chunks has a non-positive chunk");
                }
                sum += part;
            }
            if (parts.size() != static_cast<std::size_t>(chunks) || std::fabs(sum - total) > 1e-9) {
                return Expect(false, "Split of " + std::to_string(total) + " into " + std::to_string(chunks) +
                                         " chunks does not add up");
            }
        }
    }
    const auto even = strategy::TwapEngine::splitQuantity(0.01, 10, 0.001);
    for (const double part : even) {
        if (std::fabs(part - 0.001) > 1e-12) {
            return Expect(false, "0.01 in 10 chunks should be 0.001 each");
        }
    }
    return true;
}

bool TestPlanSchedule() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.01, 30));
    if (!Expect(plan.symbol == "BTCUSDT" && plan.chunkCount == 10, "Expected 10 chunks on BTCUSDT")) {
        return false;
    }
    if (!Expect(std::fabs(plan.interval.count() - 180.0) < 1e-9, "Expected a 180 second interval")) {
        return false;
    }
    for (std::size_t i = 0; i < plan.chunks.size(); ++i) {
        const auto& chunk = plan.chunks[i];
        const double offset = SecondsBetween(plan.chunks.front().scheduledAt, chunk.scheduledAt);
        if (chunk.chunkIndex != static_cast<int>(i) + 1 || std::fabs(offset - 180.0 * i) > 1e-6) {
            return Expect(false, "Chunk " + std::to_string(i + 1) + " is not on the fixed schedule");
        }
        if (!chunk.belowMinNotional) {
            return Expect(false, "0.001 BTC at 45000 should be flagged below min notional");
        }
    }
    return true;
}

bool TestJitterIsClamped() {
    StrategyHarness harness;
    strategy::TwapEngine late(harness.services(), []() { return 0.9; });
    auto request = FixedRequest(0.01, 30);
    request.randomizeTiming = true;

    const auto delayed = late.createTwap(request);
    const double first = SecondsBetween(delayed.chunks[0].scheduledAt, delayed.chunks[1].scheduledAt);
    if (!Expect(std::fabs(first - 234.0) < 1e-3, "Jitter above 0.3 should be clamped to 0.3 of the interval")) {
        return false;
    }

    strategy::TwapEngine early(harness.services(), []() { return -5.0; });
    const auto advanced = early.createTwap(request);
    const double second = SecondsBetween(advanced.chunks[0].scheduledAt, advanced.chunks[1].scheduledAt);
    return Expect(std::fabs(second - 126.0) < 1e-3, "Jitter below -0.3 should be clamped to -0.3 of the interval");
}

bool TestExecutesAllChunks() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.01, 30));
    harness.clock.advance(std::chrono::minutes(30));
    const auto done = engine.waitForCompletion(plan.id);

    if (!Expect(done.status == strategy::TwapStatus::Completed, "TWAP should complete")) {
        return false;
    }
    if (!Expect(std::fabs(done.executedQuantity - 0.01) < 1e-12, "All quantity should be executed")) {
        return false;
    }
    if (!Expect(done.averageExecutionPrice && std::fabs(*done.averageExecutionPrice - 45000.0) < 1e-9,
                "Average price should be 45000")) {
        return false;
    }
    const auto submitted = harness.fake.submitted();
    if (!Expect(submitted.size() == 10, "Expected 10 market orders")) {
        return false;
    }
    for (const auto& intent : submitted) {
        if (intent.kind != exchange::OrderKind::Market || intent.side != exchange::OrderSide::Buy) {
            return Expect(false, "Chunks without a limit must be market orders");
        }
    }
    return Expect(!harness.registry.isActive(plan.id), "Completed plan should be retired");
}

bool TestLimitChunks() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());
    auto request = FixedRequest(0.01, 4);
    request.priceLimit = 44000.0;

    const auto plan = engine.createTwap(request);
    harness.clock.advance(std::chrono::minutes(4));
    const auto done = engine.waitForCompletion(plan.id);

    const auto submitted = harness.fake.submitted();
    if (!Expect(submitted.size() == 2, "Expected 2 limit orders")) {
        return false;
    }
    for (const auto& intent : submitted) {
        if (intent.kind != exchange::OrderKind::Limit || !intent.price || *intent.price != 44000.0 ||
            intent.timeInForce != exchange::TimeInForce::Gtc) {
            return Expect(false, "Chunks with a limit must be GTC limit orders at the limit");
        }
    }
    if (!Expect(done.chunks[0].order.status == exchange::OrderStatus::Placed,
                "Resting limit chunk should be PLACED")) {
        return false;
    }
    return Expect(done.status == strategy::TwapStatus::Completed && done.averageExecutionPrice &&
                      *done.averageExecutionPrice == 44000.0,
                  "Limit chunks should be priced at the limit");
}

bool TestFailedChunkDoesNotStopPlan() {
    StrategyHarness harness;
    int submissions = 0;
    harness.fake.rejectSubmissions([&submissions](const exchange::OrderIntent&) { return ++submissions == 2; });
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.01, 30));
    harness.clock.advance(std::chrono::minutes(30));
    const auto done = engine.waitForCompletion(plan.id);

    if (!Expect(done.status == strategy::TwapStatus::Completed, "One failed chunk should not fail the plan")) {
        return false;
    }
    const auto& failed = done.chunks[1];
    if (!Expect(failed.status == strategy::TwapChunkStatus::Failed && failed.order.lastError,
                "Second chunk should be FAILED with an error")) {
        return false;
    }
    if (!Expect(std::fabs(done.executedQuantity - 0.009) < 1e-12, "Executed quantity should skip the failure")) {
        return false;
    }
    return Expect(harness.fake.submitted().size() == 10, "Every chunk should be attempted");
}

bool TestAllChunksFailing() {
    StrategyHarness harness;
    harness.fake.rejectSubmissions([](const exchange::OrderIntent&) { return true; });
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.01, 4));
    harness.clock.advance(std::chrono::minutes(4));
    const auto done = engine.waitForCompletion(plan.id);
    return Expect(done.status == strategy::TwapStatus::Failed && !done.averageExecutionPrice &&
                      done.executedQuantity == 0.0,
                  "A plan without executed chunks should be FAILED");
}

bool TestCancelStopsRemainingChunks() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.01, 30));
    if (!Expect(WaitForSleeper(harness.clock, 2), "Plan never waited for its second chunk")) {
        return false;
    }
    if (!Expect(engine.cancelTwap(plan.id), "Cancel should succeed for a running plan")) {
        return false;
    }
    const auto canceled = engine.snapshot(plan.id);
    if (!Expect(canceled && canceled->status == strategy::TwapStatus::Canceled, "Plan should be CANCELED")) {
        return false;
    }
    if (!Expect(canceled->chunks[0].status == strategy::TwapChunkStatus::Executed, "First chunk should be executed")) {
        return false;
    }
    for (std::size_t i = 1; i < canceled->chunks.size(); ++i) {
        if (canceled->chunks[i].status != strategy::TwapChunkStatus::Pending) {
            return Expect(false, "Chunks after the cancellation should stay PENDING");
        }
    }
    if (!Expect(harness.fake.submitted().size() == 1, "No order should follow the cancellation")) {
        return false;
    }
    return Expect(!engine.cancelTwap(plan.id), "Canceling twice should report false");
}

bool TestUnevenTotalIsAccepted() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());

    const auto plan = engine.createTwap(FixedRequest(0.016, 20));
    if (!Expect(plan.chunkCount == 10, "20 minutes should give 10 chunks")) {
        return false;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i + 1 < plan.chunks.size(); ++i) {
        if (std::fabs(plan.chunks[i].quantity - 0.001) > 1e-12) {
            return Expect(false, "Leading chunks should be 0.001");
        }
        sum += plan.chunks[i].quantity;
    }
    sum += plan.chunks.back().quantity;
    if (!Expect(std::fabs(plan.chunks.back().quantity - 0.007) < 1e-12, "Last chunk should carry the remainder")) {
        return false;
    }
    return Expect(std::fabs(sum - 0.016) < 1e-12, "Chunks should add up to 0.016");
}

bool TestRejectsUntradableChunks() {
    StrategyHarness harness;
    strategy::TwapEngine engine(harness.services());

    bool threw = false;
    try {
        engine.createTwap(FixedRequest(0.005, 30));
    } catch (const common::InvalidQuantity&) {
        threw = true;
    }
    if (!Expect(threw, "Chunks below the minimum quantity should be rejected")) {
        return false;
    }

    threw = false;
    try {
        engine.createTwap(FixedRequest(0.01, 0));
    } catch (const common::ValidationError&) {
        threw = true;
    }
    if (!Expect(threw, "Zero duration should be rejected")) {
        return false;
    }
    return Expect(harness.fake.submitted().empty(), "Nothing should be submitted for rejected plans");
}

}  // namespace

int main() {
    if (!TestChunkCount()) {
        return 1;
    }
    if (!TestSplitQuantityConservesTotal()) {
        return 1;
    }
    if (!TestPlanSchedule()) {
        return 1;
    }
    if (!TestJitterIsClamped()) {
        return 1;
    }
    if (!TestExecutesAllChunks()) {
        return 1;
    }
    if (!TestLimitChunks()) {
        return 1;
    }
    if (!TestFailedChunkDoesNotStopPlan()) {
        return 1;
    }
    if (!TestAllChunksFailing()) {
        return 1;
    }
    if (!TestCancelStopsRemainingChunks()) {
        return 1;
    }
    if (!TestUnevenTotalIsAccepted()) {
        return 1;
    }
    if (!TestRejectsUntradableChunks()) {
        return 1;
    }
    return 0;
}
