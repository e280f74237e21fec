#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "strategy/clock.h"
#include "strategy/types.h"

namespace strategy {

using StrategySnapshot = std::variant<GridStrategy, TwapPlan, OcoPair>;

// Process-wide table of running strategies. Each record is an immutable
// snapshot: writers publish a whole new record, readers keep whatever
// snapshot they fetched, so nobody observes a half-updated strategy.
//
// Lifecycle: add() on start, publish() by the owning task, retire() on a
// terminal status (the final record moves to a bounded history), remove() to
// stop a strategy from outside (signals its cancellation token).
class StrategyRegistry {
public:
    explicit StrategyRegistry(std::size_t historyLimit = 64);

    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    // "<prefix>_<unix seconds>_<sequence>", unique within the process.
    StrategyId nextId(const std::string& prefix);

    // Registers a new active strategy and returns its cancellation token.
    // Throws std::invalid_argument if |id| is already active.
    std::shared_ptr<CancellationToken> add(const StrategyId& id, StrategySnapshot snapshot);

    // Atomically replaces the record of an active strategy. Returns false when
    // the strategy is no longer active.
    bool publish(const StrategyId& id, StrategySnapshot snapshot);

    // Moves the strategy to history with its final record.
    void retire(const StrategyId& id, StrategySnapshot snapshot);

    // Removes an active strategy and cancels its task. Returns false when the
    // strategy was not active.
    bool remove(const StrategyId& id);

    // Active record first, then history; nullptr when unknown.
    std::shared_ptr<const StrategySnapshot> find(const StrategyId& id) const;

    template <typename T>
    std::shared_ptr<const T> get(const StrategyId& id) const {
        auto snapshot = find(id);
        if (!snapshot) {
            return nullptr;
        }
        const T* value = std::get_if<T>(snapshot.get());
        if (value == nullptr) {
            return nullptr;
        }
        return std::shared_ptr<const T>(snapshot, value);
    }

    bool isActive(const StrategyId& id) const;
    std::vector<StrategyId> activeIds() const;
    std::size_t activeCount() const;

private:
    struct Entry {
        std::shared_ptr<const StrategySnapshot> snapshot;
        std::shared_ptr<CancellationToken> cancellation;
    };

    mutable std::mutex mutex_;
    std::unordered_map<StrategyId, Entry> active_;
    std::unordered_map<StrategyId, std::shared_ptr<const StrategySnapshot>> history_;
    std::deque<StrategyId> historyOrder_;
    std::size_t historyLimit_;
    std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace strategy
