#include "strategy/registry.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace strategy {

StrategyRegistry::StrategyRegistry(std::size_t historyLimit) : historyLimit_(historyLimit) {}

StrategyId StrategyRegistry::nextId(const std::string& prefix) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    const auto sequence = ++sequence_;
    return prefix + "_" + std::to_string(seconds) + "_" + std::to_string(sequence);
}

std::shared_ptr<CancellationToken> StrategyRegistry::add(const StrategyId& id, StrategySnapshot snapshot) {
    auto token = std::make_shared<CancellationToken>();
    auto record = std::make_shared<const StrategySnapshot>(std::move(snapshot));

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.find(id) != active_.end()) {
        throw std::invalid_argument("Strategy already registered: " + id);
    }
    active_.emplace(id, Entry{std::move(record), token});
    return token;
}

bool StrategyRegistry::publish(const StrategyId& id, StrategySnapshot snapshot) {
    auto record = std::make_shared<const StrategySnapshot>(std::move(snapshot));

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = active_.find(id);
    if (it == active_.end()) {
        return false;
    }
    it->second.snapshot = std::move(record);
    return true;
}

void StrategyRegistry::retire(const StrategyId& id, StrategySnapshot snapshot) {
    auto record = std::make_shared<const StrategySnapshot>(std::move(snapshot));

    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(id);

    if (history_.find(id) == history_.end()) {
        historyOrder_.push_back(id);
    }
    history_[id] = std::move(record);

    while (historyOrder_.size() > historyLimit_) {
        history_.erase(historyOrder_.front());
        historyOrder_.pop_front();
    }
}

bool StrategyRegistry::remove(const StrategyId& id) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = active_.find(id);
        if (it == active_.end()) {
            return false;
        }
        token = it->second.cancellation;
        active_.erase(it);
    }
    if (token) {
        token->cancel();
    }
    return true;
}

std::shared_ptr<const StrategySnapshot> StrategyRegistry::find(const StrategyId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto active = active_.find(id);
    if (active != active_.end()) {
        return active->second.snapshot;
    }
    const auto finished = history_.find(id);
    if (finished != history_.end()) {
        return finished->second;
    }
    return nullptr;
}

bool StrategyRegistry::isActive(const StrategyId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.find(id) != active_.end();
}

std::vector<StrategyId> StrategyRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyId> ids;
    ids.reserve(active_.size());
    for (const auto& [id, entry] : active_) {
        (void)entry;
        ids.push_back(id);
    }
    return ids;
}

std::size_t StrategyRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

}  // namespace strategy
