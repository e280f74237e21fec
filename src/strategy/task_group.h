#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "strategy/types.h"

namespace strategy {

// Owns the background thread of every strategy an engine started. Threads of
// tasks that already returned are joined and dropped on the next launch().
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void launch(const StrategyId& id, std::function<void()> task);

    // Waits for the task of |id|. Returns false if no such task is tracked.
    bool join(const StrategyId& id);
    void joinAll();

    // Ids of tracked tasks, finished but not yet reaped ones included.
    std::vector<StrategyId> ids() const;
    // Tasks that have not returned yet.
    std::size_t running() const;

private:
    struct Task {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked(std::vector<std::thread>& finished);

    mutable std::mutex mutex_;
    std::unordered_map<StrategyId, Task> tasks_;
};

}  // namespace strategy
