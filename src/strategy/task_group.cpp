#include "strategy/task_group.h"

#include <stdexcept>
#include <utility>

namespace strategy {
namespace {
class DoneFlag {
public:
    explicit DoneFlag(std::shared_ptr<std::atomic<bool>> done) : done_(std::move(done)) {}
    ~DoneFlag() { done_->store(true); }

    DoneFlag(const DoneFlag&) = delete;
    DoneFlag& operator=(const DoneFlag&) = delete;

private:
    std::shared_ptr<std::atomic<bool>> done_;
};
}  // namespace

TaskGroup::~TaskGroup() {
    joinAll();
}

void TaskGroup::reapFinishedLocked(std::vector<std::thread>& finished) {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.done->load()) {
            finished.push_back(std::move(it->second.worker));
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskGroup::launch(const StrategyId& id, std::function<void()> task) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reapFinishedLocked(finished);
        if (tasks_.find(id) != tasks_.end()) {
            throw std::invalid_argument("Task already running for strategy " + id);
        }
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([task = std::move(task), done]() {
            DoneFlag flag(done);
            task();
        });
        tasks_.emplace(id, Task{std::move(worker), std::move(done)});
    }

    for (auto& worker : finished) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool TaskGroup::join(const StrategyId& id) {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return false;
        }
        worker = std::move(it->second.worker);
        tasks_.erase(it);
    }
    if (worker.joinable()) {
        worker.join();
    }
    return true;
}

void TaskGroup::joinAll() {
    std::unordered_map<StrategyId, Task> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(tasks_);
    }

    for (auto& [id, task] : local) {
        (void)id;
        if (task.worker.joinable()) {
            task.worker.join();
        }
    }
}

std::vector<StrategyId> TaskGroup::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyId> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        (void)task;
        result.push_back(id);
    }
    return result;
}

std::size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, task] : tasks_) {
        (void)id;
        if (!task.done->load()) {
            ++count;
        }
    }
    return count;
}

}  // namespace strategy
