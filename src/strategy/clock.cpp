#include "strategy/clock.h"

namespace strategy {
namespace {
constexpr auto kManualClockRecheck = std::chrono::milliseconds(2);
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    condition_.notify_all();
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::waitUntil(MonotonicTime deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_until(lock, deadline, [this]() { return cancelled_; });
    return !cancelled_;
}

MonotonicTime SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

WallTime SteadyClock::wallNow() const {
    return std::chrono::system_clock::now();
}

bool SteadyClock::sleepUntil(MonotonicTime deadline, const CancellationToken& token) {
    return token.waitUntil(deadline);
}

ManualClock::ManualClock()
    : start_(std::chrono::steady_clock::now()),
      wallStart_(std::chrono::system_clock::now()),
      now_(start_) {}

MonotonicTime ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

WallTime ManualClock::wallNow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallStart_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(now_ - start_);
}

bool ManualClock::sleepUntil(MonotonicTime deadline, const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++sleepCalls_;
    ++sleepers_;
    while (now_ < deadline && !token.cancelled()) {
        condition_.wait_for(lock, kManualClockRecheck);
    }
    --sleepers_;
    return !token.cancelled();
}

void ManualClock::advance(Duration duration) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += duration;
    }
    condition_.notify_all();
}

std::size_t ManualClock::sleepers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleepers_;
}

std::size_t ManualClock::sleepCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleepCalls_;
}

}  // namespace strategy
