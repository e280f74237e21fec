#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "strategy/types.h"

namespace strategy {

// Per-strategy stop signal shared by the registry entry and the strategy task.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const;

    // Blocks until |deadline| passes on the steady clock or cancel() is called.
    // Returns false when woken by cancellation.
    bool waitUntil(MonotonicTime deadline) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
    bool cancelled_{false};
};

class Clock {
public:
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual MonotonicTime now() const = 0;
    virtual WallTime wallNow() const = 0;

    // Suspends the calling task until |deadline|. Returns false if |token| was
    // cancelled first; returns true immediately when the deadline has passed.
    virtual bool sleepUntil(MonotonicTime deadline, const CancellationToken& token) = 0;

    bool sleepFor(Duration duration, const CancellationToken& token) {
        return sleepUntil(now() + duration, token);
    }
};

class SteadyClock : public Clock {
public:
    MonotonicTime now() const override;
    WallTime wallNow() const override;
    bool sleepUntil(MonotonicTime deadline, const CancellationToken& token) override;
};

// Time only moves when advance() is called. Sleeping tasks re-check their
// deadline and cancellation every couple of milliseconds.
class ManualClock : public Clock {
public:
    ManualClock();

    MonotonicTime now() const override;
    WallTime wallNow() const override;
    bool sleepUntil(MonotonicTime deadline, const CancellationToken& token) override;

    void advance(Duration duration);

    // Number of tasks currently blocked in sleepUntil().
    std::size_t sleepers() const;
    // Total sleepUntil() calls so far, including ones that returned at once.
    std::size_t sleepCalls() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    MonotonicTime start_;
    WallTime wallStart_;
    MonotonicTime now_;
    std::size_t sleepers_{0};
    std::size_t sleepCalls_{0};
};

}  // namespace strategy
