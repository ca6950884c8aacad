#pragma once

#include <atomic>
#include <chrono>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "interfaces.h"

namespace Cadence {

/**
 * IPeriodicTrigger backed by a dedicated thread. The thread sleeps on a
 * timed wait between ticks so Cancel() takes effect without waiting out
 * the interval.
 */
class ThreadTicker : public IPeriodicTrigger {
public:
    ThreadTicker() = default;
    ~ThreadTicker() override;

    ThreadTicker(const ThreadTicker&) = delete;
    ThreadTicker& operator=(const ThreadTicker&) = delete;

    void Start(std::chrono::milliseconds interval, TickCallback callback) override;
    void Cancel() override;
    bool IsRunning() const override;

    size_t TickCount() const { return ticks_.load(std::memory_order_relaxed); }

private:
    void TickLoop(std::chrono::milliseconds interval);
    bool IsStopped() const { return !running_; }

    mutable absl::Mutex mu_;
    bool running_ = false;
    TickCallback callback_;
    std::thread thread_;
    std::atomic<size_t> ticks_{0};
};

} // namespace Cadence
