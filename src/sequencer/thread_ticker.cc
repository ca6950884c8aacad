#include "thread_ticker.h"

#include <stdexcept>
#include <glog/logging.h>

namespace Cadence {

ThreadTicker::~ThreadTicker() {
    Cancel();
}

void ThreadTicker::Start(std::chrono::milliseconds interval, TickCallback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Tick interval must be positive");
    }
    {
        absl::MutexLock lock(&mu_);
        if (running_ || thread_.joinable()) {
            throw std::logic_error("ThreadTicker already started");
        }
        running_ = true;
        callback_ = std::move(callback);
    }
    thread_ = std::thread(&ThreadTicker::TickLoop, this, interval);
    VLOG(1) << "[ThreadTicker] Started with interval " << interval.count() << "ms";
}

void ThreadTicker::Cancel() {
    {
        absl::MutexLock lock(&mu_);
        if (!running_ && !thread_.joinable()) return;
        running_ = false;
    }
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            // Cancelled from inside a tick; the loop exits once the callback returns
            thread_.detach();
        } else {
            thread_.join();
        }
    }
    VLOG(1) << "[ThreadTicker] Cancelled after " << TickCount() << " ticks";
}

bool ThreadTicker::IsRunning() const {
    absl::MutexLock lock(&mu_);
    return running_;
}

void ThreadTicker::TickLoop(std::chrono::milliseconds interval) {
    const absl::Duration timeout = absl::FromChrono(interval);
    while (true) {
        {
            absl::MutexLock lock(&mu_);
            mu_.AwaitWithTimeout(absl::Condition(this, &ThreadTicker::IsStopped), timeout);
            if (!running_) return;
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);
        callback_();
    }
}

} // namespace Cadence
