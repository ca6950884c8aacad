#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "../../src/sequencer/interfaces.h"

namespace Cadence {
namespace testing_util {

using namespace std::chrono_literals;

// Polls pred every millisecond until it holds or timeout expires
template<typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

// Thread-safe ordered log of executed indices
class OrderRecorder {
public:
    void Record(int64_t index) {
        std::lock_guard<std::mutex> lock(mu_);
        order_.push_back(index);
    }
    std::vector<int64_t> Snapshot() const {
        std::lock_guard<std::mutex> lock(mu_);
        return order_;
    }
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return order_.size();
    }

private:
    mutable std::mutex mu_;
    std::vector<int64_t> order_;
};

// Holds a job body until the test opens it
class Gate {
public:
    void Open() {
        std::call_once(opened_, [this]() { promise_.set_value(); });
    }
    void Wait() const { future_.wait(); }

private:
    std::promise<void> promise_;
    std::shared_future<void> future_{promise_.get_future()};
    std::once_flag opened_;
};

// Tracks how many job bodies run at the same time
class ConcurrencyProbe {
public:
    void Enter() {
        int now = ++current_;
        int seen = max_.load();
        while (now > seen && !max_.compare_exchange_weak(seen, now)) {
        }
    }
    void Exit() { --current_; }
    int max() const { return max_.load(); }

private:
    std::atomic<int> current_{0};
    std::atomic<int> max_{0};
};

// Trigger the test fires by hand, one tick per Fire() on the calling thread
class ManualTrigger : public IPeriodicTrigger {
public:
    void Start(std::chrono::milliseconds interval, TickCallback callback) override {
        std::lock_guard<std::mutex> lock(mu_);
        interval_ = interval;
        callback_ = std::move(callback);
        running_ = true;
    }

    void Cancel() override {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
        ++cancel_count_;
    }

    bool IsRunning() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return running_;
    }

    // No-op once cancelled
    void Fire(int ticks = 1) {
        for (int i = 0; i < ticks; ++i) {
            TickCallback callback;
            {
                std::lock_guard<std::mutex> lock(mu_);
                if (!running_) return;
                callback = callback_;
            }
            callback();
        }
    }

    std::chrono::milliseconds interval() const {
        std::lock_guard<std::mutex> lock(mu_);
        return interval_;
    }

    int cancel_count() const {
        std::lock_guard<std::mutex> lock(mu_);
        return cancel_count_;
    }

private:
    mutable std::mutex mu_;
    std::chrono::milliseconds interval_{0};
    TickCallback callback_;
    bool running_ = false;
    int cancel_count_ = 0;
};

} // namespace testing_util
} // namespace Cadence
