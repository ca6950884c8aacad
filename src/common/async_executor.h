#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace Cadence {

/**
 * Raised through the future of a task submitted after Stop()
 */
class ExecutorStoppedError : public std::runtime_error {
public:
    ExecutorStoppedError() : std::runtime_error("AsyncExecutor is stopped") {}
};

/**
 * Fixed-size worker pool running job bodies and drain loops off the caller's
 * thread. Tasks start in submission order. A task's exception is delivered
 * through the future returned by Submit().
 */
class AsyncExecutor {
public:
    using Task = std::function<void()>;

    // Throws std::system_error if a worker cannot be started; the workers
    // already running are joined first.
    explicit AsyncExecutor(size_t num_threads = 2);
    ~AsyncExecutor();

    AsyncExecutor(const AsyncExecutor&) = delete;
    AsyncExecutor& operator=(const AsyncExecutor&) = delete;

    // Never throws for a stopped pool: the returned future holds
    // ExecutorStoppedError instead and the task is dropped.
    std::future<void> Submit(Task task);

    // Runs every queued task, then joins the workers. Idempotent.
    void Stop();

    size_t NumThreads() const { return workers_.size(); }
    size_t QueuedTasks() const;

private:
    void WorkerLoop();
    bool HasWorkOrStopping() const ABSL_SHARED_LOCKS_REQUIRED(mu_) { return stopping_ || !queue_.empty(); }

    mutable absl::Mutex mu_;
    std::deque<std::packaged_task<void()>> queue_ ABSL_GUARDED_BY(mu_);
    bool stopping_ ABSL_GUARDED_BY(mu_) = false;
    std::vector<std::thread> workers_;
};

} // namespace Cadence
