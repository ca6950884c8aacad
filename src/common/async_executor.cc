#include "async_executor.h"

#include <exception>
#include <system_error>
#include <glog/logging.h>

namespace Cadence {

AsyncExecutor::AsyncExecutor(size_t num_threads) {
    if (num_threads == 0) {
        LOG(WARNING) << "AsyncExecutor needs at least one worker, using 1";
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    try {
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&AsyncExecutor::WorkerLoop, this);
        }
    } catch (const std::system_error& e) {
        LOG(ERROR) << "AsyncExecutor could only start " << workers_.size() << " of "
                   << num_threads << " workers: " << e.what();
        // The destructor will not run for a half-built pool
        Stop();
        throw;
    }
    VLOG(1) << "AsyncExecutor started with " << num_threads << " workers";
}

AsyncExecutor::~AsyncExecutor() {
    Stop();
}

std::future<void> AsyncExecutor::Submit(Task task) {
    std::packaged_task<void()> packaged(std::move(task));
    std::future<void> future = packaged.get_future();

    absl::MutexLock lock(&mu_);
    if (stopping_) {
        LOG(WARNING) << "Task submitted to a stopped AsyncExecutor was dropped";
        std::promise<void> rejected;
        rejected.set_exception(std::make_exception_ptr(ExecutorStoppedError()));
        return rejected.get_future();
    }
    queue_.push_back(std::move(packaged));
    return future;
}

void AsyncExecutor::Stop() {
    {
        absl::MutexLock lock(&mu_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t AsyncExecutor::QueuedTasks() const {
    absl::MutexLock lock(&mu_);
    return queue_.size();
}

void AsyncExecutor::WorkerLoop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            absl::MutexLock lock(&mu_);
            mu_.Await(absl::Condition(this, &AsyncExecutor::HasWorkOrStopping));
            // Queued tasks still run after Stop(); exit once the queue is empty
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace Cadence
