#include <gtest/gtest.h>
#include "../../src/common/async_executor.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Cadence;
using namespace std::chrono_literals;

TEST(AsyncExecutorTest, RunsSubmittedTasks) {
    AsyncExecutor executor(2);
    EXPECT_EQ(executor.NumThreads(), 2u);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(executor.Submit([&counter]() {
            std::this_thread::sleep_for(2ms);
            counter++;
        }));
    }

    for (auto& future : futures) {
        future.get();
    }
    EXPECT_EQ(counter, 10);
}

TEST(AsyncExecutorTest, SingleWorkerPreservesSubmissionOrder) {
    AsyncExecutor executor(1);
    std::vector<int> order;
    std::future<void> last;
    for (int i = 0; i < 5; ++i) {
        last = executor.Submit([&order, i]() { order.push_back(i); });
    }
    last.get();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(AsyncExecutorTest, ExceptionReachesFuture) {
    AsyncExecutor executor(1);
    auto failed = executor.Submit([]() { throw std::runtime_error("task failed"); });
    EXPECT_THROW(failed.get(), std::runtime_error);

    // Worker survives the throwing task
    std::atomic<bool> ran{false};
    executor.Submit([&ran]() { ran = true; }).get();
    EXPECT_TRUE(ran);
}

TEST(AsyncExecutorTest, StopRunsQueuedTasks) {
    AsyncExecutor executor(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 5; ++i) {
        executor.Submit([&ran]() {
            std::this_thread::sleep_for(1ms);
            ran++;
        });
    }

    executor.Stop();
    EXPECT_EQ(ran, 5);
    EXPECT_EQ(executor.QueuedTasks(), 0u);

    // Idempotent
    executor.Stop();
}

TEST(AsyncExecutorTest, SubmitAfterStopYieldsStoppedError) {
    AsyncExecutor executor(1);
    executor.Stop();

    std::atomic<bool> ran{false};
    std::future<void> rejected;
    EXPECT_NO_THROW(rejected = executor.Submit([&ran]() { ran = true; }));
    ASSERT_TRUE(rejected.valid());
    EXPECT_THROW(rejected.get(), ExecutorStoppedError);
    EXPECT_FALSE(ran);
}

TEST(AsyncExecutorTest, ZeroThreadsFallsBackToOne) {
    AsyncExecutor executor(0);
    EXPECT_EQ(executor.NumThreads(), 1u);
    std::atomic<bool> ran{false};
    executor.Submit([&ran]() { ran = true; }).get();
    EXPECT_TRUE(ran);
}
