#include <gtest/gtest.h>
#include "../../src/sequencer/sequencer_state.h"
#include "../../src/sequencer/sequencer_errors.h"
#include <chrono>
#include <future>
#include <thread>

using namespace Cadence;
using namespace std::chrono_literals;

namespace {

Job NoopJob(int64_t index) {
    return Job{index, []() {}};
}

} // namespace

class SequencerStateTest : public ::testing::Test {
protected:
    SequencerState state_{0};
};

TEST_F(SequencerStateTest, NextIndexStartsAtInitialIndex) {
    SequencerState state(7);
    EXPECT_EQ(state.NextIndex(), 7);
    EXPECT_EQ(state.CurrentIndex(), 7);
    EXPECT_FALSE(state.HasPendingJobs());
}

TEST_F(SequencerStateTest, NextIndexUsesNumericMaximumNotArrivalOrder) {
    state_.Admit(NoopJob(5));
    state_.Admit(NoopJob(0));
    EXPECT_EQ(state_.NextIndex(), 6);
}

TEST_F(SequencerStateTest, NextIndexCountsExecutingIndex) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(state_.NextIndex(), 1);

    state_.Admit(NoopJob(3));
    EXPECT_EQ(state_.NextIndex(), 4);
}

TEST_F(SequencerStateTest, DuplicatePendingIndexRejected) {
    state_.Admit(NoopJob(2));
    try {
        state_.Admit(NoopJob(2));
        FAIL() << "Expected DuplicateIndexError";
    } catch (const DuplicateIndexError& e) {
        EXPECT_EQ(e.index(), 2);
    }
    EXPECT_EQ(state_.PendingCount(), 1u);
}

TEST_F(SequencerStateTest, DuplicateExecutingIndexRejected) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    EXPECT_THROW(state_.Admit(NoopJob(0)), DuplicateIndexError);
    EXPECT_EQ(state_.PendingCount(), 0u);
    EXPECT_EQ(state_.ExecutingIndex().value_or(-1), 0);
}

TEST_F(SequencerStateTest, TakeDueOnlyHandsOutCursorJob) {
    state_.Admit(NoopJob(1));
    EXPECT_FALSE(state_.HasDueJob());
    EXPECT_FALSE(state_.TakeDue().has_value());

    state_.Admit(NoopJob(0));
    EXPECT_TRUE(state_.HasDueJob());
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->job.index, 0);
    EXPECT_EQ(ticket->generation, 0u);
    EXPECT_EQ(state_.PendingCount(), 1u);
}

TEST_F(SequencerStateTest, ExecutingSlotHoldsOneJob) {
    state_.Admit(NoopJob(0));
    state_.Admit(NoopJob(1));
    auto first = state_.TakeDue();
    ASSERT_TRUE(first.has_value());

    // Cursor has not moved, and the slot is taken
    EXPECT_FALSE(state_.TakeDue().has_value());
    EXPECT_FALSE(state_.HasDueJob());

    ASSERT_TRUE(state_.Settle(*first, true));
    auto second = state_.TakeDue();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->job.index, 1);
}

TEST_F(SequencerStateTest, SettleAdvancesCursorByOne) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    EXPECT_TRUE(state_.Settle(*ticket, true));
    EXPECT_EQ(state_.CurrentIndex(), 1);
    EXPECT_FALSE(state_.HasPendingJobs());
}

TEST_F(SequencerStateTest, SettleWithoutAdvanceFreesIndexForResubmission) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    EXPECT_TRUE(state_.Settle(*ticket, false));
    EXPECT_EQ(state_.CurrentIndex(), 0);
    EXPECT_FALSE(state_.ExecutingIndex().has_value());

    EXPECT_NO_THROW(state_.Admit(NoopJob(0)));
    EXPECT_TRUE(state_.HasDueJob());
}

TEST_F(SequencerStateTest, StaleTicketIgnoredAfterReset) {
    state_.Admit(NoopJob(0));
    state_.Admit(NoopJob(1));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    state_.Reset();
    EXPECT_EQ(state_.Generation(), 1u);
    EXPECT_FALSE(state_.HasPendingJobs());
    EXPECT_EQ(state_.NextIndex(), 0);

    // Same index is accepted again right away
    EXPECT_NO_THROW(state_.Admit(NoopJob(0)));

    EXPECT_FALSE(state_.Settle(*ticket, true));
    EXPECT_EQ(state_.CurrentIndex(), 0);
    EXPECT_EQ(state_.PendingCount(), 1u);
}

TEST_F(SequencerStateTest, DisposeRejectsAdmissionAndDropsPending) {
    state_.Admit(NoopJob(3));
    EXPECT_TRUE(state_.Dispose());
    EXPECT_FALSE(state_.Dispose());

    EXPECT_TRUE(state_.IsDisposed());
    EXPECT_FALSE(state_.HasPendingJobs());
    EXPECT_THROW(state_.Admit(NoopJob(0)), DisposedError);
    EXPECT_FALSE(state_.TakeDue().has_value());
}

TEST_F(SequencerStateTest, SettleAfterDisposeIsIgnored) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    state_.Dispose();
    EXPECT_FALSE(state_.Settle(*ticket, true));
    EXPECT_EQ(state_.CurrentIndex(), 0);
}

TEST_F(SequencerStateTest, AwaitDrainedReturnsOnceExecutingJobSettles) {
    state_.Admit(NoopJob(0));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    auto waiter = std::async(std::launch::async, [this]() { state_.AwaitDrained(5ms); });
    EXPECT_EQ(waiter.wait_for(30ms), std::future_status::timeout);

    state_.Settle(*ticket, true);
    EXPECT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(state_.HasPendingJobs());
}

TEST_F(SequencerStateTest, AwaitDrainedReleasedByReset) {
    state_.Admit(NoopJob(0));
    state_.Admit(NoopJob(1));
    auto ticket = state_.TakeDue();
    ASSERT_TRUE(ticket.has_value());

    // Long poll interval: only the reset signal can wake the waiter in time
    auto waiter = std::async(std::launch::async, [this]() { state_.AwaitDrained(10s); });
    EXPECT_EQ(waiter.wait_for(30ms), std::future_status::timeout);

    state_.Reset();
    EXPECT_EQ(waiter.wait_for(2s), std::future_status::ready);
}
