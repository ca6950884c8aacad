#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <optional>

#include "absl/synchronization/mutex.h"
#include "../common/async_executor.h"
#include "job.h"
#include "sequencer_options.h"
#include "sequencer_state.h"

namespace Cadence {

/**
 * Runs jobs strictly in index order, one at a time. Once the job at the
 * cursor arrives, a drain task on the executor runs it and keeps going with
 * the next due job until the buffer has nothing due. No external driver is
 * needed.
 *
 * Default failure policy is kPropagate: the exception comes back through
 * the future returned by the AddJob() call that started the drain, and the
 * sequence waits on the failed index until a job for it is submitted again
 * or Reset() is called. While it waits, WaitAndReset() does not return.
 *
 * @code
 * SelfContinuingSequencer sequencer(options);
 * sequencer.AddJob({2, WriteChunk2});
 * sequencer.AddJob({0, WriteChunk0});   // starts 0, then nothing is due
 * sequencer.AddJob({1, WriteChunk1});   // drain picks up 1 and 2
 * sequencer.WaitAndReset();
 * @endcode
 */
class SelfContinuingSequencer {
public:
    // delay defaults to SleepFor
    explicit SelfContinuingSequencer(const SequencerOptions& options = SequencerOptions(),
                                     DelayFunc delay = nullptr);
    ~SelfContinuingSequencer();

    SelfContinuingSequencer(const SelfContinuingSequencer&) = delete;
    SelfContinuingSequencer& operator=(const SelfContinuingSequencer&) = delete;

    // Throws DuplicateIndexError. The returned future settles when the drain
    // started by this call ends; it is already ready if the call started
    // none (nothing due yet, or a drain is already running).
    std::future<void> AddJob(Job job);

    // Derives the index with GetNextIndex() when none is given. Two callers
    // deriving concurrently may collide and get DuplicateIndexError.
    Job CreateAndAdd(JobFunc fn,
                     std::optional<int64_t> index = std::nullopt,
                     std::future<void>* execution = nullptr);

    int64_t GetNextIndex() const { return state_.NextIndex(); }
    bool HasPendingJobs() const { return state_.HasPendingJobs(); }

    // Clears pending jobs and rewinds the cursor. A job already running
    // finishes normally but no longer moves the sequence.
    void Reset();
    void WaitAndReset();

    FailurePolicy failure_policy() const { return policy_; }
    int64_t CurrentIndex() const { return state_.CurrentIndex(); }
    uint64_t Generation() const { return state_.Generation(); }
    size_t PendingCount() const { return state_.PendingCount(); }

private:
    void DrainLoop(uint64_t generation);

    const SequencerOptions options_;
    const FailurePolicy policy_;
    const DelayFunc delay_;
    SequencerState state_;

    // Serializes admission against a drain deciding it has nothing left, so
    // an arriving due job is never stranded
    absl::Mutex drain_mu_;
    // Generation whose drain loop is currently running
    std::optional<uint64_t> active_drain_;

    // Declared last: its workers join before the state they touch goes away
    AsyncExecutor executor_;
};

} // namespace Cadence
