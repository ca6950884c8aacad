#pragma once

#include <memory>
#include <optional>

#include "../common/async_executor.h"
#include "interfaces.h"
#include "job.h"
#include "sequencer_options.h"
#include "sequencer_state.h"

namespace Cadence {

/**
 * Runs jobs strictly in index order, one at a time, driven by a periodic
 * trigger. Each tick starts the job at the cursor if it has arrived and
 * nothing is executing; the job then runs on the executor, decoupled from
 * the tick that launched it.
 *
 * Default failure policy is kSwallowAndAdvance: a throwing job is logged and
 * the sequence moves on. Admission never reports job failures; use
 * SequencerOptions::on_failure or record outcomes inside the job body.
 */
class PollingSequencer {
public:
    // trigger defaults to a ThreadTicker firing every options.tick_interval,
    // delay to SleepFor
    explicit PollingSequencer(const SequencerOptions& options = SequencerOptions(),
                              std::unique_ptr<IPeriodicTrigger> trigger = nullptr,
                              DelayFunc delay = nullptr);
    ~PollingSequencer();

    PollingSequencer(const PollingSequencer&) = delete;
    PollingSequencer& operator=(const PollingSequencer&) = delete;

    // Throws DuplicateIndexError or DisposedError. The job is picked up by a
    // later tick when its turn comes.
    void AddJob(Job job);

    // Derives the index with GetNextIndex() when none is given
    Job CreateAndAdd(JobFunc fn, std::optional<int64_t> index = std::nullopt);

    int64_t GetNextIndex() const { return state_.NextIndex(); }
    bool HasPendingJobs() const { return state_.HasPendingJobs(); }

    // Clears pending jobs, rewinds the cursor and detaches the running job
    void Reset();
    void WaitAndReset();

    // Permanent: cancels the trigger, drops pending jobs, rejects new ones
    void Dispose();
    void WaitAndDispose();

    FailurePolicy failure_policy() const { return policy_; }
    bool IsDisposed() const { return state_.IsDisposed(); }
    int64_t CurrentIndex() const { return state_.CurrentIndex(); }
    uint64_t Generation() const { return state_.Generation(); }
    size_t PendingCount() const { return state_.PendingCount(); }

private:
    void OnTick();
    void ExecuteTicket(const SequencerState::Ticket& ticket);

    const SequencerOptions options_;
    const FailurePolicy policy_;
    const DelayFunc delay_;
    SequencerState state_;
    std::unique_ptr<IPeriodicTrigger> trigger_;

    // Declared last: its workers join before the state they touch goes away
    AsyncExecutor executor_;
};

} // namespace Cadence
