#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "job.h"

namespace Cadence {

/**
 * SequencerState owns everything both engines share: the pending buffer,
 * the cursor, the executing slot and the generation counter.
 *
 * Every method takes the internal mutex, so each one is an atomic
 * check-and-update. Invariants:
 *  - an index lives in at most one of {pending, executing}
 *  - the executing slot holds at most one index
 *  - the cursor only moves forward between resets, one step per settled job
 *  - a Ticket from an older generation never mutates the current state
 */
class SequencerState {
public:
    // A due job handed out for execution, stamped with the generation that
    // was current when it started
    struct Ticket {
        Job job;
        uint64_t generation = 0;
    };

    explicit SequencerState(int64_t initial_index);

    SequencerState(const SequencerState&) = delete;
    SequencerState& operator=(const SequencerState&) = delete;

    // Throws DisposedError or DuplicateIndexError; the buffer is unchanged on failure
    void Admit(Job job);

    // Removes the job at the cursor and marks it executing. Returns nullopt
    // when nothing is due, the slot is occupied, or the state is disposed.
    // Throws ReentrantExecutionError if the due index is already executing.
    std::optional<Ticket> TakeDue();

    // Records that ticket's job finished. Returns false and changes nothing
    // if a reset or dispose happened since the ticket was taken; otherwise
    // frees the slot, moves the cursor when advance is set and wakes drain
    // waiters.
    bool Settle(const Ticket& ticket, bool advance);

    void Reset();
    // Returns false if already disposed
    bool Dispose();

    // Blocks until nothing is pending or executing (or the state is
    // disposed). poll_interval bounds each wait between re-checks.
    void AwaitDrained(std::chrono::milliseconds poll_interval) const;

    bool HasPendingJobs() const;
    bool HasDueJob() const;
    int64_t NextIndex() const;

    int64_t initial_index() const { return initial_index_; }
    int64_t CurrentIndex() const;
    uint64_t Generation() const;
    size_t PendingCount() const;
    std::optional<int64_t> ExecutingIndex() const;
    bool IsDisposed() const;

private:
    bool IsDrainedLocked() const;

    const int64_t initial_index_;

    mutable absl::Mutex mu_;
    mutable absl::CondVar drained_cv_;
    absl::btree_map<int64_t, Job> pending_;
    std::optional<int64_t> executing_;
    int64_t cursor_;
    uint64_t generation_ = 0;
    bool disposed_ = false;
};

} // namespace Cadence
