#include "sequencer_state.h"

#include <algorithm>
#include <glog/logging.h>

#include "sequencer_errors.h"

namespace Cadence {

SequencerState::SequencerState(int64_t initial_index)
    : initial_index_(initial_index), cursor_(initial_index) {}

void SequencerState::Admit(Job job) {
    const int64_t index = job.index;
    absl::MutexLock lock(&mu_);
    if (disposed_) {
        throw DisposedError();
    }
    if (pending_.contains(index) || executing_ == index) {
        throw DuplicateIndexError(index);
    }
    pending_.emplace(index, std::move(job));
    VLOG(3) << "Admitted job " << index << " (cursor " << cursor_
            << ", pending " << pending_.size() << ")";
}

std::optional<SequencerState::Ticket> SequencerState::TakeDue() {
    absl::MutexLock lock(&mu_);
    if (disposed_) return std::nullopt;

    auto it = pending_.find(cursor_);
    if (it == pending_.end()) return std::nullopt;

    if (executing_ == it->first) {
        throw ReentrantExecutionError(it->first);
    }
    if (executing_.has_value()) return std::nullopt;

    Ticket ticket{std::move(it->second), generation_};
    pending_.erase(it);
    executing_ = ticket.job.index;
    return ticket;
}

bool SequencerState::Settle(const Ticket& ticket, bool advance) {
    absl::MutexLock lock(&mu_);
    if (disposed_ || ticket.generation != generation_) {
        VLOG(2) << "Job " << ticket.job.index << " of generation " << ticket.generation
                << " settled after reset (current generation " << generation_ << ")";
        return false;
    }
    executing_.reset();
    if (advance) {
        ++cursor_;
    }
    drained_cv_.SignalAll();
    return true;
}

void SequencerState::Reset() {
    absl::MutexLock lock(&mu_);
    cursor_ = initial_index_;
    executing_.reset();
    pending_.clear();
    ++generation_;
    // A settlement from the old generation will never signal, release waiters now
    drained_cv_.SignalAll();
}

bool SequencerState::Dispose() {
    absl::MutexLock lock(&mu_);
    if (disposed_) return false;
    disposed_ = true;
    executing_.reset();
    pending_.clear();
    drained_cv_.SignalAll();
    return true;
}

void SequencerState::AwaitDrained(std::chrono::milliseconds poll_interval) const {
    const absl::Duration timeout = absl::FromChrono(poll_interval);
    absl::MutexLock lock(&mu_);
    while (!IsDrainedLocked()) {
        if (drained_cv_.WaitWithTimeout(&mu_, timeout)) {
            VLOG(3) << "Still draining: pending " << pending_.size()
                    << ", executing " << executing_.value_or(-1);
        }
    }
}

bool SequencerState::HasPendingJobs() const {
    absl::MutexLock lock(&mu_);
    return !pending_.empty() || executing_.has_value();
}

bool SequencerState::HasDueJob() const {
    absl::MutexLock lock(&mu_);
    return !disposed_ && !executing_.has_value() && pending_.contains(cursor_);
}

int64_t SequencerState::NextIndex() const {
    absl::MutexLock lock(&mu_);
    if (pending_.empty() && !executing_.has_value()) {
        return initial_index_;
    }
    // Numeric maximum, not arrival order: jobs come in out of order
    int64_t highest = pending_.empty() ? *executing_ : pending_.rbegin()->first;
    if (executing_.has_value()) {
        highest = std::max(highest, *executing_);
    }
    return highest + 1;
}

int64_t SequencerState::CurrentIndex() const {
    absl::MutexLock lock(&mu_);
    return cursor_;
}

uint64_t SequencerState::Generation() const {
    absl::MutexLock lock(&mu_);
    return generation_;
}

size_t SequencerState::PendingCount() const {
    absl::MutexLock lock(&mu_);
    return pending_.size();
}

std::optional<int64_t> SequencerState::ExecutingIndex() const {
    absl::MutexLock lock(&mu_);
    return executing_;
}

bool SequencerState::IsDisposed() const {
    absl::MutexLock lock(&mu_);
    return disposed_;
}

bool SequencerState::IsDrainedLocked() const {
    return disposed_ || (pending_.empty() && !executing_.has_value());
}

} // namespace Cadence
