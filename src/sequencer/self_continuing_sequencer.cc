#include "self_continuing_sequencer.h"

#include <glog/logging.h>

#include "sequencer_errors.h"

namespace Cadence {

namespace {

std::future<void> MakeReadyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

} // namespace

SelfContinuingSequencer::SelfContinuingSequencer(const SequencerOptions& options, DelayFunc delay)
    : options_(options),
      policy_(options.failure_policy.value_or(FailurePolicy::kPropagate)),
      delay_(delay ? std::move(delay) : DelayFunc(SleepFor)),
      state_(options.initial_index),
      executor_(options.executor_threads) {
    VLOG(1) << "SelfContinuingSequencer created: initial index " << options_.initial_index
            << ", delay " << options_.delay.count() << "ms, failure policy "
            << FailurePolicyName(policy_);
}

SelfContinuingSequencer::~SelfContinuingSequencer() {
    // Retire any running drain, then let the executor finish the job in hand
    Reset();
    executor_.Stop();
}

std::future<void> SelfContinuingSequencer::AddJob(Job job) {
    absl::MutexLock lock(&drain_mu_);
    state_.Admit(std::move(job));

    const uint64_t generation = state_.Generation();
    if (active_drain_ == generation || !state_.HasDueJob()) {
        return MakeReadyFuture();
    }
    active_drain_ = generation;
    return executor_.Submit([this, generation]() { DrainLoop(generation); });
}

Job SelfContinuingSequencer::CreateAndAdd(JobFunc fn, std::optional<int64_t> index,
                                          std::future<void>* execution) {
    Job job{index.value_or(state_.NextIndex()), std::move(fn)};
    std::future<void> drain = AddJob(job);
    if (execution) {
        *execution = std::move(drain);
    }
    return job;
}

void SelfContinuingSequencer::Reset() {
    absl::MutexLock lock(&drain_mu_);
    state_.Reset();
    active_drain_.reset();
    VLOG(1) << "SelfContinuingSequencer reset, generation " << state_.Generation();
}

void SelfContinuingSequencer::WaitAndReset() {
    state_.AwaitDrained(options_.drain_poll_interval);
    Reset();
}

void SelfContinuingSequencer::DrainLoop(uint64_t generation) {
    while (true) {
        std::optional<SequencerState::Ticket> ticket;
        {
            absl::MutexLock lock(&drain_mu_);
            if (state_.Generation() != generation) {
                VLOG(2) << "Drain of generation " << generation << " retired by reset";
                return;
            }
            try {
                ticket = state_.TakeDue();
            } catch (const ReentrantExecutionError& e) {
                LOG(ERROR) << e.what();
                active_drain_.reset();
                throw;
            }
            if (!ticket) {
                active_drain_.reset();
                return;
            }
        }

        const int64_t index = ticket->job.index;
        VLOG(2) << "Running job " << index << " (generation " << generation << ")";
        std::exception_ptr error = InvokeJob(ticket->job);
        if (error) {
            ReportJobFailure(options_, policy_, index, error);
        }

        delay_(options_.delay);

        if (error && policy_ == FailurePolicy::kPropagate) {
            {
                absl::MutexLock lock(&drain_mu_);
                if (state_.Settle(*ticket, false) && active_drain_ == generation) {
                    active_drain_.reset();
                }
            }
            std::rethrow_exception(error);
        }

        if (!state_.Settle(*ticket, true)) {
            return;
        }
        VLOG(3) << "Job " << index << " settled, cursor " << state_.CurrentIndex();
    }
}

} // namespace Cadence
