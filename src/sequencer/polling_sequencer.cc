#include "polling_sequencer.h"

#include <glog/logging.h>

#include "sequencer_errors.h"
#include "thread_ticker.h"

namespace Cadence {

PollingSequencer::PollingSequencer(const SequencerOptions& options,
                                   std::unique_ptr<IPeriodicTrigger> trigger,
                                   DelayFunc delay)
    : options_(options),
      policy_(options.failure_policy.value_or(FailurePolicy::kSwallowAndAdvance)),
      delay_(delay ? std::move(delay) : DelayFunc(SleepFor)),
      state_(options.initial_index),
      trigger_(std::move(trigger)),
      executor_(options.executor_threads) {
    if (!trigger_) {
        trigger_ = std::make_unique<ThreadTicker>();
    }
    trigger_->Start(options_.tick_interval, [this]() { OnTick(); });
    VLOG(1) << "PollingSequencer created: initial index " << options_.initial_index
            << ", delay " << options_.delay.count() << "ms, tick "
            << options_.tick_interval.count() << "ms, failure policy "
            << FailurePolicyName(policy_);
}

PollingSequencer::~PollingSequencer() {
    Dispose();
    executor_.Stop();
}

void PollingSequencer::AddJob(Job job) {
    state_.Admit(std::move(job));
}

Job PollingSequencer::CreateAndAdd(JobFunc fn, std::optional<int64_t> index) {
    Job job{index.value_or(state_.NextIndex()), std::move(fn)};
    AddJob(job);
    return job;
}

void PollingSequencer::Reset() {
    state_.Reset();
    VLOG(1) << "PollingSequencer reset, generation " << state_.Generation();
}

void PollingSequencer::WaitAndReset() {
    state_.AwaitDrained(options_.drain_poll_interval);
    Reset();
}

void PollingSequencer::Dispose() {
    if (!state_.Dispose()) {
        return;
    }
    trigger_->Cancel();
    LOG(INFO) << "PollingSequencer disposed at index " << state_.CurrentIndex();
}

void PollingSequencer::WaitAndDispose() {
    state_.AwaitDrained(options_.drain_poll_interval);
    Dispose();
}

void PollingSequencer::OnTick() {
    std::optional<SequencerState::Ticket> ticket;
    try {
        ticket = state_.TakeDue();
    } catch (const ReentrantExecutionError& e) {
        LOG(FATAL) << e.what();
    }
    if (!ticket) {
        return;
    }

    VLOG(2) << "Tick starting job " << ticket->job.index
            << " (generation " << ticket->generation << ")";
    executor_.Submit([this, ticket = std::move(*ticket)]() { ExecuteTicket(ticket); });
}

void PollingSequencer::ExecuteTicket(const SequencerState::Ticket& ticket) {
    std::exception_ptr error = InvokeJob(ticket.job);
    if (error) {
        ReportJobFailure(options_, policy_, ticket.job.index, error);
    }

    delay_(options_.delay);

    const bool advance = !error || policy_ == FailurePolicy::kSwallowAndAdvance;
    if (state_.Settle(ticket, advance)) {
        VLOG(3) << "Job " << ticket.job.index << " settled, cursor " << state_.CurrentIndex();
    }
}

} // namespace Cadence
