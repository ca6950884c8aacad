#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include "sequencer_options.h"

namespace Cadence {

using JobFunc = std::function<void()>;

/**
 * A unit of work tagged with its position in the sequence.
 * The job completes when fn returns and fails when fn throws.
 */
struct Job {
    int64_t index = 0;
    JobFunc fn;
};

// Runs the job body on the calling thread. Returns the exception it threw,
// or nullptr when it completed.
std::exception_ptr InvokeJob(const Job& job);

// Default DelayFunc: sleeps on the calling thread, returns at once for d <= 0
void SleepFor(std::chrono::milliseconds d);

// Human readable message for a captured job failure
std::string DescribeFailure(const std::exception_ptr& error);

// Logs a job failure at the severity its policy implies and forwards it to
// options.on_failure. The callback must not throw.
void ReportJobFailure(const SequencerOptions& options, FailurePolicy policy,
                      int64_t index, const std::exception_ptr& error);

} // namespace Cadence
