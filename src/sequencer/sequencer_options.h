#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>

#include "../common/config.h"

namespace Cadence {

/**
 * What a sequencer does when a job body throws.
 *
 * kPropagate: the cursor stays on the failed index and the failure is
 *   surfaced to the call that triggered execution (self-continuing engine).
 *   The sequence resumes once a job for that index is submitted again, or
 *   after a reset.
 * kSwallowAndAdvance: the failure is logged and the cursor moves on, so one
 *   bad job cannot stall the sequence.
 */
enum class FailurePolicy {
    kPropagate,
    kSwallowAndAdvance
};

inline const char* FailurePolicyName(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::kPropagate:
            return "propagate";
        case FailurePolicy::kSwallowAndAdvance:
            return "swallow";
    }
    return "unknown";
}

inline std::optional<FailurePolicy> ParseFailurePolicy(const std::string& value) {
    if (value == "propagate") return FailurePolicy::kPropagate;
    if (value == "swallow" || value == "swallow_and_advance") return FailurePolicy::kSwallowAndAdvance;
    return std::nullopt;
}

// Pause applied after each job. Tests inject one that records instead of sleeping.
using DelayFunc = std::function<void(std::chrono::milliseconds)>;

// Called for every failed job regardless of policy
using FailureCallback = std::function<void(int64_t index, std::exception_ptr error)>;

struct SequencerOptions {
    // Index of the first job to run. A job with this index must arrive or
    // nothing ever runs.
    int64_t initial_index = 0;
    std::chrono::milliseconds delay{sequencer_default_delay_ms};
    // Polling engine only
    std::chrono::milliseconds tick_interval{sequencer_default_tick_interval_ms};
    std::chrono::milliseconds drain_poll_interval{sequencer_default_drain_poll_ms};
    size_t executor_threads = sequencer_default_executor_threads;
    // Unset means the engine default
    std::optional<FailurePolicy> failure_policy;
    FailureCallback on_failure;
};

} // namespace Cadence
