#pragma once

#include <cstddef>
#include <cstdint>

/// Sequencer timing defaults
/// Pause applied after every job before the next one may start
const int64_t sequencer_default_delay_ms = 50;
/// How often the polling sequencer checks for a due job
const int64_t sequencer_default_tick_interval_ms = 5;
/// How often drain waiters re-check when no state change woke them
const int64_t sequencer_default_drain_poll_ms = 10;
/// Worker threads running job bodies. Two lets a job admitted after a reset
/// start while the detached job of the previous generation is still running.
const size_t sequencer_default_executor_threads = 2;
/// Upper bound accepted from configuration
const int sequencer_max_executor_threads = 256;
