#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Cadence {

/**
 * Base class for errors raised by the sequencers
 */
class SequencerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * The index is already pending or executing. The buffer is left unchanged;
 * the caller must pick another index or wait for the current one to settle.
 */
class DuplicateIndexError : public SequencerError {
public:
    explicit DuplicateIndexError(int64_t index)
        : SequencerError("Index for job already exists: " + std::to_string(index)),
          index_(index) {}

    int64_t index() const { return index_; }

private:
    int64_t index_;
};

/**
 * Admission after the sequencer was disposed. The instance cannot be reused.
 */
class DisposedError : public SequencerError {
public:
    DisposedError() : SequencerError("Cannot add job to disposed sequencer") {}
};

/**
 * A due index was already marked executing. Single-flight bookkeeping is
 * broken; this is a programming error, not a recoverable condition.
 */
class ReentrantExecutionError : public SequencerError {
public:
    explicit ReentrantExecutionError(int64_t index)
        : SequencerError("Tried to execute job with index already in execution (" +
                         std::to_string(index) + ")"),
          index_(index) {}

    int64_t index() const { return index_; }

private:
    int64_t index_;
};

} // namespace Cadence
