#pragma once

#include <chrono>
#include <functional>

namespace Cadence {

/**
 * Interface for a cancelable periodic trigger driving the polling sequencer
 */
class IPeriodicTrigger {
public:
    using TickCallback = std::function<void()>;

    virtual ~IPeriodicTrigger() = default;

    // Fire callback every interval until Cancel()
    virtual void Start(std::chrono::milliseconds interval, TickCallback callback) = 0;
    // No tick starts after Cancel() returns. Safe to call more than once.
    virtual void Cancel() = 0;
    virtual bool IsRunning() const = 0;
};

} // namespace Cadence
