#pragma once

#include "util/awaitable.hpp"

#include <chrono>
#include <memory>

class IOContext;

/// @addtogroup asio
/// @{

/**
 * Lets coroutines wait until another coroutine says something has changed.
 *
 * There's no state: a notification wakes whatever is waiting at the time, and nothing else. Waiters can also wake
 * without a notification, so they wait in a loop that checks whatever they're waiting for.
 */
class Event final
{
public:
    ~Event();
    explicit Event(IOContext &ioc);

    Event(Event &&) = default;

    /**
     * Wait for the next notifyAll.
     */
    Awaitable<void> wait() const;

    /**
     * Wait for the next notifyAll, for at most a given time.
     *
     * @return False if the time ran out.
     */
    Awaitable<bool> waitFor(std::chrono::steady_clock::duration timeout) const;

    /**
     * Wake everything that's currently waiting.
     */
    void notifyAll();

private:
    struct Timer;

    IOContext &ioc;

    /**
     * Shared by the current waiters, and replaced by notifyAll. Null when nothing has waited since the last one.
     */
    mutable std::unique_ptr<Timer> timer;
};

/// @}
