#pragma once

#include "Event.hpp"

#include <cstdint>
#include <deque>

/// @addtogroup asio
/// @{

/**
 * A mutex-like object for asynchronous IO.
 *
 * Waiters get the lock in the order they asked for it, and tryLock doesn't jump the queue.
 */
class Mutex final
{
public:
    /**
     * Like std::lock_guard, but for this mutex class.
     *
     * This exists because std::lock_guard can't be co_awaited in its construction.
     */
    class [[nodiscard]] LockGuard final
    {
    public:
        ~LockGuard()
        {
            if (parent) {
                parent->unlock();
            }
        }

        LockGuard(LockGuard &&other) : parent(other.parent)
        {
            other.parent = nullptr;
        }

    private:
        friend class Mutex;

        explicit LockGuard(Mutex &parent) : parent(&parent) {}

        // No copying.
        LockGuard(const LockGuard &) = delete;
        LockGuard &operator=(const LockGuard &) = delete;

        // Don't allow move *assignment* (where we might have a mutex to unlock too) either. Only move construction.
        LockGuard &operator=(LockGuard &&other) = delete;

        /**
         * The mutex to unlock when this object goes out of scope.
         */
        Mutex *parent;
    };

    explicit Mutex(IOContext &ioc) : event(ioc) {}

    /**
     * Lock the mutex, and get a RAII object that unlocks it when it goes out of scope.
     */
    Awaitable<LockGuard> lockGuard();

    /**
     * Lock the mutex.
     */
    Awaitable<void> lock();

    /**
     * Lock the mutex if it's free and nothing is waiting for it.
     *
     * @return True if the lock was taken, in which case the caller must unlock it.
     */
    bool tryLock()
    {
        if (locked || !waiters.empty()) {
            return false;
        }
        locked = true;
        return true;
    }

    /**
     * Get the number of coroutines waiting for the lock.
     */
    size_t getNumWaiters() const
    {
        return waiters.size();
    }

    /**
     * Determine whether the mutex is currently held by anything.
     */
    bool isLocked() const
    {
        return locked;
    }

    /**
     * Unlock the mutex.
     */
    void unlock()
    {
        locked = false;
        event.notifyAll();
    }

private:
    Event event;
    bool locked = false;

    /**
     * Tickets of the coroutines waiting for the lock, in the order they get it.
     */
    std::deque<uint64_t> waiters;
    uint64_t nextTicket = 0;
};

/// @}
