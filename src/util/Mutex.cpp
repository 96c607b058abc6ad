#include "Mutex.hpp"

#include "util/asio.hpp"

#include <algorithm>

Awaitable<Mutex::LockGuard> Mutex::lockGuard()
{
    co_await lock();
    co_return LockGuard(*this);
}

Awaitable<void> Mutex::lock()
{
    if (tryLock()) {
        co_return;
    }

    /* Queue up, and wait until it's our turn and the lock is free. */
    uint64_t ticket = nextTicket++;
    waiters.push_back(ticket);
    try {
        while (locked || waiters.front() != ticket) {
            co_await event.wait();
        }
    }
    catch (...) {
        // Cancelled, so give up our place. The next waiter might be able to go now.
        waiters.erase(std::find(waiters.begin(), waiters.end(), ticket));
        event.notifyAll();
        throw;
    }
    waiters.pop_front();
    locked = true;
}
