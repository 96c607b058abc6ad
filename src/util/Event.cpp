#include "Event.hpp"

#include "asio.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>

/**
 * A timer that, for practical purposes, never expires by itself. Cancelling it is how the waiters are woken.
 */
struct Event::Timer final
{
    explicit Timer(IOContext &ioc) : timer(ioc, std::chrono::hours(24 * 365 * 1000))
    {
    }

    boost::asio::steady_timer timer;
};

Event::~Event() = default;
Event::Event(IOContext &ioc) : ioc(ioc) {}

Awaitable<void> Event::wait() const
{
    if (!timer) {
        timer = std::make_unique<Timer>(ioc);
    }

    // Cancellation is the expected outcome, so it's returned rather than thrown.
    co_await timer->timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
}

Awaitable<bool> Event::waitFor(std::chrono::steady_clock::duration timeout) const
{
    auto result = co_await (wait() || sleepFor(timeout));
    co_return result.index() == 0;
}

void Event::notifyAll()
{
    if (timer) {
        timer->timer.cancel();
        timer.reset();
    }
}
