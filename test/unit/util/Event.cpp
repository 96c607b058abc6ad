#include "util/Event.hpp"

#include "coro_test.hpp"

#include <gtest/gtest.h>

namespace
{

/**
 * Spawn a coroutine that waits for the event once, and counts the wakeup.
 */
void spawnWaiter(IOContext &ioc, const Event &event, int &wakeups)
{
    testCoSpawn([&event, &wakeups]() -> Awaitable<void> {
        co_await event.wait();
        wakeups++;
    }, ioc);
}

void spawnNotifier(IOContext &ioc, Event &event)
{
    testCoSpawn([&event]() -> Awaitable<void> {
        event.notifyAll();
        co_return;
    }, ioc);
}

/* Spawned coroutines start in the order they were spawned, so these tests control which side goes first. */

TEST(Event, NotifyWakesAllWaiters)
{
    IOContext ioc;
    Event event(ioc);
    int wakeups = 0;

    spawnWaiter(ioc, event, wakeups);
    spawnWaiter(ioc, event, wakeups);
    spawnWaiter(ioc, event, wakeups);
    spawnNotifier(ioc, event);

    ioc.poll();
    EXPECT_EQ(3, wakeups);
}

TEST(Event, NoNotify)
{
    IOContext ioc;
    Event event(ioc);
    int wakeups = 0;

    spawnWaiter(ioc, event, wakeups);

    ioc.poll();
    EXPECT_EQ(0, wakeups);
}

/* A notification with nobody waiting is not remembered. */
TEST(Event, NotifyBeforeWait)
{
    IOContext ioc;
    Event event(ioc);
    int wakeups = 0;

    spawnNotifier(ioc, event);
    spawnWaiter(ioc, event, wakeups);

    ioc.poll();
    EXPECT_EQ(0, wakeups);

    // The waiter is still there for the next one.
    event.notifyAll();
    ioc.poll();
    EXPECT_EQ(1, wakeups);
}

CORO_TEST(Event, WaitForTimesOut, ioc)
{
    Event event(ioc);
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    bool notified = co_await event.waitFor(std::chrono::milliseconds(20));
    EXPECT_FALSE(notified);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

CORO_TEST(Event, WaitForNotified, ioc)
{
    Event event(ioc);
    testCoSpawn([&event]() -> Awaitable<void> {
        co_await sleepFor(std::chrono::milliseconds(5));
        event.notifyAll();
    }, ioc);

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    EXPECT_TRUE(co_await event.waitFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

} // namespace
