#include "asio.hpp"

#include "log/Log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

void spawnDetached(IOContext &ioc, Log::Context &log, std::function<Awaitable<void>()> fn, Log::Level level)
{
    spawnDetached(ioc, [fn = std::move(fn), &log, level]() mutable -> Awaitable<void> {
        try {
            co_await fn();
        }
        catch (const std::exception &e) {
            log << "exception" << level << e.what();
        }
    });
}

Awaitable<void> sleepFor(std::chrono::steady_clock::duration duration)
{
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(duration);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

Awaitable<void> awaitTree(std::span<Awaitable<void>> awaitables)
{
    if (awaitables.empty()) {}
    else if (awaitables.size() == 1) {
        co_await std::move(awaitables[0]);
    }
    else {
        co_await (awaitTree(awaitables.subspan(0, awaitables.size() / 2)) &&
                  awaitTree(awaitables.subspan(awaitables.size() / 2)));
    }
}

bool isCancellation(const std::exception &e)
{
    const auto *systemError = dynamic_cast<const boost::system::system_error *>(&e);
    return systemError && systemError->code() == boost::asio::error::operation_aborted;
}
