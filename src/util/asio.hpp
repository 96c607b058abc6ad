#pragma once

#include "log/Level.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "awaitable.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <span>

/* For co_await (a && b) and co_await (a || b), which run a and b concurrently. */
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wheader-hygiene"
using namespace boost::asio::experimental::awaitable_operators;
#pragma clang diagnostic pop

namespace Log
{

class Context;

} // namespace Log

/**
 * @defgroup asio Asynchronous IO
 *
 * The coroutine plumbing everything else is built on, over boost::asio.
 *
 * @see Awaitable.
 */

/// @addtogroup asio
/// @{

/**
 * The io_context the server runs on.
 *
 * Being a class of our own, it can be forward declared by headers that only pass it around.
 */
class IOContext final : public boost::asio::io_context
{
public:
    using boost::asio::io_context::io_context;
};

/**
 * Start a coroutine that nothing waits for.
 *
 * @param fn Returns the coroutine. An exception that escapes it is lost, so it should handle its own.
 */
template<typename F>
void spawnDetached(IOContext &ioc, F&& fn)
{
    boost::asio::co_spawn((boost::asio::io_context &)ioc, std::forward<F>(fn), boost::asio::detached);
}

/**
 * Start a coroutine that nothing waits for, logging any exception that escapes it.
 *
 * @param log Where the exception goes, as an "exception" item.
 * @param level The level to log the exception at.
 */
void spawnDetached(IOContext &ioc, Log::Context &log, std::function<Awaitable<void>()> fn,
                   Log::Level level = Log::Level::error);

/**
 * Suspend the calling coroutine for a while.
 *
 * @param duration How long to sleep for. Cancellation of the calling coroutine ends the sleep early by throwing.
 */
Awaitable<void> sleepFor(std::chrono::steady_clock::duration duration);

/**
 * Wait for all of a set of void awaitables of unknown length in parallel.
 *
 * Use && to wait for a fixed number of awaitables.
 */
Awaitable<void> awaitTree(std::span<Awaitable<void>> awaitables);

/**
 * Determine whether an exception is just the calling coroutine being cancelled.
 *
 * Code that logs and carries on after an error should still let these propagate.
 */
bool isCancellation(const std::exception &e);

/// @}
