#pragma once

#include "util/asio.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>

#include <type_traits>

namespace Util
{

/**
 * A fixed set of threads to run blocking calls on.
 *
 * Everything else runs on the single IOContext thread, so anything that could stall it (walking a directory, renaming
 * a large file on a slow disk) gets sent here instead.
 */
class BlockingPool final
{
public:
    /**
     * Wait for outstanding work and stop the threads.
     */
    ~BlockingPool();

    /**
     * @param threads The number of threads. Must be at least 1.
     */
    explicit BlockingPool(size_t threads);

    /**
     * Run a blocking function on one of the pool's threads.
     *
     * The calling coroutine resumes on its own executor once the function has returned. Exceptions thrown by the
     * function are rethrown to the caller.
     *
     * @param fn The function to run. It must not touch state that's only safe to use from the IOContext thread.
     * @return Whatever fn returned.
     */
    template <typename F>
    Awaitable<std::invoke_result_t<F>> run(F fn)
    {
        using Result = std::invoke_result_t<F>;
        co_return co_await boost::asio::co_spawn(pool.get_executor(),
                                                 [fn = std::move(fn)]() mutable -> Awaitable<Result> {
            co_return fn();
        }, boost::asio::use_awaitable);
    }

private:
    boost::asio::thread_pool pool;
};

} // namespace Util
