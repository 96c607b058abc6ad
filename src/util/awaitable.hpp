#pragma once

/// @addtogroup asio
/// @{

namespace boost::asio {
    class any_io_executor;
    template <typename T, typename Executor>
    class awaitable;
} // namespace boost::asio

/**
 * The return type of every coroutine in the server.
 *
 * Declared here without the asio headers, so that headers declaring coroutines (the fetch, cache and backend
 * interfaces) stay cheap to include. Code that co_awaits one needs util/asio.hpp.
 *
 * @tparam T The coroutine's result type.
 */
template <typename T>
using Awaitable = boost::asio::awaitable<T, boost::asio::any_io_executor>;

/// @}
