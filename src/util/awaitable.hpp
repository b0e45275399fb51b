#pragma once

/// @addtogroup asio
/// @{

namespace boost::asio {
    class any_io_executor;
    template <typename T, typename Executor>
    class awaitable;
} // namespace boost::asio

/**
 * The return type of every coroutine.
 *
 * Declaring it here, against forward declarations, lets headers declare coroutines without pulling in boost::asio. Code
 * that defines or awaits coroutines includes util/asio.hpp.
 *
 * @tparam T What the coroutine returns.
 */
template <typename T>
using Awaitable = boost::asio::awaitable<T, boost::asio::any_io_executor>;

/// @}
