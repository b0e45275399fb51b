#include "coro_test.hpp"

#include <boost/asio/co_spawn.hpp>

void testCoSpawn(std::function<Awaitable<void>()> fn, IOContext &ioc)
{
    // The function is kept in the coroutine frame, so lambda captures outlive the coroutine that uses them.
    auto run = [](std::function<Awaitable<void>()> fn) -> Awaitable<void> {
        co_await fn();
    };
    boost::asio::co_spawn((boost::asio::io_context &)ioc, run(std::move(fn)), [](std::exception_ptr e) {
        if (e) {
            ADD_FAILURE() << "Coroutine exited with an exception: " << describeException(e);
        }
    });
}
