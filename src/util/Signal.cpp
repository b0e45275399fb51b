#include "Signal.hpp"

#include "asio.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>

/* Boost::asio has no primitive to await non-exceptionally on something that's notified from another coroutine, so a
   timer that never expires stands in for one: notifyAll() cancels it. See https://stackoverflow.com/a/17029022. */

/**
 * A timer object that waits (almost) indefinitely.
 */
struct Signal::Timer final
{
    explicit Timer(IOContext &ioc) : timer(ioc)
    {
        /* The std::chrono::years value is guaranteed to allow at least this. */
        timer.expires_after(std::chrono::years(40000));
    }

    boost::asio::steady_timer timer;
};

Signal::~Signal() = default;
Signal::Signal(IOContext &ioc) : ioc(ioc) {}

Awaitable<void> Signal::wait() const
{
    // A cancellation sent before the coroutine first waited on anything isn't delivered to the timer.
    co_await throwIfCancellationRequested();

    if (!timer) {
        timer = std::make_unique<Timer>(ioc);
    }

    // The use of boost::asio::as_tuple makes this return normally when notifyAll cancels the timer. Cancellation of
    // the waiting coroutine is reported the same way, so that has to be told apart afterwards.
    co_await timer->timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable));
    co_await throwIfCancellationRequested();
}

void Signal::notifyAll()
{
    if (!timer) {
        return;
    }
    timer->timer.cancel();
    timer.reset();
}
