#pragma once

#include <memory>
#include "util/awaitable.hpp"

class IOContext;

/// @addtogroup asio
/// @{

/**
 * Wakes every coroutine that's waiting on it.
 *
 * This carries no state of its own: a coroutine that starts waiting after a notifyAll() waits for the next one. The
 * stateful primitives (Event, Log::Log::wait()) are built by looping on a condition around wait().
 */
class Signal final
{
public:
    ~Signal();
    explicit Signal(IOContext &ioc);

    Signal(Signal &&) = default;

    /**
     * Wait for the signal to be notified.
     *
     * Spurious wakeups are permitted.
     *
     * @throws boost::system::system_error With boost::asio::error::operation_aborted if the waiting coroutine is
     *                                      cancelled, including when it was cancelled before calling this.
     */
    Awaitable<void> wait() const;

    /**
     * Wake everything that's waiting on this signal.
     */
    void notifyAll();

    /**
     * Find out whether anything might be waiting.
     */
    bool hasWaiters() const
    {
        return (bool)timer;
    }

private:
    struct Timer;

    IOContext &ioc;
    mutable std::unique_ptr<Timer> timer;
};

/// @}
