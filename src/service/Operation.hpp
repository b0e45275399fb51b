#pragma once

#include "Result.hpp"
#include "util/asio.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

/// @addtogroup service
/// @{

namespace Service
{

/**
 * The handle of an asynchronous operation started by a Service or a TaskPool.
 *
 * Each handle belongs to exactly one coroutine. It knows how the coroutine ended (once it has), and it's how the
 * coroutine is cancelled.
 */
class Operation final : public std::enable_shared_from_this<Operation>
{
public:
    /**
     * Operation state.
     *
     * Everything but running is terminal.
     */
    enum class State
    {
        running,
        succeeded,
        failed,
        cancelled
    };

    /**
     * Called once, when the operation reaches a terminal state.
     */
    using DoneFn = std::function<void (const std::shared_ptr<Operation> &)>;

    ~Operation();

    /**
     * Create a handle. Nothing runs until start().
     *
     * @param id A number that identifies the operation among those of its owner.
     * @param name What the operation is, for diagnostics.
     */
    Operation(uint64_t id, std::string_view name);

    // No copying or moving.
    Operation(const Operation &) = delete;
    Operation(Operation &&) = delete;
    Operation &operator=(const Operation &) = delete;
    Operation &operator=(Operation &&) = delete;

    /**
     * Run the coroutine on the IOContext.
     *
     * The coroutine doesn't begin until the IOContext gets to it, so onDone never runs before this returns.
     *
     * @param awaitable The coroutine. If it returns a value, the value must be default constructible and copyable.
     * @param onDone Called when the coroutine ends. The operation's state, error and result are set by then.
     */
    template <typename T>
    void start(IOContext &ioc, Awaitable<T> awaitable, DoneFn onDone)
    {
        auto handler = [self = shared_from_this(), onDone = std::move(onDone)]
                       (std::exception_ptr e, auto... value) mutable {
            if constexpr (sizeof...(value) == 0) {
                self->finish(std::move(e), Result());
            }
            else {
                self->finish(e, e ? Result() : Result::of(std::move(value)...));
            }
            onDone(self);
        };
        boost::asio::co_spawn((boost::asio::io_context &)ioc, std::move(awaitable),
                              boost::asio::bind_cancellation_slot(signal.slot(), std::move(handler)));
    }

    /**
     * Ask the coroutine to stop.
     *
     * Cancellation is cooperative: the coroutine's current (or next) asynchronous wait fails with
     * boost::asio::error::operation_aborted. Does nothing if the operation is already done or already asked to stop.
     */
    void cancel();

    uint64_t getId() const
    {
        return id;
    }

    const std::string &getName() const
    {
        return name;
    }

    /**
     * Get "name#id", which is how the operation is identified in the log.
     */
    std::string getIdentity() const;

    State getState() const
    {
        return state;
    }

    bool isDone() const
    {
        return state != State::running;
    }

    bool isCancellationRequested() const
    {
        return cancellationRequested;
    }

    /**
     * Get the exception the operation failed with, or null if it didn't fail.
     */
    const std::exception_ptr &getError() const
    {
        return error;
    }

    /**
     * Get the value the operation succeeded with.
     *
     * This is empty unless the state is State::succeeded and the coroutine returns a value.
     */
    const Result &getResult() const
    {
        return result;
    }

private:
    /**
     * Record how the coroutine ended.
     *
     * An operation_aborted error is a cancellation, whether or not it was cancel() that caused it.
     */
    void finish(std::exception_ptr e, Result r);

    const uint64_t id;
    const std::string name;

    State state = State::running;
    bool cancellationRequested = false;

    std::exception_ptr error;
    Result result;

    /**
     * Bound to the coroutine by start().
     */
    boost::asio::cancellation_signal signal;
};

/**
 * Get the name of an operation state.
 */
const char *stateToName(Operation::State state);

std::ostream &operator<<(std::ostream &s, const Operation &operation);

} // namespace Service

/// @}
