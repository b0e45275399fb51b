#pragma once

#include "util/asio.hpp"
#include "util/debug.hpp"
#include "util/Signal.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>

/// @addtogroup asio
/// @{

/**
 * Thrown when resolving an Event that's already resolved.
 */
class EventAlreadyResolved final : public std::logic_error
{
public:
    ~EventAlreadyResolved() override;
    EventAlreadyResolved();
};

/**
 * Thrown when reading the outcome of an Event that isn't resolved.
 */
class EventNotResolved final : public std::logic_error
{
public:
    ~EventNotResolved() override;
    EventNotResolved();
};

/**
 * A single-assignment event that hands one outcome (a value or a failure) to any number of waiting coroutines.
 *
 * One producer calls resolve() or resolveWithFailure() exactly once per resolution cycle. Any number of consumers can
 * wait() for it, both before and after resolution, and they all observe the same outcome. reset() starts a new cycle.
 *
 * Each cycle has its own state. A coroutine woken by a resolution keeps seeing that resolution's outcome even if the
 * event is reset (and perhaps resolved again) before it gets to run.
 *
 * @tparam T The value type. This must be copyable, because every waiter gets its own copy.
 */
template <typename T>
class Event final
{
public:
    /**
     * The state of the current resolution cycle.
     */
    enum class State
    {
        unset,
        value,
        failure
    };

    explicit Event(IOContext &ioc) : ioc(ioc), cycle(std::make_shared<Cycle>(ioc)) {}

    // No copying. Waiters hold on to the cycle, not the event, so moving is fine.
    Event(const Event &) = delete;
    Event &operator=(const Event &) = delete;
    Event(Event &&) = default;

    /**
     * Resolve the event with a value, and wake everything that's waiting.
     *
     * If moving the value into the event throws, the exception propagates and the event stays unresolved.
     *
     * @throws EventAlreadyResolved If the event is already resolved.
     */
    void resolve(T value)
    {
        checkUnresolved();
        cycle->outcome.template emplace<1>(std::move(value));
        cycle->signal.notifyAll();
    }

    /**
     * Resolve the event with a failure, and wake everything that's waiting.
     *
     * @throws EventAlreadyResolved If the event is already resolved.
     * @throws std::invalid_argument If the failure is null.
     */
    void resolveWithFailure(std::exception_ptr failure)
    {
        if (!failure) {
            throw std::invalid_argument("An Event cannot be resolved with a null failure.");
        }
        checkUnresolved();
        cycle->outcome.template emplace<2>(std::move(failure));
        cycle->signal.notifyAll();
    }

    /**
     * Wait for the event to be resolved.
     *
     * @return The value, if resolved with a value.
     * @throws The failure, if resolved with a failure.
     * @throws boost::system::system_error With boost::asio::error::operation_aborted if the waiting coroutine is
     *                                      cancelled before resolution.
     */
    Awaitable<T> wait() const
    {
        /* Hold on to this cycle, so a reset() while we're suspended doesn't get us the next cycle's outcome. */
        std::shared_ptr<Cycle> waitCycle = cycle;
        while (waitCycle->getState() == State::unset) {
            co_await waitCycle->signal.wait();
        }
        co_return waitCycle->get();
    }

    /**
     * Find out whether the event is resolved (with a value or a failure).
     */
    bool isResolved() const
    {
        return getState() != State::unset;
    }

    /**
     * Get the state of the current resolution cycle.
     */
    State getState() const
    {
        return cycle->getState();
    }

    /**
     * Get the outcome without waiting.
     *
     * @return The value, if resolved with a value.
     * @throws EventNotResolved If the event isn't resolved.
     * @throws The failure, if resolved with a failure.
     */
    const T &get() const
    {
        return cycle->get();
    }

    /**
     * Get the failure, or null if the event isn't resolved with a failure.
     */
    std::exception_ptr getFailure() const
    {
        if (getState() != State::failure) {
            return nullptr;
        }
        return std::get<2>(cycle->outcome);
    }

    /**
     * Discard the outcome and start a new resolution cycle.
     *
     * Coroutines waiting on an unresolved cycle are not woken.
     */
    void reset()
    {
        cycle = std::make_shared<Cycle>(ioc);
    }

private:
    /**
     * The state of one resolution cycle.
     */
    struct Cycle final
    {
        explicit Cycle(IOContext &ioc) : signal(ioc) {}

        State getState() const
        {
            // A value whose move constructor threw during resolve() leaves the cycle unresolved.
            if (outcome.valueless_by_exception()) {
                return State::unset;
            }
            return (State)outcome.index();
        }

        const T &get() const
        {
            switch (getState()) {
                case State::unset:
                    throw EventNotResolved();
                case State::value:
                    return std::get<1>(outcome);
                case State::failure:
                    std::rethrow_exception(std::get<2>(outcome));
            }
            unreachable();
        }

        Signal signal;

        /**
         * The outcome. The alternatives are in the same order as State.
         */
        std::variant<std::monostate, T, std::exception_ptr> outcome;
    };

    void checkUnresolved() const
    {
        if (isResolved()) {
            throw EventAlreadyResolved();
        }
    }

    IOContext &ioc;
    std::shared_ptr<Cycle> cycle;
};

/// @}
