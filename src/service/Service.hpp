#pragma once

#include "Operation.hpp"
#include "configuration/configuration.hpp"
#include "log/Log.hpp"

#include <memory>
#include <set>
#include <string_view>

/**
 * @defgroup service Services
 *
 * Supervision of the background work of the features bound to a session.
 */
/// @addtogroup service
/// @{

/**
 * Services and their supervised operations.
 */
namespace Service
{

class Node;

/**
 * Base class for a feature bound to a Node that does work in the background.
 *
 * Subclasses start coroutines with spawn(). The service keeps track of every coroutine until it ends, and then hands
 * its outcome to onOperationSucceeded() or onOperationFailed(). Exceptions never escape an operation any other way, so
 * a failing operation can't take down anything else. Cancelled operations are dropped without a report.
 *
 * close() detaches the service from its node and cancels everything that's still running. A closed service shouldn't
 * spawn anything more; getNode() returning nullptr is how to tell.
 *
 * Everything here must be used from the thread running the IOContext.
 */
class Service
{
public:
    /**
     * Close the service.
     *
     * Operations that end after this are dropped without calling the hooks.
     */
    virtual ~Service();

    // No copying or moving.
    Service(const Service &) = delete;
    Service(Service &&) = delete;
    Service &operator=(const Service &) = delete;
    Service &operator=(Service &&) = delete;

    /**
     * Get the node this service is bound to, or nullptr once the service is closed.
     */
    Node *getNode() const
    {
        return node;
    }

    bool isClosed() const
    {
        return !node;
    }

    /**
     * Detach the service from its node, and cancel every operation it's running.
     *
     * This doesn't wait for the operations to finish unwinding. Closing a closed service does nothing.
     */
    void close();

    /**
     * Get the number of operations that are being tracked (spawned and not seen to end).
     */
    size_t getOperationCount() const
    {
        return operations.size();
    }

    bool isTracked(const std::shared_ptr<Operation> &operation) const
    {
        return operations.contains(operation);
    }

protected:
    /**
     * @param node The node to bind to. The service does not own it.
     * @param ioc Where operations are run.
     * @param log Where the default hooks (and subclasses) log to.
     * @param name The name of the service's log context.
     * @param config The levels the default hooks log at.
     */
    explicit Service(Node &node, IOContext &ioc, ::Log::Log &log, std::string_view name,
                     const Config::Service &config = {});

    /**
     * Run a coroutine in the background.
     *
     * The operation is tracked before it's started, so it can't end before it's tracked.
     *
     * @param awaitable The coroutine. A returned value must be default constructible and copyable.
     * @param name What the operation is, for diagnostics.
     * @return The handle of the operation.
     */
    template <typename T>
    std::shared_ptr<Operation> spawn(Awaitable<T> awaitable, std::string_view name = "operation")
    {
        auto operation = std::make_shared<Operation>(nextOperationId++, name);
        operations.insert(operation);

        // The handle outlives the service if the coroutine does, so only call back while the service exists.
        operation->start(ioc, std::move(awaitable), [service = std::weak_ptr<Service *>(self)]
                                                    (const std::shared_ptr<Operation> &done) {
            if (std::shared_ptr<Service *> s = service.lock()) {
                (*s)->handleDone(done);
            }
        });
        return operation;
    }

    /**
     * Called when an operation ends with an exception.
     *
     * The default logs the operation and the exception. Overrides must not throw: this is where otherwise unhandled
     * failures end up.
     */
    virtual void onOperationFailed(const Operation &operation, const std::exception_ptr &error);

    /**
     * Called when an operation ends normally.
     *
     * The default logs the operation and its result. Subclasses that need the result override this rather than
     * polling the handle. Overrides must not throw.
     */
    virtual void onOperationSucceeded(const Operation &operation, const Result &result);

    IOContext &ioc;

    /**
     * The service's log context.
     */
    ::Log::Context log;

private:
    /**
     * Stop tracking an operation that's ended and pass its outcome to the right hook.
     */
    void handleDone(const std::shared_ptr<Operation> &operation);

    Node *node;
    const Config::Service config;

    /**
     * The operations that haven't been seen to end.
     */
    std::set<std::shared_ptr<Operation>> operations;

    uint64_t nextOperationId = 0;

    /**
     * Lets completion handlers find out whether the service still exists.
     */
    std::shared_ptr<Service *> self;
};

} // namespace Service

/// @}
