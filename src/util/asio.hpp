#pragma once

#include "awaitable.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <string>

/**
 * @defgroup asio Asynchronous IO
 *
 * The coroutine plumbing on top of boost::asio.
 */

/// @addtogroup asio
/// @{

/**
 * The event loop everything runs on.
 *
 * It's a class of its own, rather than an alias, so it can be forward declared by headers that only pass it around.
 */
class IOContext final : public boost::asio::io_context
{
public:
    using boost::asio::io_context::io_context;
};

/**
 * Find out whether cancellation has been requested for the calling coroutine.
 */
Awaitable<bool> isCancellationRequested();

/**
 * Throw the same exception boost::asio throws for an aborted operation if the calling coroutine has been cancelled.
 *
 * This is for coroutines that wait on something which doesn't throw when it's cancelled.
 */
Awaitable<void> throwIfCancellationRequested();

/**
 * Determine whether an exception is the one boost::asio uses to report an aborted (cancelled) operation.
 */
bool isOperationAborted(const std::exception_ptr &e);

/**
 * Describe an exception in a way that's useful in a log message.
 *
 * @return The exception's type and what() for std::exception, and "Unknown." otherwise.
 */
std::string describeException(const std::exception_ptr &e);

/// @}
