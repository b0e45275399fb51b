#include "asio.hpp"

#include <boost/asio/cancellation_state.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/core/demangle.hpp>
#include <boost/system/system_error.hpp>

#include <typeinfo>

Awaitable<bool> isCancellationRequested()
{
    boost::asio::cancellation_state state = co_await boost::asio::this_coro::cancellation_state;
    co_return state.cancelled() != boost::asio::cancellation_type::none;
}

Awaitable<void> throwIfCancellationRequested()
{
    if (co_await isCancellationRequested()) {
        throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
}

bool isOperationAborted(const std::exception_ptr &e)
{
    if (!e) {
        return false;
    }

    try {
        std::rethrow_exception(e);
    }
    catch (const boost::system::system_error &se) {
        return se.code() == boost::asio::error::operation_aborted;
    }
    catch (...) {
        return false;
    }
}

std::string describeException(const std::exception_ptr &e)
{
    if (!e) {
        return "No exception.";
    }

    try {
        std::rethrow_exception(e);
    }
    catch (const std::exception &ex) {
        return boost::core::demangle(typeid(ex).name()) + ": " + ex.what();
    }
    catch (...) {
        return "Unknown.";
    }
}
