#include "Operation.hpp"

#include "util/debug.hpp"

Service::Operation::~Operation() = default;

Service::Operation::Operation(uint64_t id, std::string_view name) : id(id), name(name) {}

void Service::Operation::cancel()
{
    if (isDone() || cancellationRequested) {
        return;
    }
    cancellationRequested = true;
    signal.emit(boost::asio::cancellation_type::terminal);
}

std::string Service::Operation::getIdentity() const
{
    return name + "#" + std::to_string(id);
}

void Service::Operation::finish(std::exception_ptr e, Result r)
{
    if (!e) {
        state = State::succeeded;
        result = std::move(r);
    }
    else if (isOperationAborted(e)) {
        state = State::cancelled;
    }
    else {
        state = State::failed;
        error = std::move(e);
    }
}

const char *Service::stateToName(Operation::State state)
{
    switch (state) {
        case Operation::State::running: return "running";
        case Operation::State::succeeded: return "succeeded";
        case Operation::State::failed: return "failed";
        case Operation::State::cancelled: return "cancelled";
    }
    unreachable();
}

std::ostream &Service::operator<<(std::ostream &s, const Operation &operation)
{
    return s << operation.getIdentity() << " (" << stateToName(operation.getState()) << ")";
}
