#include "Service.hpp"

#include "Node.hpp"
#include "util/debug.hpp"

using ::Log::Context;
using ::Log::Level;

Service::Service::~Service()
{
    close();
}

Service::Service::Service(Node &node, IOContext &ioc, ::Log::Log &log, std::string_view name,
                          const Config::Service &config) :
    ioc(ioc), log(log(name)), node(&node), config(config), self(std::make_shared<Service *>(this))
{
}

void Service::Service::close()
{
    /* Detach first, so anything the cancellations run sees a closed service with nothing tracked. */
    std::set<std::shared_ptr<Operation>> cancelling;
    cancelling.swap(operations);
    node = nullptr;

    for (const std::shared_ptr<Operation> &operation: cancelling) {
        operation->cancel();
    }
}

void Service::Service::onOperationFailed(const Operation &operation, const std::exception_ptr &error)
{
    log << Context::ItemInfo(config.failureLevel, "operation", operation.getIdentity())
        << "operation " << operation.getIdentity() << " failed: " << describeException(error);
}

void Service::Service::onOperationSucceeded(const Operation &operation, const Result &result)
{
    log << Context::ItemInfo(config.successLevel, "operation", operation.getIdentity())
        << "unhandled operation (" << operation.getIdentity() << ") result: " << result.getDescription();
}

void Service::Service::handleDone(const std::shared_ptr<Operation> &operation)
{
    operations.erase(operation);

    try {
        switch (operation->getState()) {
            case Operation::State::cancelled:
                // Expected after close(), so not worth reporting.
                return;
            case Operation::State::failed:
                onOperationFailed(*operation, operation->getError());
                return;
            case Operation::State::succeeded:
                onOperationSucceeded(*operation, operation->getResult());
                return;
            case Operation::State::running:
                break;
        }
        unreachable();
    }
    catch (const std::exception &e) {
        log << Context::ItemInfo(Level::fatal, "operation", operation->getIdentity())
            << "Operation outcome hook threw: " << e.what();
    }
    catch (...) {
        log << Context::ItemInfo(Level::fatal, "operation", operation->getIdentity())
            << "Operation outcome hook threw an unknown exception.";
    }
}
