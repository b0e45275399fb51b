#include "TaskPool.hpp"

#include "configuration/configuration.hpp"

using ::Log::Context;
using ::Log::Level;

Service::TaskPool::ExhaustedException::~ExhaustedException() = default;

Service::TaskPool::ExhaustedException::ExhaustedException(const Group &group) :
    std::runtime_error("maximum number of tasks in group '" + formatGroup(group) + "' exhausted")
{
}

Service::TaskPool::~TaskPool()
{
    cancelAll();
}

Service::TaskPool::TaskPool(IOContext &ioc, ::Log::Log &log, std::optional<size_t> maxTasks,
                            std::optional<size_t> defaultLimit) :
    ioc(ioc), log(log("task pool")), defaultLimit(defaultLimit), self(std::make_shared<TaskPool *>(this))
{
    setLimit({}, maxTasks);
}

Service::TaskPool::TaskPool(IOContext &ioc, ::Log::Log &log, const Config::TaskPool &config) :
    TaskPool(ioc, log, config.maxTasks, config.defaultLimit)
{
    for (const Config::GroupLimit &limit: config.limits) {
        setLimit(limit.group, limit.limit);
    }
}

void Service::TaskPool::setLimit(const Group &group, std::optional<size_t> limit)
{
    if (!limit) {
        clearLimit(group);
        return;
    }
    limits[group] = *limit;
}

void Service::TaskPool::clearLimit(const Group &group)
{
    limits.erase(group);
}

std::optional<size_t> Service::TaskPool::getLimit(const Group &group) const
{
    auto it = limits.find(group);
    if (it == limits.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Service::TaskPool::getTaskCount(const Group &group) const
{
    auto it = counts.find(group);
    return it == counts.end() ? 0 : it->second;
}

void Service::TaskPool::cancelAll()
{
    // Cancelling doesn't call back synchronously, but take a copy in case that changes.
    std::set<std::shared_ptr<Operation>> cancelling = operations;
    for (const std::shared_ptr<Operation> &operation: cancelling) {
        operation->cancel();
    }
}

std::set<Service::TaskPool::Group> Service::TaskPool::admit(const std::set<Group> &groups) const
{
    std::set<Group> result = groups;
    result.insert(Group{});

    for (const Group &group: result) {
        std::optional<size_t> limit = getEffectiveLimit(group);
        if (limit && getTaskCount(group) >= *limit) {
            throw ExhaustedException(group);
        }
    }
    return result;
}

std::optional<size_t> Service::TaskPool::getEffectiveLimit(const Group &group) const
{
    std::optional<size_t> limit = getLimit(group);
    if (limit || group.empty()) {
        return limit;
    }
    return defaultLimit;
}

void Service::TaskPool::add(const std::shared_ptr<Operation> &operation, const std::set<Group> &groups)
{
    operations.insert(operation);
    for (const Group &group: groups) {
        counts[group]++;
    }
}

void Service::TaskPool::handleDone(const std::shared_ptr<Operation> &operation, const std::set<Group> &groups)
{
    operations.erase(operation);
    for (const Group &group: groups) {
        auto it = counts.find(group);
        if (it != counts.end() && --it->second == 0) {
            counts.erase(it);
        }
    }

    switch (operation->getState()) {
        case Operation::State::failed:
            log << Context::ItemInfo(Level::error, "task", operation->getIdentity())
                << "task " << operation->getIdentity() << " failed: " << describeException(operation->getError());
            break;
        case Operation::State::succeeded:
            log << Context::ItemInfo(Level::debug, "task", operation->getIdentity())
                << "task result: " << operation->getResult().getDescription();
            break;
        case Operation::State::cancelled:
        case Operation::State::running:
            break;
    }
}

std::string Service::formatGroup(const TaskPool::Group &group)
{
    std::string result = "(";
    for (size_t i = 0; i < group.size(); i++) {
        if (i > 0) {
            result += ", ";
        }
        result += group[i];
    }
    return result + ")";
}
