#pragma once

#include "Operation.hpp"
#include "log/Log.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Config
{

struct TaskPool;

} // namespace Config

/// @addtogroup service
/// @{

namespace Service
{

/**
 * Runs operations with limits on how many can run at once.
 *
 * Each operation runs in zero or more groups, and always in the implicit group {} as well, so the limit on {} is the
 * limit on the whole pool. A group's limit is its own limit if it has one. Otherwise every group but {} is limited by
 * the default limit, if there is one.
 *
 * An operation that would take any of its groups over the limit isn't started at all.
 */
class TaskPool final
{
public:
    /**
     * A group key.
     */
    using Group = std::vector<std::string>;

    /**
     * Thrown by spawn() when a group is at its limit.
     */
    class ExhaustedException final : public std::runtime_error
    {
    public:
        ~ExhaustedException() override;
        explicit ExhaustedException(const Group &group);
    };

    /**
     * Cancel everything that's running.
     */
    ~TaskPool();

    /**
     * @param maxTasks The limit on the implicit group.
     * @param defaultLimit The limit on groups that don't have a limit of their own.
     */
    explicit TaskPool(IOContext &ioc, ::Log::Log &log, std::optional<size_t> maxTasks = std::nullopt,
                      std::optional<size_t> defaultLimit = std::nullopt);

    /**
     * Create a task pool as described by the taskPool key of the configuration.
     */
    explicit TaskPool(IOContext &ioc, ::Log::Log &log, const Config::TaskPool &config);

    // No copying or moving.
    TaskPool(const TaskPool &) = delete;
    TaskPool(TaskPool &&) = delete;
    TaskPool &operator=(const TaskPool &) = delete;
    TaskPool &operator=(TaskPool &&) = delete;

    /**
     * Set the limit on a group.
     *
     * Operations already running in the group keep running even if the new limit is lower, but nothing more is
     * started in the group until it's below the limit. A limit of zero stops anything being started in the group.
     *
     * @param limit The new limit. std::nullopt is the same as clearLimit().
     */
    void setLimit(const Group &group, std::optional<size_t> limit);

    /**
     * Remove a group's own limit. Does nothing if it doesn't have one.
     */
    void clearLimit(const Group &group);

    /**
     * Get the group's own limit, if it has one.
     */
    std::optional<size_t> getLimit(const Group &group) const;

    std::optional<size_t> getDefaultLimit() const
    {
        return defaultLimit;
    }

    /**
     * Get the number of operations running in a group.
     */
    size_t getTaskCount(const Group &group) const;

    /**
     * Start a coroutine in the given groups.
     *
     * @param groups The groups to run in, in addition to the implicit group.
     * @param awaitable The coroutine. A returned value must be default constructible and copyable.
     * @param name What the operation is, for diagnostics.
     * @return The handle of the operation.
     * @throws ExhaustedException If any of the groups is at its limit. The coroutine is destroyed without running.
     */
    template <typename T>
    std::shared_ptr<Operation> spawn(const std::set<Group> &groups, Awaitable<T> awaitable,
                                     std::string_view name = "task")
    {
        std::set<Group> admitted = admit(groups);

        auto operation = std::make_shared<Operation>(nextOperationId++, name);
        add(operation, admitted);

        operation->start(ioc, std::move(awaitable), [pool = std::weak_ptr<TaskPool *>(self),
                                                     admitted = std::move(admitted)]
                                                    (const std::shared_ptr<Operation> &done) {
            if (std::shared_ptr<TaskPool *> p = pool.lock()) {
                (*p)->handleDone(done, admitted);
            }
        });
        return operation;
    }

    /**
     * Cancel every operation that's running.
     */
    void cancelAll();

private:
    /**
     * Check whether an operation can start in the given groups.
     *
     * @return The groups, plus the implicit group.
     * @throws ExhaustedException If it can't.
     */
    std::set<Group> admit(const std::set<Group> &groups) const;

    /**
     * Get the limit that applies to a group.
     */
    std::optional<size_t> getEffectiveLimit(const Group &group) const;

    void add(const std::shared_ptr<Operation> &operation, const std::set<Group> &groups);
    void handleDone(const std::shared_ptr<Operation> &operation, const std::set<Group> &groups);

    IOContext &ioc;
    ::Log::Context log;

    std::map<Group, size_t> limits;
    const std::optional<size_t> defaultLimit;

    /**
     * The number of running operations in each group. Groups with nothing running aren't in here.
     */
    std::map<Group, size_t> counts;

    std::set<std::shared_ptr<Operation>> operations;
    uint64_t nextOperationId = 0;

    /**
     * Lets completion handlers find out whether the pool still exists.
     */
    std::shared_ptr<TaskPool *> self;
};

/**
 * Format a group key like "(a, b)".
 */
std::string formatGroup(const TaskPool::Group &group);

} // namespace Service

/// @}
