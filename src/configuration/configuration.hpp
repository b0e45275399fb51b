#pragma once

#include "log/Level.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup configuration Configuration
 *
 * The configuration system.
 */
/// @addtogroup configuration
/// @{

/**
 * Contains the configuration of the log, the services and the task pool.
 *
 * Every key is optional. Missing keys keep the defaults given here.
 */
namespace Config
{

/**
 * Thrown when the configuration can't be parsed or is invalid.
 */
class ParseException final : public std::runtime_error
{
public:
    ~ParseException() override;
    using runtime_error::runtime_error;
};

/**
 * The log key.
 */
struct Log final
{
    ::Log::Level level = ::Log::Level::info;
    bool print = false;

    bool operator==(const Log &) const;
};

/**
 * The service key.
 *
 * The levels the default Service::Service hooks log at.
 */
struct Service final
{
    ::Log::Level failureLevel = ::Log::Level::error;
    ::Log::Level successLevel = ::Log::Level::info;

    bool operator==(const Service &) const;
};

/**
 * An element of the taskPool.limits key.
 */
struct GroupLimit final
{
    std::vector<std::string> group;
    size_t limit = 0;

    bool operator==(const GroupLimit &) const;
};

/**
 * The taskPool key.
 */
struct TaskPool final
{
    /**
     * The limit on the total number of tasks (the implicit group).
     */
    std::optional<size_t> maxTasks;

    /**
     * The limit on every other group that doesn't have a limit of its own.
     */
    std::optional<size_t> defaultLimit;

    std::vector<GroupLimit> limits;

    bool operator==(const TaskPool &) const;
};

/**
 * The root of the configuration.
 */
struct Root final
{
    /**
     * Load configuration from a JSON formatted string.
     *
     * Comments are allowed.
     *
     * @param jsonString The configuration object as a JSON formatted string.
     * @throws ParseException If the string isn't valid JSON, has unknown keys, or has invalid values.
     */
    static Root fromJson(std::string_view jsonString);

    Log log;
    Service service;
    TaskPool taskPool;

    bool operator==(const Root &) const;

    /**
     * Validate a loaded configuration.
     *
     * @throws ParseException If the configuration is invalid.
     */
    void validate() const;
};

} // namespace Config

/// @}
