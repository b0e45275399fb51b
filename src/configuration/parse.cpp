#include "configuration.hpp"

#include "util/json.hpp"

#include <set>

/// @addtogroup configuration
/// @{
/// @defgroup configuration_implementation Implementation
/// @}

/// @addtogroup configuration_implementation
/// @{

namespace
{

/**
 * Read a log level, given by its lower case name.
 */
void readLevel(Json::ObjectReader &r, ::Log::Level &dst, const char *key)
{
    r.read(dst, key, {
        { ::Log::Level::debug, "debug" },
        { ::Log::Level::info, "info" },
        { ::Log::Level::warning, "warning" },
        { ::Log::Level::error, "error" },
        { ::Log::Level::fatal, "fatal" }
    });
}

} // namespace

/// @}

// nlohmann::json finds these by argument dependent lookup, so they have to be in Config.
namespace Config
{

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Log &out)
{
    Json::ObjectReader r(j, "log");
    readLevel(r, out.level, "level");
    r.read(out.print, "print");
    r.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Service &out)
{
    Json::ObjectReader r(j, "service");
    readLevel(r, out.failureLevel, "failureLevel");
    readLevel(r, out.successLevel, "successLevel");
    r.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, GroupLimit &out)
{
    Json::ObjectReader r(j, "limits");
    r.read(out.group, "group", true);
    r.read(out.limit, "limit", true);
    r.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, TaskPool &out)
{
    Json::ObjectReader r(j, "taskPool");
    r.read(out.maxTasks, "maxTasks");
    r.read(out.defaultLimit, "defaultLimit");
    r.read(out.limits, "limits");
    r.finish();
}

} // namespace Config

Config::ParseException::~ParseException() = default;

Config::Root Config::Root::fromJson(std::string_view jsonString)
{
    nlohmann::json j;
    try {
        j = Json::parse(jsonString, true);
    }
    catch (const nlohmann::json::parse_error &e) {
        throw ParseException("Invalid configuration JSON: " + std::string(e.what()));
    }

    Root root;
    try {
        Json::ObjectReader r(j);
        r.read(root.log, "log");
        r.read(root.service, "service");
        r.read(root.taskPool, "taskPool");
        r.finish();
    }
    catch (const Json::ShapeError &e) {
        throw ParseException(std::string("Invalid configuration") + (e.getObject() ? " " : ": ") + e.what());
    }

    root.validate();
    return root;
}

void Config::Root::validate() const
{
    std::set<std::vector<std::string>> groups;
    for (const GroupLimit &limit: taskPool.limits) {
        if (limit.group.empty()) {
            throw ParseException("Invalid configuration in \"limits\": the limit on every task is maxTasks");
        }
        if (!groups.insert(limit.group).second) {
            throw ParseException("Invalid configuration in \"limits\": more than one limit for a group");
        }
    }
}
