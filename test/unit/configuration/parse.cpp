#include "configuration/configuration.hpp"

#include <gtest/gtest.h>

#include <string>

namespace
{

/**
 * Check that parsing fails, and that the error message mentions what's wrong.
 */
void expectParseError(std::string_view json, std::string_view expected)
{
    try {
        Config::Root::fromJson(json);
        ADD_FAILURE() << "Parsed invalid configuration: " << json;
    }
    catch (const Config::ParseException &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find(expected)) << e.what();
    }
}

TEST(ConfigParse, Empty)
{
    EXPECT_EQ(Config::Root{}, Config::Root::fromJson("{}"));
}

TEST(ConfigParse, Defaults)
{
    Config::Root config = Config::Root::fromJson("{ \"log\": {}, \"service\": {}, \"taskPool\": {} }");
    EXPECT_EQ(Log::Level::info, config.log.level);
    EXPECT_FALSE(config.log.print);
    EXPECT_EQ(Log::Level::error, config.service.failureLevel);
    EXPECT_EQ(Log::Level::info, config.service.successLevel);
    EXPECT_EQ(std::nullopt, config.taskPool.maxTasks);
    EXPECT_EQ(std::nullopt, config.taskPool.defaultLimit);
    EXPECT_TRUE(config.taskPool.limits.empty());
}

TEST(ConfigParse, Full)
{
    Config::Root config = Config::Root::fromJson(R"({
        // Comments are allowed.
        "log": { "level": "debug", "print": true },
        "service": { "failureLevel": "fatal", "successLevel": "debug" },
        "taskPool": {
            "maxTasks": 16,
            "defaultLimit": 4,
            "limits": [
                { "group": ["disco"], "limit": 2 },
                { "group": ["disco", "info"], "limit": 1 }
            ]
        }
    })");

    EXPECT_EQ((Config::Root{
        .log = {
            .level = Log::Level::debug,
            .print = true
        },
        .service = {
            .failureLevel = Log::Level::fatal,
            .successLevel = Log::Level::debug
        },
        .taskPool = {
            .maxTasks = 16,
            .defaultLimit = 4,
            .limits = {
                {
                    .group = {"disco"},
                    .limit = 2
                },
                {
                    .group = {"disco", "info"},
                    .limit = 1
                }
            }
        }
    }), config);
}

TEST(ConfigParse, InvalidJson)
{
    expectParseError("{", "Invalid configuration JSON: ");
    expectParseError("[]", "Invalid configuration: expected an object");
}

TEST(ConfigParse, UnknownKey)
{
    expectParseError("{ \"logs\": {} }", "Invalid configuration: unknown key \"logs\"");
    expectParseError("{ \"log\": { \"colour\": true } }", "Invalid configuration in \"log\": unknown key \"colour\"");
}

TEST(ConfigParse, BadValue)
{
    expectParseError("{ \"log\": { \"level\": \"loud\" } }",
                     "key \"level\" is \"loud\", expected one of: \"debug\", \"info\"");
    expectParseError("{ \"log\": { \"print\": 1 } }", "key \"print\" has the wrong type");
    expectParseError("{ \"taskPool\": { \"maxTasks\": \"lots\" } }",
                     "in \"taskPool\": key \"maxTasks\" has the wrong type");
}

TEST(ConfigParse, BadLimits)
{
    expectParseError("{ \"taskPool\": { \"limits\": [ { \"group\": [\"a\"] } ] } }",
                     "in \"limits\": missing key \"limit\"");
    expectParseError("{ \"taskPool\": { \"limits\": [ { \"group\": [], \"limit\": 1 } ] } }",
                     "the limit on every task is maxTasks");
    expectParseError("{ \"taskPool\": { \"limits\": [ { \"group\": [\"a\"], \"limit\": 1 }, "
                     "{ \"group\": [\"a\"], \"limit\": 2 } ] } }", "more than one limit for a group");
}

} // namespace
