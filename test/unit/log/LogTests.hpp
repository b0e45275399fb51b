#pragma once

/**
 * @file Tests that every subclass of Log::Log has to pass.
 *
 * Include this after defining LogType to the name of the subclass, and define createLog() to make one.
 */

#include "log/Level.hpp"
#include "util/asio.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace Log
{

class Log;

} // namespace Log

namespace
{

std::unique_ptr<Log::Log> createLog(IOContext &ioc, Log::Level minLevel = Log::Level::info); // NOLINT

} // namespace

/**
 * Declare a test for the log type under test. The body is in LogTests.cpp.
 *
 * Anything after the name is passed to createLog().
 */
#define LOG_TEST(TestName, ...) \
    void LOG_TEST__##TestName(Log::Log &log, IOContext &ioc); \
    namespace \
    { \
        TEST(LogType, TestName) \
        { \
            IOContext ioc; \
            std::unique_ptr<Log::Log> log = createLog(ioc __VA_OPT__(,) __VA_ARGS__); \
            LOG_TEST__##TestName(*log, ioc); \
        } \
    }

LOG_TEST(Simple, Log::Level::debug)
LOG_TEST(Separate, Log::Level::debug)
LOG_TEST(Wait, Log::Level::debug)
LOG_TEST(NoWait, Log::Level::debug)
LOG_TEST(Long, Log::Level::debug)
LOG_TEST(MinLevel, Log::Level::warning)
LOG_TEST(Subject)
