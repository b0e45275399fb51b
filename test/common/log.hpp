#pragma once

#include "log/Log.hpp"

#include <string_view>
#include <vector>

/**
 * A log that's never expected to contain anything.
 *
 * Anything that gets as far as being stored (i.e: is at or above the minimum level) fails the test.
 */
class ExpectNeverLog final : public Log::Log
{
public:
    ~ExpectNeverLog() override;

    /**
     * @param minLevel The minimum level that's expected to never happen.
     */
    explicit ExpectNeverLog(IOContext &ioc, ::Log::Level minLevel = ::Log::Level::warning);

private:
    Awaitable<::Log::Item> load(size_t index) const override;
    Awaitable<void> store(::Log::Item item) override;
};

/**
 * Read every item in a log.
 */
Awaitable<std::vector<Log::Item>> extractLog(const Log::Log &log);

/**
 * Read the items of a given kind from a log.
 */
Awaitable<std::vector<Log::Item>> extractLogKind(const Log::Log &log, std::string_view kind);
