#pragma once

#include "Log.hpp"

#include <deque>

namespace Config
{

struct Log;

} // namespace Config

namespace Log
{

/**
 * A log that keeps every item in memory, for as long as it exists.
 */
class MemoryLog final : public Log
{
public:
    ~MemoryLog() override;
    explicit MemoryLog(IOContext &ioc, Level minLevel, bool print);

    /**
     * Create a log with the settings of the configuration's log key.
     */
    explicit MemoryLog(IOContext &ioc, const Config::Log &config);

private:
    Awaitable<Item> load(size_t index) const override;
    Awaitable<void> store(Item item) override;

    // A std::deque never moves existing items when it grows.
    std::deque<Item> items;
};

} // namespace Log
