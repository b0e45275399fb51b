#include "MemoryLog.hpp"

#include "configuration/configuration.hpp"
#include "util/asio.hpp"

Log::MemoryLog::~MemoryLog() = default;

Log::MemoryLog::MemoryLog(IOContext &ioc, Level minLevel, bool print) : Log(minLevel, print, ioc) {}

Log::MemoryLog::MemoryLog(IOContext &ioc, const Config::Log &config) : MemoryLog(ioc, config.level, config.print) {}

Awaitable<Log::Item> Log::MemoryLog::load(size_t index) const
{
    co_return items.at(index);
}

Awaitable<void> Log::MemoryLog::store(Item item)
{
    items.push_back(std::move(item));
    co_return;
}
