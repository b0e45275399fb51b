#include "log.hpp"

#include "util/asio.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

ExpectNeverLog::~ExpectNeverLog() = default;

// The "log created" item is at info level, so this has to be above that.
ExpectNeverLog::ExpectNeverLog(IOContext &ioc, ::Log::Level minLevel) :
    Log(std::max(minLevel, ::Log::Level::warning), true, ioc) {}

Awaitable<Log::Item> ExpectNeverLog::load(size_t) const
{
    throw std::runtime_error("Cannot load from ExpectNeverLog.");
}

Awaitable<void> ExpectNeverLog::store(::Log::Item item)
{
    ADD_FAILURE() << "Unexpected log item: " << item.format();
    co_return;
}

Awaitable<std::vector<Log::Item>> extractLog(const Log::Log &log)
{
    size_t size = log.size();
    std::vector<Log::Item> result;
    result.reserve(size);

    for (size_t i = 0; i < size; i++) {
        result.emplace_back(co_await log[i]);
    }

    co_return result;
}

Awaitable<std::vector<Log::Item>> extractLogKind(const Log::Log &log, std::string_view kind)
{
    std::vector<Log::Item> result;
    for (Log::Item &item: co_await extractLog(log)) {
        if (item.kind == kind) {
            result.emplace_back(std::move(item));
        }
    }
    co_return result;
}
