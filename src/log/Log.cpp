#include "Log.hpp"

#include "util/asio.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <cassert>
#include <cstdio>

Log::Context::Entry::~Entry()
{
    context.add(*this);
}

Log::Context::Entry::Entry(Context &context, Level level, std::string_view kind, std::string_view subject) :
    context(context), steadyTime(std::chrono::steady_clock::now()), systemTime(std::chrono::system_clock::now()),
    level(level), kind(kind), subject(subject)
{
}

Log::Context::~Context()
{
    addLifecycle(std::chrono::steady_clock::now(), "destroyed");
}

Log::Context::Context(Log &log, std::string name, size_t index) :
    log(log), startTime(std::chrono::steady_clock::now()), name(std::move(name)), index(index)
{
    addLifecycle(startTime, "created");
}

void Log::Context::add(Entry &entry)
{
    log.add({
        .logTime = entry.steadyTime - log.startTime,
        .contextTime = entry.steadyTime - startTime,
        .systemTime = entry.systemTime,
        .level = entry.level,
        .kind = std::move(entry.kind),
        .subject = std::move(entry.subject),
        .message = entry.message.str(),
        .contextName = name,
        .contextIndex = index
    });
}

void Log::Context::addLifecycle(std::chrono::steady_clock::time_point now, const char *what)
{
    log.add({
        .logTime = now - log.startTime,
        .contextTime = now - startTime,
        .systemTime = std::chrono::system_clock::now(),
        .level = Level::debug,
        .kind = "log context",
        .message = what,
        .contextName = name,
        .contextIndex = index
    });
}

Log::Log::~Log() = default;

Log::Log::Log(Level minLevel, bool print, IOContext &ioc) :
    ioc(ioc), startTime(std::chrono::steady_clock::now()), minLevel(minLevel), print(print), added(ioc)
{
}

Log::Context Log::Log::operator()(std::string_view name)
{
    assert(!name.empty());

    auto it = nextContextIndex.find(name);
    if (it == nextContextIndex.end()) {
        it = nextContextIndex.emplace(name, 0).first;
    }
    return Context(*this, std::string(name), it->second++);
}

Awaitable<Log::Item> Log::Log::operator[](size_t index) const
{
    assert(index < size());

    if (index < stored) {
        co_return co_await load(index);
    }
    co_return queue[index - stored];
}

Awaitable<void> Log::Log::wait() const
{
    return added.wait();
}

void Log::Log::add(Item item)
{
    // A subclass isn't there to store anything during the constructor, so the log's own creation waits for the first
    // item.
    if (stored == 0 && queue.empty() && minLevel <= Level::info) {
        enqueue({
            .systemTime = std::chrono::system_clock::now(),
            .kind = "log",
            .message = "created"
        });
    }

    if (item.level >= minLevel) {
        enqueue(std::move(item));
    }
}

void Log::Log::enqueue(Item item)
{
    if (print) {
        fprintf(stderr, "%s\n", item.format(true).c_str());
    }

    queue.emplace_back(std::move(item));
    added.notifyAll();

    // Only the first item in an empty queue needs a coroutine: drain() carries on until the queue is empty.
    if (queue.size() == 1) {
        boost::asio::co_spawn((boost::asio::io_context &)ioc, drain(), boost::asio::detached);
    }
}

Awaitable<void> Log::Log::drain()
{
    while (!queue.empty()) {
        try {
            // A copy, because operator[] reads the front of the queue until store() is done with it.
            co_await store(queue.front());
        }
        catch (const std::exception &e) {
            fprintf(stderr, "Failed to store log item: %s\n", e.what());
        }

        queue.pop_front();
        stored++;
    }
}
