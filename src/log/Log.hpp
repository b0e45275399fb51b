#pragma once

#include "Item.hpp"
#include "util/Signal.hpp"

#include <deque>
#include <map>
#include <sstream>

class IOContext;

/**
 * @defgroup log Logging
 *
 * Diagnostics for services, task pools and the application.
 */
/// @addtogroup log
/// @{

/**
 * Logging related stuff.
 */
namespace Log
{

class Log;

/**
 * A named source of log items.
 *
 * Each service and task pool has its own context, so the items it logs can be told apart from everybody else's. Items
 * are written with the stream operators:
 *
 *     context << Level::warning << "Operation took too long.";
 *     context << "operation" << Level::error << "Operation failed.";
 *     context << Context::ItemInfo(Level::error, "operation", "fetch#3") << "Operation failed.";
 *
 * The item is added to the log at the end of the full expression.
 */
class Context final
{
private:
    /**
     * An item that's being written. Its destructor adds it to the log.
     */
    class Entry final
    {
    public:
        ~Entry();

        // No copying or moving.
        Entry(const Entry &) = delete;
        Entry(Entry &&) = delete;
        Entry &operator=(const Entry &) = delete;
        Entry &operator=(Entry &&) = delete;

        template <typename T>
        Entry &operator<<(T &&value)
        {
            message << std::forward<T>(value);
            return *this;
        }

    private:
        friend class Context;

        explicit Entry(Context &context, Level level, std::string_view kind, std::string_view subject);

        Context &context;

        const std::chrono::steady_clock::time_point steadyTime;
        const std::chrono::system_clock::time_point systemTime;
        const Level level;
        std::string kind;
        std::string subject;
        std::stringstream message;
    };

    /**
     * What context << "kind" gives, waiting for a level.
     */
    struct KindPrefix final
    {
        Entry operator<<(Level level)
        {
            return Entry(context, level, kind, {});
        }

        Context &context;
        std::string_view kind;
    };

public:
    /**
     * Everything about an item except its message.
     */
    struct ItemInfo final
    {
        ItemInfo(Level level = Level::info, std::string_view kind = "", std::string_view subject = "") :
            level(level), kind(kind), subject(subject) {}

        Level level;
        std::string_view kind;
        std::string_view subject;
    };

    /**
     * Log the context's destruction.
     */
    ~Context();

    // No copying or moving.
    Context(const Context &) = delete;
    Context(Context &&) = delete;
    Context &operator=(const Context &) = delete;
    Context &operator=(Context &&) = delete;

    /**
     * Start an item. A Level converts to an ItemInfo.
     */
    Entry operator<<(ItemInfo info)
    {
        return Entry(*this, info.level, info.kind, info.subject);
    }

    /**
     * Start an item of the given kind. The level comes next.
     */
    KindPrefix operator<<(std::string_view kind)
    {
        return {*this, kind};
    }

    const std::string &getName() const
    {
        return name;
    }

private:
    friend class Log;
    friend class Entry;

    /**
     * Log the context's creation.
     *
     * @param index Tells apart contexts with the same name: the first is 0, the next 1, and so on.
     */
    explicit Context(Log &log, std::string name, size_t index);

    void add(Entry &entry);

    /**
     * Log a debug item about the context itself.
     */
    void addLifecycle(std::chrono::steady_clock::time_point now, const char *what);

    Log &log;
    const std::chrono::steady_clock::time_point startTime;
    const std::string name;
    const size_t index;
};

/**
 * A log: an ordered sequence of items.
 *
 * Items are added synchronously to a queue, and a coroutine on the IOContext hands them to store() one at a time, in
 * order. Items that haven't been stored yet are read back from the queue, so reading never depends on how far storing
 * has got. Where stored items actually go is up to the subclass.
 *
 * Items below the minimum level are discarded.
 */
class Log
{
public:
    virtual ~Log();

    // No copying or moving.
    Log(const Log &) = delete;
    Log(Log &&) = delete;
    Log &operator=(const Log &) = delete;
    Log &operator=(Log &&) = delete;

    /**
     * Create a context.
     *
     * @param name Must not be empty.
     */
    Context operator()(std::string_view name);

    /**
     * Read an item.
     *
     * @param index Less than size().
     */
    Awaitable<Item> operator[](size_t index) const;

    /**
     * Get the number of items, stored or not.
     */
    size_t size() const
    {
        return stored + queue.size();
    }

    /**
     * Wait until another item is added.
     */
    Awaitable<void> wait() const;

    Level getMinLevel() const
    {
        return minLevel;
    }

protected:
    /**
     * @param print Also write every item to stderr as it's added.
     */
    explicit Log(Level minLevel, bool print, IOContext &ioc);

    /**
     * Get the number of items that store() has finished with.
     */
    size_t getWrittenItemCount() const
    {
        return stored;
    }

    IOContext &ioc;

private:
    friend class Context;

    /**
     * Read a stored item.
     *
     * @param index Less than getWrittenItemCount().
     */
    virtual Awaitable<Item> load(size_t index) const = 0;

    /**
     * Store the next item. Never called again before the previous call has finished.
     */
    virtual Awaitable<void> store(Item item) = 0;

    /**
     * Add an item if it's at or above the minimum level.
     */
    void add(Item item);

    void enqueue(Item item);

    /**
     * Store items from the front of the queue until it's empty.
     */
    Awaitable<void> drain();

    const std::chrono::steady_clock::time_point startTime;
    const Level minLevel;
    const bool print;

    size_t stored = 0;
    std::deque<Item> queue;

    /**
     * The index to give the next context of each name.
     */
    std::map<std::string, size_t, std::less<>> nextContextIndex;

    /**
     * Notified whenever an item is added.
     */
    Signal added;
};

} // namespace Log

/// @}
