#pragma once

#include "Level.hpp"

#include <chrono>
#include <string>

namespace Log
{

/**
 * One entry in a log.
 */
struct Item final
{
    /**
     * Format the item as a single line.
     *
     * The wall clock time is given in UTC.
     *
     * @param colour Highlight the parts with ANSI escape sequences.
     */
    std::string format(bool colour = false) const;

    /**
     * When the item was written, relative to the creation of the log.
     */
    std::chrono::steady_clock::duration logTime{0};

    /**
     * When the item was written, relative to the creation of its context.
     */
    std::chrono::steady_clock::duration contextTime{0};

    std::chrono::system_clock::time_point systemTime{std::chrono::system_clock::duration{0}};

    Level level = Level::info;

    /**
     * What sort of item it is (e.g: "operation" or "task"), so items can be picked out by a reader. May be empty.
     */
    std::string kind;

    /**
     * The thing the item is about, such as the "name#id" of an operation. May be empty.
     */
    std::string subject;

    std::string message;

    std::string contextName;

    /**
     * Tells apart contexts that have the same name.
     */
    size_t contextIndex = 0;

#ifdef WITH_TESTING
    bool operator==(const Item &) const;
#endif // WITH_TESTING
};

/**
 * Get the capitalized name of a level, as it's shown by Item::format().
 */
const char *levelToName(Level level);

} // namespace Log
