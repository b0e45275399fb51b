#include "Item.hpp"

#include "util/debug.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

/// @addtogroup log
/// @{
/// @defgroup log_implementation Implementation
/// @}

/// @addtogroup log_implementation
/// @{

namespace
{

/**
 * How a level is shown.
 */
struct LevelStyle final
{
    const char *name;

    /**
     * ANSI SGR parameters.
     */
    const char *colour;
};

LevelStyle getStyle(Log::Level level)
{
    switch (level) {
        case Log::Level::debug: return {"Debug", "37;1"};
        case Log::Level::info: return {"Info", "32;1"};
        case Log::Level::warning: return {"Warning", "33;1"};
        case Log::Level::error: return {"Error", "31;1"};
        case Log::Level::fatal: return {"Fatal", "31"};
    }
    unreachable();
}

/**
 * Writes text to a stream, optionally wrapped in ANSI colour escapes.
 */
class Painter final
{
public:
    explicit Painter(std::ostream &s, bool enabled) : s(s), enabled(enabled) {}

    template <typename T>
    Painter &operator()(const char *colour, const T &value)
    {
        if (enabled) {
            s << "\x1b[" << colour << "m" << value << "\x1b[m";
        }
        else {
            s << value;
        }
        return *this;
    }

    template <typename T>
    Painter &operator<<(const T &value)
    {
        s << value;
        return *this;
    }

private:
    std::ostream &s;
    const bool enabled;
};

std::string formatDuration(std::chrono::steady_clock::duration d)
{
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%0.06f s",
             std::chrono::duration_cast<std::chrono::duration<double>>(d).count());
    return buffer;
}

/**
 * Format a wall clock time, in UTC.
 */
std::string formatTime(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) {
        return "unknown";
    }

    std::stringstream s;
    s << std::put_time(&tm, "%F %T");
    return s.str();
}

constexpr const char *timeColour = "34";
constexpr const char *contextColour = "36;1";
constexpr const char *kindColour = "35;1";
constexpr const char *subjectColour = "33";

} // namespace

/// @}

const char *Log::levelToName(Level level)
{
    return getStyle(level).name;
}

std::string Log::Item::format(bool colour) const
{
    std::stringstream s;
    Painter p(s, colour);
    LevelStyle style = getStyle(level);

    // [Level] @ logTime = context[index] + contextTime = systemTime: [kind] (subject) message
    p << "[";
    p(style.colour, style.name) << "] @ ";
    p(timeColour, formatDuration(logTime)) << " = ";
    p(contextColour, contextName) << "[";
    p(contextColour, contextIndex) << "] + ";
    p(timeColour, formatDuration(contextTime)) << " = ";
    p(timeColour, formatTime(systemTime)) << ": [";
    p(kindColour, kind) << "] ";
    if (!subject.empty()) {
        p << "(";
        p(subjectColour, subject) << ") ";
    }
    p << message;

    return s.str();
}
