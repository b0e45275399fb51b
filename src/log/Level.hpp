#pragma once

namespace Log
{

/**
 * How serious a log item is. Later values are more serious.
 */
enum class Level
{
    /// Context lifecycle, task results and other detail.
    debug,

    /// The default minimum level, and the default level for unhandled operation results.
    info,

    warning,

    /// The default level for failed operations.
    error,

    /// Something that should be impossible, like an outcome hook throwing.
    fatal
};

} // namespace Log
