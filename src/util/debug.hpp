#pragma once

#include <cassert>

/// @addtogroup util
/// @{

/**
 * Mark code that can't be reached, such as the end of a function after a switch over every value of an enum.
 *
 * Debug builds assert. Release builds tell the compiler, so there's no "control reaches end" warning or dead code.
 */
[[noreturn]] inline void unreachable()
{
#ifdef NDEBUG
    __builtin_unreachable();
#else // NDEBUG
    assert(false);
    __builtin_unreachable();
#endif // NDEBUG
}

/// @}
