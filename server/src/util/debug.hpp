#pragma once

#include <cassert>

/// @addtogroup util
/// @{

/**
 * Marks the end of a function whose switch returns for every enumerator.
 *
 * Debug builds assert if it's ever reached.
 */
[[noreturn]] inline void unreachable()
{
    assert(!"unreachable");
    __builtin_unreachable();
}

/// @}
