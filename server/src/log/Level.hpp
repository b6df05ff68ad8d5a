#pragma once

#include <initializer_list>
#include <string_view>
#include <utility>

namespace Log
{

/**
 * Log item severity, least severe first.
 */
enum class Level
{
    /**
     * Detail that only matters when investigating a problem.
     */
    debug,

    /**
     * Normal operation: requests, resource registration, catalog loading.
     */
    info,

    /**
     * Something that was worked around.
     */
    warning,

    /**
     * A request failed because of the server, e.g: a read error.
     */
    error,

    /**
     * The server can't continue.
     */
    fatal
};

/**
 * The spelling of each level in configuration and log files.
 */
inline const std::initializer_list<std::pair<Level, std::string_view>> levelNames = {
    { Level::debug, "debug" },
    { Level::info, "info" },
    { Level::warning, "warning" },
    { Level::error, "error" },
    { Level::fatal, "fatal" }
};

} // namespace Log
