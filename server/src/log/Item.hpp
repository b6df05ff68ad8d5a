#pragma once

#include "Level.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace Log
{

/**
 * One log entry, as stored and as read back.
 *
 * Stored as one line of JSON per item. Timestamps keep microsecond resolution.
 */
struct Item final
{
    /**
     * @throws Json::FormatException if the JSON is an object with the wrong members.
     * @throws nlohmann::json::exception if the string isn't JSON.
     */
    static Item fromJsonString(std::string_view jsonString);

    std::string toJsonString() const;

    /**
     * One human-readable line, e.g: "2024-03-01 12:00:00 [Info] connection 4 (0.001200 s): endpoints: ...".
     *
     * @param colour Highlight the level with ANSI escapes.
     */
    std::string format(bool colour = false) const;

    /// Since the log was created.
    std::chrono::steady_clock::duration logTime{0};

    /// Since the item's context was created.
    std::chrono::steady_clock::duration contextTime{0};

    std::chrono::system_clock::time_point systemTime{std::chrono::system_clock::duration{0}};

    Level level = Level::info;

    /**
     * Tags what the item is about, e.g: "endpoints", "redirect", or "exception". Empty for free-form messages.
     */
    std::string kind;

    std::string message;

    /**
     * The context is identified by its name and an index that counts contexts with that name.
     */
    std::string contextName;
    size_t contextIndex = 0;

    bool operator==(const Item &) const = default;
};

} // namespace Log
