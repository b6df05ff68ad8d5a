#include "Item.hpp"

#include "util/debug.hpp"
#include "util/json.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace std::string_literals;

/// @addtogroup log
/// @{
/// @defgroup log_implementation Implementation
/// @}

/// @addtogroup log_implementation
/// @{

namespace
{

/**
 * Timestamps are stored in the JSON encoding with this resolution.
 */
using JsonDuration = std::chrono::microseconds;

struct LevelInfo
{
    const char *json;
    const char *name;
    const char *colour; ///< ANSI SGR parameters.
};

LevelInfo getLevelInfo(Log::Level level)
{
    switch (level) {
        case Log::Level::debug: return { "debug", "Debug", "37;1" };
        case Log::Level::info: return { "info", "Info", "32;1" };
        case Log::Level::warning: return { "warning", "Warning", "33;1" };
        case Log::Level::error: return { "error", "Error", "31;1" };
        case Log::Level::fatal: return { "fatal", "Fatal", "31" };
    }
    unreachable();
}

std::string formatDuration(std::chrono::steady_clock::duration d)
{
    char buffer[64];
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(d);
    snprintf(buffer, sizeof(buffer), "%0.06f s", us.count() / 1e6);
    return buffer;
}

std::string formatTimePoint(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) {
        return "unknown";
    }
    std::stringstream result;
    result << std::put_time(&tm, "%F %T");
    return result.str();
}

} // namespace

/// @}

namespace Log
{

static void from_json(const nlohmann::json &j, Item &out)
{
    Json::ObjectReader reader(j);

    JsonDuration::rep logTime = 0;
    JsonDuration::rep contextTime = 0;
    JsonDuration::rep systemTime = 0;
    reader.optional(logTime, "logTime");
    reader.optional(contextTime, "contextTime");
    reader.optional(systemTime, "systemTime");
    out.logTime = std::chrono::duration_cast<std::chrono::steady_clock::duration>(JsonDuration(logTime));
    out.contextTime = std::chrono::duration_cast<std::chrono::steady_clock::duration>(JsonDuration(contextTime));
    out.systemTime = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(JsonDuration(systemTime)));

    reader.oneOf(out.level, "level", levelNames);
    reader.optional(out.kind, "kind");
    reader.optional(out.message, "message");
    reader.optional(out.contextName, "contextName");
    reader.optional(out.contextIndex, "contextIndex");
    reader.finish();
}

static void to_json(nlohmann::json &j, const Item &in)
{
    j = {
        { "logTime", std::chrono::duration_cast<JsonDuration>(in.logTime).count() },
        { "contextTime", std::chrono::duration_cast<JsonDuration>(in.contextTime).count() },
        // The system_clock epoch is the Unix epoch since C++20.
        { "systemTime", std::chrono::duration_cast<JsonDuration>(in.systemTime.time_since_epoch()).count() },
        { "level", getLevelInfo(in.level).json },
        { "message", in.message },
        { "contextName", in.contextName },
        { "contextIndex", in.contextIndex }
    };
    if (!in.kind.empty()) {
        j["kind"] = in.kind;
    }
}

} // namespace Log

Log::Item Log::Item::fromJsonString(std::string_view jsonString)
{
    return Json::parse(jsonString).get<Log::Item>();
}

std::string Log::Item::toJsonString() const
{
    return Json::dump(*this);
}

std::string Log::Item::format(bool colour) const
{
    auto c = [colour](const char *sequence = "") {
        return colour ? "\x1b["s + sequence + "m" : ""s;
    };
    constexpr const char *timeColour = "34";
    constexpr const char *contextColour = "36;1";
    constexpr const char *kindColour = "35;1";
    LevelInfo info = getLevelInfo(level);

    std::ostringstream result;
    result << c(timeColour) << formatTimePoint(systemTime) << c()
           << " [" << c(info.colour) << info.name << c() << "] "
           << c(contextColour) << contextName << "[" << contextIndex << "]" << c()
           << " +" << formatDuration(contextTime) << " (" << formatDuration(logTime) << "): ";
    if (!kind.empty()) {
        result << c(kindColour) << kind << c() << ": ";
    }
    result << message;
    return result.str();
}
