#include "configuration.hpp"

#include "util/json.hpp"

/// @addtogroup configuration
/// @{
/// @defgroup configuration_implementation Implementation
/// @}

/// @addtogroup configuration_implementation
/// @{

namespace
{

[[nodiscard]] Config::ParseException parseException(std::string_view message)
{
    return Config::ParseException("Error parsing configuration: " + std::string(message));
}

[[nodiscard]] Config::ParseException parseException(const std::string &key, const std::string &problem)
{
    return parseException(Json::FormatException(key, problem).what());
}

} // namespace

/// @}

// from_json() has to be found by argument-dependent lookup, so these live in Config.
namespace Config
{

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Network &out)
{
    Json::ObjectReader reader(j, "network");
    reader.optional(out.port, "port");
    reader.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Http &out)
{
    Json::ObjectReader reader(j, "http");
    reader.optional(out.origin, "origin");
    reader.optional(out.cacheFixedTime, "cacheFixedTime");
    reader.optional(out.cacheSegmentTime, "cacheSegmentTime");
    reader.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Media &out)
{
    Json::ObjectReader reader(j, "media");
    reader.required(out.root, "root");
    reader.optional(out.hlsRoot, "hlsRoot");
    reader.required(out.catalog, "catalog");
    reader.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Streaming &out)
{
    Json::ObjectReader reader(j, "streaming");
    reader.optional(out.chunkSize, "chunkSize");
    reader.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Hls &out)
{
    Json::ObjectReader reader(j, "hls");
    reader.optional(out.targetDuration, "targetDuration");
    reader.optional(out.useCatalogDuration, "useCatalogDuration");
    reader.finish();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Log &out)
{
    Json::ObjectReader reader(j, "log");
    reader.optional(out.path, "path");
    reader.optional(out.print, "print");
    reader.oneOf(out.level, "level", ::Log::levelNames);
    reader.finish();
}

} // namespace Config

Config::Root Config::Root::fromJson(std::string_view jsonString)
{
    /* Try to parse the string into a JSON value. */
    nlohmann::json j;
    try {
        j = Json::parse(jsonString, true);
    }
    catch (const nlohmann::json::parse_error &e) {
        throw parseException(e.what());
    }

    /* Deserialize the JSON value. */
    Config::Root root;

    // The from_json() functions above turn nlohmann::json's conversion errors into FormatException.
    try {
        Json::ObjectReader reader(j);
        reader.optional(root.network, "network");
        reader.optional(root.http, "http");
        reader.required(root.media, "media");
        reader.optional(root.streaming, "streaming");
        reader.optional(root.hls, "hls");
        reader.optional(root.log, "log");
        reader.finish();
    }
    catch (const Json::FormatException &e) {
        throw parseException(e.what());
    }

    /* Fill in the defaults that depend on other keys. */
    if (root.media.hlsRoot.empty()) {
        root.media.hlsRoot = root.media.root + "/hls";
    }
    if (!root.log.print) {
        root.log.print = root.log.path.empty();
    }

    root.validate();
    return root;
}

void Config::Root::validate() const
{
    if (media.root.empty()) {
        throw parseException("media.root", "Must not be empty.");
    }
    if (media.catalog.empty()) {
        throw parseException("media.catalog", "Must not be empty.");
    }
    if (streaming.chunkSize == 0) {
        throw parseException("streaming.chunkSize", "Must be greater than zero.");
    }
    if (hls.targetDuration == 0) {
        throw parseException("hls.targetDuration", "Must be greater than zero.");
    }
}
