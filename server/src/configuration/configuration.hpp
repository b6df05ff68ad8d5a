#pragma once

#include "log/Level.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * The service configuration, as loaded from the JSON file given on the command line.
 *
 * Each struct is one top-level key of that file.
 */
namespace Config
{

/**
 * Thrown if the configuration can't be parsed or is invalid.
 */
class ParseException final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Network final
{
    /// Listened on for IPv6 and IPv4.
    uint16_t port = 8080;

    bool operator==(const Network &) const;
};

/**
 * Headers sent with every response.
 */
struct Http final
{
    /**
     * The value of Access-Control-Allow-Origin, or nothing to omit the header.
     */
    std::optional<std::string> origin = "*";

    /**
     * The max-age for CacheKind::fixed responses, in seconds.
     */
    unsigned int cacheFixedTime = 600;

    /**
     * The max-age for CacheKind::segment responses, in seconds.
     */
    unsigned int cacheSegmentTime = 3600;

    bool operator==(const Http &) const;
};

struct Media final
{
    /**
     * Relative local variant locations are resolved against this.
     */
    std::string root;

    /**
     * Where the per-video HLS directories live. Empty means "hls" inside root.
     */
    std::string hlsRoot;

    /**
     * The catalog JSON file.
     */
    std::string catalog;

    bool operator==(const Media &) const;
};

struct Streaming final
{
    /**
     * The maximum number of bytes read from a file and written to the socket at once.
     */
    unsigned int chunkSize = 65536;

    bool operator==(const Streaming &) const;
};

/**
 * The synthesized manifest for a video without HLS files.
 */
struct Hls final
{
    /// Seconds, for both TARGETDURATION and the single EXTINF.
    unsigned int targetDuration = 3600;

    /// Use the catalog's duration (rounded up) where a video has one.
    bool useCatalogDuration = false;

    bool operator==(const Hls &) const;
};

struct Log final
{
    /// JSON lines file. Empty keeps the log in memory.
    std::string path;

    /// Also print to stderr. Defaults to whether path is empty.
    std::optional<bool> print;
    ::Log::Level level = ::Log::Level::info;

    bool operator==(const Log &) const;
};

/**
 * The whole configuration file.
 *
 * Tests build with WITH_TESTING, which makes this an aggregate so expected values can use designated initializers.
 */
class Root final
{
public:
#ifndef WITH_TESTING
    ~Root();

    Root(const Root &);
    Root(Root &&) noexcept;
    Root &operator=(const Root &);
    Root &operator=(Root &&) noexcept;
#endif // WITH_TESTING

    /**
     * Parse and validate a configuration file's contents. Comments are allowed.
     *
     * Defaults that depend on other keys (media.hlsRoot, log.print) are filled in.
     *
     * @throws ParseException naming the offending key.
     */
    static Root fromJson(std::string_view jsonString);

    Network network;
    Http http;
    Media media;
    Streaming streaming;
    Hls hls;
    Log log;

    bool operator==(const Root &) const;

private:
#ifndef WITH_TESTING
    /// Only fromJson() constructs one.
    Root() = default;
#endif // WITH_TESTING

    /**
     * Reject values that are well-typed but unusable, like a zero chunk size.
     */
    void validate() const;
};

} // namespace Config
