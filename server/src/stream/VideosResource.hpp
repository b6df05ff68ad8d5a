#pragma once

#include "ContentResponder.hpp"

#include "catalog/Catalog.hpp"
#include "server/Resource.hpp"

#include <filesystem>
#include <string>

class IOContext;

namespace Config
{

struct Media;
struct Streaming;
struct Hls;

} // namespace Config

namespace Server
{

class Request;
class Response;

} // namespace Server

/**
 * @defgroup stream Streaming
 *
 * Serving stored videos over HTTP.
 */
/// @addtogroup stream
/// @{

/**
 * Contains the video streaming resources.
 */
namespace Stream
{

/**
 * The resource under which all videos are served.
 *
 * Relative to this resource, the paths are:
 * - `{id}/stream/{quality}`: the bytes of a stored variant, with Range support, or a redirect for remote variants.
 * - `{id}/hls/{resolution}/index.m3u8`: the HLS playlist, or a single-entry one if the video was never segmented.
 * - `{id}/hls/{resolution}/{segment}.ts`: an HLS segment, with Range support.
 * - `{id}/qualities`: JSON describing the available qualities.
 */
class VideosResource final : public Server::Resource
{
public:
    ~VideosResource() override;

    /**
     * @param basePath The URL path this resource is registered at, e.g: "/videos". It's used to build URLs to the
     *                 stream route.
     * @param catalog The catalog to look videos up in. Must outlive this object.
     */
    explicit VideosResource(IOContext &ioc, const Catalog::Catalog &catalog, std::string basePath,
                            const Config::Media &mediaConfig, const Config::Streaming &streamingConfig,
                            const Config::Hls &hlsConfig);

    Awaitable<void> getAsync(Server::Response &response, Server::Request &request) override;

    /**
     * Answer CORS preflight requests.
     */
    Awaitable<void> optionsAsync(Server::Response &response, Server::Request &request) override;

    bool getAllowNonEmptyPath() const noexcept override;

private:
    /**
     * Look up the video with an ID given as a path part.
     *
     * @throws Server::Error NotFound if the ID is not a decimal integer, or there's no such video.
     */
    const Catalog::Video &getVideo(const std::string &id) const;

    Awaitable<void> getStream(Server::Response &response, Server::Request &request, const Catalog::Video &video,
                              const std::string &quality) const;
    Awaitable<void> getPlaylist(Server::Response &response, Server::Request &request, const Catalog::Video &video,
                                const std::string &resolution) const;
    Awaitable<void> getSegment(Server::Response &response, Server::Request &request, const Catalog::Video &video,
                               const std::string &resolution, const std::string &segment) const;
    void getQualities(Server::Response &response, Server::Request &request, const Catalog::Video &video) const;

    /**
     * Build the playlist for a video that has no HLS segments.
     */
    std::string getSingleEntryPlaylist(Server::Request &request, const Catalog::Video &video,
                                       const std::string &resolution) const;

    /**
     * Get the directory holding a video's HLS playlist and segments.
     *
     * This is the per-resolution directory if it has a playlist, otherwise the per-video directory.
     */
    std::filesystem::path getHlsDirectory(Catalog::VideoId id, const std::string &resolution) const;

    IOContext &ioc;
    const Catalog::Catalog &catalog;
    const std::string basePath;
    const Config::Media &mediaConfig;
    const Config::Hls &hlsConfig;
    const ContentResponder responder;
};

} // namespace Stream

/// @}
