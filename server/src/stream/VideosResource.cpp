#include "VideosResource.hpp"

#include "Playlist.hpp"
#include "QualityOptions.hpp"
#include "VariantResolver.hpp"

#include "configuration/configuration.hpp"
#include "server/Error.hpp"
#include "server/Request.hpp"
#include "server/Response.hpp"
#include "util/asio.hpp"
#include "util/File.hpp"
#include "util/json.hpp"
#include "util/util.hpp"

#include <cmath>
#include <stdexcept>

namespace
{

constexpr std::string_view playlistName = "index.m3u8";
constexpr std::string_view playlistMimeType = "application/vnd.apple.mpegurl";

/**
 * Set the headers that let players on other origins use the HLS routes.
 *
 * Access-Control-Allow-Origin comes from the HTTP configuration and is set by the server for every response.
 */
void setCorsHeaders(Server::Response &response)
{
    response.setHeader(boost::beast::http::field::access_control_allow_methods, "GET, HEAD, OPTIONS");
    response.setHeader(boost::beast::http::field::access_control_allow_headers, "Content-Type, Authorization, Range");
    response.setHeader(boost::beast::http::field::access_control_expose_headers,
                       "Content-Length, Content-Range, Accept-Ranges, X-Video-Quality");
}

/**
 * The Range header to honour.
 *
 * No ETag or Last-Modified is ever sent, so an If-Range can't match what the client has, and the whole file is sent.
 */
std::optional<std::string_view> getRange(const Server::Request &request)
{
    if (request.getHeader(boost::beast::http::field::if_range)) {
        return std::nullopt;
    }
    return request.getHeader(boost::beast::http::field::range);
}

} // namespace

Stream::VideosResource::~VideosResource() = default;

Stream::VideosResource::VideosResource(IOContext &ioc, const Catalog::Catalog &catalog, std::string basePath,
                                       const Config::Media &mediaConfig, const Config::Streaming &streamingConfig,
                                       const Config::Hls &hlsConfig) :
    ioc(ioc), catalog(catalog), basePath(std::move(basePath)), mediaConfig(mediaConfig), hlsConfig(hlsConfig),
    responder(ioc, streamingConfig.chunkSize)
{
}

Awaitable<void> Stream::VideosResource::getAsync(Server::Response &response, Server::Request &request)
{
    const Server::Path &path = request.getPath();
    if (path.empty()) {
        throw Server::Error(Server::ErrorKind::NotFound);
    }
    const Catalog::Video &video = getVideo(path[0]);

    /* Dispatch by the shape of the rest of the path. */
    if (path.size() == 2 && path[1] == "qualities") {
        getQualities(response, request, video);
        co_return;
    }
    if (path.size() == 3 && path[1] == "stream") {
        co_await getStream(response, request, video, path[2]);
        co_return;
    }
    if (path.size() == 4 && path[1] == "hls") {
        setCorsHeaders(response);
        if (path[3] == playlistName) {
            co_await getPlaylist(response, request, video, path[2]);
        }
        else {
            co_await getSegment(response, request, video, path[2], path[3]);
        }
        co_return;
    }
    throw Server::Error(Server::ErrorKind::NotFound);
}

Awaitable<void> Stream::VideosResource::optionsAsync(Server::Response &response, Server::Request &request)
{
    setCorsHeaders(response);
    return Resource::optionsAsync(response, request);
}

bool Stream::VideosResource::getAllowNonEmptyPath() const noexcept
{
    return true;
}

const Catalog::Video &Stream::VideosResource::getVideo(const std::string &id) const
{
    Catalog::VideoId videoId = 0;
    try {
        videoId = Util::parseUint64(id);
    }
    catch (const std::invalid_argument &) {
        throw Server::Error(Server::ErrorKind::NotFound, "Video not found.");
    }
    catch (const std::out_of_range &) {
        throw Server::Error(Server::ErrorKind::NotFound, "Video not found.");
    }

    const Catalog::Video *video = catalog.findVideo(videoId);
    if (!video) {
        throw Server::Error(Server::ErrorKind::NotFound, "Video not found.");
    }
    return *video;
}

Awaitable<void> Stream::VideosResource::getStream(Server::Response &response, Server::Request &request,
                                                  const Catalog::Video &video, const std::string &quality) const
{
    /* Find what to serve. This might not be the quality that was asked for. */
    const Catalog::Variant *variant = resolveVariant(catalog, video.id, quality);
    if (!variant) {
        throw Server::Error(Server::ErrorKind::NotFound, "Video file not found.");
    }
    response.setHeader("X-Video-Quality", variant->quality);

    /* Remote variants are the remote server's problem, including any range requests. */
    if (const auto *remote = std::get_if<Catalog::RemoteUrl>(&variant->location)) {
        response.setCacheKind(Server::CacheKind::none);
        response.setRedirect(remote->url);
        co_return;
    }

    response.setCacheKind(Server::CacheKind::fixed);
    co_await responder(response, std::get<Catalog::LocalFile>(variant->location).path,
                       getRange(request), request.getHeadOnly());
}

Awaitable<void> Stream::VideosResource::getPlaylist(Server::Response &response, Server::Request &request,
                                                    const Catalog::Video &video, const std::string &resolution) const
{
    response.setCacheKind(Server::CacheKind::none);
    response.setMimeType(std::string(playlistMimeType));

    /* Serve the real playlist if the video was segmented. */
    std::filesystem::path playlistPath = getHlsDirectory(video.id, resolution) / playlistName;
    if (std::filesystem::is_regular_file(playlistPath)) {
        Util::File file(ioc, playlistPath);
        response << co_await file.readExactAt(0, file.size());
        co_return;
    }

    /* Otherwise, point the player at the whole file. */
    response << getSingleEntryPlaylist(request, video, resolution);
}

Awaitable<void> Stream::VideosResource::getSegment(Server::Response &response, Server::Request &request,
                                                   const Catalog::Video &video, const std::string &resolution,
                                                   const std::string &segment) const
{
    if (!segment.ends_with(".ts")) {
        throw Server::Error(Server::ErrorKind::NotFound, "Segment not found.");
    }

    // The segment name is a single path part, so it can't escape the directory.
    std::filesystem::path segmentPath = getHlsDirectory(video.id, resolution) / segment;
    if (!std::filesystem::is_regular_file(segmentPath)) {
        throw Server::Error(Server::ErrorKind::NotFound, "Segment not found.");
    }

    response.setCacheKind(Server::CacheKind::segment);
    co_await responder(response, segmentPath, getRange(request), request.getHeadOnly());
}

void Stream::VideosResource::getQualities(Server::Response &response, Server::Request &request,
                                          const Catalog::Video &video) const
{
    nlohmann::json options =
        getQualityOptions(catalog, video.id, request.getHeader(boost::beast::http::field::user_agent));
    response.setCacheKind(Server::CacheKind::fixed);
    response.setMimeType("application/json");
    response << Json::dump(options);
}

std::string Stream::VideosResource::getSingleEntryPlaylist(Server::Request &request, const Catalog::Video &video,
                                                           const std::string &resolution) const
{
    /* Pick the duration. */
    unsigned int duration = hlsConfig.targetDuration;
    if (hlsConfig.useCatalogDuration && video.duration && *video.duration > 0) {
        duration = (unsigned int)std::ceil(*video.duration);
    }

    /* Pick the URL. Remote defaults can be played directly. Everything else goes through the stream route. */
    std::optional<std::string> defaultQuality = catalog.defaultQuality(video.id);
    if (defaultQuality) {
        const Catalog::Variant *variant = catalog.findVariant(video.id, *defaultQuality);
        if (const auto *remote = variant ? std::get_if<Catalog::RemoteUrl>(&variant->location) : nullptr) {
            return makeSingleEntryPlaylist(duration, remote->url);
        }
    }

    std::string url = basePath + "/" + std::to_string(video.id) + "/stream/" + resolution;
    std::optional<std::string_view> host = request.getHeader(boost::beast::http::field::host);
    if (host && !host->empty()) {
        url = "http://" + std::string(*host) + url;
    }
    return makeSingleEntryPlaylist(duration, url);
}

std::filesystem::path Stream::VideosResource::getHlsDirectory(Catalog::VideoId id,
                                                             const std::string &resolution) const
{
    std::filesystem::path videoDirectory = std::filesystem::path(mediaConfig.hlsRoot) / std::to_string(id);
    std::filesystem::path resolutionDirectory = videoDirectory / resolution;
    if (std::filesystem::is_regular_file(resolutionDirectory / playlistName)) {
        return resolutionDirectory;
    }
    return videoDirectory;
}
