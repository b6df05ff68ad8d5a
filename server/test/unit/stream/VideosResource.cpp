#include "stream/VideosResource.hpp"

#include "catalog/JsonCatalog.hpp"
#include "configuration/configuration.hpp"

#include "server/TestResource.hpp"

#include "coro_test.hpp"
#include "data.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace
{

constexpr std::string_view catalogJson = R"({
    "videos": [
        { "id": 1, "variants": [
            { "quality": "360p", "location": "1/360p.mp4", "size": 5000 },
            { "quality": "720p", "location": "1/720p.mp4", "size": 10000 },
            { "quality": "1080p", "location": "1/1080p.mp4", "processed": false }
        ] },
        { "id": 2, "variants": [
            { "quality": "720p", "location": "https://cdn.example.com/2/720p.mp4", "size": 10000 }
        ] },
        { "id": 3, "variants": [
            { "quality": "720p", "location": "3/720p.mp4" }
        ] },
        { "id": 4, "variants": [
            { "quality": "original", "location": "4/original.mp4" }
        ] },
        { "id": 5, "duration": 634.2, "variants": [
            { "quality": "360p", "location": "5/360p.webm" }
        ] }
    ]
})";

constexpr std::string_view realPlaylist =
    "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-TARGETDURATION:10\n#EXTINF:10.0,\nsegment_000.ts\n#EXT-X-ENDLIST\n";

/**
 * A media directory with a catalog, some videos and some HLS output, and the resource that serves them.
 */
class TestMedia final
{
public:
    TestMedia(IOContext &ioc, std::string_view name, Config::Hls hls = {}) :
        dir(name),
        media({ .root = dir.getPath().string(), .hlsRoot = (dir / "hls").string(), .catalog = "" }),
        hls(hls),
        catalog(Catalog::JsonCatalog::fromJson(catalogJson, dir.getPath())),
        resource(ioc, catalog, "/videos", media, streaming, this->hls)
    {
        writeTestFile(dir / "1/360p.mp4", makeTestBytes(5000));
        writeTestFile(dir / "1/720p.mp4", makeTestBytes(10000));
        writeTestFile(dir / "4/original.mp4", makeTestBytes(100));
        writeTestFile(dir / "5/360p.webm", makeTestBytes(3000));

        // Video 5 was segmented per resolution, video 1 into the video's directory.
        writeTestFile(dir / "hls/5/720p/index.m3u8", realPlaylist);
        writeTestFile(dir / "hls/5/720p/segment_000.ts", makeTestBytes(2000));
        writeTestFile(dir / "hls/5/720p/notes.txt", "kittens");
        writeTestFile(dir / "hls/1/index.m3u8", realPlaylist);
        writeTestFile(dir / "hls/1/segment_000.ts", makeTestBytes(1500));
    }

    Awaitable<void> operator()(TestRequest &request, TestResponse &response)
    {
        return runResource(resource, request, response);
    }

    TemporaryDirectory dir;
    Config::Media media;
    Config::Streaming streaming{ .chunkSize = 1024 };
    Config::Hls hls;
    Catalog::JsonCatalog catalog;
    Stream::VideosResource resource;
};

void expectCorsHeaders(const TestResponse &response)
{
    EXPECT_EQ("GET, HEAD, OPTIONS", response.getHeader("Access-Control-Allow-Methods"));
    EXPECT_EQ("Content-Type, Authorization, Range", response.getHeader("Access-Control-Allow-Headers"));
    EXPECT_EQ("Content-Length, Content-Range, Accept-Ranges, X-Video-Quality",
              response.getHeader("Access-Control-Expose-Headers"));
}

CORO_TEST(VideosResource, Stream, ioc)
{
    TestMedia media(ioc, "VideosResource.Stream");
    TestRequest request("1/stream/720p");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::Response::Status::ok, response.getStatus());
    EXPECT_EQ(Server::CacheKind::fixed, response.getCacheKind());
    EXPECT_EQ("video/mp4", response.getMimeType());
    EXPECT_EQ(10000u, response.getContentLength());
    EXPECT_EQ("720p", response.getHeader("X-Video-Quality"));
    EXPECT_EQ("bytes", response.getHeader("Accept-Ranges"));
    EXPECT_EQ(makeTestBytes(10000), response.getBodyString());
    for (const std::vector<std::byte> &chunk: response.getChunks()) {
        EXPECT_LE(chunk.size(), 1024u);
    }
}

CORO_TEST(VideosResource, StreamRange, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamRange");
    TestRequest request("1/stream/360p");
    request.withHeader(boost::beast::http::field::range, "bytes=1000-1999");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(Server::Response::Status::partialContent, response.getStatus());
    EXPECT_EQ(1000u, response.getContentLength());
    EXPECT_EQ("bytes 1000-1999/5000", response.getHeader("Content-Range"));
    EXPECT_EQ("360p", response.getHeader("X-Video-Quality"));
    EXPECT_EQ(makeTestBytes(5000).substr(1000, 1000), response.getBodyString());
}

CORO_TEST(VideosResource, StreamIfRange, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamIfRange");
    TestRequest request("1/stream/360p");
    request.withHeader(boost::beast::http::field::range, "bytes=1000-1999");
    request.withHeader(boost::beast::http::field::if_range, "\"kitten\"");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(Server::Response::Status::ok, response.getStatus());
    EXPECT_EQ(5000u, response.getContentLength());
    EXPECT_EQ(std::nullopt, response.getHeader("Content-Range"));
    EXPECT_EQ(makeTestBytes(5000), response.getBodyString());
}

CORO_TEST(VideosResource, StreamHead, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamHead");
    TestRequest request("1/stream/720p", Server::Request::Type::get, {}, true);
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(Server::Response::Status::ok, response.getStatus());
    EXPECT_EQ(10000u, response.getContentLength());
    EXPECT_EQ("720p", response.getHeader("X-Video-Quality"));
    EXPECT_EQ("bytes", response.getHeader("Accept-Ranges"));
    EXPECT_TRUE(response.getChunks().empty());

    TestRequest segmentRequest("5/hls/720p/segment_000.ts", Server::Request::Type::get, {}, true);
    TestResponse segmentResponse;
    co_await media(segmentRequest, segmentResponse);
    EXPECT_EQ(2000u, segmentResponse.getContentLength());
    EXPECT_EQ("video/MP2T", segmentResponse.getMimeType());
    EXPECT_TRUE(segmentResponse.getChunks().empty());
}

CORO_TEST(VideosResource, StreamUnsatisfiable, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamUnsatisfiable");
    TestRequest request("1/stream/360p");
    request.withHeader(boost::beast::http::field::range, "bytes=5000-5100");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(Server::ErrorKind::RangeNotSatisfiable, response.getErrorKind());
    EXPECT_EQ("bytes */5000", response.getHeader("Content-Range"));
    EXPECT_TRUE(response.getBody().empty());
}

CORO_TEST(VideosResource, StreamFallback, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamFallback");

    // 1080p isn't processed, and 4k doesn't exist. Both get the best there is.
    for (const char *path: { "1/stream/1080p", "1/stream/4k" }) {
        TestRequest request(path);
        TestResponse response;
        co_await media(request, response);

        EXPECT_EQ(std::nullopt, response.getErrorKind());
        EXPECT_EQ("720p", response.getHeader("X-Video-Quality"));
        EXPECT_EQ(makeTestBytes(10000), response.getBodyString());
    }
}

CORO_TEST(VideosResource, StreamRemote, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamRemote");
    TestRequest request("2/stream/360p");
    request.withHeader(boost::beast::http::field::range, "bytes=0-99");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::Response::Status::redirect, response.getStatus());
    EXPECT_EQ(Server::CacheKind::none, response.getCacheKind());
    EXPECT_EQ("https://cdn.example.com/2/720p.mp4", response.getHeader("Location"));
    EXPECT_EQ("720p", response.getHeader("X-Video-Quality"));
    EXPECT_EQ(std::nullopt, response.getHeader("Content-Range"));
    EXPECT_EQ(0u, response.getContentLength());
    EXPECT_TRUE(response.getBody().empty());
}

CORO_TEST(VideosResource, StreamFileMissing, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamFileMissing");
    TestRequest request("3/stream/720p");
    co_await testResourceError(media.resource, request, "File not found.", Server::ErrorKind::NotFound);
}

CORO_TEST(VideosResource, StreamFileRemoved, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamFileRemoved");
    std::filesystem::remove(media.dir / "1/720p.mp4");
    TestRequest request("1/stream/720p");
    co_await testResourceError(media.resource, request, "File not found.", Server::ErrorKind::NotFound);
}

CORO_TEST(VideosResource, StreamNoVariant, ioc)
{
    TestMedia media(ioc, "VideosResource.StreamNoVariant");
    TestRequest request("4/stream/720p");
    co_await testResourceError(media.resource, request, "Video file not found.", Server::ErrorKind::NotFound);

    TestRequest originalRequest("4/stream/original");
    co_await testResource(media.resource, originalRequest, makeTestBytes(100), "video/mp4");
}

CORO_TEST(VideosResource, UnknownVideo, ioc)
{
    TestMedia media(ioc, "VideosResource.UnknownVideo");
    for (const char *path: { "99/stream/720p", "kitten/stream/720p", "-1/stream/720p", "99/qualities",
                             "99999999999999999999999/stream/720p", "99/hls/720p/index.m3u8" }) {
        TestRequest request(path);
        co_await testResourceError(media.resource, request, "Video not found.", Server::ErrorKind::NotFound);
    }
}

CORO_TEST(VideosResource, UnknownRoute, ioc)
{
    TestMedia media(ioc, "VideosResource.UnknownRoute");
    for (const char *path: { "", "1", "1/stream", "1/stream/720p/more", "1/kittens/720p", "1/hls/720p",
                             "1/qualities/720p" }) {
        TestRequest request(path);
        co_await testResourceError(media.resource, request, Server::ErrorKind::NotFound);
    }
}

CORO_TEST(VideosResource, Qualities, ioc)
{
    TestMedia media(ioc, "VideosResource.Qualities");
    TestRequest request("1/qualities");
    request.withHeader(boost::beast::http::field::user_agent, "Mozilla/5.0 (Linux; Android 14) Mobile Safari/537.36");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ("application/json", response.getMimeType());
    nlohmann::json expected = {
        { "available_qualities", {
            { { "quality", "360p" }, { "file_size", 5000 } },
            { { "quality", "720p" }, { "file_size", 10000 } }
        } },
        { "recommended_quality", "360p" },
        { "default_quality", "720p" }
    };
    EXPECT_EQ(expected, nlohmann::json::parse(response.getBodyString()));
}

CORO_TEST(VideosResource, Playlist, ioc)
{
    TestMedia media(ioc, "VideosResource.Playlist");
    TestRequest request("5/hls/720p/index.m3u8");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::CacheKind::none, response.getCacheKind());
    EXPECT_EQ("application/vnd.apple.mpegurl", response.getMimeType());
    EXPECT_EQ(realPlaylist, response.getBodyString());
    expectCorsHeaders(response);
}

CORO_TEST(VideosResource, PlaylistInVideoDirectory, ioc)
{
    TestMedia media(ioc, "VideosResource.PlaylistInVideoDirectory");
    TestRequest request("1/hls/360p/index.m3u8");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(realPlaylist, response.getBodyString());
}

CORO_TEST(VideosResource, PlaylistFallback, ioc)
{
    TestMedia media(ioc, "VideosResource.PlaylistFallback");
    TestRequest request("5/hls/360p/index.m3u8");
    request.withHeader(boost::beast::http::field::host, "localhost:8080");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::CacheKind::none, response.getCacheKind());
    EXPECT_EQ("application/vnd.apple.mpegurl", response.getMimeType());
    EXPECT_EQ("#EXTM3U\n"
              "#EXT-X-VERSION:3\n"
              "#EXT-X-TARGETDURATION:3600\n"
              "#EXT-X-MEDIA-SEQUENCE:0\n"
              "#EXT-X-PLAYLIST-TYPE:VOD\n"
              "#EXTINF:3600.0,\n"
              "http://localhost:8080/videos/5/stream/360p\n"
              "#EXT-X-ENDLIST\n",
              response.getBodyString());
    expectCorsHeaders(response);
}

CORO_TEST(VideosResource, PlaylistFallbackNoHost, ioc)
{
    TestMedia media(ioc, "VideosResource.PlaylistFallbackNoHost");
    TestRequest request("5/hls/360p/index.m3u8");
    TestResponse response;
    co_await media(request, response);

    EXPECT_NE(std::string::npos, response.getBodyString().find("\n/videos/5/stream/360p\n"));
}

CORO_TEST(VideosResource, PlaylistFallbackRemote, ioc)
{
    TestMedia media(ioc, "VideosResource.PlaylistFallbackRemote");
    TestRequest request("2/hls/720p/index.m3u8");
    request.withHeader(boost::beast::http::field::host, "localhost:8080");
    TestResponse response;
    co_await media(request, response);

    EXPECT_NE(std::string::npos, response.getBodyString().find("\nhttps://cdn.example.com/2/720p.mp4\n"));
}

CORO_TEST(VideosResource, PlaylistFallbackCatalogDuration, ioc)
{
    TestMedia media(ioc, "VideosResource.PlaylistFallbackCatalogDuration",
                    { .targetDuration = 3600, .useCatalogDuration = true });

    // Video 5 knows its duration.
    TestRequest request("5/hls/360p/index.m3u8");
    TestResponse response;
    co_await media(request, response);
    EXPECT_NE(std::string::npos, response.getBodyString().find("\n#EXT-X-TARGETDURATION:635\n#"));
    EXPECT_NE(std::string::npos, response.getBodyString().find("\n#EXTINF:635.0,\n"));

    // Video 2 doesn't.
    TestRequest otherRequest("2/hls/720p/index.m3u8");
    TestResponse otherResponse;
    co_await media(otherRequest, otherResponse);
    EXPECT_NE(std::string::npos, otherResponse.getBodyString().find("\n#EXT-X-TARGETDURATION:3600\n#"));
}

CORO_TEST(VideosResource, Segment, ioc)
{
    TestMedia media(ioc, "VideosResource.Segment");
    TestRequest request("5/hls/720p/segment_000.ts");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::Response::Status::ok, response.getStatus());
    EXPECT_EQ(Server::CacheKind::segment, response.getCacheKind());
    EXPECT_EQ("video/MP2T", response.getMimeType());
    EXPECT_EQ(makeTestBytes(2000), response.getBodyString());
    expectCorsHeaders(response);
}

CORO_TEST(VideosResource, SegmentInVideoDirectory, ioc)
{
    TestMedia media(ioc, "VideosResource.SegmentInVideoDirectory");
    TestRequest request("1/hls/720p/segment_000.ts");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(makeTestBytes(1500), response.getBodyString());
}

CORO_TEST(VideosResource, SegmentRange, ioc)
{
    TestMedia media(ioc, "VideosResource.SegmentRange");
    TestRequest request("5/hls/720p/segment_000.ts");
    request.withHeader(boost::beast::http::field::range, "bytes=1500-");
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(Server::Response::Status::partialContent, response.getStatus());
    EXPECT_EQ("bytes 1500-1999/2000", response.getHeader("Content-Range"));
    EXPECT_EQ(makeTestBytes(2000).substr(1500), response.getBodyString());
}

CORO_TEST(VideosResource, SegmentNotFound, ioc)
{
    TestMedia media(ioc, "VideosResource.SegmentNotFound");
    for (const char *path: { "5/hls/720p/segment_001.ts", "5/hls/720p/notes.txt", "5/hls/360p/segment_000.ts" }) {
        TestRequest request(path);
        co_await testResourceError(media.resource, request, "Segment not found.", Server::ErrorKind::NotFound);
    }
}

CORO_TEST(VideosResource, Options, ioc)
{
    TestMedia media(ioc, "VideosResource.Options");
    TestRequest request("5/hls/720p/index.m3u8", Server::Request::Type::options);
    TestResponse response;
    co_await media(request, response);

    EXPECT_EQ(std::nullopt, response.getErrorKind());
    EXPECT_EQ(Server::CacheKind::none, response.getCacheKind());
    EXPECT_EQ("GET, HEAD, OPTIONS", response.getHeader("Allow"));
    EXPECT_TRUE(response.getBody().empty());
    expectCorsHeaders(response);
}

CORO_TEST(VideosResource, Post, ioc)
{
    TestMedia media(ioc, "VideosResource.Post");
    TestRequest request("1/stream/720p", Server::Request::Type::post);
    co_await testResourceError(media.resource, request, "POST is not supported by this resource.",
                               Server::ErrorKind::UnsupportedType);
}

} // namespace
