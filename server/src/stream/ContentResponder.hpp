#pragma once

#include "util/awaitable.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

class IOContext;

namespace Server
{

class Response;

} // namespace Server

namespace Stream
{

/**
 * Writes (part of) a local file to a response, as asked for by a Range header.
 *
 * The responses are:
 * - 200 with the whole file if there's no usable range,
 * - 206 with Content-Range and exactly the requested bytes,
 * - 416 with a Content-Range that gives only the file size, and no body, if the range is outside the file.
 *
 * All of them carry Accept-Ranges, and the 200 and 206 responses carry the file's MIME type and length. The body is
 * read and written in chunks of at most chunkSize bytes. Each chunk is flushed before the next is read, so a slow
 * client never makes us buffer more than one chunk. The caller sets the cache kind.
 */
class ContentResponder final
{
public:
    ContentResponder(IOContext &ioc, size_t chunkSize) : ioc(ioc), chunkSize(chunkSize) {}

    /**
     * Respond with the file.
     *
     * @param response The response to write to. Nothing must have been written to it yet.
     * @param path The file to serve.
     * @param rangeHeader The request's Range header, if any.
     * @param headOnly Set the headers only, without reading the file.
     * @throws Server::Error NotFound if the file doesn't exist.
     * @throws std::exception if reading fails. If that happens after the headers went out, the response is incomplete.
     */
    Awaitable<void> operator()(Server::Response &response, const std::filesystem::path &path,
                               std::optional<std::string_view> rangeHeader, bool headOnly = false) const;

private:
    IOContext &ioc;
    const size_t chunkSize;
};

} // namespace Stream
