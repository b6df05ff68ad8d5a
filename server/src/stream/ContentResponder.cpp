#include "ContentResponder.hpp"

#include "ByteRange.hpp"
#include "mime.hpp"

#include "server/Error.hpp"
#include "server/Response.hpp"
#include "util/asio.hpp"
#include "util/File.hpp"

#include <algorithm>
#include <stdexcept>

Awaitable<void> Stream::ContentResponder::operator()(Server::Response &response, const std::filesystem::path &path,
                                                     std::optional<std::string_view> rangeHeader,
                                                     bool headOnly) const
{
    /* Open the file. It may have gone since the catalog or the caller looked. */
    if (!std::filesystem::is_regular_file(path)) {
        throw Server::Error(Server::ErrorKind::NotFound, "File not found.");
    }
    Util::File file;
    try {
        file = Util::File(ioc, path);
    }
    catch (const std::exception &) {
        if (!std::filesystem::exists(path)) {
            throw Server::Error(Server::ErrorKind::NotFound, "File not found.");
        }
        throw;
    }

    /* Work out what to send. The size on disk is what counts, not what anyone else claims. */
    uint64_t size = file.size();
    ByteRange range = parseRange(rangeHeader, size);
    response.setHeader(boost::beast::http::field::accept_ranges, "bytes");
    switch (range.kind) {
        case ByteRange::Kind::unsatisfiable:
            response.setError(Server::ErrorKind::RangeNotSatisfiable);
            response.setCacheKind(Server::CacheKind::none);
            response.setContentLength(0);
            response.setHeader(boost::beast::http::field::content_range, "bytes */" + std::to_string(size));
            co_return;
        case ByteRange::Kind::partial:
            response.setPartialContent(range.start, range.end, size);
            break;
        case ByteRange::Kind::full:
            response.setContentLength(size);
            break;
    }
    response.setMimeType(std::string(getMimeTypeForVideo(path)));
    if (headOnly) {
        co_return;
    }

    /* Copy the bytes, one bounded chunk at a time. */
    uint64_t offset = range.start;
    uint64_t end = range.start + range.getLength();
    while (offset < end) {
        // A file that shrank since its size was taken makes this throw.
        size_t length = (size_t)std::min<uint64_t>(end - offset, chunkSize);
        std::vector<std::byte> data = co_await file.readExactAt(offset, length);
        offset += length;
        response << std::move(data);
        co_await response.flush();
    }
}
