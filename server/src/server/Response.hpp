#pragma once

#include "CacheKind.hpp"
#include "Error.hpp"

#include <boost/beast/http/field.hpp>

#include <cassert>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "util/awaitable.hpp"

namespace Server
{

/**
 * What a resource sends back: a status line and headers, then a body.
 *
 * Every setter must be called before the first write or flush, since that's when the headers may go out. A resource
 * that has nothing to send still gets its headers sent, because Server::operator() always ends with flush(true).
 *
 * The HTTP server subclasses this to write to a socket. The tests subclass it to capture the result.
 */
class Response
{
public:
    /**
     * The status when there's no error. An error from setError() overrides it.
     */
    enum class Status
    {
        /// 200 OK.
        ok,

        /// 206 Partial Content. See setPartialContent().
        partialContent,

        /// 302 Found. See setRedirect().
        redirect
    };

    virtual ~Response();

    Response(const Response &) = delete;
    Response &operator=(const Response &) = delete;

    /**
     * Whether body data has been written or flushed, so the headers may have gone out.
     */
    bool getWriteStarted() const
    {
        return writeStarted;
    }

    /**
     * Make this an error response. The status, headers and body are still up to the caller, as for a 416.
     */
    void setError(ErrorKind kind)
    {
        assert(!getWriteStarted());
        errorKind = kind;
    }

    /**
     * Replace everything set so far with a plain error response.
     *
     * Headers set earlier are dropped, caching is turned off, and the message (if any) becomes a text/plain body. Only
     * flush() may be called afterwards.
     */
    void setErrorAndMessage(ErrorKind kind, std::string_view message = {});

    /**
     * 206 for the inclusive byte range [start, end] of total bytes. Sets Content-Range and the content length.
     */
    void setPartialContent(uint64_t start, uint64_t end, uint64_t total);

    /**
     * 302 to the given URL, with an empty body.
     */
    void setRedirect(std::string url);

    /**
     * CacheKind::fixed unless set.
     */
    void setCacheKind(CacheKind kind)
    {
        assert(!getWriteStarted());
        cacheKind = kind;
    }

    /**
     * No Content-Type is sent unless this is set.
     */
    void setMimeType(std::string type)
    {
        assert(!getWriteStarted());
        mimeType = std::move(type);
    }

    /**
     * Promise a body of exactly this many bytes. Otherwise the HTTP layer has to find out the length by itself.
     */
    void setContentLength(uint64_t length)
    {
        assert(!getWriteStarted());
        contentLength = length;
    }

    /**
     * Set any header that doesn't have its own setter, e.g: Accept-Ranges or Access-Control-Allow-Methods.
     */
    void setHeader(std::string name, std::string value)
    {
        assert(!getWriteStarted());
        extraHeaders[std::move(name)] = std::move(value);
    }

    void setHeader(boost::beast::http::field name, std::string value)
    {
        setHeader(std::string(boost::beast::http::to_string(name)), std::move(value));
    }

    /**
     * Append to the body. Nothing is guaranteed to be sent before the next flush().
     */
    Response &operator<<(std::vector<std::byte> data)
    {
        writeBody(std::move(data));
        writeStarted = true; // After writeBody(), so it can tell the first write apart.
        return *this;
    }

    Response &operator<<(std::span<const std::byte> data)
    {
        return (*this) << std::vector<std::byte>(data.begin(), data.end());
    }

    Response &operator<<(std::string_view string)
    {
        return (*this) << std::span((const std::byte *)string.data(), string.size());
    }

    /**
     * Send what's been written so far, and wait until it's been handed to the network.
     *
     * Streaming resources flush after each chunk, which bounds how much is buffered for a slow client.
     *
     * @param end No more body follows. Only Server::operator() passes true.
     */
    Awaitable<void> flush(bool end = false);

    /**
     * Give up on a response whose headers have already gone out. The connection is closed rather than reused.
     */
    void abort()
    {
        aborted = true;
    }

    bool getAborted() const
    {
        return aborted;
    }

protected:
    Response() = default;

    std::optional<ErrorKind> getErrorKind() const
    {
        return errorKind;
    }

    Status getStatus() const
    {
        return status;
    }

    CacheKind getCacheKind() const
    {
        return cacheKind;
    }

    const std::string &getMimeType() const
    {
        return mimeType;
    }

    std::optional<uint64_t> getContentLength() const
    {
        return contentLength;
    }

    const std::map<std::string, std::string> &getExtraHeaders() const
    {
        return extraHeaders;
    }

private:
    /**
     * Take body data. It needn't be sent until flushBody().
     */
    virtual void writeBody(std::vector<std::byte> data) = 0;

    /**
     * Send the headers if they haven't been, then the body data written so far.
     */
    virtual Awaitable<void> flushBody(bool end) = 0;

    std::optional<ErrorKind> errorKind;
    Status status = Status::ok;
    CacheKind cacheKind = CacheKind::fixed;
    std::string mimeType;
    std::optional<uint64_t> contentLength;
    std::map<std::string, std::string> extraHeaders;
    bool writeStarted = false;
    bool aborted = false;
};

} // namespace Server
