#pragma once

#include "Path.hpp"

#include <boost/beast/http/field.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/awaitable.hpp"

namespace Server
{

/**
 * A server request.
 *
 * The request stores information from the request line and headers: the path, the request type and header fields.
 * The body can be read with readSome().
 *
 * This is subclassed by the HTTP server to hook up the body to the socket, and by the tests.
 */
class Request
{
public:
    /**
     * Represents a request type.
     *
     * These types have the same meaning as their counterparts in HTTP.
     */
    enum class Type
    {
        /**
         * HTTP GET.
         *
         * This is also used for HEAD requests. The HTTP layer discards the body, and resources can skip producing it.
         * See getHeadOnly().
         */
        get,

        /**
         * HTTP POST.
         */
        post,

        /**
         * HTTP PUT.
         */
        put,

        /**
         * HTTP OPTIONS, mostly for CORS preflight.
         */
        options
    };

    virtual ~Request();
    explicit Request(Path path, Type type, bool headOnly = false) :
        path(std::move(path)), type(type), headOnly(headOnly)
    {
    }

    /**
     * Transform this request into a request from within its outer-most path part.
     *
     * I.e: if the request is for a/b/c, it'll be for b/c after this method has been called.
     */
    void popPathPart()
    {
        path.pop_front();
    }

    /**
     * Get the path for this request, relative to the resource handling it.
     */
    const Path &getPath() const
    {
        return path;
    }

    Type getType() const
    {
        return type;
    }

    /**
     * Whether only the headers of the response will be sent, as for HTTP HEAD.
     *
     * The headers must still be the ones a GET would get, including the Content-Length.
     */
    bool getHeadOnly() const
    {
        return headOnly;
    }

    /**
     * Get the value of a header field.
     *
     * @return The value, or std::nullopt if the request didn't have the field.
     */
    std::optional<std::string_view> getHeader(boost::beast::http::field name) const;

    /**
     * Read some data from the request body.
     *
     * @return The data that was read. This returns an empty result when the request body is finished.
     * @throws Error BadRequest if more than the maximum length has been read.
     */
    Awaitable<std::vector<std::byte>> readSome();

    /**
     * Get the number of body bytes read so far.
     */
    size_t getBytesRead() const
    {
        return bytesRead;
    }

    /**
     * Reject bodies longer than this. Default is 0.
     */
    void setMaxLength(size_t bytes);

protected:
    /**
     * Record a header field. Subclasses call this while constructing the request.
     */
    void setHeader(boost::beast::http::field name, std::string value)
    {
        headers[name] = std::move(value);
    }

    /**
     * Read some data from the request body.
     *
     * @return The data that was read, or empty at the end of the body.
     */
    virtual Awaitable<std::vector<std::byte>> doReadSome() = 0;

private:
    void checkMaxLength() const;

    Path path;
    const Type type;
    const bool headOnly;
    std::map<boost::beast::http::field, std::string> headers;

    size_t bytesRead = 0;
    size_t maxLength = 0;
};

} // namespace Server
