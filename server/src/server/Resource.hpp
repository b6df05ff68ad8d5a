#pragma once

#include <cstddef>
#include <string_view>

#include "util/awaitable.hpp"

namespace Server
{

class Request;
class Response;

/**
 * A resource that can be registered with a server.
 *
 * Think of it like an HTTP resource. If the first line of a request is `GET /videos/42/stream/720p HTTP/1.1` and a
 * resource is registered at `videos`, then this object handles the request with the path `42/stream/720p`.
 */
class Resource
{
public:
    virtual ~Resource();

    /**
     * Service a request for the resource. Override the ones for the HTTP verbs you want to support. The defaults throw
     * Error(UnsupportedType), except OPTIONS, which answers with an Allow header.
     *
     * @param response The response to (set up and) write to.
     * @param request The request to service. Its path is relative to this resource.
     */
    virtual Awaitable<void> getAsync(Response &response, Request &request);
    virtual Awaitable<void> postAsync(Response &response, Request &request);
    virtual Awaitable<void> putAsync(Response &response, Request &request);
    virtual Awaitable<void> optionsAsync(Response &response, Request &request);

    /**
     * Dispatch a request to one of the above by its type.
     */
    Awaitable<void> operator()(Response &response, Request &request);

    /**
     * The maximum number of bytes in the request body. Default is zero.
     */
    virtual size_t getMaxRequestLength() const noexcept;

    /**
     * Determine whether this resource can respond to requests with a non-empty path.
     *
     * If this returns false, then operator() is only called for an empty path. The default is false.
     */
    virtual bool getAllowNonEmptyPath() const noexcept;

protected:
    /**
     * Throw an error describing that the given HTTP verb is not supported.
     */
    [[noreturn]] void unsupportedHttpVerb(std::string_view verb) const;
};

} // namespace Server
