#pragma once

#include "server/CacheKind.hpp"
#include "server/Error.hpp"
#include "server/Request.hpp"
#include "server/Response.hpp"

#include "util/asio.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Server
{

class Resource;

} // namespace Server

/**
 * A test implementation of Server::Request.
 *
 * Handily, that class is abstract to hide away the complexity of interfacing with the HTTP server, so we can just do
 * this.
 */
class TestRequest final : public Server::Request
{
public:
    ~TestRequest() override;

    /**
     * Constructor :)
     *
     * @param path The path of the request.
     * @param type The request type.
     * @param body The request body.
     * @param headOnly Whether it's a HEAD request.
     */
    TestRequest(Server::Path path, Type type = Server::Request::Type::get, std::string_view body = {},
                bool headOnly = false);

    /**
     * Add a header field to the request.
     */
    TestRequest &withHeader(boost::beast::http::field name, std::string value)
    {
        setHeader(name, std::move(value));
        return *this;
    }

private:
    Awaitable<std::vector<std::byte>> doReadSome() override;

    std::vector<std::byte> body;
    bool bodyRead = false;
};

/**
 * A test implementation of Server::Response that records everything a resource does with it.
 */
class TestResponse final : public Server::Response
{
public:
    ~TestResponse() override;
    TestResponse() = default;

    using Response::getCacheKind;
    using Response::getContentLength;
    using Response::getErrorKind;
    using Response::getExtraHeaders;
    using Response::getMimeType;
    using Response::getStatus;

    /**
     * Get an extra header by name, as set by the resource.
     */
    std::optional<std::string> getHeader(std::string_view name) const;

    /**
     * Get everything written to the body.
     */
    std::vector<std::byte> getBody() const;

    std::string getBodyString() const;

    /**
     * Get the body, split the way it was written.
     */
    const std::vector<std::vector<std::byte>> &getChunks() const
    {
        return chunks;
    }

    /**
     * Get the number of times the body was flushed before the end.
     */
    size_t getFlushCount() const
    {
        return flushCount;
    }

    bool getEnded() const
    {
        return ended;
    }

private:
    void writeBody(std::vector<std::byte> data) override;
    Awaitable<void> flushBody(bool end) override;

    std::vector<std::vector<std::byte>> chunks;
    size_t flushCount = 0;
    bool ended = false;
};

/**
 * Read a request's body to the end.
 */
Awaitable<std::vector<std::byte>> readBody(Server::Request &request);

/**
 * Pass a request to a resource and complete the response, the way the server does.
 *
 * Server::Error thrown before anything was written becomes an error response. Anything else is a test failure.
 */
Awaitable<void> runResource(Server::Resource &resource, TestRequest &request, TestResponse &response);

/**
 * Check that the response to a request of a resource is as expected.
 *
 * @param resource The resource to make a request of.
 * @param request The request to pass to the resource.
 * @param result The data that should have been written.
 * @param mimeType The expected MIME type.
 * @param cacheKind The expected cache.
 * @param errorKind The expected error kind.
 */
Awaitable<void> testResource(Server::Resource &resource,
                             TestRequest &request,
                             std::string_view result,
                             std::string_view mimeType = {},
                             Server::CacheKind cacheKind = Server::CacheKind::fixed,
                             std::optional<Server::ErrorKind> errorKind = {});

/**
 * Check that the response to a request of a resource is a given error.
 *
 * Errors are never cached, and have a MIME type that is either text/plain (if the message is present) or unset
 * (otherwise), so this calculates those.
 *
 * @param resource The resource to make a request of.
 * @param request The request to pass to the resource.
 * @param message The expected message of the error.
 * @param errorKind The expected error kind.
 */
inline Awaitable<void> testResourceError(Server::Resource &resource,
                                         TestRequest &request,
                                         std::string_view message,
                                         Server::ErrorKind errorKind)
{
    return testResource(resource, request, message, message.empty() ? std::string_view{} : "text/plain",
                        Server::CacheKind::none, errorKind);
}

/**
 * @copydoc testResourceError
 */
inline Awaitable<void> testResourceError(Server::Resource &resource,
                                         TestRequest &request,
                                         Server::ErrorKind errorKind)
{
    return testResourceError(resource, request, {}, errorKind);
}

/**
 * Format an optional error kind as a human readable string.
 */
std::string errorKindToString(std::optional<Server::ErrorKind> errorKind);
