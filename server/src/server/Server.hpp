#pragma once

#include "Resource.hpp"

#include "log/Log.hpp"

#include <map>
#include <memory>
#include <string>

/**
 * @defgroup server Server
 *
 * Request routing and the HTTP server.
 */
/// @addtogroup server
/// @{

/**
 * Contains the request routing and the HTTP server.
 *
 * The video streaming resources live in Stream but are served through this.
 */
namespace Server
{

class Path;
class Request;
class Response;

/**
 * Routes requests to the resources registered at their paths, and turns whatever the resource throws into a response.
 *
 * Resources are registered at startup and live as long as the server. The HTTP server subclasses this to feed it
 * requests from the network, and the tests subclass it to feed it requests directly.
 */
class Server
{
public:
    virtual ~Server();

    /**
     * Create a resource and register it.
     *
     * @tparam ResourceType A subclass of Resource.
     * @param path Where to register it. Requests for this path and, if the resource allows it, paths below it go to the
     *             resource.
     * @param args Forwarded to the resource's constructor.
     * @return The new resource, owned by the server.
     * @throws std::runtime_error if something is already registered at the path, below it, or above it.
     */
    template <typename ResourceType, typename... Args>
    ResourceType &addResource(const Path &path, Args &&...args)
    {
        auto resource = std::make_unique<ResourceType>(std::forward<Args>(args)...);
        ResourceType &result = *resource;
        insert(path, std::move(resource));
        return result;
    }

protected:
    explicit Server(Log::Log &log);

    /**
     * Handle a request, from finding its resource to ending its response.
     *
     * Nothing the resource throws escapes. An error before anything was written becomes an error response. An error
     * after that aborts the response.
     *
     * @param request Its path is made relative to the resource before the resource sees it.
     */
    Awaitable<void> operator()(Response &response, Request &request) const;

    Log::Log &log;

    /**
     * For things that aren't about a particular request.
     */
    Log::Context logContext;

private:
    /**
     * A point in the routing tree. A node either has a resource or children, never both.
     */
    struct Node final
    {
        std::unique_ptr<Resource> resource;
        std::map<std::string, std::unique_ptr<Node>> children;
    };

    void insert(const Path &path, std::unique_ptr<Resource> resource);

    /**
     * Find the resource for a request, popping the path parts that lead to it.
     *
     * @throws Error NotFound if there's nothing there, or Forbidden for a path that only has resources below it.
     */
    Resource &find(Request &request) const;

    Node root;
};

} // namespace Server

/// @}
