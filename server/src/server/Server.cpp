#include "Server.hpp"

#include "Error.hpp"
#include "Request.hpp"
#include "Response.hpp"

#include "log/Log.hpp"
#include "util/asio.hpp"
#include "util/debug.hpp"

#include <optional>
#include <stdexcept>

/// @addtogroup server
/// @{
/// @defgroup server_implementation Implementation
/// @}

/// @addtogroup server_implementation
/// @{

namespace
{

const char *getErrorKindString(Server::ErrorKind kind)
{
    switch (kind) {
        case Server::ErrorKind::BadRequest: return "Bad request";
        case Server::ErrorKind::Forbidden: return "Forbidden";
        case Server::ErrorKind::NotFound: return "Not found";
        case Server::ErrorKind::UnsupportedType: return "Unsupported request type";
        case Server::ErrorKind::RangeNotSatisfiable: return "Range not satisfiable";
        case Server::ErrorKind::Internal: return "Internal";
    }
    unreachable();
}

const char *getRequestTypeString(Server::Request::Type type)
{
    switch (type) {
        case Server::Request::Type::get: return "get";
        case Server::Request::Type::post: return "post";
        case Server::Request::Type::put: return "put";
        case Server::Request::Type::options: return "options";
    }
    unreachable();
}

} // namespace

/// @}

Server::Server::~Server() = default;

Server::Server::Server(Log::Log &log) : log(log), logContext(log("server"))
{
}

void Server::Server::insert(const Path &path, std::unique_ptr<Resource> resource)
{
    const std::string pathString = path;

    Node *node = &root;
    for (size_t i = 0; i < path.size(); i++) {
        if (node->resource) {
            throw std::runtime_error("Can't add \"" + pathString + "\" below an existing resource.");
        }
        std::unique_ptr<Node> &child = node->children[path[i]];
        if (!child) {
            child = std::make_unique<Node>();
        }
        node = child.get();
    }

    if (node->resource) {
        throw std::runtime_error("There's already a resource at \"" + pathString + "\".");
    }
    if (!node->children.empty()) {
        throw std::runtime_error("Can't add \"" + pathString + "\" above existing resources.");
    }
    node->resource = std::move(resource);
    logContext << "added" << Log::Level::info << "/" << pathString;
}

Server::Resource &Server::Server::find(Request &request) const
{
    const Node *node = &root;
    while (!node->resource) {
        if (request.getPath().empty()) {
            // There's no listing of what's below.
            throw Error(node->children.empty() ? ErrorKind::NotFound : ErrorKind::Forbidden);
        }
        auto it = node->children.find(request.getPath().front());
        if (it == node->children.end()) {
            throw Error(ErrorKind::NotFound);
        }
        node = it->second.get();
        request.popPathPart();
    }

    Resource &resource = *node->resource;
    if (!request.getPath().empty() && !resource.getAllowNonEmptyPath()) {
        throw Error(ErrorKind::NotFound);
    }
    request.setMaxLength(resource.getMaxRequestLength());
    return resource;
}

Awaitable<void> Server::Server::operator()(Response &response, Request &request) const
{
    Log::Context requestLog = log("request");
    requestLog << "what" << Log::Level::info << getRequestTypeString(request.getType()) << " /"
               << (std::string)request.getPath();

    std::optional<Error> error;
    try {
        Resource &resource = find(request);
        co_await resource(response, request);
    }
    catch (const Error &e) {
        error = e;
    }
    catch (const std::exception &e) {
        // The details stay in the log.
        requestLog << "exception" << Log::Level::error << e.what();
        error = Error(ErrorKind::Internal);
    }

    if (!error) {
        co_await response.flush(true);
        co_return;
    }

    /* Once the headers are out, the status can't change. Closing the connection is the only way to tell the client. */
    if (response.getWriteStarted()) {
        requestLog << "aborted" << Log::Level::error << getErrorKindString(error->kind)
                   << " after the response started" << (error->message.empty() ? "." : ": ") << error->message;
        response.abort();
        co_return;
    }

    requestLog << "error" << Log::Level::info << getErrorKindString(error->kind)
               << (error->message.empty() ? "" : ": ") << error->message;
    response.setErrorAndMessage(error->kind, error->message);
    co_await response.flush(true);
}
