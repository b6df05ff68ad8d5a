#include "Resource.hpp"

#include "Error.hpp"
#include "Request.hpp"
#include "Response.hpp"

#include "util/asio.hpp"
#include "util/debug.hpp"

#include <string>

Server::Resource::~Resource() = default;

Awaitable<void> Server::Resource::getAsync(Response &, Request &)
{
    unsupportedHttpVerb("GET");
}

Awaitable<void> Server::Resource::postAsync(Response &, Request &)
{
    unsupportedHttpVerb("POST");
}

Awaitable<void> Server::Resource::putAsync(Response &, Request &)
{
    unsupportedHttpVerb("PUT");
}

Awaitable<void> Server::Resource::optionsAsync(Response &response, Request &)
{
    response.setCacheKind(CacheKind::none);
    response.setHeader(boost::beast::http::field::allow, "GET, HEAD, OPTIONS");
    co_return;
}

Awaitable<void> Server::Resource::operator()(Response &response, Request &request)
{
    switch (request.getType()) {
        case Request::Type::get: return getAsync(response, request);
        case Request::Type::post: return postAsync(response, request);
        case Request::Type::put: return putAsync(response, request);
        case Request::Type::options: return optionsAsync(response, request);
    }
    unreachable();
}

size_t Server::Resource::getMaxRequestLength() const noexcept
{
    return 0;
}

bool Server::Resource::getAllowNonEmptyPath() const noexcept
{
    return false;
}

void Server::Resource::unsupportedHttpVerb(std::string_view verb) const
{
    throw Error(ErrorKind::UnsupportedType, std::string(verb) + " is not supported by this resource.");
}
