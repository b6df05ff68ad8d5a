#include "Response.hpp"

#include "util/asio.hpp"

Server::Response::~Response() = default;

void Server::Response::setErrorAndMessage(ErrorKind kind, std::string_view message)
{
    setError(kind);
    status = Status::ok;
    extraHeaders.clear(); // Headers for a successful response don't apply any more.
    setCacheKind(CacheKind::none);
    setMimeType(message.empty() ? "" : "text/plain");
    contentLength = message.size();
    if (!message.empty()) {
        (*this) << message;
    }
}

void Server::Response::setPartialContent(uint64_t start, uint64_t end, uint64_t total)
{
    assert(start <= end && end < total);
    status = Status::partialContent;
    setContentLength(end - start + 1);
    setHeader(boost::beast::http::field::content_range,
              "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total));
}

void Server::Response::setRedirect(std::string url)
{
    status = Status::redirect;
    setContentLength(0);
    setHeader(boost::beast::http::field::location, std::move(url));
}

Awaitable<void> Server::Response::flush(bool end)
{
    Awaitable<void> result = flushBody(end);
    writeStarted = true; // We've now started writing. This is after flushBody() so it can detect the first write.
    return result;
}
