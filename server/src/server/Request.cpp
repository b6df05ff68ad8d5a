#include "Request.hpp"

#include "Error.hpp"

#include "util/asio.hpp"

Server::Request::~Request() = default;

std::optional<std::string_view> Server::Request::getHeader(boost::beast::http::field name) const
{
    if (auto it = headers.find(name); it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

Awaitable<std::vector<std::byte>> Server::Request::readSome()
{
    std::vector<std::byte> data = co_await doReadSome();
    bytesRead += data.size();
    checkMaxLength();
    co_return data;
}

void Server::Request::setMaxLength(size_t bytes)
{
    maxLength = bytes;
    checkMaxLength();
}

void Server::Request::checkMaxLength() const
{
    if (bytesRead > maxLength) {
        throw Error(ErrorKind::BadRequest, "Request body longer than " + std::to_string(maxLength) + " bytes.");
    }
}
