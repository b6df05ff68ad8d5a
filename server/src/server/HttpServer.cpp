#include "HttpServer.hpp"

#include "CacheKind.hpp"
#include "Error.hpp"
#include "Request.hpp"
#include "Response.hpp"

#include "configuration/configuration.hpp"
#include "log/Log.hpp"
#include "util/asio.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/write.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

#include <ctime>

#include "util/debug.hpp"

/// @addtogroup server_implementation
/// @{

namespace
{

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using RequestParser = http::request_parser<http::buffer_body>;

/**
 * The largest request body the parser will let through. Resources enforce their own, much smaller, limits.
 */
constexpr uint64_t maxParserBodyLength = (uint64_t)1 << 32;

/**
 * The request header fields resources can see.
 */
constexpr http::field forwardedFields[] = {
    http::field::range,
    http::field::if_range,
    http::field::host,
    http::field::user_agent
};

/**
 * Format an endpoint as "[address]:port" for IPv6, or "address:port" for IPv4.
 */
std::string describe(const tcp::endpoint &endpoint)
{
    const boost::asio::ip::address &address = endpoint.address();
    std::string port = std::to_string(endpoint.port());
    if (address.is_v6()) {
        return "[" + address.to_string() + "]:" + port;
    }
    return address.to_string() + ":" + port;
}

/**
 * The current time as an IMF-fixdate, e.g: "Sun, 06 Nov 1994 08:49:37 GMT".
 */
std::string httpDate()
{
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);

    char buffer[64];
    size_t length = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return { buffer, length };
}

http::status toHttpStatus(Server::ErrorKind kind)
{
    switch (kind) {
        case Server::ErrorKind::BadRequest: return http::status::bad_request;
        case Server::ErrorKind::Forbidden: return http::status::forbidden;
        case Server::ErrorKind::NotFound: return http::status::not_found;
        case Server::ErrorKind::UnsupportedType: return http::status::method_not_allowed;
        case Server::ErrorKind::RangeNotSatisfiable: return http::status::range_not_satisfiable;
        case Server::ErrorKind::Internal: return http::status::internal_server_error;
    }
    unreachable();
}

http::status toHttpStatus(Server::Response::Status status)
{
    switch (status) {
        case Server::Response::Status::ok: return http::status::ok;
        case Server::Response::Status::partialContent: return http::status::partial_content;
        case Server::Response::Status::redirect: return http::status::found;
    }
    unreachable();
}

/**
 * HEAD is served as a GET whose body is dropped.
 *
 * @return std::nullopt for methods no resource can handle.
 */
std::optional<Server::Request::Type> toRequestType(http::verb verb)
{
    switch (verb) {
        case http::verb::get:
        case http::verb::head:
            return Server::Request::Type::get;
        case http::verb::post: return Server::Request::Type::post;
        case http::verb::put: return Server::Request::Type::put;
        case http::verb::options: return Server::Request::Type::options;
        default: return std::nullopt;
    }
}

/**
 * The state of one TCP connection. HttpServer::Connection derives from this so the Beast types stay out of the header.
 */
struct Connection
{
    explicit Connection(tcp::socket socket) : socket(std::move(socket)) {}

    tcp::socket socket;

    /**
     * Bytes read from the socket but not consumed by a parser yet. Survives from one request to the next.
     */
    boost::beast::flat_buffer buffer;

    /**
     * Requests handled so far, counting the current one.
     */
    unsigned int requestCount = 0;
};

/**
 * A request whose body is read from the connection by the parser that read its header.
 */
class HttpRequest final : public Server::Request
{
public:
    ~HttpRequest() override = default;

    /**
     * @param parser Must have finished the header.
     */
    explicit HttpRequest(RequestParser &parser, Connection &connection, Server::Path path, Type type, bool headOnly) :
        Request(std::move(path), type, headOnly), parser(parser), connection(connection)
    {
        for (http::field name: forwardedFields) {
            auto it = parser.get().find(name);
            if (it != parser.get().end()) {
                setHeader(name, std::string(it->value()));
            }
        }
    }

private:
    Awaitable<std::vector<std::byte>> doReadSome() override
    {
        std::vector<std::byte> chunk(readChunkSize);
        while (!parser.is_done()) {
            http::buffer_body::value_type &body = parser.get().body();
            body.data = chunk.data();
            body.size = chunk.size();
            co_await http::async_read_some(connection.socket, connection.buffer, parser, boost::asio::use_awaitable);

            // async_read_some can finish without producing any body bytes, e.g: when it only read a chunk header.
            size_t length = chunk.size() - body.size;
            if (length > 0) {
                chunk.resize(length);
                co_return chunk;
            }
        }
        co_return std::vector<std::byte>{};
    }

    static constexpr size_t readChunkSize = 1 << 16;

    RequestParser &parser;
    Connection &connection;
};

/**
 * A response written to the connection with a Beast serializer.
 *
 * Body data is held until the next flush. If the resource never announced a length, the first flush sends everything
 * with a Content-Length when it's also the last, and switches to chunked encoding otherwise.
 */
class HttpResponse final : public Server::Response
{
public:
    ~HttpResponse() override = default;

    /**
     * @param headOnly Send the headers only, as for HEAD.
     * @param cacheable Whether the method allows Cache-Control to be sent.
     */
    explicit HttpResponse(Connection &connection, const Config::Http &httpConfig, bool keepAlive, bool headOnly,
                          bool cacheable) :
        connection(connection), httpConfig(httpConfig), headOnly(headOnly), cacheable(cacheable)
    {
        message.keep_alive(keepAlive);
    }

    bool isError() const
    {
        return (bool)getErrorKind();
    }

private:
    void writeBody(std::vector<std::byte> data) override
    {
        pending.insert(pending.end(), data.begin(), data.end());
    }

    Awaitable<void> flushBody(bool end) override
    {
        std::vector<std::byte> data = std::move(pending);
        pending.clear();

        if (!serializer.is_header_done()) {
            std::optional<uint64_t> contentLength = getContentLength();
            if (!contentLength && end) {
                contentLength = data.size();
            }
            co_await sendHeader(contentLength);
        }

        if (headOnly) {
            co_return;
        }

        if (message.chunked()) {
            co_await sendChunk(data, end);
        }
        else {
            co_await sendSized(data, end);
        }
    }

    /**
     * Beast's serializer doesn't handle a chunked buffer_body that's written in several calls, so the chunks are
     * framed by hand.
     */
    Awaitable<void> sendChunk(const std::vector<std::byte> &data, bool end)
    {
        if (!data.empty()) {
            co_await boost::asio::async_write(connection.socket,
                                              http::make_chunk(boost::asio::const_buffer(data.data(), data.size())),
                                              boost::asio::use_awaitable);
        }
        if (end) {
            co_await boost::asio::async_write(connection.socket, http::make_chunk_last(), boost::asio::use_awaitable);
        }
    }

    /**
     * With a known length, the serializer takes the body a piece at a time. It reports need_buffer when it has used
     * up a piece and more is set, which is expected.
     */
    Awaitable<void> sendSized(std::vector<std::byte> &data, bool end)
    {
        message.body().data = data.empty() ? nullptr : data.data();
        message.body().size = data.size();
        message.body().more = !end;

        boost::system::error_code ec;
        co_await http::async_write(connection.socket, serializer,
                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec && ec != http::error::need_buffer) {
            throw boost::system::system_error(ec);
        }
    }

    Awaitable<void> sendHeader(std::optional<uint64_t> contentLength)
    {
        message.result(getErrorKind() ? toHttpStatus(*getErrorKind()) : toHttpStatus(getStatus()));
        message.set(http::field::server, "Videoflix Streamer");
        message.set(http::field::date, httpDate());

        if (cacheable) {
            unsigned int maxAge = getMaxAge();
            message.set(http::field::cache_control, maxAge ? "public, max-age=" + std::to_string(maxAge) : "no-cache");
        }
        if (httpConfig.origin) {
            message.set(http::field::access_control_allow_origin, *httpConfig.origin);
        }
        if (!getMimeType().empty()) {
            message.set(http::field::content_type, getMimeType());
        }
        for (const auto &[name, value]: getExtraHeaders()) {
            message.set(name, value);
        }

        if (contentLength) {
            message.content_length(*contentLength);
        }
        else {
            message.chunked(true);
        }

        co_await http::async_write_header(connection.socket, serializer, boost::asio::use_awaitable);
    }

    unsigned int getMaxAge() const
    {
        switch (getCacheKind()) {
            case Server::CacheKind::none: return 0;
            case Server::CacheKind::fixed: return httpConfig.cacheFixedTime;
            case Server::CacheKind::segment: return httpConfig.cacheSegmentTime;
        }
        unreachable();
    }

    Connection &connection;
    const Config::Http &httpConfig;
    const bool headOnly;
    const bool cacheable;

    http::response<http::buffer_body> message;
    http::response_serializer<http::buffer_body> serializer{message};

    /**
     * Body data written since the last flush.
     */
    std::vector<std::byte> pending;
};

} // namespace

/// @}

struct Server::HttpServer::Connection final : public ::Connection
{
    using ::Connection::Connection;
};

Server::HttpServer::~HttpServer() = default;

Server::HttpServer::HttpServer(IOContext &ioc, Log::Log &log, const Config::Network &networkConfig,
                               const Config::Http &httpConfig) :
    Server(log), ioc(ioc), networkConfig(networkConfig), httpConfig(httpConfig), listenContext(log("listen"))
{
    spawnDetached(ioc, listenContext, "Listener", [this]() -> Awaitable<void> { return listen(); },
                  Log::Level::fatal);
}

Awaitable<bool> Server::HttpServer::onRequest(Connection &connection)
{
    RequestParser parser;
    parser.header_limit(1 << 16);
    parser.body_limit(maxParserBodyLength);
    try {
        co_await http::async_read_header(connection.socket, connection.buffer, parser, boost::asio::use_awaitable);
    }
    catch (const boost::system::system_error &e) {
        // The client closing the connection between requests is the normal way for a connection to end.
        if (e.code() == http::error::end_of_stream && !parser.got_some()) {
            co_return false;
        }
        throw;
    }
    connection.requestCount++;

    http::verb method = parser.get().method();
    HttpResponse response(connection, httpConfig, parser.keep_alive(), method == http::verb::head,
                          method == http::verb::get || method == http::verb::head);

    /* Requests that can't reach a resource get an error, and the connection is closed since their body (if any) is
       still unread. */
    std::optional<ErrorKind> rejection;
    std::optional<Request::Type> type = toRequestType(method);
    std::optional<Path> path;
    if (!type) {
        rejection = ErrorKind::UnsupportedType;
    }
    else {
        try {
            path.emplace(std::string_view(parser.get().target().data(), parser.get().target().size()));
        }
        catch (const Path::Exception &) {
            rejection = ErrorKind::Forbidden;
        }
    }
    if (rejection) {
        response.setErrorAndMessage(*rejection);
        co_await response.flush(true);
        connection.buffer.clear();
        co_return false;
    }

    HttpRequest request(parser, connection, std::move(*path), *type, method == http::verb::head);
    co_await (*this)(response, request);

    // The client saw a truncated response, and the only way to tell it so is to close the connection.
    if (response.getAborted()) {
        connection.buffer.clear();
        co_return false;
    }

    /* Any body the resource didn't read is still in the stream, in front of the next request. */
    bool unreadBody = false;
    try {
        unreadBody = !(co_await request.readSome()).empty();
    }
    catch (const Error &) {
        unreadBody = true;
    }
    if (unreadBody) {
        if (response.isError()) {
            connection.buffer.clear();
            co_return false;
        }
        throw std::runtime_error("Resource left part of the request body unread.");
    }

    co_return parser.keep_alive();
}

Awaitable<void> Server::HttpServer::onConnection(Connection &connection)
{
    Log::Context connectionContext = log("connection");
    try {
        connectionContext << "endpoints" << Log::Level::info << describe(connection.socket.remote_endpoint())
                          << " -> " << describe(connection.socket.local_endpoint());

        while (co_await onRequest(connection)) {}

        if (connection.buffer.size() > 0) {
            throw std::runtime_error("Unparsed data after the last request.");
        }
    }
    catch (const std::exception &e) {
        connectionContext << Log::Level::error << "Connection failed after " << connection.requestCount
                          << " requests: " << e.what();
    }

    boost::system::error_code ec;
    connection.socket.close(ec);
    if (ec) {
        connectionContext << Log::Level::warning << "Closing socket: " << ec.message();
    }
}

Awaitable<void> Server::HttpServer::listen()
{
    Log::Context acceptorContext = log("acceptor");

    tcp::acceptor acceptor(ioc, tcp::endpoint(tcp::v6(), networkConfig.port));
    acceptorContext << "listening" << Log::Level::info << "Listening on " << describe(acceptor.local_endpoint())
                    << ".";

    while (true) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor.async_accept(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            acceptorContext << Log::Level::error << "Accepting a connection: " << ec.message();
            continue;
        }

        spawnDetached(ioc, [this, socket = std::move(socket)]() mutable -> Awaitable<void> {
            Connection connection(std::move(socket));
            co_await onConnection(connection);
        });
    }
}
