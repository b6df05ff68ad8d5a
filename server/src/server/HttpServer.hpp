#pragma once

#include "Server.hpp"
#include "util/awaitable.hpp"

class IOContext;

namespace Config
{

struct Http;
struct Network;

} // namespace Config

namespace Server
{

/**
 * Serves the registered resources over HTTP/1.1.
 *
 * Requests on one connection are handled one after another. The connection is reused unless the client asked for it
 * to be closed, the request couldn't be parsed, or a response failed part way through.
 */
class HttpServer final : public Server
{
public:
    ~HttpServer() override;

    /**
     * Start accepting connections on the configured port.
     *
     * Nothing happens until the IOContext runs. Accepting continues for as long as the object lives.
     *
     * @param log Connections and requests are logged here.
     */
    explicit HttpServer(IOContext &ioc, Log::Log &log, const Config::Network &networkConfig,
                        const Config::Http &httpConfig);

private:
    /**
     * The socket and its read buffer. Defined in the source file, to keep Beast out of this header.
     */
    struct Connection;

    /**
     * Read one request from the connection and respond to it.
     *
     * @return Whether the connection can carry another request.
     */
    Awaitable<bool> onRequest(Connection &connection);

    /**
     * Serve requests from a new connection until it should close, then close it.
     */
    Awaitable<void> onConnection(Connection &connection);

    /**
     * Accept connections forever.
     */
    Awaitable<void> listen();

    IOContext &ioc;
    const Config::Network &networkConfig;
    const Config::Http &httpConfig;

    /**
     * Where failures of the listening coroutine are reported.
     */
    Log::Context listenContext;
};

} // namespace Server
