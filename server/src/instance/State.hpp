#pragma once

#include "catalog/JsonCatalog.hpp"
#include "configuration/configuration.hpp"
#include "log/Log.hpp"
#include "server/HttpServer.hpp"

#include <memory>

class IOContext;

/**
 * Contains the process-wide state of the streaming server.
 */
namespace Instance
{

/**
 * Everything the server needs while it runs: the configuration, the log, the catalog, and the HTTP server with its
 * resources registered.
 *
 * The configuration is fixed for the life of the object.
 */
class State final
{
public:
    ~State();

    /**
     * Set everything up and start listening.
     *
     * @throws Catalog::LoadException if the catalog can't be loaded.
     */
    explicit State(const Config::Root &config, IOContext &ioc);

    Server::Server &getServer()
    {
        return server;
    }

    Log::Log &getLog()
    {
        return *log;
    }

    const Catalog::Catalog &getCatalog() const
    {
        return catalog;
    }

    const Config::Root &getConfiguration() const
    {
        return config;
    }

private:
    const Config::Root config;
    std::unique_ptr<Log::Log> log;
    Catalog::JsonCatalog catalog;
    Server::HttpServer server;
};

} // namespace Instance
