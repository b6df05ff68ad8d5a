#include "State.hpp"

#include "log/FileLog.hpp"
#include "log/MemoryLog.hpp"
#include "server/Path.hpp"
#include "stream/VideosResource.hpp"

namespace
{

/**
 * The URL path the videos are served under.
 */
constexpr const char *videosPath = "videos";

/**
 * A file log if the configuration names a path, otherwise an in-memory one.
 */
std::unique_ptr<Log::Log> createLog(const Config::Log &config, IOContext &ioc)
{
    if (config.path.empty()) {
        return std::make_unique<Log::MemoryLog>(ioc, config.level, config.print.value_or(true));
    }
    return std::make_unique<Log::FileLog>(ioc, config.path, config.level, config.print.value_or(false));
}

/**
 * Load the catalog, and say what's in it.
 */
Catalog::JsonCatalog loadCatalog(const Config::Media &config, Log::Log &log)
{
    Log::Context logContext = log("catalog");
    try {
        Catalog::JsonCatalog catalog = Catalog::JsonCatalog::fromFile(config.catalog, config.root);
        logContext << "loaded" << Log::Level::info << "Loaded " << catalog.getVideoCount() << " videos with "
                   << catalog.getVariantCount() << " variants from " << config.catalog << ".";
        return catalog;
    }
    catch (const Catalog::LoadException &e) {
        logContext << "error" << Log::Level::fatal << e.what();
        throw;
    }
}

} // namespace

Instance::State::~State() = default;

Instance::State::State(const Config::Root &config, IOContext &ioc) :
    config(config),
    log(createLog(this->config.log, ioc)),
    catalog(loadCatalog(this->config.media, *log)),
    server(ioc, *log, this->config.network, this->config.http)
{
    server.addResource<Stream::VideosResource>(videosPath, ioc, catalog, "/" + std::string(videosPath),
                                               this->config.media, this->config.streaming, this->config.hls);
}
