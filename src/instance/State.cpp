#include "State.hpp"

#include "api/CacheResource.hpp"
#include "api/HlsResource.hpp"
#include "log/FileLog.hpp"
#include "log/MemoryLog.hpp"
#include "resources/FilesystemResource.hpp"
#include "resources/StreamResource.hpp"

namespace
{

/**
 * Create the log the configuration asks for.
 */
std::unique_ptr<Log::Log> createLog(const Config::Log &config, IOContext &ioc, Util::BlockingPool &blockingPool)
{
    if (config.path.empty()) {
        return std::make_unique<Log::MemoryLog>(ioc, config.level, config.print);
    }
    return std::make_unique<Log::FileLog>(ioc, blockingPool, config.path, config.level, config.print);
}

} // Anonymous namespace

Instance::State::~State() = default;

Instance::State::State(Config::Root configIn, IOContext &ioc) :
    ioc(ioc),
    config(std::move(configIn)),
    blockingPool(config.blockingThreads),
    log(createLog(config.log, ioc, blockingPool)),
    logContext((*log)("instance")),
    catalog(config.catalog),
    backend(ioc, blockingPool, config.backend.root),
    clients(ioc, *log, std::chrono::milliseconds(config.fetch.probeTimeout)),
    cache(ioc, *log, blockingPool, catalog, clients, backend, config.cache, config.fetch.parallel),
    pipeline(ioc, *log, blockingPool, cache, backend, config.transcode, config.cache.hls)
{
    /* Register the backend's clients. */
    for (const Config::BackendClient &client: config.backend.clients) {
        clients.add(backend.makeClient(client.name, client.containers), client.fallback);
    }
    logContext << "clients" << Log::Level::info << "Registered " << config.backend.clients.size()
               << " backend clients; catalog has " << catalog.size() << " objects.";
}

Awaitable<void> Instance::State::start()
{
    /* Get the cache into a known state before anything can use it. */
    co_await cache.init();

    /* Start serving. */
    server = std::make_unique<Server::HttpServer>(ioc, *log, config.network, config.http);
    addResources();
}

Awaitable<void> Instance::State::shutdown()
{
    logContext << "shutdown" << Log::Level::info << "Cancelling background work.";

    // Transcodes can be waiting on the cache, so they go first.
    co_await pipeline.shutdown();
    co_await cache.shutdown();
    logContext << "shutdown" << Log::Level::info << "Background work has stopped.";
}

void Instance::State::addResources()
{
    Server::StreamResource::Sources sources = {
        .catalog = catalog,
        .clients = clients,
        .direct = &backend,
        .cache = cache
    };
    std::chrono::steady_clock::duration warmDelay = std::chrono::seconds(config.cache.warmDelay);

    server->addResource<Server::StreamResource>("stream", ioc, *log, blockingPool, sources, Fetch::Purpose::stream,
                                                config.fetch, warmDelay);
    server->addResource<Server::StreamResource>("download", ioc, *log, blockingPool, sources,
                                                Fetch::Purpose::download, config.fetch, warmDelay);
    server->addResource<Server::FilesystemResource>("hls", ioc, blockingPool, cache.getHlsRoot(),
                                                    std::vector<std::string>{ "source" },
                                                    std::vector<std::string>{ ".part" });
    server->addResource<Api::HlsResource>("api/hls", catalog, pipeline);
    server->addResource<Api::CacheResource>("api/cache", catalog, cache);
}
