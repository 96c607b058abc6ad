#pragma once

#include "cache/DiskCache.hpp"
#include "configuration/configuration.hpp"
#include "fetch/ClientPool.hpp"
#include "hls/Pipeline.hpp"
#include "log/Log.hpp"
#include "remote/DirectoryBackend.hpp"
#include "remote/JsonCatalog.hpp"
#include "server/HttpServer.hpp"
#include "util/BlockingPool.hpp"

#include <memory>

class IOContext;

/**
 * Stuff relating to a running instance of the streaming service.
 */
namespace Instance
{

/**
 * Everything that one running instance of the service owns.
 *
 * Objects are constructed in dependency order, and destroyed in the reverse order, so anything that holds a reference
 * to another part of the state outlives nothing it refers to.
 */
class State final
{
public:
    ~State();

    /**
     * Build the objects that make up the service.
     *
     * Nothing is listening until start() is called.
     *
     * @param config The validated configuration.
     */
    explicit State(Config::Root config, IOContext &ioc);

    State(const State &) = delete;
    State &operator=(const State &) = delete;

    /**
     * Prepare the cache, then start serving requests.
     */
    Awaitable<void> start();

    /**
     * Cancel all background work, and wait for it to stop.
     *
     * This has to finish before the state is destroyed.
     */
    Awaitable<void> shutdown();

    const Config::Root &getConfiguration() const
    {
        return config;
    }

    Log::Log &getLog()
    {
        return *log;
    }

    Remote::JsonCatalog &getCatalog()
    {
        return catalog;
    }

    Cache::DiskCache &getCache()
    {
        return cache;
    }

    Hls::Pipeline &getPipeline()
    {
        return pipeline;
    }

    /**
     * Get the HTTP server.
     *
     * @return The server, or null if start() hasn't finished.
     */
    Server::HttpServer *getServer()
    {
        return server.get();
    }

private:
    /**
     * Register every resource with the server.
     */
    void addResources();

    IOContext &ioc;
    const Config::Root config;
    Util::BlockingPool blockingPool;
    std::unique_ptr<Log::Log> log;
    Log::Context logContext;
    Remote::JsonCatalog catalog;
    Remote::DirectoryBackend backend;
    Fetch::ClientPool clients;
    Cache::DiskCache cache;
    Hls::Pipeline pipeline;
    std::unique_ptr<Server::HttpServer> server;
};

} // namespace Instance
