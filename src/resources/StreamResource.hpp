#pragma once

#include "configuration/configuration.hpp"
#include "fetch/Align.hpp"
#include "log/Log.hpp"
#include "remote/RemoteObject.hpp"
#include "server/Resource.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

class IOContext;

namespace Cache
{

class DiskCache;

} // namespace Cache

namespace Fetch
{

class ClientPool;

} // namespace Fetch

namespace Remote
{

class ByteStream;
class Catalog;
class DirectSource;

} // namespace Remote

namespace Util
{

class BlockingPool;

} // namespace Util

namespace Server
{

struct ByteRange;

/**
 * Serves byte ranges of remote objects, from the cache if possible and from the backend otherwise.
 *
 * The path in the request is the object's ID.
 */
class StreamResource final : public Resource
{
public:
    /**
     * The things a StreamResource serves objects from.
     */
    struct Sources final
    {
        Remote::Catalog &catalog;
        Fetch::ClientPool &clients;

        /**
         * The fallback download API. If this is null and no client is usable, requests fail with 503.
         */
        Remote::DirectSource *direct;

        Cache::DiskCache &cache;
    };

    ~StreamResource() override;

    /**
     * @param blockingPool Where cached files are read when there's no io_uring.
     * @param purpose Whether this is for playback or for downloading. This affects alignment and the
     *                Content-Disposition header.
     * @param fetchConfig The fetch configuration.
     * @param warmDelay How long to wait after a cache miss before starting to cache the object.
     */
    explicit StreamResource(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool, Sources sources,
                            Fetch::Purpose purpose, Config::Fetch fetchConfig,
                            std::chrono::steady_clock::duration warmDelay);

    Awaitable<void> getAsync(Response &response, Request &request) override;

    bool getAllowNonEmptyPath() const noexcept override;

private:
    /**
     * The ways of reading from the backend, in the order they're tried.
     */
    enum class Strategy
    {
        parallel,
        single,
        direct
    };

    /**
     * Get the strategy to fall back to after one fails.
     */
    static Strategy getFallback(Strategy strategy);

    /**
     * Look up an object, correcting its stored size if the backend says otherwise.
     */
    Awaitable<Remote::RemoteObject> resolve(std::string_view id);

    /**
     * Write a range of a cached object.
     */
    Awaitable<void> sendCached(Response &response, const std::filesystem::path &path, const ByteRange &range);

    /**
     * Write a range of an object from the backend.
     *
     * Each strategy that fails hands over to the next, starting from the first byte that hasn't been sent.
     */
    Awaitable<void> sendRemote(Response &response, const Remote::RemoteObject &object, const ByteRange &range);

    /**
     * Start reading with a strategy.
     *
     * @return The stream, or null if the strategy can't be used right now (e.g: there are no usable clients).
     */
    Awaitable<std::unique_ptr<Remote::ByteStream>> open(Strategy strategy, const Remote::RemoteObject &object,
                                                        uint64_t start, uint64_t end);

    IOContext &ioc;
    Log::Log &log;
    Log::Context logContext;
    Util::BlockingPool &blockingPool;
    Sources sources;
    const Fetch::Purpose purpose;
    const Config::Fetch fetchConfig;
    const std::chrono::steady_clock::duration warmDelay;
};

} // namespace Server
