#include "StreamResource.hpp"

#include "cache/DiskCache.hpp"
#include "fetch/ClientPool.hpp"
#include "fetch/ParallelFetch.hpp"
#include "fetch/RangeReader.hpp"
#include "remote/Catalog.hpp"
#include "remote/Client.hpp"
#include "remote/Exceptions.hpp"
#include "server/Range.hpp"
#include "server/Request.hpp"
#include "server/Response.hpp"
#include "util/asio.hpp"
#include "util/File.hpp"

#include <algorithm>

namespace
{

/**
 * Get the value of the Content-Disposition header for an object.
 */
std::string getContentDisposition(Fetch::Purpose purpose, std::string_view name)
{
    // Keep the quoted string valid whatever the name contains.
    std::string safeName;
    for (char c: name) {
        safeName += (c == '"' || c == '\\' || (unsigned char)c < 0x20 || c == 0x7f) ? '_' : c;
    }
    return std::string(purpose == Fetch::Purpose::download ? "attachment" : "inline") + "; filename=\"" + safeName +
           "\"";
}

} // namespace

Server::StreamResource::~StreamResource() = default;

Server::StreamResource::StreamResource(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool,
                                       Sources sources, Fetch::Purpose purpose, Config::Fetch fetchConfig,
                                       std::chrono::steady_clock::duration warmDelay) :
    ioc(ioc), log(log), logContext(log(purpose == Fetch::Purpose::download ? "download" : "stream")),
    blockingPool(blockingPool), sources(sources), purpose(purpose), fetchConfig(std::move(fetchConfig)),
    warmDelay(warmDelay)
{
}

Awaitable<void> Server::StreamResource::getAsync(Response &response, Request &request)
{
    /* Find the object. */
    if (request.getPath().size() != 1) {
        throw Error(ErrorKind::NotFound);
    }
    Remote::RemoteObject object = co_await resolve(request.getPath().front());

    /* Figure out what to send. */
    response.setHeader(boost::beast::http::field::accept_ranges, "bytes");
    std::optional<ByteRange> range = parseRange(request.getHeader(boost::beast::http::field::range), object.size);
    if (!range) {
        response.setHeader(boost::beast::http::field::content_range, "bytes */" + std::to_string(object.size));
        throw Error(ErrorKind::RangeNotSatisfiable, "Range starts beyond the end of the object.");
    }

    /* Headers. */
    response.setCacheKind(CacheKind::none);
    response.setMimeType(object.mimeType);
    response.setHeader(boost::beast::http::field::content_disposition, getContentDisposition(purpose, object.name));
    response.setContentLength(range->size());
    if (range->partial) {
        response.setPartial();
        response.setHeader(boost::beast::http::field::content_range, range->getContentRange(object.size));
    }

    /* Cache hits keep the file around for longer. Misses get the object cached for next time. */
    Cache::DiskCache &cache = sources.cache;
    bool cached = cache.getEnabled() && cache.isCached(object.id, object.size);
    if (cached) {
        co_await cache.touch(cache.pathFor(object.id));
    }
    else if (cache.getEnabled()) {
        cache.scheduleWarm(object, warmDelay);
    }

    /* Body. */
    if (response.getBodyDiscarded() || range->size() == 0) {
        co_return;
    }
    if (cached) {
        co_await sendCached(response, cache.pathFor(object.id), *range);
    }
    else {
        co_await sendRemote(response, object, *range);
    }
}

bool Server::StreamResource::getAllowNonEmptyPath() const noexcept
{
    return true;
}

Server::StreamResource::Strategy Server::StreamResource::getFallback(Strategy strategy)
{
    switch (strategy) {
        case Strategy::parallel: return Strategy::single;
        case Strategy::single: return Strategy::direct;
        case Strategy::direct: break;
    }
    throw std::logic_error("There's nothing to fall back to after the download API.");
}

Awaitable<Remote::RemoteObject> Server::StreamResource::resolve(std::string_view id)
{
    try {
        Cache::DiskCache::checkId(id);
    }
    catch (const std::invalid_argument &e) {
        throw Error(ErrorKind::BadRequest, e.what());
    }
    std::optional<Remote::RemoteObject> object = sources.catalog.resolve(id);
    if (!object || object->folder) {
        throw Error(ErrorKind::NotFound);
    }

    /* A complete cached copy has the real size. */
    std::optional<uint64_t> actualSize;
    if (sources.cache.isCached(object->id, object->size)) {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(sources.cache.pathFor(object->id), ec);
        if (!ec) {
            actualSize = size;
        }
    }

    /* Otherwise, ask the backend if there's a client free to do so. */
    else {
        Fetch::ClientPool::Lease lease = co_await sources.clients.selectUsable(object->containerRef, 1);
        if (!lease.empty()) {
            try {
                Remote::ObjectHandle handle =
                    co_await lease.getClients().front()->getObjectHandle(object->containerRef, object->locator);
                actualSize = handle.declaredSize;
            }
            catch (const std::exception &e) {
                if (isCancellation(e)) {
                    throw;
                }
                logContext << "probe" << Log::Level::debug << "Could not check the size of " << object->id << ": "
                           << e.what();
            }
        }
    }

    /* Correct the stored size. */
    if (actualSize && *actualSize != object->size) {
        logContext << "size" << Log::Level::info << object->id << " is " << *actualSize << " bytes, not "
                   << object->size << ".";
        object->size = *actualSize;
        sources.catalog.updateSize(object->id, *actualSize);
    }
    co_return *object;
}

Awaitable<void> Server::StreamResource::sendCached(Response &response, const std::filesystem::path &path,
                                                   const ByteRange &range)
{
    Util::File file(ioc, blockingPool, path);
    file.seek(range.start);
    uint64_t remaining = range.size();
    while (remaining > 0) {
        std::vector<std::byte> data =
            co_await file.readSome((size_t)std::min<uint64_t>(remaining, Util::File::defaultReadSize));
        if (data.empty()) {
            throw Remote::ShortReadError("Cached file " + path.string() + " is shorter than expected.");
        }
        remaining -= data.size();
        response << std::move(data);
        co_await response.flush();
    }
}

Awaitable<void> Server::StreamResource::sendRemote(Response &response, const Remote::RemoteObject &object,
                                                   const ByteRange &range)
{
    uint64_t next = range.start;
    Strategy strategy = fetchConfig.parallel ? Strategy::parallel : Strategy::single;
    while (true) {
        /* Start reading from the first byte we haven't sent yet. */
        std::unique_ptr<Remote::ByteStream> stream = co_await open(strategy, object, next, range.end);
        if (!stream) {
            if (strategy == Strategy::direct) {
                throw Error(ErrorKind::Unavailable, "No client can read this object right now.");
            }
            strategy = getFallback(strategy);
            continue;
        }

        /* Copy to the response until the stream ends or fails. */
        bool failed = false;
        while (true) {
            std::vector<std::byte> data;
            try {
                data = co_await stream->readSome();
            }
            catch (const std::exception &e) {
                if (isCancellation(e) || strategy == Strategy::direct) {
                    throw;
                }
                logContext << "fallback" << Log::Level::warning << "Reading " << object.id << " failed at byte "
                           << next << ": " << e.what();
                failed = true;
            }
            if (failed || data.empty()) {
                break;
            }
            next += data.size();
            response << std::move(data);
            co_await response.flush();
        }

        /* Make sure the stream has given back its clients before anything else wants them. */
        co_await stream->stop();
        if (!failed) {
            co_return;
        }
        strategy = getFallback(strategy);
    }
}

Awaitable<std::unique_ptr<Remote::ByteStream>> Server::StreamResource::open(Strategy strategy,
                                                                            const Remote::RemoteObject &object,
                                                                            uint64_t start, uint64_t end)
{
    const Config::FetchMode &mode = (purpose == Fetch::Purpose::download) ? fetchConfig.download : fetchConfig.stream;
    switch (strategy) {
        case Strategy::parallel: {
            Fetch::ClientPool::Lease lease = co_await sources.clients.selectUsable(object.containerRef, mode.workers);
            if (lease.empty()) {
                co_return nullptr;
            }
            if (lease.size() == 1) {
                // A single client is better off just reading sequentially.
                co_return std::make_unique<Fetch::RangeReader>(std::move(lease), object.containerRef,
                                                               object.locator, start, end, object.size, purpose);
            }
            co_return std::make_unique<Fetch::ParallelFetch>(ioc, log, std::move(lease), object.containerRef,
                                                             object.locator, start, end, object.size, purpose,
                                                             mode.chunkSize);
        }
        case Strategy::single: {
            Fetch::ClientPool::Lease lease = co_await sources.clients.selectUsable(object.containerRef, 1);
            if (lease.empty()) {
                co_return nullptr;
            }
            co_return std::make_unique<Fetch::RangeReader>(std::move(lease), object.containerRef, object.locator,
                                                           start, end, object.size, purpose);
        }
        case Strategy::direct: {
            if (!sources.direct) {
                co_return nullptr;
            }
            logContext << "direct" << Log::Level::info << "Reading " << object.id << " from byte " << start
                       << " with the download API.";
            co_return std::make_unique<Fetch::RangeReader>(*sources.direct, object.containerRef, object.locator,
                                                           start, end);
        }
    }
    co_return nullptr;
}
