#include "DiskCache.hpp"

#include "fetch/ClientPool.hpp"
#include "fetch/ParallelFetch.hpp"
#include "remote/Catalog.hpp"
#include "remote/Client.hpp"
#include "remote/Exceptions.hpp"
#include "util/asio.hpp"
#include "util/BlockingPool.hpp"

#include <algorithm>
#include <fstream>

namespace
{

/**
 * Determine whether a path is of an incomplete file.
 */
bool isPartial(const std::filesystem::path &path)
{
    return path.extension() == ".part";
}

/**
 * Get the temporary path that's used while building a cache file.
 *
 * @param tag Set for the ways of building a file other than downloading it, so that none of them share a file.
 */
std::filesystem::path getPartPath(const std::filesystem::path &path, std::string_view tag = {})
{
    std::filesystem::path result = path;
    if (!tag.empty()) {
        result += ".";
        result += tag;
    }
    result += ".part";
    return result;
}

/**
 * Hard link a file, or copy it if that fails (e.g: because the destination is on another filesystem).
 */
void linkOrCopyFile(const std::filesystem::path &source, const std::filesystem::path &destination)
{
    std::filesystem::remove(destination);
    std::error_code ec;
    std::filesystem::create_hard_link(source, destination, ec);
    if (ec) {
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing);
    }
}

} // namespace

Cache::TrimResult Cache::trimDirectory(const std::filesystem::path &root, uint64_t budget)
{
    struct Entry final
    {
        std::filesystem::path path;
        uint64_t size;
        std::filesystem::file_time_type mtime;
    };

    /* Find all the complete files. */
    TrimResult result;
    std::vector<Entry> entries;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(
             root, std::filesystem::directory_options::skip_permission_denied, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc) || isPartial(it->path())) {
            continue;
        }
        uint64_t size = it->file_size(entryEc);
        std::filesystem::file_time_type mtime = it->last_write_time(entryEc);
        if (entryEc) {
            // Something else removed it.
            continue;
        }
        entries.push_back({ it->path(), size, mtime });
        result.bytesUsed += size;
    }
    if (result.bytesUsed <= budget) {
        return result;
    }

    /* Remove the oldest files first. */
    std::sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) {
        return a.mtime != b.mtime ? a.mtime < b.mtime : a.path < b.path;
    });
    for (const Entry &entry: entries) {
        if (result.bytesUsed <= budget) {
            break;
        }
        std::error_code removeEc;
        if (!std::filesystem::remove(entry.path, removeEc) || removeEc) {
            result.failures++;
            continue;
        }
        result.filesRemoved++;
        result.bytesRemoved += entry.size;
        result.bytesUsed -= entry.size;
    }
    return result;
}

Cache::DiskCache::~DiskCache() = default;

Cache::DiskCache::DiskCache(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool, Remote::Catalog &catalog,
                            Fetch::ClientPool &clients, Remote::DirectSource &direct, Config::Cache config,
                            bool parallel) :
    ioc(ioc), log(log), logContext(log("cache")), blockingPool(blockingPool), catalog(catalog), clients(clients),
    direct(direct), config(std::move(config)), parallel(parallel), root(this->config.root), warms(ioc, log, "warm"),
    scheduled(ioc, log, "scheduled-warm"), trimMutex(ioc)
{
    if (root.empty()) {
        throw std::invalid_argument("The cache root must be set.");
    }
}

void Cache::DiskCache::checkId(std::string_view id)
{
    if (id.empty() || id == "." || id == ".." || id.find('/') != std::string_view::npos ||
        id.find('\\') != std::string_view::npos || id.find('\0') != std::string_view::npos) {
        throw std::invalid_argument("Invalid object ID \"" + std::string(id) + "\".");
    }
}

Awaitable<void> Cache::DiskCache::init()
{
    if (!config.enabled) {
        logContext << "init" << Log::Level::info << "The cache is disabled.";
        co_return;
    }

    std::filesystem::path filesDir = root / "files";
    std::filesystem::path hlsDir = getHlsRoot();
    co_await blockingPool.run([filesDir, hlsDir]() {
        std::filesystem::create_directories(filesDir);
        std::filesystem::create_directories(hlsDir);
    });
    logContext << "init" << Log::Level::info << "Cache root is " << root.string() << ".";
    co_await trim();
}

Awaitable<void> Cache::DiskCache::shutdown()
{
    scheduled.cancelAll();
    warms.cancelAll();
    co_await scheduled.drain();
    co_await warms.drain();
}

std::filesystem::path Cache::DiskCache::getHlsRoot() const
{
    return root / "hls";
}

std::filesystem::path Cache::DiskCache::pathFor(std::string_view id) const
{
    checkId(id);
    return root / "files" / (std::string(id) + ".bin");
}

bool Cache::DiskCache::isCached(std::string_view id, std::optional<uint64_t> expectedSize) const
{
    std::error_code ec;
    std::filesystem::path path = pathFor(id);
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    if (!expectedSize) {
        return true;
    }
    uint64_t size = std::filesystem::file_size(path, ec);
    return !ec && size >= *expectedSize;
}

Awaitable<void> Cache::DiskCache::touch(const std::filesystem::path &path)
{
    co_await blockingPool.run([path]() {
        std::error_code ec;
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now(), ec);
    });
}

Awaitable<Cache::TrimResult> Cache::DiskCache::trim()
{
    uint64_t budget = config.getMaxSizeBytes();
    if (!config.enabled || budget == 0) {
        co_return TrimResult{};
    }

    Mutex::LockGuard lock = co_await trimMutex.lockGuard();
    std::filesystem::path trimRoot = root;
    TrimResult result = co_await blockingPool.run([trimRoot, budget]() {
        return trimDirectory(trimRoot, budget);
    });

    if (result.filesRemoved > 0) {
        logContext << "trim" << Log::Level::info << "Removed " << result.filesRemoved << " files ("
                   << result.bytesRemoved << " bytes). " << result.bytesUsed << " bytes remain.";
    }
    if (result.failures > 0) {
        logContext << "trim" << Log::Level::warning << "Failed to remove " << result.failures << " files.";
    }
    co_return result;
}

bool Cache::DiskCache::getCacheable(const Remote::RemoteObject &object, uint64_t size) const
{
    if (!config.enabled || object.folder || size == 0) {
        return false;
    }
    uint64_t budget = config.getMaxSizeBytes();
    return budget == 0 || size <= budget;
}

bool Cache::DiskCache::warm(const Remote::RemoteObject &object)
{
    checkId(object.id);
    if (!getCacheable(object, object.size)) {
        logContext << "skip" << Log::Level::debug << object.id << " is not cacheable.";
        return false;
    }
    return warms.start(object.id, [this, object]() -> Awaitable<void> {
        co_await runWarm(object);
    });
}

void Cache::DiskCache::scheduleWarm(const Remote::RemoteObject &object, std::chrono::steady_clock::duration delay)
{
    if (!getCacheable(object, object.size)) {
        return;
    }
    scheduled.start(object.id, [this, object, delay]() -> Awaitable<void> {
        co_await sleepFor(delay);
        warm(object);
    });
}

bool Cache::DiskCache::isWarming(std::string_view id) const
{
    return warms.isRunning(std::string(id));
}

Awaitable<bool> Cache::DiskCache::waitFor(std::string_view id, std::chrono::steady_clock::duration timeout) const
{
    co_return co_await warms.join(std::string(id), timeout);
}

Awaitable<bool> Cache::DiskCache::linkOrCopy(const Remote::RemoteObject &object,
                                             const std::filesystem::path &destination)
{
    if (!isCached(object.id, object.size)) {
        co_return false;
    }
    std::filesystem::path source = pathFor(object.id);
    co_await blockingPool.run([source, destination]() {
        linkOrCopyFile(source, destination);
    });
    co_await touch(source);
    co_return true;
}

bool Cache::DiskCache::adopt(const Remote::RemoteObject &object, const std::filesystem::path &source)
{
    checkId(object.id);
    if (!getCacheable(object, object.size)) {
        return false;
    }
    return warms.start(object.id, [this, object, source]() -> Awaitable<void> {
        co_await runAdopt(object, source);
    });
}

Awaitable<void> Cache::DiskCache::runWarm(Remote::RemoteObject object)
{
    std::filesystem::path path = pathFor(object.id);
    if (std::optional<Remote::RemoteObject> current = catalog.resolve(object.id)) {
        object.size = current->size;
    }

    /* If it's already cached, just mark it as used. */
    if (isCached(object.id, object.size)) {
        co_await touch(path);
        co_return;
    }

    /* Download into a temporary file, and rename it into place once it's complete. */
    std::exception_ptr error;
    try {
        std::filesystem::path part = getPartPath(path);
        auto start = std::chrono::steady_clock::now();
        uint64_t size = co_await download(object, part);
        co_await blockingPool.run([part, path]() {
            std::filesystem::rename(part, path);
            std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now());
        });
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                              start);
        logContext << "warm" << Log::Level::info << "Cached " << object.id << " (" << size << " bytes) in "
                   << duration.count() << " ms.";
    }
    catch (const std::exception &e) {
        logContext << "warm" << Log::Level::warning << "Failed to cache " << object.id << ": " << e.what();
        error = std::current_exception();
    }

    /* Trim whether or not that worked. */
    co_await trim();
    if (error) {
        std::rethrow_exception(error);
    }
}

Awaitable<void> Cache::DiskCache::runAdopt(Remote::RemoteObject object, std::filesystem::path source)
{
    /* Build the cache entry beside its final path, and rename it into place. */
    std::filesystem::path path = pathFor(object.id);
    std::filesystem::path part = getPartPath(path, "adopt");
    co_await blockingPool.run([source, path, part]() {
        linkOrCopyFile(source, part);
        std::filesystem::rename(part, path);
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now());
    });
    logContext << "adopt" << Log::Level::info << "Cached " << object.id << " from " << source.string() << ".";
    co_await trim();
}

Awaitable<uint64_t> Cache::DiskCache::download(const Remote::RemoteObject &object, const std::filesystem::path &part)
{
    Fetch::ClientPool::Lease lease =
        co_await clients.selectUsable(object.containerRef, parallel ? std::max(config.workers, 1u) : 1);

    /* The stored size can be stale, so ask the backend when we can. */
    uint64_t size = object.size;
    if (!lease.empty()) {
        Remote::ObjectHandle handle =
            co_await lease.getClients().front()->getObjectHandle(object.containerRef, object.locator);
        if (handle.declaredSize != size) {
            logContext << "size" << Log::Level::info << object.id << " is " << handle.declaredSize
                       << " bytes, not " << size << ".";
            size = handle.declaredSize;
            catalog.updateSize(object.id, size);
        }
        if (!getCacheable(object, size)) {
            throw std::runtime_error("Object is not cacheable at " + std::to_string(size) + " bytes.");
        }
    }

    /* Start from an empty file of the full size, so the workers can write their chunks anywhere in it. */
    co_await blockingPool.run([part, size]() {
        std::filesystem::remove(part);
        std::ofstream(part, std::ios::binary);
        std::filesystem::resize_file(part, size);
    });

    if (lease.empty()) {
        logContext << "direct" << Log::Level::info << "No usable client for " << object.id
                   << ", so using the download API.";
        co_await direct.downloadTo(object.containerRef, object.locator, part);

        // The download API writes the file from scratch, so it can end up shorter than expected.
        uint64_t written = co_await blockingPool.run([part]() {
            return (uint64_t)std::filesystem::file_size(part);
        });
        if (written < size) {
            throw Remote::ShortReadError("Download produced " + std::to_string(written) + " of " +
                                         std::to_string(size) + " bytes.");
        }
    }
    else {
        co_await Fetch::ParallelFetch::downloadTo(ioc, log, blockingPool, std::move(lease), object.containerRef,
                                                  object.locator, size, config.chunkSize, part);
    }
    co_return size;
}
