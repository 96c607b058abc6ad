#pragma once

#include "configuration/configuration.hpp"
#include "log/Log.hpp"
#include "remote/RemoteObject.hpp"
#include "util/Mutex.hpp"
#include "util/SingleFlight.hpp"
#include "util/awaitable.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

class IOContext;

namespace Fetch
{

class ClientPool;

} // namespace Fetch

namespace Remote
{

class Catalog;
class DirectSource;

} // namespace Remote

namespace Util
{

class BlockingPool;

} // namespace Util

/**
 * @defgroup cache Cache
 *
 * The local disk cache of whole objects.
 */
/// @addtogroup cache
/// @{

/**
 * Stuff for caching remote objects on the local disk.
 */
namespace Cache
{

/**
 * What a trim did.
 */
struct TrimResult final
{
    size_t filesRemoved = 0;
    uint64_t bytesRemoved = 0;

    /**
     * The bytes used by complete files afterwards.
     */
    uint64_t bytesUsed = 0;

    /**
     * The number of files that should have been removed but couldn't be.
     */
    size_t failures = 0;
};

/**
 * Remove the least recently used files in a directory tree until it fits in a budget.
 *
 * Files whose names end in .part are neither counted nor removed. This blocks, so it belongs on a BlockingPool.
 *
 * @param root The directory tree to trim.
 * @param budget The most bytes the complete files may use.
 */
TrimResult trimDirectory(const std::filesystem::path &root, uint64_t budget);

/**
 * A cache of whole remote objects on the local disk.
 *
 * The layout is:
 *  - `files/<id>.bin`: complete objects.
 *  - `files/<id>.bin.part`: objects that are still being downloaded. These have the object's full size from the start,
 *    with the unwritten parts left as holes.
 *  - `files/<id>.bin.adopt.part`: objects being copied in from elsewhere.
 *  - `hls/<id>/`: transcode workspaces, which are owned by the HLS pipeline but trimmed along with everything else.
 */
class DiskCache final
{
public:
    /**
     * Cancels everything that's in flight, without waiting for it. Await shutdown() first to wait.
     */
    ~DiskCache();

    /**
     * @param catalog Told about objects whose real size differs from what it said.
     * @param clients The clients to download with.
     * @param direct The download API to use when no client is usable.
     * @param config The cache configuration. Its root must already be filled in.
     * @param parallel Whether downloads may use more than one client.
     */
    explicit DiskCache(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool, Remote::Catalog &catalog,
                       Fetch::ClientPool &clients, Remote::DirectSource &direct, Config::Cache config, bool parallel);

    DiskCache(const DiskCache &) = delete;
    DiskCache &operator=(const DiskCache &) = delete;

    /**
     * Check that an object ID can be used to build paths.
     *
     * @throws std::invalid_argument If the ID is empty or could be used to escape the cache root.
     */
    static void checkId(std::string_view id);

    /**
     * Create the directories, then trim once.
     *
     * A disabled cache leaves the disk alone.
     */
    Awaitable<void> init();

    /**
     * Cancel every warm (including scheduled ones and adoptions), and wait for them to stop.
     */
    Awaitable<void> shutdown();

    bool getEnabled() const
    {
        return config.enabled;
    }

    const std::filesystem::path &getRoot() const
    {
        return root;
    }

    /**
     * Get the directory the HLS workspaces live in.
     */
    std::filesystem::path getHlsRoot() const;

    /**
     * Get where an object is cached when it's complete.
     */
    std::filesystem::path pathFor(std::string_view id) const;

    /**
     * Determine whether an object's complete file is in the cache.
     *
     * @param expectedSize If given, the file must be at least this big.
     */
    bool isCached(std::string_view id, std::optional<uint64_t> expectedSize = std::nullopt) const;

    /**
     * Mark a file as recently used.
     */
    Awaitable<void> touch(const std::filesystem::path &path);

    /**
     * Remove the least recently used files until the cache fits in its budget.
     *
     * Only one trim runs at a time. This does nothing if the cache is disabled or its budget is zero or less.
     */
    Awaitable<TrimResult> trim();

    /**
     * Start downloading an object into the cache in the background.
     *
     * Folders, empty objects, and objects bigger than the whole budget are skipped. So is anything that already has a
     * warm or an adoption running. The warm refreshes the file's modification time instead if the object is already
     * cached. Failures are logged, and leave no complete file behind.
     *
     * The catalog's size for the object is used if it has one, since an earlier download may have corrected it.
     *
     * @return True if a new warm was started.
     */
    bool warm(const Remote::RemoteObject &object);

    /**
     * Start a warm after a delay.
     *
     * Scheduling the same object again before the delay is up does nothing.
     */
    void scheduleWarm(const Remote::RemoteObject &object, std::chrono::steady_clock::duration delay);

    /**
     * Determine whether a warm or an adoption is running for an object.
     */
    bool isWarming(std::string_view id) const;

    /**
     * Wait for a running warm or adoption of an object to finish.
     *
     * @return True if no warm is running any more, or false if the timeout elapsed first.
     */
    Awaitable<bool> waitFor(std::string_view id, std::chrono::steady_clock::duration timeout) const;

    /**
     * Put a cached object somewhere else.
     *
     * This makes a hard link, or a copy if linking isn't possible.
     *
     * @return False if the object isn't cached.
     */
    Awaitable<bool> linkOrCopy(const Remote::RemoteObject &object, const std::filesystem::path &destination);

    /**
     * Start putting a complete copy of an object that was obtained elsewhere into the cache, in the background.
     *
     * This runs in place of a warm, so the two never build the same entry at once. It does nothing if the cache is
     * disabled, the object is too big, or a warm or adoption is already running for it. Use waitFor() to wait for it.
     *
     * @param source The complete object. It's linked (or copied) rather than moved, and must stay put until this
     *               finishes.
     * @return True if the adoption was started.
     */
    bool adopt(const Remote::RemoteObject &object, const std::filesystem::path &source);

private:
    /**
     * Determine whether an object is worth caching at all.
     */
    bool getCacheable(const Remote::RemoteObject &object, uint64_t size) const;

    /**
     * The body of a warm.
     */
    Awaitable<void> runWarm(Remote::RemoteObject object);

    /**
     * The body of an adoption.
     */
    Awaitable<void> runAdopt(Remote::RemoteObject object, std::filesystem::path source);

    /**
     * Download an object into a file.
     *
     * If a client says the object's size isn't what the catalog said, the catalog is corrected.
     *
     * @return The size that was downloaded.
     */
    Awaitable<uint64_t> download(const Remote::RemoteObject &object, const std::filesystem::path &part);

    IOContext &ioc;
    Log::Log &log;
    Log::Context logContext;
    Util::BlockingPool &blockingPool;
    Remote::Catalog &catalog;
    Fetch::ClientPool &clients;
    Remote::DirectSource &direct;
    const Config::Cache config;
    const bool parallel;
    const std::filesystem::path root;

    /**
     * The warms and adoptions that are running, by object ID.
     */
    Util::SingleFlight warms;

    /**
     * The delays before warms.
     */
    Util::SingleFlight scheduled;

    Mutex trimMutex;
};

} // namespace Cache

/// @}
