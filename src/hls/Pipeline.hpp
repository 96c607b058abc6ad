#pragma once

#include "configuration/configuration.hpp"
#include "log/Log.hpp"
#include "remote/RemoteObject.hpp"
#include "util/SingleFlight.hpp"
#include "util/awaitable.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

class IOContext;

namespace Cache
{

class DiskCache;

} // namespace Cache

namespace Ffmpeg
{

class Arguments;

} // namespace Ffmpeg

namespace Remote
{

class DirectSource;

} // namespace Remote

namespace Util
{

class BlockingPool;

} // namespace Util

/**
 * @defgroup hls HLS
 *
 * Transcoding objects into HLS on demand.
 */
/// @addtogroup hls
/// @{

/**
 * Stuff for transcoding objects into HLS.
 */
namespace Hls
{

/**
 * Transcodes video objects into HLS playlists, at most once at a time per object.
 *
 * Each object gets a workspace under the cache's HLS directory. It holds a full copy of the object (`source`) and
 * either a master playlist with three renditions (`master.m3u8`, `v0/`, `v1/`, `v2/`) or a single playlist
 * (`index.m3u8`).
 */
class Pipeline final
{
public:
    /**
     * Cancels any transcodes that are running, without waiting for them. Await shutdown() first to wait.
     */
    ~Pipeline();

    /**
     * @param cache The cache, which owns the directory the workspaces are in.
     * @param direct Where to download sources from when the cache doesn't have them.
     * @param config The transcode configuration.
     * @param useCache Whether sources may be taken from, and added to, the cache.
     */
    explicit Pipeline(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool, Cache::DiskCache &cache,
                      Remote::DirectSource &direct, Config::Transcode config, bool useCache);

    Pipeline(const Pipeline &) = delete;
    Pipeline &operator=(const Pipeline &) = delete;

    /**
     * Determine whether an object looks like a video, by its MIME type or its name.
     */
    static bool isVideo(const Remote::RemoteObject &object);

    /**
     * Get the directory an object's playlists are written to.
     */
    std::filesystem::path getWorkspace(std::string_view id) const;

    /**
     * Determine whether an object has a playlist.
     */
    bool isReady(std::string_view id) const;

    /**
     * Get the URL of an object's playlist.
     *
     * This is the master playlist if there is one.
     */
    std::string urlFor(std::string_view id) const;

    /**
     * Start transcoding an object in the background if it needs it.
     *
     * This does nothing if the object isn't a video, transcoding is disabled, ffmpeg isn't available, the object
     * already has a playlist, or a transcode is already running for it. Failures are logged, and leave no playlist, so
     * the next call tries again.
     *
     * @return True if a new transcode was started.
     */
    bool ensure(const Remote::RemoteObject &object);

    /**
     * Determine whether a transcode is running for an object.
     */
    bool isRunning(std::string_view id) const;

    /**
     * Wait for a running transcode of an object to finish.
     *
     * @return True if no transcode is running any more, or false if the timeout elapsed first.
     */
    Awaitable<bool> waitFor(std::string_view id, std::chrono::steady_clock::duration timeout) const;

    /**
     * Cancel every transcode, and wait for them to stop.
     */
    Awaitable<void> shutdown();

private:
    /**
     * Determine whether ffmpeg can be run, and complain (once) if not.
     */
    bool getFfmpegAvailable();

    /**
     * The body of a transcode.
     */
    Awaitable<void> build(Remote::RemoteObject object);

    /**
     * Put a full copy of an object at a path.
     */
    Awaitable<void> acquireSource(const Remote::RemoteObject &object, const std::filesystem::path &source);

    /**
     * Determine whether the source has audio. Errors give false.
     */
    Awaitable<bool> probeAudio(const Remote::RemoteObject &object, const std::filesystem::path &source);

    /**
     * Run one way of producing a playlist.
     *
     * @param name What to call the stage in the log.
     * @return True if ffmpeg succeeded and the playlist exists.
     */
    Awaitable<bool> runStage(std::string_view name, const Remote::RemoteObject &object,
                             const Ffmpeg::Arguments &arguments);

    IOContext &ioc;
    Log::Log &log;
    Log::Context logContext;
    Util::BlockingPool &blockingPool;
    Cache::DiskCache &cache;
    Remote::DirectSource &direct;
    const Config::Transcode config;
    const bool useCache;

    /**
     * Whether we've already complained that ffmpeg is missing.
     */
    bool warnedUnavailable = false;

    Util::SingleFlight jobs;
};

} // namespace Hls

/// @}
