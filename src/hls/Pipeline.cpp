#include "Pipeline.hpp"

#include "cache/DiskCache.hpp"
#include "ffmpeg/Arguments.hpp"
#include "ffmpeg/Process.hpp"
#include "ffmpeg/ffprobe.hpp"
#include "remote/Client.hpp"
#include "util/asio.hpp"
#include "util/BlockingPool.hpp"
#include "util/subprocess.hpp"
#include "util/util.hpp"

Hls::Pipeline::~Pipeline() = default;

Hls::Pipeline::Pipeline(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool, Cache::DiskCache &cache,
                        Remote::DirectSource &direct, Config::Transcode config, bool useCache) :
    ioc(ioc), log(log), logContext(log("hls")), blockingPool(blockingPool), cache(cache), direct(direct),
    config(std::move(config)), useCache(useCache), jobs(ioc, log, "transcode")
{
}

bool Hls::Pipeline::isVideo(const Remote::RemoteObject &object)
{
    if (object.mimeType.starts_with("video")) {
        return true;
    }
    for (std::string_view extension: { ".mp4", ".mkv", ".webm", ".mov", ".avi", ".mpeg", ".mpg" }) {
        if (Util::endsWithCaseInsensitive(object.name, extension)) {
            return true;
        }
    }
    return false;
}

std::filesystem::path Hls::Pipeline::getWorkspace(std::string_view id) const
{
    Cache::DiskCache::checkId(id);
    return cache.getHlsRoot() / id;
}

bool Hls::Pipeline::isReady(std::string_view id) const
{
    std::filesystem::path workspace = getWorkspace(id);
    std::error_code ec;
    return std::filesystem::exists(workspace / "index.m3u8", ec) ||
           std::filesystem::exists(workspace / "master.m3u8", ec);
}

std::string Hls::Pipeline::urlFor(std::string_view id) const
{
    std::error_code ec;
    bool hasMaster = std::filesystem::exists(getWorkspace(id) / "master.m3u8", ec);
    return "/hls/" + std::string(id) + (hasMaster ? "/master.m3u8" : "/index.m3u8");
}

bool Hls::Pipeline::ensure(const Remote::RemoteObject &object)
{
    if (!config.enabled || object.folder || !isVideo(object) || !getFfmpegAvailable() || isReady(object.id)) {
        return false;
    }
    return jobs.start(object.id, [this, object]() -> Awaitable<void> {
        co_await build(object);
    });
}

bool Hls::Pipeline::isRunning(std::string_view id) const
{
    return jobs.isRunning(std::string(id));
}

Awaitable<bool> Hls::Pipeline::waitFor(std::string_view id, std::chrono::steady_clock::duration timeout) const
{
    co_return co_await jobs.join(std::string(id), timeout);
}

Awaitable<void> Hls::Pipeline::shutdown()
{
    jobs.cancelAll();
    co_await jobs.drain();
}

bool Hls::Pipeline::getFfmpegAvailable()
{
    if (!Subprocess::findExecutable(config.ffmpeg).empty()) {
        return true;
    }
    if (!warnedUnavailable) {
        logContext << "unavailable" << Log::Level::warning << "ffmpeg (" << config.ffmpeg
                   << ") was not found, so HLS is disabled.";
        warnedUnavailable = true;
    }
    return false;
}

Awaitable<void> Hls::Pipeline::build(Remote::RemoteObject object)
{
    std::filesystem::path workspace = getWorkspace(object.id);
    std::filesystem::path source = workspace / "source";
    logContext << "sourcing" << Log::Level::info << object.id;

    /* Get a full copy of the object. */
    bool haveSource = co_await blockingPool.run([workspace, source]() {
        std::filesystem::create_directories(workspace);
        return std::filesystem::exists(source);
    });
    if (!haveSource) {
        co_await acquireSource(object, source);
    }

    /* Something might have finished a playlist while we were getting the source. */
    if (isReady(object.id)) {
        co_return;
    }

    /* Try each way of producing a playlist, from best to most compatible. */
    co_await blockingPool.run([workspace]() {
        for (const char *rendition: { "v0", "v1", "v2" }) {
            std::filesystem::create_directories(workspace / rendition);
        }
    });
    logContext << "probing" << Log::Level::info << object.id;
    bool audio = co_await probeAudio(object, source);
    if (co_await runStage("multi", object,
                          Ffmpeg::Arguments::hlsMultiRendition(source, workspace, config.segmentDuration, audio))) {
        co_return;
    }
    if (co_await runStage("copy", object, Ffmpeg::Arguments::hlsCopy(source, workspace, config.segmentDuration))) {
        co_return;
    }
    if (co_await runStage("full", object,
                          Ffmpeg::Arguments::hlsTranscode(source, workspace, config.segmentDuration))) {
        co_return;
    }
    logContext << "failed" << Log::Level::error << "Could not produce a playlist for " << object.id << ".";
}

Awaitable<void> Hls::Pipeline::acquireSource(const Remote::RemoteObject &object, const std::filesystem::path &source)
{
    /* Use the cache if it has the object, or will have it soon. */
    bool cacheUsable = useCache && cache.getEnabled();
    if (cacheUsable) {
        if (co_await cache.linkOrCopy(object, source)) {
            logContext << "source" << Log::Level::info << object.id << ": from the cache.";
            co_return;
        }
        if (cache.isWarming(object.id)) {
            co_await cache.waitFor(object.id, std::chrono::milliseconds(config.sourceWaitTimeout));
            if (co_await cache.linkOrCopy(object, source)) {
                logContext << "source" << Log::Level::info << object.id << ": from the cache, after waiting.";
                co_return;
            }
        }
    }

    /* Download it, and only give it its real name once it's complete. */
    std::filesystem::path part = source;
    part += ".part";
    co_await direct.downloadTo(object.containerRef, object.locator, part);
    co_await blockingPool.run([part, source]() {
        std::filesystem::rename(part, source);
    });
    logContext << "source" << Log::Level::info << object.id << ": downloaded.";

    /* Share it with the cache. */
    if (cacheUsable && !cache.isCached(object.id, object.size) && cache.adopt(object, source)) {
        logContext << "adopt" << Log::Level::debug << object.id << ": handed to the cache.";
    }
}

Awaitable<bool> Hls::Pipeline::probeAudio(const Remote::RemoteObject &object, const std::filesystem::path &source)
{
    try {
        co_return co_await Ffmpeg::hasAudio(ioc, config.ffprobe, source);
    }
    catch (const std::exception &e) {
        if (isCancellation(e)) {
            throw;
        }
        logContext << "ffprobe" << Log::Level::warning << object.id << ": " << e.what();
        co_return false;
    }
}

Awaitable<bool> Hls::Pipeline::runStage(std::string_view name, const Remote::RemoteObject &object,
                                        const Ffmpeg::Arguments &arguments)
{
    logContext << "transcoding" << Log::Level::info << object.id << ": " << name << ".";
    try {
        Ffmpeg::Process process(ioc, log, config.ffmpeg, arguments);
        int exitCode = co_await process.wait();
        std::error_code ec;
        if (exitCode == 0 && std::filesystem::exists(arguments.getPlaylist(), ec)) {
            logContext << "ready" << Log::Level::info << object.id << ": " << name << ".";
            co_return true;
        }
        logContext << "stage" << Log::Level::warning << "Transcode stage " << name << " failed for " << object.id
                   << " with exit code " << exitCode << ": " << process.getStderrHead();
    }
    catch (const std::exception &e) {
        if (isCancellation(e)) {
            throw;
        }
        logContext << "stage" << Log::Level::warning << "Transcode stage " << name << " failed for " << object.id
                   << ": " << e.what();
    }
    co_return false;
}
