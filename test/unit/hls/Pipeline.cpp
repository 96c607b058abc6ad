#include "hls/Pipeline.hpp"

#include "cache/DiskCache.hpp"
#include "coro_test.hpp"
#include "data.hpp"
#include "log.hpp"
#include "fetch/ClientPool.hpp"
#include "log/MemoryLog.hpp"
#include "remote/TestBackend.hpp"
#include "util/BlockingPool.hpp"
#include "util/util.hpp"

#include <sys/stat.h>

namespace
{

/**
 * A pipeline that runs the fake ffmpeg and ffprobe from the test data, with a cache and a test backend.
 */
struct Fixture final
{
    explicit Fixture(IOContext &ioc, Log::Log &log, Config::Transcode config = getFakeConfig(), bool useCache = true,
                     Config::Cache cacheConfig = {}) :
        dir("Pipeline"), blockingPool(2), pool(ioc, log, std::chrono::milliseconds(1000)),
        cache(ioc, log, blockingPool, catalog, pool, backend.direct, withRoot(std::move(cacheConfig)), true),
        pipeline(ioc, log, blockingPool, cache, backend.direct, std::move(config), useCache)
    {
    }

    static Config::Transcode getFakeConfig()
    {
        return {
            .ffmpeg = getTestDataPath("bin/fake-ffmpeg").string(),
            .ffprobe = getTestDataPath("bin/fake-ffprobe").string(),
            .sourceWaitTimeout = 10000
        };
    }

    Config::Cache withRoot(Config::Cache config) const
    {
        config.root = dir.getPath().string();
        return config;
    }

    Remote::RemoteObject addObject(std::string id, uint64_t size = 20000)
    {
        backend.addObject("container", id, size);
        return { .id = id, .size = size, .containerRef = "container", .locator = id, .name = id + ".mkv" };
    }

    /**
     * Make a stage of the fake ffmpeg fail for an object.
     */
    void failStage(std::string_view id, std::string_view mode)
    {
        writeFileAndParents(pipeline.getWorkspace(id) / ("fail-" + std::string(mode)), "");
    }

    /**
     * Get the stages the fake ffmpeg has run for an object.
     */
    std::vector<std::string> getInvocations(std::string_view id) const
    {
        std::filesystem::path path = pipeline.getWorkspace(id) / "invocations";
        if (!std::filesystem::exists(path)) {
            return {};
        }
        return readFileAsLines(path, false);
    }

    TemporaryDirectory dir;
    TestBackend backend{ 0 };
    Util::BlockingPool blockingPool;
    Fetch::ClientPool pool;
    TestCatalog catalog;
    Cache::DiskCache cache;
    Hls::Pipeline pipeline;
};

TEST(HlsPipeline, IsVideo)
{
    EXPECT_TRUE(Hls::Pipeline::isVideo({ .mimeType = "video/x-matroska", .name = "thing" }));
    EXPECT_TRUE(Hls::Pipeline::isVideo({ .name = "Holiday.MP4" }));
    EXPECT_TRUE(Hls::Pipeline::isVideo({ .name = "a.webm" }));
    EXPECT_TRUE(Hls::Pipeline::isVideo({ .name = "a.mpg" }));
    EXPECT_FALSE(Hls::Pipeline::isVideo({ .mimeType = "audio/flac", .name = "song.flac" }));
    EXPECT_FALSE(Hls::Pipeline::isVideo({ .name = "mp4" }));
    EXPECT_FALSE(Hls::Pipeline::isVideo({}));
}

CORO_TEST(HlsPipeline, MultiRendition, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");

    EXPECT_FALSE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ("/hls/movie/index.m3u8", fixture.pipeline.urlFor("movie"));

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(fixture.pipeline.isRunning("movie"));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_FALSE(fixture.pipeline.isRunning("movie"));

    std::filesystem::path workspace = fixture.pipeline.getWorkspace("movie");
    EXPECT_TRUE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ("/hls/movie/master.m3u8", fixture.pipeline.urlFor("movie"));
    EXPECT_EQ(std::vector<std::string>{ "multi" }, fixture.getInvocations("movie"));
    for (const char *rendition: { "v0", "v1", "v2" }) {
        EXPECT_TRUE(std::filesystem::exists(workspace / rendition / "index.m3u8"));
    }

    /* The source was downloaded, and given to the cache. */
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);
    EXPECT_TRUE(Util::readFile(workspace / "source") == patternBytes(0, 20000));
    EXPECT_FALSE(std::filesystem::exists(workspace / "source.part"));
    EXPECT_TRUE(co_await fixture.cache.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_TRUE(fixture.cache.isCached("movie", 20000));

    /* It doesn't get transcoded again. */
    EXPECT_FALSE(fixture.pipeline.ensure(object));
}

CORO_TEST(HlsPipeline, SingleFlight, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.backend.direct.latency = std::chrono::milliseconds(20);

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_FALSE(fixture.pipeline.ensure(object));
    EXPECT_FALSE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);
    EXPECT_EQ(1u, fixture.getInvocations("movie").size());
}

CORO_TEST(HlsPipeline, FallBackToCopy, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.failStage("movie", "multi");

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));

    std::filesystem::path workspace = fixture.pipeline.getWorkspace("movie");
    EXPECT_EQ((std::vector<std::string>{ "multi", "copy" }), fixture.getInvocations("movie"));
    EXPECT_TRUE(std::filesystem::exists(workspace / "index.m3u8"));
    EXPECT_FALSE(std::filesystem::exists(workspace / "master.m3u8"));
    EXPECT_EQ("/hls/movie/index.m3u8", fixture.pipeline.urlFor("movie"));
}

CORO_TEST(HlsPipeline, FallBackToTranscode, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.failStage("movie", "multi");
    fixture.failStage("movie", "copy");

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_EQ((std::vector<std::string>{ "multi", "copy", "full" }), fixture.getInvocations("movie"));
    EXPECT_TRUE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ("/hls/movie/index.m3u8", fixture.pipeline.urlFor("movie"));
}

CORO_TEST(HlsPipeline, EveryStageFails, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.failStage("movie", "multi");
    fixture.failStage("movie", "copy");
    fixture.failStage("movie", "full");

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_FALSE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ((std::vector<std::string>{ "multi", "copy", "full" }), fixture.getInvocations("movie"));

    /* The next request tries again, reusing the source. */
    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_EQ(6u, fixture.getInvocations("movie").size());
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);
}

CORO_TEST(HlsPipeline, SourceFromCache, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");

    EXPECT_TRUE(fixture.cache.warm(object));
    EXPECT_TRUE(co_await fixture.cache.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_TRUE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);

    /* Both are on the same filesystem, so the source is a hard link to the cached copy. */
    struct stat cached;
    struct stat source;
    EXPECT_EQ(0, stat(fixture.cache.pathFor("movie").c_str(), &cached));
    EXPECT_EQ(0, stat((fixture.pipeline.getWorkspace("movie") / "source").c_str(), &source));
    EXPECT_EQ(cached.st_ino, source.st_ino);
}

CORO_TEST(HlsPipeline, SourceWaitsForWarm, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.backend.direct.latency = std::chrono::milliseconds(50);

    /* The transcode waits for the warm rather than downloading the object again. */
    EXPECT_TRUE(fixture.cache.warm(object));
    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_TRUE(fixture.pipeline.isReady("movie"));
    EXPECT_EQ(1u, fixture.backend.direct.downloadCount);
}

CORO_TEST(HlsPipeline, WithoutCache, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, Fixture::getFakeConfig(), false);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_TRUE(fixture.pipeline.isReady("movie"));
    EXPECT_FALSE(fixture.cache.isCached("movie"));
}

CORO_TEST(HlsPipeline, SourceFailure, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();
    Remote::RemoteObject object = fixture.addObject("movie");
    fixture.backend.direct.failing = true;

    EXPECT_TRUE(fixture.pipeline.ensure(object));
    EXPECT_TRUE(co_await fixture.pipeline.waitFor("movie", std::chrono::seconds(10)));
    EXPECT_FALSE(fixture.pipeline.isReady("movie"));
    EXPECT_TRUE(fixture.getInvocations("movie").empty());
    EXPECT_FALSE(std::filesystem::exists(fixture.pipeline.getWorkspace("movie") / "source"));
}

CORO_TEST(HlsPipeline, NotTranscoded, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();

    Remote::RemoteObject song = fixture.addObject("song");
    song.name = "song.flac";
    EXPECT_FALSE(fixture.pipeline.ensure(song));

    Remote::RemoteObject folder = fixture.addObject("folder");
    folder.folder = true;
    EXPECT_FALSE(fixture.pipeline.ensure(folder));

    /* Anything with a playlist already is left alone. */
    Remote::RemoteObject ready = fixture.addObject("ready");
    writeFileAndParents(fixture.pipeline.getWorkspace("ready") / "index.m3u8", "#EXTM3U\n");
    EXPECT_FALSE(fixture.pipeline.ensure(ready));

    EXPECT_FALSE(fixture.pipeline.isRunning("song"));
    EXPECT_EQ(0u, fixture.backend.direct.downloadCount);
}

CORO_TEST(HlsPipeline, Disabled, ioc)
{
    ExpectNeverLog log(ioc);
    Config::Transcode config = Fixture::getFakeConfig();
    config.enabled = false;
    Fixture fixture(ioc, log, config);
    co_await fixture.cache.init();

    EXPECT_FALSE(fixture.pipeline.ensure(fixture.addObject("movie")));
}

CORO_TEST(HlsPipeline, MissingFfmpeg, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Config::Transcode config = Fixture::getFakeConfig();
    config.ffmpeg = getTestDataPath("bin/no-such-ffmpeg").string();
    Fixture fixture(ioc, log, config);
    co_await fixture.cache.init();

    EXPECT_FALSE(fixture.pipeline.ensure(fixture.addObject("movie")));
    EXPECT_FALSE(fixture.pipeline.ensure(fixture.addObject("other")));
    EXPECT_FALSE(fixture.pipeline.isRunning("movie"));
}

CORO_TEST(HlsPipeline, BadId, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log);
    co_await fixture.cache.init();

    EXPECT_THROW(fixture.pipeline.getWorkspace("../movie"), std::invalid_argument);
    EXPECT_THROW(fixture.pipeline.isReady(""), std::invalid_argument);
}

} // namespace
