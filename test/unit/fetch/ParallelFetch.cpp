#include "fetch/ParallelFetch.hpp"

#include "coro_test.hpp"
#include "data.hpp"
#include "log.hpp"
#include "log/MemoryLog.hpp"
#include "remote/Exceptions.hpp"
#include "remote/TestBackend.hpp"
#include "util/BlockingPool.hpp"
#include "util/util.hpp"

#include <fstream>

namespace
{

constexpr uint64_t KiB = 1 << 10;

/**
 * A backend with a pool of clients, each returning data in differently sized pieces.
 */
struct Fixture final
{
    explicit Fixture(IOContext &ioc, Log::Log &log, size_t numClients) :
        backend(numClients), blockingPool(2), pool(ioc, log, std::chrono::milliseconds(1000))
    {
        const size_t pieceSizes[] = { 10000, 12289, 65536, 1000 };
        for (size_t i = 0; i < backend.clients.size(); i++) {
            backend.clients[i]->pieceSize = pieceSizes[i % std::size(pieceSizes)];
            pool.add(backend.clients[i]);
        }
    }

    TestBackend backend;
    Util::BlockingPool blockingPool;
    Fetch::ClientPool pool;
};

TEST(ParallelFetch, Plan)
{
    Fetch::ParallelFetch::Plan plan =
        Fetch::ParallelFetch::makePlan(1000000, 2000000, 10000000, Fetch::Purpose::stream, 512 * KiB);
    EXPECT_EQ(983040u, plan.alignedStart);
    EXPECT_EQ(16960u, plan.skip);
    EXPECT_EQ(512 * KiB, plan.chunkSize);
    EXPECT_EQ(2u, plan.numChunks);
}

TEST(ParallelFetch, PlanRoundsChunkSize)
{
    Fetch::ParallelFetch::Plan plan =
        Fetch::ParallelFetch::makePlan(0, 999, 1000, Fetch::Purpose::stream, 1000);
    EXPECT_EQ(0u, plan.alignedStart);
    EXPECT_EQ(0u, plan.skip);
    EXPECT_EQ(4 * KiB, plan.chunkSize);
    EXPECT_EQ(1u, plan.numChunks);
}

TEST(ParallelFetch, PlanEmpty)
{
    EXPECT_EQ(Fetch::ParallelFetch::Plan{},
              Fetch::ParallelFetch::makePlan(10, 9, 100, Fetch::Purpose::stream, 512 * KiB));
}

/**
 * Check that a range comes back intact, in order, with the given number of clients.
 */
Awaitable<void> testReassembly(IOContext &ioc, size_t numClients)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, numClients);
    fixture.backend.addObject("container", "object", 3000000);

    // Make the first client slow so chunks complete out of order.
    fixture.backend.clients[0]->readLatency = std::chrono::milliseconds(2);

    constexpr uint64_t start = 123457;
    constexpr uint64_t end = 2876543;
    Fetch::ClientPool::Lease lease = co_await fixture.pool.selectUsable("container", numClients);
    EXPECT_EQ(numClients, lease.size());
    Fetch::ParallelFetch fetch(ioc, log, std::move(lease), "container", "object", start, end, 3000000,
                               Fetch::Purpose::stream, 256 * KiB);

    std::vector<std::byte> data = co_await readStream(fetch);
    EXPECT_EQ(end - start + 1, data.size());
    EXPECT_TRUE(data == patternBytes(start, end - start + 1)) << "Workers: " << numClients;
    co_await fetch.stop();

    /* Each client was used, but never for two reads at once, and they're all back in the pool. */
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_GT(client->openCount, 0u);
        EXPECT_EQ(1u, client->handleCount);
        EXPECT_LE(client->maxActiveStreams, 1u);
        EXPECT_EQ(0u, client->activeStreams);
        EXPECT_FALSE(fixture.pool.isHeld(*client));
        for (uint64_t offset: client->openOffsets) {
            EXPECT_EQ(0u, offset % (64 * KiB));
        }
    }
}

CORO_TEST(ParallelFetch, OneWorker, ioc)
{
    co_await testReassembly(ioc, 1);
}

CORO_TEST(ParallelFetch, TwoWorkers, ioc)
{
    co_await testReassembly(ioc, 2);
}

CORO_TEST(ParallelFetch, ThreeWorkers, ioc)
{
    co_await testReassembly(ioc, 3);
}

CORO_TEST(ParallelFetch, FourWorkers, ioc)
{
    co_await testReassembly(ioc, 4);
}

CORO_TEST(ParallelFetch, SingleByte, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, 3);
    fixture.backend.addObject("container", "object", 10000000);

    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 3), "container", "object",
                               5000000, 5000000, 10000000, Fetch::Purpose::stream, 512 * KiB);
    std::vector<std::byte> data = co_await readStream(fetch);
    EXPECT_EQ(patternBytes(5000000, 1), data);
    co_await fetch.stop();

    // One chunk only needs one worker.
    size_t opened = 0;
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        opened += client->openCount;
        EXPECT_FALSE(fixture.pool.isHeld(*client));
    }
    EXPECT_EQ(1u, opened);
}

CORO_TEST(ParallelFetch, EmptyRange, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, 0);
    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 1), "container", "object",
                               10, 9, 100, Fetch::Purpose::stream, 512 * KiB);
    EXPECT_TRUE((co_await fetch.readSome()).empty());
    co_await fetch.stop();
}

CORO_TEST(ParallelFetch, NeedsAClient, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, 0);
    fixture.backend.addObject("container", "object", 100);
    Fetch::ClientPool::Lease lease = co_await fixture.pool.selectUsable("container", 1);
    EXPECT_THROW(Fetch::ParallelFetch(ioc, log, std::move(lease), "container", "object", 0, 99, 100,
                                      Fetch::Purpose::stream, 512 * KiB),
                 std::logic_error);
}

CORO_TEST(ParallelFetch, ShortRead, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log, 2);
    fixture.backend.addObject("container", "object", 3000000);
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        client->endsAt = 1000000;
    }

    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 2), "container", "object",
                               0, 2999999, 3000000, Fetch::Purpose::stream, 256 * KiB);

    /* Whatever is delivered is correct, and then the error comes out. */
    std::vector<std::byte> data;
    bool threw = false;
    try {
        while (true) {
            std::vector<std::byte> piece = co_await fetch.readSome();
            if (piece.empty()) {
                break;
            }
            data.insert(data.end(), piece.begin(), piece.end());
        }
    }
    catch (const Remote::ShortReadError &) {
        threw = true;
    }
    EXPECT_TRUE(threw);
    EXPECT_LE(data.size(), 1000000u);
    EXPECT_TRUE(data == patternBytes(0, data.size()));

    co_await fetch.stop();
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_FALSE(fixture.pool.isHeld(*client));
    }
}

CORO_TEST(ParallelFetch, WorkerFailure, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    Fixture fixture(ioc, log, 3);
    fixture.backend.addObject("container", "object", 3000000);
    fixture.backend.clients[1]->failsAt = 0;

    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 3), "container", "object",
                               0, 2999999, 3000000, Fetch::Purpose::stream, 256 * KiB);
    bool threw = false;
    try {
        co_await readStream(fetch);
    }
    catch (const Remote::BackendError &) {
        threw = true;
    }
    EXPECT_TRUE(threw);

    co_await fetch.stop();
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_FALSE(fixture.pool.isHeld(*client));
        EXPECT_EQ(0u, client->activeStreams);
    }
}

CORO_TEST(ParallelFetch, BoundedReadAhead, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, 2);
    fixture.backend.addObject("container", "object", 1000000);

    // 4 KiB quantum, so 16 KiB chunks give lots of them.
    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 2), "container", "object",
                               0, 999999, 1000000, Fetch::Purpose::stream, 16 * KiB);

    /* Without a consumer, the workers stop after a few chunks. */
    co_await sleepFor(std::chrono::milliseconds(20));
    size_t opened = fixture.backend.clients[0]->openCount + fixture.backend.clients[1]->openCount;
    EXPECT_GT(opened, 0u);
    EXPECT_LE(opened, 4u);

    /* Then everything arrives once it's consumed. */
    std::vector<std::byte> data = co_await readStream(fetch);
    EXPECT_TRUE(data == patternBytes(0, 1000000));
    co_await fetch.stop();
}

CORO_TEST(ParallelFetch, StopEarly, ioc)
{
    ExpectNeverLog log(ioc);
    Fixture fixture(ioc, log, 3);
    fixture.backend.addObject("container", "object", 3000000);
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        client->readLatency = std::chrono::milliseconds(1);
    }

    Fetch::ParallelFetch fetch(ioc, log, co_await fixture.pool.selectUsable("container", 3), "container", "object",
                               0, 2999999, 3000000, Fetch::Purpose::stream, 256 * KiB);
    std::vector<std::byte> first = co_await fetch.readSome();
    EXPECT_TRUE(first == patternBytes(0, first.size()));
    co_await fetch.stop();

    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_FALSE(fixture.pool.isHeld(*client));
    }
}

CORO_TEST(ParallelFetch, DownloadTo, ioc)
{
    ExpectNeverLog log(ioc);
    TemporaryDirectory dir("ParallelFetch");
    Fixture fixture(ioc, log, 3);
    constexpr uint64_t size = 5 * 1000 * 1000 + 17;
    fixture.backend.addObject("container", "object", size);

    std::filesystem::path path = dir / "object.part";
    std::ofstream(path, std::ios::binary).close();
    std::filesystem::resize_file(path, size);

    co_await Fetch::ParallelFetch::downloadTo(ioc, log, fixture.blockingPool,
                                              co_await fixture.pool.selectUsable("container", 3), "container",
                                              "object", size, 512 * KiB, path);

    std::vector<std::byte> data = Util::readFile(path);
    EXPECT_EQ(size, data.size());
    EXPECT_TRUE(data == patternBytes(0, size));
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_GT(client->openCount, 0u);
        EXPECT_FALSE(fixture.pool.isHeld(*client));
    }
}

CORO_TEST(ParallelFetch, DownloadToFailure, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::info, false);
    TemporaryDirectory dir("ParallelFetch");
    Fixture fixture(ioc, log, 2);
    constexpr uint64_t size = 3000000;
    fixture.backend.addObject("container", "object", size);
    fixture.backend.clients[0]->endsAt = 100000;

    std::filesystem::path path = dir / "object.part";
    std::ofstream(path, std::ios::binary).close();
    std::filesystem::resize_file(path, size);

    bool threw = false;
    try {
        co_await Fetch::ParallelFetch::downloadTo(ioc, log, fixture.blockingPool,
                                                  co_await fixture.pool.selectUsable("container", 2), "container",
                                                  "object", size, 512 * KiB, path);
    }
    catch (const Remote::ShortReadError &) {
        threw = true;
    }
    EXPECT_TRUE(threw);
    for (const std::shared_ptr<TestClient> &client: fixture.backend.clients) {
        EXPECT_FALSE(fixture.pool.isHeld(*client));
    }
}

} // namespace
