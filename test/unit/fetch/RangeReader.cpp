#include "fetch/RangeReader.hpp"

#include "coro_test.hpp"
#include "log.hpp"
#include "remote/Exceptions.hpp"
#include "remote/TestBackend.hpp"

namespace
{

CORO_TEST(RangeReader, AlignedRead, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(1);
    backend.clients[0]->pieceSize = 7000;
    backend.addObject("container", "object", 10000000);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.clients[0]);

    {
        Fetch::RangeReader reader(co_await pool.selectUsable("container", 1), "container", "object", 1000000,
                                  2000000, 10000000, Fetch::Purpose::stream);
        std::vector<std::byte> data = co_await readStream(reader);
        EXPECT_EQ(1000001u, data.size());
        EXPECT_TRUE(data == patternBytes(1000000, 1000001));

        // The client goes back as soon as the range has been read.
        EXPECT_FALSE(pool.isHeld(*backend.clients[0]));
    }

    EXPECT_EQ((std::vector<uint64_t>{ 983040 }), backend.clients[0]->openOffsets);
}

CORO_TEST(RangeReader, ToEndOfObject, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(1);
    backend.addObject("container", "object", 5000);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.clients[0]);

    Fetch::RangeReader reader(co_await pool.selectUsable("container", 1), "container", "object", 4095, 4999, 5000,
                              Fetch::Purpose::download);
    std::vector<std::byte> data = co_await readStream(reader);
    EXPECT_TRUE(data == patternBytes(4095, 905));
}

CORO_TEST(RangeReader, ShortRead, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(1);
    backend.addObject("container", "object", 100000);
    backend.clients[0]->endsAt = 50000;
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.clients[0]);

    Fetch::RangeReader reader(co_await pool.selectUsable("container", 1), "container", "object", 0, 99999, 100000,
                              Fetch::Purpose::stream);
    bool threw = false;
    try {
        co_await readStream(reader);
    }
    catch (const Remote::ShortReadError &) {
        threw = true;
    }
    EXPECT_TRUE(threw);
}

CORO_TEST(RangeReader, Direct, ioc)
{
    TestBackend backend(0);
    backend.addObject("container", "object", 100000);

    // The secondary API doesn't need alignment.
    Fetch::RangeReader reader(backend.direct, "container", "object", 12345, 54320);
    std::vector<std::byte> data = co_await readStream(reader);
    EXPECT_TRUE(data == patternBytes(12345, 54320 - 12345 + 1));
    EXPECT_EQ(1u, backend.direct.openCount);
}

CORO_TEST(RangeReader, Empty, ioc)
{
    TestBackend backend(0);
    Fetch::RangeReader reader(backend.direct, "container", "object", 10, 9);
    EXPECT_TRUE((co_await reader.readSome()).empty());
    EXPECT_EQ(0u, backend.direct.openCount);
}

} // namespace
