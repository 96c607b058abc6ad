#include "fetch/ClientPool.hpp"

#include "coro_test.hpp"
#include "log.hpp"
#include "log/MemoryLog.hpp"
#include "remote/TestBackend.hpp"

namespace
{

std::vector<std::string> getIdentities(const std::vector<std::shared_ptr<Remote::Client>> &clients)
{
    std::vector<std::string> result;
    for (const std::shared_ptr<Remote::Client> &client: clients) {
        result.push_back(client->getIdentity());
    }
    return result;
}

CORO_TEST(ClientPool, RoundRobinThenFallbacks, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(0);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.addClient("a"));
    pool.add(backend.addClient("spare"), true);
    pool.add(backend.addClient("b"));
    pool.add(backend.addClient("c"));

    EXPECT_EQ((std::vector<std::string>{ "a", "b", "c", "spare" }), getIdentities(pool.listCandidates()));
    EXPECT_EQ((std::vector<std::string>{ "b", "c", "a", "spare" }), getIdentities(pool.listCandidates()));
    EXPECT_EQ((std::vector<std::string>{ "c", "a", "b", "spare" }), getIdentities(pool.listCandidates()));
    EXPECT_EQ((std::vector<std::string>{ "a", "b", "c", "spare" }), getIdentities(pool.listCandidates()));
    co_return;
}

CORO_TEST(ClientPool, DuplicateIdentity, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(0);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.addClient("a"));
    pool.add(backend.addClient("a"), true);
    pool.add(backend.addClient("b"));

    EXPECT_EQ((std::vector<std::string>{ "a", "b" }), getIdentities(pool.listCandidates()));
    co_return;
}

CORO_TEST(ClientPool, AcquireRelease, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(2);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    pool.add(backend.clients[0]);

    EXPECT_FALSE(pool.isHeld(*backend.clients[0]));
    EXPECT_TRUE(pool.tryAcquire(*backend.clients[0]));
    EXPECT_TRUE(pool.isHeld(*backend.clients[0]));
    EXPECT_FALSE(pool.tryAcquire(*backend.clients[0]));

    pool.release(*backend.clients[0]);
    EXPECT_FALSE(pool.isHeld(*backend.clients[0]));
    pool.release(*backend.clients[0]);
    EXPECT_FALSE(pool.isHeld(*backend.clients[0]));
    EXPECT_TRUE(pool.tryAcquire(*backend.clients[0]));

    // The second client was never added.
    EXPECT_THROW(pool.tryAcquire(*backend.clients[1]), std::logic_error);
    EXPECT_FALSE(pool.isHeld(*backend.clients[1]));
    co_return;
}

CORO_TEST(ClientPool, SelectUsable, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(4);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    for (const std::shared_ptr<TestClient> &client: backend.clients) {
        pool.add(client);
    }

    {
        Fetch::ClientPool::Lease lease = co_await pool.selectUsable("container", 3);
        EXPECT_EQ(3u, lease.size());
        for (const std::shared_ptr<Remote::Client> &client: lease.getClients()) {
            EXPECT_TRUE(pool.isHeld(*client));
        }

        // Only one client is left.
        Fetch::ClientPool::Lease second = co_await pool.selectUsable("container", 3);
        EXPECT_EQ(1u, second.size());

        // And then there are none.
        Fetch::ClientPool::Lease third = co_await pool.selectUsable("container", 3);
        EXPECT_TRUE(third.empty());
    }

    /* Everything is released when the leases go away. */
    for (const std::shared_ptr<TestClient> &client: backend.clients) {
        EXPECT_FALSE(pool.isHeld(*client));
    }
}

CORO_TEST(ClientPool, SelectSkipsUnusable, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(4);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    for (const std::shared_ptr<TestClient> &client: backend.clients) {
        pool.add(client);
    }
    backend.clients[0]->connected = false;
    backend.clients[1]->deniedContainers.insert("private");
    EXPECT_TRUE(pool.tryAcquire(*backend.clients[2]));

    Fetch::ClientPool::Lease lease = co_await pool.selectUsable("private", 4);
    EXPECT_EQ((std::vector<std::string>{ "client3" }), getIdentities(lease.getClients()));

    // Clients that fail the probe aren't kept.
    EXPECT_FALSE(pool.isHeld(*backend.clients[1]));
    EXPECT_EQ(0u, backend.clients[0]->probeCount);
}

CORO_TEST(ClientPool, ProbeTimeout, ioc)
{
    Log::MemoryLog log(ioc, Log::Level::debug, false);
    TestBackend backend(2);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(20));
    pool.add(backend.clients[0]);
    pool.add(backend.clients[1]);
    backend.clients[0]->probeHangs = true;

    EXPECT_FALSE(co_await pool.probe(*backend.clients[0], "container"));
    EXPECT_TRUE(co_await pool.probe(*backend.clients[1], "container"));

    Fetch::ClientPool::Lease lease = co_await pool.selectUsable("container", 2);
    EXPECT_EQ((std::vector<std::string>{ "client1" }), getIdentities(lease.getClients()));
    EXPECT_FALSE(pool.isHeld(*backend.clients[0]));
}

CORO_TEST(ClientPool, LeaseTruncate, ioc)
{
    ExpectNeverLog log(ioc);
    TestBackend backend(3);
    Fetch::ClientPool pool(ioc, log, std::chrono::milliseconds(1000));
    for (const std::shared_ptr<TestClient> &client: backend.clients) {
        pool.add(client);
    }

    Fetch::ClientPool::Lease lease = co_await pool.selectUsable("container", 3);
    EXPECT_EQ(3u, lease.size());
    std::shared_ptr<Remote::Client> last = lease.getClients().back();
    lease.truncate(2);
    EXPECT_EQ(2u, lease.size());
    EXPECT_FALSE(pool.isHeld(*last));

    Fetch::ClientPool::Lease moved(std::move(lease));
    EXPECT_EQ(2u, moved.size());
    moved.release();
    for (const std::shared_ptr<TestClient> &client: backend.clients) {
        EXPECT_FALSE(pool.isHeld(*client));
    }
}

} // namespace
