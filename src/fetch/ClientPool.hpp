#pragma once

#include "log/Log.hpp"
#include "util/Mutex.hpp"
#include "util/awaitable.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

class IOContext;

namespace Remote
{

class Client;

} // namespace Remote

namespace Fetch
{

/**
 * The set of clients that can be borrowed to read from the backend.
 *
 * Each client has a guard so that only one job uses it at a time. Acquisition never waits: a busy client is skipped.
 */
class ClientPool final
{
public:
    /**
     * A set of clients that's been acquired from the pool.
     *
     * The clients are released exactly once, when the lease is released or destroyed.
     */
    class [[nodiscard]] Lease final
    {
    public:
        ~Lease();
        Lease(Lease &&other) noexcept;

        // No copying, and no move assignment (which could leak the clients already held).
        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;
        Lease &operator=(Lease &&) = delete;

        /**
         * Get the acquired clients, in order of preference.
         */
        const std::vector<std::shared_ptr<Remote::Client>> &getClients() const
        {
            return clients;
        }

        size_t size() const
        {
            return clients.size();
        }

        bool empty() const
        {
            return clients.empty();
        }

        /**
         * Give back all the clients but the first few.
         *
         * @param count The number of clients to keep.
         */
        void truncate(size_t count);

        /**
         * Give back all the clients now.
         */
        void release();

    private:
        friend class ClientPool;
        explicit Lease(ClientPool &pool) : pool(&pool) {}

        ClientPool *pool;
        std::vector<std::shared_ptr<Remote::Client>> clients;
    };

    ~ClientPool();

    /**
     * @param probeTimeout How long to let an access probe take before treating the client as unusable.
     */
    explicit ClientPool(IOContext &ioc, Log::Log &log, std::chrono::milliseconds probeTimeout);

    ClientPool(const ClientPool &) = delete;
    ClientPool &operator=(const ClientPool &) = delete;

    /**
     * Add a client.
     *
     * @param fallback Whether the client is only a fallback, to be tried after all the normal members.
     */
    void add(std::shared_ptr<Remote::Client> client, bool fallback = false);

    /**
     * Get the clients in order of preference.
     *
     * Normal members come first, starting from a different one on each call, followed by fallbacks. Clients with the
     * same identity only appear once.
     */
    std::vector<std::shared_ptr<Remote::Client>> listCandidates() const;

    /**
     * Take a client's guard if it's free.
     *
     * @return True if the client is now held by the caller.
     */
    bool tryAcquire(const Remote::Client &client);

    /**
     * Give back a client's guard.
     *
     * It's safe to call this for a client that isn't held.
     */
    void release(const Remote::Client &client);

    /**
     * Determine whether a client is currently held.
     */
    bool isHeld(const Remote::Client &client) const;

    /**
     * Check whether a client can access a container.
     *
     * @return True if the client can access the container. Errors and timeouts give false.
     */
    Awaitable<bool> probe(Remote::Client &client, const std::string &containerRef);

    /**
     * Acquire some clients that can access a container.
     *
     * Disconnected clients, busy clients, and clients that fail the probe are skipped.
     *
     * @param containerRef The container the clients need to read from.
     * @param maxClients The most clients to acquire.
     * @return The acquired clients. This may be empty.
     */
    Awaitable<Lease> selectUsable(const std::string &containerRef, size_t maxClients);

private:
    struct Member final
    {
        std::shared_ptr<Remote::Client> client;
        bool fallback;
    };

    IOContext &ioc;
    Log::Context logContext;
    const std::chrono::milliseconds probeTimeout;

    std::vector<Member> members;

    /**
     * The guard for each client, by identity.
     */
    std::map<std::string, Mutex, std::less<>> guards;

    /**
     * Where the next call to listCandidates starts among the normal members.
     */
    mutable size_t nextMember = 0;
};

} // namespace Fetch
