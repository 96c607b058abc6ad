#include "ClientPool.hpp"

#include "remote/Client.hpp"
#include "util/asio.hpp"

#include <set>
#include <variant>

Fetch::ClientPool::Lease::~Lease()
{
    release();
}

Fetch::ClientPool::Lease::Lease(Lease &&other) noexcept : pool(other.pool), clients(std::move(other.clients))
{
    other.clients.clear();
}

void Fetch::ClientPool::Lease::truncate(size_t count)
{
    while (clients.size() > count) {
        pool->release(*clients.back());
        clients.pop_back();
    }
}

void Fetch::ClientPool::Lease::release()
{
    truncate(0);
}

Fetch::ClientPool::~ClientPool() = default;

Fetch::ClientPool::ClientPool(IOContext &ioc, Log::Log &log, std::chrono::milliseconds probeTimeout) :
    ioc(ioc), logContext(log("clients")), probeTimeout(probeTimeout)
{
}

void Fetch::ClientPool::add(std::shared_ptr<Remote::Client> client, bool fallback)
{
    guards.try_emplace(client->getIdentity(), ioc);
    members.push_back({ std::move(client), fallback });
}

std::vector<std::shared_ptr<Remote::Client>> Fetch::ClientPool::listCandidates() const
{
    /* Split the members into the round-robin ones and the fallbacks. */
    std::vector<const Member *> normal;
    std::vector<const Member *> fallbacks;
    for (const Member &member: members) {
        (member.fallback ? fallbacks : normal).push_back(&member);
    }

    /* Rotate the normal members so that load is spread across them, then add the fallbacks. */
    std::vector<std::shared_ptr<Remote::Client>> result;
    std::set<std::string, std::less<>> seen;
    auto addUnique = [&](const Member &member) {
        if (seen.insert(member.client->getIdentity()).second) {
            result.push_back(member.client);
        }
    };
    size_t first = normal.empty() ? 0 : (nextMember++ % normal.size());
    for (size_t i = 0; i < normal.size(); i++) {
        addUnique(*normal[(first + i) % normal.size()]);
    }
    for (const Member *member: fallbacks) {
        addUnique(*member);
    }
    return result;
}

bool Fetch::ClientPool::tryAcquire(const Remote::Client &client)
{
    auto it = guards.find(client.getIdentity());
    if (it == guards.end()) {
        throw std::logic_error("Client " + client.getIdentity() + " is not in the pool.");
    }
    return it->second.tryLock();
}

void Fetch::ClientPool::release(const Remote::Client &client)
{
    auto it = guards.find(client.getIdentity());
    if (it != guards.end() && it->second.isLocked()) {
        it->second.unlock();
    }
}

bool Fetch::ClientPool::isHeld(const Remote::Client &client) const
{
    auto it = guards.find(client.getIdentity());
    return it != guards.end() && it->second.isLocked();
}

Awaitable<bool> Fetch::ClientPool::probe(Remote::Client &client, const std::string &containerRef)
{
    try {
        std::variant<bool, std::monostate> result =
            co_await (client.probeAccess(containerRef) || sleepFor(probeTimeout));
        if (result.index() == 1) {
            logContext << "probe" << Log::Level::debug << "Access probe for " << containerRef << " by "
                       << client.getIdentity() << " timed out.";
            co_return false;
        }
        co_return std::get<0>(result);
    }
    catch (const std::exception &e) {
        logContext << "probe" << Log::Level::debug << "Access probe for " << containerRef << " by "
                   << client.getIdentity() << " failed: " << e.what();
        co_return false;
    }
}

Awaitable<Fetch::ClientPool::Lease> Fetch::ClientPool::selectUsable(const std::string &containerRef,
                                                                    size_t maxClients)
{
    Lease lease(*this);
    for (const std::shared_ptr<Remote::Client> &client: listCandidates()) {
        if (lease.size() >= maxClients) {
            break;
        }
        if (!client->getConnected() || !tryAcquire(*client)) {
            continue;
        }

        // The lease owns the client from here on, so it gets released if the probe throws.
        lease.clients.push_back(client);
        if (!co_await probe(*client, containerRef)) {
            lease.clients.pop_back();
            release(*client);
        }
    }
    co_return lease;
}
