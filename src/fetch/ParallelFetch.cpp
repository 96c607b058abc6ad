#include "ParallelFetch.hpp"

#include "log/Log.hpp"
#include "remote/Exceptions.hpp"
#include "util/asio.hpp"
#include "util/BlockingPool.hpp"
#include "util/Event.hpp"
#include "util/File.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <optional>

struct Fetch::ParallelFetch::State final
{
    explicit State(IOContext &ioc, Log::Log &log, ClientPool::Lease lease, std::string containerRef,
                   std::string locator, uint64_t end, Plan plan) :
        ioc(ioc), logContext(log("fetch")), containerRef(std::move(containerRef)), locator(std::move(locator)),
        end(end), plan(plan), event(ioc), lease(std::move(lease))
    {
    }

    /**
     * Record an error, and stop everything.
     *
     * Only the first error is kept.
     */
    void fail(std::exception_ptr e)
    {
        if (!error) {
            error = std::move(e);
        }
        cancel();
    }

    /**
     * Cancel all the workers.
     */
    void cancel()
    {
        if (cancelled) {
            return;
        }
        cancelled = true;
        for (std::unique_ptr<boost::asio::cancellation_signal> &signal: cancelSignals) {
            signal->emit(boost::asio::cancellation_type::terminal);
        }
        event.notifyAll();
    }

    /**
     * Wait until every worker has returned.
     */
    Awaitable<void> waitForWorkers()
    {
        while (workersRunning > 0) {
            co_await event.wait();
        }
    }

    IOContext &ioc;
    Log::Context logContext;
    const std::string containerRef;
    const std::string locator;

    /**
     * The last byte of the range (inclusive).
     */
    const uint64_t end;
    const Plan plan;

    /**
     * If set, workers write chunks here rather than into the results map.
     */
    std::optional<std::filesystem::path> destination;
    Util::BlockingPool *blockingPool = nullptr;

    /**
     * Chunk indices waiting to be read, followed by one empty entry per worker to tell it to stop.
     */
    std::deque<std::optional<size_t>> queue;

    /**
     * Chunks that have been read, but not yet delivered, by index.
     */
    std::map<size_t, std::vector<std::byte>> results;

    /**
     * The index of the next chunk to deliver.
     */
    size_t nextIndex = 0;

    /**
     * How far ahead of nextIndex the workers may read. Zero means there's no limit.
     */
    size_t maxAhead = 0;

    /**
     * Notified whenever anything in here changes.
     */
    Event event;

    std::exception_ptr error;
    bool cancelled = false;
    size_t workersRunning = 0;

    /**
     * The clients the workers are using. These are released when the last worker returns.
     */
    ClientPool::Lease lease;

    std::vector<std::unique_ptr<boost::asio::cancellation_signal>> cancelSignals;
};

Fetch::ParallelFetch::Plan Fetch::ParallelFetch::makePlan(uint64_t start, uint64_t end, uint64_t sizeHint,
                                                          Purpose purpose, uint64_t targetChunkSize)
{
    if (end < start) {
        return {};
    }
    uint64_t total = end - start + 1;

    /* Align the start, and work out how many chunks cover everything from there to the end. */
    uint64_t quantum = pickQuantum(sizeHint, purpose);
    Plan plan;
    plan.alignedStart = start - start % quantum;
    plan.skip = start - plan.alignedStart;
    plan.chunkSize = roundChunkSize(targetChunkSize, quantum);
    uint64_t totalAligned = total + plan.skip;
    plan.numChunks = (size_t)((totalAligned + plan.chunkSize - 1) / plan.chunkSize);
    return plan;
}

Fetch::ParallelFetch::~ParallelFetch()
{
    // The workers own the state too, so they finish unwinding on their own.
    state->cancel();
}

Fetch::ParallelFetch::ParallelFetch(IOContext &ioc, Log::Log &log, ClientPool::Lease lease, std::string containerRef,
                                    std::string locator, uint64_t start, uint64_t end, uint64_t sizeHint,
                                    Purpose purpose, uint64_t targetChunkSize) :
    state(std::make_shared<State>(ioc, log, std::move(lease), std::move(containerRef), std::move(locator), end,
                                  makePlan(start, end, sizeHint, purpose, targetChunkSize)))
{
    if (state->lease.empty() && state->plan.numChunks > 0) {
        throw std::logic_error("A parallel fetch needs at least one client.");
    }

    /* Keep the reorder buffer bounded if the consumer is slower than the backend. */
    state->maxAhead = 2 * std::min(state->lease.size(), state->plan.numChunks);

    state->logContext << "start" << Log::Level::debug << state->containerRef << "/" << state->locator << ": "
                      << state->plan.numChunks << " chunks of " << state->plan.chunkSize << " bytes from "
                      << state->plan.alignedStart << " with " << state->lease.size() << " clients.";
    startWorkers(ioc, state);
}

Awaitable<std::vector<std::byte>> Fetch::ParallelFetch::readSome()
{
    if (state->nextIndex >= state->plan.numChunks) {
        co_return std::vector<std::byte>();
    }

    /* Wait for the next chunk in order. */
    std::vector<std::byte> data;
    while (true) {
        if (state->error) {
            std::rethrow_exception(state->error);
        }
        auto it = state->results.find(state->nextIndex);
        if (it != state->results.end()) {
            data = std::move(it->second);
            state->results.erase(it);
            break;
        }
        if (state->cancelled || state->workersRunning == 0) {
            throw std::runtime_error("The fetch stopped before chunk " + std::to_string(state->nextIndex) +
                                     " was read.");
        }
        co_await state->event.wait();
    }

    /* The first chunk starts at the aligned offset. The workers already clipped the last one to the range. */
    if (state->nextIndex == 0) {
        data.erase(data.begin(), data.begin() + (ptrdiff_t)std::min<uint64_t>(state->plan.skip, data.size()));
    }

    /* Let the workers know they can read further ahead. */
    state->nextIndex++;
    state->event.notifyAll();
    co_return data;
}

Awaitable<void> Fetch::ParallelFetch::stop()
{
    state->cancel();
    co_await state->waitForWorkers();
}

Awaitable<void> Fetch::ParallelFetch::downloadTo(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool,
                                                 ClientPool::Lease lease, std::string containerRef,
                                                 std::string locator, uint64_t size, uint64_t targetChunkSize,
                                                 std::filesystem::path destination)
{
    if (size == 0) {
        co_return;
    }
    if (lease.empty()) {
        throw std::logic_error("A parallel download needs at least one client.");
    }

    auto state = std::make_shared<State>(ioc, log, std::move(lease), std::move(containerRef), std::move(locator),
                                         size - 1, makePlan(0, size - 1, size, Purpose::download, targetChunkSize));
    state->destination = std::move(destination);
    state->blockingPool = &blockingPool;
    state->logContext << "download" << Log::Level::debug << state->containerRef << "/" << state->locator << ": "
                      << state->plan.numChunks << " chunks of " << state->plan.chunkSize << " bytes with "
                      << state->lease.size() << " clients.";
    startWorkers(ioc, state);

    /* Wait for the workers. If we get cancelled, take them down with us. */
    std::exception_ptr cancellation;
    try {
        co_await state->waitForWorkers();
    }
    catch (const std::exception &e) {
        if (!isCancellation(e)) {
            throw;
        }
        state->cancel();
        cancellation = std::current_exception();
    }
    if (cancellation) {
        // The workers hold the lease, and so use the pool, until they've stopped.
        co_await boost::asio::this_coro::reset_cancellation_state();
        co_await state->waitForWorkers();
        std::rethrow_exception(cancellation);
    }
    if (state->error) {
        std::rethrow_exception(state->error);
    }
}

void Fetch::ParallelFetch::startWorkers(IOContext &ioc, const std::shared_ptr<State> &state)
{
    /* There's no point having more workers than chunks. */
    state->lease.truncate(std::min(state->lease.size(), state->plan.numChunks));

    /* Fill the queue. */
    for (size_t i = 0; i < state->plan.numChunks; i++) {
        state->queue.emplace_back(i);
    }
    for (size_t i = 0; i < state->lease.size(); i++) {
        state->queue.emplace_back(std::nullopt);
    }

    /* Start a worker per client. */
    for (const std::shared_ptr<Remote::Client> &client: state->lease.getClients()) {
        auto &signal = state->cancelSignals.emplace_back(std::make_unique<boost::asio::cancellation_signal>());
        state->workersRunning++;
        boost::asio::co_spawn((boost::asio::io_context &)ioc, runWorker(state, client),
                              boost::asio::bind_cancellation_slot(signal->slot(), boost::asio::detached));
    }
}

Awaitable<void> Fetch::ParallelFetch::runWorker(std::shared_ptr<State> state, std::shared_ptr<Remote::Client> client)
{
    try {
        /* Handles can go stale, so each worker looks up its own. */
        Remote::ObjectHandle handle = co_await client->getObjectHandle(state->containerRef, state->locator);

        // Each worker has its own file handle, so there's no shared position.
        std::optional<Util::File> file;
        if (state->destination) {
            file.emplace(state->ioc, *state->blockingPool, *state->destination, Util::File::Mode::update);
        }

        while (!state->cancelled && !state->queue.empty()) {
            std::optional<size_t> index = state->queue.front();
            state->queue.pop_front();
            if (!index) {
                break;
            }

            /* Don't get too far ahead of the consumer. */
            while (state->maxAhead > 0 && *index >= state->nextIndex + state->maxAhead && !state->cancelled) {
                co_await state->event.wait();
            }
            if (state->cancelled) {
                break;
            }

            /* Read the chunk, and hand it over. */
            std::vector<std::byte> data = co_await readChunk(*state, *client, handle.fileId, *index);
            if (file) {
                co_await file->writeAt(state->plan.alignedStart + *index * state->plan.chunkSize, data);
            }
            else {
                state->results.emplace(*index, std::move(data));
                state->event.notifyAll();
            }
        }
    }
    catch (const std::exception &e) {
        // Once cancelled, whatever gets thrown is just a consequence of that.
        if (!state->cancelled) {
            state->logContext << "worker" << Log::Level::warning << state->containerRef << "/" << state->locator
                              << " via " << client->getIdentity() << ": " << e.what();
            state->fail(std::current_exception());
        }
    }

    /* The last worker out gives the clients back. */
    if (--state->workersRunning == 0) {
        state->lease.release();
    }
    state->event.notifyAll();
}

Awaitable<std::vector<std::byte>> Fetch::ParallelFetch::readChunk(State &state, Remote::Client &client,
                                                                  const std::string &fileId, size_t index)
{
    uint64_t offset = state.plan.alignedStart + index * state.plan.chunkSize;
    uint64_t needed = std::min(state.plan.chunkSize, state.end + 1 - offset);

    std::unique_ptr<Remote::ByteStream> stream = co_await client.openRange(fileId, offset, needed);
    std::vector<std::byte> data;
    data.reserve(needed);
    while (data.size() < needed) {
        std::vector<std::byte> piece = co_await stream->readSome();
        if (piece.empty()) {
            throw Remote::ShortReadError("Chunk " + std::to_string(index) + " at offset " + std::to_string(offset) +
                                         " ended after " + std::to_string(data.size()) + " of " +
                                         std::to_string(needed) + " bytes.");
        }
        size_t take = (size_t)std::min<uint64_t>(piece.size(), needed - data.size());
        data.insert(data.end(), piece.begin(), piece.begin() + (ptrdiff_t)take);
    }
    co_return data;
}
