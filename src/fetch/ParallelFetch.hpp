#pragma once

#include "Align.hpp"
#include "ClientPool.hpp"
#include "remote/Client.hpp"

#include <filesystem>
#include <memory>
#include <string>

class IOContext;

namespace Log
{

class Log;

} // namespace Log

namespace Util
{

class BlockingPool;

} // namespace Util

namespace Fetch
{

/**
 * Reads a range of an object with several clients at once, and delivers it in order.
 *
 * The range is split into aligned chunks. Each client gets a worker that takes chunk indices from a shared queue and
 * reads them. Chunks complete in any order, and are buffered until they can be delivered in ascending order.
 */
class ParallelFetch final : public Remote::ByteStream
{
public:
    /**
     * How a range gets split into chunks.
     */
    struct Plan final
    {
        /**
         * The offset of the first chunk.
         */
        uint64_t alignedStart = 0;

        /**
         * The number of bytes at the start of the first chunk that aren't part of the range.
         */
        uint64_t skip = 0;

        /**
         * The size of every chunk but (possibly) the last.
         */
        uint64_t chunkSize = 0;

        size_t numChunks = 0;

        bool operator==(const Plan &) const = default;
    };

    /**
     * Work out how to split a range.
     *
     * @param start The first byte of the range.
     * @param end The last byte of the range (inclusive). If this is less than start, the range is empty.
     * @param sizeHint The (possibly stale) size of the object, which determines the alignment quantum.
     * @param purpose What the range is for.
     * @param targetChunkSize The chunk size to aim for. It gets rounded up to a whole number of quanta.
     */
    static Plan makePlan(uint64_t start, uint64_t end, uint64_t sizeHint, Purpose purpose,
                         uint64_t targetChunkSize);

    /**
     * Cancels any workers that are still running.
     */
    ~ParallelFetch() override;

    /**
     * Start fetching.
     *
     * @param lease The clients to use. There must be at least one. Clients that aren't needed are released
     *              immediately, and the rest are released once their workers have stopped.
     * @param containerRef The container that holds the object.
     * @param locator Where the object is in the container.
     * @param start The first byte of the range.
     * @param end The last byte of the range (inclusive).
     * @param sizeHint The (possibly stale) size of the object.
     * @param purpose What the range is for.
     * @param targetChunkSize The chunk size to aim for.
     */
    explicit ParallelFetch(IOContext &ioc, Log::Log &log, ClientPool::Lease lease, std::string containerRef,
                           std::string locator, uint64_t start, uint64_t end, uint64_t sizeHint, Purpose purpose,
                           uint64_t targetChunkSize);

    /**
     * Get the next piece of the range.
     *
     * @return The next chunk, trimmed to the range. This is empty once the whole range has been delivered.
     * @throws Remote::ShortReadError If a client returned less than it should have.
     * @throws std::exception Whatever a worker failed with. The other workers are cancelled.
     */
    Awaitable<std::vector<std::byte>> readSome() override;

    /**
     * Cancel the workers and wait for them to finish.
     */
    Awaitable<void> stop() override;

    /**
     * Download a whole object into an existing file, with several clients at once.
     *
     * Each worker has its own handle to the file, and writes each chunk at its absolute offset.
     *
     * @param blockingPool Used for the file writes when there's no io_uring.
     * @param lease The clients to use. There must be at least one.
     * @param containerRef The container that holds the object.
     * @param locator Where the object is in the container.
     * @param size The size of the object.
     * @param targetChunkSize The chunk size to aim for.
     * @param destination The file to write to. This must exist already.
     */
    static Awaitable<void> downloadTo(IOContext &ioc, Log::Log &log, Util::BlockingPool &blockingPool,
                                      ClientPool::Lease lease, std::string containerRef, std::string locator,
                                      uint64_t size, uint64_t targetChunkSize, std::filesystem::path destination);

private:
    struct State;

    /**
     * Spawn one worker per client.
     */
    static void startWorkers(IOContext &ioc, const std::shared_ptr<State> &state);

    /**
     * Read chunks until the queue runs out.
     */
    static Awaitable<void> runWorker(std::shared_ptr<State> state, std::shared_ptr<Remote::Client> client);

    /**
     * Read a single chunk.
     */
    static Awaitable<std::vector<std::byte>> readChunk(State &state, Remote::Client &client,
                                                       const std::string &fileId, size_t index);

    std::shared_ptr<State> state;
};

} // namespace Fetch
