#pragma once

#include "util/awaitable.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Remote
{

/**
 * What a client needs to read an object, as looked up from its message.
 *
 * File IDs can go stale, so these are looked up again for each job rather than being stored.
 */
struct ObjectHandle final
{
    std::string fileId;
    uint64_t declaredSize = 0;
};

/**
 * A sequence of bytes being read from the backend.
 */
class ByteStream
{
public:
    virtual ~ByteStream();

    /**
     * Read the next piece of data.
     *
     * @return The data. This is empty once the stream is finished.
     */
    virtual Awaitable<std::vector<std::byte>> readSome() = 0;

    /**
     * Stop reading, and give back whatever the stream holds (such as clients).
     *
     * The default does nothing.
     */
    virtual Awaitable<void> stop();

protected:
    ByteStream() = default;
};

/**
 * A connection to the message backend's primary (fast, chunk-oriented) API.
 *
 * Each client can only be used for one thing at a time. That's enforced by the ClientPool rather than here.
 */
class Client
{
public:
    virtual ~Client();

    /**
     * Get something that identifies the underlying connection.
     *
     * Two client objects with the same identity share a connection, so they're treated as the same client.
     */
    virtual const std::string &getIdentity() const = 0;

    /**
     * Determine whether the client is currently connected.
     */
    virtual bool getConnected() const = 0;

    /**
     * Check whether this client can see a container.
     *
     * @return True if the client can read from the container. Failures from the backend may be thrown.
     */
    virtual Awaitable<bool> probeAccess(std::string_view containerRef) = 0;

    /**
     * Look up the current handle of an object.
     *
     * @throws BackendError If the object doesn't exist or can't be accessed.
     */
    virtual Awaitable<ObjectHandle> getObjectHandle(std::string_view containerRef, std::string_view locator) = 0;

    /**
     * Start reading a range of an object.
     *
     * The primary API only accepts offsets that are a multiple of 4 KiB, and might return the range in pieces of any
     * size.
     *
     * @param fileId The file ID from getObjectHandle.
     * @param offset The byte to start reading from.
     * @param limit The largest number of bytes to return. Zero means everything until the end of the object.
     * @throws BackendError If the request is invalid.
     */
    virtual Awaitable<std::unique_ptr<ByteStream>> openRange(const std::string &fileId, uint64_t offset,
                                                             uint64_t limit) = 0;

protected:
    Client() = default;
};

/**
 * The backend's secondary download API.
 *
 * This is slower than the primary API, but it has no alignment requirements and doesn't use the pool's clients, so it
 * works as a last resort.
 */
class DirectSource
{
public:
    virtual ~DirectSource();

    /**
     * Start reading a range of an object.
     *
     * @param containerRef The container that holds the object.
     * @param locator Where the object is in the container.
     * @param offset The byte to start reading from. This has no alignment requirement.
     * @param limit The largest number of bytes to return. Zero means everything until the end of the object.
     */
    virtual Awaitable<std::unique_ptr<ByteStream>> openRange(std::string_view containerRef, std::string_view locator,
                                                             uint64_t offset, uint64_t limit) = 0;

    /**
     * Download an entire object to a file.
     *
     * @param destination Where to write the file. This is overwritten if it already exists.
     */
    virtual Awaitable<void> downloadTo(std::string_view containerRef, std::string_view locator,
                                       const std::filesystem::path &destination) = 0;

protected:
    DirectSource() = default;
};

} // namespace Remote
