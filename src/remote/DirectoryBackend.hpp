#pragma once

#include "Client.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

class IOContext;

namespace Util
{

class BlockingPool;

} // namespace Util

namespace Remote
{

/**
 * A message backend that's stored in a local directory.
 *
 * Each subdirectory of the root is a container, and the locator of an object is its file name within the container.
 * The clients this makes behave like the real primary API: offsets must be multiples of 4 KiB, and each read returns at
 * most 512 KiB. The backend itself is the direct source, which has neither restriction.
 */
class DirectoryBackend final : public DirectSource
{
public:
    /**
     * The alignment that the primary API requires of read offsets.
     */
    static constexpr uint64_t alignment = 4 << 10;

    /**
     * The most data a single primary API read returns.
     */
    static constexpr size_t maxReadSize = 512 << 10;

    ~DirectoryBackend() override;

    /**
     * @param blockingPool Where to run whole-file copies.
     * @param root The directory that contains the containers.
     */
    explicit DirectoryBackend(IOContext &ioc, Util::BlockingPool &blockingPool, std::filesystem::path root);

    /**
     * Create a client for this backend.
     *
     * @param name The client's identity.
     * @param containers The containers the client is allowed to see. Empty means all of them.
     */
    std::shared_ptr<Client> makeClient(std::string name, std::vector<std::string> containers = {});

    Awaitable<std::unique_ptr<ByteStream>> openRange(std::string_view containerRef, std::string_view locator,
                                                     uint64_t offset, uint64_t limit) override;
    Awaitable<void> downloadTo(std::string_view containerRef, std::string_view locator,
                               const std::filesystem::path &destination) override;

    /**
     * Get the path of an object's file.
     *
     * @throws BackendError If the container or locator would escape the backend's root.
     */
    std::filesystem::path getObjectPath(std::string_view containerRef, std::string_view locator) const;

    const std::filesystem::path &getRoot() const
    {
        return root;
    }

private:
    class DirectoryClient;
    class FileStream;

    /**
     * Open a range of a file as a stream.
     *
     * @param maxPieceSize The most data to return from each read of the stream.
     */
    Awaitable<std::unique_ptr<ByteStream>> openFile(const std::filesystem::path &path, uint64_t offset,
                                                    uint64_t limit, size_t maxPieceSize);

    IOContext &ioc;
    Util::BlockingPool &blockingPool;
    const std::filesystem::path root;
};

} // namespace Remote
