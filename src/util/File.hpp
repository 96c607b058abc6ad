#pragma once

#include "util/awaitable.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

class IOContext;

namespace Util
{

class BlockingPool;

/**
 * A file, read and written without blocking the IOContext.
 *
 * With io_uring the reads and writes go through the IOContext. Without it they're run on a BlockingPool. Opening the
 * file happens in the constructor either way.
 */
class File final
{
public:
    /**
     * The most readSome returns by default.
     */
    static constexpr size_t defaultReadSize = 1 << 16;

    enum class Mode
    {
        /**
         * Open an existing file for reading.
         */
        read,

        /**
         * Create or truncate a file, and open it for writing.
         */
        write,

        /**
         * Open an existing file for reading and writing, without truncating it.
         *
         * Each of the parallel fetch workers opens the partial file like this, to write its own chunks.
         */
        update
    };

    ~File();

    /**
     * Make a closed file, to move an open one into later.
     */
    File();

    /**
     * @param blockingPool Where reads and writes happen when there's no io_uring. It must outlive the file.
     * @throws std::exception If the file can't be opened.
     */
    explicit File(IOContext &ioc, BlockingPool &blockingPool, std::filesystem::path path, Mode mode = Mode::read);

    File(File &&) = default;
    File &operator=(File &&other);

    operator bool() const
    {
        return (bool)file;
    }

    /**
     * Read from the current position.
     *
     * @param maxSize The most to read. At least one byte is returned unless the end of the file has been reached.
     * @return The data, or nothing at the end of the file.
     */
    Awaitable<std::vector<std::byte>> readSome(size_t maxSize = defaultReadSize);

    /**
     * Read from the current position to the end of the file.
     */
    Awaitable<std::vector<std::byte>> readAll();

    /**
     * Write at the current position.
     */
    Awaitable<void> write(std::span<const std::byte> data);
    Awaitable<void> write(std::string_view data);

    /**
     * Write at an offset, leaving the position after what was written.
     */
    Awaitable<void> writeAt(uint64_t offset, std::span<const std::byte> data);

    /**
     * Move the position to an offset from the start.
     *
     * This does no IO of its own.
     */
    void seek(uint64_t offset);

    const std::filesystem::path &getPath() const
    {
        return path;
    }

private:
    struct Stream;

    /**
     * Null if the file isn't open.
     */
    std::unique_ptr<Stream> file;

    std::filesystem::path path;
};

} // namespace Util
