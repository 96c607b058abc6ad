#pragma once

#include "Log.hpp"

#include "util/File.hpp"

#include <filesystem>

namespace Log
{

/**
 * A log that appends each item, as a line of JSON, to a file.
 */
class FileLog final : public Log
{
public:
    ~FileLog() override;

    /**
     * @param blockingPool Where the file is written when there's no io_uring.
     * @param path The file to write. It's truncated first.
     * @param minLevel The minimum level to log.
     * @param print Also print the log to stderr.
     */
    explicit FileLog(IOContext &ioc, Util::BlockingPool &blockingPool, const std::filesystem::path &path,
                     Level minLevel, bool print);

private:
    Awaitable<void> store(Item item) override;

    /**
     * The file the log is written to.
     *
     * Log never calls store in parallel, so this needs no locking.
     */
    Util::File file;
};

} // namespace Log
