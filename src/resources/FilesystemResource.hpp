#pragma once

#include "server/Resource.hpp"

#include <filesystem>
#include <string>
#include <vector>

class IOContext;

namespace Util
{

class BlockingPool;

} // namespace Util

namespace Server
{

class Path;

/**
 * A directory-like resource whose content comes from the filesystem.
 *
 * Note that this is not atomic in its use of the filesystem, but that should be acceptable for most applications. If
 * it's not, then the user should use a more sophisticated configuration with a reverse HTTP proxy like Nginx.
 */
class FilesystemResource final : public Resource
{
public:
    ~FilesystemResource() override;

    /**
     * Construct a resource to serve a directory from the file system.
     *
     * @param blockingPool Where the files are read when there's no io_uring.
     * @param path The filesystem path to serve content from.
     * @param hiddenNames File names that are never served, wherever they are in the tree.
     * @param hiddenSuffixes Files whose names end with any of these are never served.
     */
    explicit FilesystemResource(IOContext &ioc, Util::BlockingPool &blockingPool, std::filesystem::path path,
                                std::vector<std::string> hiddenNames = {},
                                std::vector<std::string> hiddenSuffixes = {}) :
        ioc(ioc), blockingPool(blockingPool), path(std::move(path)), hiddenNames(std::move(hiddenNames)),
        hiddenSuffixes(std::move(hiddenSuffixes))
    {
    }

    Awaitable<void> getAsync(Response &response, Request &request) override;

    bool getAllowNonEmptyPath() const noexcept override;

private:
    /**
     * Determine whether a request path refers to something that's hidden.
     */
    bool getHidden(const Path &requestPath) const;

    IOContext &ioc;
    Util::BlockingPool &blockingPool;
    const std::filesystem::path path;
    const std::vector<std::string> hiddenNames;
    const std::vector<std::string> hiddenSuffixes;
};

} // namespace Server
