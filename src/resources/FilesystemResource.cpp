#include "FilesystemResource.hpp"

#include "server/Request.hpp"
#include "server/Response.hpp"
#include "util/asio.hpp"
#include "util/File.hpp"

namespace
{

/**
 * How to serve a type of file.
 */
struct FileType final
{
    std::string_view extension;
    std::string_view mimeType;
    Server::CacheKind cacheKind;
};

/**
 * The set of built-in known file types.
 *
 * Playlists are rewritten while a transcode is running, so they mustn't be cached. Segments never change.
 */
constexpr FileType fileTypes[] = {
    { ".m3u8", "application/vnd.apple.mpegurl", Server::CacheKind::none },
    { ".ts", "video/mp2t", Server::CacheKind::fixed },
    { ".m4s", "video/iso.segment", Server::CacheKind::fixed },
    { ".mp4", "video/mp4", Server::CacheKind::fixed },
    { ".vtt", "text/vtt", Server::CacheKind::fixed }
};

/**
 * Get how to serve a file.
 */
FileType getFileType(const std::filesystem::path &path)
{
    std::string extension = path.extension().string();
    for (const FileType &type: fileTypes) {
        if (type.extension == extension) {
            return type;
        }
    }
    return { extension, "application/octet-stream", Server::CacheKind::none };
}

} // namespace

Server::FilesystemResource::~FilesystemResource() = default;

Awaitable<void> Server::FilesystemResource::getAsync(Response &response, Request &request)
{
    /* Figure out the path. */
    // This is protected from directory traversal attacks by the constructor for the object returned by
    // request.getPath().
    if (request.getPath().empty() || getHidden(request.getPath())) {
        throw Error(ErrorKind::NotFound);
    }
    std::filesystem::path filePath = path / (std::filesystem::path)request.getPath();

    /* Check that the path exists and that it's not a directory. */
    // Unfortunately, boost.asio doesn't seem to have anything that would do this.
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(filePath, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw Error(ErrorKind::NotFound);
    }
    if (std::filesystem::is_directory(status)) {
        throw Error(ErrorKind::Forbidden);
    }

    /* Set the response properties. */
    FileType type = getFileType(filePath);
    response.setCacheKind(type.cacheKind);
    response.setMimeType(std::string(type.mimeType));
    if (response.getBodyDiscarded()) {
        co_return;
    }

    /* Write the file to the response. */
    Util::File file(ioc, blockingPool, std::move(filePath));
    while (true) {
        std::vector<std::byte> data = co_await file.readSome();
        if (data.empty()) {
            co_return;
        }
        response << std::move(data);
        co_await response.flush();
    }
}

bool Server::FilesystemResource::getAllowNonEmptyPath() const noexcept
{
    return true;
}

bool Server::FilesystemResource::getHidden(const Path &requestPath) const
{
    for (size_t i = 0; i < requestPath.size(); i++) {
        std::string_view part = requestPath[i];
        for (const std::string &name: hiddenNames) {
            if (part == name) {
                return true;
            }
        }
        for (const std::string &suffix: hiddenSuffixes) {
            if (part.ends_with(suffix)) {
                return true;
            }
        }
    }
    return false;
}
