#include "DirectoryBackend.hpp"

#include "Exceptions.hpp"

#include "util/BlockingPool.hpp"
#include "util/File.hpp"

#include <algorithm>

namespace
{

/**
 * Check that a path component can't be used to escape the backend's root.
 */
void checkComponent(std::string_view component, const char *what)
{
    if (component.empty() || component == "." || component == ".." ||
        component.find('/') != std::string_view::npos || component.find('\0') != std::string_view::npos) {
        throw Remote::BackendError("Invalid " + std::string(what) + " \"" + std::string(component) + "\".");
    }
}

} // namespace

/**
 * Reads a range of a file.
 */
class Remote::DirectoryBackend::FileStream final : public ByteStream
{
public:
    ~FileStream() override = default;

    /**
     * @param maxPieceSize The most data to return from each call to readSome.
     */
    explicit FileStream(Util::File file, uint64_t limit, size_t maxPieceSize) :
        file(std::move(file)), remaining(limit), maxPieceSize(maxPieceSize)
    {
    }

    Awaitable<std::vector<std::byte>> readSome() override
    {
        if (remaining == 0) {
            co_return std::vector<std::byte>();
        }
        std::vector<std::byte> data = co_await file.readSome((size_t)std::min<uint64_t>(remaining, maxPieceSize));
        remaining -= data.size();
        co_return data;
    }

    /**
     * Set where the stream starts.
     */
    void start(uint64_t offset)
    {
        file.seek(offset);
    }

private:
    Util::File file;
    uint64_t remaining;
    const size_t maxPieceSize;
};

/**
 * A client of the primary API.
 */
class Remote::DirectoryBackend::DirectoryClient final : public Client
{
public:
    ~DirectoryClient() override = default;

    explicit DirectoryClient(DirectoryBackend &backend, std::string name, std::vector<std::string> containers) :
        backend(backend), name(std::move(name)), containers(std::move(containers))
    {
    }

    const std::string &getIdentity() const override
    {
        return name;
    }

    bool getConnected() const override
    {
        return true;
    }

    Awaitable<bool> probeAccess(std::string_view containerRef) override
    {
        if (!canSee(containerRef)) {
            co_return false;
        }
        checkComponent(containerRef, "container");
        co_return std::filesystem::is_directory(backend.root / containerRef);
    }

    Awaitable<ObjectHandle> getObjectHandle(std::string_view containerRef, std::string_view locator) override
    {
        if (!canSee(containerRef)) {
            throw BackendError("Client " + name + " cannot access container \"" + std::string(containerRef) + "\".");
        }
        std::filesystem::path path = backend.getObjectPath(containerRef, locator);
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw BackendError("No object \"" + std::string(locator) + "\" in container \"" +
                               std::string(containerRef) + "\".");
        }
        co_return ObjectHandle{ .fileId = (std::filesystem::path(containerRef) / locator).string(),
                                .declaredSize = size };
    }

    Awaitable<std::unique_ptr<ByteStream>> openRange(const std::string &fileId, uint64_t offset,
                                                     uint64_t limit) override
    {
        if (offset % alignment != 0) {
            throw BackendError("Offset " + std::to_string(offset) + " is not a multiple of " +
                               std::to_string(alignment) + ".");
        }

        /* The file ID is container/locator. */
        size_t separator = fileId.find('/');
        if (separator == std::string::npos) {
            throw BackendError("Invalid file ID \"" + fileId + "\".");
        }
        std::string_view containerRef = std::string_view(fileId).substr(0, separator);
        std::string_view locator = std::string_view(fileId).substr(separator + 1);
        if (!canSee(containerRef)) {
            throw BackendError("Client " + name + " cannot access container \"" + std::string(containerRef) + "\".");
        }

        co_return co_await backend.openFile(backend.getObjectPath(containerRef, locator), offset, limit, maxReadSize);
    }

private:
    bool canSee(std::string_view containerRef) const
    {
        return containers.empty() || std::find(containers.begin(), containers.end(), containerRef) != containers.end();
    }

    DirectoryBackend &backend;
    const std::string name;
    const std::vector<std::string> containers;
};

Remote::DirectoryBackend::~DirectoryBackend() = default;

Remote::DirectoryBackend::DirectoryBackend(IOContext &ioc, Util::BlockingPool &blockingPool,
                                           std::filesystem::path root) :
    ioc(ioc), blockingPool(blockingPool), root(std::move(root))
{
}

std::shared_ptr<Remote::Client> Remote::DirectoryBackend::makeClient(std::string name,
                                                                     std::vector<std::string> containers)
{
    return std::make_shared<DirectoryClient>(*this, std::move(name), std::move(containers));
}

std::filesystem::path Remote::DirectoryBackend::getObjectPath(std::string_view containerRef,
                                                              std::string_view locator) const
{
    checkComponent(containerRef, "container");
    checkComponent(locator, "locator");
    return root / containerRef / locator;
}

Awaitable<std::unique_ptr<Remote::ByteStream>>
Remote::DirectoryBackend::openRange(std::string_view containerRef, std::string_view locator, uint64_t offset,
                                    uint64_t limit)
{
    co_return co_await openFile(getObjectPath(containerRef, locator), offset, limit, 1 << 20);
}

Awaitable<void> Remote::DirectoryBackend::downloadTo(std::string_view containerRef, std::string_view locator,
                                                     const std::filesystem::path &destination)
{
    std::filesystem::path source = getObjectPath(containerRef, locator);
    if (!std::filesystem::is_regular_file(source)) {
        throw BackendError("No object \"" + std::string(locator) + "\" in container \"" + std::string(containerRef) +
                           "\".");
    }
    co_await blockingPool.run([source, destination]() {
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing);
    });
}

Awaitable<std::unique_ptr<Remote::ByteStream>>
Remote::DirectoryBackend::openFile(const std::filesystem::path &path, uint64_t offset, uint64_t limit,
                                   size_t maxPieceSize)
{
    /* Work out how much there is to read. */
    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw BackendError("Cannot open " + path.string() + ": " + ec.message());
    }
    uint64_t available = (offset < size) ? size - offset : 0;
    if (limit == 0 || limit > available) {
        limit = available;
    }

    /* Open the file positioned at the start of the range. */
    auto stream = std::make_unique<FileStream>(Util::File(ioc, blockingPool, path), limit, maxPieceSize);
    if (limit > 0) {
        stream->start(offset);
    }
    co_return std::unique_ptr<ByteStream>(std::move(stream));
}
