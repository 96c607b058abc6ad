#pragma once

#include "Align.hpp"
#include "ClientPool.hpp"
#include "remote/Client.hpp"

#include <memory>
#include <optional>
#include <string>

namespace Fetch
{

/**
 * Reads a range of an object sequentially, with a single client or with the secondary download API.
 *
 * The stream delivers exactly the bytes of the range. If the backend runs out first, it throws
 * Remote::ShortReadError.
 */
class RangeReader final : public Remote::ByteStream
{
public:
    ~RangeReader() override;

    /**
     * Read with a client from the pool.
     *
     * The primary API needs aligned offsets, so the read starts at the aligned offset and the bytes before the range
     * are dropped.
     *
     * @param lease The client to read with. Only the first client is used.
     * @param start The first byte of the range.
     * @param end The last byte of the range (inclusive).
     * @param sizeHint The (possibly stale) size of the object, which determines the alignment quantum.
     * @param purpose What the range is for.
     */
    explicit RangeReader(ClientPool::Lease lease, std::string containerRef, std::string locator, uint64_t start,
                         uint64_t end, uint64_t sizeHint, Purpose purpose);

    /**
     * Read with the secondary download API.
     *
     * @param start The first byte of the range.
     * @param end The last byte of the range (inclusive).
     */
    explicit RangeReader(Remote::DirectSource &direct, std::string containerRef, std::string locator,
                         uint64_t start, uint64_t end);

    Awaitable<std::vector<std::byte>> readSome() override;

private:
    /**
     * Open the underlying stream.
     */
    Awaitable<void> open();

    std::optional<ClientPool::Lease> lease;
    Remote::DirectSource *direct = nullptr;
    const std::string containerRef;
    const std::string locator;
    const uint64_t start;
    uint64_t sizeHint = 0;
    Purpose purpose = Purpose::stream;

    std::unique_ptr<Remote::ByteStream> stream;

    /**
     * The number of bytes that still need to be dropped from the start of the stream.
     */
    uint64_t toSkip = 0;

    /**
     * The number of bytes of the range that haven't been returned yet.
     */
    uint64_t remaining;
};

} // namespace Fetch
