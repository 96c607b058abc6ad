#include "RangeReader.hpp"

#include "remote/Exceptions.hpp"
#include "util/asio.hpp"

#include <algorithm>

Fetch::RangeReader::~RangeReader() = default;

Fetch::RangeReader::RangeReader(ClientPool::Lease lease, std::string containerRef, std::string locator,
                                uint64_t start, uint64_t end, uint64_t sizeHint, Purpose purpose) :
    lease(std::move(lease)), containerRef(std::move(containerRef)), locator(std::move(locator)), start(start),
    sizeHint(sizeHint), purpose(purpose), remaining(end >= start ? end - start + 1 : 0)
{
    if (this->lease->empty() && remaining > 0) {
        throw std::logic_error("A range reader needs a client.");
    }
}

Fetch::RangeReader::RangeReader(Remote::DirectSource &direct, std::string containerRef, std::string locator,
                                uint64_t start, uint64_t end) :
    direct(&direct), containerRef(std::move(containerRef)), locator(std::move(locator)), start(start),
    remaining(end >= start ? end - start + 1 : 0)
{
}

Awaitable<std::vector<std::byte>> Fetch::RangeReader::readSome()
{
    if (remaining == 0) {
        co_return std::vector<std::byte>();
    }
    if (!stream) {
        co_await open();
    }

    while (true) {
        std::vector<std::byte> data = co_await stream->readSome();
        if (data.empty()) {
            throw Remote::ShortReadError("Read of " + containerRef + "/" + locator + " ended with " +
                                         std::to_string(remaining) + " bytes missing.");
        }

        /* Drop whatever's before the range. */
        if (toSkip > 0) {
            size_t skip = (size_t)std::min<uint64_t>(toSkip, data.size());
            data.erase(data.begin(), data.begin() + (ptrdiff_t)skip);
            toSkip -= skip;
            if (data.empty()) {
                continue;
            }
        }

        /* Drop whatever's after it. */
        if (data.size() > remaining) {
            data.resize((size_t)remaining);
        }
        remaining -= data.size();

        // Nothing else is needed from the backend, so the client can go back to the pool early.
        if (remaining == 0 && lease) {
            stream.reset();
            lease->release();
        }
        co_return data;
    }
}

Awaitable<void> Fetch::RangeReader::open()
{
    if (direct) {
        stream = co_await direct->openRange(containerRef, locator, start, remaining);
        co_return;
    }

    /* The primary API only accepts aligned offsets. */
    Remote::Client &client = *lease->getClients().front();
    Remote::ObjectHandle handle = co_await client.getObjectHandle(containerRef, locator);
    AlignedRange aligned = align(start, remaining, sizeHint, purpose);
    toSkip = aligned.trimOffset;
    stream = co_await client.openRange(handle.fileId, aligned.start, aligned.length);
}
