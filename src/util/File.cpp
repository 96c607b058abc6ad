#include "File.hpp"

#include "util/asio.hpp"
#include "util/BlockingPool.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#ifdef BOOST_ASIO_HAS_IO_URING
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/stream_file.hpp>
#include <boost/asio/write.hpp>
#else // BOOST_ASIO_HAS_IO_URING
#include <fstream>
#endif // BOOST_ASIO_HAS_IO_URING

#ifdef BOOST_ASIO_HAS_IO_URING

struct Util::File::Stream final
{
    explicit Stream(IOContext &ioc, BlockingPool &, const std::filesystem::path &path, Mode mode) :
        file(ioc, path.string(), getFlags(mode))
    {
    }

    static boost::asio::stream_file::flags getFlags(Mode mode)
    {
        using boost::asio::stream_file;
        switch (mode) {
            case Mode::read: return stream_file::read_only;
            case Mode::write: return stream_file::create | stream_file::truncate | stream_file::write_only;
            case Mode::update: return stream_file::read_write;
        }
        std::unreachable();
    }

    boost::asio::stream_file file;
};

#else // BOOST_ASIO_HAS_IO_URING

struct Util::File::Stream final
{
    explicit Stream(IOContext &, BlockingPool &blockingPool, const std::filesystem::path &path, Mode mode) :
        blockingPool(blockingPool)
    {
        file.exceptions(std::ios::badbit | std::ios::failbit);
        file.open(path, getOpenMode(mode));
    }

    static std::ios::openmode getOpenMode(Mode mode)
    {
        switch (mode) {
            case Mode::read: return std::ios::binary | std::ios::in;
            case Mode::write: return std::ios::binary | std::ios::out | std::ios::trunc;
            case Mode::update: return std::ios::binary | std::ios::in | std::ios::out;
        }
        std::unreachable();
    }

    /**
     * Read at the position, on the calling thread.
     */
    std::vector<std::byte> read(size_t maxSize)
    {
        std::vector<std::byte> result(maxSize);
        file.clear();
        file.seekg((std::streamoff)position);
        try {
            file.read((char *)result.data(), (std::streamsize)result.size());
        }
        catch (const std::ios::failure &) {
            // Reading up to the end sets eofbit and failbit, which is just a short read.
            if (!file.eof()) {
                throw;
            }
        }
        result.resize((size_t)file.gcount());
        file.clear();
        position += result.size();
        return result;
    }

    /**
     * Write at the position, on the calling thread.
     */
    void write(std::span<const std::byte> data)
    {
        file.clear();
        file.seekp((std::streamoff)position);
        file.write((const char *)data.data(), (std::streamsize)data.size());
        file.flush();
        position += data.size();
    }

    BlockingPool &blockingPool;
    std::fstream file;

    /**
     * Where the next read or write happens. The stream's own positions are set from this before each one.
     */
    uint64_t position = 0;
};

#endif // BOOST_ASIO_HAS_IO_URING

Util::File::~File() = default;
Util::File::File() = default;

Util::File::File(IOContext &ioc, BlockingPool &blockingPool, std::filesystem::path path, Mode mode) :
    file(std::make_unique<Stream>(ioc, blockingPool, path, mode)), path(std::move(path))
{
}

Util::File &Util::File::operator=(File &&other) = default;

Awaitable<std::vector<std::byte>> Util::File::readSome(size_t maxSize)
{
    maxSize = std::max<size_t>(maxSize, 1);
#ifdef BOOST_ASIO_HAS_IO_URING
    std::vector<std::byte> result(maxSize);
    auto [e, n] = co_await file->file.async_read_some(boost::asio::buffer(result),
                                                      boost::asio::as_tuple(boost::asio::use_awaitable));
    if (e && e != boost::asio::error::eof) {
        throw std::runtime_error("Error reading file " + path.string() + ": " + e.message() + ".");
    }
    result.resize(n);
    co_return result;
#else // BOOST_ASIO_HAS_IO_URING
    Stream &stream = *file;
    co_return co_await stream.blockingPool.run([&stream, maxSize]() {
        return stream.read(maxSize);
    });
#endif // BOOST_ASIO_HAS_IO_URING
}

Awaitable<std::vector<std::byte>> Util::File::readAll()
{
    std::vector<std::vector<std::byte>> dataParts;
    while (true) {
        std::vector<std::byte> part = co_await readSome();
        if (part.empty()) {
            co_return Util::concatenate(std::move(dataParts));
        }
        dataParts.emplace_back(std::move(part));
    }
}

Awaitable<void> Util::File::write(std::span<const std::byte> data)
{
#ifdef BOOST_ASIO_HAS_IO_URING
    co_await boost::asio::async_write(file->file, boost::asio::const_buffer(data.data(), data.size()),
                                      boost::asio::use_awaitable);
#else // BOOST_ASIO_HAS_IO_URING
    Stream &stream = *file;
    co_await stream.blockingPool.run([&stream, data]() {
        stream.write(data);
    });
#endif // BOOST_ASIO_HAS_IO_URING
}

Awaitable<void> Util::File::write(std::string_view data)
{
    return write(std::as_bytes(std::span(data.data(), data.size())));
}

Awaitable<void> Util::File::writeAt(uint64_t offset, std::span<const std::byte> data)
{
    seek(offset);
    co_await write(data);
}

void Util::File::seek(uint64_t offset)
{
#ifdef BOOST_ASIO_HAS_IO_URING
    file->file.seek((int64_t)offset, boost::asio::stream_file::seek_basis::seek_set);
#else // BOOST_ASIO_HAS_IO_URING
    file->position = offset;
#endif // BOOST_ASIO_HAS_IO_URING
}
