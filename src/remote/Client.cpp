#include "Client.hpp"

#include "util/asio.hpp"

Remote::ByteStream::~ByteStream() = default;

Awaitable<void> Remote::ByteStream::stop()
{
    co_return;
}

Remote::Client::~Client() = default;
Remote::DirectSource::~DirectSource() = default;
