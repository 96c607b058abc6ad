#include "Response.hpp"

#include "util/asio.hpp"

Server::Response::~Response() = default;

void Server::Response::setErrorAndMessage(ErrorKind kind, std::string_view message)
{
    setError(kind);
    partial = false;
    contentLength.reset();
    if (message.empty()) {
        setMimeType({});
        return;
    }
    setMimeType("text/plain");
    (*this) << message;
}

Awaitable<void> Server::Response::flush(bool end)
{
    Awaitable<void> result = flushBody(end);
    writeStarted = true; // As in operator<<, flushBody sees the state from before.
    return result;
}
