#pragma once

#include "Server.hpp"
#include "util/awaitable.hpp"

class IOContext;

namespace Config
{

struct Http;
struct Network;

} // namespace Config

namespace Server
{

/**
 * Serves the resource tree over HTTP/1.1.
 *
 * Connections are kept alive when the client asks. HEAD requests run the GET handler, and the body is dropped.
 */
class HttpServer final : public Server
{
public:
    ~HttpServer() override;

    /**
     * Start serving on `networkConfig.port`, in a detached coroutine that never finishes.
     *
     * @param log Receives a line per request, and connection errors.
     */
    explicit HttpServer(IOContext &ioc, Log::Log &log, const Config::Network &networkConfig,
                        const Config::Http &httpConfig);

private:
    /// A socket, and the buffers used to read requests from it.
    struct Connection;

    /// Accept connections forever, serving each in its own coroutine.
    Awaitable<void> listen();

    /// Serve requests from a connection until either end closes it.
    Awaitable<void> onConnection(Connection &connection);

    /**
     * Read one request from a connection and write the response.
     *
     * @return Whether the connection can take another request.
     */
    Awaitable<bool> onRequest(Connection &connection, Log::Context &connectionContext);

    IOContext &ioc;
    const Config::Network &networkConfig;
    const Config::Http &httpConfig;

    /// Collects a failure of listen() itself, such as the port being taken.
    Log::Context listenContext;
};

} // namespace Server
