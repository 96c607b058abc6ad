#include "HttpServer.hpp"

#include "CacheKind.hpp"
#include "Error.hpp"
#include "Request.hpp"
#include "Response.hpp"

#include "configuration/configuration.hpp"
#include "log/Log.hpp"
#include "util/asio.hpp"
#include "util/util.hpp"

#include <boost/asio/ip/tcp.hpp>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <utility>

/// @addtogroup server_implementation
/// @{

namespace
{

namespace http = boost::beast::http;

/**
 * The largest request header we accept.
 */
constexpr size_t maxHeaderSize = 64 << 10;

/**
 * The largest request body we accept. The API only takes small POSTs.
 */
constexpr uint64_t maxBodySize = 1 << 20;

/**
 * Format an endpoint to a human-readable string.
 */
std::string formatEndpoint(const boost::asio::ip::tcp::endpoint &endpoint)
{
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

/**
 * Format a time as an HTTP date, e.g: "Sun, 06 Nov 1994 08:49:37 GMT".
 */
std::string formatHttpDate(std::chrono::system_clock::time_point time)
{
    using namespace std::chrono;
    static constexpr std::array<const char *, 7> weekdays = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };
    static constexpr std::array<const char *, 12> months = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };

    sys_days day = floor<days>(time);
    year_month_day ymd{day};
    hh_mm_ss clock{floor<seconds>(time - day)};

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s, %02u %s %d %02d:%02d:%02d GMT",
                  weekdays[weekday{day}.c_encoding()], (unsigned)ymd.day(), months[(unsigned)ymd.month() - 1],
                  (int)ymd.year(), (int)clock.hours().count(), (int)clock.minutes().count(),
                  (int)clock.seconds().count());
    return buffer;
}

/**
 * Get the HTTP status for the outcome of a request.
 *
 * @param errorKind The error, if the request failed.
 * @param partial Whether a successful response is for part of the resource.
 */
http::status getHttpStatus(std::optional<Server::ErrorKind> errorKind, bool partial)
{
    if (!errorKind) {
        return partial ? http::status::partial_content : http::status::ok;
    }
    switch (*errorKind) {
        case Server::ErrorKind::BadRequest: return http::status::bad_request;
        case Server::ErrorKind::Forbidden: return http::status::forbidden;
        case Server::ErrorKind::NotFound: return http::status::not_found;
        case Server::ErrorKind::UnsupportedType: return http::status::method_not_allowed;
        case Server::ErrorKind::Conflict: return http::status::conflict;
        case Server::ErrorKind::RangeNotSatisfiable: return http::status::range_not_satisfiable;
        case Server::ErrorKind::Unavailable: return http::status::service_unavailable;
        case Server::ErrorKind::Internal: return http::status::internal_server_error;
    }
    std::unreachable();
}

/**
 * The socket of a connection, and what's been read from it but not yet parsed.
 */
struct Connection
{
    explicit Connection(boost::asio::ip::tcp::socket socket) : socket(std::move(socket)) {}

    boost::asio::ip::tcp::socket socket;
    boost::beast::flat_buffer buffer;
};

/**
 * A request whose body is read from the connection as the resource asks for it.
 */
class HttpRequest final : public Server::Request
{
public:
    ~HttpRequest() override = default;

    /**
     * @param parser The parser that's already read the request's header.
     * @param connection The connection to read the body from.
     */
    explicit HttpRequest(http::request_parser<http::buffer_body> &parser, Connection &connection, Server::Path path,
                         Type type, Headers headers) :
        Request(std::move(path), type, std::move(headers)), parser(parser), connection(connection)
    {
    }

    Awaitable<std::vector<std::byte>> doReadSome() override
    {
        while (!parser.is_done()) {
            std::vector<std::byte> data(16 << 10);
            http::buffer_body::value_type &body = parser.get().body();
            body.data = data.data();
            body.size = data.size();
            co_await http::async_read_some(connection.socket, connection.buffer, parser, boost::asio::use_awaitable);

            // Beast sometimes finishes a read without any body, e.g: when it's only parsed a chunk header.
            data.resize(data.size() - body.size);
            if (!data.empty()) {
                co_return data;
            }
        }
        co_return std::vector<std::byte>{};
    }

private:
    http::request_parser<http::buffer_body> &parser;
    Connection &connection;
};

/**
 * A response that's written straight to the connection.
 *
 * The headers go out with the first flush. If the resource didn't set a length and the first flush isn't also the
 * last, the body is sent with chunked encoding.
 */
class HttpResponse final : public Server::Response
{
public:
    ~HttpResponse() override = default;

    /**
     * @param keepAlive Whether to tell the client it can send another request on this connection.
     * @param discard Whether to leave out the body, as for HEAD.
     * @param cacheable Whether the request method allows the response to be cached.
     */
    explicit HttpResponse(Connection &connection, const Config::Http &httpConfig, bool keepAlive, bool discard,
                          bool cacheable) :
        connection(connection), httpConfig(httpConfig), discard(discard), cacheable(cacheable)
    {
        response.keep_alive(keepAlive);
    }

    bool getBodyDiscarded() const override
    {
        return discard;
    }

    /**
     * Get the status that was, or will be, sent.
     */
    http::status getStatus() const
    {
        return getHttpStatus(getErrorKind(), getPartial());
    }

private:
    void writeBody(std::vector<std::byte> data) override
    {
        pending.emplace_back(std::move(data));
    }

    Awaitable<void> flushBody(bool end) override
    {
        std::vector<std::byte> data = Util::concatenate(std::move(pending));
        pending.clear();

        /* Send the headers with the first flush. The length is known if the resource said so, or if this is
           everything. */
        if (!serializer.is_header_done()) {
            std::optional<uint64_t> contentLength = getContentLength();
            if (!contentLength && end) {
                contentLength = data.size();
            }
            setHeaders(contentLength);
            co_await http::async_write_header(connection.socket, serializer, boost::asio::use_awaitable);
        }

        if (discard) {
            co_return;
        }

        /* Chunked bodies are written as chunks directly, since the serializer doesn't cope with being resumed. */
        if (response.chunked()) {
            if (!data.empty()) {
                co_await boost::asio::async_write(connection.socket,
                                                  http::make_chunk(boost::asio::const_buffer(data.data(), data.size())),
                                                  boost::asio::use_awaitable);
            }
            if (end) {
                co_await boost::asio::async_write(connection.socket, http::make_chunk_last(),
                                                  boost::asio::use_awaitable);
            }
            co_return;
        }

        // The serializer reports need_buffer once it's written everything it was given.
        response.body().data = data.empty() ? nullptr : data.data();
        response.body().size = data.size();
        response.body().more = !end;
        try {
            co_await http::async_write(connection.socket, serializer, boost::asio::use_awaitable);
        }
        catch (const boost::system::system_error &e) {
            if (e.code() != http::error::need_buffer) {
                throw;
            }
        }
    }

    /**
     * Fill in the response header.
     *
     * @param contentLength The length of the body, or std::nullopt to send it chunked.
     */
    void setHeaders(std::optional<uint64_t> contentLength)
    {
        response.result(getStatus());
        response.set(http::field::server, "streamvault");
        response.set(http::field::date, formatHttpDate(std::chrono::system_clock::now()));
        if (cacheable) {
            unsigned int maxAge = (getCacheKind() == Server::CacheKind::fixed) ? httpConfig.cacheNonLiveTime : 0;
            response.set(http::field::cache_control, maxAge ? "public, max-age=" + std::to_string(maxAge) : "no-cache");
        }
        if (httpConfig.origin) {
            response.set(http::field::access_control_allow_origin, *httpConfig.origin);
        }
        if (!getMimeType().empty()) {
            response.set(http::field::content_type, getMimeType());
        }
        for (const auto &[field, value]: getExtraHeaders()) {
            response.set(field, value);
        }
        if (contentLength) {
            response.content_length(*contentLength);
        }
        else {
            response.chunked(true);
        }
    }

    Connection &connection;
    const Config::Http &httpConfig;
    const bool discard;
    const bool cacheable;

    http::response<http::buffer_body> response;
    http::response_serializer<http::buffer_body> serializer{response};

    /**
     * Body data that's been written, but not yet flushed.
     */
    std::vector<std::vector<std::byte>> pending;
};

/**
 * Convert an HTTP verb into a request type.
 *
 * @return The request type corresponding to the verb, or std::nullopt if there is none.
 */
std::optional<Server::Request::Type> getRequestType(http::verb verb)
{
    switch (verb) {
        case http::verb::head:
        case http::verb::get:
            return Server::Request::Type::get;
        case http::verb::post:
            return Server::Request::Type::post;
        case http::verb::options:
            return Server::Request::Type::options;
        default:
            return std::nullopt;
    }
}

/**
 * Parse a request target into a path.
 *
 * @return The path, or std::nullopt if the target isn't something we'd serve.
 */
std::optional<Server::Path> getRequestPath(std::string_view target)
{
    try {
        return Server::Path::fromTarget(target);
    }
    catch (const Server::Path::Exception &) {
        return std::nullopt;
    }
}

/**
 * Collect the request headers that resources can look at.
 */
Server::Request::Headers getRequestHeaders(const http::request<http::buffer_body> &request)
{
    Server::Request::Headers headers;
    for (const auto &field: request) {
        if (field.name() != http::field::unknown) {
            headers[field.name()] = std::string(field.value());
        }
    }
    return headers;
}

} // namespace

/// @}

/**
 * Connection argument to pass around to (private) methods defined in the header :)
 */
struct Server::HttpServer::Connection final : public ::Connection
{
    using ::Connection::Connection;
};

Server::HttpServer::~HttpServer() = default;

Server::HttpServer::HttpServer(IOContext &ioc, Log::Log &log, const Config::Network &networkConfig,
                               const Config::Http &httpConfig) :
    Server(log), ioc(ioc), networkConfig(networkConfig), httpConfig(httpConfig), listenContext(log("listen"))
{
    spawnDetached(ioc, listenContext, [this]() -> Awaitable<void> { return listen(); }, Log::Level::fatal);
}

Awaitable<bool> Server::HttpServer::onRequest(Connection &connection, Log::Context &connectionContext)
{
    /* Read the header. */
    http::request_parser<http::buffer_body> parser;
    parser.header_limit(maxHeaderSize);
    parser.body_limit(maxBodySize);
    try {
        co_await http::async_read_header(connection.socket, connection.buffer, parser, boost::asio::use_awaitable);
    }
    catch (const boost::system::system_error &e) {
        // The client closing the connection between requests is normal.
        if (e.code() == http::error::end_of_stream && !parser.got_some()) {
            co_return false;
        }
        throw;
    }
    http::verb verb = parser.get().method();
    std::string_view target(parser.get().target().data(), parser.get().target().size());

    HttpResponse response(connection, httpConfig, parser.keep_alive(), verb == http::verb::head,
                          verb == http::verb::head || verb == http::verb::get);
    auto logRequest = [&]() {
        http::status status = response.getStatus();
        connectionContext << "request" << ((status >= http::status::internal_server_error) ? Log::Level::warning :
                                                                                              Log::Level::info)
                          << http::to_string(verb) << " " << target << " " << (unsigned)status;
    };

    /* Requests we can't make sense of get an error, and the connection is closed since its body wasn't read. */
    std::optional<Request::Type> requestType = getRequestType(verb);
    std::optional<Path> path = getRequestPath(target);
    if (!requestType || !path) {
        response.setErrorAndMessage(requestType ? ErrorKind::Forbidden : ErrorKind::UnsupportedType);
        co_await response.flush(true);
        logRequest();
        connection.buffer.clear();
        co_return false;
    }

    /* Serve it. */
    HttpRequest request(parser, connection, std::move(*path), *requestType, getRequestHeaders(parser.get()));
    co_await (*this)(response, request, connectionContext);
    logRequest();

    /* A response that failed part way through has to be cut off, so the client can tell. */
    if (response.getAborted()) {
        connection.buffer.clear();
        co_return false;
    }

    /* Anything left of the body would be taken as the next request. */
    if (!(co_await request.readSome()).empty()) {
        // Errors are often sent before the body is read.
        if (response.getErrorKind()) {
            connection.buffer.clear();
            co_return false;
        }
        throw std::runtime_error("End of request body not reached.");
    }

    co_return parser.keep_alive();
}

Awaitable<void> Server::HttpServer::onConnection(Connection &connection)
{
    Log::Context connectionContext = log("connection");
    try {
        connectionContext << "endpoints" << Log::Level::debug << formatEndpoint(connection.socket.remote_endpoint())
                          << " -> " << formatEndpoint(connection.socket.local_endpoint());

        while (co_await onRequest(connection, connectionContext)) {}

        if (connection.buffer.size() > 0) {
            throw std::runtime_error("Excess data in buffer after handling request.");
        }
    }
    catch (const std::exception &e) {
        connectionContext << Log::Level::error << "Exception while handling request: " << e.what() << ".";
    }

    boost::system::error_code ec;
    connection.socket.close(ec);
    if (ec) {
        connectionContext << Log::Level::error << "Error while closing socket: " << ec.message() << ".";
    }
}

Awaitable<void> Server::HttpServer::listen()
{
    Log::Context acceptorContext = log("acceptor");

    // Dual stack, so IPv4 clients work too.
    boost::asio::ip::tcp::acceptor acceptor(ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v6(),
                                                                                networkConfig.port));
    acceptorContext << "listen" << Log::Level::info << "Listening on port " << networkConfig.port << ".";

    while (true) {
        try {
            boost::asio::ip::tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);

            // Each connection gets its own coroutine, so accepting can carry on.
            spawnDetached(ioc, [this, socket = std::move(socket)]() mutable -> Awaitable<void> {
                Connection connection(std::move(socket));
                co_await onConnection(connection);
            });
        }
        catch (const std::exception &e) {
            acceptorContext << Log::Level::error << "Exception while accepting connection: " << e.what() << ".";
        }
    }
}
