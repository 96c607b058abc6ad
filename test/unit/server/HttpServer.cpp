#include "coro_test.hpp"
#include "data.hpp"

#include "util/json.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <span>

namespace
{

constexpr uint16_t port = 12480;

/**
 * The size of the video object the server offers.
 */
constexpr size_t movieSize = 3000000;

/**
 * The content of the video object the server offers.
 */
std::string getMovieData()
{
    std::string data(movieSize, '\0');
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = (char)(i % 251);
    }
    return data;
}

/**
 * Write the backend, catalog, and configuration for a server into a directory.
 *
 * @return The path of the configuration file.
 */
std::filesystem::path writeServerFiles(const TemporaryDirectory &dir)
{
    /* The backend. */
    std::filesystem::create_directories(dir / "backend" / "media");
    {
        std::ofstream stream(dir / "backend" / "media" / "movie.mkv", std::ios::binary);
        stream << getMovieData();
    }
    writeFileAndParents(dir / "backend" / "media" / "notes.txt", "Cats are cute :D");

    /* The catalog. */
    writeFileAndParents(dir / "catalog.json", R"({
        "objects": [
            { "id": "movie", "container": "media", "locator": "movie.mkv",
              "video": { "size": 3000000, "mimeType": "video/x-matroska", "fileName": "My Movie.mkv" } },
            { "id": "notes", "container": "media", "locator": "notes.txt",
              "document": { "size": 16, "mimeType": "text/plain" } }
        ]
    })");

    /* The configuration. */
    nlohmann::json config = {
        { "network", { { "port", port } } },
        { "http", { { "origin", "*" } } },
        { "log", { { "print", false } } },
        { "cache", { { "root", (dir / "cache").string() }, { "warmDelay", 3600 } } },
        { "transcode", {
            { "ffmpeg", getTestDataPath("bin/fake-ffmpeg").string() },
            { "ffprobe", getTestDataPath("bin/fake-ffprobe").string() }
        } },
        { "backend", {
            { "root", (dir / "backend").string() },
            { "clients", { { { "name", "client0" } }, { { "name", "client1" } } } }
        } },
        { "catalog", (dir / "catalog.json").string() }
    };
    writeFileAndParents(dir / "config.json", config.dump());
    return dir / "config.json";
}

/**
 * Execute the real server by using fork.
 *
 * Doing that is easier than having multiple IO contexts.
 */
class HttpServerSubprocess final
{
public:
    /**
     * Kill the HTTP server.
     */
    ~HttpServerSubprocess()
    {
        if (pid < 0) {
            return;
        }
        if (kill(pid, SIGKILL) != 0) {
            perror("Failed to kill server");
        }
    }

    /**
     * Start the HTTP server if it hasn't already been started.
     */
    Awaitable<void> operator()(IOContext &ioc)
    {
        /* Idempotency. */
        if (pid > 0) {
            co_return;
        }

        /* Write everything the server needs before it starts. */
        std::string configPath = writeServerFiles(dir).string();

        /* Fork :) */
        pid = fork();
        if (pid < 0) {
            perror("Failed to fork for test HTTP server");
        }

        /* Parent process. */
        else if (pid > 0) {
            // Wait for the child to start listening.
            for (int i = 0; i < 50; i++) {
                // Try to connect to the socket.
                boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::tcp::v6(), port);
                boost::asio::ip::tcp::socket socket(ioc);
                auto [e, connected] = co_await boost::asio::async_connect(
                    socket, std::span(&endpoint, 1), boost::asio::as_tuple(boost::asio::use_awaitable));
                if (!e) {
                    // Put in a valid request, so we don't cause an exception in the HTTP server to get logged.
                    std::string_view request = "HEAD /stream/notes HTTP/1.0\r\n\r\n";
                    co_await boost::asio::async_write(socket, boost::asio::const_buffer(request.data(),
                                                                                        request.size()),
                                                      boost::asio::use_awaitable);
                    break;
                }

                // Wait for a short time.
                boost::asio::steady_timer sleeper(ioc);
                sleeper.expires_after(std::chrono::milliseconds(100));
                co_await sleeper.async_wait(boost::asio::use_awaitable);
            }
            co_return;
        }

        /* Exec, keeping the environment so the fake tools can find the shell utilities. */
        std::string serverBin = STREAMVAULT_BIN;
        char *argv[] = {serverBin.data(), configPath.data(), nullptr};
        execv(serverBin.c_str(), argv);

        // Error.
        perror("Failed to exec test HTTP server");
        _exit(1);
    }

private:
    TemporaryDirectory dir{"HttpServer"};
    pid_t pid = -1;
};
HttpServerSubprocess subprocess;

class Socket final
{
public:
    Socket(IOContext &ioc) : ioc(ioc), socket(ioc) {}

    /**
     * Read from the socket until end of file and return a string.
     */
    Awaitable<std::string> readAllAsString()
    {
        co_await connect();

        std::string result;
        while (true) {
            char buffer[4096];
            auto [e, n] = co_await socket.async_read_some(boost::asio::buffer(buffer),
                                                          boost::asio::as_tuple(boost::asio::use_awaitable));
            result.append(buffer, n);

            if (e == boost::asio::error::eof) {
                co_return result;
            }
            else if (e) {
                throw std::runtime_error("Error reading socket.");
            }
        }
    }

    /**
     * Write to the socket.
     */
    Awaitable<void> write(std::string_view data)
    {
        co_await connect();
        co_await boost::asio::async_write(socket, boost::asio::const_buffer(data.data(), data.size()),
                                          boost::asio::use_awaitable);
    }

    /**
     * Send a request and parse the response.
     *
     * @param method The HTTP method.
     * @param target The request target.
     * @param range The value of the Range header, if any.
     * @param keepAlive Whether to ask for the connection to be kept open afterwards.
     */
    Awaitable<boost::beast::http::response<boost::beast::http::string_body>>
    request(boost::beast::http::verb method, std::string_view target, std::string_view range = {},
            bool keepAlive = false)
    {
        co_await connect();

        boost::beast::http::request<boost::beast::http::empty_body> request(method, target, 11);
        request.set(boost::beast::http::field::host, "localhost");
        if (!range.empty()) {
            request.set(boost::beast::http::field::range, range);
        }
        request.keep_alive(keepAlive);
        co_await boost::beast::http::async_write(socket, request, boost::asio::use_awaitable);

        boost::beast::http::response_parser<boost::beast::http::string_body> parser;
        parser.body_limit(64 << 20);
        parser.skip(method == boost::beast::http::verb::head);
        co_await boost::beast::http::async_read(socket, buffer, parser, boost::asio::use_awaitable);
        co_return parser.release();
    }

private:
    Awaitable<void> connect()
    {
        /* Don't connect if already connected. */
        if (socket.is_open()) {
            co_return;
        }

        /* Make sure the test HTTP server is started up. */
        co_await subprocess(ioc);

        /* Connect. */
        boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::tcp::v6(), port);
        co_await boost::asio::async_connect(socket, std::span(&endpoint, 1), boost::asio::use_awaitable);
    }

    IOContext &ioc;
    boost::asio::ip::tcp::socket socket;
    boost::beast::flat_buffer buffer;
};

/**
 * Check that a given string consists only of digits.
 */
bool isNumberBetween(std::string_view string, int minimum, int maximum)
{
    int value = 0;
    for (char c: string) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + c - '0';
    }
    return value >= minimum && value <= maximum;
}

/**
 * Check that a string is in a list of candidates.
 */
bool isIn(std::string_view string, std::initializer_list<std::string_view> candidates)
{
    for (std::string_view candidate: candidates) {
        if (string == candidate) {
            return true;
        }
    }
    return false;
}

/**
 * Check the Date header of a raw response, and remove it.
 */
std::string checkAndFilterDateHeader(std::string_view response)
{
    std::string result;
    while (!response.empty()) {
        size_t end = response.find('\n');
        std::string_view headerLine = response.substr(0, end == std::string_view::npos ? response.size() : end + 1);
        response.remove_prefix(headerLine.size());

        if (!headerLine.starts_with("Date: ")) {
            result += headerLine;
            if (headerLine == "\r\n") {
                // Everything after this is body.
                result += response;
                break;
            }
            continue;
        }

        EXPECT_EQ(37, headerLine.size());
        EXPECT_TRUE(isIn(headerLine.substr(6, 3), { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" }))
            << headerLine;
        EXPECT_EQ(", ", headerLine.substr(9, 2)) << headerLine;
        EXPECT_TRUE(isNumberBetween(headerLine.substr(11, 2), 1, 31)) << headerLine;
        EXPECT_TRUE(isIn(headerLine.substr(14, 3),
                         { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" }))
            << headerLine;
        EXPECT_TRUE(isNumberBetween(headerLine.substr(18, 4), 2024, 2100)) << headerLine;
        EXPECT_TRUE(isNumberBetween(headerLine.substr(23, 2), 0, 23)) << headerLine;
        EXPECT_TRUE(isNumberBetween(headerLine.substr(26, 2), 0, 59)) << headerLine;
        EXPECT_TRUE(isNumberBetween(headerLine.substr(29, 2), 0, 60)) << headerLine; // Don't fail on leap seconds.
        EXPECT_EQ(" GMT\r\n", headerLine.substr(31)) << headerLine;
    }
    return result;
}

using boost::beast::http::field;
using boost::beast::http::status;
using boost::beast::http::verb;

CORO_TEST(HttpServer, NotFound, ioc)
{
    Socket socket(ioc);
    co_await socket.write("GET /stream/octopus HTTP/1.0\r\n"
                          "\r\n");
    EXPECT_EQ("HTTP/1.1 404 Not Found\r\n"
              "Connection: close\r\n"
              "Server: streamvault\r\n"
              "Cache-Control: public, max-age=600\r\n"
              "Access-Control-Allow-Origin: *\r\n"
              "Content-Length: 0\r\n"
              "\r\n",
              checkAndFilterDateHeader(co_await socket.readAllAsString()));
}

CORO_TEST(HttpServer, DotDotForbidden, ioc)
{
    Socket socket(ioc);
    co_await socket.write("GET /stream/../config.json HTTP/1.0\r\n"
                          "\r\n");
    EXPECT_EQ("HTTP/1.1 403 Forbidden\r\n"
              "Connection: close\r\n"
              "Server: streamvault\r\n"
              "Cache-Control: public, max-age=600\r\n"
              "Access-Control-Allow-Origin: *\r\n"
              "Content-Length: 0\r\n"
              "\r\n",
              checkAndFilterDateHeader(co_await socket.readAllAsString()));
}

CORO_TEST(HttpServer, Whole, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/stream/movie");
    EXPECT_EQ(status::ok, response.result());
    EXPECT_EQ("video/x-matroska", response[field::content_type]);
    EXPECT_EQ("bytes", response[field::accept_ranges]);
    EXPECT_EQ("no-cache", response[field::cache_control]);
    EXPECT_EQ(response.end(), response.find(field::content_range));
    EXPECT_EQ(std::to_string(movieSize), response[field::content_length]);
    EXPECT_TRUE(getMovieData() == response.body());
}

CORO_TEST(HttpServer, Range, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/stream/movie", "bytes=1000000-1999999");
    EXPECT_EQ(status::partial_content, response.result());
    EXPECT_EQ("bytes 1000000-1999999/3000000", response[field::content_range]);
    EXPECT_EQ("1000000", response[field::content_length]);
    EXPECT_TRUE(getMovieData().substr(1000000, 1000000) == response.body());
}

CORO_TEST(HttpServer, Suffix, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/stream/movie", "bytes=-10");
    EXPECT_EQ(status::partial_content, response.result());
    EXPECT_EQ("bytes 2999990-2999999/3000000", response[field::content_range]);
    EXPECT_EQ(getMovieData().substr(movieSize - 10), response.body());
}

CORO_TEST(HttpServer, Unsatisfiable, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/stream/movie", "bytes=3000000-");
    EXPECT_EQ(status::range_not_satisfiable, response.result());
    EXPECT_EQ("bytes */3000000", response[field::content_range]);
}

CORO_TEST(HttpServer, Head, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::head, "/stream/movie", "bytes=0-99");
    EXPECT_EQ(status::partial_content, response.result());
    EXPECT_EQ("100", response[field::content_length]);
    EXPECT_EQ("bytes 0-99/3000000", response[field::content_range]);
    EXPECT_TRUE(response.body().empty());
}

CORO_TEST(HttpServer, Download, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/download/notes");
    EXPECT_EQ(status::ok, response.result());
    EXPECT_EQ("text/plain", response[field::content_type]);
    EXPECT_TRUE(response[field::content_disposition].starts_with("attachment"));
    EXPECT_EQ("Cats are cute :D", response.body());
}

CORO_TEST(HttpServer, EscapedTarget, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::get, "/stream/%6Eotes?t=1");
    EXPECT_EQ(status::ok, response.result());
    EXPECT_EQ("Cats are cute :D", response.body());
}

CORO_TEST(HttpServer, KeepAlive, ioc)
{
    Socket socket(ioc);
    auto first = co_await socket.request(verb::get, "/stream/notes", "bytes=0-3", true);
    EXPECT_EQ(status::partial_content, first.result());
    EXPECT_EQ("Cats", first.body());
    EXPECT_TRUE(first.keep_alive());

    auto second = co_await socket.request(verb::get, "/stream/notes", "bytes=5-7");
    EXPECT_EQ(status::partial_content, second.result());
    EXPECT_EQ("are", second.body());
    EXPECT_FALSE(second.keep_alive());
}

CORO_TEST(HttpServer, MethodNotAllowed, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::delete_, "/stream/movie");
    EXPECT_EQ(status::method_not_allowed, response.result());
}

CORO_TEST(HttpServer, Options, ioc)
{
    Socket socket(ioc);
    auto response = co_await socket.request(verb::options, "/stream/movie");
    EXPECT_EQ(status::ok, response.result());
    EXPECT_EQ("Range", response[field::access_control_allow_headers]);
}

CORO_TEST(HttpServer, Hls, ioc)
{
    /* Ask for the transcode. */
    nlohmann::json reply;
    {
        Socket socket(ioc);
        auto response = co_await socket.request(verb::post, "/api/hls/movie");
        EXPECT_EQ(status::ok, response.result());
        EXPECT_EQ("application/json", response[field::content_type]);
        reply = Json::parse(response.body());
    }

    /* Wait for it to finish. */
    for (int i = 0; i < 100 && !reply["ready"].get<bool>(); i++) {
        boost::asio::steady_timer sleeper(ioc);
        sleeper.expires_after(std::chrono::milliseconds(100));
        co_await sleeper.async_wait(boost::asio::use_awaitable);

        Socket socket(ioc);
        auto response = co_await socket.request(verb::get, "/api/hls/movie");
        reply = Json::parse(response.body());
    }
    EXPECT_TRUE(reply["ready"].get<bool>());
    EXPECT_EQ("/hls/movie/master.m3u8", reply["url"].get<std::string>());

    /* Fetch the output. */
    {
        Socket socket(ioc);
        auto response = co_await socket.request(verb::get, reply["url"].get<std::string>());
        EXPECT_EQ(status::ok, response.result());
        EXPECT_EQ("application/vnd.apple.mpegurl", response[field::content_type]);
        EXPECT_TRUE(response.body().starts_with("#EXTM3U"));
    }
    {
        Socket socket(ioc);
        auto response = co_await socket.request(verb::get, "/hls/movie/v0/seg_00000.ts");
        EXPECT_EQ(status::ok, response.result());
        EXPECT_EQ("video/mp2t", response[field::content_type]);
        EXPECT_EQ("segment", response.body());
    }

    /* The downloaded source isn't served. */
    {
        Socket socket(ioc);
        auto response = co_await socket.request(verb::get, "/hls/movie/source");
        EXPECT_EQ(status::not_found, response.result());
    }
}

} // namespace
