#include "configuration/configuration.hpp"
#include "instance/State.hpp"
#include "util/Event.hpp"
#include "util/util.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdio>
#include <stdexcept>

using namespace std::string_literals;

namespace
{

/**
 * Read, parse, and validate the configuration from a file.
 */
Config::Root loadConfig(const std::filesystem::path &path)
{
    std::vector<std::byte> bytes = Util::readFile(path);
    return Config::Root::fromJson(std::string_view((const char *)bytes.data(), bytes.size()));
}

/**
 * Asynchronous version of main.
 */
Awaitable<void> asyncMain(int argc, const char * const *argv, IOContext &ioc)
{
    /* Read the configuration. */
    if (argc != 2) {
        throw std::runtime_error("Usage: "s + (argc ? argv[0] : "") + " configuration.json");
    }
    Config::Root config = loadConfig(argv[1]);

    /* Build the service and start serving. */
    Instance::State st{std::move(config), ioc};
    co_await st.start();

    /* Wait for a request to stop. */
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    co_await signals.async_wait(boost::asio::use_awaitable);

    /* Stop background work before the state goes away. The server keeps listening until the IOContext is stopped. */
    co_await st.shutdown();
}

} // namespace

int main(int argc, const char * const *argv)
{
    /* This is just a wrapper around boost::asio and asyncMain. */
    IOContext ioc;
    int result = 1;
    spawnDetached(ioc, [&]() -> Awaitable<void> {
        try {
            co_await asyncMain(argc, argv, ioc);
            result = 0;
        }
        catch (const std::exception &e) {
            fprintf(stderr, "Exited with exception: %s\n", e.what());
        }
        ioc.stop();
    });
    ioc.run();
    return result;
}
