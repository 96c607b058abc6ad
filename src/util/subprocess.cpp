#include "subprocess.hpp"

#include "util/asio.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>

#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <sys/prctl.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

struct Subprocess::Subprocess::Output::Pipe final
{
    explicit Pipe(IOContext &ioc) : pipe(ioc) {}

    boost::asio::readable_pipe pipe;
};

Subprocess::Subprocess::Output::~Output() = default;

Subprocess::Subprocess::Output::Output(IOContext &ioc) : pipe(std::make_unique<Pipe>(ioc))
{
}

Awaitable<std::vector<std::byte>> Subprocess::Subprocess::Output::read()
{
    /* Anything left over from readLine comes first. */
    if (!remainder.empty()) {
        co_return std::move(remainder);
    }

    try {
        std::byte buffer[4096];
        size_t n = co_await pipe->pipe.async_read_some(boost::asio::buffer(buffer), boost::asio::use_awaitable);
        co_return std::vector<std::byte>(buffer, buffer + n);
    }
    catch (const boost::system::system_error &e) {
        if (e.code() == boost::asio::error::eof) {
            co_return std::vector<std::byte>();
        }
        throw;
    }
}

Awaitable<std::optional<std::string>> Subprocess::Subprocess::Output::readLine()
{
    std::string result;
    bool gotData = false;
    while (true) {
        std::vector<std::byte> data = co_await read();
        if (data.empty()) {
            co_return gotData ? std::optional(std::move(result)) : std::nullopt;
        }
        gotData = true;

        /* Keep going until there's a line terminator. */
        auto it = std::find_if(data.begin(), data.end(), [](std::byte b) {
            return b == (std::byte)'\n' || b == (std::byte)'\r';
        });
        result.append((const char *)data.data(), (size_t)(it - data.begin()));
        if (it == data.end()) {
            continue;
        }

        /* Keep whatever's after the terminator for next time. */
        bool crlf = *it == (std::byte)'\r' && it + 1 != data.end() && *(it + 1) == (std::byte)'\n';
        remainder.assign(it + (crlf ? 2 : 1), data.end());
        co_return result;
    }
}

Awaitable<std::string> Subprocess::Subprocess::Output::readAll()
{
    std::string result((const char *)remainder.data(), remainder.size());
    remainder.clear();
    while (true) {
        std::vector<std::byte> data = co_await read();
        if (data.empty()) {
            co_return result;
        }
        result.append((const char *)data.data(), data.size());
    }
}

namespace
{

/**
 * A Boost Process initializer to make the subprocess terminate if the parent does.
 *
 * Orphans get adopted by init otherwise, which would leave ffmpeg transcoding for a server that no longer exists.
 */
struct KillOnDetachProcessInitializer final
{
    template <typename... Args>
    boost::process::v2::error_code on_exec_setup(Args &&...)
    {
        if (int e = prctl(PR_SET_PDEATHSIG, SIGKILL)) {
            return boost::system::error_code(e, boost::system::system_category());
        }
        return {};
    }
};

} // namespace

struct Subprocess::Subprocess::Process final
{
    explicit Process(IOContext &ioc, const std::string &executable, std::span<const std::string> arguments,
                     boost::asio::readable_pipe *stdoutPipe, boost::asio::readable_pipe *stderrPipe) :
        process(ioc, executable, arguments, getStdio(stdoutPipe, stderrPipe), KillOnDetachProcessInitializer{})
    {
    }

    boost::process::v2::process process;

private:
    /**
     * The fields of process_stdio have unspecified types, so each combination has to be spelled out.
     */
    static boost::process::v2::process_stdio getStdio(boost::asio::readable_pipe *stdoutPipe,
                                                      boost::asio::readable_pipe *stderrPipe)
    {
        if (stdoutPipe && stderrPipe) {
            return { nullptr, *stdoutPipe, *stderrPipe };
        }
        if (stdoutPipe) {
            return { nullptr, *stdoutPipe, nullptr };
        }
        if (stderrPipe) {
            return { nullptr, nullptr, *stderrPipe };
        }
        return { nullptr, nullptr, nullptr };
    }
};

namespace
{

/**
 * Copy the arguments, since boost::process::v2::process doesn't take std::string_view.
 */
std::vector<std::string> toStrings(std::initializer_list<std::string_view> views)
{
    return std::vector<std::string>(views.begin(), views.end());
}

} // namespace

Subprocess::Subprocess::~Subprocess() = default;

Subprocess::Subprocess::Subprocess(IOContext &ioc, std::string_view executable, std::span<const std::string> arguments,
                                   Capture capture)
{
    std::string executablePath = findExecutable(executable);
    if (executablePath.empty()) {
        throw std::runtime_error("Executable \"" + std::string(executable) + "\" not found.");
    }
    if (capture.standardOutput) {
        stdoutOutput.reset(new Output(ioc));
    }
    if (capture.standardError) {
        stderrOutput.reset(new Output(ioc));
    }
    process = std::make_unique<Process>(ioc, executablePath, arguments,
                                        stdoutOutput ? &stdoutOutput->pipe->pipe : nullptr,
                                        stderrOutput ? &stderrOutput->pipe->pipe : nullptr);
}

Subprocess::Subprocess::Subprocess(IOContext &ioc, std::string_view executable,
                                   std::initializer_list<std::string_view> arguments, Capture capture) :
    Subprocess(ioc, executable, toStrings(arguments), capture)
{
}

Awaitable<int> Subprocess::Subprocess::wait(bool throwOnNonZero)
{
    co_await process->process.async_wait(boost::asio::use_awaitable);
    int retCode = process->process.exit_code();
    if (throwOnNonZero && retCode != 0) {
        throw std::runtime_error("Subprocess returned " + std::to_string(retCode) + ".");
    }
    co_return retCode;
}

void Subprocess::Subprocess::kill()
{
    boost::system::error_code e;
    process->process.request_exit(e);
    if (e) {
        process->process.terminate(e);
    }
    if (e) {
        throw boost::system::system_error(e, "Error stopping subprocess");
    }
}

Subprocess::Subprocess::Output &Subprocess::Subprocess::getStdout()
{
    if (!stdoutOutput) {
        throw std::logic_error("The subprocess's stdout isn't captured.");
    }
    return *stdoutOutput;
}

Subprocess::Subprocess::Output &Subprocess::Subprocess::getStderr()
{
    if (!stderrOutput) {
        throw std::logic_error("The subprocess's stderr isn't captured.");
    }
    return *stderrOutput;
}

std::string Subprocess::findExecutable(std::string_view executable)
{
    if (executable.find('/') != std::string_view::npos) {
        std::filesystem::path path(executable);
        std::error_code e;
        if (std::filesystem::is_regular_file(path, e) && access(path.c_str(), X_OK) == 0) {
            return path.string();
        }
        return {};
    }
    return boost::process::v2::environment::find_executable(executable).string();
}

Awaitable<std::string> Subprocess::getStdout(IOContext &ioc, std::string_view executable,
                                             std::initializer_list<std::string_view> arguments)
{
    Subprocess subprocess(ioc, executable, arguments);
    auto [stdoutString, stderrString] =
        co_await (subprocess.getStdout().readAll() && subprocess.getStderr().readAll());

    int retCode = co_await subprocess.wait(false);
    if (retCode != 0) {
        throw std::runtime_error("Subprocess " + std::string(executable) + " returned " + std::to_string(retCode) +
                                 ", and stderr:\n" + stderrString);
    }
    co_return stdoutString;
}
