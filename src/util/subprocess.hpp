#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "util/awaitable.hpp"
class IOContext;

/// @addtogroup util
/// @{

/**
 * Tools for running subprocesses (ffmpeg and ffprobe, mostly).
 */
namespace Subprocess
{

/**
 * Which of the subprocess's outputs to capture.
 */
struct Capture final
{
    bool standardOutput = true;
    bool standardError = true;
};

/**
 * Run a process whose stdout and stderr can be read.
 *
 * The subprocess's stdin is always /dev/null, and the subprocess is killed if the server dies.
 */
class Subprocess final
{
public:
    /**
     * One of the subprocess's captured outputs.
     */
    class Output final
    {
    public:
        ~Output();

        /**
         * Read some data.
         *
         * @return Some data, or empty if the end of file has been reached.
         */
        Awaitable<std::vector<std::byte>> read();

        /**
         * Read a line. Any of "\n", "\r" or "\r\n" ends a line.
         *
         * @return The line without its terminator, or std::nullopt at the end of file.
         */
        Awaitable<std::optional<std::string>> readLine();

        /**
         * Read everything that's left as a string.
         *
         * @warning If both outputs are captured, read them concurrently (e.g: with `&&`) so the subprocess can't
         *          block on the one that isn't being read.
         */
        Awaitable<std::string> readAll();

    private:
        friend class Subprocess;
        struct Pipe;

        explicit Output(IOContext &ioc);

        std::unique_ptr<Pipe> pipe;
        std::vector<std::byte> remainder;
    };

    ~Subprocess();

    /**
     * Start running a subprocess.
     *
     * @param executable The executable to run. This is searched for in PATH unless it contains a '/'.
     * @param arguments The arguments (excluding the executable) to give to the subprocess.
     * @throws std::runtime_error If the executable can't be found.
     */
    explicit Subprocess(IOContext &ioc, std::string_view executable, std::span<const std::string> arguments,
                        Capture capture = {});

    /**
     * @copydoc Subprocess
     */
    explicit Subprocess(IOContext &ioc, std::string_view executable, std::initializer_list<std::string_view> arguments,
                        Capture capture = {});

    Subprocess(Subprocess &&) = default;

    /**
     * Wait for the process to terminate.
     *
     * @param throwOnNonZero Throw an exception if the return code is non-zero.
     * @return The return code.
     * @throws std::runtime_error If the sub-process returns non-zero unless throwOnNonZero is false.
     */
    Awaitable<int> wait(bool throwOnNonZero = true);

    /**
     * Ask the process to stop, or kill it if that can't be done.
     *
     * Use wait to wait for the process to terminate after calling this method.
     */
    void kill();

    /**
     * Get the subprocess's stdout.
     *
     * @throws std::logic_error If stdout wasn't captured.
     */
    Output &getStdout();

    /**
     * Get the subprocess's stderr.
     *
     * @throws std::logic_error If stderr wasn't captured.
     */
    Output &getStderr();

private:
    /**
     * A wrapper around the Boost process, so the Boost headers stay out of this one.
     */
    struct Process;

    std::unique_ptr<Output> stdoutOutput;
    std::unique_ptr<Output> stderrOutput;
    std::unique_ptr<Process> process;
};

/**
 * Find an executable.
 *
 * @param executable The name of the executable, searched for in PATH, or a path to it if it contains a '/'.
 * @return The path to the executable, or empty if it doesn't exist.
 */
std::string findExecutable(std::string_view executable);

/**
 * Run a subprocess and return its stdout.
 *
 * @param executable The executable to run. This is searched for in PATH.
 * @param arguments The arguments (excluding the executable) to give to the subprocess.
 * @return What the subprocess wrote to stdout.
 * @throws std::runtime_error If the sub-process returns non-zero. The message includes its stderr.
 */
Awaitable<std::string> getStdout(IOContext &ioc, std::string_view executable,
                                 std::initializer_list<std::string_view> arguments = {});

} // namespace Subprocess

/// @}
