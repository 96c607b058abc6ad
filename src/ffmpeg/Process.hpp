#pragma once

#include "log/Log.hpp"
#include "util/awaitable.hpp"
#include "util/subprocess.hpp"

#include <string>
#include <string_view>

/// @addtogroup ffmpeg
/// @{

namespace Ffmpeg
{

class Arguments;

/**
 * Wraps an ffmpeg process to provide logging.
 */
class Process final
{
public:
    /**
     * The number of characters of stderr to keep for reporting failures.
     */
    static constexpr size_t stderrHeadLength = 300;

    /**
     * Start an ffmpeg subprocess.
     *
     * @param executable The ffmpeg executable.
     * @param arguments The arguments to give to ffmpeg.
     * @throws std::runtime_error If the executable can't be found.
     */
    explicit Process(IOContext &ioc, Log::Log &log, std::string_view executable, const Arguments &arguments);

    /**
     * Log everything ffmpeg writes to stderr, and wait for it to terminate.
     *
     * If the calling coroutine is cancelled, ffmpeg is killed.
     *
     * @return ffmpeg's exit code.
     */
    Awaitable<int> wait();

    /**
     * Get the start of what ffmpeg wrote to stderr.
     */
    const std::string &getStderrHead() const
    {
        return stderrHead;
    }

private:
    Log::Context log;
    Subprocess::Subprocess subprocess;
    std::string stderrHead;
};

} // namespace Ffmpeg

/// @}
