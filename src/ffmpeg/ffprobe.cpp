#include "ffprobe.hpp"

#include "util/asio.hpp"
#include "util/subprocess.hpp"

#include <algorithm>
#include <cctype>

Awaitable<bool> Ffmpeg::hasAudio(IOContext &ioc, std::string_view ffprobe, const std::filesystem::path &source)
{
    /* List the index of every audio stream, one per line. */
    std::string sourceString = source.string();
    std::string output = co_await Subprocess::getStdout(ioc, ffprobe, {
        "-v", "error",
        "-select_streams", "a",
        "-show_entries", "stream=index",
        "-of", "csv=p=0",
        sourceString
    });

    /* Any output at all means there's audio. */
    co_return std::any_of(output.begin(), output.end(), [](char c) {
        return !std::isspace((unsigned char)c);
    });
}
