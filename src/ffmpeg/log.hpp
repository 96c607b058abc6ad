#pragma once

#include "log/Level.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace Ffmpeg
{

/**
 * A parsed line of logging output from ffmpeg.
 *
 * This expects ffmpeg to have been run with `-loglevel level+...`, which gives lines like
 * `[h264 @ 0x1234] [error] message` or `[info] message`.
 */
struct ParsedFfmpegLogLine final
{
    /**
     * Parse a line of logging output from ffmpeg.
     *
     * Lines that can't be parsed are kept whole, at the error level.
     */
    ParsedFfmpegLogLine(std::string_view line);

    /**
     * Map one of ffmpeg's log level names to ours.
     *
     * @return The level, or std::nullopt if the name isn't one of ffmpeg's.
     */
    static std::optional<Log::Level> getLevel(std::string_view ffmpegLevel);

    /**
     * The log level we should use in our logging system.
     */
    Log::Level level = Log::Level::error;

    /**
     * The line without its level tag, and with surrounding spaces removed.
     */
    std::string message;

    /**
     * The component that wrote the line (e.g: `h264 @ 0x1234`), if there was one.
     */
    std::string source;
};

} // namespace Ffmpeg
