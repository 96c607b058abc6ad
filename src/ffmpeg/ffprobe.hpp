#pragma once

#include "util/awaitable.hpp"

#include <filesystem>
#include <string_view>

class IOContext;

namespace Ffmpeg
{

/**
 * Determine whether a media file has any audio streams, using ffprobe.
 *
 * @param ffprobe The ffprobe executable.
 * @param source The media file.
 * @throws std::runtime_error If ffprobe can't be run, or fails.
 */
Awaitable<bool> hasAudio(IOContext &ioc, std::string_view ffprobe, const std::filesystem::path &source);

} // namespace Ffmpeg
