#include "log.hpp"

#include <array>
#include <utility>

namespace
{

/**
 * Remove spaces from both ends of a string.
 */
std::string_view trim(std::string_view string)
{
    size_t first = string.find_first_not_of(' ');
    if (first == std::string_view::npos) {
        return {};
    }
    return string.substr(first, string.find_last_not_of(' ') - first + 1);
}

/**
 * Take a "[tag] " prefix off a string.
 *
 * @param remaining The string. On success, this is advanced past the tag.
 * @return The contents of the brackets, or std::nullopt if the string doesn't start with a non-empty tag.
 */
std::optional<std::string_view> takeTag(std::string_view &remaining)
{
    if (remaining.size() < 3 || remaining[0] != '[') {
        return std::nullopt;
    }
    size_t end = remaining.find(']');
    if (end == std::string_view::npos || end < 2) {
        return std::nullopt;
    }
    std::string_view tag = remaining.substr(1, end - 1);
    remaining = remaining.substr(end + 1);
    if (!remaining.empty() && remaining[0] == ' ') {
        remaining.remove_prefix(1);
    }
    return tag;
}

} // namespace

std::optional<Log::Level> Ffmpeg::ParsedFfmpegLogLine::getLevel(std::string_view ffmpegLevel)
{
    static constexpr std::array<std::pair<std::string_view, Log::Level>, 8> levels{ {
        { "trace", Log::Level::debug },
        { "debug", Log::Level::debug },
        { "verbose", Log::Level::debug },
        { "info", Log::Level::info },
        { "warning", Log::Level::warning },
        { "error", Log::Level::error },
        { "fatal", Log::Level::fatal },
        { "panic", Log::Level::fatal }
    } };
    for (const auto &[name, value]: levels) {
        if (name == ffmpegLevel) {
            return value;
        }
    }
    return std::nullopt;
}

Ffmpeg::ParsedFfmpegLogLine::ParsedFfmpegLogLine(std::string_view line)
{
    /* The level is either the first tag, or the second if the first says where the line came from. */
    std::string_view remaining = line;
    std::optional<std::string_view> first = takeTag(remaining);
    std::optional<Log::Level> parsedLevel = first ? getLevel(*first) : std::nullopt;
    if (first && !parsedLevel) {
        std::optional<std::string_view> second = takeTag(remaining);
        parsedLevel = second ? getLevel(*second) : std::nullopt;
        if (parsedLevel) {
            source = *first;
        }
    }

    /* Keep the whole line if it isn't in the expected format. */
    if (!parsedLevel) {
        message = trim(line);
        return;
    }
    level = *parsedLevel;
    message = trim(remaining);
}
