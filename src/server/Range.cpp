#include "Range.hpp"

#include "util/util.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace
{

/**
 * Parse a non-negative integer from a range.
 *
 * @return The value, or std::nullopt if it's not a valid non-negative integer.
 */
std::optional<uint64_t> parseOffset(std::string_view string)
{
    if (string.empty() || string[0] == '-' || string[0] == '+') {
        return std::nullopt;
    }
    try {
        return (uint64_t)Util::parseInt64(string);
    }
    catch (const std::invalid_argument &) {
        return std::nullopt;
    }
    catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

/**
 * Remove spaces and tabs from both ends of a string.
 */
std::string_view trim(std::string_view string)
{
    size_t first = string.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    return string.substr(first, string.find_last_not_of(" \t") - first + 1);
}

} // namespace

std::string Server::ByteRange::getContentRange(uint64_t total) const
{
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
}

std::optional<Server::ByteRange> Server::parseRange(std::optional<std::string_view> header, uint64_t size)
{
    ByteRange whole{ .start = 0, .end = size > 0 ? size - 1 : 0, .partial = false };
    if (size == 0) {
        whole.start = 1; // Empty.
    }

    /* Split off the unit. */
    if (!header) {
        return whole;
    }
    std::string_view value = trim(*header);
    constexpr std::string_view prefix = "bytes=";
    if (!value.starts_with(prefix)) {
        return whole;
    }
    value = trim(value.substr(prefix.size()));
    if (value.find(',') != std::string_view::npos) {
        return whole;
    }

    /* Split the range. */
    size_t dash = value.find('-');
    if (dash == std::string_view::npos) {
        return whole;
    }
    std::string_view startString = trim(value.substr(0, dash));
    std::string_view endString = trim(value.substr(dash + 1));

    /* Handle suffix ranges, like -500 for the last 500 bytes. */
    if (startString.empty()) {
        std::optional<uint64_t> suffixLength = parseOffset(endString);
        if (!suffixLength) {
            return whole;
        }
        if (*suffixLength == 0 || size == 0) {
            return std::nullopt;
        }
        return ByteRange{ .start = size - std::min(*suffixLength, size), .end = size - 1, .partial = true };
    }

    /* Handle start-end and start-. */
    std::optional<uint64_t> start = parseOffset(startString);
    std::optional<uint64_t> end = endString.empty() ? std::optional<uint64_t>(UINT64_MAX) : parseOffset(endString);
    if (!start || !end || *end < *start) {
        return whole;
    }
    if (*start >= size) {
        return std::nullopt;
    }
    return ByteRange{ .start = *start, .end = std::min(*end, size - 1), .partial = true };
}
