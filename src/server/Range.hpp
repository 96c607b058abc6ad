#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Server
{

/**
 * The bytes of a resource that a request wants.
 */
struct ByteRange final
{
    uint64_t start = 0;

    /**
     * The last byte (inclusive). For an empty resource, this is less than start.
     */
    uint64_t end = 0;

    /**
     * Whether the request asked for a range, as opposed to the whole resource.
     */
    bool partial = false;

    /**
     * Get the number of bytes in the range.
     */
    uint64_t size() const
    {
        return end >= start ? end - start + 1 : 0;
    }

    /**
     * Get the value of the Content-Range header for this range.
     *
     * @param total The size of the whole resource.
     */
    std::string getContentRange(uint64_t total) const;

    bool operator==(const ByteRange &) const = default;
};

/**
 * Interpret an HTTP Range header.
 *
 * Only a single `bytes=` range is understood, in the forms `start-end`, `start-`, and `-suffixLength`. The end is
 * clamped to the end of the resource. Anything else (including multiple ranges) is ignored, as HTTP permits, giving
 * the whole resource.
 *
 * @param header The value of the Range header, if there was one.
 * @param size The size of the resource.
 * @return The range to send, or std::nullopt if the range can't be satisfied (i.e: it starts past the end).
 */
std::optional<ByteRange> parseRange(std::optional<std::string_view> header, uint64_t size);

} // namespace Server
