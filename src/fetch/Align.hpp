#pragma once

#include <cstdint>

/**
 * @defgroup fetch Fetching
 *
 * Reading byte ranges of remote objects, possibly with several clients at once.
 */
/// @addtogroup fetch
/// @{

/**
 * Stuff for reading ranges of remote objects.
 */
namespace Fetch
{

/**
 * What a range is being read for.
 *
 * Bulk downloads favour larger alignment quanta than interactive streaming, which wants cheap seeks.
 */
enum class Purpose
{
    stream,
    download
};

/**
 * A range that's been widened to the backend's alignment.
 */
struct AlignedRange final
{
    uint64_t start = 0;
    uint64_t length = 0;

    /**
     * How many bytes at the start of the aligned range come before the requested range.
     */
    uint64_t trimOffset = 0;

    bool operator==(const AlignedRange &) const = default;
};

/**
 * Get the alignment quantum to use for an object.
 *
 * @param sizeHint The (possibly stale) size of the object.
 * @param purpose What the range is for.
 */
uint64_t pickQuantum(uint64_t sizeHint, Purpose purpose);

/**
 * Widen a range so that it starts and ends on a quantum boundary.
 *
 * The result always contains [start, start + length), and is at least one quantum long.
 *
 * @param start The first byte wanted.
 * @param length The number of bytes wanted.
 * @param sizeHint The (possibly stale) size of the object.
 * @param purpose What the range is for.
 */
AlignedRange align(uint64_t start, uint64_t length, uint64_t sizeHint, Purpose purpose);

/**
 * Round a target chunk size up to a whole number of quanta.
 *
 * @return The chunk size. This is at least one quantum.
 */
uint64_t roundChunkSize(uint64_t target, uint64_t quantum);

} // namespace Fetch

/// @}
