#include "Align.hpp"

#include <cassert>

namespace
{

constexpr uint64_t KiB = 1 << 10;
constexpr uint64_t MiB = 1 << 20;

} // namespace

uint64_t Fetch::pickQuantum(uint64_t sizeHint, Purpose purpose)
{
    bool download = purpose == Purpose::download;
    if (sizeHint >= 200 * MiB) {
        return download ? MiB : 256 * KiB;
    }
    if (sizeHint >= 20 * MiB) {
        return download ? 512 * KiB : 128 * KiB;
    }
    if (sizeHint >= 2 * MiB) {
        return download ? 128 * KiB : 64 * KiB;
    }
    return 4 * KiB;
}

Fetch::AlignedRange Fetch::align(uint64_t start, uint64_t length, uint64_t sizeHint, Purpose purpose)
{
    uint64_t quantum = pickQuantum(sizeHint, purpose);

    AlignedRange result;
    result.trimOffset = start % quantum;
    result.start = start - result.trimOffset;

    /* Round up to whole quanta, with a minimum of one. */
    uint64_t wanted = length + result.trimOffset;
    result.length = (wanted + quantum - 1) / quantum * quantum;
    if (result.length == 0) {
        result.length = quantum;
    }

    assert(result.start + result.length >= start + length);
    return result;
}

uint64_t Fetch::roundChunkSize(uint64_t target, uint64_t quantum)
{
    assert(quantum > 0);
    uint64_t result = (target + quantum - 1) / quantum * quantum;
    return (result == 0) ? quantum : result;
}
