/**
 * @file ChunkPlanner.h
 * @brief Splits a resource into ordered, disjoint byte ranges
 */

#pragma once

#include "chunkdm/engine/Chunk.h"

namespace ChunkDM {

/**
 * @class ChunkPlanner
 * @brief Pure functions mapping a resource size to a chunk layout
 */
class ChunkPlanner {
public:
    /**
     * @brief Plan chunks for a resource
     *
     * A non-positive size or n <= 1 yields one chunk covering the whole
     * (possibly unbounded) range. Otherwise every chunk spans
     * floor(totalSize / n) bytes and the last one absorbs the remainder.
     *
     * @param totalSize Resource size in bytes, or -1 if unknown
     * @param n Requested number of chunks
     * @return Ordered, contiguous chunks covering [0, totalSize - 1]
     */
    static ChunkList plan(ByteCount totalSize, int n);

    /**
     * @brief Pick the number of chunks for a resource
     *
     * Unknown size or no range support: 1. Up to and including 10 MiB: 2.
     * Up to and including 100 MiB: 4. Larger: 8.
     */
    static int threadCountFor(ByteCount totalSize, bool supportsRanges = true);
};

} // namespace ChunkDM
