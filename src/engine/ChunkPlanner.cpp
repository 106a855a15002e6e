/**
 * @file ChunkPlanner.cpp
 * @brief Implementation of ChunkPlanner
 */

#include "chunkdm/engine/ChunkPlanner.h"

namespace ChunkDM {

ChunkList ChunkPlanner::plan(ByteCount totalSize, int n) {
    ChunkList chunks;

    if (totalSize <= 0 || n <= 1) {
        ByteOffset end = totalSize > 0 ? totalSize - 1 : Constants::UNBOUNDED_END;
        chunks.push_back(std::make_unique<Chunk>(0, 0, end));
        return chunks;
    }

    // never produce empty chunks for tiny resources
    if (n > totalSize) {
        n = static_cast<int>(totalSize);
    }

    const ByteCount base = totalSize / n;
    chunks.reserve(n);

    for (int i = 0; i < n - 1; ++i) {
        chunks.push_back(std::make_unique<Chunk>(i, i * base, (i + 1) * base - 1));
    }
    chunks.push_back(std::make_unique<Chunk>(n - 1, (n - 1) * base, totalSize - 1));

    return chunks;
}

int ChunkPlanner::threadCountFor(ByteCount totalSize, bool supportsRanges) {
    if (totalSize <= 0 || !supportsRanges) {
        return 1;
    }
    if (totalSize <= Constants::SMALL_RESOURCE_LIMIT) {
        return 2;
    }
    if (totalSize <= Constants::MEDIUM_RESOURCE_LIMIT) {
        return 4;
    }
    return Constants::MAX_CHUNKS;
}

} // namespace ChunkDM
