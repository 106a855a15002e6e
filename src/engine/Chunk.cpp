/**
 * @file Chunk.cpp
 * @brief Implementation of Chunk
 */

#include "chunkdm/engine/Chunk.h"

#include <algorithm>

namespace ChunkDM {

Chunk::Chunk(int index, ByteOffset start, ByteOffset end)
    : m_index(index)
    , m_start(start)
    , m_end(end)
    , m_current(start)
{
}

void Chunk::advanceBy(ByteCount bytes) {
    ByteOffset next = m_current.fetch_add(bytes, std::memory_order_acq_rel) + bytes;
    if (next > end()) {
        m_completed.store(true, std::memory_order_release);
    }
}

void Chunk::closeAtCurrent() {
    m_end.store(current() - 1, std::memory_order_release);
    m_completed.store(true, std::memory_order_release);
}

ByteCount Chunk::rewindForLostRange(ByteOffset start, ByteCount length) {
    const ByteOffset position = current();
    if (length <= 0 || start >= position || start + length <= m_start) {
        return 0;
    }

    const ByteOffset rewound = std::max(m_start, start);
    m_current.store(rewound, std::memory_order_release);
    m_completed.store(rewound > end(), std::memory_order_release);
    return position - rewound;
}

Chunk::Snapshot Chunk::snapshot() const {
    Snapshot snap;
    snap.index = m_index;
    snap.start = m_start;
    snap.end = end();
    snap.current = current();
    snap.completed = snap.current > snap.end;
    return snap;
}

std::unique_ptr<Chunk> Chunk::fromSnapshot(const Snapshot& snap) {
    auto chunk = std::make_unique<Chunk>(snap.index, snap.start, snap.end);
    chunk->m_current.store(snap.current, std::memory_order_relaxed);
    chunk->m_completed.store(snap.current > snap.end, std::memory_order_relaxed);
    return chunk;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Chunk List Helpers
// ═══════════════════════════════════════════════════════════════════════════════

bool validateChunks(const ChunkSnapshots& chunks, ByteCount totalSize) {
    if (chunks.empty()) {
        return true;
    }

    ByteOffset expectedStart = 0;
    for (const auto& c : chunks) {
        // an unbounded chunk closed on an empty stream ends at start - 1
        if (c.start != expectedStart || c.end < c.start - 1) {
            return false;
        }
        if (c.current < c.start || c.current > c.end + 1) {
            return false;
        }
        if (c.completed != (c.current > c.end)) {
            return false;
        }
        expectedStart = c.end + 1;
    }

    if (totalSize > 0) {
        return chunks.back().end == totalSize - 1;
    }
    return true;
}

ChunkSnapshots snapshotChunks(const ChunkList& chunks) {
    ChunkSnapshots result;
    result.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        result.push_back(chunk->snapshot());
    }
    return result;
}

} // namespace ChunkDM
