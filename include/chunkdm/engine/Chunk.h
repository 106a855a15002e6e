/**
 * @file Chunk.h
 * @brief Chunk data structure for ranged download management
 *
 * A Chunk represents a contiguous byte range of a download file. Chunks of
 * one download are disjoint, contiguous and cover the whole resource.
 */

#pragma once

#include "chunkdm/engine/Types.h"
#include <atomic>
#include <memory>
#include <vector>

namespace ChunkDM {

/**
 * @class Chunk
 * @brief Represents a downloadable byte range of a file
 *
 * Invariants:
 * - start <= current <= end + 1
 * - completed is true exactly when current > end
 *
 * Thread Safety:
 * - current and completed are atomic so the controller can checkpoint
 *   while the owning worker advances them
 * - Only the worker that claimed the chunk mutates it
 */
class Chunk {
public:
    // ───────────────────────────────────────────────────────────────────────
    // Construction
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Construct a new chunk
     * @param index Position of the chunk within the download
     * @param start First byte of the range (inclusive)
     * @param end Last byte of the range (inclusive)
     */
    Chunk(int index, ByteOffset start, ByteOffset end);

    // Copy operations disabled due to atomic members
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    ~Chunk() = default;

    // ───────────────────────────────────────────────────────────────────────
    // Byte Range
    // ───────────────────────────────────────────────────────────────────────

    /// @return Position within the download
    int index() const { return m_index; }

    /// @return First byte position (inclusive)
    ByteOffset start() const { return m_start; }

    /// @return Last byte position (inclusive)
    ByteOffset end() const { return m_end.load(std::memory_order_acquire); }

    /// @return True if the chunk has no known end
    bool isUnbounded() const { return end() >= Constants::UNBOUNDED_END; }

    /// @return Next byte to fetch
    ByteOffset current() const { return m_current.load(std::memory_order_acquire); }

    /// @return Number of bytes remaining to download
    ByteCount remainingBytes() const { return end() - current() + 1; }

    /// @return Bytes already written for this chunk
    ByteCount downloadedBytes() const { return current() - m_start; }

    /**
     * @brief Advance the current position after a successful write
     * @param bytes Number of bytes written at current()
     */
    void advanceBy(ByteCount bytes);

    /**
     * @brief Close an unbounded chunk at the byte before current()
     *
     * Used when the stream ended before the unknown end was reached.
     */
    void closeAtCurrent();

    /**
     * @brief Move current() back to the first byte of a lost range
     *
     * Only valid while no worker owns the chunk.
     *
     * @param start First byte of the range that never reached disk
     * @param length Length of that range
     * @return Number of bytes the chunk gave back
     */
    ByteCount rewindForLostRange(ByteOffset start, ByteCount length);

    // ───────────────────────────────────────────────────────────────────────
    // State
    // ───────────────────────────────────────────────────────────────────────

    /// @return True if every byte of the range was written
    bool isCompleted() const { return m_completed.load(std::memory_order_acquire); }

    /**
     * @brief Try to become the single worker for this chunk
     * @return True if the caller now owns the chunk
     */
    bool tryClaim() {
        bool expected = false;
        return m_claimed.compare_exchange_strong(expected, true,
            std::memory_order_acq_rel, std::memory_order_acquire);
    }

    /// @brief Give up ownership when the worker exits
    void release() { m_claimed.store(false, std::memory_order_release); }

    // ───────────────────────────────────────────────────────────────────────
    // Serialization (for persistence)
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Copy-safe state for persistence
     */
    struct Snapshot {
        int index = 0;
        ByteOffset start = 0;
        ByteOffset end = 0;
        ByteOffset current = 0;
        bool completed = false;

        bool operator==(const Snapshot&) const = default;
    };

    Snapshot snapshot() const;

    /**
     * @brief Rebuild a chunk from persisted state
     */
    static std::unique_ptr<Chunk> fromSnapshot(const Snapshot& snap);

private:
    int m_index{0};
    ByteOffset m_start{0};
    std::atomic<ByteOffset> m_end{0};

    std::atomic<ByteOffset> m_current{0};
    std::atomic<bool> m_completed{false};
    std::atomic<bool> m_claimed{false};
};

using ChunkList = std::vector<std::unique_ptr<Chunk>>;
using ChunkSnapshots = std::vector<Chunk::Snapshot>;

/**
 * @brief Check the chunk invariants for a whole download
 * @param chunks Ordered chunk snapshots
 * @param totalSize Resource size, or -1 if unknown
 * @return True if the list is empty or forms a valid, contiguous cover
 */
bool validateChunks(const ChunkSnapshots& chunks, ByteCount totalSize);

/**
 * @brief Snapshot every chunk in order
 */
ChunkSnapshots snapshotChunks(const ChunkList& chunks);

} // namespace ChunkDM
