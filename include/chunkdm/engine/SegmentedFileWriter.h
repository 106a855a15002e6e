/**
 * @file SegmentedFileWriter.h
 * @brief Serializes concurrent offset writes into correct files
 *
 * Chunk workers of one download write disjoint byte ranges of the same file
 * in arbitrary order. The writer keeps one open handle and one pending
 * contiguous run per path and guarantees every byte lands at its absolute
 * offset exactly once.
 */

#pragma once

#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <QByteArray>
#include <QFile>
#include <QHash>
#include <QLoggingCategory>
#include <QString>

namespace ChunkDM {

/**
 * @class SegmentedFileWriter
 * @brief Per-path buffered writer with contiguity-triggered flushes
 *
 * For each path the writer holds a pending run [bufferStart, bufferStart+len).
 * A write is appended only if it continues that run; any other offset
 * flushes the run first. The run is also flushed once it reaches the flush
 * ratio of the buffer capacity. Flushing seeks to the run's start, takes an
 * exclusive byte-range lock over exactly that span, writes and unlocks.
 *
 * Thread Safety:
 * - Every path is its own critical section; different paths never contend
 * - The path registry is guarded by a separate mutex held only for lookups
 *
 * With several workers on one file, nearly every write breaks contiguity and
 * flushes; the buffer only batches a single sequential writer.
 *
 * A run whose flush failed stays pending and is retried on the next flush.
 * While it is stuck, writes at other offsets go straight to disk, so one
 * failing range never fails the writers of other ranges.
 */
class SegmentedFileWriter {
public:
    struct Options {
        ByteCount bufferCapacity = Constants::WRITE_BUFFER_CAPACITY;
        double flushRatio = Constants::WRITE_BUFFER_FLUSH_RATIO;
    };

    /// Bytes that were accepted by write() but never reached disk
    struct LostRun {
        ByteOffset start = 0;
        ByteCount length = 0;

        bool isEmpty() const { return length <= 0; }
    };

    explicit SegmentedFileWriter(const QLoggingCategory& log = lcWriter());
    SegmentedFileWriter(Options options, const QLoggingCategory& log = lcWriter());

    /// Drains every buffer and closes every handle
    virtual ~SegmentedFileWriter();

    SegmentedFileWriter(const SegmentedFileWriter&) = delete;
    SegmentedFileWriter& operator=(const SegmentedFileWriter&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Writing
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Write bytes at an absolute offset
     *
     * Opens the file on first use (parent directories are created, existing
     * content is kept). Safe to call concurrently for the same or different
     * paths.
     *
     * @param path Target file
     * @param offset Absolute byte offset
     * @param data Bytes to place at offset
     * @param error Receives a FileSystem error on failure
     * @return True once the bytes are buffered or on disk; on false none of
     *         them were accepted
     */
    bool write(const QString& path, ByteOffset offset, const QByteArray& data,
               DownloadError* error = nullptr);

    /**
     * @brief Push the pending run of one path to disk
     * @return True if nothing is left pending for the path
     */
    bool flush(const QString& path, DownloadError* error = nullptr);

    /**
     * @brief Push the pending run of every open path to disk
     * @return True if every flush succeeded
     */
    bool flush();

    /**
     * @brief Flush and release the handle of one path
     *
     * A pending run that still cannot be written is dropped and described
     * in @p lost, so the caller can fetch those bytes again.
     *
     * @return True if the pending run reached disk
     */
    bool close(const QString& path, DownloadError* error = nullptr, LostRun* lost = nullptr);

    /**
     * @brief Flush and release every handle
     * @return True if every pending run reached disk
     */
    bool closeAll();

    // ───────────────────────────────────────────────────────────────────────
    // Inspection
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Minimal integrity check: the file exists and is not empty
     *
     * This is not a content verification.
     */
    static bool checkIntegrity(const QString& path);

    /// @return Number of paths with an open handle
    int openFileCount() const;

    /// @return Number of flushes that reached disk since construction
    int64_t flushCount() const { return m_flushCount.load(std::memory_order_relaxed); }

protected:
    /**
     * @brief Write one run at the file's current position and flush it
     *
     * Called with the range locked and the file positioned at @p start.
     */
    virtual bool writeRun(QFile& file, ByteOffset start, const QByteArray& data);

private:
    struct FileSlot;

    std::shared_ptr<FileSlot> acquireSlot(const QString& path, DownloadError* error);
    std::shared_ptr<FileSlot> findSlot(const QString& path) const;
    bool writeLocked(FileSlot& slot, ByteOffset start, const QByteArray& data, DownloadError* error);
    bool flushLocked(FileSlot& slot, DownloadError* error);
    bool closeSlot(FileSlot& slot, DownloadError* error, LostRun* lost);

    Options m_options;
    const QLoggingCategory& m_log;

    mutable std::mutex m_registryMutex;
    QHash<QString, std::shared_ptr<FileSlot>> m_slots;

    std::atomic<int64_t> m_flushCount{0};
};

} // namespace ChunkDM
