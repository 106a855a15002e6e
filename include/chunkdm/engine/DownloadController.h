/**
 * @file DownloadController.h
 * @brief Per-download state machine driving chunk workers
 *
 * A DownloadController owns one download: its status, its chunk list and its
 * bytes-transferred counter. It probes the resource, plans chunks, runs one
 * ChunkWorker per incomplete chunk and decides the terminal status once every
 * worker has exited.
 */

#pragma once

#include "chunkdm/engine/Chunk.h"
#include "chunkdm/engine/ControlToken.h"
#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"
#include "chunkdm/persistence/StateStore.h"

#include <atomic>
#include <QFuture>
#include <QLoggingCategory>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <QWaitCondition>

namespace ChunkDM {

// Forward declarations
class ChunkWorker;
class RangeClient;
class RetryPolicy;
class SegmentedFileWriter;

/**
 * @class DownloadController
 * @brief State machine for a single download
 *
 * State transitions:
 *   Queued → Downloading → {Paused, Completed, Error, Cancelled}
 *   Paused → Downloading (resume)
 *   Error → Queued (retry)
 *   any non-terminal state → Cancelled
 *
 * Threading:
 * - One session task per run probes, plans, spawns workers and waits for them
 * - One ChunkWorker per incomplete chunk, on the controller's own pool
 * - Public methods are thread-safe; signals are emitted from the calling or
 *   worker thread, never while the controller mutex is held
 *
 * If every worker exits while the download is still Downloading and some
 * chunks are incomplete (their retry budget ran out), the download moves to
 * Error with the number of stalled chunks in its message.
 *
 * Bytes the writer had to drop when closing the partial file move their
 * chunks back to the first dropped byte before the snapshot is stored.
 */
class DownloadController : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Collaborators shared by all controllers of a manager
     */
    struct Dependencies {
        RangeClient& client;
        SegmentedFileWriter& writer;
        StateStore& store;
        const RetryPolicy& retry;
    };

    /**
     * @brief Per-download tuning
     */
    struct Options {
        ByteCount fetchIncrement = Constants::FETCH_INCREMENT;
        Duration pausePollInterval = Constants::PAUSE_POLL_INTERVAL;
        ByteCount checkpointBytes = Constants::CHECKPOINT_BYTES;
        int maxAttempts = Constants::DEFAULT_MAX_ATTEMPTS;
    };

    // ───────────────────────────────────────────────────────────────────────
    // Construction
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Create a controller from a snapshot
     *
     * A fresh download passes a Queued snapshot with no chunks. A restored one
     * passes its stored snapshot; its chunk list is reused as is.
     */
    DownloadController(const StateSnapshot& initial, Dependencies deps,
                       Options options = Options{},
                       const QLoggingCategory& log = lcEngine(),
                       QObject* parent = nullptr);

    /// Stops running workers and waits for them; a running download is stored as Paused
    ~DownloadController() override;

    DownloadController(const DownloadController&) = delete;
    DownloadController& operator=(const DownloadController&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Identification
    // ───────────────────────────────────────────────────────────────────────

    /// @return Unique download ID
    TaskId id() const { return m_id; }

    /// @return Source URL
    QString url() const { return m_url; }

    /// @return Submission time, ms since epoch
    qint64 createdAt() const { return m_createdAt; }

    /// @return Final path of the data file
    QString filePath() const;

    /// @return Path written to while the download is not Completed
    QString partialPath() const;

    // ───────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Start or continue the download
     *
     * Effective from Queued, Paused and Interrupted. Workers are spawned only
     * for incomplete chunks that have no live worker.
     *
     * @return True if the download moved to Downloading
     */
    bool start();

    /**
     * @brief Pause a running download
     *
     * Workers park between fetch increments without losing position.
     *
     * @return True if the download moved to Paused
     */
    bool pause();

    /**
     * @brief Resume a paused download
     * @return True if the download moved to Downloading
     */
    bool resume();

    /**
     * @brief Cancel the download
     *
     * Releases parked workers, removes the stored snapshot and the sidecar.
     * The partial file is left on disk. Once every chunk is done the data
     * file is moved into place under the controller lock; a cancel that
     * arrives then waits for that step and returns false.
     *
     * @return True if the download moved to Cancelled
     */
    bool cancel();

    /**
     * @brief Return a failed download to Queued, keeping its chunks
     * @return True if the download was in Error
     */
    bool retry();

    /**
     * @brief Block until no session or worker is running
     * @param msecs Timeout, -1 waits forever
     * @return True if idle before the timeout
     */
    bool waitForIdle(int msecs = -1);

    // ───────────────────────────────────────────────────────────────────────
    // State Queries
    // ───────────────────────────────────────────────────────────────────────

    /// @return Current status
    DownloadStatus status() const;

    /// @return Immutable view of url, progress and status
    DownloadStatusInfo getStatus() const;

    /// @return Durable copy of the whole download
    StateSnapshot snapshot() const;

    /// @return Copy of every chunk
    ChunkSnapshots chunkSnapshots() const;

    /// @return Bytes written so far
    ByteCount bytesTransferred() const { return m_bytesTransferred.load(std::memory_order_acquire); }

    /// @return Last error, empty unless the download is in Error
    DownloadError lastError() const;

signals:
    /**
     * @brief Emitted on every status transition
     */
    void statusChanged(const ChunkDM::TaskId& id, ChunkDM::DownloadStatus status);

    /**
     * @brief Emitted once a run ends in Completed, Error or Cancelled
     */
    void finished(const ChunkDM::TaskId& id, ChunkDM::DownloadStatus status);

private:
    friend class ChunkWorker;

    // Session
    void runSession();
    bool ensureSizeKnown();
    void ensureChunksPlanned();
    int spawnWorkersLocked();
    bool closePartialLocked(DownloadError* error);
    bool completeFilesLocked(DownloadError* error);

    // Worker callbacks
    void onBytesWritten(ByteCount bytes);
    void onChunkCompleted(const Chunk& chunk);
    void onWorkerExit(Chunk& chunk, const DownloadError& error);

    // Helpers
    void persist();
    StateSnapshot snapshotLocked() const;
    void logTransition(DownloadStatus from, DownloadStatus to) const;
    void announce(DownloadStatus status);

    // Identity
    const TaskId m_id;
    const QString m_url;
    QString m_filePath;
    qint64 m_createdAt = 0;

    // Collaborators
    Dependencies m_deps;
    Options m_options;
    const QLoggingCategory& m_log;

    // State (guarded by m_mutex)
    mutable QMutex m_mutex;
    QWaitCondition m_workersDone;
    DownloadStatus m_status;
    ByteCount m_totalSize = -1;
    bool m_supportsRanges = true;
    ChunkList m_chunks;
    DownloadError m_lastError;
    int m_liveWorkers = 0;
    bool m_sessionActive = false;
    bool m_shuttingDown = false;

    // Shared with workers
    std::atomic<ByteCount> m_bytesTransferred{0};
    std::atomic<ByteCount> m_bytesSinceCheckpoint{0};
    ControlToken m_token;

    QThreadPool m_pool;
    QFuture<void> m_session;
};

} // namespace ChunkDM
