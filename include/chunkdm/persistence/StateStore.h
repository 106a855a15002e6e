/**
 * @file StateStore.h
 * @brief SQLite-backed store of per-download snapshots
 *
 * Handles durable storage of:
 * - Download identity, sizes, progress and status
 * - The ordered chunk list of every download
 *
 * All SQL runs on one dedicated thread that owns the connection; lookups
 * are served from an in-memory cache first.
 */

#pragma once

#include "chunkdm/engine/Chunk.h"
#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include <QHash>
#include <QLoggingCategory>
#include <QString>

namespace ChunkDM {

/**
 * @brief Durable, self-contained copy of one download
 */
struct StateSnapshot {
    TaskId id;
    QString url;
    QString filePath;                   ///< Final path; bytes live in filePath + ".part" until Completed
    ByteCount totalSize = -1;
    ByteCount bytesTransferred = 0;
    DownloadStatus status = DownloadStatus::Queued;
    ChunkSnapshots chunks;
    QString errorMessage;
    qint64 createdAt = 0;               ///< ms since epoch
    qint64 updatedAt = 0;               ///< ms since epoch
};

/**
 * @class StateStore
 * @brief Keyed snapshot store with crash recovery
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Writes are queued to the store thread and applied in call order
 * - Reads that miss the cache wait for the store thread
 *
 * A record that cannot be decoded or breaks the chunk invariants is logged
 * as StateCorruption and treated as absent.
 */
class StateStore {
public:
    /**
     * @brief Constructor
     * @param stateRoot Directory holding state.db (created on open)
     * @param log Logging category
     */
    explicit StateStore(const QString& stateRoot, const QLoggingCategory& log = lcStore());

    ~StateStore();

    // Non-copyable
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // ─────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────

    /**
     * @brief Open the database and start the store thread
     * @param error Receives a FileSystem error on failure
     * @return True if successful
     */
    bool open(DownloadError* error = nullptr);

    /**
     * @brief Apply queued writes, close the database and stop the thread
     */
    void close();

    /// @return True between a successful open() and close()
    bool isOpen() const { return m_running.load(std::memory_order_acquire); }

    /// @return Path of the SQLite file
    QString databasePath() const { return m_dbPath; }

    /**
     * @brief Block until every queued write reached the database
     */
    void flush();

    // ─────────────────────────────────────────────────────────────────────
    // Snapshot Operations
    // ─────────────────────────────────────────────────────────────────────

    /**
     * @brief Persist a full overwrite of a snapshot
     *
     * The creation time of an already known snapshot is kept; the update
     * time is set to now.
     */
    void save(const StateSnapshot& snapshot);

    /**
     * @brief Look up a snapshot, cache first
     * @return Snapshot, or nullopt if unknown or corrupt
     */
    std::optional<StateSnapshot> get(const TaskId& id);

    /**
     * @brief Replace progress counters and chunk list
     * @return False if the id is unknown
     */
    bool updateProgress(const TaskId& id, ByteCount bytesTransferred, const ChunkSnapshots& chunks);

    /**
     * @brief Replace the status
     * @return False if the id is unknown
     */
    bool updateState(const TaskId& id, DownloadStatus status);

    /**
     * @brief Delete a snapshot from cache and database
     */
    void remove(const TaskId& id);

    /**
     * @brief Union of cached and stored snapshots, one per id
     */
    std::vector<StateSnapshot> listAll();

    /**
     * @brief Snapshots whose status equals the given one
     */
    std::vector<StateSnapshot> listByState(DownloadStatus status);

    // ─────────────────────────────────────────────────────────────────────
    // Crash Recovery
    // ─────────────────────────────────────────────────────────────────────

    /**
     * @brief Synthesize snapshots for orphaned partial files
     *
     * Every "*.part" file in the directory whose ".meta" sidecar names a URL
     * and which no snapshot refers to yields an Interrupted snapshot with
     * unknown size, no chunks and bytesTransferred equal to the file size.
     *
     * @param partialFilesDir Directory to scan
     * @return The snapshots that were created
     */
    std::vector<StateSnapshot> recoverInterruptedDownloads(const QString& partialFilesDir);

    /**
     * @brief Stable id for a download recovered from its URL
     */
    static TaskId recoveryIdForUrl(const QString& url);

private:
    using Job = std::function<void()>;

    bool post(Job job);
    void threadLoop();
    void stopThread();

    template <typename F>
    auto call(F&& fn) -> std::invoke_result_t<F&> {
        using R = std::invoke_result_t<F&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        if (!post([task]() { (*task)(); })) {
            return R();
        }
        return future.get();
    }

    // Store thread only
    bool openDatabase(DownloadError* error);
    void closeDatabase();
    void doSave(const StateSnapshot& snapshot);
    void doRemove(const TaskId& id);
    std::optional<StateSnapshot> doLoad(const TaskId& id);
    std::vector<StateSnapshot> doLoadAll();
    ChunkSnapshots loadChunks(const QString& key);
    std::optional<StateSnapshot> decodeRow(const QString& key, const QString& url,
                                           const QString& filePath, qint64 totalSize,
                                           qint64 bytes, int status, const QString& errorMessage,
                                           qint64 createdAt, qint64 updatedAt);

    QString m_stateRoot;
    QString m_dbPath;
    QString m_connectionName;
    const QLoggingCategory& m_log;

    // Cache
    mutable std::mutex m_cacheMutex;
    QHash<TaskId, StateSnapshot> m_cache;

    // Store thread
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::queue<Job> m_jobs;
    bool m_acceptingJobs = false;
};

} // namespace ChunkDM
