/**
 * @file DownloadManager.h
 * @brief Control surface over every download of the engine
 *
 * The DownloadManager is the central coordinator for:
 * - Submitting URLs and creating their controllers
 * - Admission through the DownloadQueue
 * - Lifecycle calls by id (start, pause, resume, cancel, retry)
 * - Restoring stored downloads and recovering orphaned partial files
 */

#pragma once

#include "chunkdm/engine/DownloadController.h"
#include "chunkdm/engine/DownloadQueue.h"
#include "chunkdm/engine/EngineConfig.h"
#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/RangeClient.h"
#include "chunkdm/engine/RetryPolicy.h"
#include "chunkdm/engine/SegmentedFileWriter.h"
#include "chunkdm/engine/Types.h"
#include "chunkdm/persistence/StateStore.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <QObject>

namespace ChunkDM {

/**
 * @class DownloadManager
 * @brief Owns the shared collaborators and one controller per download
 *
 * Expected failures never throw: calls return false, a null id or an empty
 * optional and fill the optional DownloadError out-parameter. Lifecycle calls
 * on an unknown id fail with NotFound.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Signals are emitted from the thread that caused the transition
 */
class DownloadManager : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Construct with the libcurl range client
     */
    explicit DownloadManager(EngineConfig config = EngineConfig{}, QObject* parent = nullptr);

    /**
     * @brief Construct with a custom range client
     */
    DownloadManager(EngineConfig config, std::unique_ptr<RangeClient> client,
                    QObject* parent = nullptr);

    /// Calls shutdown()
    ~DownloadManager() override;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Create the downloads root and open the state store
     * @return True if successful
     */
    bool initialize(DownloadError* error = nullptr);

    /**
     * @brief Pause running downloads, persist them and release every resource
     */
    void shutdown();

    /**
     * @brief Recreate controllers for every stored snapshot
     *
     * Queued downloads are enqueued. Downloading and Interrupted ones become
     * Paused. Terminal ones are kept for inspection.
     *
     * @return Number of controllers created
     */
    int restore();

    /**
     * @brief Synthesize snapshots for orphaned partial files, then restore()
     * @return Number of controllers created
     */
    int recover();

    // ═══════════════════════════════════════════════════════════════════════
    // Control Surface
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Register a URL for download
     * @param url Absolute http, https or ftp URL
     * @param autoStart Enqueue the download right away
     * @param error Receives InvalidInput for a malformed URL
     * @return New download id, or a null id on failure
     */
    TaskId submit(const QString& url, bool autoStart = true, DownloadError* error = nullptr);

    /**
     * @brief Enqueue a Queued download or resume a Paused one
     */
    bool start(const TaskId& id, DownloadError* error = nullptr);

    bool pause(const TaskId& id, DownloadError* error = nullptr);

    /**
     * @brief Resume a Paused download
     *
     * A download still holding its queue slot continues at once; otherwise it
     * goes back through admission.
     */
    bool resume(const TaskId& id, DownloadError* error = nullptr);

    /**
     * @brief Cancel a download and drop its stored snapshot
     *
     * The controller stays registered so status() and list() keep reporting
     * the download as Cancelled for the rest of the session. Its pool threads
     * expire once idle; only the status record is retained. A later restore()
     * does not bring it back, since its snapshot is gone.
     */
    bool cancel(const TaskId& id, DownloadError* error = nullptr);

    /**
     * @brief Re-enqueue a download in Error, keeping its completed chunks
     */
    bool retry(const TaskId& id, DownloadError* error = nullptr);

    /// @return Status view, or nullopt (NotFound) for an unknown id
    std::optional<DownloadStatusInfo> status(const TaskId& id, DownloadError* error = nullptr) const;

    /// @return Ids of every known download, oldest first
    std::vector<TaskId> list() const;

    /// @return Status of every known download, oldest first
    std::vector<DownloadStatusInfo> statusAll() const;

    /**
     * @brief Change the concurrency bound of the queue
     * @param error Receives ConcurrencyLimit when n < 1
     */
    bool setMaxConcurrent(int n, DownloadError* error = nullptr);

    /// @return True when no download is pending or active in the queue
    bool isIdle() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Accessors
    // ═══════════════════════════════════════════════════════════════════════

    const EngineConfig& config() const { return m_config; }
    DownloadQueue& queue() { return m_queue; }
    StateStore& store() { return m_store; }

signals:
    void statusChanged(const ChunkDM::TaskId& id, ChunkDM::DownloadStatus status);
    void downloadFinished(const ChunkDM::TaskId& id, ChunkDM::DownloadStatus status);

private:
    DownloadController* find(const TaskId& id, DownloadError* error) const;
    DownloadController* adopt(const StateSnapshot& snapshot);
    bool isPathClaimedLocked(const QString& path) const;

    EngineConfig m_config;
    const QLoggingCategory& m_log;

    // Shared collaborators
    std::unique_ptr<RangeClient> m_client;
    RetryPolicy m_retry;
    SegmentedFileWriter m_writer;
    StateStore m_store;
    DownloadQueue m_queue;

    // Controllers; declared last so they go before the collaborators they use
    mutable std::mutex m_controllersMutex;
    std::map<TaskId, std::unique_ptr<DownloadController>> m_controllers;
    bool m_initialized = false;
};

} // namespace ChunkDM
