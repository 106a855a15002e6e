/**
 * @file DownloadQueue.h
 * @brief Admission control bounding the number of active downloads
 */

#pragma once

#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"

#include <deque>
#include <map>
#include <mutex>
#include <vector>

#include <QLoggingCategory>
#include <QObject>
#include <QTimer>

namespace ChunkDM {

class DownloadController;

/**
 * @class DownloadQueue
 * @brief FIFO pending sequence plus a bounded active set
 *
 * Admission step (runNext): while fewer than maxConcurrent downloads are
 * active and some are pending, move the head of pending into the active set
 * and start it. The step runs on enqueue, whenever an active download
 * finishes, when the bound changes and on a periodic sweep.
 *
 * A paused download keeps its slot. A download leaves the active set when it
 * finishes (Completed, Error, Cancelled) or is removed.
 *
 * Every operation on the two collections runs under one mutex, so
 * activeCount() <= maxConcurrent() holds at all times. Controllers are
 * started outside that mutex.
 */
class DownloadQueue : public QObject {
    Q_OBJECT

public:
    explicit DownloadQueue(int maxConcurrent = Constants::DEFAULT_MAX_CONCURRENT,
                           Duration sweepInterval = Constants::ADMISSION_SWEEP_INTERVAL,
                           const QLoggingCategory& log = lcQueue(),
                           QObject* parent = nullptr);
    ~DownloadQueue() override;

    /**
     * @brief Append a download to the pending sequence and run admission
     * @return False if the download is already pending or active
     */
    bool enqueue(DownloadController* controller);

    /**
     * @brief Admit pending downloads while slots are free
     * @return Number of downloads started
     */
    int runNext();

    /**
     * @brief Evict a download from pending and active
     * @return True if it was present
     */
    bool remove(const TaskId& id);

    /**
     * @brief Drop every entry without starting anything
     */
    void clear();

    /**
     * @brief Change the concurrency bound
     * @param n New bound, must be at least 1
     * @param error Receives a ConcurrencyLimit error when n is rejected
     * @return True if accepted
     */
    bool setMaxConcurrent(int n, DownloadError* error = nullptr);

    int maxConcurrent() const;
    int pendingCount() const;
    int activeCount() const;
    bool contains(const TaskId& id) const;
    bool isActive(const TaskId& id) const;

    /// @return Pending ids, head first
    std::vector<TaskId> pendingIds() const;

    /// Periodic sweep control; the sweep starts with the queue
    void startSweep();
    void stopSweep();

signals:
    /**
     * @brief Emitted after a download moved from pending to active
     */
    void admitted(const ChunkDM::TaskId& id);

private:
    void onDownloadFinished(const ChunkDM::TaskId& id, ChunkDM::DownloadStatus status);

    const QLoggingCategory& m_log;

    mutable std::mutex m_mutex;
    std::deque<DownloadController*> m_pending;
    std::map<TaskId, DownloadController*> m_active;
    int m_maxConcurrent;

    QTimer m_sweepTimer;
};

} // namespace ChunkDM
