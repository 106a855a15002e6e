/**
 * @file DownloadQueue.cpp
 * @brief Implementation of DownloadQueue - bounded admission of downloads
 */

#include "chunkdm/engine/DownloadQueue.h"
#include "chunkdm/engine/DownloadController.h"

#include <algorithm>

namespace ChunkDM {

DownloadQueue::DownloadQueue(int maxConcurrent, Duration sweepInterval,
                             const QLoggingCategory& log, QObject* parent)
    : QObject(parent)
    , m_log(log)
    , m_maxConcurrent(maxConcurrent >= 1 ? maxConcurrent : Constants::DEFAULT_MAX_CONCURRENT)
{
    if (maxConcurrent < 1) {
        qCWarning(m_log) << "DownloadQueue: Invalid limit" << maxConcurrent
                         << "- using" << m_maxConcurrent;
    }

    connect(&m_sweepTimer, &QTimer::timeout, this, [this]() { runNext(); });
    m_sweepTimer.setInterval(static_cast<int>(sweepInterval.count()));
    startSweep();
}

DownloadQueue::~DownloadQueue() {
    stopSweep();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════════════════════════════════════

bool DownloadQueue::enqueue(DownloadController* controller) {
    if (!controller) {
        return false;
    }

    const TaskId id = controller->id();
    {
        std::lock_guard lock(m_mutex);
        const bool pending = std::find(m_pending.begin(), m_pending.end(), controller) != m_pending.end();
        if (pending || m_active.count(id) > 0) {
            qCDebug(m_log) << "DownloadQueue: Already queued" << id.toString(QUuid::WithoutBraces);
            return false;
        }
        m_pending.push_back(controller);
    }

    connect(controller, &DownloadController::finished, this, &DownloadQueue::onDownloadFinished,
            static_cast<Qt::ConnectionType>(Qt::DirectConnection | Qt::UniqueConnection));

    qCDebug(m_log) << "DownloadQueue: Enqueued" << id.toString(QUuid::WithoutBraces)
                   << "pending" << pendingCount();

    runNext();
    return true;
}

int DownloadQueue::runNext() {
    int started = 0;

    for (;;) {
        DownloadController* next = nullptr;
        {
            std::lock_guard lock(m_mutex);
            if (static_cast<int>(m_active.size()) >= m_maxConcurrent || m_pending.empty()) {
                break;
            }
            next = m_pending.front();
            m_pending.pop_front();
            m_active[next->id()] = next;
        }

        const TaskId id = next->id();
        if (next->start() || next->status() == DownloadStatus::Downloading) {
            ++started;
            qCInfo(m_log) << "DownloadQueue: Admitted" << id.toString(QUuid::WithoutBraces)
                          << "active" << activeCount() << "/" << maxConcurrent();
            emit admitted(id);
            continue;
        }

        // Finished or cancelled while pending; its slot goes to the next one
        qCDebug(m_log) << "DownloadQueue: Skipping" << id.toString(QUuid::WithoutBraces)
                       << "in state" << downloadStatusToString(next->status());
        std::lock_guard lock(m_mutex);
        m_active.erase(id);
    }

    return started;
}

bool DownloadQueue::remove(const TaskId& id) {
    bool wasActive = false;
    bool found = false;
    {
        std::lock_guard lock(m_mutex);
        auto it = std::find_if(m_pending.begin(), m_pending.end(),
                               [&id](DownloadController* c) { return c->id() == id; });
        if (it != m_pending.end()) {
            m_pending.erase(it);
            found = true;
        }
        if (m_active.erase(id) > 0) {
            wasActive = true;
            found = true;
        }
    }

    if (found) {
        qCDebug(m_log) << "DownloadQueue: Removed" << id.toString(QUuid::WithoutBraces);
    }
    if (wasActive) {
        runNext();
    }
    return found;
}

void DownloadQueue::clear() {
    std::lock_guard lock(m_mutex);
    m_pending.clear();
    m_active.clear();
}

bool DownloadQueue::setMaxConcurrent(int n, DownloadError* error) {
    if (n < 1) {
        qCWarning(m_log) << "DownloadQueue: Rejected concurrency limit" << n;
        reportError(error, DownloadError::make(ErrorCategory::ConcurrencyLimit,
            QStringLiteral("maxConcurrent must be at least 1, got %1").arg(n)));
        return false;
    }

    {
        std::lock_guard lock(m_mutex);
        m_maxConcurrent = n;
    }
    qCInfo(m_log) << "DownloadQueue: Concurrency limit set to" << n;

    runNext();
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

int DownloadQueue::maxConcurrent() const {
    std::lock_guard lock(m_mutex);
    return m_maxConcurrent;
}

int DownloadQueue::pendingCount() const {
    std::lock_guard lock(m_mutex);
    return static_cast<int>(m_pending.size());
}

int DownloadQueue::activeCount() const {
    std::lock_guard lock(m_mutex);
    return static_cast<int>(m_active.size());
}

bool DownloadQueue::contains(const TaskId& id) const {
    std::lock_guard lock(m_mutex);
    if (m_active.count(id) > 0) {
        return true;
    }
    return std::any_of(m_pending.begin(), m_pending.end(),
                       [&id](DownloadController* c) { return c->id() == id; });
}

bool DownloadQueue::isActive(const TaskId& id) const {
    std::lock_guard lock(m_mutex);
    return m_active.count(id) > 0;
}

std::vector<TaskId> DownloadQueue::pendingIds() const {
    std::lock_guard lock(m_mutex);
    std::vector<TaskId> ids;
    ids.reserve(m_pending.size());
    for (auto* controller : m_pending) {
        ids.push_back(controller->id());
    }
    return ids;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Sweep
// ═══════════════════════════════════════════════════════════════════════════════

void DownloadQueue::startSweep() {
    if (m_sweepTimer.interval() > 0) {
        m_sweepTimer.start();
    }
}

void DownloadQueue::stopSweep() {
    m_sweepTimer.stop();
}

void DownloadQueue::onDownloadFinished(const TaskId& id, DownloadStatus status) {
    bool released = false;
    {
        std::lock_guard lock(m_mutex);
        released = m_active.erase(id) > 0;
    }

    if (released) {
        qCDebug(m_log) << "DownloadQueue: Slot freed by" << id.toString(QUuid::WithoutBraces)
                       << downloadStatusToString(status);
        runNext();
    }
}

} // namespace ChunkDM
