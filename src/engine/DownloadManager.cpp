/**
 * @file DownloadManager.cpp
 * @brief Implementation of DownloadManager - central download coordination
 */

#include "chunkdm/engine/DownloadManager.h"
#include "chunkdm/engine/CurlRangeClient.h"
#include "chunkdm/engine/FileNaming.h"
#include "chunkdm/engine/UrlValidator.h"

#include <QDateTime>
#include <QDir>
#include <algorithm>

namespace ChunkDM {

namespace {

CurlRangeClient::Options clientOptions(const EngineConfig& config) {
    CurlRangeClient::Options options;
    options.connectTimeout = config.connectTimeout;
    options.readTimeout = config.readTimeout;
    options.userAgent = config.userAgent;
    return options;
}

RetryPolicy::Config retryConfig(const EngineConfig& config) {
    RetryPolicy::Config retry;
    retry.maxAttempts = config.maxAttempts;
    retry.baseDelay = config.retryBaseDelay;
    retry.maxDelay = config.retryMaxDelay;
    return retry;
}

SegmentedFileWriter::Options writerOptions(const EngineConfig& config) {
    SegmentedFileWriter::Options options;
    options.bufferCapacity = config.writeBufferCapacity;
    options.flushRatio = config.writeBufferFlushRatio;
    return options;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

DownloadManager::DownloadManager(EngineConfig config, QObject* parent)
    : DownloadManager(config, std::make_unique<CurlRangeClient>(clientOptions(config)), parent)
{
}

DownloadManager::DownloadManager(EngineConfig config, std::unique_ptr<RangeClient> client,
                                 QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_log(lcEngine())
    , m_client(std::move(client))
    , m_retry(retryConfig(m_config))
    , m_writer(writerOptions(m_config))
    , m_store(m_config.stateRoot)
    , m_queue(m_config.maxConcurrent, m_config.sweepInterval)
{
}

DownloadManager::~DownloadManager() {
    shutdown();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

bool DownloadManager::initialize(DownloadError* error) {
    if (m_initialized) {
        return true;
    }

    qCDebug(m_log) << "DownloadManager: Initializing...";

    if (!QDir().mkpath(m_config.downloadsRoot)) {
        qCCritical(m_log) << "DownloadManager: Cannot create" << m_config.downloadsRoot;
        reportError(error, DownloadError::make(ErrorCategory::FileSystem,
            QStringLiteral("Cannot create downloads directory %1").arg(m_config.downloadsRoot)));
        return false;
    }

    if (!m_store.open(error)) {
        qCCritical(m_log) << "DownloadManager: Failed to open state store";
        return false;
    }

    m_queue.startSweep();
    m_initialized = true;
    qCDebug(m_log) << "DownloadManager: Initialized, downloads in" << m_config.downloadsRoot;
    return true;
}

void DownloadManager::shutdown() {
    if (!m_initialized) {
        return;
    }

    qCDebug(m_log) << "DownloadManager: Shutting down...";

    m_queue.stopSweep();
    m_queue.clear();

    std::map<TaskId, std::unique_ptr<DownloadController>> controllers;
    {
        std::lock_guard lock(m_controllersMutex);
        controllers.swap(m_controllers);
    }

    // Paused downloads are stored with their positions; destruction waits for workers
    for (auto& [id, controller] : controllers) {
        controller->pause();
    }
    controllers.clear();

    if (!m_writer.closeAll()) {
        qCWarning(m_log) << "DownloadManager: Some buffered data could not be written";
    }
    m_store.close();

    m_initialized = false;
    qCDebug(m_log) << "DownloadManager: Shutdown complete";
}

int DownloadManager::restore() {
    const auto snapshots = m_store.listAll();
    std::vector<DownloadController*> queued;
    int restored = 0;

    {
        std::lock_guard lock(m_controllersMutex);
        for (const auto& stored : snapshots) {
            if (m_controllers.count(stored.id) > 0) {
                continue;
            }

            StateSnapshot snapshot = stored;
            if (snapshot.status == DownloadStatus::Downloading ||
                snapshot.status == DownloadStatus::Interrupted) {
                qCInfo(m_log) << "DownloadManager: Restoring" << snapshot.id.toString(QUuid::WithoutBraces)
                              << "from" << downloadStatusToString(snapshot.status) << "as Paused";
                snapshot.status = DownloadStatus::Paused;
                m_store.save(snapshot);
            }

            DownloadController* controller = adopt(snapshot);
            if (snapshot.status == DownloadStatus::Queued) {
                queued.push_back(controller);
            }
            ++restored;
        }
    }

    for (auto* controller : queued) {
        m_queue.enqueue(controller);
    }

    qCInfo(m_log) << "DownloadManager: Restored" << restored << "downloads,"
                  << queued.size() << "queued";
    return restored;
}

int DownloadManager::recover() {
    const auto recovered = m_store.recoverInterruptedDownloads(m_config.downloadsRoot);
    if (!recovered.empty()) {
        qCInfo(m_log) << "DownloadManager: Recovered" << recovered.size() << "orphaned partial files";
    }
    return restore();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Control Surface
// ═══════════════════════════════════════════════════════════════════════════════

TaskId DownloadManager::submit(const QString& url, bool autoStart, DownloadError* error) {
    QString reason;
    if (!UrlValidator::isValid(url, &reason)) {
        qCWarning(m_log) << "DownloadManager: Invalid URL" << url << "-" << reason;
        reportError(error, DownloadError::make(ErrorCategory::InvalidInput, reason));
        return TaskId{};
    }

    if (!m_initialized) {
        reportError(error, DownloadError::make(ErrorCategory::Unknown,
            QStringLiteral("DownloadManager is not initialized")));
        return TaskId{};
    }

    StateSnapshot snapshot;
    snapshot.id = QUuid::createUuid();
    snapshot.url = url;
    snapshot.status = DownloadStatus::Queued;
    snapshot.createdAt = QDateTime::currentMSecsSinceEpoch();

    DownloadController* controller = nullptr;
    {
        std::lock_guard lock(m_controllersMutex);
        snapshot.filePath = FileNaming::uniquePath(
            QDir(m_config.downloadsRoot).absolutePath(), FileNaming::fileNameForUrl(url),
            [this](const QString& candidate) { return isPathClaimedLocked(candidate); });

        if (!FileNaming::writeSidecar(snapshot.filePath, url)) {
            qCWarning(m_log) << "DownloadManager: Could not write sidecar for" << snapshot.filePath;
        }

        m_store.save(snapshot);
        controller = adopt(snapshot);
    }

    qCInfo(m_log) << "DownloadManager: Submitted" << snapshot.id.toString(QUuid::WithoutBraces)
                  << url << "->" << snapshot.filePath;
    emit statusChanged(snapshot.id, DownloadStatus::Queued);

    if (autoStart) {
        m_queue.enqueue(controller);
    }
    return snapshot.id;
}

bool DownloadManager::start(const TaskId& id, DownloadError* error) {
    DownloadController* controller = find(id, error);
    if (!controller) {
        return false;
    }

    switch (controller->status()) {
        case DownloadStatus::Queued:
            return m_queue.enqueue(controller) || m_queue.contains(id);
        case DownloadStatus::Paused:
        case DownloadStatus::Interrupted:
            return resume(id, error);
        default:
            return false;
    }
}

bool DownloadManager::pause(const TaskId& id, DownloadError* error) {
    DownloadController* controller = find(id, error);
    return controller && controller->pause();
}

bool DownloadManager::resume(const TaskId& id, DownloadError* error) {
    DownloadController* controller = find(id, error);
    if (!controller) {
        return false;
    }

    const DownloadStatus current = controller->status();
    if (current != DownloadStatus::Paused && current != DownloadStatus::Interrupted) {
        return false;
    }

    if (m_queue.isActive(id)) {
        return controller->resume();
    }
    return m_queue.enqueue(controller) || m_queue.contains(id);
}

bool DownloadManager::cancel(const TaskId& id, DownloadError* error) {
    DownloadController* controller = find(id, error);
    if (!controller) {
        return false;
    }

    m_queue.remove(id);
    return controller->cancel();
}

bool DownloadManager::retry(const TaskId& id, DownloadError* error) {
    DownloadController* controller = find(id, error);
    if (!controller || !controller->retry()) {
        return false;
    }
    return m_queue.enqueue(controller) || m_queue.contains(id);
}

std::optional<DownloadStatusInfo> DownloadManager::status(const TaskId& id, DownloadError* error) const {
    DownloadController* controller = find(id, error);
    if (!controller) {
        return std::nullopt;
    }
    return controller->getStatus();
}

std::vector<TaskId> DownloadManager::list() const {
    std::vector<TaskId> ids;
    for (const auto& info : statusAll()) {
        ids.push_back(info.id);
    }
    return ids;
}

std::vector<DownloadStatusInfo> DownloadManager::statusAll() const {
    std::vector<std::pair<qint64, DownloadStatusInfo>> entries;
    {
        std::lock_guard lock(m_controllersMutex);
        entries.reserve(m_controllers.size());
        for (const auto& [id, controller] : m_controllers) {
            entries.emplace_back(controller->createdAt(), controller->getStatus());
        }
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<DownloadStatusInfo> result;
    result.reserve(entries.size());
    for (auto& entry : entries) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

bool DownloadManager::setMaxConcurrent(int n, DownloadError* error) {
    return m_queue.setMaxConcurrent(n, error);
}

bool DownloadManager::isIdle() const {
    return m_queue.pendingCount() == 0 && m_queue.activeCount() == 0;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

DownloadController* DownloadManager::find(const TaskId& id, DownloadError* error) const {
    std::lock_guard lock(m_controllersMutex);
    auto it = m_controllers.find(id);
    if (it == m_controllers.end()) {
        qCDebug(m_log) << "DownloadManager: Unknown download" << id.toString(QUuid::WithoutBraces);
        reportError(error, DownloadError::make(ErrorCategory::NotFound,
            QStringLiteral("Unknown download %1").arg(id.toString(QUuid::WithoutBraces))));
        return nullptr;
    }
    return it->second.get();
}

// Caller holds m_controllersMutex
DownloadController* DownloadManager::adopt(const StateSnapshot& snapshot) {
    DownloadController::Options options;
    options.fetchIncrement = m_config.fetchIncrement;
    options.pausePollInterval = m_config.pausePollInterval;
    options.checkpointBytes = m_config.checkpointBytes;
    options.maxAttempts = m_config.maxAttempts;

    auto controller = std::make_unique<DownloadController>(
        snapshot, DownloadController::Dependencies{*m_client, m_writer, m_store, m_retry}, options);

    connect(controller.get(), &DownloadController::statusChanged,
            this, &DownloadManager::statusChanged, Qt::DirectConnection);
    connect(controller.get(), &DownloadController::finished,
            this, &DownloadManager::downloadFinished, Qt::DirectConnection);

    DownloadController* raw = controller.get();
    m_controllers[snapshot.id] = std::move(controller);
    return raw;
}

// Caller holds m_controllersMutex
bool DownloadManager::isPathClaimedLocked(const QString& path) const {
    return std::any_of(m_controllers.begin(), m_controllers.end(),
        [&path](const auto& entry) {
            const DownloadStatus status = entry.second->status();
            return status != DownloadStatus::Cancelled && entry.second->filePath() == path;
        });
}

} // namespace ChunkDM
