/**
 * @file DownloadController.cpp
 * @brief Implementation of DownloadController - per-download state machine
 */

#include "chunkdm/engine/DownloadController.h"
#include "chunkdm/engine/ChunkPlanner.h"
#include "chunkdm/engine/ChunkWorker.h"
#include "chunkdm/engine/FileNaming.h"
#include "chunkdm/engine/RangeClient.h"
#include "chunkdm/engine/RetryPolicy.h"
#include "chunkdm/engine/SegmentedFileWriter.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentRun>
#include <algorithm>

namespace ChunkDM {

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

DownloadController::DownloadController(const StateSnapshot& initial, Dependencies deps,
                                       Options options, const QLoggingCategory& log,
                                       QObject* parent)
    : QObject(parent)
    , m_id(initial.id)
    , m_url(initial.url)
    , m_filePath(initial.filePath)
    , m_createdAt(initial.createdAt)
    , m_deps(deps)
    , m_options(options)
    , m_log(log)
    , m_status(initial.status)
    , m_totalSize(initial.totalSize)
{
    if (m_createdAt == 0) {
        m_createdAt = QDateTime::currentMSecsSinceEpoch();
    }

    for (const auto& chunk : initial.chunks) {
        m_chunks.push_back(Chunk::fromSnapshot(chunk));
    }

    // Chunk positions are authoritative once a plan exists
    ByteCount bytes = initial.bytesTransferred;
    if (!m_chunks.empty()) {
        bytes = 0;
        for (const auto& chunk : m_chunks) {
            bytes += chunk->downloadedBytes();
        }
    }
    m_bytesTransferred.store(bytes, std::memory_order_release);

    if (!initial.errorMessage.isEmpty()) {
        m_lastError = DownloadError::make(ErrorCategory::Unknown, initial.errorMessage);
    }

    m_pool.setMaxThreadCount(Constants::MAX_CHUNKS + 1);

    qCDebug(m_log) << "DownloadController: Created" << m_id.toString(QUuid::WithoutBraces)
                   << "status" << downloadStatusToString(m_status)
                   << "chunks" << m_chunks.size();
}

DownloadController::~DownloadController() {
    blockSignals(true);
    {
        QMutexLocker locker(&m_mutex);
        m_shuttingDown = true;
    }
    m_token.cancel();
    m_pool.waitForDone();
}

QString DownloadController::filePath() const {
    QMutexLocker locker(&m_mutex);
    return m_filePath;
}

QString DownloadController::partialPath() const {
    return FileNaming::partialPathFor(filePath());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

bool DownloadController::start() {
    DownloadStatus previous;
    {
        QMutexLocker locker(&m_mutex);
        if (m_status != DownloadStatus::Queued &&
            m_status != DownloadStatus::Paused &&
            m_status != DownloadStatus::Interrupted) {
            return false;
        }

        previous = m_status;
        m_status = DownloadStatus::Downloading;
        m_lastError = DownloadError{};

        if (m_sessionActive) {
            // Parked workers continue; chunks whose worker already left get a new one
            m_token.unpause();
            spawnWorkersLocked();
        } else {
            m_token.reset();
            m_sessionActive = true;
            m_session = QtConcurrent::run(&m_pool, [this]() { runSession(); });
        }
    }

    logTransition(previous, DownloadStatus::Downloading);
    announce(DownloadStatus::Downloading);
    persist();
    return true;
}

bool DownloadController::pause() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_status != DownloadStatus::Downloading) {
            return false;
        }
        m_token.pause();
        m_status = DownloadStatus::Paused;
    }

    logTransition(DownloadStatus::Downloading, DownloadStatus::Paused);
    persist();
    announce(DownloadStatus::Paused);
    return true;
}

bool DownloadController::resume() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_status != DownloadStatus::Paused && m_status != DownloadStatus::Interrupted) {
            return false;
        }
    }
    return start();
}

bool DownloadController::cancel() {
    DownloadStatus previous;
    bool sessionActive = false;
    QString path;
    {
        QMutexLocker locker(&m_mutex);
        if (isTerminal(m_status)) {
            return false;
        }
        previous = m_status;
        m_status = DownloadStatus::Cancelled;
        sessionActive = m_sessionActive;
        path = m_filePath;
    }

    m_token.cancel();
    logTransition(previous, DownloadStatus::Cancelled);

    m_deps.store.remove(m_id);
    const QString sidecar = FileNaming::sidecarPathFor(path);
    if (QFile::exists(sidecar) && !QFile::remove(sidecar)) {
        qCWarning(m_log) << "DownloadController: Could not remove sidecar" << sidecar;
    }

    // A running session closes the file itself once its workers are gone
    if (!sessionActive) {
        DownloadError error;
        if (!m_deps.writer.close(FileNaming::partialPathFor(path), &error)) {
            qCWarning(m_log) << "DownloadController: Close on cancel failed -" << error.message;
        }
    }

    announce(DownloadStatus::Cancelled);
    emit finished(m_id, DownloadStatus::Cancelled);
    return true;
}

bool DownloadController::retry() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_status != DownloadStatus::Error) {
            return false;
        }
        m_status = DownloadStatus::Queued;
        m_lastError = DownloadError{};
    }

    logTransition(DownloadStatus::Error, DownloadStatus::Queued);
    persist();
    announce(DownloadStatus::Queued);
    return true;
}

bool DownloadController::waitForIdle(int msecs) {
    return m_pool.waitForDone(msecs);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════════

void DownloadController::runSession() {
    const bool ready = ensureSizeKnown();
    if (ready) {
        ensureChunksPlanned();
        persist();
    }

    DownloadStatus previous;
    DownloadStatus outcome;
    {
        QMutexLocker locker(&m_mutex);
        if (ready && !m_token.isCancelled()) {
            spawnWorkersLocked();
        }

        while (m_liveWorkers > 0) {
            m_workersDone.wait(&m_mutex);
        }

        previous = m_status;
        const auto incomplete = std::count_if(m_chunks.begin(), m_chunks.end(),
            [](const std::unique_ptr<Chunk>& chunk) { return !chunk->isCompleted(); });
        const bool running = m_status == DownloadStatus::Downloading ||
                             m_status == DownloadStatus::Paused;

        if (m_status == DownloadStatus::Cancelled || !running) {
            // Cancelled stays Cancelled
        } else if (m_shuttingDown) {
            m_status = DownloadStatus::Paused;
        } else if (!ready) {
            m_status = DownloadStatus::Error;
        } else if (incomplete == 0) {
            if (m_totalSize < 0) {
                m_totalSize = m_bytesTransferred.load(std::memory_order_acquire);
            }
            // Completed is reported only once the data file is in place
            DownloadError error;
            if (completeFilesLocked(&error)) {
                m_status = DownloadStatus::Completed;
            } else {
                m_lastError = error;
                m_status = DownloadStatus::Error;
            }
        } else if (m_status == DownloadStatus::Downloading) {
            const QString stalled = QStringLiteral("%1 chunk(s) stalled").arg(incomplete);
            if (m_lastError.hasError()) {
                m_lastError.message = stalled + QStringLiteral(": ") + m_lastError.message;
            } else {
                m_lastError = DownloadError::make(ErrorCategory::Unknown, stalled);
            }
            m_status = DownloadStatus::Error;
        }

        if (m_status != DownloadStatus::Completed) {
            DownloadError error;
            if (!closePartialLocked(&error)) {
                qCWarning(m_log) << "DownloadController: Close failed -" << error.message;
            }
        }

        m_sessionActive = false;
        outcome = m_status;
    }

    persist();

    if (outcome != previous) {
        logTransition(previous, outcome);
        announce(outcome);
        if (outcome == DownloadStatus::Completed || outcome == DownloadStatus::Error) {
            emit finished(m_id, outcome);
        }
    }
}

bool DownloadController::ensureSizeKnown() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_totalSize >= 0) {
            return true;
        }
    }

    DownloadError error;
    auto caps = m_deps.retry.run([this](DownloadError* attemptError) {
        return m_deps.client.probe(m_url, attemptError);
    }, m_options.maxAttempts, &m_token, &error);

    QMutexLocker locker(&m_mutex);
    if (!caps) {
        if (!m_token.isCancelled()) {
            qCCritical(m_log) << "DownloadController: Probe of" << m_url << "failed -" << error.message;
            m_lastError = error;
        }
        return false;
    }

    m_totalSize = caps->contentLength >= 0 ? caps->contentLength : -1;
    m_supportsRanges = caps->supportsRanges;

    qCDebug(m_log) << "DownloadController: Probed" << m_url
                   << "size" << m_totalSize << "ranges" << m_supportsRanges;
    return true;
}

void DownloadController::ensureChunksPlanned() {
    QMutexLocker locker(&m_mutex);
    if (!m_chunks.empty()) {
        qCDebug(m_log) << "DownloadController: Reusing" << m_chunks.size() << "chunks";
        return;
    }

    const int count = ChunkPlanner::threadCountFor(m_totalSize, m_supportsRanges);
    m_chunks = ChunkPlanner::plan(m_totalSize, count);
    m_bytesTransferred.store(0, std::memory_order_release);
    m_bytesSinceCheckpoint.store(0, std::memory_order_release);

    // A fresh plan refetches everything; stale bytes past the new end must not survive
    const QString partial = FileNaming::partialPathFor(m_filePath);
    if (QFileInfo::exists(partial) && !QFile::resize(partial, 0)) {
        qCWarning(m_log) << "DownloadController: Could not truncate" << partial;
    }

    qCInfo(m_log) << "DownloadController: Planned" << m_chunks.size() << "chunks for"
                  << m_id.toString(QUuid::WithoutBraces)
                  << "(" << formatByteSize(m_totalSize) << ")";
}

int DownloadController::spawnWorkersLocked() {
    m_pool.setMaxThreadCount(std::max(m_pool.maxThreadCount(),
                                      static_cast<int>(m_chunks.size()) + 1));

    int spawned = 0;
    for (auto& chunk : m_chunks) {
        if (chunk->isCompleted() || !chunk->tryClaim()) {
            continue;
        }
        ++m_liveWorkers;
        ++spawned;
        m_pool.start(new ChunkWorker(this, *chunk));
    }

    qCDebug(m_log) << "DownloadController: Spawned" << spawned << "workers, live" << m_liveWorkers;
    return spawned;
}

bool DownloadController::closePartialLocked(DownloadError* error) {
    SegmentedFileWriter::LostRun lost;
    if (m_deps.writer.close(FileNaming::partialPathFor(m_filePath), error, &lost)) {
        return true;
    }
    if (lost.isEmpty()) {
        return false;
    }

    // No worker is alive here, so chunk positions can move back safely
    ByteCount given = 0;
    for (auto& chunk : m_chunks) {
        given += chunk->rewindForLostRange(lost.start, lost.length);
    }
    m_bytesTransferred.fetch_sub(given, std::memory_order_acq_rel);

    qCWarning(m_log) << "DownloadController:" << lost.length << "bytes at" << lost.start
                     << "never reached disk, rewound" << given << "bytes of"
                     << m_id.toString(QUuid::WithoutBraces);
    return false;
}

bool DownloadController::completeFilesLocked(DownloadError* error) {
    const QString target = m_filePath;
    const QString partial = FileNaming::partialPathFor(target);

    if (!closePartialLocked(error)) {
        qCCritical(m_log) << "DownloadController: Final flush failed -" << error->message;
        return false;
    }

    QString finalPath = target;
    if (QFileInfo::exists(finalPath)) {
        const QFileInfo info(target);
        finalPath = FileNaming::uniquePath(info.absolutePath(), info.fileName());
        qCWarning(m_log) << "DownloadController:" << target << "exists, using" << finalPath;
    }

    if (QFileInfo::exists(partial)) {
        if (!QFile::rename(partial, finalPath)) {
            qCCritical(m_log) << "DownloadController: Could not rename" << partial << "to" << finalPath;
            reportError(error, DownloadError::make(ErrorCategory::FileSystem,
                QStringLiteral("Could not rename %1 to %2").arg(partial, finalPath)));
            return false;
        }
    } else {
        // Nothing was ever written: the resource is empty
        QFile empty(finalPath);
        if (!empty.open(QIODevice::WriteOnly)) {
            qCCritical(m_log) << "DownloadController: Could not create" << finalPath
                              << "-" << empty.errorString();
            reportError(error, DownloadError::make(ErrorCategory::FileSystem,
                QStringLiteral("Could not create %1: %2").arg(finalPath, empty.errorString())));
            return false;
        }
    }

    m_filePath = finalPath;
    QFile::remove(FileNaming::sidecarPathFor(target));

    if (m_totalSize > 0 && !SegmentedFileWriter::checkIntegrity(finalPath)) {
        qCWarning(m_log) << "DownloadController: Integrity check failed for" << finalPath;
    }

    qCInfo(m_log) << "DownloadController: Completed" << finalPath
                  << formatByteSize(m_bytesTransferred.load(std::memory_order_acquire));
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Worker Callbacks
// ═══════════════════════════════════════════════════════════════════════════════

void DownloadController::onBytesWritten(ByteCount bytes) {
    m_bytesTransferred.fetch_add(bytes, std::memory_order_acq_rel);
    const ByteCount pending = m_bytesSinceCheckpoint.fetch_add(bytes, std::memory_order_acq_rel) + bytes;
    if (pending >= m_options.checkpointBytes) {
        m_bytesSinceCheckpoint.store(0, std::memory_order_release);
        persist();
    }
}

void DownloadController::onChunkCompleted(const Chunk& chunk) {
    qCDebug(m_log) << "DownloadController: Chunk" << chunk.index() << "of"
                   << m_id.toString(QUuid::WithoutBraces) << "done";
    persist();
}

void DownloadController::onWorkerExit(Chunk& chunk, const DownloadError& error) {
    chunk.release();

    QMutexLocker locker(&m_mutex);
    if (error.hasError() && error.category != ErrorCategory::Cancelled && !chunk.isCompleted()) {
        m_lastError = error;
    }
    --m_liveWorkers;
    m_workersDone.wakeAll();
}

// ═══════════════════════════════════════════════════════════════════════════════
// State Queries
// ═══════════════════════════════════════════════════════════════════════════════

DownloadStatus DownloadController::status() const {
    QMutexLocker locker(&m_mutex);
    return m_status;
}

DownloadStatusInfo DownloadController::getStatus() const {
    QMutexLocker locker(&m_mutex);
    DownloadStatusInfo info;
    info.id = m_id;
    info.url = m_url;
    info.filePath = m_filePath;
    info.bytesTransferred = m_bytesTransferred.load(std::memory_order_acquire);
    info.totalBytes = m_totalSize;
    info.state = m_status;
    info.errorMessage = m_lastError.message;
    return info;
}

StateSnapshot DownloadController::snapshot() const {
    QMutexLocker locker(&m_mutex);
    return snapshotLocked();
}

ChunkSnapshots DownloadController::chunkSnapshots() const {
    QMutexLocker locker(&m_mutex);
    return snapshotChunks(m_chunks);
}

DownloadError DownloadController::lastError() const {
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

void DownloadController::persist() {
    QMutexLocker locker(&m_mutex);
    if (m_status == DownloadStatus::Cancelled) {
        return;
    }

    // Positions are read before the flush, so the stored snapshot never runs ahead of the disk
    StateSnapshot state = snapshotLocked();

    if (m_status != DownloadStatus::Completed) {
        DownloadError error;
        if (!m_deps.writer.flush(FileNaming::partialPathFor(m_filePath), &error)) {
            qCWarning(m_log) << "DownloadController: Flush before checkpoint failed -" << error.message;
            return;
        }
    }

    m_deps.store.save(state);
}

StateSnapshot DownloadController::snapshotLocked() const {
    StateSnapshot state;
    state.id = m_id;
    state.url = m_url;
    state.filePath = m_filePath;
    state.chunks = snapshotChunks(m_chunks);
    state.totalSize = m_totalSize;
    state.status = m_status;
    state.errorMessage = m_status == DownloadStatus::Error ? m_lastError.message : QString();
    state.createdAt = m_createdAt;

    if (state.chunks.empty()) {
        state.bytesTransferred = m_bytesTransferred.load(std::memory_order_acquire);
    } else {
        for (const auto& chunk : state.chunks) {
            state.bytesTransferred += chunk.current - chunk.start;
        }
    }
    return state;
}

void DownloadController::logTransition(DownloadStatus from, DownloadStatus to) const {
    qCInfo(m_log).noquote() << "DownloadController:" << m_id.toString(QUuid::WithoutBraces)
                            << downloadStatusToString(from) << "->" << downloadStatusToString(to);
}

void DownloadController::announce(DownloadStatus status) {
    emit statusChanged(m_id, status);
}

} // namespace ChunkDM
