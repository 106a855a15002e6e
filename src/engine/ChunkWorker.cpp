/**
 * @file ChunkWorker.cpp
 * @brief Implementation of ChunkWorker - fetches one chunk in increments
 */

#include "chunkdm/engine/ChunkWorker.h"
#include "chunkdm/engine/Chunk.h"
#include "chunkdm/engine/DownloadController.h"
#include "chunkdm/engine/FileNaming.h"
#include "chunkdm/engine/RangeClient.h"
#include "chunkdm/engine/RetryPolicy.h"
#include "chunkdm/engine/SegmentedFileWriter.h"

#include <QMutexLocker>
#include <algorithm>

namespace ChunkDM {

ChunkWorker::ChunkWorker(DownloadController* controller, Chunk& chunk)
    : m_controller(controller)
    , m_chunk(chunk)
    , m_log(lcWorker())
{
    setAutoDelete(true);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Main Worker Loop
// ═══════════════════════════════════════════════════════════════════════════════

void ChunkWorker::run() {
    ControlToken& token = m_controller->m_token;
    DownloadError error;

    qCDebug(m_log) << "ChunkWorker: Starting chunk" << m_chunk.index()
                   << "of" << m_controller->id().toString(QUuid::WithoutBraces)
                   << "at" << m_chunk.current();

    while (!m_chunk.isCompleted() && !token.isCancelled()) {
        if (token.isPaused()) {
            if (!token.waitWhilePaused(m_controller->m_options.pausePollInterval)) {
                break;
            }
            continue;
        }

        if (!fetchNext(&error)) {
            break;
        }
    }

    if (m_chunk.isCompleted()) {
        qCDebug(m_log) << "ChunkWorker: Chunk" << m_chunk.index() << "completed";
        m_controller->onChunkCompleted(m_chunk);
    }

    m_controller->onWorkerExit(m_chunk, error);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Fetch Increment
// ═══════════════════════════════════════════════════════════════════════════════

bool ChunkWorker::fetchNext(DownloadError* error) {
    bool supportsRanges = true;
    QString path;
    {
        QMutexLocker locker(&m_controller->m_mutex);
        supportsRanges = m_controller->m_supportsRanges;
        path = FileNaming::partialPathFor(m_controller->m_filePath);
    }

    const auto& options = m_controller->m_options;
    const auto& deps = m_controller->m_deps;
    ControlToken& token = m_controller->m_token;

    const ByteOffset start = m_chunk.current();
    const bool openEnded = m_chunk.isUnbounded();

    // Without range support every request restarts at byte 0, so take it all at once
    const ByteOffset requestEnd = supportsRanges
        ? std::min(m_chunk.end(), start + options.fetchIncrement - 1)
        : m_chunk.end();
    const ByteCount requested = requestEnd - start + 1;

    auto data = deps.retry.run([&](DownloadError* attemptError) -> std::optional<QByteArray> {
        auto bytes = deps.client.fetchRange(m_controller->url(), start, requestEnd,
                                            attemptError, &token);
        if (bytes && bytes->isEmpty() && !openEnded) {
            *attemptError = DownloadError::make(ErrorCategory::Network,
                QStringLiteral("Empty response for bytes %1-%2").arg(start).arg(requestEnd));
            return std::nullopt;
        }
        return bytes;
    }, options.maxAttempts, &token, error);

    if (!data) {
        if (!token.isCancelled()) {
            qCWarning(m_log) << "ChunkWorker: Chunk" << m_chunk.index() << "stopped at offset"
                             << start << "-" << error->message;
        }
        return false;
    }

    if (!data->isEmpty()) {
        if (!deps.writer.write(path, start, *data, error)) {
            qCWarning(m_log) << "ChunkWorker: Chunk" << m_chunk.index() << "write at" << start
                             << "failed -" << error->message;
            return false;
        }

        m_chunk.advanceBy(data->size());
        m_controller->onBytesWritten(data->size());
    }

    if (openEnded && data->size() < requested) {
        m_chunk.closeAtCurrent();
    }

    return true;
}

} // namespace ChunkDM
