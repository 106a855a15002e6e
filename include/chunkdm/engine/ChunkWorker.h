/**
 * @file ChunkWorker.h
 * @brief Drives one chunk to completion
 */

#pragma once

#include "chunkdm/engine/Types.h"

#include <QLoggingCategory>
#include <QRunnable>

namespace ChunkDM {

class Chunk;
class DownloadController;

/**
 * @class ChunkWorker
 * @brief Runnable that fetches one chunk in bounded increments
 *
 * Loop: park while paused; fetch min(increment, remaining) bytes at the
 * chunk's current position through the retry policy; write them at that
 * offset; advance the chunk and the download's counter. A chunk whose
 * retries run out is left incomplete and the worker exits without touching
 * sibling chunks.
 *
 * Chunks with an unknown end finish at the first short read. Without range
 * support the whole remaining span is fetched in one request.
 */
class ChunkWorker : public QRunnable {
public:
    /**
     * @brief Constructor
     * @param controller Owning controller; must outlive the worker
     * @param chunk Chunk already claimed for this worker
     */
    ChunkWorker(DownloadController* controller, Chunk& chunk);

    void run() override;

private:
    bool fetchNext(DownloadError* error);

    DownloadController* m_controller;
    Chunk& m_chunk;
    const QLoggingCategory& m_log;
};

} // namespace ChunkDM
