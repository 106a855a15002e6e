/**
 * @file EngineConfig.h
 * @brief Tunable engine settings and their INI representation
 */

#pragma once

#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"

#include <QString>

class QSettings;

namespace ChunkDM {

/**
 * @struct EngineConfig
 * @brief Every tunable of the engine, with defaults
 *
 * INI layout:
 * @code
 * [paths]        downloads_root, state_root
 * [queue]        max_concurrent, sweep_interval_ms
 * [network]      connect_timeout_ms, read_timeout_ms, user_agent
 * [retry]        max_attempts, base_delay_ms, max_delay_ms
 * [worker]       fetch_increment, pause_poll_ms
 * [writer]       buffer_capacity, flush_ratio
 * [persistence]  checkpoint_bytes
 * @endcode
 */
struct EngineConfig {
    // Paths
    QString downloadsRoot = QStringLiteral("downloads");
    QString stateRoot = QStringLiteral("download_states");

    // Queue
    int maxConcurrent = Constants::DEFAULT_MAX_CONCURRENT;
    Duration sweepInterval = Constants::ADMISSION_SWEEP_INTERVAL;

    // Network
    Duration connectTimeout = Constants::CONNECT_TIMEOUT;
    Duration readTimeout = Constants::READ_TIMEOUT;
    QString userAgent = QStringLiteral("ChunkDM/1.0");

    // Retry
    int maxAttempts = Constants::DEFAULT_MAX_ATTEMPTS;
    Duration retryBaseDelay = Constants::RETRY_BASE_DELAY;
    Duration retryMaxDelay = Constants::MAX_RETRY_DELAY;

    // Worker
    ByteCount fetchIncrement = Constants::FETCH_INCREMENT;
    Duration pausePollInterval = Constants::PAUSE_POLL_INTERVAL;

    // Writer
    ByteCount writeBufferCapacity = Constants::WRITE_BUFFER_CAPACITY;
    double writeBufferFlushRatio = Constants::WRITE_BUFFER_FLUSH_RATIO;

    // Persistence
    ByteCount checkpointBytes = Constants::CHECKPOINT_BYTES;

    /**
     * @brief Read settings, keeping defaults for missing keys
     *
     * A value that does not parse or is out of range is logged and replaced
     * by its default.
     */
    static EngineConfig load(QSettings& settings, const QLoggingCategory& log = lcEngine());

    /**
     * @brief Write every setting
     */
    void save(QSettings& settings) const;
};

} // namespace ChunkDM
