/**
 * @file Types.h
 * @brief Core type definitions and enumerations for the ChunkDM engine
 *
 * This header defines fundamental types, enumerations, and constants used
 * throughout the download engine.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace ChunkDM {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using TaskId = QUuid;
using ByteOffset = int64_t;
using ByteCount = int64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════════════════════════
// Download State Machine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Download lifecycle states
 *
 * State transitions:
 *   Queued → Downloading → Completed
 *               ↓    ↑  ↘
 *             Paused ┘   Error
 *   any non-terminal state → Cancelled
 *
 * Interrupted is only produced by crash recovery and behaves like Paused.
 * Values are persisted; never renumber them.
 */
enum class DownloadStatus : uint8_t {
    Queued = 0,      ///< Waiting for an admission slot
    Downloading = 1, ///< Workers are fetching chunks
    Paused = 2,      ///< Paused by caller, resumable
    Completed = 3,   ///< Every chunk finished
    Error = 4,       ///< Probe failed or chunks stalled
    Cancelled = 5,   ///< Cancelled by caller
    Interrupted = 6  ///< Recovered from an orphaned partial file
};

/// @return True for states a download never leaves on its own
inline bool isTerminal(DownloadStatus status) {
    return status == DownloadStatus::Completed ||
           status == DownloadStatus::Error ||
           status == DownloadStatus::Cancelled;
}

/**
 * @brief Error categories for download failures
 */
enum class ErrorCategory : uint8_t {
    None,
    InvalidInput,      ///< Malformed URL or argument
    Network,           ///< Connection issues
    Timeout,           ///< Operation timed out
    ServerError,       ///< HTTP 5xx errors
    NotFound,          ///< HTTP 404 or unknown download id
    Forbidden,         ///< HTTP 401/403
    ClientError,       ///< Other HTTP 4xx errors
    FileSystem,        ///< Disk write or lock errors
    StateCorruption,   ///< Unreadable persisted snapshot
    ConcurrencyLimit,  ///< Rejected concurrency bound
    Cancelled,         ///< Cancelled by caller
    Unknown
};

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Constants {
    constexpr ByteCount KiB = 1024;
    constexpr ByteCount MiB = 1024 * KiB;

    // Chunk planning
    constexpr int MAX_CHUNKS = 8;
    constexpr ByteCount SMALL_RESOURCE_LIMIT = 10 * MiB;
    constexpr ByteCount MEDIUM_RESOURCE_LIMIT = 100 * MiB;
    constexpr ByteOffset UNBOUNDED_END = INT64_MAX - 1;

    // Workers
    constexpr ByteCount FETCH_INCREMENT = 1 * MiB;
    constexpr Duration PAUSE_POLL_INTERVAL{500};
    constexpr ByteCount CHECKPOINT_BYTES = 8 * MiB;

    // Queue
    constexpr int DEFAULT_MAX_CONCURRENT = 3;
    constexpr Duration ADMISSION_SWEEP_INTERVAL{5000};

    // Retry configuration
    constexpr int DEFAULT_MAX_ATTEMPTS = 4;                       // one try + 3 retries
    constexpr Duration RETRY_BASE_DELAY{1000};
    constexpr Duration MAX_RETRY_DELAY{60000};
    constexpr double RETRY_JITTER_MIN = 0.8;
    constexpr double RETRY_JITTER_MAX = 1.2;

    // Network timeouts
    constexpr Duration CONNECT_TIMEOUT{15000};
    constexpr Duration READ_TIMEOUT{30000};

    // Segmented writer
    constexpr ByteCount WRITE_BUFFER_CAPACITY = 1 * MiB;
    constexpr double WRITE_BUFFER_FLUSH_RATIO = 0.9;

    // File naming
    inline constexpr const char* PARTIAL_SUFFIX = ".part";
    inline constexpr const char* SIDECAR_SUFFIX = ".meta";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Server Capabilities
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Information gathered from a metadata probe (HEAD request)
 */
struct ServerCapabilities {
    ByteCount contentLength = -1;       ///< Total size (-1 if unknown)
    QString contentType;                ///< MIME type
    bool supportsRanges = false;        ///< Accept-Ranges is not "none"
    QString fileName;                   ///< From Content-Disposition
    int httpStatusCode = 0;             ///< Response status
};

// ═══════════════════════════════════════════════════════════════════════════════
// Error Information
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Detailed error information for failures
 */
struct DownloadError {
    ErrorCategory category = ErrorCategory::None;
    int errorCode = 0;                  ///< HTTP status or library specific code
    QString message;                    ///< Human-readable description
    QString details;                    ///< Technical details for debugging
    Timestamp timestamp;                ///< When error occurred
    int retryCount = 0;                 ///< Number of retries attempted

    bool isRecoverable() const {
        return category == ErrorCategory::Network ||
               category == ErrorCategory::Timeout ||
               category == ErrorCategory::ServerError;
    }

    bool hasError() const { return category != ErrorCategory::None; }

    static DownloadError make(ErrorCategory category, const QString& message, int code = 0) {
        DownloadError error;
        error.category = category;
        error.errorCode = code;
        error.message = message;
        error.timestamp = std::chrono::system_clock::now();
        return error;
    }
};

/**
 * @brief Store an error into an optional out-parameter
 */
inline void reportError(DownloadError* out, const DownloadError& error) {
    if (out) {
        *out = error;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Status Snapshot
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Immutable view of a download returned by status queries
 */
struct DownloadStatusInfo {
    TaskId id;
    QString url;
    QString filePath;
    ByteCount bytesTransferred = 0;
    ByteCount totalBytes = -1;
    DownloadStatus state = DownloadStatus::Queued;
    QString errorMessage;

    /// @return Fraction in [0, 1], 0 while the size is unknown
    double progress() const {
        return totalBytes > 0 ? static_cast<double>(bytesTransferred) / totalBytes : 0.0;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Convert DownloadStatus to string for logging/display
 */
inline QString downloadStatusToString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Queued:      return QStringLiteral("Queued");
        case DownloadStatus::Downloading: return QStringLiteral("Downloading");
        case DownloadStatus::Paused:      return QStringLiteral("Paused");
        case DownloadStatus::Completed:   return QStringLiteral("Completed");
        case DownloadStatus::Error:       return QStringLiteral("Error");
        case DownloadStatus::Cancelled:   return QStringLiteral("Cancelled");
        case DownloadStatus::Interrupted: return QStringLiteral("Interrupted");
        default:                          return QStringLiteral("Unknown");
    }
}

/**
 * @brief Decode a persisted status value
 * @return The status, or nullopt if the value is out of range
 */
inline std::optional<DownloadStatus> downloadStatusFromInt(int value) {
    if (value < static_cast<int>(DownloadStatus::Queued) ||
        value > static_cast<int>(DownloadStatus::Interrupted)) {
        return std::nullopt;
    }
    return static_cast<DownloadStatus>(value);
}

/**
 * @brief Convert ErrorCategory to string
 */
inline QString errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:             return QStringLiteral("None");
        case ErrorCategory::InvalidInput:     return QStringLiteral("InvalidInput");
        case ErrorCategory::Network:          return QStringLiteral("Network");
        case ErrorCategory::Timeout:          return QStringLiteral("Timeout");
        case ErrorCategory::ServerError:      return QStringLiteral("ServerError");
        case ErrorCategory::NotFound:         return QStringLiteral("NotFound");
        case ErrorCategory::Forbidden:        return QStringLiteral("Forbidden");
        case ErrorCategory::ClientError:      return QStringLiteral("ClientError");
        case ErrorCategory::FileSystem:       return QStringLiteral("FileSystem");
        case ErrorCategory::StateCorruption:  return QStringLiteral("StateCorruption");
        case ErrorCategory::ConcurrencyLimit: return QStringLiteral("ConcurrencyLimit");
        case ErrorCategory::Cancelled:        return QStringLiteral("Cancelled");
        default:                              return QStringLiteral("Unknown");
    }
}

/**
 * @brief Format byte count for display (e.g., "1.5 GB")
 */
inline QString formatByteSize(ByteCount bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    if (bytes < 0) return QStringLiteral("Unknown");
    if (bytes < KB) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < MB) return QStringLiteral("%1 KB").arg(bytes / KB, 0, 'f', 1);
    if (bytes < GB) return QStringLiteral("%1 MB").arg(bytes / MB, 0, 'f', 2);
    if (bytes < TB) return QStringLiteral("%1 GB").arg(bytes / GB, 0, 'f', 2);
    return QStringLiteral("%1 TB").arg(bytes / TB, 0, 'f', 2);
}

/**
 * @brief Format progress for display (e.g., "42.5%")
 */
inline QString formatProgress(const DownloadStatusInfo& info) {
    if (info.totalBytes <= 0) {
        return QStringLiteral("--");
    }
    return QStringLiteral("%1%").arg(info.progress() * 100.0, 0, 'f', 1);
}

} // namespace ChunkDM

// Register types with Qt meta-object system
Q_DECLARE_METATYPE(ChunkDM::DownloadStatus)
Q_DECLARE_METATYPE(ChunkDM::DownloadStatusInfo)
