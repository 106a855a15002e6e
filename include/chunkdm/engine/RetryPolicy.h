/**
 * @file RetryPolicy.h
 * @brief Exponential backoff with jitter for network operations
 */

#pragma once

#include "chunkdm/engine/ControlToken.h"
#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/Types.h"

#include <optional>
#include <type_traits>
#include <QLoggingCategory>

namespace ChunkDM {

/**
 * @class RetryPolicy
 * @brief Runs an operation until it succeeds or the attempt budget runs out
 *
 * The delay after failed attempt k (1-based) is
 * min(2^k * baseDelay * jitter, maxDelay) with jitter uniform in [0.8, 1.2].
 * Errors that are not recoverable (NotFound, Forbidden, ...) stop at once.
 */
class RetryPolicy {
public:
    struct Config {
        int maxAttempts = Constants::DEFAULT_MAX_ATTEMPTS;
        Duration baseDelay = Constants::RETRY_BASE_DELAY;
        Duration maxDelay = Constants::MAX_RETRY_DELAY;
    };

    explicit RetryPolicy(const QLoggingCategory& log = lcRetry());
    RetryPolicy(Config config, const QLoggingCategory& log = lcRetry());

    /// @return Active configuration
    const Config& config() const { return m_config; }

    /**
     * @brief Backoff delay before the attempt following attempt k
     * @param attempt 1-based index of the attempt that failed
     */
    Duration computeDelay(int attempt) const;

    /**
     * @brief Run an operation with retries
     *
     * @param op Callable with signature std::optional<T>(DownloadError*)
     * @param maxAttempts Total attempts including the first, <= 0 for default
     * @param token Optional cancellation token; cuts delays short
     * @param lastError Receives the error of the final failed attempt
     * @return The first successful result, or nullopt
     */
    template <typename Op>
    auto run(Op&& op, int maxAttempts = 0, ControlToken* token = nullptr,
             DownloadError* lastError = nullptr) const
        -> std::invoke_result_t<Op&, DownloadError*>
    {
        if (maxAttempts <= 0) {
            maxAttempts = m_config.maxAttempts;
        }

        DownloadError error;
        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            if (token && token->isCancelled()) {
                error = DownloadError::make(ErrorCategory::Cancelled,
                                            QStringLiteral("Cancelled"));
                break;
            }

            error = DownloadError{};
            auto result = op(&error);
            if (result) {
                return result;
            }

            error.retryCount = attempt - 1;
            if (!error.isRecoverable()) {
                qCDebug(m_log) << "RetryPolicy: Not retrying" << errorCategoryToString(error.category)
                               << error.message;
                break;
            }
            if (attempt == maxAttempts) {
                qCWarning(m_log) << "RetryPolicy: Giving up after" << attempt << "attempts:"
                                 << error.message;
                break;
            }

            Duration delay = computeDelay(attempt);
            qCDebug(m_log) << "RetryPolicy: Attempt" << attempt << "failed:" << error.message
                           << "- retrying in" << delay.count() << "ms";
            if (!sleep(delay, token)) {
                error = DownloadError::make(ErrorCategory::Cancelled, QStringLiteral("Cancelled"));
                break;
            }
        }

        reportError(lastError, error);
        return std::nullopt;
    }

private:
    bool sleep(Duration delay, ControlToken* token) const;

    Config m_config;
    const QLoggingCategory& m_log;
};

} // namespace ChunkDM
