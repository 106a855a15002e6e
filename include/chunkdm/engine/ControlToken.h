/**
 * @file ControlToken.h
 * @brief Cooperative pause/cancel signal shared by a download's workers
 */

#pragma once

#include "chunkdm/engine/Types.h"

#include <atomic>
#include <QMutex>
#include <QWaitCondition>

namespace ChunkDM {

/**
 * @class ControlToken
 * @brief Cancellation token plus pause gate for one download
 *
 * Workers check the token between fetch increments and park in
 * waitWhilePaused() while the download is paused. Cancelling also releases
 * parked workers so they can observe it. Worst-case latency is one
 * in-flight fetch plus one poll interval.
 */
class ControlToken {
public:
    ControlToken() = default;

    ControlToken(const ControlToken&) = delete;
    ControlToken& operator=(const ControlToken&) = delete;

    /// @return True once cancel() was called
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    /// @return True while paused and not cancelled
    bool isPaused() const { return m_paused.load(std::memory_order_acquire); }

    /// @brief Request cancellation and wake every parked worker
    void cancel();

    /// @brief Raise the pause gate
    void pause();

    /// @brief Lower the pause gate and wake parked workers
    void unpause();

    /// @brief Clear both flags before a new run
    void reset();

    /**
     * @brief Block while paused
     * @param pollInterval Upper bound between flag checks
     * @return False if the download was cancelled
     */
    bool waitWhilePaused(Duration pollInterval = Constants::PAUSE_POLL_INTERVAL);

    /**
     * @brief Sleep unless cancelled first
     * @return False if cancellation cut the sleep short
     */
    bool sleepFor(Duration delay);

private:
    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_paused{false};

    QMutex m_mutex;
    QWaitCondition m_condition;
};

} // namespace ChunkDM
