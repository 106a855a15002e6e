/**
 * @file ControlToken.cpp
 * @brief Implementation of ControlToken
 */

#include "chunkdm/engine/ControlToken.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

namespace ChunkDM {

void ControlToken::cancel() {
    {
        QMutexLocker locker(&m_mutex);
        m_cancelled.store(true, std::memory_order_release);
        m_paused.store(false, std::memory_order_release);
    }
    m_condition.wakeAll();
}

void ControlToken::pause() {
    QMutexLocker locker(&m_mutex);
    m_paused.store(true, std::memory_order_release);
}

void ControlToken::unpause() {
    {
        QMutexLocker locker(&m_mutex);
        m_paused.store(false, std::memory_order_release);
    }
    m_condition.wakeAll();
}

void ControlToken::reset() {
    QMutexLocker locker(&m_mutex);
    m_cancelled.store(false, std::memory_order_release);
    m_paused.store(false, std::memory_order_release);
}

bool ControlToken::waitWhilePaused(Duration pollInterval) {
    QMutexLocker locker(&m_mutex);
    while (m_paused.load(std::memory_order_acquire) && !isCancelled()) {
        m_condition.wait(&m_mutex, static_cast<unsigned long>(pollInterval.count()));
    }
    return !isCancelled();
}

bool ControlToken::sleepFor(Duration delay) {
    QDeadlineTimer deadline(delay.count());
    QMutexLocker locker(&m_mutex);
    while (!isCancelled() && !deadline.hasExpired()) {
        m_condition.wait(&m_mutex, deadline);
    }
    return !isCancelled();
}

} // namespace ChunkDM
