/**
 * @file RetryPolicy.cpp
 * @brief Implementation of RetryPolicy
 */

#include "chunkdm/engine/RetryPolicy.h"

#include <QRandomGenerator>
#include <QThread>
#include <algorithm>

namespace ChunkDM {

RetryPolicy::RetryPolicy(const QLoggingCategory& log)
    : RetryPolicy(Config{}, log)
{
}

RetryPolicy::RetryPolicy(Config config, const QLoggingCategory& log)
    : m_config(config)
    , m_log(log)
{
}

Duration RetryPolicy::computeDelay(int attempt) const {
    const int exponent = std::clamp(attempt, 0, 30);
    const double jitter = Constants::RETRY_JITTER_MIN +
        QRandomGenerator::global()->generateDouble() *
        (Constants::RETRY_JITTER_MAX - Constants::RETRY_JITTER_MIN);

    const double raw = static_cast<double>(int64_t{1} << exponent) *
                       static_cast<double>(m_config.baseDelay.count()) * jitter;
    const double capped = std::min(raw, static_cast<double>(m_config.maxDelay.count()));

    return Duration{static_cast<int64_t>(capped)};
}

bool RetryPolicy::sleep(Duration delay, ControlToken* token) const {
    if (token) {
        return token->sleepFor(delay);
    }
    QThread::msleep(static_cast<unsigned long>(delay.count()));
    return true;
}

} // namespace ChunkDM
