/**
 * @file EngineConfig.cpp
 * @brief Implementation of EngineConfig - INI load and save
 */

#include "chunkdm/engine/EngineConfig.h"

#include <QSettings>

namespace ChunkDM {

namespace {

// Reads an integer key; out-of-range or unparsable values keep the fallback
qint64 readInteger(QSettings& settings, const QString& key, qint64 fallback,
                   qint64 minimum, qint64 maximum, const QLoggingCategory& log) {
    if (!settings.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const qint64 value = settings.value(key).toLongLong(&ok);
    if (!ok || value < minimum || value > maximum) {
        qCWarning(log) << "EngineConfig: Invalid value for" << settings.group() + "/" + key
                       << settings.value(key).toString() << "- using" << fallback;
        return fallback;
    }
    return value;
}

Duration readDuration(QSettings& settings, const QString& key, Duration fallback,
                      qint64 minimum, qint64 maximum, const QLoggingCategory& log) {
    return Duration(readInteger(settings, key, fallback.count(), minimum, maximum, log));
}

QString readPath(QSettings& settings, const QString& key, const QString& fallback) {
    const QString value = settings.value(key, fallback).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

} // anonymous namespace

EngineConfig EngineConfig::load(QSettings& settings, const QLoggingCategory& log) {
    EngineConfig config;

    settings.beginGroup(QStringLiteral("paths"));
    config.downloadsRoot = readPath(settings, QStringLiteral("downloads_root"), config.downloadsRoot);
    config.stateRoot = readPath(settings, QStringLiteral("state_root"), config.stateRoot);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("queue"));
    config.maxConcurrent = static_cast<int>(readInteger(settings, QStringLiteral("max_concurrent"),
        config.maxConcurrent, 1, 64, log));
    config.sweepInterval = readDuration(settings, QStringLiteral("sweep_interval_ms"),
        config.sweepInterval, 100, 3600000, log);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("network"));
    config.connectTimeout = readDuration(settings, QStringLiteral("connect_timeout_ms"),
        config.connectTimeout, 1000, 600000, log);
    config.readTimeout = readDuration(settings, QStringLiteral("read_timeout_ms"),
        config.readTimeout, 1000, 600000, log);
    config.userAgent = readPath(settings, QStringLiteral("user_agent"), config.userAgent);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("retry"));
    config.maxAttempts = static_cast<int>(readInteger(settings, QStringLiteral("max_attempts"),
        config.maxAttempts, 1, 100, log));
    config.retryBaseDelay = readDuration(settings, QStringLiteral("base_delay_ms"),
        config.retryBaseDelay, 0, 600000, log);
    config.retryMaxDelay = readDuration(settings, QStringLiteral("max_delay_ms"),
        config.retryMaxDelay, 0, 3600000, log);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("worker"));
    config.fetchIncrement = readInteger(settings, QStringLiteral("fetch_increment"),
        config.fetchIncrement, Constants::KiB, 256 * Constants::MiB, log);
    config.pausePollInterval = readDuration(settings, QStringLiteral("pause_poll_ms"),
        config.pausePollInterval, 10, 60000, log);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("writer"));
    config.writeBufferCapacity = readInteger(settings, QStringLiteral("buffer_capacity"),
        config.writeBufferCapacity, Constants::KiB, 256 * Constants::MiB, log);
    if (settings.contains(QStringLiteral("flush_ratio"))) {
        bool ok = false;
        const double ratio = settings.value(QStringLiteral("flush_ratio")).toDouble(&ok);
        if (ok && ratio > 0.0 && ratio <= 1.0) {
            config.writeBufferFlushRatio = ratio;
        } else {
            qCWarning(log) << "EngineConfig: Invalid value for writer/flush_ratio"
                           << settings.value(QStringLiteral("flush_ratio")).toString()
                           << "- using" << config.writeBufferFlushRatio;
        }
    }
    settings.endGroup();

    settings.beginGroup(QStringLiteral("persistence"));
    config.checkpointBytes = readInteger(settings, QStringLiteral("checkpoint_bytes"),
        config.checkpointBytes, Constants::KiB, 1024 * Constants::MiB, log);
    settings.endGroup();

    if (config.retryMaxDelay < config.retryBaseDelay) {
        qCWarning(log) << "EngineConfig: retry/max_delay_ms below base delay, raising it to"
                       << config.retryBaseDelay.count();
        config.retryMaxDelay = config.retryBaseDelay;
    }

    return config;
}

void EngineConfig::save(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("paths"));
    settings.setValue(QStringLiteral("downloads_root"), downloadsRoot);
    settings.setValue(QStringLiteral("state_root"), stateRoot);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("queue"));
    settings.setValue(QStringLiteral("max_concurrent"), maxConcurrent);
    settings.setValue(QStringLiteral("sweep_interval_ms"), static_cast<qint64>(sweepInterval.count()));
    settings.endGroup();

    settings.beginGroup(QStringLiteral("network"));
    settings.setValue(QStringLiteral("connect_timeout_ms"), static_cast<qint64>(connectTimeout.count()));
    settings.setValue(QStringLiteral("read_timeout_ms"), static_cast<qint64>(readTimeout.count()));
    settings.setValue(QStringLiteral("user_agent"), userAgent);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("retry"));
    settings.setValue(QStringLiteral("max_attempts"), maxAttempts);
    settings.setValue(QStringLiteral("base_delay_ms"), static_cast<qint64>(retryBaseDelay.count()));
    settings.setValue(QStringLiteral("max_delay_ms"), static_cast<qint64>(retryMaxDelay.count()));
    settings.endGroup();

    settings.beginGroup(QStringLiteral("worker"));
    settings.setValue(QStringLiteral("fetch_increment"), static_cast<qint64>(fetchIncrement));
    settings.setValue(QStringLiteral("pause_poll_ms"), static_cast<qint64>(pausePollInterval.count()));
    settings.endGroup();

    settings.beginGroup(QStringLiteral("writer"));
    settings.setValue(QStringLiteral("buffer_capacity"), static_cast<qint64>(writeBufferCapacity));
    settings.setValue(QStringLiteral("flush_ratio"), writeBufferFlushRatio);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("persistence"));
    settings.setValue(QStringLiteral("checkpoint_bytes"), static_cast<qint64>(checkpointBytes));
    settings.endGroup();

    settings.sync();
}

} // namespace ChunkDM
