/**
 * @file FileNaming.cpp
 * @brief Implementation of file naming helpers
 */

#include "chunkdm/engine/FileNaming.h"
#include "chunkdm/engine/Types.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QUrl>

namespace ChunkDM {
namespace FileNaming {

QString partialPathFor(const QString& finalPath) {
    return finalPath + QLatin1String(Constants::PARTIAL_SUFFIX);
}

QString sidecarPathFor(const QString& finalPath) {
    return finalPath + QLatin1String(Constants::SIDECAR_SUFFIX);
}

QString finalPathForPartial(const QString& partialPath) {
    const QLatin1String suffix(Constants::PARTIAL_SUFFIX);
    if (!partialPath.endsWith(suffix)) {
        return {};
    }
    return partialPath.left(partialPath.size() - suffix.size());
}

QString fileNameForUrl(const QString& url) {
    QString name = QUrl(url).fileName();
    if (name.isEmpty()) {
        name = QStringLiteral("download_%1").arg(QDateTime::currentMSecsSinceEpoch());
    }
    return name;
}

QString uniquePath(const QString& directory, const QString& fileName,
                   const std::function<bool(const QString&)>& isTaken) {
    QDir dir(directory);
    auto inUse = [&](const QString& candidate) {
        return QFileInfo::exists(candidate) ||
               QFileInfo::exists(partialPathFor(candidate)) ||
               (isTaken && isTaken(candidate));
    };

    QString candidate = dir.absoluteFilePath(fileName);
    if (!inUse(candidate)) {
        return candidate;
    }

    const QFileInfo info(fileName);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();

    for (int n = 1;; ++n) {
        QString name = suffix.isEmpty()
            ? QStringLiteral("%1 (%2)").arg(base).arg(n)
            : QStringLiteral("%1 (%2).%3").arg(base).arg(n).arg(suffix);
        candidate = dir.absoluteFilePath(name);
        if (!inUse(candidate)) {
            return candidate;
        }
    }
}

bool writeSidecar(const QString& finalPath, const QString& url) {
    QDir().mkpath(QFileInfo(finalPath).absolutePath());

    QSaveFile file(sidecarPathFor(finalPath));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return false;
    }
    file.write(url.toUtf8());
    file.write("\n");
    return file.commit();
}

std::optional<QString> readSidecarUrl(const QString& sidecarPath) {
    QFile file(sidecarPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }

    QString url = QString::fromUtf8(file.readLine()).trimmed();
    if (url.isEmpty()) {
        return std::nullopt;
    }
    return url;
}

} // namespace FileNaming
} // namespace ChunkDM
