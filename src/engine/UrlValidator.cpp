/**
 * @file UrlValidator.cpp
 * @brief Implementation of UrlValidator
 */

#include "chunkdm/engine/UrlValidator.h"

#include <QStringList>
#include <QUrl>

namespace ChunkDM {
namespace UrlValidator {

bool isValid(const QString& url, QString* reason) {
    auto reject = [reason](const QString& why) {
        if (reason) {
            *reason = why;
        }
        return false;
    };

    if (url.trimmed().isEmpty()) {
        return reject(QStringLiteral("URL is empty"));
    }

    const QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid()) {
        return reject(QStringLiteral("Malformed URL: %1").arg(parsed.errorString()));
    }

    static const QStringList schemes{QStringLiteral("http"), QStringLiteral("https"),
                                     QStringLiteral("ftp")};
    if (!schemes.contains(parsed.scheme().toLower())) {
        return reject(QStringLiteral("Unsupported scheme: '%1'").arg(parsed.scheme()));
    }

    if (parsed.host().isEmpty()) {
        return reject(QStringLiteral("URL has no host"));
    }

    return true;
}

} // namespace UrlValidator
} // namespace ChunkDM
