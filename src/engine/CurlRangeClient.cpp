/**
 * @file CurlRangeClient.cpp
 * @brief Implementation of CurlRangeClient - probes and ranged fetches using libcurl
 */

#include "chunkdm/engine/CurlRangeClient.h"
#include "chunkdm/engine/ControlToken.h"

#include <curl/curl.h>
#include <QRegularExpression>
#include <QUrl>
#include <algorithm>
#include <memory>

namespace ChunkDM {

namespace {

// ═══════════════════════════════════════════════════════════════════════════════
// libcurl global state
// ═══════════════════════════════════════════════════════════════════════════════

class CurlGlobalInit {
public:
    static CurlGlobalInit& instance() {
        static CurlGlobalInit init;
        return init;
    }

    ~CurlGlobalInit() {
        if (m_valid) {
            curl_global_cleanup();
        }
    }

    CurlGlobalInit(const CurlGlobalInit&) = delete;
    CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;

    bool isValid() const { return m_valid; }

private:
    CurlGlobalInit() {
        m_valid = curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK;
    }

    bool m_valid = false;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle makeHandle() {
    return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
}

bool isHttpUrl(const QString& url) {
    return url.startsWith(QStringLiteral("http"), Qt::CaseInsensitive);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer contexts
// ═══════════════════════════════════════════════════════════════════════════════

struct ProbeContext {
    QString rawHeaders;
};

struct FetchContext {
    CURL* curl = nullptr;
    bool http = true;
    ByteOffset start = 0;
    ByteCount wanted = 0;          ///< -1 while the range is open-ended
    ByteOffset streamPos = -1;     ///< Absolute offset of the next received byte
    bool failedStatus = false;
    bool complete = false;
    QByteArray body;
    const ControlToken* token = nullptr;
};

size_t probeHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ProbeContext*>(userdata);
    size_t totalSize = size * nitems;
    ctx->rawHeaders += QString::fromUtf8(buffer, static_cast<qsizetype>(totalSize));
    return totalSize;
}

size_t fetchWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    const size_t totalSize = size * nmemb;

    if (ctx->streamPos < 0) {
        long httpCode = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &httpCode);
        ctx->failedStatus = ctx->http && httpCode >= 400;
        // a plain 200 ignores the Range header and starts at byte 0
        ctx->streamPos = (!ctx->http || httpCode == 206) ? ctx->start : 0;
    }

    if (ctx->failedStatus) {
        return totalSize;  // discard error page
    }

    const ByteOffset blockStart = ctx->streamPos;
    ctx->streamPos += static_cast<ByteOffset>(totalSize);

    ByteOffset from = std::max<ByteOffset>(blockStart, ctx->start);
    ByteOffset to = ctx->streamPos;
    if (ctx->wanted >= 0) {
        to = std::min<ByteOffset>(to, ctx->start + ctx->wanted);
    }

    if (to > from) {
        ctx->body.append(ptr + (from - blockStart), static_cast<qsizetype>(to - from));
    }

    if (ctx->wanted >= 0 && ctx->body.size() >= ctx->wanted) {
        ctx->complete = true;
        return 0;  // stop the transfer, everything requested has arrived
    }

    return totalSize;
}

int fetchProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<FetchContext*>(clientp);
    if (ctx->token && ctx->token->isCancelled()) {
        return 1;  // Non-zero aborts transfer
    }
    return 0;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

CurlRangeClient::CurlRangeClient(const QLoggingCategory& log)
    : CurlRangeClient(Options{}, log)
{
}

CurlRangeClient::CurlRangeClient(Options options, const QLoggingCategory& log)
    : m_options(std::move(options))
    , m_log(log)
{
    if (!CurlGlobalInit::instance().isValid()) {
        qCCritical(m_log) << "CurlRangeClient: curl_global_init failed";
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Probe
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<ServerCapabilities> CurlRangeClient::probe(const QString& url, DownloadError* error) {
    CurlHandle curl = makeHandle();
    if (!curl) {
        reportError(error, DownloadError::make(ErrorCategory::Unknown,
                                               QStringLiteral("Failed to initialize curl")));
        return std::nullopt;
    }

    qCDebug(m_log) << "CurlRangeClient: Probing" << url;

    ProbeContext ctx;
    const QByteArray urlBytes = url.toUtf8();
    const QByteArray agent = m_options.userAgent.toUtf8();

    curl_easy_setopt(curl.get(), CURLOPT_URL, urlBytes.constData());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);  // HEAD request
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(m_options.connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(m_options.readTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, probeHeaderCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, agent.constData());

    CURLcode result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        DownloadError err = errorForCurlCode(result);
        qCWarning(m_log) << "CurlRangeClient: Probe failed for" << url << err.message;
        reportError(error, err);
        return std::nullopt;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    if (isHttpUrl(url) && httpCode >= 400) {
        DownloadError err = DownloadError::make(categoryForHttpStatus(httpCode),
                                                QStringLiteral("HTTP error %1").arg(httpCode),
                                                static_cast<int>(httpCode));
        qCWarning(m_log) << "CurlRangeClient: Probe of" << url << "returned" << httpCode;
        reportError(error, err);
        return std::nullopt;
    }

    ServerCapabilities caps;
    caps.httpStatusCode = static_cast<int>(httpCode);

    curl_off_t contentLength = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    caps.contentLength = contentLength;

    char* contentType = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        caps.contentType = QString::fromUtf8(contentType);
    }

    // FTP servers resume via REST without advertising it
    caps.supportsRanges = isHttpUrl(url) ? acceptsRangesFromHeaders(ctx.rawHeaders) : true;
    caps.fileName = fileNameFromHeaders(ctx.rawHeaders);
    if (caps.fileName.isEmpty()) {
        caps.fileName = QUrl(url).fileName();
    }

    qCDebug(m_log) << "CurlRangeClient: Probe completed. Size:" << caps.contentLength
                   << "Ranges:" << caps.supportsRanges
                   << "Type:" << caps.contentType;

    return caps;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Ranged Fetch
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<QByteArray> CurlRangeClient::fetchRange(const QString& url,
                                                      ByteOffset start, ByteOffset end,
                                                      DownloadError* error,
                                                      const ControlToken* token) {
    CurlHandle curl = makeHandle();
    if (!curl) {
        reportError(error, DownloadError::make(ErrorCategory::Unknown,
                                               QStringLiteral("Failed to initialize curl")));
        return std::nullopt;
    }

    const bool openEnded = end >= Constants::UNBOUNDED_END;

    FetchContext ctx;
    ctx.curl = curl.get();
    ctx.http = isHttpUrl(url);
    ctx.start = start;
    ctx.wanted = openEnded ? -1 : end - start + 1;
    ctx.token = token;

    const QByteArray urlBytes = url.toUtf8();
    const QByteArray agent = m_options.userAgent.toUtf8();
    const QByteArray range = openEnded
        ? QByteArray::number(start) + '-'
        : QByteArray::number(start) + '-' + QByteArray::number(end);

    curl_easy_setopt(curl.get(), CURLOPT_URL, urlBytes.constData());
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.constData());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(m_options.connectTimeout.count()));

    // Abort when nothing arrives for the read timeout
    const long stallSeconds = std::max<long>(1, static_cast<long>(m_options.readTimeout.count() / 1000));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, stallSeconds);

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, fetchWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, fetchProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, agent.constData());

    CURLcode result = curl_easy_perform(curl.get());

    if (result == CURLE_WRITE_ERROR && ctx.complete) {
        result = CURLE_OK;
    }

    if (result == CURLE_ABORTED_BY_CALLBACK && token && token->isCancelled()) {
        reportError(error, DownloadError::make(ErrorCategory::Cancelled,
                                               QStringLiteral("Cancelled")));
        return std::nullopt;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    if (ctx.http && httpCode == 416) {
        // Nothing left past start: the open-ended stream is exhausted
        qCDebug(m_log) << "CurlRangeClient: Range" << range << "not satisfiable for" << url;
        return QByteArray{};
    }

    if (ctx.http && httpCode >= 400) {
        DownloadError err = DownloadError::make(categoryForHttpStatus(httpCode),
                                                QStringLiteral("HTTP error %1").arg(httpCode),
                                                static_cast<int>(httpCode));
        reportError(error, err);
        return std::nullopt;
    }

    if (result != CURLE_OK) {
        DownloadError err = errorForCurlCode(result);
        qCDebug(m_log) << "CurlRangeClient: Fetch" << range << "failed:" << err.message;
        reportError(error, err);
        return std::nullopt;
    }

    if (ctx.wanted >= 0 && ctx.body.size() < ctx.wanted) {
        qCWarning(m_log) << "CurlRangeClient: Short read for" << url << "range" << range
                         << "expected:" << ctx.wanted << "got:" << ctx.body.size();
    }

    return ctx.body;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

DownloadError CurlRangeClient::errorForCurlCode(int code) {
    DownloadError error;
    error.errorCode = code;
    error.timestamp = std::chrono::system_clock::now();
    error.details = QString::fromUtf8(curl_easy_strerror(static_cast<CURLcode>(code)));

    switch (static_cast<CURLcode>(code)) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_WEIRD_SERVER_REPLY:
            error.category = ErrorCategory::Network;
            error.message = QStringLiteral("Network error: %1").arg(error.details);
            break;

        case CURLE_OPERATION_TIMEDOUT:
            error.category = ErrorCategory::Timeout;
            error.message = QStringLiteral("Timed out: %1").arg(error.details);
            break;

        case CURLE_REMOTE_FILE_NOT_FOUND:
            error.category = ErrorCategory::NotFound;
            error.message = QStringLiteral("Remote file not found");
            break;

        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
            error.category = ErrorCategory::Forbidden;
            error.message = QStringLiteral("Access denied: %1").arg(error.details);
            break;

        default:
            error.category = ErrorCategory::Unknown;
            error.message = QStringLiteral("Transfer error: %1").arg(error.details);
            break;
    }

    return error;
}

ErrorCategory CurlRangeClient::categoryForHttpStatus(long httpCode) {
    if (httpCode == 404 || httpCode == 410) {
        return ErrorCategory::NotFound;
    }
    if (httpCode == 401 || httpCode == 403) {
        return ErrorCategory::Forbidden;
    }
    if (httpCode == 408) {
        return ErrorCategory::Timeout;
    }
    if (httpCode == 429 || httpCode >= 500) {
        return ErrorCategory::ServerError;
    }
    return ErrorCategory::ClientError;
}

QString CurlRangeClient::fileNameFromHeaders(const QString& rawHeaders) {
    static const QRegularExpression contentDispositionRegex(
        QStringLiteral("Content-Disposition:.*filename\\*?=(?:UTF-8'')?['\"]?([^'\"\\r\\n;]+)"),
        QRegularExpression::CaseInsensitiveOption
    );

    auto match = contentDispositionRegex.match(rawHeaders);
    if (!match.hasMatch()) {
        return {};
    }

    return QUrl::fromPercentEncoding(match.captured(1).trimmed().toUtf8());
}

bool CurlRangeClient::acceptsRangesFromHeaders(const QString& rawHeaders) {
    static const QRegularExpression acceptRangesRegex(
        QStringLiteral("^Accept-Ranges:\\s*([^\\r\\n]*)"),
        QRegularExpression::CaseInsensitiveOption | QRegularExpression::MultilineOption
    );

    // With redirects the last response wins
    QString value;
    bool present = false;
    auto it = acceptRangesRegex.globalMatch(rawHeaders);
    while (it.hasNext()) {
        value = it.next().captured(1).trimmed();
        present = true;
    }

    return present && value.compare(QStringLiteral("none"), Qt::CaseInsensitive) != 0;
}

} // namespace ChunkDM
