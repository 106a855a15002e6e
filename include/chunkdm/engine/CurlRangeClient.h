/**
 * @file CurlRangeClient.h
 * @brief libcurl implementation of RangeClient
 */

#pragma once

#include "chunkdm/engine/Logging.h"
#include "chunkdm/engine/RangeClient.h"

#include <QLoggingCategory>

namespace ChunkDM {

/**
 * @class CurlRangeClient
 * @brief Performs HEAD probes and ranged GETs with one easy handle per call
 *
 * Each call creates its own easy handle, so the client can be shared by every
 * worker thread. libcurl global initialization happens once, on first
 * construction.
 */
class CurlRangeClient : public RangeClient {
public:
    struct Options {
        Duration connectTimeout = Constants::CONNECT_TIMEOUT;
        Duration readTimeout = Constants::READ_TIMEOUT;    ///< Max stall before abort
        QString userAgent = QStringLiteral("ChunkDM/1.0");
    };

    explicit CurlRangeClient(const QLoggingCategory& log = lcNet());
    CurlRangeClient(Options options, const QLoggingCategory& log = lcNet());
    ~CurlRangeClient() override = default;

    CurlRangeClient(const CurlRangeClient&) = delete;
    CurlRangeClient& operator=(const CurlRangeClient&) = delete;

    std::optional<ServerCapabilities> probe(const QString& url,
                                            DownloadError* error) override;

    std::optional<QByteArray> fetchRange(const QString& url,
                                         ByteOffset start, ByteOffset end,
                                         DownloadError* error,
                                         const ControlToken* token = nullptr) override;

    /**
     * @brief Map an HTTP status of 400 or above to an error category
     */
    static ErrorCategory categoryForHttpStatus(long httpCode);

    /**
     * @brief Translate a libcurl result code into a DownloadError
     *
     * Transport failures a later attempt can get past (connect, TLS
     * handshake, HTTP/2 framing, truncated or malformed replies) map to
     * Network so the retry policy picks them up.
     */
    static DownloadError errorForCurlCode(int code);

    /**
     * @brief Extract a file name from a Content-Disposition header block
     * @return Decoded file name, or empty if none is present
     */
    static QString fileNameFromHeaders(const QString& rawHeaders);

    /**
     * @brief Decide range support from an Accept-Ranges header block
     * @return True if the header is present and not "none"
     */
    static bool acceptsRangesFromHeaders(const QString& rawHeaders);

private:
    Options m_options;
    const QLoggingCategory& m_log;
};

} // namespace ChunkDM
