/**
 * @file RangeClient.h
 * @brief Interface for metadata probes and ranged fetches
 */

#pragma once

#include "chunkdm/engine/Types.h"

#include <optional>
#include <QByteArray>
#include <QString>

namespace ChunkDM {

class ControlToken;

/**
 * @class RangeClient
 * @brief Network collaborator used by controllers and workers
 *
 * Implementations must be safe to call from several worker threads at once.
 * Failures are reported through the error out-parameter: Network, Timeout and
 * ServerError are transient; NotFound, Forbidden and ClientError are terminal.
 */
class RangeClient {
public:
    virtual ~RangeClient() = default;

    /**
     * @brief Query size and range support of a resource
     * @param url Resource URL
     * @param error Receives the failure cause
     * @return Capabilities, or nullopt on failure
     */
    virtual std::optional<ServerCapabilities> probe(const QString& url,
                                                    DownloadError* error) = 0;

    /**
     * @brief Fetch an inclusive byte range
     *
     * May return fewer bytes than requested; that is logged, not an error.
     *
     * @param url Resource URL
     * @param start First byte (inclusive)
     * @param end Last byte (inclusive)
     * @param error Receives the failure cause
     * @param token Optional token that aborts an in-flight transfer
     * @return Bytes starting at start, or nullopt on failure
     */
    virtual std::optional<QByteArray> fetchRange(const QString& url,
                                                 ByteOffset start, ByteOffset end,
                                                 DownloadError* error,
                                                 const ControlToken* token = nullptr) = 0;
};

} // namespace ChunkDM
