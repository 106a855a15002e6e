/**
 * @file FileNaming.h
 * @brief On-disk naming of data files, partial files and URL sidecars
 *
 * While a download is not Completed its bytes live in "<path>.part" and the
 * source URL is kept on the first line of "<path>.meta". Crash recovery uses
 * the sidecar to find the URL of an orphaned partial file.
 */

#pragma once

#include <functional>
#include <optional>
#include <QString>

namespace ChunkDM {
namespace FileNaming {

/// @return "<finalPath>.part"
QString partialPathFor(const QString& finalPath);

/// @return "<finalPath>.meta"
QString sidecarPathFor(const QString& finalPath);

/// @return Final path for a partial file path, or empty if it has no ".part" suffix
QString finalPathForPartial(const QString& partialPath);

/**
 * @brief Derive a local file name from a URL
 *
 * Uses the last path segment without query; falls back to
 * "download_<epoch-ms>".
 */
QString fileNameForUrl(const QString& url);

/**
 * @brief Pick a free path inside a directory
 *
 * Inserts " (n)" before the extension until neither the path nor its
 * partial file exists and isTaken() rejects it.
 */
QString uniquePath(const QString& directory, const QString& fileName,
                   const std::function<bool(const QString&)>& isTaken = {});

/**
 * @brief Write the source URL sidecar next to a download
 * @return True on success
 */
bool writeSidecar(const QString& finalPath, const QString& url);

/**
 * @brief Read the source URL from a sidecar file
 * @return First line of the file, or nullopt if missing or empty
 */
std::optional<QString> readSidecarUrl(const QString& sidecarPath);

} // namespace FileNaming
} // namespace ChunkDM
