/**
 * @file UrlValidator.h
 * @brief Syntax check for submitted download URLs
 */

#pragma once

#include <QString>

namespace ChunkDM {
namespace UrlValidator {

/**
 * @brief Check that a URL can be downloaded
 *
 * Accepts absolute http, https and ftp URLs with a host.
 *
 * @param url Candidate URL
 * @param reason Receives a description when the URL is rejected
 */
bool isValid(const QString& url, QString* reason = nullptr);

} // namespace UrlValidator
} // namespace ChunkDM
