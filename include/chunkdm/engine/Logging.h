/**
 * @file Logging.h
 * @brief Logging categories for the ChunkDM engine
 *
 * Every component receives one of these categories at construction and logs
 * through it. Filter with QT_LOGGING_RULES, e.g. "chunkdm.*.debug=false".
 */

#pragma once

#include <QLoggingCategory>

namespace ChunkDM {

Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcWorker)
Q_DECLARE_LOGGING_CATEGORY(lcWriter)
Q_DECLARE_LOGGING_CATEGORY(lcQueue)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcNet)
Q_DECLARE_LOGGING_CATEGORY(lcRetry)

} // namespace ChunkDM
