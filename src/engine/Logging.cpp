/**
 * @file Logging.cpp
 * @brief Logging category definitions
 */

#include "chunkdm/engine/Logging.h"

namespace ChunkDM {

Q_LOGGING_CATEGORY(lcEngine, "chunkdm.engine")
Q_LOGGING_CATEGORY(lcWorker, "chunkdm.worker")
Q_LOGGING_CATEGORY(lcWriter, "chunkdm.writer")
Q_LOGGING_CATEGORY(lcQueue, "chunkdm.queue")
Q_LOGGING_CATEGORY(lcStore, "chunkdm.store")
Q_LOGGING_CATEGORY(lcNet, "chunkdm.net")
Q_LOGGING_CATEGORY(lcRetry, "chunkdm.retry")

} // namespace ChunkDM
