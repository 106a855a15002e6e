/**
 * @file SegmentedFileWriter.cpp
 * @brief Implementation of SegmentedFileWriter
 */

#include "chunkdm/engine/SegmentedFileWriter.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QtGlobal>
#include <vector>

#ifdef Q_OS_WIN
#include <io.h>
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#endif

namespace ChunkDM {

struct SegmentedFileWriter::FileSlot {
    std::mutex mutex;
    QFile file;
    QByteArray buffer;
    ByteOffset bufferStart = 0;
    bool stalled = false;  // last flush of the pending run failed
    bool closed = false;
};

namespace {

/**
 * @brief Take or release an exclusive lock on [offset, offset + length)
 */
bool lockRange(QFile& file, ByteOffset offset, ByteCount length, bool acquire) {
#ifdef Q_OS_WIN
    HANDLE handle = reinterpret_cast<HANDLE>(_get_osfhandle(file.handle()));
    OVERLAPPED overlapped{};
    overlapped.Offset = static_cast<DWORD>(offset & 0xFFFFFFFF);
    overlapped.OffsetHigh = static_cast<DWORD>(offset >> 32);
    const DWORD low = static_cast<DWORD>(length & 0xFFFFFFFF);
    const DWORD high = static_cast<DWORD>(length >> 32);
    if (acquire) {
        return LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK, 0, low, high, &overlapped) != 0;
    }
    return UnlockFileEx(handle, 0, low, high, &overlapped) != 0;
#else
    struct flock region{};
    region.l_type = acquire ? F_WRLCK : F_UNLCK;
    region.l_whence = SEEK_SET;
    region.l_start = static_cast<off_t>(offset);
    region.l_len = static_cast<off_t>(length);

    int rc = 0;
    do {
        rc = ::fcntl(file.handle(), F_SETLKW, &region);
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
#endif
}

DownloadError fileError(const QString& message, const QFile& file) {
    DownloadError error = DownloadError::make(ErrorCategory::FileSystem, message);
    error.details = file.errorString();
    error.errorCode = static_cast<int>(file.error());
    return error;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

SegmentedFileWriter::SegmentedFileWriter(const QLoggingCategory& log)
    : SegmentedFileWriter(Options{}, log)
{
}

SegmentedFileWriter::SegmentedFileWriter(Options options, const QLoggingCategory& log)
    : m_options(options)
    , m_log(log)
{
}

SegmentedFileWriter::~SegmentedFileWriter() {
    closeAll();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Writing
// ═══════════════════════════════════════════════════════════════════════════════

bool SegmentedFileWriter::write(const QString& path, ByteOffset offset, const QByteArray& data,
                                DownloadError* error) {
    if (data.isEmpty()) {
        return true;
    }

    const auto threshold = static_cast<qsizetype>(
        static_cast<double>(m_options.bufferCapacity) * m_options.flushRatio);

    for (;;) {
        auto slot = acquireSlot(path, error);
        if (!slot) {
            return false;
        }

        std::lock_guard lock(slot->mutex);
        if (slot->closed) {
            continue;  // closed while we waited, reopen
        }

        // Non-contiguous offset: the pending run must reach disk first
        const bool contiguous =
            offset == slot->bufferStart + static_cast<ByteOffset>(slot->buffer.size());
        if (!slot->buffer.isEmpty() && (!contiguous || slot->stalled)) {
            if (!flushLocked(*slot, nullptr)) {
                // The stuck run stays pending; these bytes bypass it
                return writeLocked(*slot, offset, data, error);
            }
        }

        if (slot->buffer.isEmpty()) {
            slot->bufferStart = offset;
        }
        slot->buffer.append(data);

        if (slot->buffer.size() >= threshold && !flushLocked(*slot, error)) {
            slot->buffer.chop(data.size());
            if (slot->buffer.isEmpty()) {
                slot->stalled = false;
            }
            return false;
        }
        return true;
    }
}

bool SegmentedFileWriter::flush(const QString& path, DownloadError* error) {
    auto slot = findSlot(path);
    if (!slot) {
        return true;
    }

    std::lock_guard lock(slot->mutex);
    if (slot->closed) {
        return true;
    }
    return flushLocked(*slot, error);
}

bool SegmentedFileWriter::flush() {
    std::vector<std::shared_ptr<FileSlot>> slots;
    {
        std::lock_guard lock(m_registryMutex);
        for (const auto& slot : m_slots) {
            slots.push_back(slot);
        }
    }

    bool ok = true;
    for (const auto& slot : slots) {
        std::lock_guard lock(slot->mutex);
        if (!slot->closed) {
            ok = flushLocked(*slot, nullptr) && ok;
        }
    }
    return ok;
}

bool SegmentedFileWriter::close(const QString& path, DownloadError* error, LostRun* lost) {
    std::shared_ptr<FileSlot> slot;
    {
        std::lock_guard lock(m_registryMutex);
        slot = m_slots.take(path);
    }

    if (!slot) {
        return true;
    }
    return closeSlot(*slot, error, lost);
}

bool SegmentedFileWriter::closeAll() {
    QHash<QString, std::shared_ptr<FileSlot>> slots;
    {
        std::lock_guard lock(m_registryMutex);
        slots.swap(m_slots);
    }

    bool ok = true;
    for (const auto& slot : slots) {
        ok = closeSlot(*slot, nullptr, nullptr) && ok;
    }
    return ok;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Inspection
// ═══════════════════════════════════════════════════════════════════════════════

bool SegmentedFileWriter::checkIntegrity(const QString& path) {
    QFileInfo info(path);
    return info.exists() && info.isFile() && info.size() > 0;
}

int SegmentedFileWriter::openFileCount() const {
    std::lock_guard lock(m_registryMutex);
    return static_cast<int>(m_slots.size());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Internal Helpers
// ═══════════════════════════════════════════════════════════════════════════════

std::shared_ptr<SegmentedFileWriter::FileSlot>
SegmentedFileWriter::acquireSlot(const QString& path, DownloadError* error) {
    std::lock_guard lock(m_registryMutex);

    auto it = m_slots.constFind(path);
    if (it != m_slots.constEnd()) {
        return it.value();
    }

    QDir().mkpath(QFileInfo(path).absolutePath());

    auto slot = std::make_shared<FileSlot>();
    slot->file.setFileName(path);
    if (!slot->file.open(QIODevice::ReadWrite)) {
        qCWarning(m_log) << "SegmentedFileWriter: Failed to open" << path
                         << slot->file.errorString();
        reportError(error, fileError(QStringLiteral("Failed to open %1").arg(path), slot->file));
        return nullptr;
    }

    qCDebug(m_log) << "SegmentedFileWriter: Opened" << path;
    m_slots.insert(path, slot);
    return slot;
}

std::shared_ptr<SegmentedFileWriter::FileSlot>
SegmentedFileWriter::findSlot(const QString& path) const {
    std::lock_guard lock(m_registryMutex);
    return m_slots.value(path);
}

bool SegmentedFileWriter::writeRun(QFile& file, ByteOffset /*start*/, const QByteArray& data) {
    return file.write(data) == data.size() && file.flush();
}

bool SegmentedFileWriter::writeLocked(FileSlot& slot, ByteOffset start, const QByteArray& data,
                                      DownloadError* error) {
    const ByteCount length = data.size();

    if (!slot.file.seek(start)) {
        qCWarning(m_log) << "SegmentedFileWriter: Seek to" << start << "failed for"
                         << slot.file.fileName() << slot.file.errorString();
        reportError(error, fileError(QStringLiteral("Seek failed"), slot.file));
        return false;
    }

    if (!lockRange(slot.file, start, length, true)) {
        qCWarning(m_log) << "SegmentedFileWriter: Could not lock" << start << "+" << length
                         << "of" << slot.file.fileName();
        reportError(error, DownloadError::make(ErrorCategory::FileSystem,
                                               QStringLiteral("Byte-range lock failed")));
        return false;
    }

    const bool ok = writeRun(slot.file, start, data);

    if (!lockRange(slot.file, start, length, false)) {
        qCWarning(m_log) << "SegmentedFileWriter: Could not unlock" << start << "+" << length
                         << "of" << slot.file.fileName();
    }

    if (!ok) {
        qCWarning(m_log) << "SegmentedFileWriter: Write of" << length << "bytes at" << start
                         << "failed for" << slot.file.fileName() << slot.file.errorString();
        reportError(error, fileError(QStringLiteral("Write failed at offset %1").arg(start),
                                     slot.file));
        return false;
    }

    m_flushCount.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool SegmentedFileWriter::flushLocked(FileSlot& slot, DownloadError* error) {
    if (slot.buffer.isEmpty()) {
        return true;
    }

    if (!writeLocked(slot, slot.bufferStart, slot.buffer, error)) {
        // Keep the run pending so a later flush can retry it
        slot.stalled = true;
        return false;
    }

    slot.buffer.clear();
    slot.stalled = false;
    return true;
}

bool SegmentedFileWriter::closeSlot(FileSlot& slot, DownloadError* error, LostRun* lost) {
    std::lock_guard lock(slot.mutex);
    if (slot.closed) {
        return true;
    }

    bool ok = flushLocked(slot, error);
    if (!ok) {
        qCCritical(m_log) << "SegmentedFileWriter: Dropping" << slot.buffer.size()
                          << "unflushed bytes at" << slot.bufferStart
                          << "of" << slot.file.fileName();
        if (lost) {
            lost->start = slot.bufferStart;
            lost->length = slot.buffer.size();
        }
        slot.buffer.clear();
        slot.stalled = false;
    }

    slot.file.close();
    slot.closed = true;
    qCDebug(m_log) << "SegmentedFileWriter: Closed" << slot.file.fileName();
    return ok;
}

} // namespace ChunkDM
