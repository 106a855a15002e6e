/**
 * @file StateStore.cpp
 * @brief SQLite snapshot store implementation
 */

#include "chunkdm/persistence/StateStore.h"
#include "chunkdm/engine/FileNaming.h"
#include "DatabaseSchema.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <algorithm>
#include <map>

namespace ChunkDM {

namespace {

// Namespace for name-based ids of recovered downloads
const QUuid RECOVERY_NAMESPACE = QUuid::fromString(QStringLiteral("{8a3e2c61-4f0b-4d7e-9c52-1b6f0e9d3a47}"));

QString keyFor(const TaskId& id) {
    return id.toString(QUuid::WithoutBraces);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

StateStore::StateStore(const QString& stateRoot, const QLoggingCategory& log)
    : m_stateRoot(stateRoot)
    , m_dbPath(QDir(stateRoot).absoluteFilePath(QStringLiteral("state.db")))
    , m_connectionName(QStringLiteral("chunkdm-state-%1").arg(keyFor(QUuid::createUuid())))
    , m_log(log)
{
}

StateStore::~StateStore() {
    close();
}

bool StateStore::open(DownloadError* error) {
    if (isOpen()) {
        return true;
    }

    if (!QDir().mkpath(m_stateRoot)) {
        qCCritical(m_log) << "StateStore: Cannot create state root" << m_stateRoot;
        reportError(error, DownloadError::make(ErrorCategory::FileSystem,
            QStringLiteral("Cannot create state root %1").arg(m_stateRoot)));
        return false;
    }

    {
        std::lock_guard lock(m_queueMutex);
        m_acceptingJobs = true;
    }
    m_thread = std::thread(&StateStore::threadLoop, this);

    DownloadError openError;
    const bool opened = call([this, &openError]() { return openDatabase(&openError); });
    if (!opened) {
        stopThread();
        reportError(error, openError);
        return false;
    }

    m_running.store(true, std::memory_order_release);
    qCDebug(m_log) << "StateStore: Opened" << m_dbPath;
    return true;
}

void StateStore::close() {
    if (!m_thread.joinable()) {
        return;
    }
    m_running.store(false, std::memory_order_release);
    stopThread();
    qCDebug(m_log) << "StateStore: Closed" << m_dbPath;
}

void StateStore::flush() {
    call([]() {});
}

// ═══════════════════════════════════════════════════════════════════════════════
// Snapshot Operations
// ═══════════════════════════════════════════════════════════════════════════════

void StateStore::save(const StateSnapshot& snapshot) {
    StateSnapshot snap = snapshot;
    const qint64 now = QDateTime::currentMSecsSinceEpoch();

    {
        std::lock_guard lock(m_cacheMutex);
        auto it = m_cache.constFind(snap.id);
        if (it != m_cache.constEnd() && it->createdAt > 0) {
            snap.createdAt = it->createdAt;
        }
        if (snap.createdAt <= 0) {
            snap.createdAt = now;
        }
        snap.updatedAt = now;
        m_cache.insert(snap.id, snap);
    }

    if (!post([this, snap]() { doSave(snap); })) {
        qCWarning(m_log) << "StateStore: Not open, snapshot" << keyFor(snap.id)
                         << "kept in memory only";
    }
}

std::optional<StateSnapshot> StateStore::get(const TaskId& id) {
    {
        std::lock_guard lock(m_cacheMutex);
        auto it = m_cache.constFind(id);
        if (it != m_cache.constEnd()) {
            return it.value();
        }
    }

    auto loaded = call([this, id]() { return doLoad(id); });
    if (loaded) {
        std::lock_guard lock(m_cacheMutex);
        m_cache.insert(id, *loaded);
    }
    return loaded;
}

bool StateStore::updateProgress(const TaskId& id, ByteCount bytesTransferred,
                                const ChunkSnapshots& chunks) {
    auto snap = get(id);
    if (!snap) {
        return false;
    }
    snap->bytesTransferred = bytesTransferred;
    snap->chunks = chunks;
    save(*snap);
    return true;
}

bool StateStore::updateState(const TaskId& id, DownloadStatus status) {
    auto snap = get(id);
    if (!snap) {
        return false;
    }
    snap->status = status;
    save(*snap);
    return true;
}

void StateStore::remove(const TaskId& id) {
    {
        std::lock_guard lock(m_cacheMutex);
        m_cache.remove(id);
    }
    post([this, id]() { doRemove(id); });
}

std::vector<StateSnapshot> StateStore::listAll() {
    std::map<QString, StateSnapshot> merged;

    for (auto& snap : call([this]() { return doLoadAll(); })) {
        merged[keyFor(snap.id)] = std::move(snap);
    }

    {
        std::lock_guard lock(m_cacheMutex);
        for (const auto& snap : m_cache) {
            merged[keyFor(snap.id)] = snap;
        }
    }

    std::vector<StateSnapshot> result;
    result.reserve(merged.size());
    for (auto& [key, snap] : merged) {
        result.push_back(std::move(snap));
    }

    std::stable_sort(result.begin(), result.end(), [](const StateSnapshot& a, const StateSnapshot& b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

std::vector<StateSnapshot> StateStore::listByState(DownloadStatus status) {
    auto all = listAll();
    std::vector<StateSnapshot> result;
    std::copy_if(all.begin(), all.end(), std::back_inserter(result),
                 [status](const StateSnapshot& s) { return s.status == status; });
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Crash Recovery
// ═══════════════════════════════════════════════════════════════════════════════

std::vector<StateSnapshot> StateStore::recoverInterruptedDownloads(const QString& partialFilesDir) {
    std::vector<StateSnapshot> recovered;

    QDir dir(partialFilesDir);
    if (!dir.exists()) {
        return recovered;
    }

    QSet<QString> knownPaths;
    for (const auto& snap : listAll()) {
        knownPaths.insert(QFileInfo(snap.filePath).absoluteFilePath());
    }

    const QStringList filters{QStringLiteral("*") + QLatin1String(Constants::PARTIAL_SUFFIX)};
    const QFileInfoList parts = dir.entryInfoList(filters, QDir::Files, QDir::Name);

    for (const QFileInfo& part : parts) {
        const QString finalPath = FileNaming::finalPathForPartial(part.absoluteFilePath());
        if (knownPaths.contains(finalPath)) {
            continue;
        }

        auto url = FileNaming::readSidecarUrl(FileNaming::sidecarPathFor(finalPath));
        if (!url) {
            qCDebug(m_log) << "StateStore: No sidecar for" << part.fileName() << "- skipping";
            continue;
        }

        const TaskId id = recoveryIdForUrl(*url);
        if (get(id)) {
            qCDebug(m_log) << "StateStore: Download for" << *url << "already known - skipping"
                           << part.fileName();
            continue;
        }

        StateSnapshot snap;
        snap.id = id;
        snap.url = *url;
        snap.filePath = finalPath;
        snap.totalSize = -1;
        snap.bytesTransferred = part.size();
        snap.status = DownloadStatus::Interrupted;
        snap.createdAt = part.lastModified().toMSecsSinceEpoch();

        save(snap);
        knownPaths.insert(finalPath);

        qCInfo(m_log) << "StateStore: Recovered interrupted download" << keyFor(id)
                      << *url << formatByteSize(snap.bytesTransferred);

        if (auto stored = get(id)) {
            recovered.push_back(*stored);
        }
    }

    return recovered;
}

TaskId StateStore::recoveryIdForUrl(const QString& url) {
    return QUuid::createUuidV3(RECOVERY_NAMESPACE, url);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Store Thread
// ═══════════════════════════════════════════════════════════════════════════════

bool StateStore::post(Job job) {
    {
        std::lock_guard lock(m_queueMutex);
        if (!m_acceptingJobs) {
            return false;
        }
        m_jobs.push(std::move(job));
    }
    m_queueCondition.notify_one();
    return true;
}

void StateStore::threadLoop() {
    qCDebug(m_log) << "StateStore: Store thread started";

    for (;;) {
        Job job;
        {
            std::unique_lock lock(m_queueMutex);
            m_queueCondition.wait(lock, [this]() {
                return !m_jobs.empty() || !m_acceptingJobs;
            });

            if (m_jobs.empty()) {
                break;  // stopped and drained
            }

            job = std::move(m_jobs.front());
            m_jobs.pop();
        }
        job();
    }

    qCDebug(m_log) << "StateStore: Store thread stopped";
}

void StateStore::stopThread() {
    post([this]() { closeDatabase(); });
    {
        std::lock_guard lock(m_queueMutex);
        m_acceptingJobs = false;
    }
    m_queueCondition.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// SQL (store thread only)
// ═══════════════════════════════════════════════════════════════════════════════

bool StateStore::openDatabase(DownloadError* error) {
    QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    db.setDatabaseName(m_dbPath);

    if (!db.open()) {
        qCCritical(m_log) << "StateStore: Failed to open database:" << db.lastError().text();
        reportError(error, DownloadError::make(ErrorCategory::FileSystem,
            QStringLiteral("Failed to open %1: %2").arg(m_dbPath, db.lastError().text())));
        return false;
    }

    QSqlQuery query(db);
    for (const char* pragma : DatabaseSchema::PRAGMAS) {
        if (!query.exec(QString::fromLatin1(pragma))) {
            qCWarning(m_log) << "StateStore:" << pragma << "failed:" << query.lastError().text();
        }
    }

    const char* statements[] = {
        DatabaseSchema::CREATE_DOWNLOADS_TABLE,
        DatabaseSchema::CREATE_DOWNLOADS_STATUS_INDEX,
        DatabaseSchema::CREATE_CHUNKS_TABLE,
        DatabaseSchema::CREATE_CHUNKS_DOWNLOAD_INDEX,
    };
    for (const char* sql : statements) {
        if (!query.exec(QString::fromLatin1(sql))) {
            qCCritical(m_log) << "StateStore: Failed to create schema:" << query.lastError().text();
            reportError(error, DownloadError::make(ErrorCategory::FileSystem,
                QStringLiteral("Failed to create schema: %1").arg(query.lastError().text())));
            return false;
        }
    }

    if (!query.exec(QStringLiteral("PRAGMA user_version = %1").arg(DatabaseSchema::CURRENT_SCHEMA_VERSION))) {
        qCWarning(m_log) << "StateStore: Cannot record schema version:" << query.lastError().text();
    }
    return true;
}

void StateStore::closeDatabase() {
    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen()) {
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(m_connectionName);
}

void StateStore::doSave(const StateSnapshot& snapshot) {
    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    const QString key = keyFor(snapshot.id);

    if (!db.transaction()) {
        qCWarning(m_log) << "StateStore: Cannot begin transaction:" << db.lastError().text();
        return;
    }

    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        INSERT OR REPLACE INTO downloads
        (id, url, file_path, total_size, bytes_transferred, status,
         error_message, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));
    query.addBindValue(key);
    query.addBindValue(snapshot.url);
    query.addBindValue(snapshot.filePath);
    query.addBindValue(static_cast<qint64>(snapshot.totalSize));
    query.addBindValue(static_cast<qint64>(snapshot.bytesTransferred));
    query.addBindValue(static_cast<int>(snapshot.status));
    query.addBindValue(snapshot.errorMessage);
    query.addBindValue(snapshot.createdAt);
    query.addBindValue(snapshot.updatedAt);

    bool ok = query.exec();

    if (ok) {
        query.prepare(QStringLiteral("DELETE FROM chunks WHERE download_id = ?"));
        query.addBindValue(key);
        ok = query.exec();
    }

    for (const auto& chunk : snapshot.chunks) {
        if (!ok) break;
        query.prepare(QStringLiteral(R"(
            INSERT INTO chunks
            (download_id, chunk_index, start_byte, end_byte, current_byte, completed)
            VALUES (?, ?, ?, ?, ?, ?)
        )"));
        query.addBindValue(key);
        query.addBindValue(chunk.index);
        query.addBindValue(static_cast<qint64>(chunk.start));
        query.addBindValue(static_cast<qint64>(chunk.end));
        query.addBindValue(static_cast<qint64>(chunk.current));
        query.addBindValue(chunk.completed ? 1 : 0);
        ok = query.exec();
    }

    if (!ok) {
        qCWarning(m_log) << "StateStore: Failed to save" << key << query.lastError().text();
        db.rollback();
        return;
    }

    if (!db.commit()) {
        qCWarning(m_log) << "StateStore: Commit failed for" << key << db.lastError().text();
    }
}

void StateStore::doRemove(const TaskId& id) {
    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    QSqlQuery query(db);
    const QString key = keyFor(id);

    // Delete chunks first (foreign key)
    query.prepare(QStringLiteral("DELETE FROM chunks WHERE download_id = ?"));
    query.addBindValue(key);
    if (!query.exec()) {
        qCWarning(m_log) << "StateStore: Failed to delete chunks of" << key << query.lastError().text();
    }

    query.prepare(QStringLiteral("DELETE FROM downloads WHERE id = ?"));
    query.addBindValue(key);
    if (!query.exec()) {
        qCWarning(m_log) << "StateStore: Failed to delete" << key << query.lastError().text();
    }
}

std::optional<StateSnapshot> StateStore::doLoad(const TaskId& id) {
    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        SELECT id, url, file_path, total_size, bytes_transferred, status,
               error_message, created_at, updated_at
        FROM downloads
        WHERE id = ?
    )"));
    query.addBindValue(keyFor(id));

    if (!query.exec()) {
        qCWarning(m_log) << "StateStore: Failed to load" << keyFor(id) << query.lastError().text();
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }

    return decodeRow(query.value(0).toString(), query.value(1).toString(),
                     query.value(2).toString(), query.value(3).toLongLong(),
                     query.value(4).toLongLong(), query.value(5).toInt(),
                     query.value(6).toString(), query.value(7).toLongLong(),
                     query.value(8).toLongLong());
}

std::vector<StateSnapshot> StateStore::doLoadAll() {
    std::vector<StateSnapshot> result;

    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    QSqlQuery query(db);
    if (!query.exec(QStringLiteral(R"(
        SELECT id, url, file_path, total_size, bytes_transferred, status,
               error_message, created_at, updated_at
        FROM downloads
        ORDER BY created_at
    )"))) {
        qCWarning(m_log) << "StateStore: Failed to list snapshots:" << query.lastError().text();
        return result;
    }

    while (query.next()) {
        auto snap = decodeRow(query.value(0).toString(), query.value(1).toString(),
                              query.value(2).toString(), query.value(3).toLongLong(),
                              query.value(4).toLongLong(), query.value(5).toInt(),
                              query.value(6).toString(), query.value(7).toLongLong(),
                              query.value(8).toLongLong());
        if (snap) {
            result.push_back(std::move(*snap));
        }
    }

    return result;
}

ChunkSnapshots StateStore::loadChunks(const QString& key) {
    ChunkSnapshots chunks;

    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        SELECT chunk_index, start_byte, end_byte, current_byte, completed
        FROM chunks
        WHERE download_id = ?
        ORDER BY chunk_index
    )"));
    query.addBindValue(key);

    if (!query.exec()) {
        qCWarning(m_log) << "StateStore: Failed to load chunks of" << key << query.lastError().text();
        return chunks;
    }

    while (query.next()) {
        Chunk::Snapshot snap;
        snap.index = query.value(0).toInt();
        snap.start = query.value(1).toLongLong();
        snap.end = query.value(2).toLongLong();
        snap.current = query.value(3).toLongLong();
        snap.completed = query.value(4).toInt() != 0;
        chunks.push_back(snap);
    }

    return chunks;
}

std::optional<StateSnapshot> StateStore::decodeRow(const QString& key, const QString& url,
                                                   const QString& filePath, qint64 totalSize,
                                                   qint64 bytes, int status,
                                                   const QString& errorMessage,
                                                   qint64 createdAt, qint64 updatedAt) {
    auto corrupt = [this, &key](const char* reason) -> std::optional<StateSnapshot> {
        qCWarning(m_log) << "StateStore:" << errorCategoryToString(ErrorCategory::StateCorruption)
                         << "in record" << key << "-" << reason << "- treating as absent";
        return std::nullopt;
    };

    const TaskId id = QUuid::fromString(key);
    if (id.isNull()) {
        return corrupt("invalid id");
    }

    auto decodedStatus = downloadStatusFromInt(status);
    if (!decodedStatus) {
        return corrupt("unknown status");
    }

    if (url.isEmpty() || filePath.isEmpty()) {
        return corrupt("missing url or path");
    }

    if (totalSize < -1 || bytes < 0) {
        return corrupt("negative size");
    }

    StateSnapshot snap;
    snap.id = id;
    snap.url = url;
    snap.filePath = filePath;
    snap.totalSize = totalSize;
    snap.bytesTransferred = bytes;
    snap.status = *decodedStatus;
    snap.errorMessage = errorMessage;
    snap.createdAt = createdAt;
    snap.updatedAt = updatedAt;
    snap.chunks = loadChunks(key);

    if (!validateChunks(snap.chunks, snap.totalSize)) {
        return corrupt("chunk list breaks range invariants");
    }

    return snap;
}

} // namespace ChunkDM
