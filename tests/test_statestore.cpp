/**
 * @file test_statestore.cpp
 * @brief Unit tests for StateStore persistence and crash recovery
 */

#include <QtTest>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QUuid>

#include "chunkdm/engine/FileNaming.h"
#include "chunkdm/persistence/StateStore.h"

using namespace ChunkDM;

namespace {

StateSnapshot makeSnapshot(const QString& dir, const QString& name,
                           DownloadStatus status = DownloadStatus::Downloading)
{
    StateSnapshot snap;
    snap.id = QUuid::createUuid();
    snap.url = QStringLiteral("https://example.com/") + name;
    snap.filePath = QDir(dir).absoluteFilePath(name);
    snap.totalSize = 1000;
    snap.bytesTransferred = 300;
    snap.status = status;
    snap.chunks = {
        {0, 0, 499, 300, false},
        {1, 500, 999, 500, false},
    };
    return snap;
}

} // namespace

class TestStateStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSaveAndGet();
    void testSurvivesReopen();
    void testCreatedAtKept();
    void testUpdateProgress();
    void testUpdateState();
    void testUnknownIdUpdatesFail();
    void testRemove();
    void testListByState();
    void testCorruptRecordTreatedAsAbsent();
    void testInvalidChunksTreatedAsAbsent();
    void testRecoverInterruptedDownloads();
    void testRecoverySkipsKnownPaths();
    void testRecoveryIdIsStable();

private:
    void insertRawRow(const QString& key, int status, qint64 totalSize);

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_stateRoot;
};

void TestStateStore::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_stateRoot = m_dir->filePath("state");
}

void TestStateStore::cleanup()
{
    m_dir.reset();
}

void TestStateStore::insertRawRow(const QString& key, int status, qint64 totalSize)
{
    const QString connection = QStringLiteral("test-raw-%1").arg(key);
    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connection);
        db.setDatabaseName(QDir(m_stateRoot).absoluteFilePath("state.db"));
        QVERIFY(db.open());

        QSqlQuery query(db);
        QVERIFY(query.prepare(QStringLiteral(
            "INSERT INTO downloads (id, url, file_path, total_size, bytes_transferred, status, "
            "error_message, created_at, updated_at) VALUES (?, ?, ?, ?, 0, ?, '', 1, 1)")));
        query.addBindValue(key);
        query.addBindValue(QStringLiteral("https://example.com/raw"));
        query.addBindValue(m_dir->filePath("raw.bin"));
        query.addBindValue(totalSize);
        query.addBindValue(status);
        QVERIFY(query.exec());
        db.close();
    }
    QSqlDatabase::removeDatabase(connection);
}

void TestStateStore::testSaveAndGet()
{
    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    QVERIFY(QFile::exists(store.databasePath()));

    const StateSnapshot snap = makeSnapshot(m_dir->path(), "a.bin");
    store.save(snap);

    auto loaded = store.get(snap.id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->url, snap.url);
    QCOMPARE(loaded->filePath, snap.filePath);
    QCOMPARE(loaded->bytesTransferred, ByteCount(300));
    QVERIFY(loaded->status == DownloadStatus::Downloading);
    QCOMPARE(loaded->chunks.size(), size_t(2));
    QVERIFY(loaded->createdAt > 0);
    QVERIFY(loaded->updatedAt >= loaded->createdAt);

    QVERIFY(!store.get(QUuid::createUuid()).has_value());
}

void TestStateStore::testSurvivesReopen()
{
    const StateSnapshot snap = makeSnapshot(m_dir->path(), "b.bin", DownloadStatus::Paused);
    {
        StateStore store(m_stateRoot);
        QVERIFY(store.open());
        store.save(snap);
        store.close();
    }

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    auto loaded = store.get(snap.id);
    QVERIFY(loaded.has_value());
    QVERIFY(loaded->status == DownloadStatus::Paused);
    QCOMPARE(loaded->totalSize, ByteCount(1000));
    QCOMPARE(loaded->chunks.size(), size_t(2));
    QCOMPARE(loaded->chunks[1].start, ByteOffset(500));
    QCOMPARE(loaded->chunks[1].current, ByteOffset(500));
    QVERIFY(!loaded->chunks[0].completed);
}

void TestStateStore::testCreatedAtKept()
{
    StateStore store(m_stateRoot);
    QVERIFY(store.open());

    StateSnapshot snap = makeSnapshot(m_dir->path(), "c.bin");
    store.save(snap);
    const qint64 created = store.get(snap.id)->createdAt;

    QTest::qWait(5);
    snap.createdAt = 0;
    snap.bytesTransferred = 400;
    snap.chunks[0].current = 400;
    store.save(snap);

    auto loaded = store.get(snap.id);
    QCOMPARE(loaded->createdAt, created);
    QVERIFY(loaded->updatedAt >= created);
}

void TestStateStore::testUpdateProgress()
{
    StateSnapshot snap = makeSnapshot(m_dir->path(), "d.bin");
    {
        StateStore store(m_stateRoot);
        QVERIFY(store.open());
        store.save(snap);

        ChunkSnapshots chunks = snap.chunks;
        chunks[0].current = 500;
        chunks[0].completed = true;
        QVERIFY(store.updateProgress(snap.id, 500, chunks));
        store.close();
    }

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    auto loaded = store.get(snap.id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->bytesTransferred, ByteCount(500));
    QVERIFY(loaded->chunks[0].completed);
    QCOMPARE(loaded->chunks[0].current, ByteOffset(500));
}

void TestStateStore::testUpdateState()
{
    StateStore store(m_stateRoot);
    QVERIFY(store.open());

    const StateSnapshot snap = makeSnapshot(m_dir->path(), "e.bin");
    store.save(snap);
    QVERIFY(store.updateState(snap.id, DownloadStatus::Error));
    QVERIFY(store.get(snap.id)->status == DownloadStatus::Error);
}

void TestStateStore::testUnknownIdUpdatesFail()
{
    StateStore store(m_stateRoot);
    QVERIFY(store.open());

    const TaskId unknown = QUuid::createUuid();
    QVERIFY(!store.updateState(unknown, DownloadStatus::Paused));
    QVERIFY(!store.updateProgress(unknown, 10, {}));
}

void TestStateStore::testRemove()
{
    const StateSnapshot snap = makeSnapshot(m_dir->path(), "f.bin");
    {
        StateStore store(m_stateRoot);
        QVERIFY(store.open());
        store.save(snap);
        store.flush();
        store.remove(snap.id);
        QVERIFY(!store.get(snap.id).has_value());
        store.close();
    }

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    QVERIFY(!store.get(snap.id).has_value());
    QVERIFY(store.listAll().empty());
}

void TestStateStore::testListByState()
{
    StateStore store(m_stateRoot);
    QVERIFY(store.open());

    store.save(makeSnapshot(m_dir->path(), "g1.bin", DownloadStatus::Paused));
    store.save(makeSnapshot(m_dir->path(), "g2.bin", DownloadStatus::Downloading));
    store.save(makeSnapshot(m_dir->path(), "g3.bin", DownloadStatus::Paused));

    QCOMPARE(store.listAll().size(), size_t(3));
    QCOMPARE(store.listByState(DownloadStatus::Paused).size(), size_t(2));
    QCOMPARE(store.listByState(DownloadStatus::Downloading).size(), size_t(1));
    QVERIFY(store.listByState(DownloadStatus::Completed).empty());
}

void TestStateStore::testCorruptRecordTreatedAsAbsent()
{
    {
        StateStore store(m_stateRoot);
        QVERIFY(store.open());
        store.close();
    }

    const QUuid id = QUuid::createUuid();
    insertRawRow(id.toString(QUuid::WithoutBraces), 42, 100);

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    QVERIFY(!store.get(id).has_value());
    QVERIFY(store.listAll().empty());
}

void TestStateStore::testInvalidChunksTreatedAsAbsent()
{
    StateSnapshot snap = makeSnapshot(m_dir->path(), "h.bin");
    // Chunks no longer cover the stored size
    snap.totalSize = 5000;
    {
        StateStore store(m_stateRoot);
        QVERIFY(store.open());
        store.save(snap);
        store.close();
    }

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    QVERIFY(!store.get(snap.id).has_value());
}

void TestStateStore::testRecoverInterruptedDownloads()
{
    const QString downloads = m_dir->filePath("downloads");
    QVERIFY(QDir().mkpath(downloads));

    const QString finalPath = QDir(downloads).absoluteFilePath("movie.mkv");
    QFile part(FileNaming::partialPathFor(finalPath));
    QVERIFY(part.open(QIODevice::WriteOnly));
    part.write(QByteArray(2048, 'z'));
    part.close();
    QVERIFY(FileNaming::writeSidecar(finalPath, "https://example.com/movie.mkv"));

    // A partial without a sidecar cannot be attributed to a URL
    QFile orphan(QDir(downloads).absoluteFilePath("orphan.bin.part"));
    QVERIFY(orphan.open(QIODevice::WriteOnly));
    orphan.write("x");
    orphan.close();

    StateStore store(m_stateRoot);
    QVERIFY(store.open());

    const auto recovered = store.recoverInterruptedDownloads(downloads);
    QCOMPARE(recovered.size(), size_t(1));

    const StateSnapshot& snap = recovered.front();
    QCOMPARE(snap.id, StateStore::recoveryIdForUrl("https://example.com/movie.mkv"));
    QCOMPARE(snap.url, QString("https://example.com/movie.mkv"));
    QCOMPARE(snap.filePath, finalPath);
    QVERIFY(snap.status == DownloadStatus::Interrupted);
    QCOMPARE(snap.totalSize, ByteCount(-1));
    QCOMPARE(snap.bytesTransferred, ByteCount(2048));
    QVERIFY(snap.chunks.empty());

    // A second scan finds nothing new
    QVERIFY(store.recoverInterruptedDownloads(downloads).empty());
    QVERIFY(store.recoverInterruptedDownloads(m_dir->filePath("missing")).empty());
}

void TestStateStore::testRecoverySkipsKnownPaths()
{
    const QString downloads = m_dir->filePath("downloads");
    QVERIFY(QDir().mkpath(downloads));

    StateSnapshot snap = makeSnapshot(downloads, "tracked.bin", DownloadStatus::Paused);
    QFile part(FileNaming::partialPathFor(snap.filePath));
    QVERIFY(part.open(QIODevice::WriteOnly));
    part.write(QByteArray(300, 'a'));
    part.close();
    QVERIFY(FileNaming::writeSidecar(snap.filePath, snap.url));

    StateStore store(m_stateRoot);
    QVERIFY(store.open());
    store.save(snap);

    QVERIFY(store.recoverInterruptedDownloads(downloads).empty());
    QCOMPARE(store.listAll().size(), size_t(1));
}

void TestStateStore::testRecoveryIdIsStable()
{
    const TaskId a = StateStore::recoveryIdForUrl("https://example.com/x");
    QCOMPARE(StateStore::recoveryIdForUrl("https://example.com/x"), a);
    QVERIFY(StateStore::recoveryIdForUrl("https://example.com/y") != a);
    QVERIFY(!a.isNull());
}

QTEST_MAIN(TestStateStore)
#include "test_statestore.moc"
