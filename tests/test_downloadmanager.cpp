/**
 * @file test_downloadmanager.cpp
 * @brief Control surface and end-to-end tests for DownloadManager
 */

#include <QtTest>

#include "chunkdm/engine/DownloadManager.h"
#include "chunkdm/engine/FileNaming.h"
#include "EngineRig.h"

using namespace ChunkDM;

namespace {

const QString kUrl = QStringLiteral("http://fake.test/files/payload.bin");

/**
 * @brief Status transitions of every download seen by a manager
 */
class StatusRecorder {
public:
    void attach(DownloadManager& manager) {
        QObject::connect(&manager, &DownloadManager::statusChanged, &manager,
            [this](const TaskId& id, DownloadStatus status) {
                std::lock_guard lock(m_mutex);
                m_states[id].push_back(status);
            }, Qt::DirectConnection);
    }

    std::vector<DownloadStatus> statesOf(const TaskId& id) const {
        std::lock_guard lock(m_mutex);
        auto it = m_states.find(id);
        return it != m_states.end() ? it->second : std::vector<DownloadStatus>{};
    }

private:
    mutable std::mutex m_mutex;
    std::map<TaskId, std::vector<DownloadStatus>> m_states;
};

} // namespace

class TestDownloadManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSubmitRejectsInvalidUrl();
    void testSubmitBeforeInitialize();
    void testUnknownIdIsNotFound();
    void testEndToEndPauseResume();
    void testSubmitWithoutAutoStart();
    void testSameUrlGetsDistinctPaths();
    void testCancelFreesSlot();
    void testRetryAfterError();
    void testRejectsInvalidConcurrency();
    void testRestoreMapsStates();
    void testShutdownAndRestoreResumes();
    void testRecoverOrphanedPartialFile();

private:
    EngineConfig makeConfig(int maxConcurrent = 3) const;
    std::unique_ptr<DownloadManager> makeManager(const QByteArray& payload,
                                                 FakeRangeClient** client,
                                                 int maxConcurrent = 3) const;

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestDownloadManager::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestDownloadManager::cleanup()
{
    m_dir.reset();
}

EngineConfig TestDownloadManager::makeConfig(int maxConcurrent) const
{
    EngineConfig config;
    config.downloadsRoot = m_dir->filePath("downloads");
    config.stateRoot = m_dir->filePath("state");
    config.maxConcurrent = maxConcurrent;
    config.maxAttempts = 3;
    config.retryBaseDelay = Duration(1);
    config.retryMaxDelay = Duration(5);
    config.fetchIncrement = 256 * Constants::KiB;
    config.pausePollInterval = Duration(5);
    config.checkpointBytes = Constants::MiB;
    return config;
}

std::unique_ptr<DownloadManager> TestDownloadManager::makeManager(const QByteArray& payload,
                                                                  FakeRangeClient** client,
                                                                  int maxConcurrent) const
{
    auto fake = std::make_unique<FakeRangeClient>(payload);
    *client = fake.get();
    return std::make_unique<DownloadManager>(makeConfig(maxConcurrent), std::move(fake));
}

void TestDownloadManager::testSubmitRejectsInvalidUrl()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(1024), &client);
    QVERIFY(manager->initialize());

    DownloadError error;
    const TaskId id = manager->submit("not a url", true, &error);
    QVERIFY(id.isNull());
    QCOMPARE(error.category, ErrorCategory::InvalidInput);

    QVERIFY(manager->submit("file:///etc/hosts").isNull());
    QVERIFY(manager->list().empty());
    QCOMPARE(client->probeCount(), 0);
}

void TestDownloadManager::testSubmitBeforeInitialize()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(1024), &client);

    DownloadError error;
    QVERIFY(manager->submit(kUrl, true, &error).isNull());
    QVERIFY(error.hasError());
}

void TestDownloadManager::testUnknownIdIsNotFound()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(1024), &client);
    QVERIFY(manager->initialize());

    const TaskId unknown = QUuid::createUuid();
    DownloadError error;

    QVERIFY(!manager->start(unknown, &error));
    QCOMPARE(error.category, ErrorCategory::NotFound);

    error = DownloadError{};
    QVERIFY(!manager->pause(unknown, &error));
    QCOMPARE(error.category, ErrorCategory::NotFound);

    error = DownloadError{};
    QVERIFY(!manager->resume(unknown, &error));
    QCOMPARE(error.category, ErrorCategory::NotFound);

    error = DownloadError{};
    QVERIFY(!manager->cancel(unknown, &error));
    QCOMPARE(error.category, ErrorCategory::NotFound);

    error = DownloadError{};
    QVERIFY(!manager->retry(unknown, &error));
    QCOMPARE(error.category, ErrorCategory::NotFound);

    error = DownloadError{};
    QVERIFY(!manager->status(unknown, &error).has_value());
    QCOMPARE(error.category, ErrorCategory::NotFound);
}

void TestDownloadManager::testEndToEndPauseResume()
{
    StatusRecorder recorder;
    const QByteArray payload = makePayload(10 * Constants::MiB);
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(payload, &client, 1);
    recorder.attach(*manager);
    client->setFetchDelay(10);
    QVERIFY(manager->initialize());

    const TaskId first = manager->submit(kUrl);
    const TaskId second = manager->submit("http://fake.test/files/other.bin");
    QVERIFY(!first.isNull());
    QVERIFY(!second.isNull());

    // One slot: the second download waits for the first
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(first)->bytesTransferred > 0, 5000);
    QVERIFY(manager->status(second)->state == DownloadStatus::Queued);

    QVERIFY(manager->pause(first));
    QVERIFY(manager->status(first)->state == DownloadStatus::Paused);
    QTest::qWait(50);
    QVERIFY(manager->status(second)->state == DownloadStatus::Queued);

    QVERIFY(manager->resume(first));
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(first)->state == DownloadStatus::Completed, 20000);

    const auto info = *manager->status(first);
    QCOMPARE(info.bytesTransferred, ByteCount(payload.size()));
    QCOMPARE(info.totalBytes, ByteCount(payload.size()));
    QCOMPARE(QFileInfo(info.filePath).fileName(), QString("payload.bin"));
    QCOMPARE(readFile(info.filePath), payload);
    QVERIFY(!QFile::exists(FileNaming::partialPathFor(info.filePath)));
    QVERIFY(!QFile::exists(FileNaming::sidecarPathFor(info.filePath)));

    const std::vector<DownloadStatus> expected{
        DownloadStatus::Queued, DownloadStatus::Downloading, DownloadStatus::Paused,
        DownloadStatus::Downloading, DownloadStatus::Completed};
    QVERIFY(recorder.statesOf(first) == expected);

    QTRY_VERIFY_WITH_TIMEOUT(manager->status(second)->state == DownloadStatus::Completed, 20000);
    QTRY_VERIFY(manager->isIdle());
    QCOMPARE(readFile(manager->status(second)->filePath), payload);
}

void TestDownloadManager::testSubmitWithoutAutoStart()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(64 * Constants::KiB), &client);
    QVERIFY(manager->initialize());

    const TaskId id = manager->submit(kUrl, false);
    QVERIFY(!id.isNull());
    QVERIFY(manager->status(id)->state == DownloadStatus::Queued);
    QVERIFY(!manager->queue().contains(id));
    QVERIFY(manager->isIdle());
    QCOMPARE(client->probeCount(), 0);

    auto stored = manager->store().get(id);
    QVERIFY(stored.has_value());
    QVERIFY(stored->status == DownloadStatus::Queued);
    QVERIFY(QFile::exists(FileNaming::sidecarPathFor(stored->filePath)));

    QVERIFY(manager->start(id));
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->state == DownloadStatus::Completed, 10000);
    QVERIFY(!manager->start(id));
}

void TestDownloadManager::testSameUrlGetsDistinctPaths()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(1024), &client);
    QVERIFY(manager->initialize());

    const TaskId a = manager->submit(kUrl, false);
    const TaskId b = manager->submit(kUrl, false);
    QVERIFY(a != b);

    QCOMPARE(QFileInfo(manager->status(a)->filePath).fileName(), QString("payload.bin"));
    QCOMPARE(QFileInfo(manager->status(b)->filePath).fileName(), QString("payload (1).bin"));

    const std::vector<TaskId> expected{a, b};
    QVERIFY(manager->list() == expected);
}

void TestDownloadManager::testCancelFreesSlot()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(2 * Constants::MiB), &client, 1);
    client->setFetchDelay(50);
    QVERIFY(manager->initialize());

    const TaskId a = manager->submit(kUrl);
    const TaskId b = manager->submit("http://fake.test/files/b.bin");
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(a)->state == DownloadStatus::Downloading, 5000);
    QVERIFY(manager->status(b)->state == DownloadStatus::Queued);

    const QString sidecar = FileNaming::sidecarPathFor(manager->status(a)->filePath);
    QVERIFY(QFile::exists(sidecar));

    QVERIFY(manager->cancel(a));
    QVERIFY(manager->status(a)->state == DownloadStatus::Cancelled);
    QVERIFY(!manager->cancel(a));
    QVERIFY(!manager->queue().contains(a));
    QVERIFY(!manager->store().get(a).has_value());
    QVERIFY(!QFile::exists(sidecar));

    QTRY_VERIFY_WITH_TIMEOUT(manager->status(b)->state != DownloadStatus::Queued, 5000);
    QVERIFY(manager->queue().isActive(b));
    QVERIFY(manager->cancel(b));

    // Cancelled downloads stay inspectable for the session, but are not restored
    QTest::qWait(200);
    const auto ids = manager->list();
    QVERIFY(std::find(ids.begin(), ids.end(), a) != ids.end());
    QVERIFY(manager->status(a)->state == DownloadStatus::Cancelled);
    QVERIFY(manager->status(b)->state == DownloadStatus::Cancelled);
    QCOMPARE(manager->restore(), 0);
    QCOMPARE(manager->list().size(), ids.size());
}

void TestDownloadManager::testRetryAfterError()
{
    const QByteArray payload = makePayload(1 * Constants::MiB);
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(payload, &client);
    client->failFetchesFrom(512 * Constants::KiB);
    QVERIFY(manager->initialize());

    const TaskId id = manager->submit(kUrl);
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->state == DownloadStatus::Error, 10000);
    QVERIFY(manager->status(id)->errorMessage.contains("stalled"));
    QTRY_VERIFY(manager->isIdle());

    client->failFetchesFrom(-1);
    QVERIFY(manager->retry(id));
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->state == DownloadStatus::Completed, 10000);
    QCOMPARE(readFile(manager->status(id)->filePath), payload);
    QVERIFY(!manager->retry(id));
}

void TestDownloadManager::testRejectsInvalidConcurrency()
{
    FakeRangeClient* client = nullptr;
    auto manager = makeManager(makePayload(1024), &client, 2);
    QVERIFY(manager->initialize());

    DownloadError error;
    QVERIFY(!manager->setMaxConcurrent(0, &error));
    QCOMPARE(error.category, ErrorCategory::ConcurrencyLimit);
    QCOMPARE(manager->queue().maxConcurrent(), 2);

    QVERIFY(manager->setMaxConcurrent(5));
    QCOMPARE(manager->queue().maxConcurrent(), 5);
}

void TestDownloadManager::testRestoreMapsStates()
{
    const QByteArray payload = makePayload(64 * Constants::KiB);
    const EngineConfig config = makeConfig();
    QVERIFY(QDir().mkpath(config.downloadsRoot));

    auto snapshotFor = [&config](const QString& name, DownloadStatus status) {
        StateSnapshot snap;
        snap.id = QUuid::createUuid();
        snap.url = QStringLiteral("http://fake.test/") + name;
        snap.filePath = QDir(config.downloadsRoot).absoluteFilePath(name);
        snap.status = status;
        return snap;
    };

    const StateSnapshot downloading = snapshotFor("d.bin", DownloadStatus::Downloading);
    const StateSnapshot interrupted = snapshotFor("i.bin", DownloadStatus::Interrupted);
    const StateSnapshot paused = snapshotFor("p.bin", DownloadStatus::Paused);
    const StateSnapshot queued = snapshotFor("q.bin", DownloadStatus::Queued);
    StateSnapshot completed = snapshotFor("c.bin", DownloadStatus::Completed);
    completed.totalSize = 0;
    {
        StateStore store(config.stateRoot);
        QVERIFY(store.open());
        for (const auto& snap : {downloading, interrupted, paused, queued, completed}) {
            store.save(snap);
        }
        store.close();
    }

    FakeRangeClient* client = nullptr;
    auto manager = makeManager(payload, &client);
    QVERIFY(manager->initialize());
    QCOMPARE(manager->restore(), 5);
    QCOMPARE(manager->list().size(), size_t(5));

    QVERIFY(manager->status(downloading.id)->state == DownloadStatus::Paused);
    QVERIFY(manager->status(interrupted.id)->state == DownloadStatus::Paused);
    QVERIFY(manager->status(paused.id)->state == DownloadStatus::Paused);
    QVERIFY(manager->status(completed.id)->state == DownloadStatus::Completed);
    QVERIFY(manager->store().get(downloading.id)->status == DownloadStatus::Paused);

    // Queued downloads go straight back into admission
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(queued.id)->state == DownloadStatus::Completed, 10000);
    QCOMPARE(readFile(manager->status(queued.id)->filePath), payload);

    // A second restore does not duplicate anything
    QCOMPARE(manager->restore(), 0);
}

void TestDownloadManager::testShutdownAndRestoreResumes()
{
    const QByteArray payload = makePayload(4 * Constants::MiB);
    TaskId id;
    ByteCount stopped = 0;
    {
        FakeRangeClient* client = nullptr;
        auto manager = makeManager(payload, &client);
        client->setFetchDelay(20);
        QVERIFY(manager->initialize());

        id = manager->submit(kUrl);
        QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->bytesTransferred > 0, 5000);
        manager->shutdown();
        QVERIFY(manager->list().empty());
    }

    {
        StateStore store(makeConfig().stateRoot);
        QVERIFY(store.open());
        auto stored = store.get(id);
        QVERIFY(stored.has_value());
        QVERIFY(stored->status == DownloadStatus::Paused);
        QVERIFY(stored->bytesTransferred > 0);
        QCOMPARE(stored->chunks.size(), size_t(2));
        stopped = stored->bytesTransferred;
        store.close();
    }

    FakeRangeClient* client = nullptr;
    auto manager = makeManager(payload, &client);
    QVERIFY(manager->initialize());
    QCOMPARE(manager->restore(), 1);
    QVERIFY(manager->status(id)->state == DownloadStatus::Paused);
    QCOMPARE(manager->status(id)->bytesTransferred, stopped);

    QVERIFY(manager->start(id));
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->state == DownloadStatus::Completed, 10000);
    QCOMPARE(readFile(manager->status(id)->filePath), payload);
    QCOMPARE(client->probeCount(), 0);

    // Only the bytes missing at shutdown are fetched again
    ByteCount refetched = 0;
    for (const auto& fetch : client->fetches()) {
        refetched += fetch.end - fetch.start + 1;
    }
    QCOMPARE(refetched, ByteCount(payload.size()) - stopped);
}

void TestDownloadManager::testRecoverOrphanedPartialFile()
{
    const QByteArray payload = makePayload(512 * Constants::KiB);
    const EngineConfig config = makeConfig();
    QVERIFY(QDir().mkpath(config.downloadsRoot));

    // A partial file and its sidecar without any stored state
    const QString finalPath = QDir(config.downloadsRoot).absoluteFilePath("payload.bin");
    QFile part(FileNaming::partialPathFor(finalPath));
    QVERIFY(part.open(QIODevice::WriteOnly));
    part.write(payload.left(100 * 1024));
    part.close();
    QVERIFY(FileNaming::writeSidecar(finalPath, kUrl));

    FakeRangeClient* client = nullptr;
    auto manager = makeManager(payload, &client);
    QVERIFY(manager->initialize());
    QCOMPARE(manager->recover(), 1);

    const TaskId id = StateStore::recoveryIdForUrl(kUrl);
    auto info = manager->status(id);
    QVERIFY(info.has_value());
    QVERIFY(info->state == DownloadStatus::Paused);
    QCOMPARE(info->totalBytes, ByteCount(-1));
    QCOMPARE(info->bytesTransferred, ByteCount(100 * 1024));
    QCOMPARE(info->filePath, finalPath);

    // Without a chunk list the download is planned afresh
    QVERIFY(manager->resume(id));
    QTRY_VERIFY_WITH_TIMEOUT(manager->status(id)->state == DownloadStatus::Completed, 10000);
    QCOMPARE(readFile(finalPath), payload);
    QCOMPARE(client->probeCount(), 1);
}

QTEST_MAIN(TestDownloadManager)
#include "test_downloadmanager.moc"
