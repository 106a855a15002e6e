/**
 * @file test_chunkplanner.cpp
 * @brief Unit tests for chunk planning and the thread-count heuristic
 */

#include <QtTest>

#include "chunkdm/engine/ChunkPlanner.h"

using namespace ChunkDM;

class TestChunkPlanner : public QObject
{
    Q_OBJECT

private slots:
    void testExactCoverage_data();
    void testExactCoverage();
    void testLastChunkAbsorbsRemainder();
    void testSingleChunkCases();
    void testMoreChunksThanBytes();
    void testThreadCountBoundaries_data();
    void testThreadCountBoundaries();
    void testNoRangeSupportUsesOneChunk();
};

void TestChunkPlanner::testExactCoverage_data()
{
    QTest::addColumn<qint64>("totalSize");
    QTest::addColumn<int>("n");

    QTest::newRow("even") << qint64(1000) << 4;
    QTest::newRow("remainder") << qint64(1003) << 4;
    QTest::newRow("prime") << qint64(7919) << 8;
    QTest::newRow("one chunk") << qint64(12345) << 1;
    QTest::newRow("10 MiB") << qint64(10 * Constants::MiB) << 2;
    QTest::newRow("large") << qint64(3) * 1024 * 1024 * 1024 + 17 << 8;
    QTest::newRow("n equals size") << qint64(5) << 5;
}

void TestChunkPlanner::testExactCoverage()
{
    QFETCH(qint64, totalSize);
    QFETCH(int, n);

    const ChunkList chunks = ChunkPlanner::plan(totalSize, n);
    QVERIFY(!chunks.empty());
    QVERIFY(static_cast<int>(chunks.size()) <= n);

    ByteOffset expectedStart = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        QCOMPARE(chunk->index(), static_cast<int>(i));
        QCOMPARE(chunk->start(), expectedStart);
        QVERIFY(chunk->end() >= chunk->start());
        QCOMPARE(chunk->current(), chunk->start());
        QVERIFY(!chunk->isCompleted());
        expectedStart = chunk->end() + 1;
    }
    QCOMPARE(expectedStart, ByteOffset(totalSize));
    QVERIFY(validateChunks(snapshotChunks(chunks), totalSize));
}

void TestChunkPlanner::testLastChunkAbsorbsRemainder()
{
    const ChunkList chunks = ChunkPlanner::plan(10, 3);
    QCOMPARE(chunks.size(), size_t(3));
    QCOMPARE(chunks[0]->start(), ByteOffset(0));
    QCOMPARE(chunks[0]->end(), ByteOffset(2));
    QCOMPARE(chunks[1]->start(), ByteOffset(3));
    QCOMPARE(chunks[1]->end(), ByteOffset(5));
    QCOMPARE(chunks[2]->start(), ByteOffset(6));
    QCOMPARE(chunks[2]->end(), ByteOffset(9));
}

void TestChunkPlanner::testSingleChunkCases()
{
    auto unknown = ChunkPlanner::plan(-1, 4);
    QCOMPARE(unknown.size(), size_t(1));
    QVERIFY(unknown[0]->isUnbounded());
    QCOMPARE(unknown[0]->start(), ByteOffset(0));

    auto empty = ChunkPlanner::plan(0, 8);
    QCOMPARE(empty.size(), size_t(1));
    QVERIFY(empty[0]->isUnbounded());

    auto single = ChunkPlanner::plan(4096, 1);
    QCOMPARE(single.size(), size_t(1));
    QCOMPARE(single[0]->end(), ByteOffset(4095));

    auto zeroThreads = ChunkPlanner::plan(4096, 0);
    QCOMPARE(zeroThreads.size(), size_t(1));
}

void TestChunkPlanner::testMoreChunksThanBytes()
{
    const ChunkList chunks = ChunkPlanner::plan(3, 8);
    QCOMPARE(chunks.size(), size_t(3));
    for (const auto& chunk : chunks) {
        QCOMPARE(chunk->end() - chunk->start() + 1, ByteCount(1));
    }
}

void TestChunkPlanner::testThreadCountBoundaries_data()
{
    QTest::addColumn<qint64>("totalSize");
    QTest::addColumn<int>("expected");

    QTest::newRow("unknown") << qint64(-1) << 1;
    QTest::newRow("empty") << qint64(0) << 1;
    QTest::newRow("tiny") << qint64(1) << 2;
    QTest::newRow("10 MiB") << qint64(10 * Constants::MiB) << 2;
    QTest::newRow("10 MiB + 1") << qint64(10 * Constants::MiB + 1) << 4;
    QTest::newRow("100 MiB") << qint64(100 * Constants::MiB) << 4;
    QTest::newRow("100 MiB + 1") << qint64(100 * Constants::MiB + 1) << 8;
    QTest::newRow("4 GiB") << qint64(4096) * Constants::MiB << 8;
}

void TestChunkPlanner::testThreadCountBoundaries()
{
    QFETCH(qint64, totalSize);
    QFETCH(int, expected);

    QCOMPARE(ChunkPlanner::threadCountFor(totalSize), expected);
}

void TestChunkPlanner::testNoRangeSupportUsesOneChunk()
{
    const ByteCount size = 50 * Constants::MiB;
    const int n = ChunkPlanner::threadCountFor(size, false);
    QCOMPARE(n, 1);

    const ChunkList chunks = ChunkPlanner::plan(size, n);
    QCOMPARE(chunks.size(), size_t(1));
    QCOMPARE(chunks[0]->end(), size - 1);
}

QTEST_MAIN(TestChunkPlanner)
#include "test_chunkplanner.moc"
