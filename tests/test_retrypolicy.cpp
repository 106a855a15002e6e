/**
 * @file test_retrypolicy.cpp
 * @brief Unit tests for RetryPolicy backoff and retry loop
 */

#include <QtTest>
#include <QElapsedTimer>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>

#include "chunkdm/engine/ControlToken.h"
#include "chunkdm/engine/RetryPolicy.h"

using namespace ChunkDM;

namespace {

RetryPolicy fastPolicy(int maxAttempts = 4)
{
    RetryPolicy::Config config;
    config.maxAttempts = maxAttempts;
    config.baseDelay = Duration(1);
    config.maxDelay = Duration(10);
    return RetryPolicy(config);
}

} // namespace

class TestRetryPolicy : public QObject
{
    Q_OBJECT

private slots:
    void testDelayBounds();
    void testDelayCappedAtMaximum();
    void testSucceedsAfterTransientFailures();
    void testGivesUpAfterMaxAttempts();
    void testTerminalErrorStopsImmediately();
    void testCancelledTokenStopsLoop();
    void testCancelInterruptsBackoff();
};

void TestRetryPolicy::testDelayBounds()
{
    RetryPolicy policy;
    for (int k = 1; k <= 8; ++k) {
        for (int sample = 0; sample < 50; ++sample) {
            const qint64 delay = policy.computeDelay(k).count();
            const double nominal = double(1 << k) * 1000.0;
            QVERIFY2(delay >= qint64(0.8 * nominal) - 1,
                     qPrintable(QString("attempt %1 delay %2").arg(k).arg(delay)));
            QVERIFY2(delay <= std::min<qint64>(qint64(1.2 * nominal), 60000),
                     qPrintable(QString("attempt %1 delay %2").arg(k).arg(delay)));
        }
    }
}

void TestRetryPolicy::testDelayCappedAtMaximum()
{
    RetryPolicy policy;
    QVERIFY(policy.computeDelay(10) == Duration(60000));
    QVERIFY(policy.computeDelay(1000) == Duration(60000));
}

void TestRetryPolicy::testSucceedsAfterTransientFailures()
{
    RetryPolicy policy = fastPolicy(4);
    int calls = 0;

    auto result = policy.run([&calls](DownloadError* error) -> std::optional<int> {
        if (++calls < 3) {
            *error = DownloadError::make(ErrorCategory::Network, "connection reset");
            return std::nullopt;
        }
        return 42;
    });

    QVERIFY(result.has_value());
    QCOMPARE(*result, 42);
    QCOMPARE(calls, 3);
}

void TestRetryPolicy::testGivesUpAfterMaxAttempts()
{
    RetryPolicy policy = fastPolicy(4);
    int calls = 0;
    DownloadError lastError;

    auto result = policy.run([&calls](DownloadError* error) -> std::optional<int> {
        ++calls;
        *error = DownloadError::make(ErrorCategory::ServerError, "503");
        return std::nullopt;
    }, 0, nullptr, &lastError);

    QVERIFY(!result.has_value());
    QCOMPARE(calls, 4);
    QCOMPARE(lastError.category, ErrorCategory::ServerError);
    QCOMPARE(lastError.retryCount, 3);

    // An explicit budget overrides the configured one
    calls = 0;
    result = policy.run([&calls](DownloadError* error) -> std::optional<int> {
        ++calls;
        *error = DownloadError::make(ErrorCategory::Timeout, "timeout");
        return std::nullopt;
    }, 2);
    QCOMPARE(calls, 2);
}

void TestRetryPolicy::testTerminalErrorStopsImmediately()
{
    RetryPolicy policy = fastPolicy(5);
    int calls = 0;
    DownloadError lastError;

    auto result = policy.run([&calls](DownloadError* error) -> std::optional<int> {
        ++calls;
        *error = DownloadError::make(ErrorCategory::NotFound, "404", 404);
        return std::nullopt;
    }, 0, nullptr, &lastError);

    QVERIFY(!result.has_value());
    QCOMPARE(calls, 1);
    QCOMPARE(lastError.category, ErrorCategory::NotFound);
    QCOMPARE(lastError.errorCode, 404);
}

void TestRetryPolicy::testCancelledTokenStopsLoop()
{
    RetryPolicy policy = fastPolicy(5);
    ControlToken token;
    token.cancel();

    int calls = 0;
    DownloadError lastError;
    auto result = policy.run([&calls](DownloadError*) -> std::optional<int> {
        ++calls;
        return 1;
    }, 0, &token, &lastError);

    QVERIFY(!result.has_value());
    QCOMPARE(calls, 0);
    QCOMPARE(lastError.category, ErrorCategory::Cancelled);
}

void TestRetryPolicy::testCancelInterruptsBackoff()
{
    RetryPolicy::Config config;
    config.maxAttempts = 3;
    config.baseDelay = Duration(5000);
    config.maxDelay = Duration(60000);
    RetryPolicy policy(config);
    ControlToken token;

    QTimer::singleShot(100, [&token]() { token.cancel(); });

    QElapsedTimer timer;
    timer.start();
    DownloadError lastError;
    auto future = QtConcurrent::run([&]() {
        return policy.run([](DownloadError* error) -> std::optional<int> {
            *error = DownloadError::make(ErrorCategory::Network, "down");
            return std::nullopt;
        }, 0, &token, &lastError);
    });

    QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 5000);
    QVERIFY(!future.result().has_value());
    QVERIFY(timer.elapsed() < 5000);
    QCOMPARE(lastError.category, ErrorCategory::Cancelled);
}

QTEST_MAIN(TestRetryPolicy)
#include "test_retrypolicy.moc"
