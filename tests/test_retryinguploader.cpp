/**
 * @file test_retryinguploader.cpp
 * @brief Unit tests for RetryingUploader and Backoff
 *
 * Waits are recorded instead of slept, except in the real timer test.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QElapsedTimer>
#include "sync/retryinguploader.h"
#include "sync/backoff.h"
#include "fakecollaborators.h"

using namespace ShelfSync;

using Outcome = FakeRemoteClient::Outcome;

class TestRetryingUploader : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Success Tests ==========
    void testFirstAttemptSucceeds();
    void testStoresSyncedRecord();
    void testSucceedsAfterTransientFailures();

    // ========== Exhaustion Tests ==========
    void testGivesUpAfterMaxRetries();
    void testZeroRetries();
    void testAttemptFailedSignals();
    void testThrowCountsAsAttempt();
    void testFailureReasonReported();

    // ========== Storage Tests ==========
    void testStoreFailureAfterUpload();

    // ========== Cancel Tests ==========
    void testCancelDuringWait();
    void testCancelCheck();

    // ========== Backoff Tests ==========
    void testDelaySchedule();
    void testRealTimerWaits();
    void testDelayCapped();
    void testNegativeDelayDoesNotWait();
    void testCancelWakesNestedWaits();

private:
    FakeRemoteClient *m_client;
    MemoryStore *m_store;
    Backoff *m_backoff;
    RetryingUploader *m_uploader;
    QList<qint64> m_waits;
};

void TestRetryingUploader::initTestCase()
{
    qDebug() << "Starting RetryingUploader tests";
}

void TestRetryingUploader::cleanupTestCase()
{
    qDebug() << "RetryingUploader tests complete";
}

void TestRetryingUploader::init()
{
    m_waits.clear();
    m_client = new FakeRemoteClient();
    m_store = new MemoryStore();
    m_backoff = new Backoff();
    m_backoff->setWaitFunction([this](qint64 delayMs) { m_waits.append(delayMs); });
    m_uploader = new RetryingUploader(m_client, m_store, m_backoff);
}

void TestRetryingUploader::cleanup()
{
    delete m_uploader;
    delete m_backoff;
    delete m_store;
    delete m_client;
    m_uploader = nullptr;
    m_backoff = nullptr;
    m_store = nullptr;
    m_client = nullptr;
}

// ========== Success Tests ==========

void TestRetryingUploader::testFirstAttemptSucceeds()
{
    ProgressRecord record = pendingRecord("li_1", 42.0, 1000);

    QVERIFY(m_uploader->uploadWithRetry(record));
    QCOMPARE(m_uploader->lastAttemptCount(), 1);
    QCOMPARE(m_client->pushCalls.size(), 1);
    QVERIFY(m_waits.isEmpty());
}

void TestRetryingUploader::testStoresSyncedRecord()
{
    ProgressRecord record = pendingRecord("li_1", 42.0, 1000);
    m_store->seed(record);

    QVERIFY(m_uploader->uploadWithRetry(record));

    ProgressRecord stored;
    QVERIFY(m_store->get("li_1", stored));
    QVERIFY(!stored.pendingUpload);
    QCOMPARE(stored.elapsedSeconds, 42.0);
    QCOMPARE(stored.lastUpdate, qint64(1000));
}

void TestRetryingUploader::testSucceedsAfterTransientFailures()
{
    m_client->pushScript = {Outcome::Fail, Outcome::Fail, Outcome::Succeed};

    QVERIFY(m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastAttemptCount(), 3);
    QCOMPARE(m_waits, QList<qint64>({1000, 2000}));
    QVERIFY(!m_store->record("li_1").pendingUpload);
}

// ========== Exhaustion Tests ==========

void TestRetryingUploader::testGivesUpAfterMaxRetries()
{
    ProgressRecord record = pendingRecord("li_1", 1.0, 1000);
    m_store->seed(record);
    m_client->failingPushItems.insert("li_1");

    QVERIFY(!m_uploader->uploadWithRetry(record));
    QCOMPARE(m_uploader->lastAttemptCount(), 4);
    QCOMPARE(m_client->pushCalls.size(), 4);
    QCOMPARE(m_waits, QList<qint64>({1000, 2000, 4000}));

    // Still pending for the next pass
    QVERIFY(m_store->record("li_1").pendingUpload);
    QCOMPARE(m_store->putCalls, 0);
}

void TestRetryingUploader::testZeroRetries()
{
    SyncOptions options;
    options.maxRetries = 0;
    m_uploader->setOptions(options);
    m_client->failingPushItems.insert("li_1");

    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastAttemptCount(), 1);
    QVERIFY(m_waits.isEmpty());
}

void TestRetryingUploader::testAttemptFailedSignals()
{
    QSignalSpy spy(m_uploader, &RetryingUploader::attemptFailed);
    m_client->failingPushItems.insert("li_1");

    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));

    // No retry follows the final attempt
    QCOMPARE(spy.count(), 3);
    QCOMPARE(spy.at(0).at(1).toInt(), 1);
    QCOMPARE(spy.at(0).at(2).toLongLong(), qint64(1000));
    QCOMPARE(spy.at(2).at(1).toInt(), 3);
    QCOMPARE(spy.at(2).at(2).toLongLong(), qint64(4000));
}

void TestRetryingUploader::testThrowCountsAsAttempt()
{
    m_client->pushScript = {Outcome::Throw, Outcome::Succeed};

    QVERIFY(m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastAttemptCount(), 2);
    QCOMPARE(m_waits, QList<qint64>({1000}));
}

void TestRetryingUploader::testFailureReasonReported()
{
    m_client->failingPushItems.insert("li_1");
    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastError(), QString("push rejected for li_1"));

    m_client->failingPushItems.clear();
    m_client->pushScript = {Outcome::Throw, Outcome::Throw, Outcome::Throw, Outcome::Throw};
    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastError(), QString("push exploded"));

    QVERIFY(m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QVERIFY(m_uploader->lastError().isEmpty());
}

// ========== Storage Tests ==========

void TestRetryingUploader::testStoreFailureAfterUpload()
{
    m_store->failPuts = true;

    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));

    // The push itself is not retried
    QCOMPARE(m_client->pushCalls.size(), 1);
    QCOMPARE(m_store->putCalls, 1);
    QVERIFY(m_uploader->lastError().contains("could not store"));
}

// ========== Cancel Tests ==========

void TestRetryingUploader::testCancelDuringWait()
{
    m_backoff->setWaitFunction([this](qint64 delayMs) {
        m_waits.append(delayMs);
        m_backoff->cancel();
    });
    m_client->failingPushItems.insert("li_1");

    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastAttemptCount(), 1);
    QCOMPARE(m_waits.size(), 1);
}

void TestRetryingUploader::testCancelCheck()
{
    m_backoff->setCancelCheck([]() { return true; });

    QVERIFY(!m_uploader->uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));
    QCOMPARE(m_uploader->lastAttemptCount(), 0);
    QVERIFY(m_client->pushCalls.isEmpty());
}

// ========== Backoff Tests ==========

void TestRetryingUploader::testDelaySchedule()
{
    SyncOptions options;
    QCOMPARE(options.delayForAttempt(0), qint64(1000));
    QCOMPARE(options.delayForAttempt(1), qint64(2000));
    QCOMPARE(options.delayForAttempt(2), qint64(4000));

    options.baseDelayMs = 250;
    QCOMPARE(options.delayForAttempt(3), qint64(2000));
}

void TestRetryingUploader::testRealTimerWaits()
{
    Backoff backoff;
    SyncOptions options;
    options.maxRetries = 2;
    options.baseDelayMs = 20;

    RetryingUploader uploader(m_client, m_store, &backoff, options);
    m_client->failingPushItems.insert("li_1");

    QElapsedTimer elapsed;
    elapsed.start();
    QVERIFY(!uploader.uploadWithRetry(pendingRecord("li_1", 1.0, 1000)));

    // 20ms + 40ms between three attempts
    QVERIFY(elapsed.elapsed() >= 55);
    QVERIFY(backoff.totalWaitedMs() >= 55);
    QCOMPARE(uploader.lastAttemptCount(), 3);
}

void TestRetryingUploader::testDelayCapped()
{
    SyncOptions options;
    options.baseDelayMs = 60000;

    QCOMPARE(options.delayForAttempt(2), qint64(240000));
    QCOMPARE(options.delayForAttempt(3), SyncOptions::MAX_DELAY_MS);
    QCOMPARE(options.delayForAttempt(40), SyncOptions::MAX_DELAY_MS);
    QCOMPARE(options.delayForAttempt(100), SyncOptions::MAX_DELAY_MS);

    options.baseDelayMs = 1;
    QCOMPARE(options.delayForAttempt(64), SyncOptions::MAX_DELAY_MS);

    options.baseDelayMs = -5;
    QCOMPARE(options.delayForAttempt(10), qint64(0));
}

void TestRetryingUploader::testNegativeDelayDoesNotWait()
{
    Backoff backoff;
    QSignalSpy spy(&backoff, &Backoff::waitStarted);

    QElapsedTimer elapsed;
    elapsed.start();
    QVERIFY(backoff.wait(-1000));

    QVERIFY(elapsed.elapsed() < 500);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toLongLong(), qint64(0));
}

void TestRetryingUploader::testCancelWakesNestedWaits()
{
    Backoff backoff;
    bool innerResult = true;

    // Start a second wait from an event handled during the first one
    QTimer::singleShot(0, &backoff, [&]() { innerResult = backoff.wait(5000); });
    QTimer::singleShot(50, &backoff, [&]() { backoff.cancel(); });

    QElapsedTimer elapsed;
    elapsed.start();
    QVERIFY(!backoff.wait(5000));

    QVERIFY(!innerResult);
    QVERIFY(elapsed.elapsed() < 2000);
}

QTEST_MAIN(TestRetryingUploader)
#include "test_retryinguploader.moc"
