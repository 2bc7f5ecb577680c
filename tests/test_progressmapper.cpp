/**
 * @file test_progressmapper.cpp
 * @brief Unit tests for ProgressMapper
 *
 * Tests parsing of the server's expanded item, the PATCH body and the
 * on-disk record shape.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include "mappers/progressmapper.h"

using namespace ShelfSync;

class TestProgressMapper : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    // ========== Server Item Tests ==========
    void testParseUserMediaProgress();
    void testFallbackToMediaProgress();
    void testNoProgressMeansNeverListened();
    void testItemIdFromItem();
    void testForeignProgressRejected();
    void testMalformedLastUpdate();
    void testMalformedCurrentTime();
    void testNegativePositionClamped();

    // ========== Patch Body Tests ==========
    void testPatchBodyRequiredFields();
    void testPatchBodyWithDuration();

    // ========== Storage Tests ==========
    void testStorageRoundTrip();
    void testStorageMissingFields();

private:
    static QJsonObject parse(const QByteArray &json);
};

void TestProgressMapper::initTestCase()
{
    qDebug() << "Starting ProgressMapper tests";
}

void TestProgressMapper::cleanupTestCase()
{
    qDebug() << "ProgressMapper tests complete";
}

QJsonObject TestProgressMapper::parse(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}

// ========== Server Item Tests ==========

void TestProgressMapper::testParseUserMediaProgress()
{
    QJsonObject item = parse(R"({
        "id": "li_abc",
        "media": {"duration": 3600},
        "userMediaProgress": {
            "libraryItemId": "li_abc",
            "currentTime": 1234.5,
            "duration": 3600,
            "isFinished": false,
            "lastUpdate": 1700000000123
        }
    })");

    bool ok = false;
    ProgressRecord record = ProgressMapper::progressFromItemJson(item, "li_abc", &ok);

    QVERIFY(ok);
    QCOMPARE(record.itemId, QString("li_abc"));
    QCOMPARE(record.elapsedSeconds, 1234.5);
    QCOMPARE(record.lastUpdate, qint64(1700000000123));
    QCOMPARE(record.duration, 3600.0);
    QVERIFY(!record.isFinished);
    QVERIFY(!record.pendingUpload);
}

void TestProgressMapper::testFallbackToMediaProgress()
{
    QJsonObject item = parse(R"({
        "id": "li_abc",
        "mediaProgress": {"currentTime": 10, "lastUpdate": 500, "isFinished": true}
    })");

    bool ok = false;
    ProgressRecord record = ProgressMapper::progressFromItemJson(item, "li_abc", &ok);

    QVERIFY(ok);
    QCOMPARE(record.elapsedSeconds, 10.0);
    QCOMPARE(record.lastUpdate, qint64(500));
    QVERIFY(record.isFinished);
}

void TestProgressMapper::testNoProgressMeansNeverListened()
{
    QJsonObject item = parse(R"({"id": "li_abc", "media": {}})");

    bool ok = false;
    ProgressRecord record = ProgressMapper::progressFromItemJson(item, "li_abc", &ok);

    QVERIFY(ok);
    QCOMPARE(record.itemId, QString("li_abc"));
    QCOMPARE(record.lastUpdate, qint64(0));
    QCOMPARE(record.elapsedSeconds, 0.0);
}

void TestProgressMapper::testItemIdFromItem()
{
    QJsonObject item = parse(R"({"id": "li_xyz"})");

    ProgressRecord record = ProgressMapper::progressFromItemJson(item, QString());
    QCOMPARE(record.itemId, QString("li_xyz"));
}

void TestProgressMapper::testForeignProgressRejected()
{
    QJsonObject item = parse(R"({
        "id": "li_abc",
        "userMediaProgress": {"libraryItemId": "li_other", "currentTime": 1, "lastUpdate": 2}
    })");

    bool ok = true;
    ProgressMapper::progressFromItemJson(item, "li_abc", &ok);
    QVERIFY(!ok);
}

void TestProgressMapper::testMalformedLastUpdate()
{
    QJsonObject item = parse(R"({
        "userMediaProgress": {"currentTime": 1, "lastUpdate": "yesterday"}
    })");

    bool ok = true;
    ProgressMapper::progressFromItemJson(item, "li_abc", &ok);
    QVERIFY(!ok);
}

void TestProgressMapper::testMalformedCurrentTime()
{
    QJsonObject item = parse(R"({
        "userMediaProgress": {"currentTime": "12:30", "lastUpdate": 100}
    })");

    bool ok = true;
    ProgressMapper::progressFromItemJson(item, "li_abc", &ok);
    QVERIFY(!ok);
}

void TestProgressMapper::testNegativePositionClamped()
{
    QJsonObject item = parse(R"({
        "userMediaProgress": {"currentTime": -3, "lastUpdate": 100}
    })");

    bool ok = false;
    ProgressRecord record = ProgressMapper::progressFromItemJson(item, "li_abc", &ok);
    QVERIFY(ok);
    QCOMPARE(record.elapsedSeconds, 0.0);
    QVERIFY(record.isValid());
}

// ========== Patch Body Tests ==========

void TestProgressMapper::testPatchBodyRequiredFields()
{
    ProgressRecord record = ProgressRecord::fromPlayback(
        "li_abc", 99.5, QDateTime::fromMSecsSinceEpoch(1700000000000));

    QJsonObject body = ProgressMapper::progressToPatchJson(record);

    QCOMPARE(body["currentTime"].toDouble(), 99.5);
    QCOMPARE(body["lastUpdate"].toInteger(), qint64(1700000000000));
    QCOMPARE(body["isFinished"].toBool(true), false);
    QVERIFY(!body.contains("duration"));
    QVERIFY(!body.contains("progress"));
    QVERIFY(!body.contains("itemId"));
}

void TestProgressMapper::testPatchBodyWithDuration()
{
    ProgressRecord record;
    record.itemId = "li_abc";
    record.elapsedSeconds = 900.0;
    record.duration = 3600.0;
    record.lastUpdate = 42;

    QJsonObject body = ProgressMapper::progressToPatchJson(record);

    QCOMPARE(body["duration"].toDouble(), 3600.0);
    QCOMPARE(body["progress"].toDouble(), 0.25);
}

// ========== Storage Tests ==========

void TestProgressMapper::testStorageRoundTrip()
{
    ProgressRecord record;
    record.itemId = "li_abc";
    record.elapsedSeconds = 61.25;
    record.lastUpdate = 1700000000999;
    record.pendingUpload = true;
    record.duration = 120.0;
    record.isFinished = false;

    QVERIFY(ProgressMapper::recordFromJson(ProgressMapper::recordToJson(record)) == record);
}

void TestProgressMapper::testStorageMissingFields()
{
    ProgressRecord record = ProgressMapper::recordFromJson(parse(R"({"itemId": "li_abc"})"));

    QCOMPARE(record.itemId, QString("li_abc"));
    QCOMPARE(record.lastUpdate, qint64(0));
    QVERIFY(!record.pendingUpload);
    QVERIFY(record.isValid());
}

QTEST_MAIN(TestProgressMapper)
#include "test_progressmapper.moc"
