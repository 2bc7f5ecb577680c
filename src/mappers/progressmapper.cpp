#include "progressmapper.h"

#include <QJsonValue>

using ShelfSync::ProgressRecord;

static void setOk(bool *ok, bool value)
{
    if (ok) {
        *ok = value;
    }
}

// ========== Server shape ==========

ProgressRecord ProgressMapper::progressFromItemJson(const QJsonObject &item,
                                                    const QString &itemId,
                                                    bool *ok)
{
    ProgressRecord record;
    record.itemId = itemId.isEmpty() ? item["id"].toString() : itemId;
    setOk(ok, true);

    QJsonValue progressValue = item["userMediaProgress"];
    if (!progressValue.isObject()) {
        progressValue = item["mediaProgress"];
    }
    if (!progressValue.isObject()) {
        // Nothing listened on the server yet
        return record;
    }

    QJsonObject progress = progressValue.toObject();

    // A progress object for some other item is not ours to adopt
    QString progressItemId = progress["libraryItemId"].toString();
    if (!progressItemId.isEmpty() && progressItemId != record.itemId) {
        setOk(ok, false);
        return record;
    }

    QJsonValue lastUpdate = progress["lastUpdate"];
    QJsonValue currentTime = progress["currentTime"];
    if (!lastUpdate.isDouble()
        || (!currentTime.isUndefined() && !currentTime.isNull() && !currentTime.isDouble())) {
        setOk(ok, false);
        return record;
    }

    record.lastUpdate = lastUpdate.toInteger();
    record.elapsedSeconds = qMax(0.0, currentTime.toDouble(0.0));
    record.duration = qMax(0.0, progress["duration"].toDouble(0.0));
    record.isFinished = progress["isFinished"].toBool(false);
    record.pendingUpload = false;
    return record;
}

QJsonObject ProgressMapper::progressToPatchJson(const ProgressRecord &record)
{
    QJsonObject body;
    body["currentTime"] = record.elapsedSeconds;
    body["lastUpdate"] = record.lastUpdate;
    body["isFinished"] = record.isFinished;

    if (record.duration > 0.0) {
        body["duration"] = record.duration;
        body["progress"] = record.progressFraction();
    }
    return body;
}

// ========== Storage shape ==========

QJsonObject ProgressMapper::recordToJson(const ProgressRecord &record)
{
    QJsonObject obj;
    obj["itemId"] = record.itemId;
    obj["elapsedSeconds"] = record.elapsedSeconds;
    obj["lastUpdate"] = record.lastUpdate;
    obj["pendingUpload"] = record.pendingUpload;
    obj["duration"] = record.duration;
    obj["isFinished"] = record.isFinished;
    return obj;
}

ProgressRecord ProgressMapper::recordFromJson(const QJsonObject &json)
{
    ProgressRecord record;
    record.itemId = json["itemId"].toString();
    record.elapsedSeconds = json["elapsedSeconds"].toDouble();
    record.lastUpdate = json["lastUpdate"].toInteger();
    record.pendingUpload = json["pendingUpload"].toBool();
    record.duration = json["duration"].toDouble();
    record.isFinished = json["isFinished"].toBool();
    return record;
}
