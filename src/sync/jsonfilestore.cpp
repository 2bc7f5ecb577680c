#include "jsonfilestore.h"
#include "../mappers/progressmapper.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonObject>
#include <QDebug>

namespace ShelfSync {

static const int STORE_FORMAT_VERSION = 1;

JsonFileStore::JsonFileStore(const QString &stateDir, QObject *parent)
    : LocalStore(parent)
    , m_stateDir(stateDir)
{
}

QString JsonFileStore::filePath() const
{
    return QDir(m_stateDir).filePath("progress.json");
}

bool JsonFileStore::ensureStateDir()
{
    QDir dir(m_stateDir);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }
    return true;
}

// ========== LocalStore ==========

bool JsonFileStore::get(const QString &itemId, ProgressRecord &record) const
{
    auto it = m_records.constFind(itemId);
    if (it == m_records.constEnd()) {
        return false;
    }
    record = it.value();
    return true;
}

bool JsonFileStore::put(const ProgressRecord &record)
{
    if (!record.isValid()) {
        emit errorOccurred(QString("Refusing to store invalid record: %1").arg(record.description()));
        return false;
    }

    const bool isNew = !m_records.contains(record.itemId);
    const ProgressRecord previous = m_records.value(record.itemId);

    m_records[record.itemId] = record;
    if (isNew) {
        m_order.append(record.itemId);
    }

    if (!save()) {
        if (isNew) {
            m_records.remove(record.itemId);
            m_order.removeAll(record.itemId);
        } else {
            m_records[record.itemId] = previous;
        }
        return false;
    }

    emit recordChanged(record.itemId);
    return true;
}

QList<ProgressRecord> JsonFileStore::listPending() const
{
    QList<ProgressRecord> pending;
    for (const QString &id : m_order) {
        const ProgressRecord record = m_records.value(id);
        if (record.pendingUpload) {
            pending.append(record);
        }
    }
    return pending;
}

bool JsonFileStore::markSynced(const QString &itemId)
{
    if (!m_records.contains(itemId)) {
        return false;
    }

    ProgressRecord &record = m_records[itemId];
    if (!record.pendingUpload) {
        return true;
    }

    record.pendingUpload = false;
    if (!save()) {
        m_records[itemId].pendingUpload = true;
        return false;
    }

    emit recordChanged(itemId);
    return true;
}

// ========== Record Management ==========

bool JsonFileStore::recordPlayback(const QString &itemId, double elapsedSeconds,
                                   const QDateTime &now)
{
    ProgressRecord record = ProgressRecord::fromPlayback(itemId, elapsedSeconds, now);

    ProgressRecord existing;
    if (get(itemId, existing)) {
        record.duration = existing.duration;
    }
    if (record.duration > 0.0 && elapsedSeconds >= record.duration) {
        record.isFinished = true;
    }

    return put(record);
}

bool JsonFileStore::remove(const QString &itemId)
{
    if (!m_records.contains(itemId)) {
        return false;
    }

    const ProgressRecord previous = m_records.take(itemId);
    const int index = m_order.indexOf(itemId);
    m_order.removeAt(index);

    if (!save()) {
        m_records[itemId] = previous;
        m_order.insert(index, itemId);
        return false;
    }

    emit recordChanged(itemId);
    return true;
}

QList<ProgressRecord> JsonFileStore::allRecords() const
{
    QList<ProgressRecord> records;
    for (const QString &id : m_order) {
        records.append(m_records.value(id));
    }
    return records;
}

int JsonFileStore::pendingCount() const
{
    int count = 0;
    for (const ProgressRecord &record : m_records) {
        if (record.pendingUpload) {
            count++;
        }
    }
    return count;
}

// ========== Persistence ==========

bool JsonFileStore::load()
{
    QFile file(filePath());
    if (!file.exists()) {
        // No previous state - this is fine for a new profile
        m_records.clear();
        m_order.clear();
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open progress file: %1").arg(filePath()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse progress file: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    int version = root["version"].toInt(STORE_FORMAT_VERSION);
    if (version > STORE_FORMAT_VERSION) {
        emit errorOccurred(QString("Unsupported progress file version: %1").arg(version));
        return false;
    }

    m_records.clear();
    m_order.clear();

    QJsonArray recordsArray = root["records"].toArray();
    for (const QJsonValue &val : recordsArray) {
        ProgressRecord record = ProgressMapper::recordFromJson(val.toObject());
        if (!record.isValid()) {
            qWarning() << "[JsonFileStore] Skipping invalid record in" << filePath();
            continue;
        }
        if (!m_records.contains(record.itemId)) {
            m_order.append(record.itemId);
        }
        m_records[record.itemId] = record;
    }

    qDebug() << "[JsonFileStore] Loaded" << m_records.size() << "records,"
             << pendingCount() << "pending";
    return true;
}

bool JsonFileStore::save()
{
    if (!ensureStateDir()) {
        return false;
    }

    QJsonObject root;
    root["version"] = STORE_FORMAT_VERSION;

    QJsonArray recordsArray;
    for (const QString &id : m_order) {
        recordsArray.append(ProgressMapper::recordToJson(m_records.value(id)));
    }
    root["records"] = recordsArray;

    QSaveFile file(filePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save progress file: %1").arg(filePath()));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit progress file: %1").arg(filePath()));
        return false;
    }

    qDebug() << "[JsonFileStore] Saved" << m_records.size() << "records";
    return true;
}

bool JsonFileStore::clear()
{
    m_records.clear();
    m_order.clear();
    return save();
}

} // namespace ShelfSync
