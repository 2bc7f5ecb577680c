#ifndef JSONFILESTORE_H
#define JSONFILESTORE_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QMap>
#include "localstore.h"

namespace ShelfSync {

/**
 * @brief LocalStore kept as a single JSON document on disk
 *
 * State is stored in:
 *   <stateDir>/
 *     └── progress.json  - every known item, in insertion order
 *
 * Every change is written through immediately with QSaveFile, so a
 * record is either fully stored or not at all. If a write fails the
 * in-memory state is rolled back.
 */
class JsonFileStore : public LocalStore
{
    Q_OBJECT

public:
    /**
     * @brief Create a store for a state directory
     * @param stateDir Directory that holds progress.json
     * @param parent Parent QObject
     *
     * Call load() before use to read existing records.
     */
    explicit JsonFileStore(const QString &stateDir, QObject *parent = nullptr);
    ~JsonFileStore() override = default;

    // ========== LocalStore ==========

    bool get(const QString &itemId, ProgressRecord &record) const override;
    bool put(const ProgressRecord &record) override;
    QList<ProgressRecord> listPending() const override;
    bool markSynced(const QString &itemId) override;

    // ========== Record Management ==========

    /**
     * @brief Store a new playback position as a pending change
     *
     * Keeps the known duration of an existing record.
     */
    bool recordPlayback(const QString &itemId, double elapsedSeconds,
                        const QDateTime &now = QDateTime::currentDateTimeUtc());

    /**
     * @brief Remove an item (e.g. when it left the library)
     */
    bool remove(const QString &itemId);

    bool contains(const QString &itemId) const { return m_records.contains(itemId); }
    QList<ProgressRecord> allRecords() const;
    int count() const { return m_order.size(); }
    int pendingCount() const;

    // ========== Persistence ==========

    /**
     * @brief Load records from disk
     * @return true if loaded successfully (or if no file exists yet)
     */
    bool load();

    /**
     * @brief Write all records to disk
     */
    bool save();

    /**
     * @brief Remove every record and save
     */
    bool clear();

    QString stateDirectory() const { return m_stateDir; }
    QString filePath() const;

private:
    bool ensureStateDir();

    QString m_stateDir;
    QMap<QString, ProgressRecord> m_records;
    QStringList m_order;  // item ids in insertion order
};

} // namespace ShelfSync

#endif // JSONFILESTORE_H
