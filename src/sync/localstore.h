#ifndef LOCALSTORE_H
#define LOCALSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include "synctypes.h"

namespace ShelfSync {

/**
 * @brief Abstract interface for local progress storage
 *
 * The sync engine assumes each call is atomic for a single record.
 * It does no locking of its own.
 *
 * Implementations:
 *   - JsonFileStore: one JSON document in the profile's state directory
 *   - Test fakes
 */
class LocalStore : public QObject
{
    Q_OBJECT

public:
    explicit LocalStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~LocalStore() = default;

    /**
     * @brief Look up the stored record for an item
     * @return false if the item is not stored
     */
    virtual bool get(const QString &itemId, ProgressRecord &record) const = 0;

    /**
     * @brief Insert or replace the record for record.itemId
     * @return true once the record is durably stored
     */
    virtual bool put(const ProgressRecord &record) = 0;

    /**
     * @brief All records with pendingUpload set, in store order
     */
    virtual QList<ProgressRecord> listPending() const = 0;

    /**
     * @brief Clear pendingUpload for an item
     *
     * Marking an already-synced item again changes nothing.
     * @return false if the item is unknown or the write failed
     */
    virtual bool markSynced(const QString &itemId) = 0;

signals:
    void recordChanged(const QString &itemId);
    void errorOccurred(const QString &error);
};

} // namespace ShelfSync

#endif // LOCALSTORE_H
