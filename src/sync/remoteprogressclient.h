#ifndef REMOTEPROGRESSCLIENT_H
#define REMOTEPROGRESSCLIENT_H

#include <QObject>
#include <QString>
#include "synctypes.h"

namespace ShelfSync {

/**
 * @brief Abstract interface to the library server's progress records
 *
 * A client performs exactly one network attempt per call. It never
 * retries on its own; retry policy belongs to the sync engine.
 *
 * Implementations:
 *   - HttpProgressClient: the library server's REST API
 *   - Test fakes
 *
 * Failures are reported by returning false. Implementations may also
 * throw std::exception for unexpected conditions; callers treat that
 * the same as a false return.
 */
class RemoteProgressClient : public QObject
{
    Q_OBJECT

public:
    explicit RemoteProgressClient(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RemoteProgressClient() = default;

    /**
     * @brief Human-readable name for display
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Fetch the server's current record for an item
     * @param itemId Library item to look up
     * @param remote Filled with the server record on success. An item
     *               the server has no progress for comes back with
     *               lastUpdate == 0.
     * @return true if the server answered with usable data
     */
    virtual bool fetch(const QString &itemId, ProgressRecord &remote) = 0;

    /**
     * @brief Push a local record to the server
     * @return true if the server confirmed the write
     */
    virtual bool push(const ProgressRecord &record) = 0;

    /**
     * @brief Description of the last failure, empty if none
     */
    virtual QString lastError() const { return QString(); }

signals:
    void errorOccurred(const QString &error);
};

} // namespace ShelfSync

#endif // REMOTEPROGRESSCLIENT_H
