#ifndef RETRYINGUPLOADER_H
#define RETRYINGUPLOADER_H

#include <QObject>
#include <QString>
#include "synctypes.h"

namespace ShelfSync {

class Backoff;
class LocalStore;
class RemoteProgressClient;

/**
 * @brief Pushes one record to the server with bounded exponential backoff
 *
 * Makes at most maxRetries + 1 attempts. Before retry n (n = 1..maxRetries)
 * it waits baseDelayMs * 2^(n-1). A thrown std::exception from the client
 * counts as one failed attempt.
 *
 * On success the record is stored again with pendingUpload cleared,
 * and uploadWithRetry() returns only after that write completed.
 *
 * The uploader does not own the client, store or backoff.
 */
class RetryingUploader : public QObject
{
    Q_OBJECT

public:
    RetryingUploader(RemoteProgressClient *client,
                     LocalStore *store,
                     Backoff *backoff,
                     const SyncOptions &options = SyncOptions(),
                     QObject *parent = nullptr);
    ~RetryingUploader() override = default;

    /**
     * @brief Upload a record, retrying transient failures
     * @return true once the server accepted the record and the local
     *         copy was stored with pendingUpload == false
     */
    bool uploadWithRetry(ProgressRecord record);

    /**
     * @brief Number of push attempts made by the last uploadWithRetry()
     */
    int lastAttemptCount() const { return m_lastAttemptCount; }

    /**
     * @brief Why the last uploadWithRetry() failed, empty after a success
     */
    QString lastError() const { return m_lastError; }

    SyncOptions options() const { return m_options; }
    void setOptions(const SyncOptions &options) { m_options = options; }

signals:
    void attemptFailed(const QString &itemId, int attempt, qint64 retryDelayMs);
    void uploaded(const QString &itemId);
    void logMessage(const QString &message);

private:
    bool attemptPush(const ProgressRecord &record);
    bool persist(const ProgressRecord &record);

    RemoteProgressClient *m_client = nullptr;
    LocalStore *m_store = nullptr;
    Backoff *m_backoff = nullptr;
    SyncOptions m_options;
    int m_lastAttemptCount = 0;
    QString m_lastError;
};

} // namespace ShelfSync

#endif // RETRYINGUPLOADER_H
