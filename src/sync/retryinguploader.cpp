#include "retryinguploader.h"
#include "backoff.h"
#include "localstore.h"
#include "remoteprogressclient.h"

#include <QDebug>

#include <exception>

namespace ShelfSync {

RetryingUploader::RetryingUploader(RemoteProgressClient *client,
                                   LocalStore *store,
                                   Backoff *backoff,
                                   const SyncOptions &options,
                                   QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_store(store)
    , m_backoff(backoff)
    , m_options(options)
{
}

bool RetryingUploader::uploadWithRetry(ProgressRecord record)
{
    m_lastAttemptCount = 0;
    m_lastError.clear();

    if (!m_client || !m_store) {
        m_lastError = "no client or store configured";
        qWarning() << "[RetryingUploader] No client or store configured";
        return false;
    }

    for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt) {
        if (m_backoff && m_backoff->isCancelled()) {
            m_lastError = "upload cancelled";
            emit logMessage(QString("Upload of %1 cancelled").arg(record.itemId));
            return false;
        }

        m_lastAttemptCount++;
        emit logMessage(QString("Uploading progress for %1... (attempt %2)")
            .arg(record.itemId).arg(attempt + 1));

        if (attemptPush(record)) {
            record.pendingUpload = false;
            if (!persist(record)) {
                return false;
            }
            emit uploaded(record.itemId);
            emit logMessage(QString("Progress uploaded for %1").arg(record.itemId));
            return true;
        }

        if (attempt == m_options.maxRetries) {
            break;
        }

        qint64 delay = m_options.delayForAttempt(attempt);
        emit attemptFailed(record.itemId, attempt + 1, delay);
        emit logMessage(QString("Upload failed, retrying in %1ms").arg(delay));

        if (m_backoff && !m_backoff->wait(delay)) {
            m_lastError = "upload cancelled";
            emit logMessage(QString("Upload of %1 cancelled").arg(record.itemId));
            return false;
        }
    }

    qWarning() << "[RetryingUploader] Giving up on" << record.itemId
               << "after" << m_lastAttemptCount << "attempts";
    return false;
}

bool RetryingUploader::attemptPush(const ProgressRecord &record)
{
    try {
        if (m_client->push(record)) {
            return true;
        }
        m_lastError = m_client->lastError();
        if (m_lastError.isEmpty()) {
            m_lastError = "server rejected the update";
        }
    } catch (const std::exception &e) {
        m_lastError = QString::fromUtf8(e.what());
        qWarning() << "[RetryingUploader] push() threw for" << record.itemId << ":" << e.what();
    }
    return false;
}

bool RetryingUploader::persist(const ProgressRecord &record)
{
    // Uploaded but not stored: the item stays pending and is pushed again later
    try {
        if (m_store->put(record)) {
            m_lastError.clear();
            return true;
        }
        m_lastError = "uploaded but could not store the synced record";
        qWarning() << "[RetryingUploader] Failed to store synced record for" << record.itemId;
    } catch (const std::exception &e) {
        m_lastError = QString("uploaded but could not store the synced record: %1").arg(e.what());
        qWarning() << "[RetryingUploader] put() threw for" << record.itemId << ":" << e.what();
    }
    return false;
}

} // namespace ShelfSync
