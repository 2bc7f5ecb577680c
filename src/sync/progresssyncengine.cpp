#include "progresssyncengine.h"
#include "backoff.h"
#include "conflictresolver.h"
#include "localstore.h"
#include "remoteprogressclient.h"
#include "retryinguploader.h"

#include <QDebug>

#include <exception>

namespace ShelfSync {

ProgressSyncEngine::ProgressSyncEngine(RemoteProgressClient *client,
                                       LocalStore *store,
                                       QObject *parent)
    : QObject(parent)
    , m_client(client)
    , m_store(store)
{
    m_backoff = new Backoff(this);
    m_uploader = new RetryingUploader(m_client, m_store, m_backoff, m_options, this);

    connect(m_uploader, &RetryingUploader::logMessage,
            this, &ProgressSyncEngine::logMessage);
}

ProgressSyncEngine::~ProgressSyncEngine()
{
    // Wake any wait still in progress; client and store are not ours
    m_backoff->cancel();
}

// ========== Sync Operations ==========

bool ProgressSyncEngine::syncItem(const ProgressRecord &local)
{
    if (!m_syncing) {
        m_backoff->reset();
    }

    bool success = false;
    try {
        success = runPipeline(local);
        if (!success) {
            emit errorOccurred(failureMessage(local.itemId));
        }
    } catch (const std::exception &e) {
        m_lastFailure = QString::fromUtf8(e.what());
        qWarning() << "[ProgressSyncEngine] Error syncing" << local.itemId << ":" << e.what();
        emit errorOccurred(QString("Error syncing %1: %2").arg(local.itemId, e.what()));
    }

    if (!success && !m_syncing) {
        notifyUser(QString("Failed to sync %1").arg(local.itemId));
    }
    return success;
}

SyncResult ProgressSyncEngine::syncAllPending()
{
    SyncResult result;
    result.startTime = QDateTime::currentDateTime();

    if (m_syncing) {
        qWarning() << "[ProgressSyncEngine] Batch sync already running";
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    if (!m_client || !m_store) {
        emit errorOccurred("No client or store configured");
        result.endTime = QDateTime::currentDateTime();
        return result;
    }

    m_syncing = true;
    m_backoff->reset();
    emit syncStarted();

    QList<ProgressRecord> pendingItems;
    try {
        pendingItems = m_store->listPending();
    } catch (const std::exception &e) {
        emit errorOccurred(QString("Failed to list pending items: %1").arg(e.what()));
        m_syncing = false;
        result.endTime = QDateTime::currentDateTime();
        emit syncFinished(result);
        return result;
    }

    const int total = pendingItems.size();
    emit logMessage(QString("Starting batch sync of %1 pending items").arg(total));

    for (int i = 0; i < total; ++i) {
        const ProgressRecord &item = pendingItems.at(i);

        if (isCancelled()) {
            emit logMessage("Sync cancelled by user");
            for (int j = i; j < total; ++j) {
                result.failureCount++;
                result.errors.append(QString("Sync cancelled before %1")
                    .arg(pendingItems.at(j).itemId));
            }
            break;
        }

        reportProgress(i, total, QString("Syncing %1...").arg(item.itemId));

        try {
            if (runPipeline(item)) {
                if (!m_store->markSynced(item.itemId)) {
                    qWarning() << "[ProgressSyncEngine] markSynced() failed for" << item.itemId;
                }
                result.successCount++;
                emit logMessage(QString("Successfully synced progress for: %1").arg(item.itemId));
                emit itemFinished(item.itemId, true);
            } else {
                result.failureCount++;
                result.errors.append(failureMessage(item.itemId));
                qWarning() << "[ProgressSyncEngine] Failed to sync progress for:" << item.itemId;
                emit itemFinished(item.itemId, false);
            }
        } catch (const std::exception &e) {
            m_lastFailure = QString::fromUtf8(e.what());
            result.failureCount++;
            result.errors.append(QString("Error syncing %1: %2").arg(item.itemId, e.what()));
            qWarning() << "[ProgressSyncEngine] Error syncing progress for:" << item.itemId
                       << e.what();
            emit itemFinished(item.itemId, false);
        }
    }

    reportProgress(total, total, "Sync complete");

    result.endTime = QDateTime::currentDateTime();
    m_syncing = false;

    emit logMessage(QString("Batch sync completed: %1 successful, %2 failed (%3ms)")
        .arg(result.successCount)
        .arg(result.failureCount)
        .arg(result.durationMs()));

    if (result.failureCount > 0) {
        notifyUser(QString("%1 of %2 items failed to sync")
            .arg(result.failureCount).arg(total));
    }

    emit syncFinished(result);
    return result;
}

void ProgressSyncEngine::cancelSync()
{
    m_backoff->cancel();
    emit logMessage("Cancel requested...");
}

// ========== Configuration ==========

void ProgressSyncEngine::setOptions(const SyncOptions &options)
{
    m_options = options;
    m_uploader->setOptions(options);
}

void ProgressSyncEngine::setProgressCallback(std::function<void(int, int, const QString&)> callback)
{
    m_progressCallback = callback;
}

void ProgressSyncEngine::setCancelCheck(std::function<bool()> callback)
{
    m_backoff->setCancelCheck(callback);
}

// ========== Pipeline ==========

bool ProgressSyncEngine::runPipeline(const ProgressRecord &local)
{
    m_lastFailure.clear();

    if (!m_client || !m_store) {
        m_lastFailure = "no client or store configured";
        return false;
    }

    if (!local.isValid()) {
        m_lastFailure = "invalid record";
        emit logMessage(QString("Skipping invalid record: %1").arg(local.description()));
        return false;
    }

    ProgressRecord remote;
    if (!fetchWithRetry(local.itemId, remote)) {
        return false;
    }

    SyncDecision decision = ConflictResolver::resolve(local, remote);
    emit decisionMade(local.itemId, decision);

    if (decision == SyncDecision::AdoptRemote) {
        emit logMessage(QString("Progress on server is more recent for %1. Not uploading")
            .arg(local.itemId));
        return adoptRemote(local, remote);
    }

    if (!m_uploader->uploadWithRetry(local)) {
        m_lastFailure = m_uploader->lastError();
        return false;
    }
    return true;
}

bool ProgressSyncEngine::fetchWithRetry(const QString &itemId, ProgressRecord &remote)
{
    for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt) {
        if (isCancelled()) {
            m_lastFailure = "cancelled";
            return false;
        }

        if (attemptFetch(itemId, remote)) {
            return true;
        }

        if (attempt == m_options.maxRetries) {
            break;
        }

        qint64 delay = m_options.delayForAttempt(attempt);
        emit logMessage(QString("Fetching %1 failed, retrying in %2ms").arg(itemId).arg(delay));
        if (!m_backoff->wait(delay)) {
            m_lastFailure = "cancelled";
            return false;
        }
    }

    qWarning() << "[ProgressSyncEngine] Could not fetch server progress for" << itemId;
    m_lastFailure = QString("could not fetch server progress: %1").arg(m_lastFailure);
    return false;
}

bool ProgressSyncEngine::attemptFetch(const QString &itemId, ProgressRecord &remote)
{
    try {
        if (m_client->fetch(itemId, remote)) {
            return true;
        }
        m_lastFailure = m_client->lastError();
        if (m_lastFailure.isEmpty()) {
            m_lastFailure = "request failed";
        }
    } catch (const std::exception &e) {
        m_lastFailure = QString::fromUtf8(e.what());
        qWarning() << "[ProgressSyncEngine] fetch() threw for" << itemId << ":" << e.what();
    }
    return false;
}

bool ProgressSyncEngine::adoptRemote(const ProgressRecord &local, const ProgressRecord &remote)
{
    ProgressRecord adopted = remote;
    adopted.itemId = local.itemId;
    adopted.pendingUpload = false;

    if (!m_store->put(adopted)) {
        m_lastFailure = "could not store server progress";
        qWarning() << "[ProgressSyncEngine] Failed to store server progress for" << local.itemId;
        return false;
    }
    return true;
}

// ========== Helpers ==========

void ProgressSyncEngine::reportProgress(int current, int total, const QString &message)
{
    emit progressUpdated(current, total, message);

    if (m_progressCallback) {
        m_progressCallback(current, total, message);
    }
}

void ProgressSyncEngine::notifyUser(const QString &message)
{
    if (m_showErrorNotifications) {
        emit notification(message);
    }
}

QString ProgressSyncEngine::failureMessage(const QString &itemId) const
{
    if (m_lastFailure.isEmpty()) {
        return QString("Failed to sync %1").arg(itemId);
    }
    return QString("Failed to sync %1: %2").arg(itemId, m_lastFailure);
}

bool ProgressSyncEngine::isCancelled() const
{
    return m_backoff->isCancelled();
}

} // namespace ShelfSync
