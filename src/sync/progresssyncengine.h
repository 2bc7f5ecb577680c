#ifndef PROGRESSSYNCENGINE_H
#define PROGRESSSYNCENGINE_H

#include <QObject>
#include <QString>
#include <QList>
#include <functional>
#include "synctypes.h"

namespace ShelfSync {

class Backoff;
class LocalStore;
class RemoteProgressClient;
class RetryingUploader;

/**
 * @brief Main progress sync orchestrator
 *
 * The ProgressSyncEngine coordinates:
 *   - Fetching the server's record for an item (with retry)
 *   - Last-write-wins resolution against the local record
 *   - Uploading local changes through RetryingUploader
 *   - Batch passes over every pending item
 *
 * Usage:
 * @code
 * JsonFileStore store(profile.stateDirectoryPath());
 * store.load();
 * HttpProgressClient client(profile.completeAddress(), profile.token(),
 *                           profile.timeoutSeconds());
 *
 * ProgressSyncEngine engine(&client, &store);
 * engine.setOptions(profile.syncOptions());
 *
 * SyncResult result = engine.syncAllPending();
 * @endcode
 *
 * The engine does not take ownership of the client or the store.
 * Items are processed one at a time on the calling thread; network
 * waits and backoff delays run local event loops so the thread keeps
 * handling events.
 */
class ProgressSyncEngine : public QObject
{
    Q_OBJECT

public:
    ProgressSyncEngine(RemoteProgressClient *client,
                       LocalStore *store,
                       QObject *parent = nullptr);
    ~ProgressSyncEngine() override;

    // ========== Collaborators ==========

    RemoteProgressClient* client() const { return m_client; }
    LocalStore* store() const { return m_store; }
    RetryingUploader* uploader() const { return m_uploader; }

    /**
     * @brief Backoff shared by fetch retries and the uploader
     */
    Backoff* backoff() const { return m_backoff; }

    // ========== Sync Operations ==========

    /**
     * @brief Bring one item in line with the server
     *
     * Fetches the server record (retrying transient failures), then
     * either stores the newer server record locally or uploads the
     * local one.
     *
     * @return true if local and server now agree
     */
    bool syncItem(const ProgressRecord &local);

    /**
     * @brief Sync every pending item in store order
     *
     * Never throws. Every pending item ends up counted as either a
     * success or a failure.
     */
    SyncResult syncAllPending();

    /**
     * @brief Cancel a running sync
     *
     * Abandons the current backoff wait. Items not yet processed are
     * reported as failures.
     */
    void cancelSync();

    /**
     * @brief Check if a batch sync is currently running
     */
    bool isSyncing() const { return m_syncing; }

    /**
     * @brief Why the last failed item failed, empty after a success
     */
    QString lastFailure() const { return m_lastFailure; }

    // ========== Configuration ==========

    SyncOptions options() const { return m_options; }
    void setOptions(const SyncOptions &options);

    /**
     * @brief Whether failures are surfaced through notification()
     */
    bool showErrorNotifications() const { return m_showErrorNotifications; }
    void setShowErrorNotifications(bool show) { m_showErrorNotifications = show; }

    /**
     * @brief Set progress callback for batch syncs
     */
    void setProgressCallback(std::function<void(int, int, const QString&)> callback);

    /**
     * @brief Set external cancel check callback
     */
    void setCancelCheck(std::function<bool()> callback);

signals:
    void syncStarted();
    void syncFinished(const ShelfSync::SyncResult &result);
    void itemFinished(const QString &itemId, bool success);
    void decisionMade(const QString &itemId, ShelfSync::SyncDecision decision);
    void progressUpdated(int current, int total, const QString &message);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

    /**
     * @brief Short user-facing failure message
     *
     * Only emitted while showErrorNotifications() is true.
     */
    void notification(const QString &message);

private:
    bool runPipeline(const ProgressRecord &local);
    bool fetchWithRetry(const QString &itemId, ProgressRecord &remote);
    bool attemptFetch(const QString &itemId, ProgressRecord &remote);
    bool adoptRemote(const ProgressRecord &local, const ProgressRecord &remote);
    void reportProgress(int current, int total, const QString &message);
    void notifyUser(const QString &message);
    bool isCancelled() const;
    QString failureMessage(const QString &itemId) const;

    RemoteProgressClient *m_client = nullptr;
    LocalStore *m_store = nullptr;
    Backoff *m_backoff = nullptr;
    RetryingUploader *m_uploader = nullptr;

    SyncOptions m_options;
    bool m_showErrorNotifications = true;
    bool m_syncing = false;
    QString m_lastFailure;

    std::function<void(int, int, const QString&)> m_progressCallback;
};

} // namespace ShelfSync

#endif // PROGRESSSYNCENGINE_H
