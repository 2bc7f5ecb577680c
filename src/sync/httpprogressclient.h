#ifndef HTTPPROGRESSCLIENT_H
#define HTTPPROGRESSCLIENT_H

#include <QUrl>
#include <QByteArray>
#include "remoteprogressclient.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace ShelfSync {

/**
 * @brief RemoteProgressClient for the library server's REST API
 *
 * Endpoints:
 *   - fetch: GET   <base>/api/items/<id>?expanded=1&include=progress
 *   - push:  PATCH <base>/api/me/progress/<id>
 *
 * Requests carry "Authorization: Bearer <token>". Each call blocks the
 * caller on a local event loop until the reply finishes or the timeout
 * expires; a timed-out reply is aborted and the call returns false.
 */
class HttpProgressClient : public RemoteProgressClient
{
    Q_OBJECT

public:
    HttpProgressClient(const QUrl &baseUrl,
                       const QString &token,
                       int timeoutSeconds = SyncOptions::DEFAULT_TIMEOUT_SECONDS,
                       QObject *parent = nullptr);
    ~HttpProgressClient() override;

    QString displayName() const override { return "Library server"; }

    bool fetch(const QString &itemId, ProgressRecord &remote) override;
    bool push(const ProgressRecord &record) override;
    QString lastError() const override { return m_lastError; }

    // ========== Configuration ==========

    QUrl baseUrl() const { return m_baseUrl; }

    QString token() const { return m_token; }
    void setToken(const QString &token) { m_token = token; }

    int timeoutSeconds() const { return m_timeoutSeconds; }
    void setTimeoutSeconds(int seconds) { m_timeoutSeconds = seconds; }

    /**
     * @brief URL of the expanded library item (with progress)
     */
    QUrl itemUrl(const QString &itemId) const;

    /**
     * @brief URL of the user's progress for an item
     */
    QUrl progressUrl(const QString &itemId) const;

private:
    QNetworkRequest buildRequest(const QUrl &url) const;
    QNetworkAccessManager* networkManager();

    /**
     * @brief Wait for a reply with timeout
     * @param body Response body on success
     * @return true if the reply finished without error and with a 2xx status
     */
    bool waitForReply(QNetworkReply *reply, const QString &what, QByteArray &body);

    void fail(const QString &error);

    QUrl m_baseUrl;
    QString m_token;
    int m_timeoutSeconds;
    QString m_lastError;

    QNetworkAccessManager *m_networkManager = nullptr;
};

} // namespace ShelfSync

#endif // HTTPPROGRESSCLIENT_H
