#include "httpprogressclient.h"
#include "../mappers/progressmapper.h"
#include "shelfsync_version.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QEventLoop>
#include <QTimer>
#include <QUrlQuery>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace ShelfSync {

HttpProgressClient::HttpProgressClient(const QUrl &baseUrl,
                                       const QString &token,
                                       int timeoutSeconds,
                                       QObject *parent)
    : RemoteProgressClient(parent)
    , m_baseUrl(baseUrl.adjusted(QUrl::StripTrailingSlash))
    , m_token(token)
    , m_timeoutSeconds(timeoutSeconds)
{
    // Note: QNetworkAccessManager is created lazily on first use so it
    // lives on the thread that performs the requests
}

HttpProgressClient::~HttpProgressClient()
{
    delete m_networkManager;
    m_networkManager = nullptr;
}

QNetworkAccessManager* HttpProgressClient::networkManager()
{
    if (!m_networkManager) {
        m_networkManager = new QNetworkAccessManager();  // No parent - we manage lifetime
    }
    return m_networkManager;
}

// ========== URLs ==========

QUrl HttpProgressClient::itemUrl(const QString &itemId) const
{
    QUrl url(m_baseUrl.toString() + "/api/items/"
             + QString::fromUtf8(QUrl::toPercentEncoding(itemId)));

    QUrlQuery query;
    query.addQueryItem("expanded", "1");
    query.addQueryItem("include", "progress");
    url.setQuery(query);
    return url;
}

QUrl HttpProgressClient::progressUrl(const QString &itemId) const
{
    return QUrl(m_baseUrl.toString() + "/api/me/progress/"
                + QString::fromUtf8(QUrl::toPercentEncoding(itemId)));
}

QNetworkRequest HttpProgressClient::buildRequest(const QUrl &url) const
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader,
                      QString("ShelfSync/%1").arg(SHELFSYNC_VERSION_STRING));
    request.setRawHeader("Authorization", "Bearer " + m_token.toUtf8());
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    return request;
}

// ========== RemoteProgressClient ==========

bool HttpProgressClient::fetch(const QString &itemId, ProgressRecord &remote)
{
    m_lastError.clear();

    if (!m_baseUrl.isValid() || m_baseUrl.isEmpty()) {
        fail("No server address configured");
        return false;
    }

    QUrl url = itemUrl(itemId);
    qDebug() << "[HttpProgressClient] GET" << url.toString();

    QNetworkReply *reply = networkManager()->get(buildRequest(url));

    QByteArray body;
    if (!waitForReply(reply, QString("item %1").arg(itemId), body)) {
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(QString("Malformed response for item %1: %2")
            .arg(itemId, parseError.errorString()));
        return false;
    }

    bool ok = true;
    ProgressRecord record = ProgressMapper::progressFromItemJson(doc.object(), itemId, &ok);
    if (!ok) {
        fail(QString("Malformed progress for item %1").arg(itemId));
        return false;
    }

    remote = record;
    qDebug() << "[HttpProgressClient] Server progress:" << remote.description();
    return true;
}

bool HttpProgressClient::push(const ProgressRecord &record)
{
    m_lastError.clear();

    if (!m_baseUrl.isValid() || m_baseUrl.isEmpty()) {
        fail("No server address configured");
        return false;
    }

    QUrl url = progressUrl(record.itemId);
    QByteArray payload = QJsonDocument(ProgressMapper::progressToPatchJson(record))
        .toJson(QJsonDocument::Compact);

    QNetworkRequest request = buildRequest(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    qDebug() << "[HttpProgressClient] PATCH" << url.toString() << payload;

    QNetworkReply *reply = networkManager()->sendCustomRequest(request, "PATCH", payload);

    QByteArray body;
    if (!waitForReply(reply, QString("progress %1").arg(record.itemId), body)) {
        return false;
    }

    qDebug() << "[HttpProgressClient] Progress uploaded. Response:" << body.left(200);
    return true;
}

// ========== Helpers ==========

bool HttpProgressClient::waitForReply(QNetworkReply *reply, const QString &what, QByteArray &body)
{
    // Synchronous request using event loop
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(m_timeoutSeconds * 1000);
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (timeout.isActive()) {
        timeout.stop();
    } else if (!reply->isFinished()) {
        // Timeout occurred
        reply->abort();
        reply->deleteLater();
        fail(QString("Timeout waiting for %1").arg(what));
        return false;
    }

    int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (reply->error() != QNetworkReply::NoError) {
        QString error = httpStatus > 0
            ? QString("HTTP %1 for %2").arg(httpStatus).arg(what)
            : QString("Request for %1 failed: %2").arg(what, reply->errorString());
        reply->deleteLater();
        fail(error);
        return false;
    }

    body = reply->readAll();
    reply->deleteLater();

    if (httpStatus < 200 || httpStatus >= 300) {
        fail(QString("HTTP %1 for %2").arg(httpStatus).arg(what));
        return false;
    }

    return true;
}

void HttpProgressClient::fail(const QString &error)
{
    m_lastError = error;
    qWarning() << "[HttpProgressClient]" << error;
    emit errorOccurred(error);
}

} // namespace ShelfSync
