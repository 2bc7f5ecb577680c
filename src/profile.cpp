#include "profile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>

const int Profile::DEFAULT_MAX_RETRIES = 3;
const int Profile::DEFAULT_BASE_DELAY_MS = 1000;

Profile::Profile(const QString &profilePath)
    : m_profilePath(profilePath)
    , m_maxRetries(DEFAULT_MAX_RETRIES)
    , m_baseDelayMs(DEFAULT_BASE_DELAY_MS)
    , m_timeoutSeconds(0)
    , m_debugMode(false)
    , m_debugLogging(false)
    , m_showErrorNotifications(true)
{
    // Try to load existing settings if path is set
    if (!m_profilePath.isEmpty()) {
        load();
    }
}

void Profile::setProfilePath(const QString &path)
{
    m_profilePath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_profilePath.isEmpty()) {
        return QFileInfo(m_profilePath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_profilePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_profilePath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Server Settings ==========

QUrl Profile::completeAddress() const
{
    QString address = m_serverAddress.trimmed();
    if (address.isEmpty()) {
        return QUrl();
    }

    if (!address.contains("://")) {
        address.prepend("http://");
    }
    while (address.endsWith('/')) {
        address.chop(1);
    }
    return QUrl(address);
}

bool Profile::hasServer() const
{
    return completeAddress().isValid() && !m_token.isEmpty();
}

// ========== Sync Settings ==========

ShelfSync::SyncOptions Profile::syncOptions() const
{
    ShelfSync::SyncOptions options = ShelfSync::SyncOptions::defaults(m_debugMode);
    options.maxRetries = qBound(0, m_maxRetries, ShelfSync::SyncOptions::MAX_RETRIES);
    options.baseDelayMs = qBound(0, m_baseDelayMs, ShelfSync::SyncOptions::MAX_BASE_DELAY_MS);
    if (m_timeoutSeconds > 0) {
        options.timeoutSeconds = m_timeoutSeconds;
    }
    return options;
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();

    // Server settings
    m_serverAddress = settings.value("server/address", QString()).toString();
    m_token = settings.value("server/token", QString()).toString();
    m_userName = settings.value("server/userName", QString()).toString();

    // Sync settings
    m_maxRetries = settings.value("sync/maxRetries", DEFAULT_MAX_RETRIES).toInt();
    m_baseDelayMs = settings.value("sync/baseDelayMs", DEFAULT_BASE_DELAY_MS).toInt();
    m_timeoutSeconds = settings.value("sync/timeoutSeconds", 0).toInt();

    // Advanced settings
    m_debugMode = settings.value("advanced/debugMode", false).toBool();
    m_debugLogging = settings.value("advanced/debugLogging", false).toBool();
    m_showErrorNotifications = settings.value("advanced/showErrorNotifications", true).toBool();

    return settings.status() == QSettings::NoError;
}

bool Profile::save()
{
    if (m_profilePath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_profilePath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }

    settings.setValue("server/address", m_serverAddress);
    settings.setValue("server/token", m_token);
    if (!m_userName.isEmpty()) {
        settings.setValue("server/userName", m_userName);
    }

    settings.setValue("sync/maxRetries", m_maxRetries);
    settings.setValue("sync/baseDelayMs", m_baseDelayMs);
    settings.setValue("sync/timeoutSeconds", m_timeoutSeconds);

    settings.setValue("advanced/debugMode", m_debugMode);
    settings.setValue("advanced/debugLogging", m_debugLogging);
    settings.setValue("advanced/showErrorNotifications", m_showErrorNotifications);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_profilePath.isEmpty()) {
        return false;
    }

    QDir dir(m_profilePath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    if (!dir.mkpath(".state")) {
        return false;
    }

    // Save default settings
    return save();
}

QString Profile::configFilePath() const
{
    if (m_profilePath.isEmpty()) {
        return QString();
    }
    return QDir(m_profilePath).filePath("shelfsync.conf");
}

QString Profile::stateDirectoryPath() const
{
    if (m_profilePath.isEmpty()) {
        return QString();
    }
    return QDir(m_profilePath).filePath(".state");
}
