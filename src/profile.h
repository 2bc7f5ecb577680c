#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QUrl>
#include "sync/synctypes.h"

/**
 * @brief Profile represents a sync profile with its settings
 *
 * Profile settings are stored in the profile folder itself as
 * shelfsync.conf, making profiles portable - you can move the entire
 * folder and the settings and progress state travel with it.
 *
 * Each profile corresponds to:
 *   - One library server and the user token used against it
 *   - A .state/ folder holding the local progress store
 *   - Retry/timeout tunables for the sync engine
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given folder path
     * @param profilePath Path to the profile folder (e.g., ~/.shelfsync)
     */
    explicit Profile(const QString &profilePath = QString());

    // Profile location
    QString profilePath() const { return m_profilePath; }
    void setProfilePath(const QString &path);

    // Profile name (defaults to folder name)
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Server Settings ==========

    QString serverAddress() const { return m_serverAddress; }
    void setServerAddress(const QString &address) { m_serverAddress = address; }

    /**
     * @brief Server address ready for requests
     *
     * Adds "http://" when no scheme is given and strips a trailing slash.
     * Returns an empty URL when no address is configured.
     */
    QUrl completeAddress() const;

    QString token() const { return m_token; }
    void setToken(const QString &token) { m_token = token; }

    QString userName() const { return m_userName; }
    void setUserName(const QString &userName) { m_userName = userName; }

    // Server address and token are both set
    bool hasServer() const;

    // ========== Sync Settings ==========

    int maxRetries() const { return m_maxRetries; }
    void setMaxRetries(int retries) { m_maxRetries = retries; }

    int baseDelayMs() const { return m_baseDelayMs; }
    void setBaseDelayMs(int delayMs) { m_baseDelayMs = delayMs; }

    // 0 means derive from debug mode
    int timeoutSeconds() const { return m_timeoutSeconds; }
    void setTimeoutSeconds(int seconds) { m_timeoutSeconds = seconds; }

    /**
     * @brief Engine options built from the sync settings
     */
    ShelfSync::SyncOptions syncOptions() const;

    // ========== Advanced Settings ==========

    bool debugMode() const { return m_debugMode; }
    void setDebugMode(bool enabled) { m_debugMode = enabled; }

    bool debugLogging() const { return m_debugLogging; }
    void setDebugLogging(bool enabled) { m_debugLogging = enabled; }

    bool showErrorNotifications() const { return m_showErrorNotifications; }
    void setShowErrorNotifications(bool enabled) { m_showErrorNotifications = enabled; }

    /**
     * @brief Whether a run should surface sync failures to the user
     *
     * A quiet run never does, whatever the profile says.
     */
    bool notifyOnErrors(bool quiet) const { return m_showErrorNotifications && !quiet; }

    // ========== Persistence ==========

    // Load settings from shelfsync.conf in the profile folder
    bool load();

    // Save settings to shelfsync.conf in the profile folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    // Get the path to the profile config file
    QString configFilePath() const;

    // Get the path to the state directory
    QString stateDirectoryPath() const;

private:
    QString m_profilePath;
    QString m_name;

    // Server settings
    QString m_serverAddress;
    QString m_token;
    QString m_userName;

    // Sync settings
    int m_maxRetries;
    int m_baseDelayMs;
    int m_timeoutSeconds;

    // Advanced settings
    bool m_debugMode;
    bool m_debugLogging;
    bool m_showErrorNotifications;

    // Default values
    static const int DEFAULT_MAX_RETRIES;
    static const int DEFAULT_BASE_DELAY_MS;
};

#endif // PROFILE_H
