#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types for progress synchronization
 *
 * Everything the sync engine passes between the conflict resolver,
 * the uploader and the storage/transport collaborators.
 */

namespace ShelfSync {

/**
 * @brief Playback progress of one library item
 *
 * The same type describes both the local copy and the server copy.
 * Whichever has the larger lastUpdate is authoritative.
 */
struct ProgressRecord {
    QString itemId;               ///< Library item identifier (non-empty)
    double elapsedSeconds = 0.0;  ///< Playback position in seconds
    qint64 lastUpdate = 0;        ///< Epoch milliseconds of last change
    bool pendingUpload = false;   ///< Local change not yet confirmed by server

    double duration = 0.0;        ///< Total length in seconds, 0 if unknown
    bool isFinished = false;

    bool isValid() const {
        return !itemId.isEmpty() && elapsedSeconds >= 0.0;
    }

    /**
     * @brief Fraction listened (0..1), 0 when duration is unknown
     */
    double progressFraction() const;

    /**
     * @brief One-line description for logs and error reports
     */
    QString description() const;

    /**
     * @brief Create a local record for a playback position
     *
     * The record is stamped with @p now and marked pending.
     */
    static ProgressRecord fromPlayback(const QString &itemId,
                                       double elapsedSeconds,
                                       const QDateTime &now = QDateTime::currentDateTimeUtc());

    bool operator==(const ProgressRecord &other) const;
    bool operator!=(const ProgressRecord &other) const { return !(*this == other); }
};

/**
 * @brief Outcome of comparing a local record with the server's
 */
enum class SyncDecision {
    KeepLocalAndUpload,   ///< Local is at least as recent - push it
    AdoptRemote           ///< Server is strictly newer - overwrite local
};

/**
 * @brief Retry and timeout tunables
 */
struct SyncOptions {
    int maxRetries = 3;           ///< Retries after the first attempt
    int baseDelayMs = 1000;       ///< Delay before the first retry
    int timeoutSeconds = 7;       ///< Per-request connect/read/write timeout

    static constexpr int DEFAULT_TIMEOUT_SECONDS = 7;
    static constexpr int DEBUG_TIMEOUT_SECONDS = 3;
    static constexpr int MAX_RETRIES = 10;
    static constexpr int MAX_BASE_DELAY_MS = 60000;
    static constexpr qint64 MAX_DELAY_MS = 300000;

    /**
     * @brief Backoff delay before retry number attemptIndex + 1
     *
     * baseDelayMs * 2^attemptIndex, attemptIndex starting at 0,
     * capped at MAX_DELAY_MS. A negative baseDelayMs counts as 0.
     */
    qint64 delayForAttempt(int attemptIndex) const;

    /**
     * @brief Defaults, with the shorter timeout in debug mode
     */
    static SyncOptions defaults(bool debugMode = false);
};

/**
 * @brief Summary of a batch sync
 *
 * errors holds one entry per failed item, in the order the
 * failures happened.
 */
struct SyncResult {
    int successCount = 0;
    int failureCount = 0;
    QStringList errors;
    QDateTime startTime;
    QDateTime endTime;

    int total() const { return successCount + failureCount; }
    bool allSucceeded() const { return failureCount == 0; }

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const {
        return QString("Synced: %1, Failed: %2")
            .arg(successCount).arg(failureCount);
    }
};

} // namespace ShelfSync

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(ShelfSync::ProgressRecord)
Q_DECLARE_METATYPE(ShelfSync::SyncDecision)
Q_DECLARE_METATYPE(ShelfSync::SyncResult)

#endif // SYNCTYPES_H
