#include "synctypes.h"

#include <QtGlobal>

namespace ShelfSync {

// ========== ProgressRecord ==========

double ProgressRecord::progressFraction() const
{
    if (duration <= 0.0) {
        return 0.0;
    }
    return qBound(0.0, elapsedSeconds / duration, 1.0);
}

QString ProgressRecord::description() const
{
    return QString("%1 at %2s (updated %3%4)")
        .arg(itemId)
        .arg(elapsedSeconds, 0, 'f', 1)
        .arg(lastUpdate)
        .arg(pendingUpload ? ", pending" : "");
}

ProgressRecord ProgressRecord::fromPlayback(const QString &itemId,
                                            double elapsedSeconds,
                                            const QDateTime &now)
{
    ProgressRecord record;
    record.itemId = itemId;
    record.elapsedSeconds = elapsedSeconds;
    record.lastUpdate = now.toMSecsSinceEpoch();
    record.pendingUpload = true;
    return record;
}

bool ProgressRecord::operator==(const ProgressRecord &other) const
{
    return itemId == other.itemId
        && qFuzzyCompare(1.0 + elapsedSeconds, 1.0 + other.elapsedSeconds)
        && lastUpdate == other.lastUpdate
        && pendingUpload == other.pendingUpload
        && qFuzzyCompare(1.0 + duration, 1.0 + other.duration)
        && isFinished == other.isFinished;
}

// ========== SyncOptions ==========

qint64 SyncOptions::delayForAttempt(int attemptIndex) const
{
    if (attemptIndex < 0) {
        attemptIndex = 0;
    }

    // Double one step at a time so large indexes never shift past 64 bits
    qint64 delay = qMax(0, baseDelayMs);
    for (int i = 0; i < attemptIndex && delay > 0 && delay < MAX_DELAY_MS; ++i) {
        delay *= 2;
    }
    return qMin(delay, MAX_DELAY_MS);
}

SyncOptions SyncOptions::defaults(bool debugMode)
{
    SyncOptions options;
    options.timeoutSeconds = debugMode ? DEBUG_TIMEOUT_SECONDS : DEFAULT_TIMEOUT_SECONDS;
    return options;
}

} // namespace ShelfSync
