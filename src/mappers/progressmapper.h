#ifndef PROGRESSMAPPER_H
#define PROGRESSMAPPER_H

#include <QString>
#include <QJsonObject>
#include "../sync/synctypes.h"

/**
 * @brief Mapper between ProgressRecord and its JSON forms
 *
 * Two JSON shapes are handled:
 *   - Server shape: the progress object embedded in an expanded library
 *     item ("userMediaProgress"), and the body of a progress PATCH.
 *   - Storage shape: the flat object JsonFileStore keeps on disk.
 */
class ProgressMapper
{
public:
    // ========== Server shape ==========

    /**
     * @brief Extract the user's progress from an expanded library item
     *
     * Reads "userMediaProgress", falling back to "mediaProgress". An item
     * without either yields a record with lastUpdate == 0, meaning the
     * server has no progress yet.
     *
     * @param item Library item object returned by the server
     * @param itemId Item the caller asked for
     * @param ok Set to false if the progress object is malformed
     */
    static ShelfSync::ProgressRecord progressFromItemJson(const QJsonObject &item,
                                                          const QString &itemId,
                                                          bool *ok = nullptr);

    /**
     * @brief Build the body of a progress update request
     *
     * Always carries currentTime, lastUpdate and isFinished. duration and
     * progress are added only when the duration is known.
     */
    static QJsonObject progressToPatchJson(const ShelfSync::ProgressRecord &record);

    // ========== Storage shape ==========

    static QJsonObject recordToJson(const ShelfSync::ProgressRecord &record);
    static ShelfSync::ProgressRecord recordFromJson(const QJsonObject &json);
};

#endif // PROGRESSMAPPER_H
