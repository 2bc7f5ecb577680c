#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include "synctypes.h"

namespace ShelfSync {

/**
 * @brief Last-write-wins comparison of local and server progress
 *
 * The server wins only when its lastUpdate is strictly greater.
 * On a tie the local copy is kept and pushed again; the server
 * accepts a repeated write of the same value.
 */
class ConflictResolver
{
public:
    static SyncDecision resolve(const ProgressRecord &local,
                                const ProgressRecord &remote);

    static QString decisionName(SyncDecision decision);
};

} // namespace ShelfSync

#endif // CONFLICTRESOLVER_H
