#include "conflictresolver.h"

namespace ShelfSync {

SyncDecision ConflictResolver::resolve(const ProgressRecord &local,
                                       const ProgressRecord &remote)
{
    if (remote.lastUpdate > local.lastUpdate) {
        return SyncDecision::AdoptRemote;
    }
    return SyncDecision::KeepLocalAndUpload;
}

QString ConflictResolver::decisionName(SyncDecision decision)
{
    switch (decision) {
    case SyncDecision::KeepLocalAndUpload: return "keep-local";
    case SyncDecision::AdoptRemote: return "adopt-remote";
    }
    return QString();
}

} // namespace ShelfSync
