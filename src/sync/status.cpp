#include "wfsync/sync/status.hpp"

namespace wfsync::sync {

using workflow::SyncStatus;

SyncStatus compute_status(const std::optional<std::string>& local,
                          const std::optional<std::string>& remote,
                          const std::optional<std::string>& base) {
    if (local && !base && !remote) {
        return SyncStatus::EXIST_ONLY_LOCALLY;
    }
    if (remote && !base && !local) {
        return SyncStatus::EXIST_ONLY_REMOTELY;
    }

    if (local && remote && *local == *remote) {
        return SyncStatus::IN_SYNC;
    }

    if (base) {
        // Deletion evidence first: a missing side whose counterpart still
        // equals the base is not a modification.
        if (!local && remote == base) {
            return SyncStatus::DELETED_LOCALLY;
        }
        if (!remote && local == base) {
            return SyncStatus::DELETED_REMOTELY;
        }

        const bool local_modified = local != base;
        const bool remote_modified = remote.has_value() && remote != base;

        if (local_modified && remote_modified) {
            return SyncStatus::CONFLICT;
        }
        if (local_modified && remote == base) {
            return SyncStatus::MODIFIED_LOCALLY;
        }
        if (remote_modified && local == base) {
            return SyncStatus::MODIFIED_REMOTELY;
        }
    }

    return SyncStatus::CONFLICT;
}

} // namespace wfsync::sync
