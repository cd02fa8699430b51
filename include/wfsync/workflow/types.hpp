#pragma once

/**
 * @file types.hpp
 * @brief Core workflow types for the reconciliation engine
 *
 * WHY THIS FILE EXISTS:
 * The same workflow lives in two places: as a JSON file in the sync
 * directory and as a record on the remote automation service. Instead of
 * diffing documents field by field, both sides are reduced to a canonical
 * hash and compared against the hash recorded at the last successful sync
 * (the "base"). These types carry that information around.
 *
 * HOW IT INTEGRATES:
 * - RemoteApi (remote/remote_api.hpp) returns WorkflowSummary / full documents
 * - Watcher (sync/watcher.hpp) computes SyncStatus per workflow
 * - SyncEngine (sync/engine.hpp) dispatches on SyncStatus
 * - Event records (events/events.hpp) carry SyncStatus to subscribers
 *
 * DESIGN DECISIONS:
 * - Workflow bodies stay nlohmann::json: nodes, connections and settings
 *   are opaque to the sync core, only their canonical form matters
 * - Hashes are lower-case hex strings (SHA-256, 64 chars)
 * - Absence is modelled with std::optional, never with empty strings
 */

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace wfsync {
namespace workflow {

using Document = nlohmann::json;

/**
 * @brief Sync status of one workflow, derived from a three-way comparison
 *
 * INPUTS:
 * - L: canonical hash of the local file (absent if no file)
 * - R: canonical hash of the remote record (absent if not on the service)
 * - B: hash recorded at the last successful sync (absent if never synced)
 *
 * EXAMPLE:
 * base=h0, local=h0, remote=h1  ->  MODIFIED_REMOTELY (pull will fix it)
 * base=h0, local=h1, remote=h2  ->  CONFLICT (only a forced operation proceeds)
 */
enum class SyncStatus {
    EXIST_ONLY_LOCALLY,   // L present, no base, no remote
    EXIST_ONLY_REMOTELY,  // R present, no base, no local file
    IN_SYNC,              // L == R (base irrelevant)
    MODIFIED_LOCALLY,     // L != B, R == B
    MODIFIED_REMOTELY,    // R != B, L == B
    DELETED_LOCALLY,      // L absent, R == B
    DELETED_REMOTELY,     // R absent, L == B
    CONFLICT              // Both diverged, or any combination not covered above
};

/**
 * @brief Lightweight listing entry returned by the remote service
 *
 * WHY THIS EXISTS:
 * Polling must be cheap. The listing tells us which ids exist and when
 * they last changed; full content is only fetched when updated_at moves.
 */
struct WorkflowSummary {
    std::string id;
    std::string name;
    bool active = false;
    std::vector<std::string> tags;  // Tag names as returned by the service
    std::string updated_at;         // Opaque timestamp, compared for equality only

    WorkflowSummary() = default;

    WorkflowSummary(std::string wf_id, std::string wf_name, bool is_active,
                    std::vector<std::string> tag_names = {}, std::string updated = {})
        : id(std::move(wf_id)),
          name(std::move(wf_name)),
          active(is_active),
          tags(std::move(tag_names)),
          updated_at(std::move(updated)) {}
};

/**
 * @brief Identifies a workflow on both sides
 *
 * A workflow that only exists locally has no id yet; a workflow that only
 * exists remotely already has the filename it will be written to.
 */
struct WorkflowRef {
    std::string filename;
    std::optional<std::string> workflow_id;
};

/**
 * @brief Point-in-time status of one workflow (computed, never persisted)
 */
struct StatusSnapshot {
    std::string filename;
    std::optional<std::string> workflow_id;
    std::optional<std::string> local_hash;
    std::optional<std::string> remote_hash;
    SyncStatus status = SyncStatus::CONFLICT;

    WorkflowRef ref() const { return WorkflowRef{filename, workflow_id}; }
};

/**
 * @brief Helper functions for SyncStatus enum
 */
class SyncStatusUtils {
public:
    static std::string to_string(SyncStatus status) {
        switch (status) {
            case SyncStatus::EXIST_ONLY_LOCALLY: return "EXIST_ONLY_LOCALLY";
            case SyncStatus::EXIST_ONLY_REMOTELY: return "EXIST_ONLY_REMOTELY";
            case SyncStatus::IN_SYNC: return "IN_SYNC";
            case SyncStatus::MODIFIED_LOCALLY: return "MODIFIED_LOCALLY";
            case SyncStatus::MODIFIED_REMOTELY: return "MODIFIED_REMOTELY";
            case SyncStatus::DELETED_LOCALLY: return "DELETED_LOCALLY";
            case SyncStatus::DELETED_REMOTELY: return "DELETED_REMOTELY";
            case SyncStatus::CONFLICT: return "CONFLICT";
            default: return "UNKNOWN";
        }
    }

    static std::optional<SyncStatus> from_string(const std::string& text) {
        if (text == "EXIST_ONLY_LOCALLY") return SyncStatus::EXIST_ONLY_LOCALLY;
        if (text == "EXIST_ONLY_REMOTELY") return SyncStatus::EXIST_ONLY_REMOTELY;
        if (text == "IN_SYNC") return SyncStatus::IN_SYNC;
        if (text == "MODIFIED_LOCALLY") return SyncStatus::MODIFIED_LOCALLY;
        if (text == "MODIFIED_REMOTELY") return SyncStatus::MODIFIED_REMOTELY;
        if (text == "DELETED_LOCALLY") return SyncStatus::DELETED_LOCALLY;
        if (text == "DELETED_REMOTELY") return SyncStatus::DELETED_REMOTELY;
        if (text == "CONFLICT") return SyncStatus::CONFLICT;
        return std::nullopt;
    }

    /**
     * True for statuses a pull would act on
     */
    static bool wants_pull(SyncStatus status) {
        return status == SyncStatus::EXIST_ONLY_REMOTELY ||
               status == SyncStatus::MODIFIED_REMOTELY ||
               status == SyncStatus::DELETED_REMOTELY;
    }

    /**
     * True for statuses a push would act on
     */
    static bool wants_push(SyncStatus status) {
        return status == SyncStatus::EXIST_ONLY_LOCALLY ||
               status == SyncStatus::MODIFIED_LOCALLY;
    }
};

} // namespace workflow
} // namespace wfsync
