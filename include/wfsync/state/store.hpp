#pragma once

/**
 * @file store.hpp
 * @brief Persisted "last synced" state, the base of every three-way comparison
 *
 * WHY THIS FILE EXISTS:
 * Comparing local against remote only tells us THAT they differ, not WHO
 * changed. Remembering the hash both sides had the last time they were
 * confirmed identical turns "they differ" into "local was edited",
 * "remote was edited" or "both were edited".
 *
 * WHAT PROBLEM IT SOLVES:
 * - Direction of change: L != B means a local edit, R != B a remote one
 * - Deletion evidence: a missing side whose counterpart still equals B
 * - Restart safety: this file is the only thing persisted; hash maps are
 *   rebuilt by rescanning disk and remote at start-up
 *
 * FILE FORMAT (.n8n-state.json in the sync directory):
 * {
 *   "workflows": {
 *     "<id>": { "lastSyncedHash": "<sha256>", "lastSyncedAt": "2024-01-01T10:00:00.000Z" }
 *   }
 * }
 *
 * DESIGN DECISIONS:
 * - Missing or corrupt file == empty state (nothing has a known base yet)
 * - Every mutation is written through atomically (temp file + rename)
 * - std::shared_mutex: status computation reads constantly, writes are rare
 * - Only the Watcher mutates the store (finalize / remove / migrate)
 */

#include "wfsync/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wfsync {
namespace state {

inline constexpr const char* kStateFileName = ".n8n-state.json";

/**
 * @brief Base entry for one workflow id
 */
struct SyncStateEntry {
    std::string last_synced_hash;
    std::string last_synced_at;  // ISO 8601, UTC, millisecond precision
};

/**
 * @brief Thread-safe, file-backed map: workflow id -> SyncStateEntry
 */
class StateStore {
public:
    /**
     * Loads the file immediately; see load() for the degradation rules.
     */
    explicit StateStore(std::filesystem::path state_file);

    /**
     * Re-read the file from disk
     *
     * HOW IT DEGRADES:
     * - file missing            -> empty state, no log
     * - unreadable / bad JSON   -> empty state, warning logged
     * - no "workflows" object   -> empty state
     * - malformed single entry  -> entry skipped, warning logged
     */
    void load();

    std::optional<SyncStateEntry> get(const std::string& workflow_id) const;

    std::optional<std::string> last_synced_hash(const std::string& workflow_id) const;

    /**
     * Create or replace the base entry and persist
     *
     * EXAMPLE:
     * store.record("wf-1", hash);   // lastSyncedAt = now
     */
    Result<void> record(const std::string& workflow_id,
                        const std::string& hash,
                        std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

    /**
     * Remove the base entry and persist (no-op if absent)
     */
    Result<void> remove(const std::string& workflow_id);

    /**
     * Move the entry of old_id to new_id and persist
     *
     * Used when a record deleted out of band is re-created with a new id.
     * No-op if old_id has no entry.
     */
    Result<void> migrate(const std::string& old_id, const std::string& new_id);

    std::vector<std::string> workflow_ids() const;

    size_t size() const;

    const std::filesystem::path& path() const noexcept { return state_file_; }

    static std::string format_timestamp(std::chrono::system_clock::time_point at);

private:
    Result<void> save_locked() const;

    std::filesystem::path state_file_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SyncStateEntry> entries_;
};

} // namespace state
} // namespace wfsync
