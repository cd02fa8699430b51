#pragma once

/**
 * @file watcher.hpp
 * @brief The observer: hash maps, status derivation, base-state commits
 *
 * WHY THIS FILE EXISTS:
 * Something has to know, at any moment, what the local file hashes to,
 * what the remote record hashes to and what both hashed to when they last
 * agreed. The Watcher owns those three views and derives one of eight
 * statuses from them. It never pulls or pushes.
 *
 * WHAT IT OWNS (one mutex):
 * - local hashes      filename -> canonical hash
 * - remote hashes     workflow id -> canonical hash
 * - remote timestamps workflow id -> updatedAt (polling cache)
 * - identity maps     filename <-> workflow id
 * - guards            paused ids, sync-in-progress ids
 * - the StateStore    (base hashes, persisted)
 *
 * HOW IT OBSERVES:
 * - Local:  DirectoryWatcher (inotify, debounced) -> on_local_change / on_local_delete
 * - Remote: poll timer -> refresh_remote_state (list, then fetch only what changed)
 *
 * HOW THE ENGINE TALKS TO IT:
 * The SyncEngine never touches the maps. It brackets each mutation with
 * try_acquire()/release() and commits through finalize_sync(),
 * migrate_workflow_id(), remove_workflow_state() and set_remote_hash().
 *
 * LOCKING RULES:
 * - The mutex is never held across network calls or workflow file writes
 * - Events are emitted after the mutex is released
 * - A guarded id is ignored by every observation path: its local events
 *   are dropped, its remote entry is neither refreshed nor pruned
 */

#include "wfsync/core/result.hpp"
#include "wfsync/events/event_bus.hpp"
#include "wfsync/remote/remote_api.hpp"
#include "wfsync/state/store.hpp"
#include "wfsync/sync/archive.hpp"
#include "wfsync/sync/directory_watcher.hpp"
#include "wfsync/workflow/types.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wfsync::sync {

struct WatcherOptions {
    std::filesystem::path directory;
    std::chrono::milliseconds poll_interval{3000};  // 0 disables polling
    std::chrono::milliseconds debounce{500};
    bool watch_filesystem = true;                   // false for one-shot commands
    bool sync_inactive = true;
    std::vector<std::string> ignored_tags{"archive"};
};

class Watcher {
public:
    Watcher(asio::io_context& io_context,
            remote::RemoteApi& remote,
            events::EventBus& bus,
            WatcherOptions options);

    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    /**
     * @brief Initial remote + local scan, then install the watch and poll timer
     *
     * Fails if the initial remote listing fails: without it every tracked
     * workflow would look remotely deleted.
     */
    Result<void> start();

    void stop();

    bool running() const { return running_; }

    // ════════════════════════════════════════════════════════
    // Observation
    // ════════════════════════════════════════════════════════

    /**
     * @brief Rescan every visible *.json file in the sync directory
     *
     * Malformed files keep their previous hash and are logged. Files that
     * disappeared lose their local hash and are re-broadcast.
     */
    Result<void> refresh_local_state();

    /**
     * @brief Listing + timestamp-gated fetches + pruning
     *
     * Ignored workflows (inactive or ignored tag) are skipped. When two
     * workflows map to the same filename, active ones claim it first and
     * the first claim wins.
     */
    Result<void> refresh_remote_state();

    void on_local_change(const std::string& filename);
    void on_local_delete(const std::string& filename);

    // ════════════════════════════════════════════════════════
    // Status
    // ════════════════════════════════════════════════════════

    workflow::SyncStatus calculate_status(const std::string& filename,
                                          const std::optional<std::string>& workflow_id = std::nullopt) const;

    workflow::StatusSnapshot snapshot(const std::string& filename,
                                      const std::optional<std::string>& workflow_id = std::nullopt) const;

    /**
     * @brief Every known workflow (local files, remote ids, base entries), sorted by filename
     */
    std::vector<workflow::StatusSnapshot> status_matrix() const;

    std::optional<std::string> filename_for_id(const std::string& workflow_id) const;
    std::optional<std::string> id_for_filename(const std::string& filename) const;
    std::optional<std::string> last_synced_hash(const std::string& workflow_id) const;
    std::vector<std::string> tracked_workflow_ids() const;

    const std::filesystem::path& directory() const { return options_.directory; }

    // ════════════════════════════════════════════════════════
    // Commits (SyncEngine only)
    // ════════════════════════════════════════════════════════

    /**
     * @brief Local file and remote are now identical: record the base
     *
     * Locates the file (scanning the directory for the id when it is not
     * mapped yet), hashes it, sets local = remote = base, persists and
     * broadcasts.
     */
    Result<void> finalize_sync(const std::string& workflow_id);

    /**
     * @brief Drop the base entry and all in-memory tracking of the id
     */
    Result<void> remove_workflow_state(const std::string& workflow_id);

    /**
     * @brief Move base entry, identity maps, remote hash and timestamp to new_id
     */
    Result<void> migrate_workflow_id(const std::string& old_id, const std::string& new_id);

    void set_remote_hash(const std::string& workflow_id,
                         const std::string& hash,
                         const std::optional<std::string>& updated_at = std::nullopt);

    // ════════════════════════════════════════════════════════
    // Guards
    // ════════════════════════════════════════════════════════

    void pause_observation(const std::string& key);

    /**
     * Re-reads the local file of the id and schedules a remote refresh on
     * the loop when running.
     */
    void resume_observation(const std::string& key);

    void mark_sync_in_progress(const std::string& key);
    void mark_sync_complete(const std::string& key);

    /**
     * @brief Pause + mark in progress, atomically; false if already held
     */
    bool try_acquire(const std::string& key);

    /**
     * @brief mark_sync_complete + resume_observation
     */
    void release(const std::string& key);

    bool is_guarded(const std::string& key) const;

private:
    using Target = std::pair<std::string, std::optional<std::string>>;  // filename, id

    struct LocalRead {
        std::string filename;
        std::optional<std::string> content_id;
        std::optional<std::string> hash;  // nullopt: file missing
        bool malformed = false;
    };

    LocalRead read_local(const std::string& filename) const;
    void apply_local_read_locked(const LocalRead& read, std::vector<Target>& changed);
    bool is_guarded_locked(const std::string& key) const;
    std::optional<std::string> resolve_id_locked(const std::string& filename,
                                                 const std::optional<std::string>& hint) const;
    workflow::StatusSnapshot snapshot_locked(const std::string& filename,
                                             const std::optional<std::string>& workflow_id) const;

    /**
     * Computes and emits statuses; snapshots the remote into .archive/
     * first for any new DELETED_LOCALLY.
     */
    void broadcast(const std::vector<Target>& targets);
    void archive_deleted_locally(const std::string& filename, const std::string& workflow_id);
    void broadcast_all();
    void emit_error(const std::string& message, const std::optional<std::string>& workflow_id = std::nullopt);

    void on_directory_event(const std::string& filename, DirectoryWatcher::ChangeKind kind);
    void schedule_poll();
    void schedule_remote_refresh();

    asio::io_context& io_context_;
    remote::RemoteApi& remote_;
    events::EventBus& bus_;
    WatcherOptions options_;

    state::StateStore state_;
    ArchiveStore archive_;
    std::unique_ptr<DirectoryWatcher> directory_watcher_;
    asio::steady_timer poll_timer_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> local_hashes_;
    std::unordered_map<std::string, std::string> remote_hashes_;
    std::unordered_map<std::string, std::string> remote_timestamps_;
    std::unordered_map<std::string, std::string> file_to_id_;
    std::unordered_map<std::string, std::string> id_to_file_;
    std::unordered_set<std::string> paused_;
    std::unordered_set<std::string> in_progress_;
    std::unordered_set<std::string> archived_deletions_;  // snapshot taken for this deletion episode

    std::atomic<bool> running_{false};
    std::atomic<bool> refresh_scheduled_{false};
    std::mutex refresh_mutex_;  // one remote refresh at a time
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace wfsync::sync
