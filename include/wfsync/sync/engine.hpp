#pragma once

/**
 * @file engine.hpp
 * @brief The mutator: pull, push and the forced/recovery operations
 *
 * WHY THIS FILE EXISTS:
 * The Watcher says WHAT the situation is; the engine decides what to DO
 * about it, following one fixed table per direction:
 *
 * PULL (remote -> local)
 *   EXIST_ONLY_REMOTELY  fetch, write local, finalize
 *   MODIFIED_REMOTELY    fetch, overwrite local, finalize
 *   DELETED_REMOTELY     move local file into .archive/, drop base
 *   CONFLICT             refused (ErrorCode::Conflict)
 *   anything else        no-op
 *
 * PUSH (local -> remote)
 *   EXIST_ONLY_LOCALLY   create, write assigned id into the file, finalize
 *   MODIFIED_LOCALLY     update, overwrite local with the server's version, finalize
 *   DELETED_LOCALLY      refused (ErrorCode::ConfirmationRequired), use delete_remote
 *   CONFLICT             refused (ErrorCode::Conflict)
 *   anything else        no-op
 *
 * GUARANTEES:
 * - Every mutation holds an ObservationGuard for its id, released on every
 *   exit path, so the Watcher never reacts to the engine's own writes
 * - A second operation on a held id fails with ErrorCode::Busy
 * - The engine never edits the Watcher's maps; it commits through
 *   finalize_sync / migrate_workflow_id / remove_workflow_state
 * - Nothing is deleted remotely without an explicit delete_remote() call
 */

#include "wfsync/core/result.hpp"
#include "wfsync/events/event_bus.hpp"
#include "wfsync/remote/remote_api.hpp"
#include "wfsync/sync/archive.hpp"
#include "wfsync/sync/watcher.hpp"
#include "wfsync/workflow/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wfsync::sync {

/**
 * @brief Whole-document resolution of a CONFLICT
 *
 * No field-level merge: the chosen side overwrites the other.
 */
enum class ConflictStrategy {
    KeepLocal,   // force_push
    KeepRemote,  // force_pull
    Manual       // refuse, the user edits the file and forces a push
};

/**
 * @brief RAII pause + in-progress hold on one or more workflow ids
 *
 * EXAMPLE:
 * auto guard = ObservationGuard::acquire(watcher, id);
 * if (guard.is_error()) return ...;   // Busy
 * ... mutate ...
 * // released when guard goes out of scope, success or not
 */
class ObservationGuard {
public:
    static Result<ObservationGuard> acquire(Watcher& watcher, const std::string& key);

    ObservationGuard(ObservationGuard&& other) noexcept;
    ObservationGuard& operator=(ObservationGuard&& other) noexcept;
    ObservationGuard(const ObservationGuard&) = delete;
    ObservationGuard& operator=(const ObservationGuard&) = delete;

    ~ObservationGuard();

    /**
     * @brief Hold one more key (e.g. the id a create just produced)
     */
    Result<void> adopt(const std::string& key);

    const std::vector<std::string>& keys() const { return keys_; }

private:
    explicit ObservationGuard(Watcher& watcher) : watcher_(&watcher) {}
    void release_all();

    Watcher* watcher_;
    std::vector<std::string> keys_;
};

/**
 * @brief Outcome of pull_all() / push_all()
 *
 * One failing workflow never aborts the sweep.
 */
struct BatchReport {
    struct Item {
        std::string filename;
        std::string detail;
    };

    std::vector<Item> done;
    std::vector<Item> skipped;
    std::vector<Item> failed;

    bool ok() const { return failed.empty(); }
};

class SyncEngine {
public:
    SyncEngine(remote::RemoteApi& remote, Watcher& watcher, events::EventBus& bus);

    /**
     * @brief Apply the PULL table to the workflow's current status
     */
    Result<void> pull(const workflow::WorkflowRef& ref);

    /**
     * @brief Apply the PUSH table to the workflow's current status
     * @return the workflow id afterwards (a new one after a create)
     */
    Result<std::string> push(const workflow::WorkflowRef& ref);

    /**
     * @brief Unconditional fetch + overwrite + finalize
     */
    Result<void> force_pull(const std::string& workflow_id);

    /**
     * @brief Unconditional update; a vanished record is re-created and
     *        its identity migrated
     * @return the id the workflow has afterwards
     */
    Result<std::string> force_push(const std::string& workflow_id);

    /**
     * @brief Delete the remote record (first step of a confirmed deletion)
     *
     * Makes sure an archive copy exists, moves a still-present local file
     * into the archive. The base entry stays until finalize_deletion().
     */
    Result<void> delete_remote(const std::string& workflow_id);

    /**
     * @brief Second step of a confirmed deletion: forget the workflow
     */
    Result<void> finalize_deletion(const std::string& workflow_id);

    /**
     * @brief Bring back the newest archived copy of filename
     * @return the archive entry that was restored
     */
    Result<std::string> restore_from_archive(const std::string& filename);

    Result<void> resolve_conflict(const workflow::WorkflowRef& ref, ConflictStrategy strategy);

    BatchReport pull_all();
    BatchReport push_all();

private:
    /**
     * Fetch, write the local file, finalize. false if the record vanished
     * (the local file, if any, has then been archived and the base dropped).
     */
    Result<bool> execute_pull(const std::string& workflow_id, const std::string& filename, bool forced);
    Result<void> execute_update(const std::string& workflow_id, const std::string& filename, bool forced);
    Result<std::string> execute_create(const std::string& filename,
                                       const std::optional<std::string>& previous_id,
                                       ObservationGuard& guard,
                                       bool forced);
    Result<void> archive_local(const std::string& filename,
                               const std::optional<std::string>& workflow_id,
                               const std::string& reason);

    static std::string file_key(const std::string& filename) { return "file:" + filename; }
    static std::optional<std::string> updated_at_of(const workflow::Document& document);

    remote::RemoteApi& remote_;
    Watcher& watcher_;
    events::EventBus& bus_;
    ArchiveStore archive_;
};

} // namespace wfsync::sync
