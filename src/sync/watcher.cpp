#include "wfsync/sync/watcher.hpp"

#include "wfsync/events/events.hpp"
#include "wfsync/sync/status.hpp"
#include "wfsync/workflow/hasher.hpp"
#include "wfsync/workflow/normalizer.hpp"
#include "wfsync/workflow/workflow_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <system_error>

namespace wfsync::sync {
namespace fs = std::filesystem;

using workflow::CanonicalHasher;
using workflow::StatusSnapshot;
using workflow::SyncStatus;
using workflow::WorkflowNormalizer;
using workflow::WorkflowSummary;

Watcher::Watcher(asio::io_context& io_context,
                 remote::RemoteApi& remote,
                 events::EventBus& bus,
                 WatcherOptions options)
    : io_context_(io_context),
      remote_(remote),
      bus_(bus),
      options_(std::move(options)),
      state_(options_.directory / state::kStateFileName),
      archive_(options_.directory),
      poll_timer_(io_context) {}

Watcher::~Watcher() {
    stop();
}

// ════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════

Result<void> Watcher::start() {
    if (running_) {
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(options_.directory, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Cannot create sync directory " + options_.directory.string() +
                                            ": " + ec.message());
    }

    auto remote = refresh_remote_state();
    if (remote.is_error()) {
        return remote;
    }
    auto local = refresh_local_state();
    if (local.is_error()) {
        return local;
    }

    if (options_.watch_filesystem) {
        directory_watcher_ = std::make_unique<DirectoryWatcher>(
            io_context_, options_.directory, options_.debounce,
            [this](const std::string& filename, DirectoryWatcher::ChangeKind kind) {
                on_directory_event(filename, kind);
            });
        auto watching = directory_watcher_->start();
        if (watching.is_error()) {
            directory_watcher_.reset();
            return watching;
        }
    }

    running_ = true;
    if (options_.poll_interval.count() > 0) {
        schedule_poll();
    }

    {
        std::lock_guard lock(mutex_);
        spdlog::info("[Watcher] Started on {} ({} local files, {} remote workflows, {} tracked)",
                     options_.directory.string(), local_hashes_.size(), remote_hashes_.size(), state_.size());
    }
    broadcast_all();
    return Ok();
}

void Watcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (directory_watcher_) {
        directory_watcher_->stop();
    }
    poll_timer_.cancel();
    spdlog::debug("[Watcher] Stopped");
}

void Watcher::schedule_poll() {
    poll_timer_.expires_after(options_.poll_interval);

    std::weak_ptr<bool> alive = alive_;
    poll_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || alive.expired() || !running_) {
            return;
        }
        // Failures are reported as SyncErrorEvent and retried next tick
        auto refreshed = refresh_remote_state();
        if (refreshed.is_error()) {
            spdlog::debug("[Watcher] Poll failed, retrying in {}ms", options_.poll_interval.count());
        }
        schedule_poll();
    });
}

void Watcher::schedule_remote_refresh() {
    if (refresh_scheduled_.exchange(true)) {
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    asio::post(io_context_, [this, alive]() {
        if (alive.expired()) {
            return;
        }
        refresh_scheduled_ = false;
        if (!running_) {
            return;
        }
        auto refreshed = refresh_remote_state();
        if (refreshed.is_error()) {
            spdlog::debug("[Watcher] Refresh after resume failed: {}", refreshed.error().message);
        }
    });
}

void Watcher::on_directory_event(const std::string& filename, DirectoryWatcher::ChangeKind kind) {
    switch (kind) {
        case DirectoryWatcher::ChangeKind::Upserted:
            on_local_change(filename);
            break;
        case DirectoryWatcher::ChangeKind::Removed:
            on_local_delete(filename);
            break;
        case DirectoryWatcher::ChangeKind::Overflow: {
            auto refreshed = refresh_local_state();
            if (refreshed.is_error()) {
                emit_error("Local rescan failed: " + refreshed.error().message);
            }
            break;
        }
    }
}

// ════════════════════════════════════════════════════════
// Local observation
// ════════════════════════════════════════════════════════

Watcher::LocalRead Watcher::read_local(const std::string& filename) const {
    LocalRead read;
    read.filename = filename;

    auto document = workflow::read_document(options_.directory / filename);
    if (document.is_error()) {
        if (document.error().code != ErrorCode::NotFound) {
            spdlog::warn("[Watcher] Skipping {}: {}", filename, document.error().message);
            read.malformed = true;
        }
        return read;
    }

    const std::string id = remote::id_of(document.value());
    if (!id.empty()) {
        read.content_id = id;
    }
    read.hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(document.value()));
    return read;
}

void Watcher::apply_local_read_locked(const LocalRead& read, std::vector<Target>& changed) {
    if (read.malformed) {
        return;
    }

    const auto id = resolve_id_locked(read.filename, read.content_id);
    if (id && is_guarded_locked(*id)) {
        return;
    }

    if (!read.hash) {
        if (local_hashes_.erase(read.filename) > 0) {
            changed.emplace_back(read.filename, id);
        }
        return;
    }

    if (read.content_id) {
        file_to_id_[read.filename] = *read.content_id;
        id_to_file_[*read.content_id] = read.filename;
    }
    if (id) {
        archived_deletions_.erase(*id);  // file is back, a later deletion is a new episode
    }

    auto it = local_hashes_.find(read.filename);
    if (it == local_hashes_.end() || it->second != *read.hash) {
        local_hashes_[read.filename] = *read.hash;
        changed.emplace_back(read.filename, id);
    }
}

Result<void> Watcher::refresh_local_state() {
    std::vector<Target> changed;
    std::error_code ec;

    if (!fs::is_directory(options_.directory, ec)) {
        spdlog::warn("[Watcher] Sync directory {} is missing", options_.directory.string());
        {
            std::lock_guard lock(mutex_);
            for (const auto& [filename, _] : local_hashes_) {
                changed.emplace_back(filename, resolve_id_locked(filename, std::nullopt));
            }
            local_hashes_.clear();
        }
        broadcast(changed);
        return Ok();
    }

    std::vector<std::string> filenames;
    for (const auto& entry : fs::directory_iterator(options_.directory, ec)) {
        std::error_code type_ec;
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file(type_ec) && workflow::is_workflow_filename(name)) {
            filenames.push_back(name);
        }
    }
    if (ec) {
        return Err<void>(ErrorCode::Io, "Cannot list " + options_.directory.string() + ": " + ec.message());
    }

    std::vector<LocalRead> reads;
    reads.reserve(filenames.size());
    for (const auto& filename : filenames) {
        reads.push_back(read_local(filename));
    }

    {
        std::lock_guard lock(mutex_);
        const std::unordered_set<std::string> present(filenames.begin(), filenames.end());

        std::vector<std::string> vanished;
        for (const auto& [filename, _] : local_hashes_) {
            if (present.count(filename) == 0) {
                vanished.push_back(filename);
            }
        }
        for (const auto& filename : vanished) {
            LocalRead gone;
            gone.filename = filename;
            apply_local_read_locked(gone, changed);
        }

        for (const auto& read : reads) {
            apply_local_read_locked(read, changed);
        }
    }

    broadcast(changed);
    return Ok();
}

void Watcher::on_local_change(const std::string& filename) {
    if (!workflow::is_workflow_filename(filename)) {
        return;
    }

    const LocalRead read = read_local(filename);
    std::vector<Target> changed;
    {
        std::lock_guard lock(mutex_);
        apply_local_read_locked(read, changed);
    }
    broadcast(changed);
}

void Watcher::on_local_delete(const std::string& filename) {
    if (!workflow::is_workflow_filename(filename)) {
        return;
    }

    LocalRead gone;
    gone.filename = filename;

    std::vector<Target> changed;
    {
        std::lock_guard lock(mutex_);
        apply_local_read_locked(gone, changed);
    }
    broadcast(changed);
}

// ════════════════════════════════════════════════════════
// Remote observation
// ════════════════════════════════════════════════════════

Result<void> Watcher::refresh_remote_state() {
    std::lock_guard refresh_lock(refresh_mutex_);

    auto listed = remote_.list();
    if (listed.is_error()) {
        emit_error("Remote refresh failed: " + listed.error().message);
        return Err<void, Error>(listed.error());
    }

    std::vector<WorkflowSummary> candidates;
    for (auto& summary : listed.value()) {
        if (!WorkflowNormalizer::should_ignore(summary, options_.sync_inactive, options_.ignored_tags)) {
            candidates.push_back(std::move(summary));
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const WorkflowSummary& a, const WorkflowSummary& b) { return a.active && !b.active; });

    struct Fetch {
        std::string id;
        std::string filename;
        std::string updated_at;
    };

    std::vector<Fetch> fetches;
    std::vector<Target> changed;
    std::unordered_set<std::string> seen;

    {
        std::lock_guard lock(mutex_);
        std::unordered_map<std::string, std::string> claims;  // filename -> id, this refresh only

        for (const auto& summary : candidates) {
            const std::string filename = WorkflowNormalizer::filename_for(summary.name);
            auto claim = claims.find(filename);
            if (claim != claims.end() && claim->second != summary.id) {
                spdlog::warn("[Watcher] {} maps to {} which is already claimed by {}, skipping",
                             summary.id, filename, claim->second);
                continue;
            }
            claims[filename] = summary.id;
            seen.insert(summary.id);

            if (is_guarded_locked(summary.id)) {
                continue;
            }

            id_to_file_[summary.id] = filename;
            file_to_id_[filename] = summary.id;

            auto hash = remote_hashes_.find(summary.id);
            auto stamp = remote_timestamps_.find(summary.id);
            const bool needs_fetch = hash == remote_hashes_.end() || stamp == remote_timestamps_.end() ||
                                     (!summary.updated_at.empty() && stamp->second != summary.updated_at);
            if (needs_fetch) {
                fetches.push_back(Fetch{summary.id, filename, summary.updated_at});
            } else {
                changed.emplace_back(filename, summary.id);
            }
        }
    }

    for (const auto& fetch : fetches) {
        auto full = remote_.get(fetch.id);
        if (full.is_error()) {
            spdlog::warn("[Watcher] Could not fetch workflow {}: {}", fetch.id, full.error().message);
            continue;
        }
        if (!full.value()) {
            seen.erase(fetch.id);  // deleted between listing and fetch
            continue;
        }

        const std::string hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(*full.value()));

        std::lock_guard lock(mutex_);
        if (is_guarded_locked(fetch.id)) {
            continue;
        }
        remote_hashes_[fetch.id] = hash;
        if (!fetch.updated_at.empty()) {
            remote_timestamps_[fetch.id] = fetch.updated_at;
        }
        changed.emplace_back(fetch.filename, fetch.id);
    }

    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> vanished;
        for (const auto& [id, _] : remote_hashes_) {
            if (seen.count(id) == 0 && !is_guarded_locked(id)) {
                vanished.push_back(id);
            }
        }
        for (const auto& id : vanished) {
            remote_hashes_.erase(id);
            remote_timestamps_.erase(id);
            auto file = id_to_file_.find(id);
            changed.emplace_back(file != id_to_file_.end() ? file->second : id + ".json", id);
        }
    }

    broadcast(changed);
    return Ok();
}

// ════════════════════════════════════════════════════════
// Status
// ════════════════════════════════════════════════════════

std::optional<std::string> Watcher::resolve_id_locked(const std::string& filename,
                                                      const std::optional<std::string>& hint) const {
    if (hint) {
        return hint;
    }
    auto it = file_to_id_.find(filename);
    if (it == file_to_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

StatusSnapshot Watcher::snapshot_locked(const std::string& filename,
                                        const std::optional<std::string>& workflow_id) const {
    StatusSnapshot snap;
    snap.filename = filename;
    snap.workflow_id = resolve_id_locked(filename, workflow_id);

    auto local = local_hashes_.find(filename);
    if (local != local_hashes_.end()) {
        snap.local_hash = local->second;
    }

    std::optional<std::string> base;
    if (snap.workflow_id) {
        auto remote = remote_hashes_.find(*snap.workflow_id);
        if (remote != remote_hashes_.end()) {
            snap.remote_hash = remote->second;
        }
        base = state_.last_synced_hash(*snap.workflow_id);
    }

    snap.status = compute_status(snap.local_hash, snap.remote_hash, base);
    return snap;
}

SyncStatus Watcher::calculate_status(const std::string& filename,
                                     const std::optional<std::string>& workflow_id) const {
    return snapshot(filename, workflow_id).status;
}

StatusSnapshot Watcher::snapshot(const std::string& filename,
                                 const std::optional<std::string>& workflow_id) const {
    std::lock_guard lock(mutex_);
    return snapshot_locked(filename, workflow_id);
}

std::vector<StatusSnapshot> Watcher::status_matrix() const {
    std::lock_guard lock(mutex_);

    std::map<std::string, std::optional<std::string>> known;
    for (const auto& [filename, _] : local_hashes_) {
        known[filename] = resolve_id_locked(filename, std::nullopt);
    }

    auto add_id = [&](const std::string& id) {
        auto file = id_to_file_.find(id);
        const std::string filename = file != id_to_file_.end() ? file->second : id + ".json";
        known.emplace(filename, id);
    };
    for (const auto& [id, _] : remote_hashes_) {
        add_id(id);
    }
    for (const auto& id : state_.workflow_ids()) {
        add_id(id);
    }

    std::vector<StatusSnapshot> matrix;
    matrix.reserve(known.size());
    for (const auto& [filename, id] : known) {
        matrix.push_back(snapshot_locked(filename, id));
    }
    return matrix;
}

std::optional<std::string> Watcher::filename_for_id(const std::string& workflow_id) const {
    std::lock_guard lock(mutex_);
    auto it = id_to_file_.find(workflow_id);
    if (it == id_to_file_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Watcher::id_for_filename(const std::string& filename) const {
    std::lock_guard lock(mutex_);
    return resolve_id_locked(filename, std::nullopt);
}

std::optional<std::string> Watcher::last_synced_hash(const std::string& workflow_id) const {
    return state_.last_synced_hash(workflow_id);
}

std::vector<std::string> Watcher::tracked_workflow_ids() const {
    return state_.workflow_ids();
}

// ════════════════════════════════════════════════════════
// Broadcast
// ════════════════════════════════════════════════════════

void Watcher::broadcast(const std::vector<Target>& targets) {
    // Last entry per filename wins
    std::map<std::string, std::optional<std::string>> unique;
    for (const auto& [filename, id] : targets) {
        unique[filename] = id;
    }

    for (const auto& [filename, id] : unique) {
        StatusSnapshot snap;
        bool take_snapshot = false;
        {
            std::lock_guard lock(mutex_);
            snap = snapshot_locked(filename, id);
            if (snap.status == SyncStatus::DELETED_LOCALLY && snap.workflow_id &&
                !is_guarded_locked(*snap.workflow_id)) {
                take_snapshot = archived_deletions_.insert(*snap.workflow_id).second;
            }
        }

        if (take_snapshot) {
            archive_deleted_locally(filename, *snap.workflow_id);
        }

        bus_.emit(events::WorkflowStatusChangedEvent{snap.filename, snap.workflow_id, snap.status});
    }
}

void Watcher::broadcast_all() {
    std::vector<Target> targets;
    for (const auto& snap : status_matrix()) {
        targets.emplace_back(snap.filename, snap.workflow_id);
    }
    broadcast(targets);
}

void Watcher::archive_deleted_locally(const std::string& filename, const std::string& workflow_id) {
    auto forget = [this, &workflow_id]() {
        std::lock_guard lock(mutex_);
        archived_deletions_.erase(workflow_id);
    };

    auto remote = remote_.get(workflow_id);
    if (remote.is_error()) {
        forget();
        emit_error("Could not snapshot " + filename + " before deletion: " + remote.error().message, workflow_id);
        return;
    }
    if (!remote.value()) {
        forget();
        spdlog::warn("[Watcher] {} was deleted locally but {} is gone remotely too", filename, workflow_id);
        return;
    }

    auto archived = archive_.snapshot(filename, WorkflowNormalizer::to_local_file(*remote.value(), workflow_id));
    if (archived.is_error()) {
        forget();
        emit_error("Could not snapshot " + filename + " before deletion: " + archived.error().message, workflow_id);
        return;
    }

    bus_.emit(events::WorkflowArchivedEvent{filename, archived.value(), workflow_id, "local-deletion"});
}

void Watcher::emit_error(const std::string& message, const std::optional<std::string>& workflow_id) {
    spdlog::warn("[Watcher] {}", message);
    bus_.emit(events::SyncErrorEvent{message, workflow_id});
}

// ════════════════════════════════════════════════════════
// Commits
// ════════════════════════════════════════════════════════

Result<void> Watcher::finalize_sync(const std::string& workflow_id) {
    std::optional<std::string> filename = filename_for_id(workflow_id);

    if (!filename) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(options_.directory, ec)) {
            const std::string name = entry.path().filename().string();
            if (!workflow::is_workflow_filename(name)) {
                continue;
            }
            auto document = workflow::read_document(entry.path());
            if (document.is_ok() && remote::id_of(document.value()) == workflow_id) {
                filename = name;
                break;
            }
        }
    }
    if (!filename) {
        return Err<void>(ErrorCode::NotFound,
                         "Cannot finalize " + workflow_id + ": no local file carries this id");
    }

    auto document = workflow::read_document(options_.directory / *filename);
    if (document.is_error()) {
        return Err<void>(document.error().code,
                         "Cannot finalize " + workflow_id + ": " + document.error().message);
    }
    const std::string hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(document.value()));

    auto recorded = state_.record(workflow_id, hash);
    if (recorded.is_error()) {
        return recorded;
    }

    {
        std::lock_guard lock(mutex_);
        local_hashes_[*filename] = hash;
        remote_hashes_[workflow_id] = hash;
        file_to_id_[*filename] = workflow_id;
        id_to_file_[workflow_id] = *filename;
        archived_deletions_.erase(workflow_id);
    }

    spdlog::debug("[Watcher] Finalized {} ({}) at {}", *filename, workflow_id, hash.substr(0, 12));
    broadcast({{*filename, workflow_id}});
    return Ok();
}

Result<void> Watcher::remove_workflow_state(const std::string& workflow_id) {
    auto removed = state_.remove(workflow_id);

    const auto filename = filename_for_id(workflow_id);
    std::error_code ec;
    const bool file_present = filename && fs::exists(options_.directory / *filename, ec);

    std::lock_guard lock(mutex_);
    if (filename) {
        auto mapped = file_to_id_.find(*filename);
        if (mapped != file_to_id_.end() && mapped->second == workflow_id) {
            file_to_id_.erase(mapped);
        }
        if (!file_present) {
            local_hashes_.erase(*filename);
        }
    }
    id_to_file_.erase(workflow_id);
    remote_hashes_.erase(workflow_id);
    remote_timestamps_.erase(workflow_id);
    archived_deletions_.erase(workflow_id);
    return removed;
}

Result<void> Watcher::migrate_workflow_id(const std::string& old_id, const std::string& new_id) {
    auto migrated = state_.migrate(old_id, new_id);

    std::lock_guard lock(mutex_);
    auto file = id_to_file_.find(old_id);
    if (file != id_to_file_.end()) {
        const std::string filename = file->second;
        id_to_file_.erase(file);
        id_to_file_[new_id] = filename;
        file_to_id_[filename] = new_id;
    }

    auto hash = remote_hashes_.find(old_id);
    if (hash != remote_hashes_.end()) {
        remote_hashes_[new_id] = hash->second;
        remote_hashes_.erase(old_id);
    }

    auto stamp = remote_timestamps_.find(old_id);
    if (stamp != remote_timestamps_.end()) {
        remote_timestamps_[new_id] = stamp->second;
        remote_timestamps_.erase(old_id);
    }

    if (archived_deletions_.erase(old_id) > 0) {
        archived_deletions_.insert(new_id);
    }

    spdlog::info("[Watcher] Migrated workflow id {} -> {}", old_id, new_id);
    return migrated;
}

void Watcher::set_remote_hash(const std::string& workflow_id,
                              const std::string& hash,
                              const std::optional<std::string>& updated_at) {
    std::lock_guard lock(mutex_);
    remote_hashes_[workflow_id] = hash;
    if (updated_at && !updated_at->empty()) {
        remote_timestamps_[workflow_id] = *updated_at;
    }
}

// ════════════════════════════════════════════════════════
// Guards
// ════════════════════════════════════════════════════════

bool Watcher::is_guarded_locked(const std::string& key) const {
    return paused_.count(key) > 0 || in_progress_.count(key) > 0;
}

bool Watcher::is_guarded(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return is_guarded_locked(key);
}

void Watcher::pause_observation(const std::string& key) {
    std::lock_guard lock(mutex_);
    paused_.insert(key);
}

void Watcher::mark_sync_in_progress(const std::string& key) {
    std::lock_guard lock(mutex_);
    in_progress_.insert(key);
}

void Watcher::mark_sync_complete(const std::string& key) {
    std::lock_guard lock(mutex_);
    in_progress_.erase(key);
}

bool Watcher::try_acquire(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (is_guarded_locked(key)) {
        return false;
    }
    paused_.insert(key);
    in_progress_.insert(key);
    return true;
}

void Watcher::release(const std::string& key) {
    mark_sync_complete(key);
    resume_observation(key);
}

void Watcher::resume_observation(const std::string& key) {
    std::optional<std::string> filename;
    {
        std::lock_guard lock(mutex_);
        paused_.erase(key);
        if (!is_guarded_locked(key)) {
            auto it = id_to_file_.find(key);
            if (it != id_to_file_.end()) {
                filename = it->second;
            }
        }
    }

    // Whatever happened to the file while we looked away is observed now
    if (filename) {
        const LocalRead read = read_local(*filename);
        std::vector<Target> changed;
        {
            std::lock_guard lock(mutex_);
            apply_local_read_locked(read, changed);
        }
        broadcast(changed);
    }

    if (running_) {
        schedule_remote_refresh();
    }
}

} // namespace wfsync::sync
