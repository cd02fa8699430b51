#include "wfsync/sync/engine.hpp"

#include "wfsync/events/events.hpp"
#include "wfsync/workflow/hasher.hpp"
#include "wfsync/workflow/normalizer.hpp"
#include "wfsync/workflow/workflow_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace wfsync::sync {
namespace fs = std::filesystem;

using workflow::CanonicalHasher;
using workflow::Document;
using workflow::SyncStatus;
using workflow::SyncStatusUtils;
using workflow::WorkflowNormalizer;
using workflow::WorkflowRef;

// ──────────────────────────────────────────────────────────
// ObservationGuard
// ──────────────────────────────────────────────────────────

Result<ObservationGuard> ObservationGuard::acquire(Watcher& watcher, const std::string& key) {
    ObservationGuard guard(watcher);
    auto held = guard.adopt(key);
    if (held.is_error()) {
        return Err<ObservationGuard, Error>(held.error());
    }
    return Ok(std::move(guard));
}

ObservationGuard::ObservationGuard(ObservationGuard&& other) noexcept
    : watcher_(other.watcher_), keys_(std::move(other.keys_)) {
    other.keys_.clear();
}

ObservationGuard& ObservationGuard::operator=(ObservationGuard&& other) noexcept {
    if (this != &other) {
        release_all();
        watcher_ = other.watcher_;
        keys_ = std::move(other.keys_);
        other.keys_.clear();
    }
    return *this;
}

ObservationGuard::~ObservationGuard() {
    release_all();
}

Result<void> ObservationGuard::adopt(const std::string& key) {
    if (std::find(keys_.begin(), keys_.end(), key) != keys_.end()) {
        return Ok();
    }
    if (!watcher_->try_acquire(key)) {
        return Err<void>(ErrorCode::Busy, "Another operation is already running for " + key);
    }
    keys_.push_back(key);
    return Ok();
}

void ObservationGuard::release_all() {
    // Reverse order: the newest key (e.g. a freshly created id) resumes first
    for (auto it = keys_.rbegin(); it != keys_.rend(); ++it) {
        watcher_->release(*it);
    }
    keys_.clear();
}

// ──────────────────────────────────────────────────────────
// SyncEngine
// ──────────────────────────────────────────────────────────

SyncEngine::SyncEngine(remote::RemoteApi& remote, Watcher& watcher, events::EventBus& bus)
    : remote_(remote), watcher_(watcher), bus_(bus), archive_(watcher.directory()) {}

Result<void> SyncEngine::pull(const WorkflowRef& ref) {
    const auto id = ref.workflow_id ? ref.workflow_id : watcher_.id_for_filename(ref.filename);
    auto guard = ObservationGuard::acquire(watcher_, id ? *id : file_key(ref.filename));
    if (guard.is_error()) {
        return Err<void, Error>(guard.error());
    }

    const std::string filename = id ? watcher_.filename_for_id(*id).value_or(ref.filename) : ref.filename;
    const auto status = watcher_.calculate_status(filename, id);

    switch (status) {
        case SyncStatus::EXIST_ONLY_REMOTELY:
        case SyncStatus::MODIFIED_REMOTELY: {
            auto pulled = execute_pull(*id, filename, false);
            if (pulled.is_error()) {
                spdlog::error("[SyncEngine] Pull of {} failed: {}", filename, pulled.error().message);
                return Err<void, Error>(pulled.error());
            }
            return Ok();
        }

        case SyncStatus::DELETED_REMOTELY: {
            auto archived = archive_local(filename, id, "remote-deletion");
            if (archived.is_error()) {
                return archived;
            }
            // Remote deletion accepted: the id is gone for good
            return id ? watcher_.remove_workflow_state(*id) : Ok();
        }

        case SyncStatus::CONFLICT:
            return Err<void>(ErrorCode::Conflict,
                             "Conflict on " + filename + ", use a forced pull or push to resolve it");

        default:
            spdlog::debug("[SyncEngine] Pull of {} is a no-op ({})", filename, SyncStatusUtils::to_string(status));
            return Ok();
    }
}

Result<std::string> SyncEngine::push(const WorkflowRef& ref) {
    const auto id = ref.workflow_id ? ref.workflow_id : watcher_.id_for_filename(ref.filename);
    auto guard = ObservationGuard::acquire(watcher_, id ? *id : file_key(ref.filename));
    if (guard.is_error()) {
        return Err<std::string, Error>(guard.error());
    }

    const std::string filename = id ? watcher_.filename_for_id(*id).value_or(ref.filename) : ref.filename;
    const auto status = watcher_.calculate_status(filename, id);

    switch (status) {
        case SyncStatus::EXIST_ONLY_LOCALLY: {
            auto created = execute_create(filename, id, guard.value(), false);
            if (created.is_error()) {
                spdlog::error("[SyncEngine] Create of {} failed: {}", filename, created.error().message);
            }
            return created;
        }

        case SyncStatus::MODIFIED_LOCALLY: {
            auto updated = execute_update(*id, filename, false);
            if (updated.is_error()) {
                spdlog::error("[SyncEngine] Push of {} failed: {}", filename, updated.error().message);
                return Err<std::string, Error>(updated.error());
            }
            return Ok(*id);
        }

        case SyncStatus::DELETED_LOCALLY:
            return Err<std::string>(ErrorCode::ConfirmationRequired,
                                    filename + " was deleted locally; confirm with an explicit remote delete");

        case SyncStatus::CONFLICT:
            return Err<std::string>(ErrorCode::Conflict,
                                    "Conflict on " + filename + ", use a forced pull or push to resolve it");

        default:
            spdlog::debug("[SyncEngine] Push of {} is a no-op ({})", filename, SyncStatusUtils::to_string(status));
            return Ok(id.value_or(std::string{}));
    }
}

Result<void> SyncEngine::force_pull(const std::string& workflow_id) {
    auto guard = ObservationGuard::acquire(watcher_, workflow_id);
    if (guard.is_error()) {
        return Err<void, Error>(guard.error());
    }

    const auto filename = watcher_.filename_for_id(workflow_id);
    if (!filename) {
        return Err<void>(ErrorCode::NotFound, "Unknown workflow " + workflow_id);
    }

    auto pulled = execute_pull(workflow_id, *filename, true);
    if (pulled.is_error()) {
        spdlog::error("[SyncEngine] Forced pull of {} failed: {}", *filename, pulled.error().message);
        return Err<void, Error>(pulled.error());
    }
    if (!pulled.value()) {
        return Err<void>(ErrorCode::NotFound,
                         "Workflow " + workflow_id + " no longer exists remotely, local copy archived");
    }
    return Ok();
}

Result<std::string> SyncEngine::force_push(const std::string& workflow_id) {
    auto guard = ObservationGuard::acquire(watcher_, workflow_id);
    if (guard.is_error()) {
        return Err<std::string, Error>(guard.error());
    }

    const auto filename = watcher_.filename_for_id(workflow_id);
    std::error_code ec;
    if (!filename || !fs::exists(watcher_.directory() / *filename, ec)) {
        return Err<std::string>(ErrorCode::NotFound, "No local file for workflow " + workflow_id);
    }

    auto updated = execute_update(workflow_id, *filename, true);
    if (updated.is_ok()) {
        return Ok(workflow_id);
    }
    if (updated.error().code != ErrorCode::NotFound) {
        spdlog::error("[SyncEngine] Forced push of {} failed: {}", *filename, updated.error().message);
        return Err<std::string, Error>(updated.error());
    }

    spdlog::info("[SyncEngine] Workflow {} not found remotely, re-creating it from {}", workflow_id, *filename);
    auto created = execute_create(*filename, workflow_id, guard.value(), true);
    if (created.is_error()) {
        spdlog::error("[SyncEngine] Re-creating {} failed: {}", *filename, created.error().message);
    }
    return created;
}

Result<void> SyncEngine::delete_remote(const std::string& workflow_id) {
    auto guard = ObservationGuard::acquire(watcher_, workflow_id);
    if (guard.is_error()) {
        return Err<void, Error>(guard.error());
    }

    const auto filename = watcher_.filename_for_id(workflow_id);

    // Never delete without a copy to come back to
    if (filename && !archive_.has_entry_for(*filename)) {
        auto fetched = remote_.get(workflow_id);
        if (fetched.is_error()) {
            return Err<void, Error>(fetched.error());
        }
        if (fetched.value()) {
            auto snapshot = archive_.snapshot(*filename,
                                              WorkflowNormalizer::to_local_file(*fetched.value(), workflow_id));
            if (snapshot.is_error()) {
                return Err<void, Error>(snapshot.error());
            }
            bus_.emit(events::WorkflowArchivedEvent{*filename, snapshot.value(), workflow_id, "remote-delete"});
        }
    }

    auto removed = remote_.remove(workflow_id);
    if (removed.is_error()) {
        if (removed.error().code != ErrorCode::NotFound) {
            spdlog::error("[SyncEngine] Remote delete of {} failed: {}", workflow_id, removed.error().message);
            return removed;
        }
        spdlog::warn("[SyncEngine] Workflow {} was already gone remotely", workflow_id);
    }

    if (filename) {
        auto archived = archive_local(*filename, workflow_id, "remote-delete");
        if (archived.is_error()) {
            return archived;
        }
    }

    bus_.emit(events::RemoteWorkflowDeletedEvent{workflow_id, filename.value_or(workflow_id + ".json")});
    return Ok();
}

Result<void> SyncEngine::finalize_deletion(const std::string& workflow_id) {
    auto guard = ObservationGuard::acquire(watcher_, workflow_id);
    if (guard.is_error()) {
        return Err<void, Error>(guard.error());
    }
    return watcher_.remove_workflow_state(workflow_id);
}

Result<std::string> SyncEngine::restore_from_archive(const std::string& filename) {
    auto guard = ObservationGuard::acquire(watcher_, file_key(filename));
    if (guard.is_error()) {
        return Err<std::string, Error>(guard.error());
    }

    auto restored = archive_.restore(filename);
    if (restored.is_error()) {
        return restored;
    }

    bus_.emit(events::WorkflowRestoredEvent{filename, restored.value()});
    watcher_.on_local_change(filename);
    return restored;
}

Result<void> SyncEngine::resolve_conflict(const WorkflowRef& ref, ConflictStrategy strategy) {
    const auto id = ref.workflow_id ? ref.workflow_id : watcher_.id_for_filename(ref.filename);
    if (!id) {
        return Err<void>(ErrorCode::InvalidData, ref.filename + " has no workflow id, nothing to resolve against");
    }

    switch (strategy) {
        case ConflictStrategy::KeepLocal: {
            auto pushed = force_push(*id);
            if (pushed.is_error()) {
                return Err<void, Error>(pushed.error());
            }
            return Ok();
        }
        case ConflictStrategy::KeepRemote:
            return force_pull(*id);
        case ConflictStrategy::Manual:
        default:
            return Err<void>(ErrorCode::Conflict,
                             "Manual resolution of " + ref.filename + ": edit the file, then force a push");
    }
}

BatchReport SyncEngine::pull_all() {
    BatchReport report;
    for (const auto& snap : watcher_.status_matrix()) {
        if (snap.status == SyncStatus::CONFLICT) {
            report.skipped.push_back({snap.filename, "conflict"});
            continue;
        }
        if (!SyncStatusUtils::wants_pull(snap.status)) {
            continue;
        }

        auto pulled = pull(snap.ref());
        if (pulled.is_error()) {
            report.failed.push_back({snap.filename, pulled.error().message});
        } else {
            report.done.push_back({snap.filename, SyncStatusUtils::to_string(snap.status)});
        }
    }

    spdlog::info("[SyncEngine] Pull sweep: {} done, {} skipped, {} failed",
                 report.done.size(), report.skipped.size(), report.failed.size());
    return report;
}

BatchReport SyncEngine::push_all() {
    BatchReport report;
    for (const auto& snap : watcher_.status_matrix()) {
        if (snap.status == SyncStatus::CONFLICT) {
            report.skipped.push_back({snap.filename, "conflict"});
            continue;
        }
        if (snap.status == SyncStatus::DELETED_LOCALLY) {
            report.skipped.push_back({snap.filename, "deleted locally, awaiting confirmation"});
            continue;
        }
        if (!SyncStatusUtils::wants_push(snap.status)) {
            continue;
        }

        auto pushed = push(snap.ref());
        if (pushed.is_error()) {
            report.failed.push_back({snap.filename, pushed.error().message});
        } else {
            report.done.push_back({snap.filename, SyncStatusUtils::to_string(snap.status)});
        }
    }

    spdlog::info("[SyncEngine] Push sweep: {} done, {} skipped, {} failed",
                 report.done.size(), report.skipped.size(), report.failed.size());
    return report;
}

// ──────────────────────────────────────────────────────────
// Steps
// ──────────────────────────────────────────────────────────

Result<bool> SyncEngine::execute_pull(const std::string& workflow_id, const std::string& filename, bool forced) {
    auto fetched = remote_.get(workflow_id);
    if (fetched.is_error()) {
        return Err<bool, Error>(fetched.error());
    }

    if (!fetched.value()) {
        spdlog::warn("[SyncEngine] Workflow {} vanished remotely before it could be pulled", workflow_id);
        auto archived = archive_local(filename, workflow_id, "remote-deletion");
        if (archived.is_error()) {
            return Err<bool, Error>(archived.error());
        }
        // Same outcome as a pull on DELETED_REMOTELY: the id is gone for good
        auto removed = watcher_.remove_workflow_state(workflow_id);
        if (removed.is_error()) {
            return Err<bool, Error>(removed.error());
        }
        return Ok(false);
    }

    const Document& remote_doc = *fetched.value();
    const std::string hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(remote_doc));

    auto written = workflow::write_document(watcher_.directory() / filename,
                                            WorkflowNormalizer::to_local_file(remote_doc, workflow_id));
    if (written.is_error()) {
        return Err<bool, Error>(written.error());
    }

    watcher_.set_remote_hash(workflow_id, hash, updated_at_of(remote_doc));
    auto finalized = watcher_.finalize_sync(workflow_id);
    if (finalized.is_error()) {
        return Err<bool, Error>(finalized.error());
    }

    bus_.emit(events::WorkflowPulledEvent{filename, workflow_id, hash, forced});
    return Ok(true);
}

Result<void> SyncEngine::execute_update(const std::string& workflow_id, const std::string& filename, bool forced) {
    auto local = workflow::read_document(watcher_.directory() / filename);
    if (local.is_error()) {
        return Err<void, Error>(local.error());
    }

    auto updated = remote_.update(workflow_id, WorkflowNormalizer::clean_for_push(local.value()));
    if (updated.is_error()) {
        return Err<void, Error>(updated.error());
    }

    // The server's answer is authoritative; writing it back makes local == remote
    const Document& server_doc = updated.value();
    const std::string hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(server_doc));

    auto written = workflow::write_document(watcher_.directory() / filename,
                                            WorkflowNormalizer::to_local_file(server_doc, workflow_id));
    if (written.is_error()) {
        return written;
    }

    watcher_.set_remote_hash(workflow_id, hash, updated_at_of(server_doc));
    auto finalized = watcher_.finalize_sync(workflow_id);
    if (finalized.is_error()) {
        return finalized;
    }

    bus_.emit(events::WorkflowPushedEvent{filename, workflow_id, hash, false, forced});
    return Ok();
}

Result<std::string> SyncEngine::execute_create(const std::string& filename,
                                               const std::optional<std::string>& previous_id,
                                               ObservationGuard& guard,
                                               bool forced) {
    const fs::path path = watcher_.directory() / filename;
    auto local = workflow::read_document(path);
    if (local.is_error()) {
        return Err<std::string, Error>(local.error());
    }
    if (!local.value().is_object()) {
        return Err<std::string>(ErrorCode::InvalidData, filename + " does not contain a JSON object");
    }

    // The remote name must derive back to this filename, or the next listing
    // would pull the workflow into a second file
    Document payload = WorkflowNormalizer::clean_for_push(local.value());
    const bool name_matches = payload.contains("name") && payload["name"].is_string() &&
                              WorkflowNormalizer::filename_for(payload["name"].get<std::string>()) == filename;
    if (!name_matches) {
        payload["name"] = fs::path(filename).stem().string();
    }

    auto created = remote_.create(payload);
    if (created.is_error()) {
        return Err<std::string, Error>(created.error());
    }

    const std::string new_id = remote::id_of(created.value());
    if (new_id.empty()) {
        return Err<std::string>(ErrorCode::InvalidData, "Remote create of " + filename + " returned no id");
    }

    // Cover the new id before its file is rewritten
    auto adopted = guard.adopt(new_id);
    if (adopted.is_error()) {
        spdlog::warn("[SyncEngine] Could not guard new id {}: {}", new_id, adopted.error().message);
    }

    Document file = local.value();
    file["id"] = new_id;
    if (!name_matches) {
        file["name"] = payload["name"];
    }
    auto written = workflow::write_document(path, file);
    if (written.is_error()) {
        return Err<std::string>(ErrorCode::Io, "Created remote workflow " + new_id +
                                                   " but could not write its id into " + filename + ": " +
                                                   written.error().message);
    }

    if (previous_id && *previous_id != new_id) {
        auto migrated = watcher_.migrate_workflow_id(*previous_id, new_id);
        if (migrated.is_error()) {
            return Err<std::string, Error>(migrated.error());
        }
        bus_.emit(events::WorkflowIdMigratedEvent{filename, *previous_id, new_id});
    }

    const std::string hash = CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(file));
    watcher_.set_remote_hash(new_id, hash, updated_at_of(created.value()));

    auto finalized = watcher_.finalize_sync(new_id);
    if (finalized.is_error()) {
        return Err<std::string, Error>(finalized.error());
    }

    bus_.emit(events::WorkflowPushedEvent{filename, new_id, hash, true, forced});
    return Ok(new_id);
}

Result<void> SyncEngine::archive_local(const std::string& filename,
                                       const std::optional<std::string>& workflow_id,
                                       const std::string& reason) {
    auto moved = archive_.move_into(filename);
    if (moved.is_error()) {
        if (moved.error().code == ErrorCode::NotFound) {
            return Ok();
        }
        return Err<void, Error>(moved.error());
    }

    bus_.emit(events::WorkflowArchivedEvent{filename, moved.value(), workflow_id, reason});
    return Ok();
}

std::optional<std::string> SyncEngine::updated_at_of(const Document& document) {
    if (document.is_object() && document.contains("updatedAt") && document["updatedAt"].is_string()) {
        return document["updatedAt"].get<std::string>();
    }
    return std::nullopt;
}

} // namespace wfsync::sync
