/**
 * @file events.hpp
 * @brief Event records published by the Watcher and the Sync Engine
 *
 * WHY THIS FILE EXISTS:
 * Everything the reconciliation core wants to tell the outside world is a
 * plain tagged record defined here. Subscribers pick the records they care
 * about through the EventBus.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: WorkflowPulledEvent, WorkflowArchivedEvent
 */

#pragma once

#include "wfsync/workflow/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace wfsync::events {

// ════════════════════════════════════════════════════════
// Observation
// ════════════════════════════════════════════════════════

/**
 * @brief A workflow's derived status was (re)computed
 *
 * WHO EMITS:
 * - Watcher, after every local rescan, remote refresh and finalizeSync()
 *
 * WHO SUBSCRIBES:
 * - StatusBoard (latest status per file)
 * - AutoSyncDriver (decides whether to pull or push)
 * - LoggerComponent
 */
struct WorkflowStatusChangedEvent {
    std::string filename;
    std::optional<std::string> workflow_id;
    workflow::SyncStatus status;
    std::chrono::system_clock::time_point timestamp;

    WorkflowStatusChangedEvent(std::string file,
                               std::optional<std::string> id,
                               workflow::SyncStatus s)
        : filename(std::move(file)),
          workflow_id(std::move(id)),
          status(s),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief A background task or engine operation failed
 *
 * The core keeps running; the message is for presentation.
 */
struct SyncErrorEvent {
    std::string message;
    std::optional<std::string> workflow_id;
    std::chrono::system_clock::time_point timestamp;

    explicit SyncErrorEvent(std::string msg, std::optional<std::string> id = std::nullopt)
        : message(std::move(msg)),
          workflow_id(std::move(id)),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief A file was written to .archive/
 *
 * reason: "local-deletion" (snapshot of the remote), "remote-deletion"
 * (local file moved aside) or "remote-delete" (explicit deleteRemote)
 */
struct WorkflowArchivedEvent {
    std::string filename;
    std::string archive_name;
    std::optional<std::string> workflow_id;
    std::string reason;
};

// ════════════════════════════════════════════════════════
// Mutation
// ════════════════════════════════════════════════════════

struct WorkflowPulledEvent {
    std::string filename;
    std::string workflow_id;
    std::string hash;
    bool forced = false;
};

struct WorkflowPushedEvent {
    std::string filename;
    std::string workflow_id;
    std::string hash;
    bool created = false;
    bool forced = false;
};

/**
 * @brief forcePush re-created a record that vanished remotely
 */
struct WorkflowIdMigratedEvent {
    std::string filename;
    std::string old_id;
    std::string new_id;
};

struct RemoteWorkflowDeletedEvent {
    std::string workflow_id;
    std::string filename;
};

struct WorkflowRestoredEvent {
    std::string filename;
    std::string archive_name;
};

} // namespace wfsync::events
