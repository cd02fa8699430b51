/**
 * @file components.hpp
 * @brief Ready-made subscribers for the reconciliation events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatusBoard board(bus);
 * // Watcher / SyncEngine emit, both components react
 */

#pragma once

#include "wfsync/events/event_bus.hpp"
#include "wfsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace wfsync::events {

/**
 * @brief Logs every event record through spdlog
 *
 * Status changes log at debug (the watcher broadcasts a lot of them), the
 * rest at info, errors at error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subs_.push_back(bus.scoped_subscribe<WorkflowStatusChangedEvent>(
            [](const WorkflowStatusChangedEvent& e) {
                spdlog::debug("[Status] {} id={} status={}",
                              e.filename, e.workflow_id.value_or("-"),
                              workflow::SyncStatusUtils::to_string(e.status));
            }));

        subs_.push_back(bus.scoped_subscribe<SyncErrorEvent>([](const SyncErrorEvent& e) {
            spdlog::error("[SyncError] {}{}", e.message,
                          e.workflow_id ? " (id=" + *e.workflow_id + ")" : std::string{});
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowArchivedEvent>([](const WorkflowArchivedEvent& e) {
            spdlog::info("[Archived] {} -> .archive/{} reason={}", e.filename, e.archive_name, e.reason);
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowPulledEvent>([](const WorkflowPulledEvent& e) {
            spdlog::info("[Pulled] {} id={} hash={}{}", e.filename, e.workflow_id,
                         e.hash.substr(0, 12), e.forced ? " (forced)" : "");
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowPushedEvent>([](const WorkflowPushedEvent& e) {
            spdlog::info("[Pushed] {} id={} hash={}{}{}", e.filename, e.workflow_id,
                         e.hash.substr(0, 12), e.created ? " (created)" : "",
                         e.forced ? " (forced)" : "");
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowIdMigratedEvent>([](const WorkflowIdMigratedEvent& e) {
            spdlog::warn("[IdMigrated] {} {} -> {}", e.filename, e.old_id, e.new_id);
        }));

        subs_.push_back(bus.scoped_subscribe<RemoteWorkflowDeletedEvent>([](const RemoteWorkflowDeletedEvent& e) {
            spdlog::warn("[RemoteDeleted] {} id={}", e.filename, e.workflow_id);
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowRestoredEvent>([](const WorkflowRestoredEvent& e) {
            spdlog::info("[Restored] {} from .archive/{}", e.filename, e.archive_name);
        }));
    }

private:
    std::vector<Subscription> subs_;
};

/**
 * @brief Latest status per file plus operation counters
 *
 * WHAT IT DOES:
 * Keeps what a status table needs without querying the Watcher again.
 *
 * USAGE:
 * StatusBoard board(bus);
 * watcher.start();
 * for (const auto& [file, entry] : board.entries()) { ... }
 */
class StatusBoard {
public:
    struct Entry {
        std::optional<std::string> workflow_id;
        workflow::SyncStatus status = workflow::SyncStatus::CONFLICT;
    };

    struct Stats {
        std::atomic<uint64_t> pulls{0};
        std::atomic<uint64_t> pushes{0};
        std::atomic<uint64_t> creates{0};
        std::atomic<uint64_t> archives{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> migrations{0};
    };

    explicit StatusBoard(EventBus& bus) {
        subs_.push_back(bus.scoped_subscribe<WorkflowStatusChangedEvent>(
            [this](const WorkflowStatusChangedEvent& e) {
                std::lock_guard lock(mutex_);
                entries_[e.filename] = Entry{e.workflow_id, e.status};
            }));

        subs_.push_back(bus.scoped_subscribe<WorkflowPulledEvent>([this](const WorkflowPulledEvent&) {
            stats_.pulls++;
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowPushedEvent>([this](const WorkflowPushedEvent& e) {
            stats_.pushes++;
            if (e.created) {
                stats_.creates++;
            }
        }));

        subs_.push_back(bus.scoped_subscribe<WorkflowArchivedEvent>([this](const WorkflowArchivedEvent&) {
            stats_.archives++;
        }));

        subs_.push_back(bus.scoped_subscribe<SyncErrorEvent>([this](const SyncErrorEvent&) {
            stats_.errors++;
        }));

        // A migrated id leaves a stale row under the same filename; the
        // next status broadcast overwrites it.
        subs_.push_back(bus.scoped_subscribe<WorkflowIdMigratedEvent>([this](const WorkflowIdMigratedEvent&) {
            stats_.migrations++;
        }));
    }

    std::optional<Entry> find(const std::string& filename) const {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(filename);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, Entry> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    size_t count(workflow::SyncStatus status) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& [_, entry] : entries_) {
            if (entry.status == status) {
                ++n;
            }
        }
        return n;
    }

    const Stats& stats() const { return stats_; }

    void print_summary() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync summary:");
        spdlog::info("  In sync:     {}", count(workflow::SyncStatus::IN_SYNC));
        spdlog::info("  Conflicts:   {}", count(workflow::SyncStatus::CONFLICT));
        spdlog::info("  Pulled:      {}", stats_.pulls.load());
        spdlog::info("  Pushed:      {} ({} created)", stats_.pushes.load(), stats_.creates.load());
        spdlog::info("  Archived:    {}", stats_.archives.load());
        spdlog::info("  Errors:      {}", stats_.errors.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    Stats stats_;
    std::vector<Subscription> subs_;  // last member: unsubscribed before the rest is destroyed
};

} // namespace wfsync::events
