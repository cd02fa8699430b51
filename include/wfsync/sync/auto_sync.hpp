#pragma once

/**
 * @file auto_sync.hpp
 * @brief Reacts to status broadcasts by running the engine in the background
 *
 * WHAT IT DOES:
 * Subscribes to WorkflowStatusChangedEvent and queues every workflow whose
 * status calls for a pull or a push. A single worker thread drains the
 * queue and calls SyncEngine::pull / push.
 *
 * The queue is keyed by filename, so a burst of broadcasts for the same
 * workflow collapses into one operation carrying the latest status.
 * CONFLICT and DELETED_LOCALLY are never acted upon here; those need a
 * human decision.
 *
 * USAGE:
 * AutoSyncDriver driver(engine, bus, {true, true});
 * driver.start();
 * // ... watcher runs, broadcasts are turned into pulls/pushes ...
 * driver.stop();
 */

#include "wfsync/events/event_bus.hpp"
#include "wfsync/events/event_queue.hpp"
#include "wfsync/events/events.hpp"
#include "wfsync/sync/engine.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace wfsync::sync {

struct AutoSyncOptions {
    bool auto_pull = true;
    bool auto_push = false;
};

class AutoSyncDriver {
public:
    AutoSyncDriver(SyncEngine& engine, events::EventBus& bus, AutoSyncOptions options);
    ~AutoSyncDriver();

    AutoSyncDriver(const AutoSyncDriver&) = delete;
    AutoSyncDriver& operator=(const AutoSyncDriver&) = delete;

    void start();
    void stop();

    bool running() const { return running_; }
    size_t pending() const { return queue_.size(); }

    uint64_t completed() const { return completed_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    struct Job {
        workflow::WorkflowRef ref;
        workflow::SyncStatus status;
    };

    void on_status(const events::WorkflowStatusChangedEvent& event);
    void run();
    void process(const Job& job);

    SyncEngine& engine_;
    events::EventBus& bus_;
    AutoSyncOptions options_;

    events::CoalescingQueue<std::string, Job> queue_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};

    events::Subscription subscription_;
};

} // namespace wfsync::sync
