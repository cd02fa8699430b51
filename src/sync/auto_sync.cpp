#include "wfsync/sync/auto_sync.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace wfsync::sync {

using workflow::SyncStatus;
using workflow::SyncStatusUtils;

AutoSyncDriver::AutoSyncDriver(SyncEngine& engine, events::EventBus& bus, AutoSyncOptions options)
    : engine_(engine), bus_(bus), options_(options) {}

AutoSyncDriver::~AutoSyncDriver() {
    stop();
}

void AutoSyncDriver::start() {
    if (queue_.is_shutdown()) {
        spdlog::warn("[AutoSync] Driver was stopped and cannot be restarted");
        return;
    }
    if (running_.exchange(true)) {
        return;
    }

    subscription_ = bus_.scoped_subscribe<events::WorkflowStatusChangedEvent>(
        [this](const events::WorkflowStatusChangedEvent& e) { on_status(e); });

    worker_ = std::thread([this]() { run(); });
    spdlog::info("[AutoSync] Started (pull={}, push={})", options_.auto_pull, options_.auto_push);
}

void AutoSyncDriver::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    subscription_.reset();
    queue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("[AutoSync] Stopped ({} completed, {} failed)", completed_.load(), failed_.load());
}

void AutoSyncDriver::on_status(const events::WorkflowStatusChangedEvent& event) {
    const bool pull = options_.auto_pull && SyncStatusUtils::wants_pull(event.status);
    const bool push = options_.auto_push && SyncStatusUtils::wants_push(event.status);
    if (!pull && !push) {
        return;
    }

    if (queue_.push(event.filename, Job{{event.filename, event.workflow_id}, event.status})) {
        spdlog::debug("[AutoSync] Queued {} ({})", event.filename, SyncStatusUtils::to_string(event.status));
    }
}

void AutoSyncDriver::run() {
    while (auto job = queue_.pop()) {
        process(*job);
    }
}

void AutoSyncDriver::process(const Job& job) {
    std::optional<Error> failure;

    if (SyncStatusUtils::wants_pull(job.status)) {
        auto pulled = engine_.pull(job.ref);
        if (pulled.is_error()) {
            failure = pulled.error();
        }
    } else {
        auto pushed = engine_.push(job.ref);
        if (pushed.is_error()) {
            failure = pushed.error();
        }
    }

    if (!failure) {
        completed_++;
        return;
    }

    // A held id means a manual operation is running; the next poll re-broadcasts
    if (failure->code == ErrorCode::Busy) {
        spdlog::debug("[AutoSync] {} is busy, skipping", job.ref.filename);
        return;
    }

    failed_++;
    spdlog::warn("[AutoSync] {} failed: {}", job.ref.filename, failure->message);
    bus_.emit(events::SyncErrorEvent(job.ref.filename + ": " + failure->message, job.ref.workflow_id));
}

} // namespace wfsync::sync
