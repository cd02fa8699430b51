#include "wfsync/state/store.hpp"

#include "wfsync/workflow/workflow_file.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace wfsync::state {
namespace fs = std::filesystem;
using json = nlohmann::json;

StateStore::StateStore(fs::path state_file) : state_file_(std::move(state_file)) {
    load();
}

void StateStore::load() {
    std::unique_lock lock(mutex_);
    entries_.clear();

    std::error_code ec;
    if (!fs::exists(state_file_, ec)) {
        return;
    }

    auto document = workflow::read_document(state_file_);
    if (document.is_error()) {
        spdlog::warn("[StateStore] Could not read {} ({}), using empty state",
                     state_file_.string(), document.error().message);
        return;
    }

    const auto& root = document.value();
    if (!root.is_object()) {
        spdlog::warn("[StateStore] {} is not a JSON object, using empty state", state_file_.string());
        return;
    }
    auto workflows = root.find("workflows");
    if (workflows == root.end() || !workflows->is_object()) {
        return;
    }

    for (auto it = workflows->begin(); it != workflows->end(); ++it) {
        const auto& value = it.value();
        if (!value.is_object() || !value.contains("lastSyncedHash") ||
            !value["lastSyncedHash"].is_string()) {
            spdlog::warn("[StateStore] Skipping malformed state entry for {}", it.key());
            continue;
        }
        SyncStateEntry entry;
        entry.last_synced_hash = value["lastSyncedHash"].get<std::string>();
        entry.last_synced_at = value.value("lastSyncedAt", std::string{});
        entries_.emplace(it.key(), std::move(entry));
    }
}

std::optional<SyncStateEntry> StateStore::get(const std::string& workflow_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(workflow_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> StateStore::last_synced_hash(const std::string& workflow_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(workflow_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.last_synced_hash;
}

Result<void> StateStore::record(const std::string& workflow_id,
                                const std::string& hash,
                                std::chrono::system_clock::time_point at) {
    std::unique_lock lock(mutex_);
    entries_[workflow_id] = SyncStateEntry{hash, format_timestamp(at)};
    return save_locked();
}

Result<void> StateStore::remove(const std::string& workflow_id) {
    std::unique_lock lock(mutex_);
    if (entries_.erase(workflow_id) == 0) {
        return Ok();
    }
    return save_locked();
}

Result<void> StateStore::migrate(const std::string& old_id, const std::string& new_id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(old_id);
    if (it == entries_.end() || old_id == new_id) {
        return Ok();
    }
    SyncStateEntry entry = it->second;
    entries_.erase(it);
    entries_[new_id] = std::move(entry);
    return save_locked();
}

std::vector<std::string> StateStore::workflow_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, _] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

size_t StateStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::string StateStore::format_timestamp(std::chrono::system_clock::time_point at) {
    using namespace std::chrono;
    const auto millis = duration_cast<milliseconds>(at.time_since_epoch()).count() % 1000;
    const std::time_t seconds = system_clock::to_time_t(at);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis)
        << 'Z';
    return oss.str();
}

Result<void> StateStore::save_locked() const {
    json workflows = json::object();
    for (const auto& [id, entry] : entries_) {
        workflows[id] = json{
            {"lastSyncedHash", entry.last_synced_hash},
            {"lastSyncedAt", entry.last_synced_at}
        };
    }

    auto result = workflow::write_document(state_file_, json{{"workflows", workflows}});
    if (result.is_error()) {
        spdlog::error("[StateStore] Failed to persist {}: {}", state_file_.string(), result.error().message);
    }
    return result;
}

} // namespace wfsync::state
