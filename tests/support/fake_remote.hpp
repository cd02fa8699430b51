#pragma once

#include "wfsync/remote/remote_api.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wfsync::test_support {

/**
 * In-memory remote service: assigns ids, bumps updatedAt on every write,
 * keeps active/tags across updates the way the real service does.
 */
class FakeRemote : public remote::RemoteApi {
public:
    using Document = workflow::Document;

    // ── Test-side manipulation (no call counting) ──

    std::string add(Document doc) {
        std::lock_guard lock(mutex_);
        std::string id = doc.contains("id") && doc["id"].is_string() ? doc["id"].get<std::string>() : next_id();
        doc["id"] = id;
        if (!doc.contains("active")) doc["active"] = false;
        if (!doc.contains("tags")) doc["tags"] = Document::array();
        if (!doc.contains("nodes")) doc["nodes"] = Document::array();
        if (!doc.contains("connections")) doc["connections"] = Document::object();
        if (!doc.contains("settings")) doc["settings"] = Document::object();
        doc["updatedAt"] = next_timestamp();
        records_[id] = doc;
        return id;
    }

    void edit(const std::string& id, const std::string& key, Document value) {
        std::lock_guard lock(mutex_);
        auto& doc = records_.at(id);
        doc[key] = std::move(value);
        doc["updatedAt"] = next_timestamp();
    }

    void erase(const std::string& id) {
        std::lock_guard lock(mutex_);
        records_.erase(id);
    }

    std::optional<Document> record(const std::string& id) const {
        std::lock_guard lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    // Every following call fails with this error until cleared
    void fail_with(std::optional<Error> error) {
        std::lock_guard lock(mutex_);
        failure_ = std::move(error);
    }

    int list_calls() const { std::lock_guard lock(mutex_); return list_calls_; }
    int get_calls() const { std::lock_guard lock(mutex_); return get_calls_; }
    int create_calls() const { std::lock_guard lock(mutex_); return create_calls_; }
    int update_calls() const { std::lock_guard lock(mutex_); return update_calls_; }
    int remove_calls() const { std::lock_guard lock(mutex_); return remove_calls_; }

    // ── RemoteApi ──

    Result<std::vector<workflow::WorkflowSummary>> list() override {
        std::lock_guard lock(mutex_);
        ++list_calls_;
        if (failure_) return Err<std::vector<workflow::WorkflowSummary>, Error>(*failure_);

        std::vector<workflow::WorkflowSummary> out;
        for (const auto& [id, doc] : records_) {
            auto summary = remote::summary_from_document(doc);
            if (summary.is_ok()) out.push_back(summary.value());
        }
        return Ok(std::move(out));
    }

    Result<std::optional<Document>> get(const std::string& id) override {
        std::lock_guard lock(mutex_);
        ++get_calls_;
        if (failure_) return Err<std::optional<Document>, Error>(*failure_);

        auto it = records_.find(id);
        if (it == records_.end()) return Ok(std::optional<Document>{});
        return Ok(std::optional<Document>(it->second));
    }

    Result<Document> create(const Document& payload) override {
        std::lock_guard lock(mutex_);
        ++create_calls_;
        if (failure_) return Err<Document, Error>(*failure_);

        Document doc = payload;
        const std::string id = next_id();
        doc["id"] = id;
        doc["active"] = false;
        doc["tags"] = Document::array();
        doc["updatedAt"] = next_timestamp();
        records_[id] = doc;
        return Ok(doc);
    }

    Result<Document> update(const std::string& id, const Document& payload) override {
        std::lock_guard lock(mutex_);
        ++update_calls_;
        if (failure_) return Err<Document, Error>(*failure_);

        auto it = records_.find(id);
        if (it == records_.end()) {
            return Err<Document>(ErrorCode::NotFound, "Workflow " + id + " not found");
        }
        Document doc = payload;
        doc["id"] = id;
        doc["active"] = it->second.value("active", false);
        doc["tags"] = it->second.contains("tags") ? it->second["tags"] : Document::array();
        doc["updatedAt"] = next_timestamp();
        it->second = doc;
        return Ok(doc);
    }

    Result<void> remove(const std::string& id) override {
        std::lock_guard lock(mutex_);
        ++remove_calls_;
        if (failure_) return Err<void, Error>(*failure_);

        if (records_.erase(id) == 0) {
            return Err<void>(ErrorCode::NotFound, "Workflow " + id + " not found");
        }
        return Ok();
    }

private:
    std::string next_id() { return "wf" + std::to_string(++id_counter_); }

    std::string next_timestamp() {
        return "2024-01-01T00:00:00." + std::to_string(100000 + ++clock_) + "Z";
    }

    mutable std::mutex mutex_;
    std::map<std::string, Document> records_;
    std::optional<Error> failure_;
    int id_counter_ = 0;
    int clock_ = 0;
    int list_calls_ = 0;
    int get_calls_ = 0;
    int create_calls_ = 0;
    int update_calls_ = 0;
    int remove_calls_ = 0;
};

} // namespace wfsync::test_support
