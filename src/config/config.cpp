#include "wfsync/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace wfsync::config {
namespace fs = std::filesystem;

namespace {

Result<void> type_error(const std::string& key, const char* expected) {
    return Err<void>(ErrorCode::InvalidData, "Config key '" + key + "' must be " + expected);
}

Result<void> read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return Ok();
    if (!j[key].is_string()) return type_error(key, "a string");
    out = j[key].get<std::string>();
    return Ok();
}

Result<void> read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return Ok();
    if (!j[key].is_number_integer() || j[key].get<int64_t>() <= 0) {
        return type_error(key, "a positive integer");
    }
    out = std::chrono::milliseconds(j[key].get<int64_t>());
    return Ok();
}

} // namespace

sync::WatcherOptions SyncConfig::watcher_options() const {
    sync::WatcherOptions options;
    options.directory = directory;
    options.poll_interval = poll_interval;
    options.debounce = debounce;
    options.sync_inactive = sync_inactive;
    options.ignored_tags = ignored_tags;
    return options;
}

spdlog::level::level_enum SyncConfig::spdlog_level() const {
    return spdlog::level::from_str(log_level);
}

Result<void> merge_file(SyncConfig& config, const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<void>(ErrorCode::NotFound, "Cannot open config file " + path.string());
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        return Err<void>(ErrorCode::InvalidData, "Malformed config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        return Err<void>(ErrorCode::InvalidData, "Config file " + path.string() + " must contain a JSON object");
    }

    SyncConfig merged = config;

    for (auto step : {read_string(j, "host", merged.host),
                      read_string(j, "apiKey", merged.api_key),
                      read_string(j, "logLevel", merged.log_level),
                      read_millis(j, "pollIntervalMs", merged.poll_interval),
                      read_millis(j, "debounceMs", merged.debounce)}) {
        if (step.is_error()) return step;
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) return type_error("directory", "a string");
        merged.directory = j["directory"].get<std::string>();
    }

    if (j.contains("syncInactive")) {
        if (!j["syncInactive"].is_boolean()) return type_error("syncInactive", "a boolean");
        merged.sync_inactive = j["syncInactive"].get<bool>();
    }

    if (j.contains("ignoredTags")) {
        const auto& tags = j["ignoredTags"];
        if (!tags.is_array()) return type_error("ignoredTags", "an array of strings");
        merged.ignored_tags.clear();
        for (const auto& tag : tags) {
            if (!tag.is_string()) return type_error("ignoredTags", "an array of strings");
            std::string name = tag.get<std::string>();
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            merged.ignored_tags.push_back(std::move(name));
        }
    }

    config = std::move(merged);
    spdlog::debug("[Config] Loaded {}", path.string());
    return Ok();
}

void merge_environment(SyncConfig& config, const EnvLookup& lookup) {
    if (const char* host = lookup("N8N_HOST"); host && *host) {
        config.host = host;
    }
    if (const char* key = lookup("N8N_API_KEY"); key && *key) {
        config.api_key = key;
    }
}

Result<SyncConfig> load_config(const std::optional<fs::path>& explicit_path) {
    SyncConfig config;

    std::error_code ec;
    if (explicit_path) {
        auto merged = merge_file(config, *explicit_path);
        if (merged.is_error()) {
            return Err<SyncConfig, Error>(merged.error());
        }
    } else if (fs::exists(kDefaultConfigFile, ec)) {
        auto merged = merge_file(config, kDefaultConfigFile);
        if (merged.is_error()) {
            return Err<SyncConfig, Error>(merged.error());
        }
    }

    merge_environment(config, [](const char* name) { return std::getenv(name); });
    return Ok(std::move(config));
}

Result<void> validate_remote(const SyncConfig& config) {
    if (config.host.empty()) {
        return Err<void>(ErrorCode::InvalidData, "No host configured (set N8N_HOST, --host or \"host\" in wfsync.json)");
    }
    if (config.api_key.empty()) {
        return Err<void>(ErrorCode::InvalidData, "No API key configured (set N8N_API_KEY or \"apiKey\" in wfsync.json)");
    }
    return Ok();
}

} // namespace wfsync::config
