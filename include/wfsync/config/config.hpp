#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration for the sync tool
 *
 * Sources, later ones overriding earlier ones:
 * 1. Built-in defaults
 * 2. JSON file (wfsync.json in the working directory, or --config <path>)
 * 3. Environment (N8N_HOST, N8N_API_KEY)
 * 4. Command-line flags (applied by the CLI)
 *
 * EXAMPLE wfsync.json:
 * {
 *   "host": "https://n8n.example.com",
 *   "apiKey": "...",
 *   "directory": "./workflows",
 *   "pollIntervalMs": 3000,
 *   "ignoredTags": ["archive"]
 * }
 */

#include "wfsync/core/result.hpp"
#include "wfsync/sync/watcher.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wfsync::config {

inline constexpr const char* kDefaultConfigFile = "wfsync.json";

struct SyncConfig {
    std::string host;
    std::string api_key;
    std::filesystem::path directory = "./workflows";
    std::chrono::milliseconds poll_interval{3000};
    std::chrono::milliseconds debounce{500};
    bool sync_inactive = true;
    std::vector<std::string> ignored_tags{"archive"};
    std::string log_level = "info";

    sync::WatcherOptions watcher_options() const;
    spdlog::level::level_enum spdlog_level() const;
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Overlay the keys present in a JSON config file
 *
 * Unknown keys are ignored; a key with the wrong type is an error.
 */
Result<void> merge_file(SyncConfig& config, const std::filesystem::path& path);

void merge_environment(SyncConfig& config, const EnvLookup& lookup);

/**
 * @brief Defaults + file + process environment
 *
 * An explicit path must exist; the default wfsync.json is optional.
 */
Result<SyncConfig> load_config(const std::optional<std::filesystem::path>& explicit_path = std::nullopt);

/**
 * @brief Host and API key are needed by every command that reaches the remote
 */
Result<void> validate_remote(const SyncConfig& config);

} // namespace wfsync::config
