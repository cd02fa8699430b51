#pragma once

/**
 * @file archive.hpp
 * @brief The .archive/ resurrection buffer
 *
 * Entries are named `<epochMillis>_<filename>`. Nothing in here decides
 * WHEN to archive; the Watcher snapshots on local deletion, the engine
 * moves files aside on remote deletion.
 */

#include "wfsync/core/result.hpp"
#include "wfsync/workflow/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wfsync::sync {

inline constexpr const char* kArchiveDirName = ".archive";

class ArchiveStore {
public:
    explicit ArchiveStore(std::filesystem::path sync_directory);

    const std::filesystem::path& directory() const noexcept { return archive_dir_; }

    /**
     * @brief Write a document into the archive
     * @return archive entry name, e.g. "1700000000000_Flow.json"
     */
    Result<std::string> snapshot(const std::string& filename,
                                 const workflow::Document& content,
                                 std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

    /**
     * @brief Rename <sync dir>/<filename> into the archive
     *
     * NotFound if the working file does not exist.
     */
    Result<std::string> move_into(const std::string& filename,
                                  std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

    /**
     * @brief Entries for filename, newest first
     */
    std::vector<std::string> entries_for(const std::string& filename) const;

    std::optional<std::string> latest_for(const std::string& filename) const;

    bool has_entry_for(const std::string& filename) const { return latest_for(filename).has_value(); }

    /**
     * @brief Copy the newest entry back to <sync dir>/<filename>, then delete it
     *
     * Overwrites an existing working file. NotFound if there is no entry.
     * @return name of the restored archive entry
     */
    Result<std::string> restore(const std::string& filename);

    /**
     * @brief "<ms>_<filename>" -> (ms, filename); nullopt for foreign names
     */
    static std::optional<std::pair<long long, std::string>> parse_entry_name(const std::string& entry);

private:
    Result<void> ensure_directory() const;
    std::string entry_name(const std::string& filename, std::chrono::system_clock::time_point at) const;

    std::filesystem::path sync_dir_;
    std::filesystem::path archive_dir_;
};

} // namespace wfsync::sync
