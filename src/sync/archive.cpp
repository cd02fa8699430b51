#include "wfsync/sync/archive.hpp"

#include "wfsync/workflow/workflow_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace wfsync::sync {
namespace fs = std::filesystem;

ArchiveStore::ArchiveStore(fs::path sync_directory)
    : sync_dir_(std::move(sync_directory)),
      archive_dir_(sync_dir_ / kArchiveDirName) {}

Result<std::string> ArchiveStore::snapshot(const std::string& filename,
                                           const workflow::Document& content,
                                           std::chrono::system_clock::time_point at) {
    auto dir = ensure_directory();
    if (dir.is_error()) {
        return Err<std::string, Error>(dir.error());
    }

    const std::string name = entry_name(filename, at);
    auto written = workflow::write_document(archive_dir_ / name, content);
    if (written.is_error()) {
        return Err<std::string, Error>(written.error());
    }

    spdlog::info("[Archive] Snapshot of {} written to {}/{}", filename, kArchiveDirName, name);
    return Ok(name);
}

Result<std::string> ArchiveStore::move_into(const std::string& filename,
                                            std::chrono::system_clock::time_point at) {
    const fs::path source = sync_dir_ / filename;
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return Err<std::string>(ErrorCode::NotFound, "Nothing to archive, " + filename + " does not exist");
    }

    auto dir = ensure_directory();
    if (dir.is_error()) {
        return Err<std::string, Error>(dir.error());
    }

    const std::string name = entry_name(filename, at);
    fs::rename(source, archive_dir_ / name, ec);
    if (ec) {
        return Err<std::string>(ErrorCode::Io, "Failed to move " + filename + " into archive: " + ec.message());
    }

    spdlog::info("[Archive] Moved {} to {}/{}", filename, kArchiveDirName, name);
    return Ok(name);
}

std::vector<std::string> ArchiveStore::entries_for(const std::string& filename) const {
    std::vector<std::pair<long long, std::string>> matches;

    std::error_code ec;
    if (!fs::is_directory(archive_dir_, ec)) {
        return {};
    }

    for (const auto& entry : fs::directory_iterator(archive_dir_, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        auto parsed = parse_entry_name(name);
        if (parsed && parsed->second == filename) {
            matches.emplace_back(parsed->first, name);
        }
    }

    std::sort(matches.begin(), matches.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::string> names;
    names.reserve(matches.size());
    for (auto& [_, name] : matches) {
        names.push_back(std::move(name));
    }
    return names;
}

std::optional<std::string> ArchiveStore::latest_for(const std::string& filename) const {
    auto entries = entries_for(filename);
    if (entries.empty()) {
        return std::nullopt;
    }
    return entries.front();
}

Result<std::string> ArchiveStore::restore(const std::string& filename) {
    auto latest = latest_for(filename);
    if (!latest) {
        return Err<std::string>(ErrorCode::NotFound, "No archive entry for " + filename);
    }

    const fs::path archived = archive_dir_ / *latest;
    auto content = workflow::read_document(archived);
    if (content.is_error()) {
        return Err<std::string, Error>(content.error());
    }

    auto written = workflow::write_document(sync_dir_ / filename, content.value());
    if (written.is_error()) {
        return Err<std::string, Error>(written.error());
    }

    std::error_code ec;
    fs::remove(archived, ec);
    if (ec) {
        // The working copy is back, a leftover entry only costs disk space.
        spdlog::warn("[Archive] Restored {} but could not delete {}: {}", filename, *latest, ec.message());
    }

    spdlog::info("[Archive] Restored {} from {}", filename, *latest);
    return Ok(*latest);
}

std::optional<std::pair<long long, std::string>> ArchiveStore::parse_entry_name(const std::string& entry) {
    const auto sep = entry.find('_');
    if (sep == 0 || sep == std::string::npos || sep + 1 >= entry.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < sep; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(entry[i]))) {
            return std::nullopt;
        }
    }
    try {
        return std::make_pair(std::stoll(entry.substr(0, sep)), entry.substr(sep + 1));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

Result<void> ArchiveStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(archive_dir_, ec);
    if (ec) {
        return Err<void>(ErrorCode::Io, "Failed to create " + archive_dir_.string() + ": " + ec.message());
    }
    return Ok();
}

std::string ArchiveStore::entry_name(const std::string& filename,
                                     std::chrono::system_clock::time_point at) const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    // Two archives of the same file within one millisecond must not collide.
    std::error_code ec;
    while (fs::exists(archive_dir_ / (std::to_string(millis) + "_" + filename), ec)) {
        ++millis;
    }
    return std::to_string(millis) + "_" + filename;
}

} // namespace wfsync::sync
