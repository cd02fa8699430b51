#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace wfsync::test_support {

inline std::filesystem::path create_temp_dir(const std::string& prefix = "wfsync_test_") {
    static std::atomic<uint64_t> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = base / std::filesystem::path(prefix + std::to_string(id));
    std::filesystem::create_directories(unique);
    return unique;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& document) {
    write_file(path, document.dump(2));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

inline nlohmann::json read_json(const std::filesystem::path& path) {
    return nlohmann::json::parse(read_file(path));
}

} // namespace wfsync::test_support
