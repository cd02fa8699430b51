#pragma once

/**
 * @file directory_watcher.hpp
 * @brief Debounced inotify watch of the sync directory on an Asio loop
 *
 * WHY THIS FILE EXISTS:
 * Editors write a file in several steps (truncate, write, rename). Acting
 * on every raw event would hash half-written JSON. Each filename gets its
 * own timer that is pushed back on every event; only when a file has been
 * quiet for the debounce window is the change reported.
 *
 * WHAT IT DOES:
 * - Watches ONE directory, non-recursive (.archive/ is never seen)
 * - Ignores hidden names (state file, temporary write files) and non-.json
 * - Reports Upserted or Removed, decided by whether the file exists when
 *   the timer fires, so a delete + re-create inside the window is Upserted
 * - Reports Overflow when the kernel queue overflowed; callers rescan
 *
 * THREADING:
 * start()/stop() and the callback run on the io_context thread (or while
 * the io_context is not running).
 */

#include "wfsync/core/result.hpp"

#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace wfsync::sync {

namespace asio = boost::asio;

class DirectoryWatcher {
public:
    enum class ChangeKind { Upserted, Removed, Overflow };

    using Callback = std::function<void(const std::string& filename, ChangeKind kind)>;

    DirectoryWatcher(asio::io_context& io_context,
                     std::filesystem::path directory,
                     std::chrono::milliseconds debounce,
                     Callback callback);

    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    Result<void> start();

    /**
     * Cancels the read and every pending debounce timer. Pending changes
     * are dropped, not flushed.
     */
    void stop();

    bool running() const { return running_; }

    size_t pending() const { return timers_.size(); }

private:
    void do_read();
    void handle_events(size_t bytes);
    void schedule(const std::string& filename);
    void fire(const std::string& filename);

    asio::io_context& io_context_;
    std::filesystem::path directory_;
    std::chrono::milliseconds debounce_;
    Callback callback_;

    asio::posix::stream_descriptor descriptor_;
    int watch_descriptor_ = -1;
    bool running_ = false;

    alignas(8) std::array<char, 16 * 1024> buffer_{};
    std::unordered_map<std::string, std::unique_ptr<asio::steady_timer>> timers_;

    // Expires with the object; handlers already queued check it first
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace wfsync::sync
