#include "wfsync/sync/directory_watcher.hpp"

#include "wfsync/workflow/workflow_file.hpp"

#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace wfsync::sync {
namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_MODIFY |
                                IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF | IN_MOVE_SELF;

} // namespace

DirectoryWatcher::DirectoryWatcher(asio::io_context& io_context,
                                   fs::path directory,
                                   std::chrono::milliseconds debounce,
                                   Callback callback)
    : io_context_(io_context),
      directory_(std::move(directory)),
      debounce_(debounce),
      callback_(std::move(callback)),
      descriptor_(io_context) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

Result<void> DirectoryWatcher::start() {
    if (running_) {
        return Ok();
    }

    const int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return Err<void>(ErrorCode::Io, std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    watch_descriptor_ = inotify_add_watch(fd, directory_.c_str(), kWatchMask);
    if (watch_descriptor_ < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        return Err<void>(ErrorCode::Io, "Cannot watch " + directory_.string() + ": " + reason);
    }

    descriptor_.assign(fd);
    running_ = true;
    spdlog::debug("[DirectoryWatcher] Watching {} (debounce {}ms)", directory_.string(), debounce_.count());

    do_read();
    return Ok();
}

void DirectoryWatcher::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    for (auto& [_, timer] : timers_) {
        timer->cancel();
    }
    timers_.clear();

    boost::system::error_code ec;
    descriptor_.cancel(ec);
    descriptor_.close(ec);  // closing the inotify fd drops the watch
    watch_descriptor_ = -1;
}

void DirectoryWatcher::do_read() {
    std::weak_ptr<bool> alive = alive_;
    descriptor_.async_read_some(
        asio::buffer(buffer_),
        [this, alive](const boost::system::error_code& ec, size_t bytes) {
            if (ec == asio::error::operation_aborted || alive.expired() || !running_) {
                return;
            }
            if (ec) {
                spdlog::error("[DirectoryWatcher] Read failed: {}", ec.message());
                running_ = false;
                return;
            }

            handle_events(bytes);
            if (running_) {
                do_read();
            }
        });
}

void DirectoryWatcher::handle_events(size_t bytes) {
    size_t offset = 0;
    while (offset + sizeof(inotify_event) <= bytes) {
        const auto* event = reinterpret_cast<const inotify_event*>(buffer_.data() + offset);
        offset += sizeof(inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            spdlog::warn("[DirectoryWatcher] Event queue overflow, requesting full rescan");
            callback_("", ChangeKind::Overflow);
            continue;
        }
        if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
            spdlog::error("[DirectoryWatcher] {} was removed or moved, watch stopped", directory_.string());
            stop();
            return;
        }
        if (event->len == 0 || (event->mask & IN_ISDIR)) {
            continue;
        }

        const std::string filename(event->name);
        if (!workflow::is_workflow_filename(filename)) {
            continue;
        }
        schedule(filename);
    }
}

void DirectoryWatcher::schedule(const std::string& filename) {
    auto& timer = timers_[filename];
    if (!timer) {
        timer = std::make_unique<asio::steady_timer>(io_context_);
    }

    // expires_after() cancels a pending wait; that handler sees operation_aborted
    timer->expires_after(debounce_);

    std::weak_ptr<bool> alive = alive_;
    timer->async_wait([this, alive, filename](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || alive.expired() || !running_) {
            return;
        }
        fire(filename);
    });
}

void DirectoryWatcher::fire(const std::string& filename) {
    auto it = timers_.find(filename);
    if (it == timers_.end() || it->second->expiry() > asio::steady_timer::clock_type::now()) {
        return;  // re-armed after this handler was queued
    }
    timers_.erase(it);

    std::error_code ec;
    const bool exists = fs::is_regular_file(directory_ / filename, ec);
    callback_(filename, exists ? ChangeKind::Upserted : ChangeKind::Removed);
}

} // namespace wfsync::sync
