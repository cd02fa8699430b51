/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO that coalesces pending items by key
 *
 * WHY THIS FILE EXISTS:
 * The watcher broadcasts a status for the same file many times in a row
 * (every rescan, every poll). The auto-sync driver only needs to act on the
 * latest one, on its own thread. Pushing an item whose key is already
 * waiting replaces the waiting item in place instead of queueing a second.
 *
 * EXAMPLE:
 * CoalescingQueue<std::string, Job> queue;
 * queue.push("a.json", job1);
 * queue.push("a.json", job2);   // replaces job1, size() == 1
 * auto job = queue.pop();       // job2 (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace wfsync::events {

template<typename Key, typename T>
class CoalescingQueue {
public:
    CoalescingQueue() = default;

    CoalescingQueue(const CoalescingQueue&) = delete;
    CoalescingQueue& operator=(const CoalescingQueue&) = delete;

    /**
     * @brief Enqueue, or replace the pending item with the same key
     *
     * RETURNS: true if a new slot was added, false if coalesced
     * Ignored after shutdown().
     */
    bool push(const Key& key, T item) {
        bool added = false;
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return false;
            }
            auto it = pending_.find(key);
            if (it != pending_.end()) {
                it->second = std::move(item);
            } else {
                order_.push_back(key);
                pending_.emplace(key, std::move(item));
                added = true;
            }
        }
        cv_.notify_one();
        return added;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front_locked();
    }

    /**
     * @brief Blocking pop; nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !order_.empty() || shutdown_; });
        return take_front_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !order_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        return take_front_locked();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return order_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return order_.empty();
    }

    /**
     * @brief Reject further pushes and wake every waiting consumer
     *
     * Items already queued can still be popped.
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

private:
    std::optional<T> take_front_locked() {
        if (order_.empty()) {
            return std::nullopt;
        }
        Key key = std::move(order_.front());
        order_.pop_front();
        auto it = pending_.find(key);
        T item = std::move(it->second);
        pending_.erase(it);
        return item;
    }

    std::deque<Key> order_;
    std::unordered_map<Key, T> pending_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace wfsync::events
