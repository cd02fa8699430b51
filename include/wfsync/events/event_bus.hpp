/**
 * @file event_bus.hpp
 * @brief Injected, type-safe notification channel
 *
 * WHY THIS FILE EXISTS:
 * The Watcher and the Sync Engine report status changes and failures
 * without knowing who listens (CLI table, logger, auto-sync driver, tests).
 * The bus is constructed by the caller and handed to both by reference, so
 * there is no process-wide emitter and no emitter base class.
 *
 * WHAT IT DOES:
 * - Subscription keyed by event record type
 * - Thread-safe subscribe / unsubscribe / emit
 * - Handlers run synchronously on the emitting thread, outside the lock
 * - A throwing handler is logged and the remaining handlers still run
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.scoped_subscribe<WorkflowStatusChangedEvent>(
 *     [](const WorkflowStatusChangedEvent& e) { ... });
 * bus.emit(WorkflowStatusChangedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wfsync::events {

class EventBus;

/**
 * @brief RAII handle that unsubscribes when it goes out of scope
 *
 * Components whose lifetime is shorter than the bus hold one of these so
 * that the bus never calls into a destroyed object.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::function<void()> release) : release_(std::move(release)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : release_(std::move(other.release_)) {
        other.release_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release_ = std::move(other.release_);
            other.release_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (release_) {
            auto release = std::move(release_);
            release_ = nullptr;
            release();
        }
    }

    bool active() const { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event record type
     *
     * RETURNS:
     * Handler id for unsubscribe<EventType>()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {handler_id, std::make_shared<TypedHandler<EventType>>(std::move(handler))});
        return handler_id;
    }

    /**
     * @brief subscribe() bound to the lifetime of the returned handle
     *
     * The bus must outlive the handle.
     */
    template<typename EventType>
    Subscription scoped_subscribe(std::function<void(const EventType&)> handler) {
        size_t handler_id = subscribe<EventType>(std::move(handler));
        return Subscription([this, handler_id]() { unsubscribe<EventType>(handler_id); });
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * HOW IT WORKS:
     * 1. Copy the handler list under a shared lock
     * 2. Release the lock (handlers may subscribe or emit themselves)
     * 3. Call each handler; exceptions are logged, not propagated
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) const = 0;
    };

    template<typename EventType>
    struct TypedHandler : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) const override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace wfsync::events
