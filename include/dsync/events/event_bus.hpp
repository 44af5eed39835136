/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * The orchestrator emits stage, retry, progress and completion events
 * without knowing who listens; logging, metrics, the console progress
 * renderer and tests subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<StageEnteredEvent>([](const StageEnteredEvent& e) { ... });
 * bus.emit(StageEnteredEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace dsync::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 * - Handlers may subscribe or unsubscribe from inside a callback
 */
class EventBus {
public:
    EventBus() = default;

    // Non-copyable (would duplicate handlers)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        const std::size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) { return pair.first == handler_id; }),
            handler_list.end());
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        // Copy handler pointers so a handler can subscribe without deadlocking
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType* is ever stored under EventType's index
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

/**
 * @brief Unsubscribes on destruction
 *
 * For listeners that live shorter than the bus, such as a job-scoped
 * progress renderer.
 */
template<typename EventType>
class ScopedSubscription {
public:
    ScopedSubscription(EventBus& bus, std::function<void(const EventType&)> handler)
        : bus_(bus), id_(bus.subscribe<EventType>(std::move(handler))) {}

    ~ScopedSubscription() { bus_.unsubscribe<EventType>(id_); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    EventBus& bus_;
    std::size_t id_;
};

} // namespace dsync::events
