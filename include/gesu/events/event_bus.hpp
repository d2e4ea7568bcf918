/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the orchestration core to observers
 *
 * WHY THIS FILE EXISTS:
 * The session registry and transfer queue report state changes without
 * knowing who listens: the logger, the metrics counters and the sidecar's
 * notification stream all subscribe here.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SessionCrashedEvent>([](const SessionCrashedEvent& e) { ... });
 * bus.emit(SessionCrashedEvent{...});
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
#include <utility>
#include <vector>

namespace gesu::events {

class EventBus;

/**
 * @brief Move-only handle that unsubscribes its handler when destroyed
 *
 * The bus must outlive every Subscription taken from it.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus& bus, std::type_index type, size_t handler_id)
        : bus_(&bus), type_(type), handler_id_(handler_id) {}

    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), type_(other.type_), handler_id_(other.handler_id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            type_ = other.type_;
            handler_id_ = other.handler_id_;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    bool active() const { return bus_ != nullptr; }

    void reset();

private:
    EventBus* bus_ = nullptr;
    std::type_index type_ = std::type_index(typeid(void));
    size_t handler_id_ = 0;
};

/**
 * @brief Type-safe synchronous event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from any thread, including worker threads of the
 *   transfer queue and the session monitor
 * - Handlers run synchronously in the emitting thread, without the bus
 *   lock held, so a handler may subscribe or emit
 * - Emitters never hold their own locks while emitting
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {handler_id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return handler_id;
    }

    /// Subscribe for the lifetime of the returned handle
    template<typename EventType>
    Subscription listen(std::function<void(const EventType&)> handler) {
        const size_t handler_id = subscribe<EventType>(std::move(handler));
        return Subscription(*this, std::type_index(typeid(EventType)), handler_id);
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        remove(std::type_index(typeid(EventType)), handler_id);
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * EXCEPTION SAFETY:
     * A handler throwing std::exception is logged and the remaining
     * handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
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
    friend class Subscription;

    void remove(std::type_index type, size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(type);
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& entry) { return entry.first == handler_id; }),
            handler_list.end());
    }

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
            func(*static_cast<const EventType*>(event));
        }
    };

    // event type -> list of (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

inline void Subscription::reset() {
    if (bus_ != nullptr) {
        bus_->remove(type_, handler_id_);
        bus_ = nullptr;
    }
}

} // namespace gesu::events
