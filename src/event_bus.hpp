// =============================================================================
// AdbFleet - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Worker tasks publish operation completions here; front ends subscribe.
// Usage:
//   auto sub = bus.subscribe<InstallFinishedEvent>([](const auto& e) { ... });
//   bus.publish(InstallFinishedEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <type_traits>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include "fleet_log.hpp"
#include "command_runner.hpp"
#include "device_registry.hpp"
#include "identity_resolver.hpp"
#include "installation_engine.hpp"

namespace fleet {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Device list refresh finished
struct DevicesRefreshedEvent : Event {
    struct Entry {
        DeviceRegistry::Device device;
        std::string name;           // mapped name, or the device id
    };
    std::vector<Entry> devices;
};

// LAN listing finished
struct UsableDevicesEvent : Event {
    std::vector<IdentityResolver::UsableDevice> devices;
};

// connect / disconnect / uninstall / clear / force-stop finished
struct CommandFinishedEvent : Event {
    std::string operation;          // "connect", "disconnect", "uninstall", ...
    std::string target;             // address or device id
    CommandResult result;
};

struct InstallFinishedEvent : Event {
    uint64_t install_id = 0;
    std::string device_id;
    std::string artifact_path;
    InstallOutcome outcome;
    size_t still_running = 0;       // installs in flight after this one
};

// Single-flight request turned away
struct OperationRejectedEvent : Event {
    std::string operation;
    std::string holder;             // operation occupying the slot
    Error error;                    // kind Busy
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives as long as the bus

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        FLOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    // Handlers run on the publishing thread
    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                FLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        auto it = handlers_.find(key);
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace fleet
