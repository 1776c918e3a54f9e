#pragma once
// EventBus: synchronous listener broadcast
//
// Every component owns one. Listeners subscribe to a named event and
// are invoked on the emitting thread, after the component has released
// its own lock, so a listener may call back into the component.

#include "types.hpp"
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortex {

using EventCallback = std::function<void(const std::string& event, const json& payload)>;
using SubscriptionId = uint64_t;

class EventBus {
public:
    explicit EventBus(std::string tag) : tag_(std::move(tag)) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId on(const std::string& event, EventCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = ++next_id_;
        listeners_[event].push_back({id, std::move(callback)});
        return id;
    }

    bool off(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, list] : listeners_) {
            for (auto it = list.begin(); it != list.end(); ++it) {
                if (it->id == id) {
                    list.erase(it);
                    return true;
                }
            }
        }
        return false;
    }

    void emit(const std::string& event, const json& payload) const {
        std::vector<Listener> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = listeners_.find(event);
            if (it == listeners_.end()) return;
            targets = it->second;
        }

        for (const auto& listener : targets) {
            try {
                listener.callback(event, payload);
            } catch (const std::exception& e) {
                std::cerr << "[" << tag_ << "] Listener for '" << event
                          << "' threw: " << e.what() << "\n";
            }
        }
    }

private:
    struct Listener {
        SubscriptionId id;
        EventCallback callback;
    };

    std::string tag_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Listener>> listeners_;
    SubscriptionId next_id_ = 0;
};

} // namespace cortex
