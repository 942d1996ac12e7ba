#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace fleetcam::core {

using ListenerId = std::uint64_t;

// Typed event emitter. Listeners are copied out under the lock and invoked
// without it, so a listener may subscribe/unsubscribe re-entrantly. A listener
// removed while an emit is already running on another thread may still see
// that one in-flight event.
template<typename... Args>
class EventEmitter {
public:
    using Listener = std::function<void(Args...)>;

    EventEmitter() = default;

    // Non-copyable
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    ListenerId subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        ListenerId id = next_id_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    std::size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    void emit(Args... args) const {
        std::vector<std::pair<ListenerId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = listeners_;
        }
        for (const auto& entry : snapshot) {
            entry.second(args...);
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_id_ = 1;
};

} // namespace fleetcam::core
