#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace qbvh {

// Publish/subscribe keyed by event name. Each handler is bound to the payload
// type it was subscribed with; emit() only calls handlers of the emitted type.
// Handlers run synchronously on the emitting thread, in subscription order.
class EventBus {
public:
    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        channels_[event_type].push_back(Subscriber{
            std::type_index(typeid(T)),
            [handler](const void* data) { handler(*static_cast<const T*>(data)); }
        });
    }

    // Returns how many handlers received the event.
    template<typename T>
    size_t emit(const std::string& event_type, const T& data) const {
        auto it = channels_.find(event_type);
        if (it == channels_.end()) return 0;

        const std::type_index emitted(typeid(T));
        size_t delivered = 0;
        for (const Subscriber& sub : it->second) {
            if (sub.payload != emitted) continue;
            sub.deliver(&data);
            ++delivered;
        }
        return delivered;
    }

    bool has_subscribers(const std::string& event_type) const {
        return subscriber_count(event_type) > 0;
    }

    size_t subscriber_count(const std::string& event_type) const {
        auto it = channels_.find(event_type);
        return it != channels_.end() ? it->second.size() : 0;
    }

    void clear(const std::string& event_type) { channels_.erase(event_type); }

private:
    struct Subscriber {
        std::type_index payload;
        std::function<void(const void*)> deliver;
    };

    std::unordered_map<std::string, std::vector<Subscriber>> channels_;
};

// Published after every successful build, empty trees included
struct TreeBuiltEvent {
    size_t shape_count;
    size_t node_count;
    size_t leaf_count;
    size_t max_depth;
    double build_ms;
};

// Emitted before a contract violation is thrown out of a build
struct BuildRejectedEvent {
    const char* reason;
    size_t requested_count;
};

namespace Events {
    constexpr const char* TREE_BUILT     = "tree_built";
    constexpr const char* BUILD_REJECTED = "build_rejected";
}

} // namespace qbvh
