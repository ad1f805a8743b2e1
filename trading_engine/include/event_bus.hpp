#pragma once

#include "engine_events.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <type_traits>

namespace atx {
namespace trading_engine {

class EventPusher {
public:
    virtual ~EventPusher() = default;
    virtual void push_event(EngineEvent event) = 0;
};

// Synchronous fan-out to any number of subscribers. Listeners run on the
// publishing thread and must not block; a throwing listener is logged and skipped.
class EventBus : public EventPusher {
public:
    using SubscriptionId = uint64_t;
    using Listener = std::function<void(const EngineEvent&)>;

    EventBus() = default;

    SubscriptionId subscribe(Listener listener);

    template<typename EventT>
    SubscriptionId subscribe(std::function<void(const EventT&)> listener) {
        return subscribe([listener = std::move(listener)](const EngineEvent& event) {
            if (const auto* typed = std::get_if<EventT>(&event)) {
                listener(*typed);
            }
        });
    }

    bool unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    void push_event(EngineEvent event) override;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    std::atomic<SubscriptionId> next_id_{1};
};

} // namespace trading_engine
} // namespace atx
