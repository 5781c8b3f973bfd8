#include "EventBus.h"

#include <algorithm>
#include <string>

#include "../../engine/core/Logger.h"

namespace Zen {

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    Subscriber sub;
    sub.id = ++lastId_;
    sub.handler = std::move(handler);
    subscribers_.push_back(std::move(sub));
    return lastId_;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    for (auto& sub : subscribers_) {
        if (sub.id == id && !sub.removed) {
            // Erased after the current dispatch so iteration stays valid.
            sub.removed = true;
            if (!dispatching_) compact();
            return true;
        }
    }
    return false;
}

void EventBus::emit(GameEvent event) {
    Engine::logDebug("Event " + std::string(toString(event.type)) + " " + event.data.dump());
    queue_.push_back(std::move(event));
}

// Clears the dispatch flag and compacts removed subscribers even when a handler throws.
class EventBus::DispatchScope {
public:
    explicit DispatchScope(EventBus& bus) : bus_(bus) { bus_.dispatching_ = true; }
    ~DispatchScope() {
        bus_.dispatching_ = false;
        bus_.compact();
    }
    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

private:
    EventBus& bus_;
};

std::size_t EventBus::drain() {
    if (dispatching_) {
        Engine::logWarn("EventBus::drain called from a subscriber; ignored.");
        return 0;
    }
    DispatchScope scope(*this);
    std::size_t delivered = 0;
    while (!queue_.empty()) {
        GameEvent event = std::move(queue_.front());
        queue_.pop_front();
        // Subscribers added during dispatch start with the next event.
        const std::size_t count = subscribers_.size();
        for (std::size_t i = 0; i < count; ++i) {
            if (subscribers_[i].removed) continue;
            auto handler = subscribers_[i].handler;
            handler(event);
        }
        ++delivered;
    }
    return delivered;
}

void EventBus::compact() {
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const Subscriber& s) { return s.removed; }),
                       subscribers_.end());
}

std::size_t EventBus::subscriberCount() const {
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                                  [](const Subscriber& s) { return !s.removed; }));
}

}  // namespace Zen
