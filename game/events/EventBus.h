// Ordered event queue. Producers enqueue during a tick; drain() delivers to subscribers in emit order.
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include "GameEvent.h"

namespace Zen {

class EventBus {
public:
    using Handler = std::function<void(const GameEvent&)>;
    using SubscriptionId = std::uint32_t;

    SubscriptionId subscribe(Handler handler);
    bool unsubscribe(SubscriptionId id);

    void emit(GameEvent event);
    // Delivers queued events, including any raised by handlers along the way. Returns the count delivered.
    std::size_t drain();
    void clear() { queue_.clear(); }

    bool dispatching() const { return dispatching_; }
    std::size_t pending() const { return queue_.size(); }
    std::size_t subscriberCount() const;

private:
    class DispatchScope;

    struct Subscriber {
        SubscriptionId id{0};
        Handler handler;
        bool removed{false};
    };

    void compact();

    std::vector<Subscriber> subscribers_;
    std::deque<GameEvent> queue_;
    SubscriptionId lastId_{0};
    bool dispatching_{false};
};

}  // namespace Zen
