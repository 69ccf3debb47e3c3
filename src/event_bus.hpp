#pragma once
#include "event.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace toolhost {

using EventHandler = std::function<void(const Event&)>;

// Publish/subscribe keyed by event tag. publish() runs handlers on the
// calling thread. post() queues the event for a dispatch thread owned by
// the bus; servers use it for events raised on a connection's reader or a
// background refresh, so handlers may call back into the host from there.
class EventBus {
public:
    EventBus() = default;
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Subscribe to one tag. Returns a subscription id.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Receive every event regardless of tag.
    uint64_t subscribe_all(EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Tag subscribers first, then catch-all subscribers, each in
    // registration order. No lock is held while handlers run.
    void publish(const Event& event);

    // Deliver `event` later, in post order, on the dispatch thread.
    // Events still queued when the bus is destroyed are dropped.
    template<typename E>
    void post(E event) {
        enqueue(std::make_shared<const E>(std::move(event)));
    }

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    void enqueue(std::shared_ptr<const Event> event);
    void dispatch_loop();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    std::vector<Subscription> catch_all_;
    uint64_t next_id_ = 1;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<const Event>> queue_;
    std::thread dispatcher_;
    bool stopping_ = false;
};

// Type-safe subscribe helper: casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace toolhost
