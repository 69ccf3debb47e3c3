#include "event_bus.hpp"
#include <algorithm>

namespace toolhost {

EventBus::~EventBus() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        queue_.clear();
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        if (dispatcher_.get_id() == std::this_thread::get_id()) {
            dispatcher_.detach();
        } else {
            dispatcher_.join();
        }
    }
}

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    catch_all_.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    auto erase_from = [id](std::vector<Subscription>& subs) {
        auto it = std::find_if(subs.begin(), subs.end(),
                               [id](const Subscription& s) { return s.id == id; });
        if (it == subs.end()) return false;
        subs.erase(it);
        return true;
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (erase_from(catch_all_)) return true;
    for (auto& entry : by_tag_) {
        if (erase_from(entry.second)) return true;
    }
    return false;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_tag_.find(event.type_tag);
        if (it != by_tag_.end()) {
            for (const auto& sub : it->second) to_call.push_back(sub.handler);
        }
        for (const auto& sub : catch_all_) to_call.push_back(sub.handler);
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

void EventBus::enqueue(std::shared_ptr<const Event> event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) return;
        queue_.push_back(std::move(event));
        if (!dispatcher_.joinable()) {
            dispatcher_ = std::thread([this]() { dispatch_loop(); });
        }
    }
    queue_cv_.notify_one();
}

void EventBus::dispatch_loop() {
    while (true) {
        std::shared_ptr<const Event> event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        publish(*event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_tag_.clear();
    catch_all_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

} // namespace toolhost
