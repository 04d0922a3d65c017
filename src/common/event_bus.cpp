#include "common/event_bus.h"
#include <algorithm>
#include <utility>

namespace dts {

EventBus::Subscription::Subscription(Subscription&& other) noexcept
    : bus_(other.bus_), id_(other.id_) {
    other.bus_ = nullptr;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
    }
    return *this;
}

EventBus::Subscription::~Subscription() {
    reset();
}

void EventBus::Subscription::reset() {
    if (bus_) {
        bus_->remove(id_);
        bus_ = nullptr;
    }
}

EventBus::Subscription EventBus::subscribe(EventCategory cat, Callback cb) {
    return add(cat, std::move(cb));
}

EventBus::Subscription EventBus::subscribe_all(Callback cb) {
    return add(std::nullopt, std::move(cb));
}

EventBus::Subscription EventBus::add(std::optional<EventCategory> cat, Callback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t id = next_id_++;
    listeners_.push_back(Listener{id, cat, std::move(cb)});
    return Subscription(this, id);
}

void EventBus::remove(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const Listener& l) { return l.id == id; }),
        listeners_.end());
}

void EventBus::publish(const EventRecord& event) {
    std::vector<Callback> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_;
        for (const auto& l : listeners_) {
            if (!l.category || *l.category == event.category)
                matching.push_back(l.cb);
        }
    }
    for (const auto& cb : matching)
        cb(event);
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

uint64_t EventBus::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace dts
