#pragma once
#include "common/types.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dts {

struct EventRecord {
    EventId       id;
    EventCategory category;
    Severity      severity;
    int64_t       tick;      // simulation tick the event refers to, -1 if none
    std::string   subject;   // agent id, category or file path the event is about
    std::string   detail;
};

// Synchronous fan-out of simulation events to in-process listeners.
class EventBus {
public:
    using Callback = std::function<void(const EventRecord&)>;

    // Delivery lasts as long as the handle. A handle must not outlive
    // the bus it came from.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        ~Subscription();

        void reset();
        bool active() const { return bus_ != nullptr; }

    private:
        friend class EventBus;
        Subscription(EventBus* bus, uint32_t id) : bus_(bus), id_(id) {}

        EventBus* bus_ = nullptr;
        uint32_t  id_ = 0;
    };

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    Subscription subscribe(EventCategory cat, Callback cb);
    Subscription subscribe_all(Callback cb);

    // Listeners run on the publishing thread, after the bus lock is released.
    void publish(const EventRecord& event);

    std::size_t subscriber_count() const;
    uint64_t published_count() const;

private:
    struct Listener {
        uint32_t                     id;
        std::optional<EventCategory> category;   // nullopt: every category
        Callback                     cb;
    };

    Subscription add(std::optional<EventCategory> cat, Callback cb);
    void remove(uint32_t id);

    mutable std::mutex mutex_;
    std::vector<Listener> listeners_;
    uint32_t next_id_ = 1;
    uint64_t published_ = 0;
};

} // namespace dts
