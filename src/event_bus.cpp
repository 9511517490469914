#include "ofdisc/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

namespace ofdisc {

// Marks one handler call in running_calls_ until the handler returns or throws.
class EventBus::RunningCall {
public:
    RunningCall(EventBus& bus, SubscriptionId id) : bus_(bus), entry_(id, std::this_thread::get_id()) {
        bus_.running_calls_.push_back(entry_); // handlers_mutex_ is held by the caller
    }

    ~RunningCall() {
        {
            std::lock_guard<std::mutex> lock(bus_.handlers_mutex_);
            auto it = std::find(bus_.running_calls_.begin(), bus_.running_calls_.end(), entry_);
            if (it != bus_.running_calls_.end()) {
                bus_.running_calls_.erase(it);
            }
        }
        bus_.calls_done_.notify_all();
    }

    RunningCall(const RunningCall&) = delete;
    RunningCall& operator=(const RunningCall&) = delete;

private:
    EventBus& bus_;
    std::pair<SubscriptionId, std::thread::id> entry_;
};

EventBus::EventBus(const Logger& logger) : logger_(logger) {}

EventBus::SubscriptionId EventBus::subscribe_packet_in(uint8_t version, PacketInHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    packet_in_handlers_[id] = std::make_pair(version, std::move(handler));
    logger_.debug("EVENT_BUS", "Subscription " + std::to_string(id) + " to " + packet_in_topic(version));
    return id;
}

EventBus::SubscriptionId EventBus::on_packet_out(PacketOutHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    packet_out_handlers_[id] = std::move(handler);
    return id;
}

EventBus::SubscriptionId EventBus::on_link_discovered(LinkHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    SubscriptionId id = next_id_++;
    link_handlers_[id] = std::move(handler);
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(handlers_mutex_);
    bool removed = packet_in_handlers_.erase(id) > 0 ||
                   packet_out_handlers_.erase(id) > 0 ||
                   link_handlers_.erase(id) > 0;
    if (!removed) {
        return false;
    }
    // Calls made by this thread are further up our own stack; do not wait for them.
    const std::thread::id self = std::this_thread::get_id();
    calls_done_.wait(lock, [this, id, self] {
        return std::none_of(running_calls_.begin(), running_calls_.end(),
                            [id, self](const std::pair<SubscriptionId, std::thread::id>& call) {
                                return call.first == id && call.second != self;
                            });
    });
    return true;
}

bool EventBus::is_subscribed_locked(SubscriptionId id) const {
    return packet_in_handlers_.count(id) > 0 ||
           packet_out_handlers_.count(id) > 0 ||
           link_handlers_.count(id) > 0;
}

template <typename Event, typename Handler>
std::size_t EventBus::deliver(const std::vector<std::pair<SubscriptionId, Handler>>& handlers, const Event& event,
                              const std::string& topic) {
    if (handlers.empty()) {
        dropped_events_.fetch_add(1);
        logger_.debug("EVENT_BUS", "No subscriber for " + topic + ", event dropped");
        return 0;
    }
    std::size_t called = 0;
    for (const auto& entry : handlers) {
        std::unique_lock<std::mutex> lock(handlers_mutex_);
        if (!is_subscribed_locked(entry.first)) {
            continue; // unsubscribed after the snapshot was taken
        }
        RunningCall call(*this, entry.first);
        lock.unlock();
        try {
            entry.second(event);
        } catch (const std::exception& e) {
            logger_.error("EVENT_BUS", "Handler for " + topic + " failed: " + e.what());
        }
        ++called;
    }
    return called;
}

std::size_t EventBus::dispatch_packet_in(const PacketInEvent& event) {
    std::vector<std::pair<SubscriptionId, PacketInHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& pair : packet_in_handlers_) {
            if (pair.second.first == event.version) {
                handlers.emplace_back(pair.first, pair.second.second);
            }
        }
    }
    return deliver(handlers, event, packet_in_topic(event.version));
}

void EventBus::publish_packet_out(const ProbeCommand& command) {
    std::vector<std::pair<SubscriptionId, PacketOutHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& pair : packet_out_handlers_) {
            handlers.emplace_back(pair.first, pair.second);
        }
    }
    deliver(handlers, command, packet_out_topic());
}

void EventBus::publish_link(const DiscoveredLink& link) {
    std::vector<std::pair<SubscriptionId, LinkHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& pair : link_handlers_) {
            handlers.emplace_back(pair.first, pair.second);
        }
    }
    deliver(handlers, link, link_topic());
}

std::vector<std::string> EventBus::subscribed_topics() const {
    std::set<std::string> topics;
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    for (const auto& pair : packet_in_handlers_) {
        topics.insert(packet_in_topic(pair.second.first));
    }
    if (!packet_out_handlers_.empty()) {
        topics.insert(packet_out_topic());
    }
    if (!link_handlers_.empty()) {
        topics.insert(link_topic());
    }
    return std::vector<std::string>(topics.begin(), topics.end());
}

} // namespace ofdisc
