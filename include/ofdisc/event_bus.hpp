#ifndef OFDISC_EVENT_BUS_HPP
#define OFDISC_EVENT_BUS_HPP

#include "ofdisc/discovery_events.hpp"
#include "ofdisc/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ofdisc {

// Outbound side used by the prober and the correlator.
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    virtual void publish_packet_out(const ProbeCommand& command) = 0;
    virtual void publish_link(const DiscoveredLink& link) = 0;
};

class EventBus : public EventPublisher {
public:
    using SubscriptionId = uint64_t;
    using PacketInHandler = std::function<void(const PacketInEvent&)>;
    using PacketOutHandler = std::function<void(const ProbeCommand&)>;
    using LinkHandler = std::function<void(const DiscoveredLink&)>;

    explicit EventBus(const Logger& logger);

    // One subscription per protocol version; there is no wildcard.
    SubscriptionId subscribe_packet_in(uint8_t version, PacketInHandler handler);
    SubscriptionId on_packet_out(PacketOutHandler handler);
    SubscriptionId on_link_discovered(LinkHandler handler);
    // Once this returns the handler is not running on any other thread and
    // will not be called again. A handler may unsubscribe itself.
    bool unsubscribe(SubscriptionId id);

    // Delivers to the handlers registered for event.version and returns how
    // many were called. An event nobody listens to counts as dropped.
    std::size_t dispatch_packet_in(const PacketInEvent& event);

    void publish_packet_out(const ProbeCommand& command) override;
    void publish_link(const DiscoveredLink& link) override;

    uint64_t dropped_events() const { return dropped_events_.load(); }

    // Topics that currently have at least one subscriber.
    std::vector<std::string> subscribed_topics() const;

private:
    class RunningCall;

    template <typename Event, typename Handler>
    std::size_t deliver(const std::vector<std::pair<SubscriptionId, Handler>>& handlers, const Event& event,
                        const std::string& topic);
    bool is_subscribed_locked(SubscriptionId id) const;

    const Logger& logger_;
    mutable std::mutex handlers_mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, std::pair<uint8_t, PacketInHandler>> packet_in_handlers_;
    std::map<SubscriptionId, PacketOutHandler> packet_out_handlers_;
    std::map<SubscriptionId, LinkHandler> link_handlers_;
    // Handlers being called right now, and the thread calling each.
    std::vector<std::pair<SubscriptionId, std::thread::id>> running_calls_;
    std::condition_variable calls_done_;
    std::atomic<uint64_t> dropped_events_{0};
};

} // namespace ofdisc

#endif // OFDISC_EVENT_BUS_HPP
