#include "ofdisc/link_discovery.hpp"
#include "ofdisc/packet_out_builder.hpp"

#include <chrono>

namespace ofdisc {

namespace {
const char* const kComponent = "DISCOVERY";
}

LinkDiscovery::LinkDiscovery(const SwitchInventory& inventory, EventBus& event_bus, const Logger& logger,
                             DiscoverySettings settings)
    : event_bus_(event_bus),
      logger_(logger),
      settings_(settings),
      prober_(inventory, event_bus, logger),
      correlator_(inventory, event_bus, logger),
      timer_(logger, "lldp-prober") {}

LinkDiscovery::~LinkDiscovery() {
    shutdown();
    for (EventBus::SubscriptionId id : subscriptions_) {
        event_bus_.unsubscribe(id);
    }
}

void LinkDiscovery::setup() {
    if (!subscriptions_.empty()) {
        return;
    }
    for (uint8_t version : supported_versions()) {
        subscriptions_.push_back(event_bus_.subscribe_packet_in(
            version, [this](const PacketInEvent& event) { correlator_.handle_packet_in(event); }));
    }
    logger_.info(kComponent, "Listening for probes on " + std::to_string(subscriptions_.size()) +
                             " packet-in topics, polling every " +
                             std::to_string(settings_.polling_time.count()) + "s");
}

bool LinkDiscovery::start() {
    if (settings_.polling_time.count() <= 0 ||
        settings_.polling_time > std::chrono::seconds(MAX_POLLING_TIME_SECONDS)) {
        logger_.warning(kComponent, "Polling time of " + std::to_string(settings_.polling_time.count()) +
                                    "s is outside 1.." + std::to_string(MAX_POLLING_TIME_SECONDS) + "s, not starting");
        return false;
    }
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.polling_time);
    return timer_.start(interval, [this]() { prober_.handle_timer_tick(); });
}

std::size_t LinkDiscovery::execute() {
    return prober_.handle_timer_tick();
}

void LinkDiscovery::shutdown() {
    if (!timer_.is_running()) {
        return;
    }
    logger_.info(kComponent, "Shutting down...");
    timer_.stop();
}

} // namespace ofdisc
