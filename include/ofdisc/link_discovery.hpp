#ifndef OFDISC_LINK_DISCOVERY_HPP
#define OFDISC_LINK_DISCOVERY_HPP

#include "ofdisc/config_manager.hpp" // For DiscoverySettings
#include "ofdisc/event_bus.hpp"
#include "ofdisc/link_correlator.hpp"
#include "ofdisc/lldp_prober.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/periodic_timer.hpp"
#include "ofdisc/switch_inventory.hpp"

#include <cstddef>
#include <vector>

namespace ofdisc {

// Wires the prober to a periodic timer and the correlator to the packet-in
// topics of every supported protocol version.
class LinkDiscovery {
public:
    LinkDiscovery(const SwitchInventory& inventory, EventBus& event_bus, const Logger& logger,
                  DiscoverySettings settings = DiscoverySettings());
    ~LinkDiscovery();

    LinkDiscovery(const LinkDiscovery&) = delete;
    LinkDiscovery& operator=(const LinkDiscovery&) = delete;

    // Subscribes the correlator. Calling it twice has no further effect.
    void setup();

    // Starts periodic probing. Returns false if already running.
    bool start();

    // A single probe round, as run by the timer.
    std::size_t execute();

    void shutdown();

    bool is_running() const { return timer_.is_running(); }
    const DiscoverySettings& settings() const { return settings_; }

private:
    EventBus& event_bus_;
    const Logger& logger_;
    DiscoverySettings settings_;

    LldpProber prober_;
    LinkCorrelator correlator_;
    PeriodicTimer timer_;
    std::vector<EventBus::SubscriptionId> subscriptions_;
};

} // namespace ofdisc

#endif // OFDISC_LINK_DISCOVERY_HPP
