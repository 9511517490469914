#ifndef OFDISC_LINK_CORRELATOR_HPP
#define OFDISC_LINK_CORRELATOR_HPP

#include "ofdisc/discovery_events.hpp"
#include "ofdisc/event_bus.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/switch_inventory.hpp"

#include <optional>

namespace ofdisc {

// Turns a received probe into a DiscoveredLink. Holds no mutable state, so
// concurrent calls are safe as long as the inventory is.
class LinkCorrelator {
public:
    LinkCorrelator(const SwitchInventory& inventory, EventPublisher& publisher, const Logger& logger);

    // std::nullopt for non-LLDP frames, foreign LLDP and unknown origin
    // switches. Throws DecodeError if the frame is too short for an
    // Ethernet header.
    std::optional<DiscoveredLink> correlate(const PacketInEvent& event) const;

    // correlate() and publish the link, if any. Returns whether one was published.
    bool handle_packet_in(const PacketInEvent& event);

private:
    const SwitchInventory& inventory_;
    EventPublisher& publisher_;
    const Logger& logger_;
};

} // namespace ofdisc

#endif // OFDISC_LINK_CORRELATOR_HPP
