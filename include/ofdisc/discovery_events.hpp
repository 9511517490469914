#ifndef OFDISC_DISCOVERY_EVENTS_HPP
#define OFDISC_DISCOVERY_EVENTS_HPP

#include "ofdisc/openflow.hpp"
#include "ofdisc/switch_inventory.hpp" // For ConnectionId

#include <cstdint>
#include <string>
#include <vector>

namespace ofdisc {

// Probe addressed to one switch connection.
struct ProbeCommand {
    ConnectionId destination = 0;
    uint64_t dpid = 0;
    openflow::Message message; // encoded PacketOut
};

struct LinkEndpoint {
    std::string id; // canonical dpid string
    uint32_t port = 0;

    bool operator==(const LinkEndpoint& other) const {
        return id == other.id && port == other.port;
    }
    bool operator!=(const LinkEndpoint& other) const {
        return !(*this == other);
    }
};

// switch_a received the probe on its ingress port; switch_b sent it.
struct DiscoveredLink {
    LinkEndpoint switch_a;
    LinkEndpoint switch_b;

    // The same physical link seen from either side compares equal.
    bool operator==(const DiscoveredLink& other) const {
        return (switch_a == other.switch_a && switch_b == other.switch_b) ||
               (switch_a == other.switch_b && switch_b == other.switch_a);
    }
    bool operator!=(const DiscoveredLink& other) const {
        return !(*this == other);
    }

    std::string to_string() const;
};

struct PacketInEvent {
    uint8_t version = 0;
    ConnectionId connection = 0;
    uint64_t dpid = 0;
    uint32_t in_port = 0;
    std::vector<uint8_t> data;
};

std::string packet_in_topic(uint8_t version);
const std::string& packet_out_topic();
const std::string& link_topic();

// Decodes a packet-in received from `dpid` on `connection`. Throws DecodeError.
PacketInEvent to_packet_in_event(const openflow::Message& message, ConnectionId connection, uint64_t dpid);

} // namespace ofdisc

#endif // OFDISC_DISCOVERY_EVENTS_HPP
