#include "ofdisc/discovery_events.hpp"

#include <cstdio>
#include <utility>

namespace ofdisc {

std::string DiscoveredLink::to_string() const {
    return switch_a.id + ":" + std::to_string(switch_a.port) + " <-> " +
           switch_b.id + ":" + std::to_string(switch_b.port);
}

std::string packet_in_topic(uint8_t version) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "v0x%02x", version);
    return std::string("of_core.") + buf + ".messages.in.ofpt_packet_in";
}

const std::string& packet_out_topic() {
    static const std::string topic = "ofdisc.messages.out.ofpt_packet_out";
    return topic;
}

const std::string& link_topic() {
    static const std::string topic = "ofdisc.switch.link";
    return topic;
}

PacketInEvent to_packet_in_event(const openflow::Message& message, ConnectionId connection, uint64_t dpid) {
    openflow::PacketInInfo packet_in = openflow::decode_packet_in(message);

    PacketInEvent event;
    event.version = packet_in.version;
    event.connection = connection;
    event.dpid = dpid;
    event.in_port = packet_in.in_port;
    event.data = std::move(packet_in.data);
    return event;
}

} // namespace ofdisc
