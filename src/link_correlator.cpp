#include "ofdisc/link_correlator.hpp"
#include "ofdisc/lldp_codec.hpp"
#include "ofdisc/packet.hpp"
#include "ofdisc/utils.hpp"

namespace ofdisc {

namespace {
const char* const kComponent = "LLDP_CORRELATOR";
}

LinkCorrelator::LinkCorrelator(const SwitchInventory& inventory, EventPublisher& publisher, const Logger& logger)
    : inventory_(inventory), publisher_(publisher), logger_(logger) {}

std::optional<DiscoveredLink> LinkCorrelator::correlate(const PacketInEvent& event) const {
    EthernetFrame frame = EthernetFrame::unpack(event.data);
    if (frame.ether_type != ETHERTYPE_LLDP) {
        return std::nullopt;
    }

    ProbeIdentity origin;
    try {
        origin = lldp::decode_probe_payload(frame.data);
    } catch (const DecodeError& e) {
        logger_.debug(kComponent, "Ignoring LLDP not sent by us on " + utils::dpid_to_string(event.dpid) +
                                  " port " + std::to_string(event.in_port) + ": " + e.what());
        return std::nullopt;
    }

    std::optional<SwitchSnapshot> origin_switch = inventory_.find_by_dpid(origin.dpid);
    if (!origin_switch) {
        logger_.debug(kComponent, "Probe from unknown switch " + utils::dpid_to_string(origin.dpid) +
                                  " received on " + utils::dpid_to_string(event.dpid) + ", dropped");
        return std::nullopt;
    }

    DiscoveredLink link;
    link.switch_a.id = utils::dpid_to_string(event.dpid);
    link.switch_a.port = event.in_port;
    link.switch_b.id = origin_switch->id();
    link.switch_b.port = origin.port_number;
    return link;
}

bool LinkCorrelator::handle_packet_in(const PacketInEvent& event) {
    std::optional<DiscoveredLink> link = correlate(event);
    if (!link) {
        return false;
    }
    logger_.log_link_discovered(link->switch_a.id, link->switch_a.port, link->switch_b.id, link->switch_b.port);
    publisher_.publish_link(*link);
    return true;
}

} // namespace ofdisc
