#include "ofdisc/config_manager.hpp"
#include "ofdisc/event_bus.hpp"
#include "ofdisc/link_discovery.hpp"
#include "ofdisc/lldp_defs.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/openflow.hpp"
#include "ofdisc/switch_inventory.hpp"
#include "ofdisc/utils.hpp"

#include <array>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace {

using ofdisc::ConnectionId;
using PortRef = std::pair<uint64_t, uint32_t>; // dpid, port

// Point-to-point cabling between switch ports, stored in both directions.
class WireTable {
public:
    void connect(PortRef a, PortRef b) {
        ends_[a] = b;
        ends_[b] = a;
    }

    const PortRef* far_end(PortRef near) const {
        auto it = ends_.find(near);
        return it == ends_.end() ? nullptr : &it->second;
    }

private:
    std::map<PortRef, PortRef> ends_;
};

// Carries every PacketOut across the wire it is sent on and hands it back to
// the controller as a packet-in from the switch at the far end. Messages go
// through the version codec in both directions.
class LoopbackTransport {
public:
    LoopbackTransport(const ofdisc::SwitchInventory& inventory, ofdisc::EventBus& bus, const WireTable& wires,
                      const ofdisc::Logger& logger)
        : inventory_(inventory), bus_(bus), wires_(wires), logger_(logger) {}

    void deliver(const ofdisc::ProbeCommand& command) {
        ofdisc::openflow::PacketOutInfo sent = ofdisc::openflow::decode_packet_out(command.message);

        for (uint32_t port : sent.output_ports) {
            const PortRef* peer = wires_.far_end({command.dpid, port});
            if (!peer) {
                logger_.debug("SIM", "Port " + std::to_string(port) + " of " +
                                     ofdisc::utils::dpid_to_string(command.dpid) + " is not cabled");
                continue;
            }
            auto receiver = inventory_.find_by_dpid(peer->first);
            if (!receiver || !receiver->of_version) {
                continue;
            }
            ofdisc::openflow::Message packet_in =
                ofdisc::openflow::encode_packet_in(*receiver->of_version, peer->second, sent.data);
            bus_.dispatch_packet_in(ofdisc::to_packet_in_event(packet_in, receiver->connection, receiver->dpid));
        }
    }

private:
    const ofdisc::SwitchInventory& inventory_;
    ofdisc::EventBus& bus_;
    const WireTable& wires_;
    const ofdisc::Logger& logger_;
};

void add_switch(ofdisc::InMemorySwitchInventory& inventory, uint64_t dpid, ConnectionId connection,
                ofdisc::openflow::OfVersion version, const std::vector<uint16_t>& ports) {
    inventory.add_switch(dpid, connection, ofdisc::openflow::to_wire(version));
    for (uint16_t port : ports) {
        std::array<uint8_t, 6> mac{0x02, 0x00, 0x00, static_cast<uint8_t>(dpid & 0xff),
                                   static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xff)};
        inventory.add_interface(dpid, ofdisc::Interface(port, ofdisc::MacAddress(mac), "s" + std::to_string(dpid) +
                                                                                         "-eth" + std::to_string(port)));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ofdisc::Logger logger(ofdisc::LogLevel::INFO);

    ofdisc::ConfigManager config;
    config.set_logger(&logger);
    if (argc > 1) {
        if (!config.load_config(argv[1])) {
            std::cerr << "Could not read configuration file " << argv[1] << std::endl;
            return 1;
        }
        for (const auto& error : config.validate_config(config.get_current_config_data())) {
            logger.warning("CONFIG", error);
        }
    }
    ofdisc::DiscoverySettings settings = config.discovery_settings();
    logger.set_min_log_level(settings.log_level);

    ofdisc::InMemorySwitchInventory inventory(logger);
    add_switch(inventory, 0x1, 101, ofdisc::openflow::OfVersion::V1_3, {1, 2, ofdisc::LLDP_RESERVED_LOCAL_PORT});
    add_switch(inventory, 0x2, 102, ofdisc::openflow::OfVersion::V1_3, {1, 2});
    add_switch(inventory, 0x3, 103, ofdisc::openflow::OfVersion::V1_0, {1, 2});

    WireTable wires;
    wires.connect({0x1, 1}, {0x2, 1});
    wires.connect({0x2, 2}, {0x3, 1});

    ofdisc::EventBus bus(logger);
    LoopbackTransport transport(inventory, bus, wires, logger);
    bus.on_packet_out([&transport](const ofdisc::ProbeCommand& command) { transport.deliver(command); });

    std::mutex links_mutex;
    std::vector<ofdisc::DiscoveredLink> links;
    bus.on_link_discovered([&](const ofdisc::DiscoveredLink& link) {
        std::lock_guard<std::mutex> lock(links_mutex);
        for (const auto& known : links) {
            if (known == link) {
                return;
            }
        }
        links.push_back(link);
    });

    ofdisc::LinkDiscovery discovery(inventory, bus, logger, settings);
    discovery.setup();

    // The first probe round runs as soon as the timer starts.
    if (!discovery.start()) {
        logger.error("SIM", "Could not start periodic probing");
        return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    discovery.shutdown();

    std::lock_guard<std::mutex> lock(links_mutex);
    std::cout << "Discovered " << links.size() << " links:" << std::endl;
    for (const auto& link : links) {
        std::cout << "  " << link.to_string() << std::endl;
    }
    return 0;
}
