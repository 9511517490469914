#include "ofdisc/lldp_prober.hpp"
#include "ofdisc/lldp_codec.hpp"
#include "ofdisc/lldp_defs.hpp"
#include "ofdisc/packet_out_builder.hpp"

#include <exception>
#include <utility>

namespace ofdisc {

namespace {
const char* const kComponent = "LLDP_PROBER";
}

LldpProber::LldpProber(const SwitchInventory& inventory, EventPublisher& publisher, const Logger& logger)
    : inventory_(inventory), publisher_(publisher), logger_(logger) {}

std::size_t LldpProber::handle_timer_tick() {
    return probe(inventory_.snapshot());
}

std::size_t LldpProber::probe(const std::vector<SwitchSnapshot>& switches) {
    std::size_t sent = 0;
    for (const auto& sw : switches) {
        if (!sw.is_connected()) {
            logger_.debug(kComponent, "Skipping disconnected switch " + sw.id());
            continue;
        }
        if (!sw.of_version) {
            logger_.debug(kComponent, "Skipping switch " + sw.id() + ": OpenFlow version not negotiated yet");
            continue;
        }
        if (!is_supported_version(*sw.of_version)) {
            logger_.info(kComponent, "OpenFlow version " + std::to_string(*sw.of_version) +
                                     " is not yet supported (switch " + sw.id() + ")");
            continue;
        }

        try {
            sent += probe_switch(sw);
        } catch (const std::exception& e) {
            logger_.warning(kComponent, "Probing switch " + sw.id() + " failed: " + e.what());
        }
    }
    return sent;
}

std::size_t LldpProber::probe_switch(const SwitchSnapshot& sw) {
    std::size_t sent = 0;
    for (const auto& pair : sw.interfaces) {
        const Interface& interface = pair.second;
        if (interface.port_number == LLDP_RESERVED_LOCAL_PORT) {
            continue;
        }

        try {
            std::optional<ProbeCommand> command = build_probe(sw, interface);
            if (!command) {
                continue;
            }
            publisher_.publish_packet_out(*command);
            logger_.log_probe_sent(sw.id(), interface.port_number, interface.address, *sw.of_version);
            ++sent;
        } catch (const std::exception& e) {
            logger_.warning(kComponent, "Probe on switch " + sw.id() + " port " +
                                        std::to_string(interface.port_number) + " failed: " + e.what());
        }
    }
    return sent;
}

std::optional<ProbeCommand> LldpProber::build_probe(const SwitchSnapshot& sw, const Interface& interface) {
    if (!sw.of_version) {
        return std::nullopt;
    }

    std::vector<uint8_t> frame = lldp::build_probe_frame(sw.dpid, interface.port_number, interface.address);
    std::optional<openflow::Message> packet_out =
        build_lldp_packet_out(*sw.of_version, interface.port_number, std::move(frame));
    if (!packet_out) {
        return std::nullopt;
    }

    ProbeCommand command;
    command.destination = sw.connection;
    command.dpid = sw.dpid;
    command.message = std::move(*packet_out);
    return command;
}

} // namespace ofdisc
