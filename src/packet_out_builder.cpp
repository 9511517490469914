#include "ofdisc/packet_out_builder.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace ofdisc {

namespace {

using openflow::Message;
using openflow::OfVersion;
namespace of10 = openflow::of10;
namespace of13 = openflow::of13;

// max_len only matters for output to the controller.
constexpr uint16_t OUTPUT_MAX_LEN = 0xffff;

Message build_packet_out_v10(uint32_t port_number, std::vector<uint8_t> data) {
    if (port_number > 0xffff) {
        throw std::invalid_argument("port " + std::to_string(port_number) + " does not fit OpenFlow 1.0");
    }
    of10::OutputAction output(static_cast<uint16_t>(port_number), OUTPUT_MAX_LEN);
    of10::PacketOut packet_out(0, openflow::OFP_NO_BUFFER, of10::OFPP_NONE);
    packet_out.add_action(output);
    packet_out.data(data.data(), data.size());
    return openflow::serialize(packet_out);
}

Message build_packet_out_v13(uint32_t port_number, std::vector<uint8_t> data) {
    of13::OutputAction output(port_number, of13::OFPCML_NO_BUFFER);
    of13::PacketOut packet_out(0, of13::OFP_NO_BUFFER, of13::OFPP_CONTROLLER);
    packet_out.add_action(output);
    packet_out.data(data.data(), data.size());
    return openflow::serialize(packet_out);
}

struct PacketOutFamily {
    uint8_t version;
    Message (*build)(uint32_t port_number, std::vector<uint8_t> data);
};

// One entry per supported protocol version.
const std::array<PacketOutFamily, 2> kPacketOutFamilies = {{
    {openflow::to_wire(OfVersion::V1_0), &build_packet_out_v10},
    {openflow::to_wire(OfVersion::V1_3), &build_packet_out_v13},
}};

const PacketOutFamily* find_family(uint8_t version) {
    auto it = std::find_if(kPacketOutFamilies.begin(), kPacketOutFamilies.end(),
                           [version](const PacketOutFamily& family) { return family.version == version; });
    return it == kPacketOutFamilies.end() ? nullptr : &*it;
}

} // namespace

bool is_supported_version(uint8_t version) {
    return find_family(version) != nullptr;
}

std::vector<uint8_t> supported_versions() {
    std::vector<uint8_t> versions;
    for (const auto& family : kPacketOutFamilies) {
        versions.push_back(family.version);
    }
    return versions;
}

std::optional<openflow::Message> build_lldp_packet_out(uint8_t version, uint32_t port_number,
                                                       std::vector<uint8_t> data) {
    const PacketOutFamily* family = find_family(version);
    if (!family) {
        return std::nullopt;
    }
    return family->build(port_number, std::move(data));
}

} // namespace ofdisc
