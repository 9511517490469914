#include "ofdisc/openflow.hpp"
#include "ofdisc/packet.hpp" // For DecodeError

#include <cstdio>
#include <string>

namespace ofdisc {
namespace openflow {

using byte_swap::read_be16;

namespace {

constexpr std::size_t PACKET_OUT_V10_SIZE = 16;
constexpr std::size_t PACKET_OUT_V13_SIZE = 24;
constexpr std::size_t PACKET_IN_V10_SIZE = 18;
constexpr std::size_t PACKET_IN_V13_MATCH_OFFSET = 24;
constexpr std::size_t PACKET_IN_V13_MIN_SIZE = 34; // empty match padded to 8, then 2 pad bytes
constexpr uint16_t OFPMT_OXM = 1;
constexpr std::size_t MAX_PACKET_IN_DATA = 0xffff - 64;

void expect_header(const std::vector<uint8_t>& bytes, uint8_t type, std::size_t fixed_size) {
    if (bytes.size() < OFP_HEADER_SIZE) {
        throw DecodeError("OpenFlow: truncated header (" + std::to_string(bytes.size()) + " bytes)");
    }
    if (bytes[1] != type) {
        throw DecodeError("OpenFlow: expected message type " + std::to_string(type) +
                          ", got " + std::to_string(bytes[1]));
    }
    uint16_t length = read_be16(bytes.data() + 2);
    if (length != bytes.size()) {
        throw DecodeError("OpenFlow: header length " + std::to_string(length) + ", buffer holds " +
                          std::to_string(bytes.size()) + " bytes");
    }
    if (length < fixed_size) {
        throw DecodeError("OpenFlow: message length " + std::to_string(length) +
                          " shorter than fixed part " + std::to_string(fixed_size));
    }
}

// libfluid walks the action list by the lengths it finds, so they have to
// tile [begin, end) exactly before it sees them.
void check_actions(const std::vector<uint8_t>& bytes, std::size_t begin, std::size_t end) {
    if (end > bytes.size()) {
        throw DecodeError("OpenFlow: actions run past the end of the message");
    }
    std::size_t offset = begin;
    while (offset < end) {
        if (end - offset < 8) {
            throw DecodeError("OpenFlow: truncated action");
        }
        uint16_t len = read_be16(bytes.data() + offset + 2);
        if (len < 8 || len % 8 != 0 || len > end - offset) {
            throw DecodeError("OpenFlow: bad action length " + std::to_string(len));
        }
        offset += len;
    }
}

// OXM match of a 1.3 packet-in, same reasoning as check_actions().
void check_match(const std::vector<uint8_t>& bytes, std::size_t begin) {
    if (read_be16(bytes.data() + begin) != OFPMT_OXM) {
        throw DecodeError("OpenFlow: packet-in match is not an OXM match");
    }
    uint16_t match_len = read_be16(bytes.data() + begin + 2);
    std::size_t padded = (static_cast<std::size_t>(match_len) + 7) / 8 * 8;
    if (match_len < 4 || begin + padded + 2 > bytes.size()) {
        throw DecodeError("OpenFlow: bad match length " + std::to_string(match_len));
    }
    std::size_t offset = begin + 4;
    std::size_t end = begin + match_len;
    while (offset < end) {
        if (end - offset < 4) {
            throw DecodeError("OpenFlow: truncated OXM header");
        }
        std::size_t oxm_len = bytes[offset + 3];
        if (oxm_len > end - offset - 4) {
            throw DecodeError("OpenFlow: OXM field runs past the match");
        }
        offset += 4 + oxm_len;
    }
}

void expect_unpacked(uint32_t error, const char* what) {
    if (error != 0) {
        throw DecodeError(std::string("OpenFlow: malformed ") + what + " (error " + std::to_string(error) + ")");
    }
}

std::vector<uint8_t> copy_data(void* data, std::size_t length) {
    if (!data || length == 0) {
        return {};
    }
    const uint8_t* begin = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(begin, begin + length);
}

template <typename OutputAction>
std::vector<uint32_t> output_ports_of(fluid_msg::ActionList actions, uint16_t output_type) {
    std::vector<uint32_t> ports;
    for (fluid_msg::Action* action : actions.action_list()) {
        if (action->type() == output_type) {
            ports.push_back(static_cast<OutputAction*>(action)->port());
        }
    }
    return ports;
}

} // namespace

std::string version_to_string(uint8_t version) {
    switch (version) {
        case to_wire(OfVersion::V1_0): return "1.0";
        case to_wire(OfVersion::V1_3): return "1.3";
        default: {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "0x%02x", version);
            return std::string(buf);
        }
    }
}

PacketOutInfo decode_packet_out(const Message& message) {
    PacketOutInfo info;
    info.version = message.version();
    // libfluid unpacks from a mutable buffer
    std::vector<uint8_t> buffer = message.bytes;

    if (info.version == to_wire(OfVersion::V1_0)) {
        expect_header(buffer, OFPT_PACKET_OUT, PACKET_OUT_V10_SIZE);
        check_actions(buffer, PACKET_OUT_V10_SIZE, PACKET_OUT_V10_SIZE + read_be16(buffer.data() + 14));

        of10::PacketOut packet_out;
        expect_unpacked(packet_out.unpack(buffer.data()), "1.0 PacketOut");
        info.buffer_id = packet_out.buffer_id();
        info.in_port = packet_out.in_port();
        info.output_ports = output_ports_of<of10::OutputAction>(packet_out.actions(), of10::OFPAT_OUTPUT);
        info.data = copy_data(packet_out.data(), packet_out.data_len());
    } else if (info.version == to_wire(OfVersion::V1_3)) {
        expect_header(buffer, OFPT_PACKET_OUT, PACKET_OUT_V13_SIZE);
        check_actions(buffer, PACKET_OUT_V13_SIZE, PACKET_OUT_V13_SIZE + read_be16(buffer.data() + 16));

        of13::PacketOut packet_out;
        expect_unpacked(packet_out.unpack(buffer.data()), "1.3 PacketOut");
        info.buffer_id = packet_out.buffer_id();
        info.in_port = packet_out.in_port();
        info.output_ports = output_ports_of<of13::OutputAction>(packet_out.actions(), of13::OFPAT_OUTPUT);
        info.data = copy_data(packet_out.data(), packet_out.data_len());
    } else {
        throw DecodeError("OpenFlow: unsupported version " + version_to_string(info.version));
    }
    return info;
}

PacketInInfo decode_packet_in(const Message& message) {
    PacketInInfo info;
    info.version = message.version();
    std::vector<uint8_t> buffer = message.bytes;

    if (info.version == to_wire(OfVersion::V1_0)) {
        expect_header(buffer, OFPT_PACKET_IN, PACKET_IN_V10_SIZE);

        of10::PacketIn packet_in;
        expect_unpacked(packet_in.unpack(buffer.data()), "1.0 packet-in");
        info.buffer_id = packet_in.buffer_id();
        info.in_port = packet_in.in_port();
        info.reason = packet_in.reason();
        info.data = copy_data(packet_in.data(), packet_in.data_len());
    } else if (info.version == to_wire(OfVersion::V1_3)) {
        expect_header(buffer, OFPT_PACKET_IN, PACKET_IN_V13_MIN_SIZE);
        check_match(buffer, PACKET_IN_V13_MATCH_OFFSET);

        of13::PacketIn packet_in;
        expect_unpacked(packet_in.unpack(buffer.data()), "1.3 packet-in");
        auto&& match = packet_in.match();
        of13::InPort* in_port = match.in_port();
        if (!in_port) {
            throw DecodeError("OpenFlow: 1.3 packet-in without in_port in its match");
        }
        info.buffer_id = packet_in.buffer_id();
        info.in_port = in_port->value();
        info.reason = packet_in.reason();
        info.data = copy_data(packet_in.data(), packet_in.data_len());
    } else {
        throw DecodeError("OpenFlow: unsupported version " + version_to_string(info.version));
    }
    return info;
}

Message encode_packet_in(uint8_t version, uint32_t in_port, const std::vector<uint8_t>& data) {
    if (data.size() > MAX_PACKET_IN_DATA) {
        throw std::invalid_argument("OpenFlow: packet-in data too long: " + std::to_string(data.size()) + " bytes");
    }
    std::vector<uint8_t> body(data);
    uint16_t total_len = static_cast<uint16_t>(body.size());

    if (version == to_wire(OfVersion::V1_0)) {
        if (in_port > 0xffff) {
            throw std::invalid_argument("OpenFlow: port " + std::to_string(in_port) + " does not fit OpenFlow 1.0");
        }
        of10::PacketIn packet_in(0, OFP_NO_BUFFER, static_cast<uint16_t>(in_port), total_len, of10::OFPR_ACTION);
        packet_in.data(body.data(), body.size());
        return serialize(packet_in);
    }
    if (version == to_wire(OfVersion::V1_3)) {
        of13::PacketIn packet_in(0, OFP_NO_BUFFER, total_len, of13::OFPR_ACTION, 0, 0);
        packet_in.add_oxm_field(new of13::InPort(in_port));
        packet_in.data(body.data(), body.size());
        return serialize(packet_in);
    }
    throw std::invalid_argument("OpenFlow: cannot encode a packet-in for version " + version_to_string(version));
}

} // namespace openflow
} // namespace ofdisc
