#ifndef OFDISC_OPENFLOW_HPP
#define OFDISC_OPENFLOW_HPP

#include "ofdisc/byte_swap.hpp"

#include <fluid/of10msg.hh>
#include <fluid/of13msg.hh>

#include <cstdint>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ofdisc {
namespace openflow {

namespace of10 = fluid_msg::of10;
namespace of13 = fluid_msg::of13;

// Wire version bytes of the protocol families we speak.
enum class OfVersion : uint8_t {
    V1_0 = 0x01,
    V1_3 = 0x04
};

constexpr uint8_t to_wire(OfVersion version) { return static_cast<uint8_t>(version); }

std::string version_to_string(uint8_t version);

// Same numbering in 1.0 and 1.3 for these two
constexpr uint8_t OFPT_PACKET_IN = 10;
constexpr uint8_t OFPT_PACKET_OUT = 13;

constexpr std::size_t OFP_HEADER_SIZE = 8;
// 1.0 has no name for it, the value is the same.
constexpr uint32_t OFP_NO_BUFFER = 0xffffffff;

// One encoded message, the bytes written to (or read from) a switch connection.
struct Message {
    std::vector<uint8_t> bytes;

    uint8_t version() const { return bytes.empty() ? 0 : bytes[0]; }
    uint8_t type() const { return bytes.size() > 1 ? bytes[1] : 0; }

    bool operator==(const Message& other) const { return bytes == other.bytes; }
    bool operator!=(const Message& other) const { return bytes != other.bytes; }
};

// Packs a libfluid message. The buffer is released with OFMsg::free_buffer.
template <typename FluidMessage>
Message serialize(FluidMessage& message) {
    std::unique_ptr<uint8_t[], void (*)(uint8_t*)> buffer(message.pack(), &fluid_msg::OFMsg::free_buffer);
    if (!buffer) {
        throw std::runtime_error("OpenFlow: message could not be packed");
    }
    uint16_t length = byte_swap::read_be16(buffer.get() + 2);
    return Message{std::vector<uint8_t>(buffer.get(), buffer.get() + length)};
}

struct PacketOutInfo {
    uint8_t version = 0;
    uint32_t buffer_id = OFP_NO_BUFFER;
    uint32_t in_port = 0;
    std::vector<uint32_t> output_ports;
    std::vector<uint8_t> data;
};

struct PacketInInfo {
    uint8_t version = 0;
    uint32_t buffer_id = OFP_NO_BUFFER;
    uint32_t in_port = 0; // 1.3: the OXM in_port of the match
    uint8_t reason = 0;
    std::vector<uint8_t> data;
};

// Both throw DecodeError for unknown versions, other message types, a header
// length that disagrees with the buffer and malformed bodies.
PacketOutInfo decode_packet_out(const Message& message);
PacketInInfo decode_packet_in(const Message& message);

// What a switch sends when it hands `data`, received on `in_port`, to the
// controller. Throws std::invalid_argument for a version we do not speak or
// a port that does not fit the version.
Message encode_packet_in(uint8_t version, uint32_t in_port, const std::vector<uint8_t>& data);

} // namespace openflow
} // namespace ofdisc

#endif // OFDISC_OPENFLOW_HPP
