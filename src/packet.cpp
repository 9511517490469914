#include "ofdisc/packet.hpp"
#include "ofdisc/byte_swap.hpp"

#include <string>

namespace ofdisc {

std::vector<uint8_t> EthernetFrame::pack() const {
    std::vector<uint8_t> frame;
    frame.reserve(ETHERNET_HEADER_SIZE + data.size());
    frame.insert(frame.end(), destination.bytes.begin(), destination.bytes.end());
    frame.insert(frame.end(), source.bytes.begin(), source.bytes.end());
    byte_swap::append_be16(frame, ether_type);
    frame.insert(frame.end(), data.begin(), data.end());
    return frame;
}

EthernetFrame EthernetFrame::unpack(const uint8_t* buffer, std::size_t length) {
    if (!buffer || length < ETHERNET_HEADER_SIZE) {
        throw DecodeError("Ethernet frame too short: " + std::to_string(length) + " bytes");
    }

    EthernetFrame frame;
    frame.destination = MacAddress(buffer);
    frame.source = MacAddress(buffer + 6);
    frame.ether_type = byte_swap::read_be16(buffer + 12);
    frame.data.assign(buffer + ETHERNET_HEADER_SIZE, buffer + length);
    return frame;
}

} // namespace ofdisc
