#ifndef OFDISC_LLDP_CODEC_HPP
#define OFDISC_LLDP_CODEC_HPP

#include "ofdisc/lldp_defs.hpp"
#include "ofdisc/packet.hpp"

#include <cstdint>
#include <cstddef>
#include <vector>

namespace ofdisc {
namespace lldp {

// Serializes chassis id, port id, TTL and End TLVs.
// Throws std::invalid_argument if a TLV value does not fit the 9-bit length.
std::vector<uint8_t> pack_lldpdu(const LldpPdu& pdu);

// Parses an LLDPDU. The first three TLVs must be Chassis ID, Port ID and TTL,
// in that order (IEEE 802.1AB); optional TLVs that follow are skipped up to the
// End TLV. Throws DecodeError on any structural problem.
LldpPdu unpack_lldpdu(const uint8_t* data, std::size_t length);
inline LldpPdu unpack_lldpdu(const std::vector<uint8_t>& data) {
    return unpack_lldpdu(data.data(), data.size());
}

// Datapath id sub-value: exactly DPID_WIRE_LENGTH bytes, network order.
std::vector<uint8_t> pack_dpid(uint64_t dpid);
uint64_t unpack_dpid(const std::vector<uint8_t>& sub_value);

// Port id sub-value: exactly PORT_ID_WIRE_LENGTH bytes, network order.
std::vector<uint8_t> pack_port_id(uint16_t port_number);
uint16_t unpack_port_id(const std::vector<uint8_t>& sub_value);

LldpPdu make_probe_lldpdu(uint64_t dpid, uint16_t port_number);

// Full Ethernet frame for a probe: LLDP multicast destination, the probing
// interface as source, LLDP ethertype.
std::vector<uint8_t> build_probe_frame(uint64_t dpid, uint16_t port_number, const MacAddress& source);

// Recovers the sender of a probe from an LLDP payload (Ethernet data).
// Throws DecodeError when the payload is not in our chassis/port encoding.
ProbeIdentity decode_probe_payload(const std::vector<uint8_t>& lldp_payload);

} // namespace lldp
} // namespace ofdisc

#endif // OFDISC_LLDP_CODEC_HPP
