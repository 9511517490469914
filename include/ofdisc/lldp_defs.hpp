#pragma once

#include "ofdisc/packet.hpp" // For MacAddress

#include <cstddef>
#include <cstdint>
#include <vector>
#include <array>

namespace ofdisc {

// LLDP Constants
const MacAddress LLDP_MULTICAST_MAC{std::array<uint8_t, 6>{0x01, 0x80, 0xc2, 0x00, 0x00, 0x0e}};
constexpr uint16_t LLDP_DEFAULT_TTL = 120;

// Port 65534 is the switch-local (virtual) port; probes are never sent out of it.
constexpr uint16_t LLDP_RESERVED_LOCAL_PORT = 65534;

// TLV Types
constexpr uint8_t TLV_TYPE_END_OF_LLDPDU = 0;
constexpr uint8_t TLV_TYPE_CHASSIS_ID = 1;
constexpr uint8_t TLV_TYPE_PORT_ID = 2;
constexpr uint8_t TLV_TYPE_TTL = 3;
constexpr uint8_t TLV_TYPE_PORT_DESCRIPTION = 4;
constexpr uint8_t TLV_TYPE_SYSTEM_NAME = 5;
constexpr uint8_t TLV_TYPE_SYSTEM_DESCRIPTION = 6;

constexpr uint16_t TLV_MAX_VALUE_LENGTH = 0x01FF;

// Chassis ID Subtypes
constexpr uint8_t CHASSIS_ID_SUBTYPE_MAC_ADDRESS = 4;
constexpr uint8_t CHASSIS_ID_SUBTYPE_INTERFACE_NAME = 6;
constexpr uint8_t CHASSIS_ID_SUBTYPE_LOCALLY_ASSIGNED = 7;

// Port ID Subtypes
constexpr uint8_t PORT_ID_SUBTYPE_MAC_ADDRESS = 3;
constexpr uint8_t PORT_ID_SUBTYPE_INTERFACE_NAME = 5;
constexpr uint8_t PORT_ID_SUBTYPE_LOCALLY_ASSIGNED = 7;

// Sizes of the sub-values carried by our own probes.
constexpr std::size_t DPID_WIRE_LENGTH = 8;
constexpr std::size_t PORT_ID_WIRE_LENGTH = 2;

// Basic TLV header: 7 bits for type, 9 bits for length (host order here).
struct LldpTlvHeader {
    uint16_t type_length = 0;

    uint8_t getType() const {
        return (type_length & 0xFE00) >> 9;
    }

    void setType(uint8_t type) {
        type_length = (type_length & 0x01FF) | (static_cast<uint16_t>(type) << 9);
    }

    uint16_t getLength() const {
        return type_length & 0x01FF;
    }

    void setLength(uint16_t length) {
        type_length = (type_length & 0xFE00) | (length & 0x01FF);
    }
};

// Value part of the Chassis ID and Port ID TLVs: one subtype octet followed by
// the sub-value.
struct ChassisIdTlvValue {
    uint8_t subtype = CHASSIS_ID_SUBTYPE_LOCALLY_ASSIGNED;
    std::vector<uint8_t> sub_value;
};

struct PortIdTlvValue {
    uint8_t subtype = PORT_ID_SUBTYPE_LOCALLY_ASSIGNED;
    std::vector<uint8_t> sub_value;
};

// The mandatory part of an LLDPDU. Optional TLVs are skipped on decode and
// never emitted.
struct LldpPdu {
    ChassisIdTlvValue chassis_id;
    PortIdTlvValue port_id;
    uint16_t ttl = LLDP_DEFAULT_TTL;
};

// What a probe of ours carries: who sent it, out of which port.
struct ProbeIdentity {
    uint64_t dpid = 0;
    uint16_t port_number = 0;
};

} // namespace ofdisc
