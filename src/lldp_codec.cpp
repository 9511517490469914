#include "ofdisc/lldp_codec.hpp"
#include "ofdisc/byte_swap.hpp"

#include <stdexcept>
#include <string>

namespace ofdisc {
namespace lldp {

namespace {

// The LldpTlvHeader handles the type/length packing.
void add_tlv_to_pdu(std::vector<uint8_t>& pdu, uint8_t type, const std::vector<uint8_t>& value_data) {
    if (value_data.size() > TLV_MAX_VALUE_LENGTH) {
        throw std::invalid_argument("LLDP TLV value too long: " + std::to_string(value_data.size()) + " bytes");
    }
    LldpTlvHeader tlv_header;
    tlv_header.setType(type);
    tlv_header.setLength(static_cast<uint16_t>(value_data.size()));

    byte_swap::append_be16(pdu, tlv_header.type_length);
    pdu.insert(pdu.end(), value_data.begin(), value_data.end());
}

std::vector<uint8_t> subtyped_value(uint8_t subtype, const std::vector<uint8_t>& sub_value) {
    std::vector<uint8_t> value;
    value.reserve(1 + sub_value.size());
    value.push_back(subtype);
    value.insert(value.end(), sub_value.begin(), sub_value.end());
    return value;
}

struct RawTlv {
    uint8_t type;
    const uint8_t* value;
    uint16_t length;
};

// Reads one TLV at `offset` and advances it.
RawTlv next_tlv(const uint8_t* data, std::size_t length, std::size_t& offset) {
    if (length - offset < 2) {
        throw DecodeError("LLDP: truncated TLV header at offset " + std::to_string(offset));
    }
    LldpTlvHeader header;
    header.type_length = byte_swap::read_be16(data + offset);
    offset += 2;

    RawTlv tlv{header.getType(), data + offset, header.getLength()};
    if (tlv.length > length - offset) {
        throw DecodeError("LLDP: TLV type " + std::to_string(tlv.type) + " length " +
                          std::to_string(tlv.length) + " exceeds remaining PDU");
    }
    offset += tlv.length;
    return tlv;
}

RawTlv expect_tlv(const uint8_t* data, std::size_t length, std::size_t& offset, uint8_t expected_type) {
    RawTlv tlv = next_tlv(data, length, offset);
    if (tlv.type != expected_type) {
        throw DecodeError("LLDP: expected TLV type " + std::to_string(expected_type) +
                          ", found " + std::to_string(tlv.type));
    }
    return tlv;
}

} // namespace

std::vector<uint8_t> pack_lldpdu(const LldpPdu& pdu) {
    std::vector<uint8_t> out;

    add_tlv_to_pdu(out, TLV_TYPE_CHASSIS_ID, subtyped_value(pdu.chassis_id.subtype, pdu.chassis_id.sub_value));
    add_tlv_to_pdu(out, TLV_TYPE_PORT_ID, subtyped_value(pdu.port_id.subtype, pdu.port_id.sub_value));

    std::vector<uint8_t> ttl_value;
    byte_swap::append_be16(ttl_value, pdu.ttl);
    add_tlv_to_pdu(out, TLV_TYPE_TTL, ttl_value);

    add_tlv_to_pdu(out, TLV_TYPE_END_OF_LLDPDU, {});
    return out;
}

LldpPdu unpack_lldpdu(const uint8_t* data, std::size_t length) {
    if (!data || length == 0) {
        throw DecodeError("LLDP: empty PDU");
    }

    LldpPdu pdu;
    std::size_t offset = 0;

    RawTlv chassis = expect_tlv(data, length, offset, TLV_TYPE_CHASSIS_ID);
    if (chassis.length < 1) {
        throw DecodeError("LLDP: chassis id TLV without subtype");
    }
    pdu.chassis_id.subtype = chassis.value[0];
    pdu.chassis_id.sub_value.assign(chassis.value + 1, chassis.value + chassis.length);

    RawTlv port = expect_tlv(data, length, offset, TLV_TYPE_PORT_ID);
    if (port.length < 1) {
        throw DecodeError("LLDP: port id TLV without subtype");
    }
    pdu.port_id.subtype = port.value[0];
    pdu.port_id.sub_value.assign(port.value + 1, port.value + port.length);

    RawTlv ttl = expect_tlv(data, length, offset, TLV_TYPE_TTL);
    if (ttl.length != 2) {
        throw DecodeError("LLDP: TTL TLV length " + std::to_string(ttl.length));
    }
    pdu.ttl = byte_swap::read_be16(ttl.value);

    // Optional TLVs carry nothing we use; walk them so a bad length is still caught.
    while (offset < length) {
        RawTlv tlv = next_tlv(data, length, offset);
        if (tlv.type == TLV_TYPE_END_OF_LLDPDU) {
            break;
        }
    }
    return pdu;
}

std::vector<uint8_t> pack_dpid(uint64_t dpid) {
    std::vector<uint8_t> out;
    out.reserve(DPID_WIRE_LENGTH);
    byte_swap::append_be64(out, dpid);
    return out;
}

uint64_t unpack_dpid(const std::vector<uint8_t>& sub_value) {
    if (sub_value.size() != DPID_WIRE_LENGTH) {
        throw DecodeError("DPID: expected " + std::to_string(DPID_WIRE_LENGTH) + " bytes, got " +
                          std::to_string(sub_value.size()));
    }
    return byte_swap::read_be64(sub_value.data());
}

std::vector<uint8_t> pack_port_id(uint16_t port_number) {
    std::vector<uint8_t> out;
    byte_swap::append_be16(out, port_number);
    return out;
}

uint16_t unpack_port_id(const std::vector<uint8_t>& sub_value) {
    if (sub_value.size() != PORT_ID_WIRE_LENGTH) {
        throw DecodeError("Port id: expected " + std::to_string(PORT_ID_WIRE_LENGTH) + " bytes, got " +
                          std::to_string(sub_value.size()));
    }
    return byte_swap::read_be16(sub_value.data());
}

LldpPdu make_probe_lldpdu(uint64_t dpid, uint16_t port_number) {
    LldpPdu pdu;
    pdu.chassis_id.subtype = CHASSIS_ID_SUBTYPE_LOCALLY_ASSIGNED;
    pdu.chassis_id.sub_value = pack_dpid(dpid);
    pdu.port_id.subtype = PORT_ID_SUBTYPE_LOCALLY_ASSIGNED;
    pdu.port_id.sub_value = pack_port_id(port_number);
    pdu.ttl = LLDP_DEFAULT_TTL;
    return pdu;
}

std::vector<uint8_t> build_probe_frame(uint64_t dpid, uint16_t port_number, const MacAddress& source) {
    EthernetFrame frame;
    frame.destination = LLDP_MULTICAST_MAC;
    frame.source = source;
    frame.ether_type = ETHERTYPE_LLDP;
    frame.data = pack_lldpdu(make_probe_lldpdu(dpid, port_number));
    return frame.pack();
}

ProbeIdentity decode_probe_payload(const std::vector<uint8_t>& lldp_payload) {
    LldpPdu pdu = unpack_lldpdu(lldp_payload);

    if (pdu.chassis_id.subtype != CHASSIS_ID_SUBTYPE_LOCALLY_ASSIGNED) {
        throw DecodeError("LLDP: chassis id subtype " + std::to_string(pdu.chassis_id.subtype) +
                          " is not locally assigned");
    }
    if (pdu.port_id.subtype != PORT_ID_SUBTYPE_LOCALLY_ASSIGNED) {
        throw DecodeError("LLDP: port id subtype " + std::to_string(pdu.port_id.subtype) +
                          " is not locally assigned");
    }

    ProbeIdentity identity;
    identity.dpid = unpack_dpid(pdu.chassis_id.sub_value);
    identity.port_number = unpack_port_id(pdu.port_id.sub_value);
    return identity;
}

} // namespace lldp
} // namespace ofdisc
