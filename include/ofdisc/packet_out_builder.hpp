#ifndef OFDISC_PACKET_OUT_BUILDER_HPP
#define OFDISC_PACKET_OUT_BUILDER_HPP

#include "ofdisc/openflow.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ofdisc {

// True when a PacketOut family is registered for this wire version.
bool is_supported_version(uint8_t version);

std::vector<uint8_t> supported_versions();

// Encodes a PacketOut for `version` with a single output action to
// `port_number` and `data` as the message body. Returns std::nullopt for a
// version without a registered family. Throws std::invalid_argument for a
// port the version cannot address.
std::optional<openflow::Message> build_lldp_packet_out(uint8_t version, uint32_t port_number,
                                                       std::vector<uint8_t> data);

} // namespace ofdisc

#endif // OFDISC_PACKET_OUT_BUILDER_HPP
