#ifndef OFDISC_BYTE_SWAP_HPP
#define OFDISC_BYTE_SWAP_HPP

#include <cstdint>
#include <vector>

namespace ofdisc {
namespace byte_swap {

// Utility functions for reading/writing multi-byte values from/to byte arrays.
// LLDP and OpenFlow fields are big endian on the wire.
inline uint16_t read_be16(const uint8_t* buffer) noexcept {
    return static_cast<uint16_t>((buffer[0] << 8) | buffer[1]);
}

inline uint32_t read_be32(const uint8_t* buffer) noexcept {
    return (static_cast<uint32_t>(buffer[0]) << 24) | (static_cast<uint32_t>(buffer[1]) << 16) |
           (static_cast<uint32_t>(buffer[2]) << 8) | static_cast<uint32_t>(buffer[3]);
}

inline uint64_t read_be64(const uint8_t* buffer) noexcept {
    return (static_cast<uint64_t>(read_be32(buffer)) << 32) | read_be32(buffer + 4);
}

// Appending variants used by the encoders, which build messages front to back.
inline void append_be16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void append_be32(std::vector<uint8_t>& out, uint32_t value) {
    append_be16(out, static_cast<uint16_t>(value >> 16));
    append_be16(out, static_cast<uint16_t>(value & 0xFFFF));
}

inline void append_be64(std::vector<uint8_t>& out, uint64_t value) {
    append_be32(out, static_cast<uint32_t>(value >> 32));
    append_be32(out, static_cast<uint32_t>(value & 0xFFFFFFFF));
}

} // namespace byte_swap
} // namespace ofdisc

#endif // OFDISC_BYTE_SWAP_HPP
