#ifndef OFDISC_PACKET_HPP
#define OFDISC_PACKET_HPP

#include <cstdint>   // For uint8_t, uint16_t
#include <vector>    // For std::vector
#include <string>    // For std::string
#include <array>     // For std::array
#include <algorithm> // For std::copy
#include <cstdio>    // For std::sscanf, std::snprintf
#include <cstddef>   // For std::size_t
#include <stdexcept> // For std::runtime_error

namespace ofdisc {

// Raised by every decoder in this library when the bytes do not have the
// structure being decoded (short buffer, bad length field, unexpected type).
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

struct MacAddress {
    std::array<uint8_t, 6> bytes{};

    MacAddress() = default;

    MacAddress(const std::array<uint8_t, 6>& mac_bytes) : bytes(mac_bytes) {}

    MacAddress(const uint8_t* mac_bytes_ptr) {
        if (mac_bytes_ptr) {
            std::copy(mac_bytes_ptr, mac_bytes_ptr + 6, bytes.begin());
        } else {
            bytes.fill(0);
        }
    }

    // Accepts "aa:bb:cc:dd:ee:ff". Anything else yields the zero address.
    MacAddress(const std::string& mac_str) {
        bytes.fill(0);
        if (mac_str.length() == 17) {
            unsigned int temp_b[6];
            int matched = std::sscanf(mac_str.c_str(), "%02x:%02x:%02x:%02x:%02x:%02x",
                                      &temp_b[0], &temp_b[1], &temp_b[2],
                                      &temp_b[3], &temp_b[4], &temp_b[5]);
            if (matched == 6) {
                for (std::size_t i = 0; i < 6; ++i) {
                    bytes[i] = static_cast<uint8_t>(temp_b[i]);
                }
            }
        }
    }

    bool operator==(const MacAddress& other) const {
        return bytes == other.bytes;
    }

    bool operator!=(const MacAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const MacAddress& other) const {
        return bytes < other.bytes;
    }

    std::string to_string() const {
        char buf[18];
        std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                      bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
        return std::string(buf);
    }

    bool is_zero() const {
        for (uint8_t b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    bool is_multicast() const {
        return (bytes[0] & 0x01) != 0;
    }
};

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_ARP = 0x0806;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;
constexpr uint16_t ETHERTYPE_LLDP = 0x88CC;

constexpr std::size_t ETHERNET_HEADER_SIZE = 14;

// An untagged Ethernet II frame with its header fields in host order.
struct EthernetFrame {
    MacAddress destination;
    MacAddress source;
    uint16_t ether_type = 0;
    std::vector<uint8_t> data;

    std::vector<uint8_t> pack() const;

    // Throws DecodeError when fewer than ETHERNET_HEADER_SIZE bytes are given.
    static EthernetFrame unpack(const uint8_t* buffer, std::size_t length);
    static EthernetFrame unpack(const std::vector<uint8_t>& buffer) {
        return unpack(buffer.data(), buffer.size());
    }
};

} // namespace ofdisc

#endif // OFDISC_PACKET_HPP
