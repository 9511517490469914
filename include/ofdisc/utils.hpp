#ifndef OFDISC_UTILS_HPP
#define OFDISC_UTILS_HPP

#include <string>    // For std::string
#include <optional>  // For std::optional
#include <sstream>   // For std::stringstream
#include <iomanip>   // For std::hex, std::setfill, std::setw
#include <cstdint>   // For uint64_t, uint8_t

namespace ofdisc {
namespace utils {

// Safely converts a string to an unsigned long (base auto-detected, so "0x1f" works).
// Returns std::nullopt if conversion fails or trailing characters remain.
std::optional<unsigned long long> safe_stoull(const std::string& str);

// Canonical datapath id form: eight colon-separated lowercase hex octets,
// e.g. 0x1 -> "00:00:00:00:00:00:00:01".
std::string dpid_to_string(uint64_t dpid);

// Accepts the canonical form, or a plain decimal / 0x-prefixed number.
std::optional<uint64_t> parse_dpid(const std::string& text);

// Helper to convert a byte container to a hex string with optional delimiter
template <typename TContainer>
std::string to_hex_string(const TContainer& container, char delimiter = '\0') {
    std::stringstream ss;
    bool first = true;
    for (const auto& byte_val : container) {
        if (!first && delimiter != '\0') {
            ss << delimiter;
        }
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(static_cast<uint8_t>(byte_val));
        first = false;
    }
    return ss.str();
}

} // namespace utils
} // namespace ofdisc

#endif // OFDISC_UTILS_HPP
