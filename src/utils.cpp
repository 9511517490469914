#include "ofdisc/utils.hpp"
#include <string>
#include <cctype>
#include <cstdio>
#include <stdexcept> // For std::stoull exceptions

namespace ofdisc {
namespace utils {

std::optional<unsigned long long> safe_stoull(const std::string& str) {
    // std::stoull skips leading blanks and negates a '-' after them
    if (str.empty() || str[0] == '-' || std::isspace(static_cast<unsigned char>(str[0]))) {
        return std::nullopt;
    }
    try {
        size_t processed_chars = 0;
        unsigned long long val = std::stoull(str, &processed_chars, 0); // 0 for auto-base detection
        if (processed_chars != str.length()) { // Ensure the entire string was consumed
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string dpid_to_string(uint64_t dpid) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x:%02x:%02x",
                  static_cast<unsigned>((dpid >> 56) & 0xFF), static_cast<unsigned>((dpid >> 48) & 0xFF),
                  static_cast<unsigned>((dpid >> 40) & 0xFF), static_cast<unsigned>((dpid >> 32) & 0xFF),
                  static_cast<unsigned>((dpid >> 24) & 0xFF), static_cast<unsigned>((dpid >> 16) & 0xFF),
                  static_cast<unsigned>((dpid >> 8) & 0xFF), static_cast<unsigned>(dpid & 0xFF));
    return std::string(buf);
}

std::optional<uint64_t> parse_dpid(const std::string& text) {
    if (text.find(':') == std::string::npos) {
        auto value = safe_stoull(text);
        if (!value) return std::nullopt;
        return static_cast<uint64_t>(*value);
    }

    // "xx:xx:xx:xx:xx:xx:xx:xx"
    if (text.size() != 23) {
        return std::nullopt;
    }
    uint64_t dpid = 0;
    for (size_t i = 0; i < 8; ++i) {
        size_t pos = i * 3;
        if (i < 7 && text[pos + 2] != ':') {
            return std::nullopt;
        }
        if (!std::isxdigit(static_cast<unsigned char>(text[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(text[pos + 1]))) {
            return std::nullopt;
        }
        uint64_t octet = std::stoul(text.substr(pos, 2), nullptr, 16);
        dpid = (dpid << 8) | octet;
    }
    return dpid;
}

} // namespace utils
} // namespace ofdisc
