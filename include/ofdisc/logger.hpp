#ifndef OFDISC_LOGGER_HPP
#define OFDISC_LOGGER_HPP

#include "ofdisc/packet.hpp" // For MacAddress

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ofdisc {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Accepts "debug", "info", "warning" (or "warn"), "error", "critical", any case.
inline std::optional<LogLevel> parse_log_level(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warning" || text == "warn") return LogLevel::WARNING;
    if (text == "error") return LogLevel::ERROR;
    if (text == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}

    void set_min_log_level(LogLevel level) {
        min_log_level_.store(level);
    }

    LogLevel get_min_log_level() const {
        return min_log_level_.load();
    }

    bool enabled(LogLevel level) const {
        return level >= min_log_level_.load();
    }

    void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (!enabled(level)) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm local_tm {};

        if (!(localtime_r(&t, &local_tm) && std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local_tm))) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::ostream& output_stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

        std::lock_guard<std::mutex> lock(write_mutex_);
        output_stream << "[" << time_buf << "] "
                      << "[" << level_to_string(level) << "] "
                      << "[" << component << "] "
                      << message << std::endl;
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }
    void critical(const std::string& component, const std::string& message) const {
        log(LogLevel::CRITICAL, component, message);
    }

    std::string mac_to_string(const MacAddress& mac) const {
        return mac.to_string();
    }

    std::string to_hex_string(uint16_t val) const {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << val;
        return oss.str();
    }

    void log_probe_sent(const std::string& switch_id, uint32_t port_number, const MacAddress& source,
                        uint8_t of_version) const {
        if (!enabled(LogLevel::DEBUG)) return;
        std::string message = "Sending a LLDP PacketOut to the switch " + switch_id +
                              " port " + std::to_string(port_number) +
                              " from " + mac_to_string(source) +
                              " (OpenFlow " + to_hex_string(of_version) + ")";
        log(LogLevel::DEBUG, "LLDP_PROBER", message);
    }

    void log_link_discovered(const std::string& switch_a, uint32_t port_a,
                             const std::string& switch_b, uint32_t port_b) const {
        if (!enabled(LogLevel::INFO)) return;
        std::string message = "Link discovered: " + switch_a + " port " + std::to_string(port_a) +
                              " <-> " + switch_b + " port " + std::to_string(port_b);
        log(LogLevel::INFO, "LLDP_CORRELATOR", message);
    }

private:
    std::atomic<LogLevel> min_log_level_;
    mutable std::mutex write_mutex_;

    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }
};

} // namespace ofdisc

#endif // OFDISC_LOGGER_HPP
