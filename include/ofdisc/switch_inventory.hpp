#ifndef OFDISC_SWITCH_INVENTORY_HPP
#define OFDISC_SWITCH_INVENTORY_HPP

#include "ofdisc/packet.hpp" // For MacAddress
#include "ofdisc/logger.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ofdisc {

using ConnectionId = uint64_t;

struct Interface {
    uint16_t port_number = 0;
    MacAddress address;
    std::string name;

    Interface() = default;
    Interface(uint16_t port, const MacAddress& mac, std::string interface_name = "")
        : port_number(port), address(mac), name(std::move(interface_name)) {}
};

// Point-in-time copy of one switch as the controller knows it.
struct SwitchSnapshot {
    uint64_t dpid = 0;
    ConnectionId connection = 0;
    bool connected = false;
    std::optional<uint8_t> of_version; // nullopt until negotiated
    std::map<uint16_t, Interface> interfaces;

    std::string id() const;
    bool is_connected() const { return connected; }
};

class SwitchInventory {
public:
    virtual ~SwitchInventory() = default;

    virtual std::vector<SwitchSnapshot> snapshot() const = 0;
    virtual std::optional<SwitchSnapshot> find_by_dpid(uint64_t dpid) const = 0;
};

class InMemorySwitchInventory : public SwitchInventory {
public:
    explicit InMemorySwitchInventory(const Logger& logger);

    std::vector<SwitchSnapshot> snapshot() const override;
    std::optional<SwitchSnapshot> find_by_dpid(uint64_t dpid) const override;

    // Replaces any switch already registered under the same dpid.
    void add_switch(uint64_t dpid, ConnectionId connection, std::optional<uint8_t> of_version = std::nullopt,
                    bool connected = true);
    bool remove_switch(uint64_t dpid);
    bool set_connected(uint64_t dpid, bool connected);
    bool set_of_version(uint64_t dpid, std::optional<uint8_t> of_version);
    bool add_interface(uint64_t dpid, const Interface& interface);
    bool remove_interface(uint64_t dpid, uint16_t port_number);

    std::size_t size() const;

private:
    const Logger& logger_;
    std::map<uint64_t, SwitchSnapshot> switches_;
    mutable std::mutex switches_mutex_;
};

} // namespace ofdisc

#endif // OFDISC_SWITCH_INVENTORY_HPP
