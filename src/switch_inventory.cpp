#include "ofdisc/switch_inventory.hpp"
#include "ofdisc/utils.hpp"

namespace ofdisc {

std::string SwitchSnapshot::id() const {
    return utils::dpid_to_string(dpid);
}

InMemorySwitchInventory::InMemorySwitchInventory(const Logger& logger) : logger_(logger) {
    logger_.log(LogLevel::DEBUG, "INVENTORY", "Switch inventory initialized.");
}

std::vector<SwitchSnapshot> InMemorySwitchInventory::snapshot() const {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    std::vector<SwitchSnapshot> result;
    result.reserve(switches_.size());
    for (const auto& pair : switches_) {
        result.push_back(pair.second);
    }
    return result;
}

std::optional<SwitchSnapshot> InMemorySwitchInventory::find_by_dpid(uint64_t dpid) const {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    auto it = switches_.find(dpid);
    if (it != switches_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void InMemorySwitchInventory::add_switch(uint64_t dpid, ConnectionId connection,
                                         std::optional<uint8_t> of_version, bool connected) {
    SwitchSnapshot entry;
    entry.dpid = dpid;
    entry.connection = connection;
    entry.connected = connected;
    entry.of_version = of_version;

    {
        std::lock_guard<std::mutex> lock(switches_mutex_);
        switches_[dpid] = entry;
    }
    logger_.log(LogLevel::INFO, "INVENTORY", "Switch " + entry.id() + " added on connection " +
                                             std::to_string(connection));
}

bool InMemorySwitchInventory::remove_switch(uint64_t dpid) {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    if (switches_.erase(dpid) == 0) {
        logger_.log(LogLevel::WARNING, "INVENTORY", "Attempted to remove unknown switch " +
                                                    utils::dpid_to_string(dpid));
        return false;
    }
    return true;
}

bool InMemorySwitchInventory::set_connected(uint64_t dpid, bool connected) {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    auto it = switches_.find(dpid);
    if (it == switches_.end()) {
        return false;
    }
    it->second.connected = connected;
    return true;
}

bool InMemorySwitchInventory::set_of_version(uint64_t dpid, std::optional<uint8_t> of_version) {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    auto it = switches_.find(dpid);
    if (it == switches_.end()) {
        return false;
    }
    it->second.of_version = of_version;
    return true;
}

bool InMemorySwitchInventory::add_interface(uint64_t dpid, const Interface& interface) {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    auto it = switches_.find(dpid);
    if (it == switches_.end()) {
        logger_.log(LogLevel::WARNING, "INVENTORY", "Cannot add port " + std::to_string(interface.port_number) +
                                                    " to unknown switch " + utils::dpid_to_string(dpid));
        return false;
    }
    it->second.interfaces[interface.port_number] = interface;
    return true;
}

bool InMemorySwitchInventory::remove_interface(uint64_t dpid, uint16_t port_number) {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    auto it = switches_.find(dpid);
    if (it == switches_.end()) {
        return false;
    }
    return it->second.interfaces.erase(port_number) > 0;
}

std::size_t InMemorySwitchInventory::size() const {
    std::lock_guard<std::mutex> lock(switches_mutex_);
    return switches_.size();
}

} // namespace ofdisc
