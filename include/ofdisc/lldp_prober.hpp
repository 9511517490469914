#ifndef OFDISC_LLDP_PROBER_HPP
#define OFDISC_LLDP_PROBER_HPP

#include "ofdisc/event_bus.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/switch_inventory.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace ofdisc {

// Sends one LLDP probe out of every eligible port of every eligible switch.
// Eligible switch: connected, with a negotiated version we can build a
// PacketOut for. Eligible port: anything but the reserved local port.
class LldpProber {
public:
    LldpProber(const SwitchInventory& inventory, EventPublisher& publisher, const Logger& logger);

    // Returns the number of probes published.
    std::size_t probe(const std::vector<SwitchSnapshot>& switches);

    // Timer entry point: probes a fresh inventory snapshot.
    std::size_t handle_timer_tick();

    // Builds the probe for one interface, or std::nullopt if the switch
    // version has no PacketOut family.
    static std::optional<ProbeCommand> build_probe(const SwitchSnapshot& sw, const Interface& interface);

private:
    std::size_t probe_switch(const SwitchSnapshot& sw);

    const SwitchInventory& inventory_;
    EventPublisher& publisher_;
    const Logger& logger_;
};

} // namespace ofdisc

#endif // OFDISC_LLDP_PROBER_HPP
