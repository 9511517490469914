#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "mock_collaborators.hpp"

#include "ofdisc/lldp_codec.hpp"
#include "ofdisc/lldp_defs.hpp"
#include "ofdisc/lldp_prober.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/openflow.hpp"

#include <array>
#include <optional>
#include <string>
#include <stdexcept>
#include <vector>

using namespace ofdisc;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::Return;

class LldpProberTest : public ::testing::Test {
protected:
    MockSwitchInventory inventory_;
    MockEventPublisher publisher_;
    Logger logger_{LogLevel::CRITICAL};
    LldpProber prober_{inventory_, publisher_, logger_};
    std::vector<ProbeCommand> sent_;

    void capture_probes() {
        ON_CALL(publisher_, publish_packet_out(_))
            .WillByDefault(Invoke([this](const ProbeCommand& command) { sent_.push_back(command); }));
    }

    static MacAddress mac_for(uint64_t dpid, uint16_t port) {
        return MacAddress(std::array<uint8_t, 6>{0x02, 0x00, 0x00, static_cast<uint8_t>(dpid),
                                                 static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port)});
    }

    static SwitchSnapshot make_switch(uint64_t dpid, ConnectionId connection, std::optional<uint8_t> version,
                                      bool connected, const std::vector<uint16_t>& ports) {
        SwitchSnapshot sw;
        sw.dpid = dpid;
        sw.connection = connection;
        sw.of_version = version;
        sw.connected = connected;
        for (uint16_t port : ports) {
            sw.interfaces[port] = Interface(port, mac_for(dpid, port));
        }
        return sw;
    }
};

TEST_F(LldpProberTest, ProbesEveryPortOfConnectedOpenFlow13Switch) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(2);

    SwitchSnapshot sw = make_switch(0x1, 11, 0x04, true, {1, 2});
    EXPECT_EQ(prober_.probe({sw}), 2u);

    ASSERT_EQ(sent_.size(), 2u);
    for (std::size_t i = 0; i < sent_.size(); ++i) {
        uint16_t port = static_cast<uint16_t>(i + 1);
        const ProbeCommand& command = sent_[i];
        EXPECT_EQ(command.destination, 11u);
        EXPECT_EQ(command.dpid, 0x1u);
        openflow::PacketOutInfo packet_out = openflow::decode_packet_out(command.message);
        EXPECT_EQ(packet_out.version, 0x04);
        EXPECT_THAT(packet_out.output_ports, ElementsAre(port));
        EXPECT_EQ(packet_out.data, lldp::build_probe_frame(0x1, port, mac_for(0x1, port)));
    }
}

TEST_F(LldpProberTest, SingleInterfaceProbeCarriesChassisAndPortId) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(1);

    SwitchSnapshot sw;
    sw.dpid = 0x1;
    sw.connection = 21;
    sw.connected = true;
    sw.of_version = openflow::to_wire(openflow::OfVersion::V1_3);
    sw.interfaces[3] = Interface(3, MacAddress(std::string("aa:bb:cc:dd:ee:01")));

    EXPECT_EQ(prober_.probe({sw}), 1u);
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].destination, 21u);
    openflow::PacketOutInfo packet_out = openflow::decode_packet_out(sent_[0].message);
    EXPECT_THAT(packet_out.output_ports, ElementsAre(3u));

    EthernetFrame frame = EthernetFrame::unpack(packet_out.data);
    EXPECT_EQ(frame.destination, LLDP_MULTICAST_MAC);
    EXPECT_EQ(frame.source.to_string(), "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(frame.ether_type, ETHERTYPE_LLDP);
    ProbeIdentity identity = lldp::decode_probe_payload(frame.data);
    EXPECT_EQ(identity.dpid, 0x1u);
    EXPECT_EQ(identity.port_number, 3);
}

TEST_F(LldpProberTest, OpenFlow10SwitchGetsOpenFlow10PacketOut) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(1);

    EXPECT_EQ(prober_.probe({make_switch(0x3, 13, 0x01, true, {4})}), 1u);

    ASSERT_EQ(sent_.size(), 1u);
    openflow::PacketOutInfo packet_out = openflow::decode_packet_out(sent_[0].message);
    EXPECT_EQ(packet_out.version, 0x01);
    EXPECT_EQ(packet_out.in_port, 0xffffu); // OFPP_NONE
    EXPECT_THAT(packet_out.output_ports, ElementsAre(4u));
}

TEST_F(LldpProberTest, ReservedLocalPortIsNeverProbed) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(1);

    EXPECT_EQ(prober_.probe({make_switch(0x1, 11, 0x04, true, {3, LLDP_RESERVED_LOCAL_PORT})}), 1u);
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_THAT(openflow::decode_packet_out(sent_[0].message).output_ports, ElementsAre(3u));
}

TEST_F(LldpProberTest, DisconnectedSwitchIsSkipped) {
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(0);
    EXPECT_EQ(prober_.probe({make_switch(0x1, 11, 0x04, false, {1, 2})}), 0u);
}

TEST_F(LldpProberTest, SwitchWithoutNegotiatedVersionIsSkipped) {
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(0);
    EXPECT_EQ(prober_.probe({make_switch(0x1, 11, std::nullopt, true, {1})}), 0u);
}

TEST_F(LldpProberTest, UnsupportedVersionsAreSkipped) {
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(0);
    EXPECT_EQ(prober_.probe({make_switch(0x1, 11, 0x02, true, {1}),
                             make_switch(0x2, 12, 0x05, true, {1}),
                             make_switch(0x3, 13, 0x06, true, {1})}),
              0u);
}

TEST_F(LldpProberTest, OnlyEligibleSwitchesInAMixedSnapshot) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(3);

    std::vector<SwitchSnapshot> switches = {
        make_switch(0x1, 11, 0x04, true, {1, LLDP_RESERVED_LOCAL_PORT}),
        make_switch(0x2, 12, 0x04, false, {1, 2}),
        make_switch(0x3, 13, 0x01, true, {1, 2}),
        make_switch(0x4, 14, 0x05, true, {1}),
    };
    EXPECT_EQ(prober_.probe(switches), 3u);

    std::vector<ConnectionId> destinations;
    for (const auto& command : sent_) {
        destinations.push_back(command.destination);
    }
    EXPECT_THAT(destinations, ElementsAre(11u, 13u, 13u));
}

TEST_F(LldpProberTest, PublishFailureOnOnePortDoesNotStopTheRest) {
    EXPECT_CALL(publisher_, publish_packet_out(_))
        .WillOnce(Return())
        .WillOnce(Invoke([](const ProbeCommand&) { throw std::runtime_error("connection reset"); }))
        .WillOnce(Return());

    EXPECT_EQ(prober_.probe({make_switch(0x1, 11, 0x04, true, {1, 2, 3})}), 2u);
}

TEST_F(LldpProberTest, TimerTickProbesInventorySnapshot) {
    capture_probes();
    EXPECT_CALL(inventory_, snapshot())
        .WillOnce(Return(std::vector<SwitchSnapshot>{make_switch(0x7, 17, 0x04, true, {5})}));
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(1);

    EXPECT_EQ(prober_.handle_timer_tick(), 1u);
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_[0].destination, 17u);
}

TEST_F(LldpProberTest, ConsecutiveTicksSendIdenticalProbes) {
    capture_probes();
    EXPECT_CALL(publisher_, publish_packet_out(_)).Times(2);

    SwitchSnapshot sw = make_switch(0x1, 11, 0x04, true, {1});
    prober_.probe({sw});
    prober_.probe({sw});

    ASSERT_EQ(sent_.size(), 2u);
    EXPECT_EQ(sent_[0].message.bytes, sent_[1].message.bytes);
}

TEST(LldpProberBuildProbeTest, NoProbeForUnknownVersion) {
    SwitchSnapshot sw;
    sw.dpid = 1;
    sw.connected = true;
    sw.of_version = 0x03;
    EXPECT_FALSE(LldpProber::build_probe(sw, Interface(1, MacAddress())).has_value());

    sw.of_version = std::nullopt;
    EXPECT_FALSE(LldpProber::build_probe(sw, Interface(1, MacAddress())).has_value());
}
