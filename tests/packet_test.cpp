#include "gtest/gtest.h"
#include "ofdisc/packet.hpp"
#include "ofdisc/utils.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

using namespace ofdisc;

// --- MacAddress ---

TEST(MacAddressTest, ParseAndFormat) {
    MacAddress mac(std::string("AA:bb:0C:dd:ee:01"));
    EXPECT_EQ(mac.bytes, (std::array<uint8_t, 6>{0xaa, 0xbb, 0x0c, 0xdd, 0xee, 0x01}));
    EXPECT_EQ(mac.to_string(), "aa:bb:0c:dd:ee:01");
    EXPECT_FALSE(mac.is_zero());
}

TEST(MacAddressTest, MalformedStringIsZero) {
    EXPECT_TRUE(MacAddress(std::string("aa:bb:cc")).is_zero());
    EXPECT_TRUE(MacAddress(std::string("zz:bb:cc:dd:ee:ff")).is_zero());
    EXPECT_TRUE(MacAddress().is_zero());
}

TEST(MacAddressTest, NearestBridgeGroupIsMulticast) {
    EXPECT_TRUE(MacAddress(std::string("01:80:c2:00:00:0e")).is_multicast());
    EXPECT_FALSE(MacAddress(std::string("02:00:00:00:00:01")).is_multicast());
}

// --- EthernetFrame ---

TEST(EthernetFrameTest, PackLaysOutHeaderInNetworkOrder) {
    EthernetFrame frame;
    frame.destination = MacAddress(std::string("01:80:c2:00:00:0e"));
    frame.source = MacAddress(std::string("aa:bb:cc:dd:ee:01"));
    frame.ether_type = ETHERTYPE_LLDP;
    frame.data = {0xde, 0xad};

    std::vector<uint8_t> expected = {
        0x01, 0x80, 0xc2, 0x00, 0x00, 0x0e,
        0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x01,
        0x88, 0xcc,
        0xde, 0xad};
    EXPECT_EQ(frame.pack(), expected);
}

TEST(EthernetFrameTest, UnpackSplitsHeaderAndPayload) {
    std::vector<uint8_t> raw = {
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0x02, 0x00, 0x00, 0x00, 0x00, 0x07,
        0x08, 0x06,
        0x00, 0x01, 0x08, 0x00};

    EthernetFrame frame = EthernetFrame::unpack(raw);
    EXPECT_EQ(frame.destination.to_string(), "ff:ff:ff:ff:ff:ff");
    EXPECT_EQ(frame.source.to_string(), "02:00:00:00:00:07");
    EXPECT_EQ(frame.ether_type, ETHERTYPE_ARP);
    EXPECT_EQ(frame.data, (std::vector<uint8_t>{0x00, 0x01, 0x08, 0x00}));
}

TEST(EthernetFrameTest, HeaderOnlyFrameHasEmptyPayload) {
    std::vector<uint8_t> raw(ETHERNET_HEADER_SIZE, 0);
    EXPECT_TRUE(EthernetFrame::unpack(raw).data.empty());
}

TEST(EthernetFrameTest, ShortFrameThrows) {
    std::vector<uint8_t> raw(ETHERNET_HEADER_SIZE - 1, 0);
    EXPECT_THROW(EthernetFrame::unpack(raw), DecodeError);
    EXPECT_THROW(EthernetFrame::unpack(nullptr, 64), DecodeError);
}

// --- utils ---

TEST(UtilsTest, DpidToString) {
    EXPECT_EQ(utils::dpid_to_string(0x1), "00:00:00:00:00:00:00:01");
    EXPECT_EQ(utils::dpid_to_string(0x0102030405060708ULL), "01:02:03:04:05:06:07:08");
    EXPECT_EQ(utils::dpid_to_string(0xffffffffffffffffULL), "ff:ff:ff:ff:ff:ff:ff:ff");
}

TEST(UtilsTest, ParseDpid) {
    EXPECT_EQ(utils::parse_dpid("00:00:00:00:00:00:00:2a"), std::optional<uint64_t>(0x2a));
    EXPECT_EQ(utils::parse_dpid("42"), std::optional<uint64_t>(42));
    EXPECT_EQ(utils::parse_dpid("0x2a"), std::optional<uint64_t>(0x2a));

    EXPECT_FALSE(utils::parse_dpid("00:00:00:00:00:00:2a").has_value());
    EXPECT_FALSE(utils::parse_dpid("00-00-00-00-00-00-00-2a").has_value());
    EXPECT_FALSE(utils::parse_dpid("00:00:00:00:00:00:00:zz").has_value());
    EXPECT_FALSE(utils::parse_dpid("").has_value());
}

TEST(UtilsTest, SafeStoull) {
    EXPECT_EQ(utils::safe_stoull("123"), std::optional<unsigned long long>(123));
    EXPECT_FALSE(utils::safe_stoull("-1").has_value());
    EXPECT_FALSE(utils::safe_stoull("12abc").has_value());
    EXPECT_FALSE(utils::safe_stoull("99999999999999999999999").has_value());
}

TEST(UtilsTest, SafeStoullRejectsLeadingWhitespace) {
    EXPECT_FALSE(utils::safe_stoull(" -1").has_value());
    EXPECT_FALSE(utils::safe_stoull("\t-1").has_value());
    EXPECT_FALSE(utils::safe_stoull(" 42").has_value());
    EXPECT_FALSE(utils::parse_dpid(" -1").has_value());
    EXPECT_FALSE(utils::parse_dpid("\n42").has_value());
}

TEST(UtilsTest, ToHexString) {
    std::vector<uint8_t> bytes = {0x00, 0x1f, 0xa0};
    EXPECT_EQ(utils::to_hex_string(bytes), "001fa0");
    EXPECT_EQ(utils::to_hex_string(bytes, ' '), "00 1f a0");
}
