#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "ofdisc/discovery_events.hpp"
#include "ofdisc/event_bus.hpp"
#include "ofdisc/logger.hpp"
#include "ofdisc/packet_out_builder.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ofdisc;
using ::testing::ElementsAre;
using namespace std::chrono_literals;

class EventBusTest : public ::testing::Test {
protected:
    Logger logger_{LogLevel::CRITICAL};
    EventBus bus_{logger_};

    static PacketInEvent event_for(uint8_t version) {
        PacketInEvent event;
        event.version = version;
        event.dpid = 1;
        event.in_port = 2;
        return event;
    }

    static DiscoveredLink sample_link() {
        DiscoveredLink link;
        link.switch_a = {"00:00:00:00:00:00:00:02", 7};
        link.switch_b = {"00:00:00:00:00:00:00:01", 3};
        return link;
    }
};

TEST_F(EventBusTest, PacketInRoutedByVersion) {
    std::vector<uint8_t> v10_seen;
    std::vector<uint8_t> v13_seen;
    bus_.subscribe_packet_in(0x01, [&](const PacketInEvent& e) { v10_seen.push_back(e.version); });
    bus_.subscribe_packet_in(0x04, [&](const PacketInEvent& e) { v13_seen.push_back(e.version); });

    EXPECT_EQ(bus_.dispatch_packet_in(event_for(0x04)), 1u);
    EXPECT_EQ(bus_.dispatch_packet_in(event_for(0x01)), 1u);
    EXPECT_EQ(bus_.dispatch_packet_in(event_for(0x04)), 1u);

    EXPECT_THAT(v10_seen, ElementsAre(0x01));
    EXPECT_THAT(v13_seen, ElementsAre(0x04, 0x04));
}

TEST_F(EventBusTest, EventWithoutSubscriberIsCountedAsDropped) {
    bus_.subscribe_packet_in(0x04, [](const PacketInEvent&) {});

    EXPECT_EQ(bus_.dispatch_packet_in(event_for(0x02)), 0u);
    bus_.publish_link(sample_link());
    EXPECT_EQ(bus_.dropped_events(), 2u);
}

TEST_F(EventBusTest, FailingHandlerDoesNotStopOthers) {
    int delivered = 0;
    bus_.on_link_discovered([](const DiscoveredLink&) { throw std::runtime_error("subscriber down"); });
    bus_.on_link_discovered([&](const DiscoveredLink&) { ++delivered; });

    EXPECT_NO_THROW(bus_.publish_link(sample_link()));
    EXPECT_EQ(delivered, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    EventBus::SubscriptionId id = bus_.on_packet_out([&](const ProbeCommand&) { ++calls; });

    ProbeCommand command;
    command.message = *build_lldp_packet_out(0x04, 1, {});
    bus_.publish_packet_out(command);
    EXPECT_TRUE(bus_.unsubscribe(id));
    EXPECT_FALSE(bus_.unsubscribe(id));
    bus_.publish_packet_out(command);

    EXPECT_EQ(calls, 1);
}

TEST_F(EventBusTest, HandlerMayUnsubscribeItselfDuringDelivery) {
    int calls = 0;
    EventBus::SubscriptionId id = 0;
    id = bus_.subscribe_packet_in(0x01, [&](const PacketInEvent&) {
        ++calls;
        bus_.unsubscribe(id);
    });

    bus_.dispatch_packet_in(event_for(0x01));
    bus_.dispatch_packet_in(event_for(0x01));
    EXPECT_EQ(calls, 1);
}

TEST_F(EventBusTest, HandlerUnsubscribedByAnEarlierHandlerIsSkipped) {
    EventBus::SubscriptionId second = 0;
    int second_calls = 0;
    bus_.subscribe_packet_in(0x04, [&](const PacketInEvent&) { bus_.unsubscribe(second); });
    second = bus_.subscribe_packet_in(0x04, [&](const PacketInEvent&) { ++second_calls; });

    EXPECT_EQ(bus_.dispatch_packet_in(event_for(0x04)), 1u);
    EXPECT_EQ(second_calls, 0);
}

TEST_F(EventBusTest, UnsubscribeWaitsForHandlerRunningOnAnotherThread) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    EventBus::SubscriptionId id = bus_.subscribe_packet_in(0x01, [&](const PacketInEvent&) {
        entered = true;
        released.wait();
        finished = true;
    });

    std::thread dispatcher([this] { bus_.dispatch_packet_in(event_for(0x01)); });
    while (!entered.load()) {
        std::this_thread::sleep_for(1ms);
    }

    std::atomic<bool> unsubscribed{false};
    std::thread unsubscriber([&] {
        EXPECT_TRUE(bus_.unsubscribe(id));
        // The handler must be done by the time unsubscribe() returns.
        EXPECT_TRUE(finished.load());
        unsubscribed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(unsubscribed.load());

    release.set_value();
    dispatcher.join();
    unsubscriber.join();
    EXPECT_TRUE(unsubscribed.load());
    EXPECT_TRUE(bus_.subscribed_topics().empty());
}

TEST_F(EventBusTest, SubscribedTopics) {
    bus_.subscribe_packet_in(0x01, [](const PacketInEvent&) {});
    bus_.subscribe_packet_in(0x04, [](const PacketInEvent&) {});
    bus_.on_link_discovered([](const DiscoveredLink&) {});

    EXPECT_THAT(bus_.subscribed_topics(),
                ElementsAre("of_core.v0x01.messages.in.ofpt_packet_in",
                            "of_core.v0x04.messages.in.ofpt_packet_in",
                            "ofdisc.switch.link"));
}
