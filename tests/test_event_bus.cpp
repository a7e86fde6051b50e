#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "network_events.h"

TEST_CASE("Subscribers only receive the event type they asked for") {
    NetworkEventBus bus;
    std::vector<std::string> joined;
    int left = 0;

    bus.Subscribe<PlayerJoinedEvent>([&joined](const PlayerJoinedEvent& e) { joined.push_back(e.playerId); });
    bus.Subscribe<PlayerLeftEvent>([&left](const PlayerLeftEvent&) { ++left; });

    bus.Publish(PlayerJoinedEvent{ "p1" });
    bus.Publish(PlayerJoinedEvent{ "p2" });

    REQUIRE(joined == std::vector<std::string>{ "p1", "p2" });
    REQUIRE(left == 0);
}

TEST_CASE("Unsubscribe stops delivery") {
    NetworkEventBus bus;
    int calls = 0;
    auto id = bus.Subscribe<DisconnectedEvent>([&calls](const DisconnectedEvent&) { ++calls; });
    REQUIRE(bus.GetSubscriberCount<DisconnectedEvent>() == 1);

    bus.Unsubscribe(id);
    bus.Unsubscribe(id);
    bus.Publish(DisconnectedEvent{});

    REQUIRE(calls == 0);
    REQUIRE(bus.GetSubscriberCount<DisconnectedEvent>() == 0);
}

TEST_CASE("A handler may unsubscribe itself while being published") {
    NetworkEventBus bus;
    int calls = 0;
    NetworkEventBus::SubscriptionId id = 0;
    id = bus.Subscribe<KickedEvent>([&](const KickedEvent&) {
        ++calls;
        bus.Unsubscribe(id);
    });

    bus.Publish(KickedEvent{ "bye" });
    bus.Publish(KickedEvent{ "bye again" });
    REQUIRE(calls == 1);
}

TEST_CASE("Publishing with no subscribers is harmless") {
    NetworkEventBus bus;
    bus.Publish(ServerNoticeEvent{ "maintenance" });
    REQUIRE(bus.GetSubscriberCount<ServerNoticeEvent>() == 0);
}
