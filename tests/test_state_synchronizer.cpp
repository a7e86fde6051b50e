#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include "fake_session.h"
#include "state_synchronizer.h"

using Catch::Approx;

namespace {
    PlayerState MakeState(const std::string& id, float x, float timestamp) {
        PlayerState state;
        state.playerId = id;
        state.position = sf::Vector3f(x, 0.0f, 0.0f);
        state.timestamp = timestamp;
        return state;
    }

    struct SyncFixture {
        FakeSession session;
        NetworkEventBus events;
        StateSynchronizer sync{ session, events, 5.0f, 10.0f };

        SyncFixture() { session.SetRoom("room-1", false); }
    };
}

TEST_CASE("First contact creates the record at the received state") {
    SyncFixture f;
    std::string spawned;
    f.events.Subscribe<RemotePlayerSpawnedEvent>([&spawned](const RemotePlayerSpawnedEvent& e) { spawned = e.playerId; });

    REQUIRE(f.sync.ApplyState(MakeState("p2", 3.0f, 1.0f)) == ApplyResult::FirstContact);
    REQUIRE(spawned == "p2");

    PlayerState current;
    REQUIRE(f.sync.GetRemoteState("p2", current));
    REQUIRE(current.position.x == Approx(3.0f));
}

TEST_CASE("Out-of-order state is discarded as stale") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 5.0f));

    REQUIRE(f.sync.ApplyState(MakeState("p2", 1.0f, 4.0f)) == ApplyResult::Stale);
    REQUIRE(f.sync.GetStaleCount() == 1);

    PlayerState target;
    REQUIRE(f.sync.GetTargetState("p2", target));
    REQUIRE(target.timestamp == Approx(5.0f));
    REQUIRE(target.position.x == Approx(0.0f));
}

TEST_CASE("A state with the same timestamp is accepted") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 5.0f));
    REQUIRE(f.sync.ApplyState(MakeState("p2", 1.0f, 5.0f)) == ApplyResult::Interpolating);
}

TEST_CASE("Drift beyond the desync threshold snaps immediately") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 1.0f));

    REQUIRE(f.sync.ApplyState(MakeState("p2", 50.0f, 2.0f)) == ApplyResult::Snapped);
    REQUIRE(f.sync.GetSnapCount() == 1);

    PlayerState current;
    f.sync.GetRemoteState("p2", current);
    REQUIRE(current.position.x == Approx(50.0f));
}

TEST_CASE("Small drift blends toward the target over updates") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 1.0f));
    REQUIRE(f.sync.ApplyState(MakeState("p2", 2.0f, 1.1f)) == ApplyResult::Interpolating);

    f.sync.Update(0.05f);
    PlayerState current;
    f.sync.GetRemoteState("p2", current);
    REQUIRE(current.position.x == Approx(1.0f));

    f.sync.Update(1.0f);
    f.sync.GetRemoteState("p2", current);
    REQUIRE(current.position.x == Approx(2.0f));
}

TEST_CASE("Applied timestamps never go backwards for a shuffled stream") {
    SyncFixture f;
    const float stamps[] = { 1.0f, 3.0f, 2.0f, 3.0f, 5.0f, 4.0f, 6.0f };
    float lastTarget = 0.0f;

    for (float stamp : stamps) {
        f.sync.ApplyState(MakeState("p2", stamp * 0.1f, stamp));
        PlayerState target;
        REQUIRE(f.sync.GetTargetState("p2", target));
        REQUIRE(target.timestamp >= lastTarget);
        lastTarget = target.timestamp;
    }
    REQUIRE(f.sync.GetStaleCount() == 2);
}

TEST_CASE("Our own echoed state is ignored") {
    SyncFixture f;
    REQUIRE(f.sync.ApplyState(MakeState("local", 1.0f, 1.0f)) == ApplyResult::IgnoredLocal);
    REQUIRE(f.sync.GetPlayerCount() == 0);
}

TEST_CASE("State outside a room is dropped") {
    SyncFixture f;
    f.session.ClearRoom();
    REQUIRE(f.sync.ApplyState(MakeState("p2", 1.0f, 1.0f)) == ApplyResult::NotInRoom);
}

TEST_CASE("Non-finite state is rejected") {
    SyncFixture f;
    PlayerState state = MakeState("p2", 1.0f, 1.0f);
    state.velocity.y = std::numeric_limits<float>::infinity();
    REQUIRE(f.sync.ApplyState(state) == ApplyResult::Rejected);
    REQUIRE_FALSE(f.sync.HasPlayer("p2"));
}

TEST_CASE("Input is routed only to known remote players and clamped") {
    SyncFixture f;
    PlayerInput input;
    input.playerId = "p2";
    input.steering = 3.0f;
    input.throttle = 0.5f;

    REQUIRE_FALSE(f.sync.ApplyInput(input));

    f.sync.ApplyState(MakeState("p2", 0.0f, 1.0f));
    REQUIRE(f.sync.ApplyInput(input));

    PlayerInput stored;
    REQUIRE(f.sync.GetRemoteInput("p2", stored));
    REQUIRE(stored.steering == Approx(1.0f));
    REQUIRE(stored.throttle == Approx(0.5f));

    input.playerId = "local";
    REQUIRE_FALSE(f.sync.ApplyInput(input));
}

TEST_CASE("Relay messages reach the synchronizer through the session") {
    SyncFixture f;
    f.session.Deliver(GameDataMessage{ "p3", MakeState("p3", 4.0f, 2.0f) });
    REQUIRE(f.sync.HasPlayer("p3"));

    std::string removed;
    f.events.Subscribe<RemotePlayerRemovedEvent>([&removed](const RemotePlayerRemovedEvent& e) { removed = e.playerId; });
    f.session.Deliver(PlayerDisconnectedMessage{ "p3" });
    REQUIRE_FALSE(f.sync.HasPlayer("p3"));
    REQUIRE(removed == "p3");
}

TEST_CASE("Leaving the room clears every record") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 1.0f));
    f.sync.ApplyState(MakeState("p3", 0.0f, 1.0f));

    f.events.Publish(RoomLeftEvent{ "room-1" });
    REQUIRE(f.sync.GetPlayerCount() == 0);
}

TEST_CASE("A datagram arriving after the player left does not bring the car back") {
    SyncFixture f;
    int spawned = 0;
    f.events.Subscribe<RemotePlayerSpawnedEvent>([&spawned](const RemotePlayerSpawnedEvent&) { ++spawned; });

    f.session.Deliver(GameDataMessage{ "p2", MakeState("p2", 1.0f, 5.0f) });
    REQUIRE(f.sync.HasPlayer("p2"));

    f.session.Deliver(PlayerDisconnectedMessage{ "p2" });
    REQUIRE_FALSE(f.sync.HasPlayer("p2"));

    REQUIRE(f.sync.ApplyState(MakeState("p2", 1.0f, 4.0f)) == ApplyResult::Departed);
    f.session.Deliver(GameDataMessage{ "p2", MakeState("p2", 1.0f, 6.0f) });
    REQUIRE_FALSE(f.sync.HasPlayer("p2"));
    REQUIRE(spawned == 1);
}

TEST_CASE("A player who rejoins is tracked again") {
    SyncFixture f;
    f.sync.ApplyState(MakeState("p2", 0.0f, 1.0f));
    f.session.Deliver(PlayerDisconnectedMessage{ "p2" });

    f.session.Deliver(PlayerJoinedMessage{ "p2" });
    REQUIRE(f.sync.ApplyState(MakeState("p2", 0.0f, 0.5f)) == ApplyResult::FirstContact);
    REQUIRE(f.sync.HasPlayer("p2"));
}
