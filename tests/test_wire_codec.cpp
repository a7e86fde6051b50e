#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <nlohmann/json.hpp>
#include "wire_codec.h"

using Catch::Approx;
using nlohmann::json;

namespace {
    DecodeError::Kind KindOfMessageError(const std::string& text) {
        try {
            WireCodec::DecodeMessage(text);
        }
        catch (const DecodeError& e) {
            return e.GetKind();
        }
        FAIL("expected DecodeError for " << text);
        return DecodeError::Kind::Malformed;
    }
}

TEST_CASE("HOST_GAME is tagged and uses snake_case keys") {
    HostGameCommand host;
    host.roomName = "Monaco";
    host.maxPlayers = 6;

    json j = json::parse(WireCodec::EncodeCommand(host));
    REQUIRE(j["type"] == "HOST_GAME");
    REQUIRE(j["room_name"] == "Monaco");
    REQUIRE(j["max_players"] == 6);
}

TEST_CASE("REGISTER carries the protocol version and omits an empty password") {
    RegisterCommand reg;
    reg.name = "alice";

    json j = json::parse(WireCodec::EncodeCommand(reg));
    REQUIRE(j["type"] == "REGISTER");
    REQUIRE(j["protocol_version"] == NetworkConstants::PROTOCOL_VERSION);
    REQUIRE_FALSE(j.contains("password"));
}

TEST_CASE("RELAY_MESSAGE targets a player or a room, never both") {
    RelayCommand toRoom{ "r1", "", "hello" };
    json j = json::parse(WireCodec::EncodeCommand(toRoom));
    REQUIRE(j["room_id"] == "r1");
    REQUIRE_FALSE(j.contains("target_id"));

    RelayCommand toPlayer{ "r1", "p7", "psst" };
    j = json::parse(WireCodec::EncodeCommand(toPlayer));
    REQUIRE(j["target_id"] == "p7");
    REQUIRE_FALSE(j.contains("room_id"));
}

TEST_CASE("GAME_DATA with a car state decodes to the sender's PlayerState") {
    PlayerState state;
    state.position = sf::Vector3f(1.5f, 0.0f, -3.0f);
    state.rotation = Quat(0.0f, 0.7071f, 0.0f, 0.7071f);
    state.velocity = sf::Vector3f(10.0f, 0.0f, 0.0f);
    state.timestamp = 12.25f;

    GameDataMessage sent{ "p2", state };
    ServerMessage decoded = WireCodec::DecodeMessage(WireCodec::EncodeMessage(sent));

    REQUIRE(std::holds_alternative<GameDataMessage>(decoded));
    const GameDataMessage& message = std::get<GameDataMessage>(decoded);
    REQUIRE(message.from == "p2");
    REQUIRE(std::holds_alternative<PlayerState>(message.data));

    const PlayerState& got = std::get<PlayerState>(message.data);
    REQUIRE(got.playerId == "p2");
    REQUIRE(got.position.x == Approx(1.5f));
    REQUIRE(got.position.z == Approx(-3.0f));
    REQUIRE(got.rotation.y == Approx(0.7071f));
    REQUIRE(got.velocity.x == Approx(10.0f));
    REQUIRE(got.timestamp == Approx(12.25f));
}

TEST_CASE("Player input from the wire is clamped to pedal and steering ranges") {
    std::string text = R"({"type":"GAME_DATA","from":"p3","data":{"type":"PLAYER_INPUT",
        "input":{"steering":-4.0,"throttle":1.7,"brake":-0.5,"timestamp":1.0}}})";

    ServerMessage decoded = WireCodec::DecodeMessage(text);
    const PlayerInput& input = std::get<PlayerInput>(std::get<GameDataMessage>(decoded).data);
    REQUIRE(input.playerId == "p3");
    REQUIRE(input.steering == Approx(-1.0f));
    REQUIRE(input.throttle == Approx(1.0f));
    REQUIRE(input.brake == Approx(0.0f));
}

TEST_CASE("GAME_LIST keeps room entries in order") {
    ServerMessage decoded = WireCodec::DecodeMessage(
        R"({"type":"GAME_LIST","rooms":[
            {"room_id":"a","name":"Spa","player_count":2,"max_players":8},
            {"room_id":"b","name":"Suzuka","player_count":0,"max_players":4,"host_id":"h1"}]})");

    const GameListMessage& list = std::get<GameListMessage>(decoded);
    REQUIRE(list.rooms.size() == 2);
    REQUIRE(list.rooms[0].roomId == "a");
    REQUIRE(list.rooms[0].playerCount == 2);
    REQUIRE(list.rooms[1].hostId == "h1");
    REQUIRE(list.rooms[1].maxPlayers == 4);
}

TEST_CASE("REGISTERED without a protocol version is accepted") {
    ServerMessage decoded = WireCodec::DecodeMessage(R"({"type":"REGISTERED","client_id":"c1"})");
    const RegisteredMessage& reg = std::get<RegisteredMessage>(decoded);
    REQUIRE(reg.clientId == "c1");
    REQUIRE_FALSE(reg.protocolVersion.has_value());
}

TEST_CASE("Relayed non-string bodies are passed through as JSON text") {
    ServerMessage decoded = WireCodec::DecodeMessage(R"({"type":"RELAY","from":"h","message":{"lap":3}})");
    const RelayMessage& relay = std::get<RelayMessage>(decoded);
    REQUIRE(relay.from == "h");
    REQUIRE(json::parse(relay.message)["lap"] == 3);
}

TEST_CASE("Unknown message types are reported, not guessed") {
    REQUIRE(KindOfMessageError(R"({"type":"TELEPORT","x":1})") == DecodeError::Kind::UnknownType);
}

TEST_CASE("Missing required fields are reported as MissingField") {
    REQUIRE(KindOfMessageError(R"({"type":"GAME_HOSTED"})") == DecodeError::Kind::MissingField);
    REQUIRE(KindOfMessageError(R"({"client_id":"c1"})") == DecodeError::Kind::MissingField);
}

TEST_CASE("Garbage and non-object payloads are Malformed") {
    REQUIRE(KindOfMessageError("not json at all") == DecodeError::Kind::Malformed);
    REQUIRE(KindOfMessageError("[1,2,3]") == DecodeError::Kind::Malformed);
    REQUIRE(KindOfMessageError("{\"type\":\"REGISTERED\"") == DecodeError::Kind::Malformed);
}

TEST_CASE("Wrongly typed or out-of-range values are InvalidValue") {
    REQUIRE(KindOfMessageError(R"({"type":"GAME_HOSTED","room_id":42})") == DecodeError::Kind::InvalidValue);
    REQUIRE(KindOfMessageError(R"({"type":"PING_RESPONSE","timestamp":"soon"})") == DecodeError::Kind::InvalidValue);
    REQUIRE(KindOfMessageError(
        R"({"type":"GAME_DATA","from":"p","data":{"type":"PLAYER_STATE","state":{
            "position":{"x":1e9,"y":0,"z":0},"rotation":{"x":0,"y":0,"z":0,"w":1},
            "velocity":{"x":0,"y":0,"z":0},"angularVelocity":{"x":0,"y":0,"z":0},
            "timestamp":1}}})") == DecodeError::Kind::InvalidValue);
}

TEST_CASE("Unknown command types are rejected by the command decoder") {
    REQUIRE_THROWS_AS(WireCodec::DecodeCommand(R"({"type":"FLY"})"), DecodeError);

    ClientCommand decoded = WireCodec::DecodeCommand(R"({"type":"JOIN_GAME","room_id":"r9"})");
    REQUIRE(std::get<JoinGameCommand>(decoded).roomId == "r9");
}

TEST_CASE("Wire names follow the variant alternatives") {
    REQUIRE(std::string(WireCodec::CommandName(ListGamesCommand{})) == "LIST_GAMES");
    REQUIRE(std::string(WireCodec::MessageName(ServerNoticeMessage{})) == "SERVER_MESSAGE");
    REQUIRE(std::string(WireCodec::MessageName(ServerErrorMessage{})) == "ERROR");
}

TEST_CASE("Every command survives an encode and decode unchanged") {
    PlayerInput input;
    input.steering = -0.25f;
    input.throttle = 0.75f;
    input.timestamp = 3.0f;

    std::vector<ClientCommand> commands = {
        RegisterCommand{ "alice", "pw", NetworkConstants::PROTOCOL_VERSION },
        HeartbeatCommand{ "c1" },
        PingCommand{ 123456789 },
        HostGameCommand{ "Alpha", 4 },
        JoinGameCommand{ "room_1" },
        ListGamesCommand{},
        LeaveRoomCommand{ "room_1" },
        GetRoomPlayersCommand{ "room_1" },
        RelayCommand{ "room_1", "", "go go go" },
        GameDataCommand{ "c1", "room_1", "", input },
        DisconnectCommand{},
        StartGameCommand{ "room_1" },
        PlayerInfoCommand{ "alice" }
    };
    REQUIRE(commands.size() == std::variant_size_v<ClientCommand>);

    for (const ClientCommand& command : commands) {
        std::string encoded = WireCodec::EncodeCommand(command);
        ClientCommand decoded = WireCodec::DecodeCommand(encoded);
        REQUIRE(decoded.index() == command.index());
        REQUIRE(json::parse(WireCodec::EncodeCommand(decoded)) == json::parse(encoded));
    }
}

TEST_CASE("Every server message survives an encode and decode unchanged") {
    RoomInfo hosted("room_1", "Alpha", 2, 4);
    hosted.hostId = "c1";
    GameListMessage list;
    list.rooms = { hosted, RoomInfo("room_2", "Beta", 0, 8) };

    GameStartedMessage started;
    started.spawn.position = sf::Vector3f(4.0f, 0.5f, -2.0f);
    started.spawn.index = 1;
    started.playerIds = { "c1", "c2" };

    PlayerState state;
    state.playerId = "c2";
    state.position = sf::Vector3f(1.5f, 0.0f, -3.0f);
    state.velocity = sf::Vector3f(0.0f, 0.0f, 8.0f);
    state.timestamp = 2.5f;

    std::vector<ServerMessage> messages = {
        RegisteredMessage{ "c1", 3 },
        HeartbeatAckMessage{},
        PingResponseMessage{ 123 },
        GameHostedMessage{ "room_1" },
        list,
        JoinedGameMessage{ "room_1", "c1", { "c1", "c2" }, true },
        JoinFailedMessage{ "Room is full" },
        PlayerJoinedMessage{ "c3" },
        PlayerDisconnectedMessage{ "c3" },
        RoomPlayersMessage{ { "c1", "c2" } },
        started,
        RelayMessage{ "c2", "gg" },
        KickedMessage{ "Host left" },
        ServerNoticeMessage{ "Maintenance in 5 minutes" },
        GameDataMessage{ "c2", state },
        AuthFailedMessage{ "Bad password" },
        ServerErrorMessage{ "Not in a room" }
    };
    REQUIRE(messages.size() == std::variant_size_v<ServerMessage>);

    for (const ServerMessage& message : messages) {
        std::string encoded = WireCodec::EncodeMessage(message);
        ServerMessage decoded = WireCodec::DecodeMessage(encoded);
        REQUIRE(decoded.index() == message.index());
        REQUIRE(json::parse(WireCodec::EncodeMessage(decoded)) == json::parse(encoded));
    }
}
