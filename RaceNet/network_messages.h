#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <variant>
#include <chrono>
#include <SFML/System/Vector3.hpp>
#include "net_math.h"
#include "network_constants.h"

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

const char* ConnectionStateToString(ConnectionState state);

// Identity and connection state of this client for the lifetime of one connection
struct Session {
    std::string clientId;               // Assigned by the relay in REGISTERED
    std::optional<std::string> roomId;  // Set while inside a room
    bool isHost;
    ConnectionState connectionState;
    int64_t lastActivityTime;           // ms, last inbound traffic on either channel

    Session() : isHost(false), connectionState(ConnectionState::Disconnected), lastActivityTime(0) {}
};

// One entry of the relay's room list
struct RoomInfo {
    std::string roomId;
    std::string name;
    std::string hostId;     // Empty when the relay does not report it
    int playerCount;
    int maxPlayers;

    RoomInfo() : playerCount(0), maxPlayers(0) {}
    RoomInfo(std::string id, std::string roomName, int players, int capacity)
        : roomId(std::move(id)), name(std::move(roomName)), playerCount(players), maxPlayers(capacity) {}
};

// Vehicle transform sampled by the physics layer
struct PlayerState {
    std::string playerId;
    sf::Vector3f position;
    Quat rotation;
    sf::Vector3f velocity;
    sf::Vector3f angularVelocity;
    float timestamp;        // Sender's simulation clock, seconds

    PlayerState() : timestamp(0.0f) {}
};

// Driver input, streamed independently of PlayerState
struct PlayerInput {
    std::string playerId;
    float steering;         // [-1, 1]
    float throttle;         // [0, 1]
    float brake;            // [0, 1]
    float timestamp;

    PlayerInput() : steering(0.0f), throttle(0.0f), brake(0.0f), timestamp(0.0f) {}
};

using GameDataPayload = std::variant<PlayerState, PlayerInput>;

struct SpawnPoint {
    sf::Vector3f position;
    int index;

    SpawnPoint() : index(0) {}
};

// ---------------------------------------------------------------------------
// Client -> relay commands
// ---------------------------------------------------------------------------

struct RegisterCommand {
    std::string name;
    std::string password;   // Omitted from the wire when empty
    int protocolVersion = NetworkConstants::PROTOCOL_VERSION;
};

// Over TCP clientId is empty; over UDP it tells the relay which endpoint to learn
struct HeartbeatCommand {
    std::string clientId;
};

struct PingCommand {
    int64_t timestamp = 0;  // ms, echoed back in PING_RESPONSE
};

struct HostGameCommand {
    std::string roomName;
    int maxPlayers = NetworkConstants::DEFAULT_ROOM_PLAYERS;
};

struct JoinGameCommand {
    std::string roomId;
};

struct ListGamesCommand {};

struct LeaveRoomCommand {
    std::string roomId;
};

struct GetRoomPlayersCommand {
    std::string roomId;
};

// Exactly one of roomId / targetId is set
struct RelayCommand {
    std::string roomId;
    std::string targetId;
    std::string message;
};

struct GameDataCommand {
    std::string clientId;
    std::string roomId;
    std::string targetId;   // Direct send when set
    GameDataPayload data;
};

struct DisconnectCommand {};

struct StartGameCommand {
    std::string roomId;
};

struct PlayerInfoCommand {
    std::string name;
};

using ClientCommand = std::variant<
    RegisterCommand,
    HeartbeatCommand,
    PingCommand,
    HostGameCommand,
    JoinGameCommand,
    ListGamesCommand,
    LeaveRoomCommand,
    GetRoomPlayersCommand,
    RelayCommand,
    GameDataCommand,
    DisconnectCommand,
    StartGameCommand,
    PlayerInfoCommand>;

// ---------------------------------------------------------------------------
// Relay -> client messages
// ---------------------------------------------------------------------------

struct RegisteredMessage {
    std::string clientId;
    std::optional<int> protocolVersion;   // Older relays do not report one
};

struct HeartbeatAckMessage {};

struct PingResponseMessage {
    int64_t timestamp = 0;
};

struct GameHostedMessage {
    std::string roomId;
};

struct GameListMessage {
    std::vector<RoomInfo> rooms;
};

struct JoinedGameMessage {
    std::string roomId;
    std::string hostId;
    std::vector<std::string> players;   // Often incomplete; follow up with GET_ROOM_PLAYERS
    bool gameStarted = false;
};

struct JoinFailedMessage {
    std::string reason;
};

struct PlayerJoinedMessage {
    std::string clientId;
};

struct PlayerDisconnectedMessage {
    std::string playerId;
};

struct RoomPlayersMessage {
    std::vector<std::string> players;
};

struct GameStartedMessage {
    SpawnPoint spawn;
    std::vector<std::string> playerIds;
};

struct RelayMessage {
    std::string from;
    std::string message;
};

struct KickedMessage {
    std::string message;
};

struct ServerNoticeMessage {
    std::string message;
};

struct GameDataMessage {
    std::string from;
    GameDataPayload data;
};

struct AuthFailedMessage {
    std::string message;
};

struct ServerErrorMessage {
    std::string message;
};

using ServerMessage = std::variant<
    RegisteredMessage,
    HeartbeatAckMessage,
    PingResponseMessage,
    GameHostedMessage,
    GameListMessage,
    JoinedGameMessage,
    JoinFailedMessage,
    PlayerJoinedMessage,
    PlayerDisconnectedMessage,
    RoomPlayersMessage,
    GameStartedMessage,
    RelayMessage,
    KickedMessage,
    ServerNoticeMessage,
    GameDataMessage,
    AuthFailedMessage,
    ServerErrorMessage>;

// Network statistics for monitoring connection quality
struct NetworkStats {
    uint32_t reliablePacketsSent;
    uint32_t reliablePacketsReceived;
    uint32_t datagramsSent;
    uint32_t datagramsReceived;
    uint32_t decodeErrors;
    float averageRTT;       // ms
    float jitter;           // ms, standard deviation of the RTT window
    float minRTT;
    float maxRTT;

    NetworkStats() { Reset(); }

    void Reset() {
        reliablePacketsSent = 0;
        reliablePacketsReceived = 0;
        datagramsSent = 0;
        datagramsReceived = 0;
        decodeErrors = 0;
        averageRTT = 0;
        jitter = 0;
        minRTT = 0;
        maxRTT = 0;
    }
};

// Monotonic millisecond clock used for ping round trips and activity tracking
inline int64_t GetCurrentTimestamp() {
    auto now = std::chrono::steady_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}
