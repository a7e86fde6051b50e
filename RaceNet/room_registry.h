#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "network_constants.h"
#include "network_events.h"
#include "network_messages.h"
#include "session_control.h"

enum class ListRequestResult {
    Sent,
    Throttled,      // Inside the minimum interval, nothing sent
    NotConnected,
    SendFailed
};

const char* ListRequestResultToString(ListRequestResult result);

// Client-side view of the relay's rooms: the discoverable room list and the
// roster of the room we are in. Consumer thread only.
class RoomRegistry {
public:
    RoomRegistry(SessionControl& session, NetworkEventBus& events,
        float listThrottle = NetworkConstants::ROOM_LIST_THROTTLE);
    ~RoomRegistry();

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    ListRequestResult RequestList();
    bool HostRoom(const std::string& name, int maxPlayers = NetworkConstants::DEFAULT_ROOM_PLAYERS);
    bool JoinRoom(const std::string& roomId);
    bool LeaveRoom();
    bool StartGame();       // Host only
    bool RefreshRoster();

    // Advances the list throttle
    void Update(float deltaTime);

    void HandleMessage(const ServerMessage& message);

    const std::vector<RoomInfo>& GetRooms() const { return rooms; }
    const std::unordered_set<std::string>& GetRoster() const { return roster; }
    bool IsInRoom() const { return session.GetSession().roomId.has_value(); }
    bool IsHost() const { return IsInRoom() && session.GetSession().isHost; }
    bool IsGameStarted() const { return gameStarted; }
    std::string GetCurrentRoomId() const { return session.GetSession().roomId.value_or(""); }

private:
    void HandleGameHosted(const GameHostedMessage& message);
    void HandleJoinedGame(const JoinedGameMessage& message);
    void HandleGameList(const GameListMessage& message);
    void HandleRelay(const RelayMessage& message);
    void AddToRoster(const std::string& playerId);
    void LeaveLocally();
    void ResetAll();

    SessionControl& session;
    NetworkEventBus& events;

    std::vector<RoomInfo> rooms;
    std::unordered_set<std::string> roster;
    std::string hostId;
    bool gameStarted;

    float listThrottle;
    float listTimer;    // Seconds since the last LIST_GAMES

    SessionControl::HandlerId messageHandlerId;
    std::vector<NetworkEventBus::SubscriptionId> subscriptions;
};
