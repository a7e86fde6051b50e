#include "room_registry.h"
#include "network_validation.h"
#include "utils.h"
#include <unordered_map>

const char* ListRequestResultToString(ListRequestResult result) {
    switch (result) {
    case ListRequestResult::Sent:         return "sent";
    case ListRequestResult::Throttled:    return "skipped, too soon";
    case ListRequestResult::NotConnected: return "not connected";
    case ListRequestResult::SendFailed:   return "send failed";
    }
    return "unknown";
}

RoomRegistry::RoomRegistry(SessionControl& session, NetworkEventBus& events, float listThrottle)
    : session(session), events(events), gameStarted(false),
    listThrottle(listThrottle), listTimer(listThrottle) {
    messageHandlerId = session.AddMessageHandler([this](const ServerMessage& message) {
        HandleMessage(message);
    });
    subscriptions.push_back(events.Subscribe<ConnectionLostEvent>([this](const ConnectionLostEvent&) {
        ResetAll();
    }));
    subscriptions.push_back(events.Subscribe<DisconnectedEvent>([this](const DisconnectedEvent&) {
        ResetAll();
    }));
}

RoomRegistry::~RoomRegistry() {
    session.RemoveMessageHandler(messageHandlerId);
    for (NetworkEventBus::SubscriptionId id : subscriptions) {
        events.Unsubscribe(id);
    }
}

void RoomRegistry::Update(float deltaTime) {
    listTimer += deltaTime;
}

ListRequestResult RoomRegistry::RequestList() {
    if (!session.IsConnected()) {
        return ListRequestResult::NotConnected;
    }
    if (listTimer < listThrottle) {
        Utils::printMsg("Room list refresh skipped, too soon (" + std::to_string(listTimer) + "s since last)", debug);
        return ListRequestResult::Throttled;
    }

    if (!session.SendReliable(ListGamesCommand{})) {
        return ListRequestResult::SendFailed;
    }
    listTimer = 0;
    return ListRequestResult::Sent;
}

bool RoomRegistry::HostRoom(const std::string& name, int maxPlayers) {
    if (!session.IsConnected()) {
        Utils::printMsg("Cannot host a room while disconnected", warning);
        return false;
    }
    if (IsInRoom()) {
        Utils::printMsg("Already in room " + GetCurrentRoomId() + ", leave it first", warning);
        return false;
    }
    if (!NetworkValidation::IsValidRoomName(name)) {
        Utils::printMsg("Room name must be 1-" + std::to_string(NetworkValidation::MAX_ROOM_NAME_LENGTH) +
            " printable characters", warning);
        return false;
    }
    if (!NetworkValidation::IsValidMaxPlayers(maxPlayers)) {
        Utils::printMsg("Max players must be between " + std::to_string(NetworkConstants::MIN_ROOM_PLAYERS) +
            " and " + std::to_string(NetworkConstants::MAX_ROOM_PLAYERS), warning);
        return false;
    }

    Utils::printMsg("Hosting room '" + name + "' for " + std::to_string(maxPlayers) + " players");
    return session.SendReliable(HostGameCommand{ name, maxPlayers });
}

bool RoomRegistry::JoinRoom(const std::string& roomId) {
    if (!session.IsConnected()) {
        Utils::printMsg("Cannot join a room while disconnected", warning);
        return false;
    }
    if (IsInRoom()) {
        Utils::printMsg("Already in room " + GetCurrentRoomId() + ", leave it first", warning);
        return false;
    }
    if (!NetworkValidation::IsValidId(roomId)) {
        Utils::printMsg("Invalid room id", warning);
        return false;
    }

    Utils::printMsg("Joining room " + roomId);
    return session.SendReliable(JoinGameCommand{ roomId });
}

/**
 * Leaves the current room. A host first tells the members the room is closed
 * (the relay deletes a room when its host leaves). Local room state is
 * cleared even if the notifications cannot be sent.
 * @return True when we were in a room.
 */
bool RoomRegistry::LeaveRoom() {
    if (!IsInRoom()) {
        return false;
    }

    std::string roomId = GetCurrentRoomId();
    if (session.IsConnected()) {
        if (session.GetSession().isHost) {
            session.SendReliable(RelayCommand{ roomId, "", NetworkConstants::ROOM_CLOSED_NOTICE });
        }
        if (session.IsConnected()) {
            session.SendReliable(LeaveRoomCommand{ roomId });
        }
    }

    Utils::printMsg("Left room " + roomId);
    LeaveLocally();
    return true;
}

bool RoomRegistry::StartGame() {
    if (!IsInRoom() || !session.IsConnected()) {
        return false;
    }
    if (!session.GetSession().isHost) {
        Utils::printMsg("Only the host can start the game", warning);
        return false;
    }
    return session.SendReliable(StartGameCommand{ GetCurrentRoomId() });
}

bool RoomRegistry::RefreshRoster() {
    if (!IsInRoom() || !session.IsConnected()) {
        return false;
    }
    return session.SendReliable(GetRoomPlayersCommand{ GetCurrentRoomId() });
}

void RoomRegistry::HandleMessage(const ServerMessage& message) {
    if (const auto* hosted = std::get_if<GameHostedMessage>(&message)) {
        HandleGameHosted(*hosted);
    }
    else if (const auto* joined = std::get_if<JoinedGameMessage>(&message)) {
        HandleJoinedGame(*joined);
    }
    else if (const auto* list = std::get_if<GameListMessage>(&message)) {
        HandleGameList(*list);
    }
    else if (const auto* failed = std::get_if<JoinFailedMessage>(&message)) {
        Utils::printMsg("Join failed: " + failed->reason, warning);
        events.Publish(JoinFailedEvent{ failed->reason });
    }
    else if (const auto* playerJoined = std::get_if<PlayerJoinedMessage>(&message)) {
        if (IsInRoom()) {
            AddToRoster(playerJoined->clientId);
        }
    }
    else if (const auto* playerLeft = std::get_if<PlayerDisconnectedMessage>(&message)) {
        if (roster.erase(playerLeft->playerId) > 0) {
            Utils::printMsg("Player left: " + playerLeft->playerId);
            events.Publish(PlayerLeftEvent{ playerLeft->playerId });
        }
    }
    else if (const auto* players = std::get_if<RoomPlayersMessage>(&message)) {
        if (IsInRoom()) {
            for (const std::string& playerId : players->players) {
                AddToRoster(playerId);
            }
            events.Publish(RosterUpdatedEvent{ roster.size() });
        }
    }
    else if (const auto* started = std::get_if<GameStartedMessage>(&message)) {
        if (!IsInRoom()) {
            Utils::printMsg("GAME_STARTED outside a room, ignored", debug);
            return;
        }
        gameStarted = true;
        for (const std::string& playerId : started->playerIds) {
            AddToRoster(playerId);
        }
        Utils::printMsg("Game started, spawn slot " + std::to_string(started->spawn.index), success);
        events.Publish(GameStartedEvent{ started->spawn, started->playerIds });
    }
    else if (const auto* relay = std::get_if<RelayMessage>(&message)) {
        HandleRelay(*relay);
    }
    else if (std::holds_alternative<KickedMessage>(message)) {
        LeaveLocally();
    }
}

void RoomRegistry::HandleGameHosted(const GameHostedMessage& message) {
    const std::string& localId = session.GetSession().clientId;

    session.SetRoom(message.roomId, true);
    hostId = localId;
    gameStarted = false;
    roster.clear();
    roster.insert(localId);

    Utils::printMsg("Hosting room " + message.roomId, success);
    events.Publish(RoomHostedEvent{ message.roomId });
}

/**
 * Join acknowledgement. The players listed here are not guaranteed to be the
 * full roster, so a GET_ROOM_PLAYERS follow-up is always sent.
 */
void RoomRegistry::HandleJoinedGame(const JoinedGameMessage& message) {
    const std::string& localId = session.GetSession().clientId;
    bool sameRoom = GetCurrentRoomId() == message.roomId;
    bool isHost = message.hostId == localId;

    session.SetRoom(message.roomId, isHost);
    hostId = message.hostId;
    gameStarted = message.gameStarted;
    if (!sameRoom) {
        roster.clear();
    }
    roster.insert(localId);
    for (const std::string& playerId : message.players) {
        roster.insert(playerId);
    }

    Utils::printMsg("Joined room " + message.roomId + (isHost ? " as host" : ", host " + message.hostId), success);
    if (!sameRoom) {
        events.Publish(RoomJoinedEvent{ message.roomId, message.hostId, isHost });
    }

    session.SendReliable(GetRoomPlayersCommand{ message.roomId });
}

void RoomRegistry::HandleGameList(const GameListMessage& message) {
    // Later entries for the same id win, keeping the position of the first
    std::vector<RoomInfo> unique;
    std::unordered_map<std::string, std::size_t> indexById;
    for (const RoomInfo& room : message.rooms) {
        auto found = indexById.find(room.roomId);
        if (found != indexById.end()) {
            unique[found->second] = room;
        }
        else {
            indexById.emplace(room.roomId, unique.size());
            unique.push_back(room);
        }
    }

    if (unique.size() != message.rooms.size()) {
        Utils::printMsg("Room list contained " + std::to_string(message.rooms.size() - unique.size()) +
            " duplicate entries", debug);
    }

    rooms = std::move(unique);
    events.Publish(RoomListUpdatedEvent{ rooms });
}

void RoomRegistry::HandleRelay(const RelayMessage& message) {
    if (message.message != NetworkConstants::ROOM_CLOSED_NOTICE || !IsInRoom()) {
        return;
    }
    if (message.from != hostId) {
        Utils::printMsg("Ignoring room-closed notice from non-host " + message.from, debug);
        return;
    }
    Utils::printMsg("Host closed the room", warning);
    LeaveLocally();
}

void RoomRegistry::AddToRoster(const std::string& playerId) {
    if (!NetworkValidation::IsValidId(playerId)) {
        return;
    }
    if (roster.insert(playerId).second) {
        Utils::printMsg("Player joined: " + playerId);
        events.Publish(PlayerJoinedEvent{ playerId });
    }
}

void RoomRegistry::LeaveLocally() {
    if (!IsInRoom()) {
        return;
    }
    std::string roomId = GetCurrentRoomId();
    session.ClearRoom();
    roster.clear();
    hostId.clear();
    gameStarted = false;
    events.Publish(RoomLeftEvent{ roomId });
}

void RoomRegistry::ResetAll() {
    roster.clear();
    rooms.clear();
    hostId.clear();
    gameStarted = false;
    listTimer = listThrottle;
}
