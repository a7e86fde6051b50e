#include "state_synchronizer.h"
#include "net_math.h"
#include "network_validation.h"
#include "utils.h"
#include <algorithm>

const char* ApplyResultToString(ApplyResult result) {
    switch (result) {
    case ApplyResult::IgnoredLocal:  return "ignored (local)";
    case ApplyResult::NotInRoom:     return "ignored (not in room)";
    case ApplyResult::Departed:      return "ignored (player left)";
    case ApplyResult::Rejected:      return "rejected";
    case ApplyResult::FirstContact:  return "first contact";
    case ApplyResult::Stale:         return "stale";
    case ApplyResult::Snapped:       return "snapped";
    case ApplyResult::Interpolating: return "interpolating";
    }
    return "unknown";
}

StateSynchronizer::StateSynchronizer(SessionControl& session, NetworkEventBus& events,
    float desyncThreshold, float blendRate)
    : session(session), events(events), desyncThreshold(desyncThreshold), blendRate(blendRate),
    staleCount(0), snapCount(0) {
    messageHandlerId = session.AddMessageHandler([this](const ServerMessage& message) {
        HandleMessage(message);
    });
    subscriptions.push_back(events.Subscribe<RoomLeftEvent>([this](const RoomLeftEvent&) { Clear(); }));
    subscriptions.push_back(events.Subscribe<ConnectionLostEvent>([this](const ConnectionLostEvent&) { Clear(); }));
    subscriptions.push_back(events.Subscribe<DisconnectedEvent>([this](const DisconnectedEvent&) { Clear(); }));
}

StateSynchronizer::~StateSynchronizer() {
    session.RemoveMessageHandler(messageHandlerId);
    for (NetworkEventBus::SubscriptionId id : subscriptions) {
        events.Unsubscribe(id);
    }
}

/**
 * Applies one inbound state for a remote player.
 * First contact teleports and creates the record. A timestamp older than the
 * last applied one is discarded (equal timestamps are accepted). Otherwise the
 * drift from the current target decides between snapping and blending.
 * @param state Decoded state; playerId identifies the sender.
 * @return What was done with the state.
 */
ApplyResult StateSynchronizer::ApplyState(const PlayerState& state) {
    const Session& local = session.GetSession();
    if (state.playerId == local.clientId) {
        return ApplyResult::IgnoredLocal;
    }
    if (!local.roomId) {
        Utils::printMsg("State for " + state.playerId + " arrived outside a room, dropped", debug);
        return ApplyResult::NotInRoom;
    }
    if (!NetworkValidation::IsValidId(state.playerId) ||
        !NetworkValidation::IsValidPosition(state.position) ||
        !NetworkValidation::IsValidRotation(state.rotation) ||
        !NetworkValidation::IsFinite(state.velocity) ||
        !NetworkValidation::IsFinite(state.angularVelocity) ||
        !NetworkValidation::IsValidTimestamp(state.timestamp)) {
        Utils::printMsg("Rejected invalid state for " + state.playerId, warning);
        return ApplyResult::Rejected;
    }

    auto it = records.find(state.playerId);
    if (it == records.end()) {
        if (departed.count(state.playerId) > 0) {
            Utils::printMsg("Late state for departed player " + state.playerId + ", dropped", debug);
            return ApplyResult::Departed;
        }
        RemotePlayerRecord& record = records[state.playerId];
        SnapTo(record, state);
        Utils::printMsg("First state for " + state.playerId, debug);
        events.Publish(RemotePlayerSpawnedEvent{ state.playerId, record.current });
        return ApplyResult::FirstContact;
    }

    RemotePlayerRecord& record = it->second;
    if (state.timestamp < record.lastAppliedTimestamp) {
        ++staleCount;
        return ApplyResult::Stale;
    }

    float drift = NetMath::Distance(record.target.position, state.position);
    if (drift > desyncThreshold) {
        SnapTo(record, state);
        ++record.snapCount;
        ++snapCount;
        Utils::printMsg("SNAP correction for " + state.playerId + ": drift " + std::to_string(drift) + "m", debug);
        return ApplyResult::Snapped;
    }

    record.target = state;
    record.target.rotation = NetMath::Normalize(state.rotation);
    record.lastAppliedTimestamp = state.timestamp;
    return ApplyResult::Interpolating;
}

void StateSynchronizer::SnapTo(RemotePlayerRecord& record, const PlayerState& state) {
    record.target = state;
    record.target.rotation = NetMath::Normalize(state.rotation);
    record.current = record.target;
    record.lastAppliedTimestamp = state.timestamp;
}

bool StateSynchronizer::ApplyInput(const PlayerInput& input) {
    if (input.playerId.empty() || input.playerId == session.GetSession().clientId) {
        return false;
    }
    auto it = records.find(input.playerId);
    if (it == records.end()) {
        // Input without a state has nothing to predict from yet
        return false;
    }

    PlayerInput clamped = input;
    clamped.steering = NetworkValidation::ClampSteering(input.steering);
    clamped.throttle = NetworkValidation::ClampPedal(input.throttle);
    clamped.brake = NetworkValidation::ClampPedal(input.brake);

    it->second.input = clamped;
    it->second.hasInput = true;
    return true;
}

void StateSynchronizer::Update(float deltaTime) {
    if (deltaTime <= 0.0f) {
        return;
    }
    float t = std::min(1.0f, blendRate * deltaTime);

    for (auto& [playerId, record] : records) {
        PlayerState& current = record.current;
        const PlayerState& target = record.target;

        current.position = NetMath::Lerp(current.position, target.position, t);
        current.velocity = NetMath::Lerp(current.velocity, target.velocity, t);
        current.angularVelocity = NetMath::Lerp(current.angularVelocity, target.angularVelocity, t);
        current.rotation = NetMath::Slerp(current.rotation, target.rotation, t);

        if (NetMath::Distance(current.position, target.position) < NetworkConstants::SETTLE_DISTANCE) {
            current.position = target.position;
        }
        current.timestamp = target.timestamp;
    }
}

bool StateSynchronizer::GetRemoteState(const std::string& playerId, PlayerState& outState) const {
    auto it = records.find(playerId);
    if (it == records.end()) {
        return false;
    }
    outState = it->second.current;
    return true;
}

bool StateSynchronizer::GetTargetState(const std::string& playerId, PlayerState& outState) const {
    auto it = records.find(playerId);
    if (it == records.end()) {
        return false;
    }
    outState = it->second.target;
    return true;
}

bool StateSynchronizer::GetRemoteInput(const std::string& playerId, PlayerInput& outInput) const {
    auto it = records.find(playerId);
    if (it == records.end() || !it->second.hasInput) {
        return false;
    }
    outInput = it->second.input;
    return true;
}

void StateSynchronizer::RemovePlayer(const std::string& playerId) {
    if (records.erase(playerId) > 0) {
        Utils::printMsg("Removed sync record for " + playerId, debug);
        events.Publish(RemotePlayerRemovedEvent{ playerId });
    }
}

void StateSynchronizer::Clear() {
    records.clear();
    departed.clear();
}

std::vector<std::string> StateSynchronizer::GetPlayerIds() const {
    std::vector<std::string> ids;
    ids.reserve(records.size());
    for (const auto& entry : records) {
        ids.push_back(entry.first);
    }
    return ids;
}

void StateSynchronizer::HandleMessage(const ServerMessage& message) {
    if (const auto* gameData = std::get_if<GameDataMessage>(&message)) {
        if (const auto* state = std::get_if<PlayerState>(&gameData->data)) {
            ApplyState(*state);
        }
        else if (const auto* input = std::get_if<PlayerInput>(&gameData->data)) {
            ApplyInput(*input);
        }
    }
    else if (const auto* left = std::get_if<PlayerDisconnectedMessage>(&message)) {
        departed.insert(left->playerId);
        RemovePlayer(left->playerId);
    }
    else if (const auto* joined = std::get_if<PlayerJoinedMessage>(&message)) {
        departed.erase(joined->clientId);
    }
    else if (const auto* players = std::get_if<RoomPlayersMessage>(&message)) {
        for (const std::string& playerId : players->players) {
            departed.erase(playerId);
        }
    }
}
