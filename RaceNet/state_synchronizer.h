#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "network_constants.h"
#include "network_events.h"
#include "network_messages.h"
#include "session_control.h"

enum class ApplyResult {
    IgnoredLocal,   // Our own state echoed back
    NotInRoom,      // Arrived outside an active room
    Departed,       // Sender already left the room (late datagram)
    Rejected,       // Non-finite or out-of-world values
    FirstContact,   // New record, applied directly
    Stale,          // Older than the last applied timestamp, discarded
    Snapped,        // Drift above the desync threshold, teleported
    Interpolating   // New blend target
};

const char* ApplyResultToString(ApplyResult result);

// Synchronization record for one remote player
struct RemotePlayerRecord {
    PlayerState current;            // Blended state handed to the simulation
    PlayerState target;             // Latest accepted authoritative state
    float lastAppliedTimestamp;
    PlayerInput input;              // Latest input, for short-horizon prediction
    bool hasInput;
    uint32_t snapCount;

    RemotePlayerRecord() : lastAppliedTimestamp(0.0f), hasInput(false), snapCount(0) {}
};

// Turns inbound PlayerState/PlayerInput into temporally consistent values for
// remote players. Records live as long as the player is in our room.
class StateSynchronizer {
public:
    StateSynchronizer(SessionControl& session, NetworkEventBus& events,
        float desyncThreshold = NetworkConstants::DESYNC_THRESHOLD,
        float blendRate = NetworkConstants::BLEND_RATE);
    ~StateSynchronizer();

    StateSynchronizer(const StateSynchronizer&) = delete;
    StateSynchronizer& operator=(const StateSynchronizer&) = delete;

    ApplyResult ApplyState(const PlayerState& state);

    // No staleness check; only routed to remote players. Returns false for local or unknown ids.
    bool ApplyInput(const PlayerInput& input);

    // Blends every record's current state toward its target
    void Update(float deltaTime);

    bool GetRemoteState(const std::string& playerId, PlayerState& outState) const;
    bool GetTargetState(const std::string& playerId, PlayerState& outState) const;
    bool GetRemoteInput(const std::string& playerId, PlayerInput& outInput) const;
    bool HasPlayer(const std::string& playerId) const { return records.count(playerId) > 0; }

    void RemovePlayer(const std::string& playerId);
    void Clear();

    std::size_t GetPlayerCount() const { return records.size(); }
    std::vector<std::string> GetPlayerIds() const;
    uint32_t GetStaleCount() const { return staleCount; }
    uint32_t GetSnapCount() const { return snapCount; }

    float GetDesyncThreshold() const { return desyncThreshold; }

private:
    void HandleMessage(const ServerMessage& message);
    void SnapTo(RemotePlayerRecord& record, const PlayerState& state);

    SessionControl& session;
    NetworkEventBus& events;
    float desyncThreshold;
    float blendRate;

    std::unordered_map<std::string, RemotePlayerRecord> records;
    std::unordered_set<std::string> departed;   // Left the room; no first contact until they rejoin
    uint32_t staleCount;
    uint32_t snapCount;

    SessionControl::HandlerId messageHandlerId;
    std::vector<NetworkEventBus::SubscriptionId> subscriptions;
};
