#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "client_config.h"
#include "dispatch_queue.h"
#include "latency_monitor.h"
#include "network_events.h"
#include "reliable_channel.h"
#include "session_control.h"
#include "unreliable_channel.h"

// Owns both channels and the Session.
// State machine: Disconnected -> Connecting -> Connected -> {Disconnected | Failed},
// Failed -> Connecting only through BeginReconnect.
// Every method runs on the consumer thread; receive threads only enqueue closures.
class SessionManager : public SessionControl {
public:
    SessionManager(const ClientConfig& config, MainThreadDispatcher& dispatcher,
        NetworkEventBus& events, LatencyMonitor& latency);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Throws ConfigError for invalid credentials before any socket or thread exists.
    // Transport failures move to Failed and publish ConnectionFailedEvent.
    // Ignored unless Disconnected.
    void Connect(const Credentials& credentials);

    // Best-effort DISCONNECT, closes channels, clears the session. No-op when Disconnected.
    void Disconnect();

    // Starts bounded reconnection with backoff, driven by Update. Only valid from Failed.
    bool BeginReconnect();

    // Heartbeat, ping, silence, registration and reconnect timers
    void Update(float deltaTime);

    bool SendReliable(const ClientCommand& command) override;
    bool SendUnreliable(const ClientCommand& command) override;

    // GAME_DATA for the current room; false when not in a room
    bool SendPlayerState(const PlayerState& state);
    bool SendPlayerInput(const PlayerInput& input);

    // Relay text to the whole room, or to a single player when targetId is set
    bool SendRelay(const std::string& message, const std::string& targetId = "");

    bool SendPing();

    const Session& GetSession() const override { return session; }
    ConnectionState GetState() const { return session.connectionState; }
    bool IsConnected() const override { return session.connectionState == ConnectionState::Connected; }
    bool IsReconnecting() const { return reconnectActive; }
    int GetReconnectAttempt() const { return reconnectAttempt; }
    const std::string& GetLastFailureReason() const { return lastFailureReason; }
    bool IsEncrypted() const { return reliable.IsEncrypted(); }

    NetworkStats GetStats() const;

    void SetRoom(const std::string& roomId, bool isHost) override;
    void ClearRoom() override;

    HandlerId AddMessageHandler(MessageHandler handler) override;
    void RemoveMessageHandler(HandlerId id) override;

private:
    void StartConnection(const Credentials& credentials);
    void OpenChannels();
    void TeardownChannels();
    void FailConnection(const std::string& reason);

    void HandleMessage(uint64_t generation, const ServerMessage& message, bool datagram);
    void HandleRegistered(const RegisteredMessage& message);
    void HandleDecodeError(uint64_t generation, const std::string& what);
    void HandleChannelClosed(uint64_t generation, const std::string& reason);

    void SendHeartbeat();
    void UpdateConnected(float deltaTime);
    void UpdateReconnect(float deltaTime);

    ClientConfig config;
    MainThreadDispatcher& dispatcher;
    NetworkEventBus& events;
    LatencyMonitor& latency;

    ReliableChannel reliable;
    UnreliableChannel unreliable;

    Session session;
    Credentials credentials;
    bool hasCredentials;
    std::string lastFailureReason;

    // Bumped on every connect and teardown; closures from older connections are ignored
    uint64_t generation;

    float connectingTimer;
    float heartbeatTimer;
    float pingTimer;
    float silenceTimer;

    bool reconnectActive;
    bool reconnectAwaitingResult;
    int reconnectAttempt;
    float reconnectDelay;
    float reconnectTimer;
    float reconnectAttemptTimer;

    NetworkStats stats;

    std::vector<std::pair<HandlerId, MessageHandler>> messageHandlers;
    HandlerId nextHandlerId;
};
