#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "network_constants.h"

// What the relay needs to admit this client
struct Credentials {
    std::string host;
    unsigned short tcpPort = NetworkConstants::DEFAULT_TCP_PORT;
    unsigned short udpPort = NetworkConstants::DEFAULT_UDP_PORT;
    std::string playerName;
    std::string password;

    // Throws ConfigError naming the first invalid field
    void Validate() const;
};

// Client settings, loadable from a JSON file. Missing keys keep their defaults.
struct ClientConfig {
    // Relay endpoint
    std::string host = "127.0.0.1";
    unsigned short tcpPort = NetworkConstants::DEFAULT_TCP_PORT;
    unsigned short udpPort = NetworkConstants::DEFAULT_UDP_PORT;
    unsigned short localUdpPort = 0;    // 0 = ephemeral

    // Security
    bool useTls = false;
    bool allowSelfSigned = false;       // Development only
    std::string caFile;
    bool encryptUdp = false;
    std::string udpSharedSecret;

    // Identity
    std::string playerName = "Player";
    std::string password;

    // Session timing
    float connectTimeout = NetworkConstants::CONNECT_TIMEOUT;
    float heartbeatInterval = NetworkConstants::HEARTBEAT_INTERVAL;
    float heartbeatTimeout = NetworkConstants::HEARTBEAT_TIMEOUT;
    float pingInterval = NetworkConstants::PING_INTERVAL;
    std::size_t latencyWindow = NetworkConstants::LATENCY_WINDOW_SIZE;

    // Reconnect
    float reconnectBaseDelay = NetworkConstants::RECONNECT_BASE_DELAY;
    float reconnectMultiplier = NetworkConstants::RECONNECT_BACKOFF_MULTIPLIER;
    float reconnectMaxDelay = NetworkConstants::RECONNECT_MAX_DELAY;
    int maxReconnectAttempts = NetworkConstants::MAX_RECONNECT_ATTEMPTS;
    float reconnectAttemptTimeout = NetworkConstants::RECONNECT_ATTEMPT_TIMEOUT;
    bool autoReconnect = true;

    // Rooms and state
    float roomListThrottle = NetworkConstants::ROOM_LIST_THROTTLE;
    float desyncThreshold = NetworkConstants::DESYNC_THRESHOLD;
    float blendRate = NetworkConstants::BLEND_RATE;
    std::size_t maxDispatchPerTick = NetworkConstants::MAX_DISPATCH_PER_TICK;

    bool debugLogs = false;

    // Throws ConfigError on unreadable files, bad JSON, wrong types or invalid values
    static ClientConfig LoadFromFile(const std::string& path);
    static ClientConfig FromJson(const nlohmann::json& root);

    void Validate() const;

    Credentials GetCredentials() const;
};
