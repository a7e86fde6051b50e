#include "client_config.h"
#include "network_errors.h"
#include "network_validation.h"
#include "utils.h"
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {
    template <typename T>
    void ReadKey(const json& root, const char* key, T& target) {
        auto it = root.find(key);
        if (it == root.end() || it->is_null()) {
            return;
        }
        try {
            target = it->get<T>();
        }
        catch (const json::type_error&) {
            throw ConfigError(std::string("Config key '") + key + "' has the wrong type");
        }
    }

    void ReadPort(const json& root, const char* key, unsigned short& target, bool allowZero) {
        auto it = root.find(key);
        if (it == root.end() || it->is_null()) {
            return;
        }
        if (!it->is_number_integer()) {
            throw ConfigError(std::string("Config key '") + key + "' must be an integer");
        }
        long value = it->get<long>();
        if (!(allowZero && value == 0) && !NetworkValidation::IsValidPort(value)) {
            throw ConfigError(std::string("Config key '") + key + "' is not a valid port: " + std::to_string(value));
        }
        target = static_cast<unsigned short>(value);
    }

    void RequirePositive(float value, const char* name) {
        if (!(value > 0.0f) || value == std::numeric_limits<float>::infinity()) {
            throw ConfigError(std::string(name) + " must be a positive number");
        }
    }
}

void Credentials::Validate() const {
    if (!NetworkValidation::IsValidHost(host)) {
        throw ConfigError("Invalid server host: '" + host + "'");
    }
    if (!NetworkValidation::IsValidPort(tcpPort)) {
        throw ConfigError("Invalid TCP port: " + std::to_string(tcpPort));
    }
    if (!NetworkValidation::IsValidPort(udpPort)) {
        throw ConfigError("Invalid UDP port: " + std::to_string(udpPort));
    }
    if (!NetworkValidation::IsValidPlayerName(playerName)) {
        throw ConfigError("Player name must be 1-" +
            std::to_string(NetworkValidation::MAX_PLAYER_NAME_LENGTH) + " printable characters");
    }
}

ClientConfig ClientConfig::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json root;
    try {
        root = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw ConfigError("Config file " + path + " is not valid JSON: " + e.what());
    }

    ClientConfig config = FromJson(root);
    Utils::printMsg("Loaded config from " + path);
    return config;
}

/**
 * Builds a config from a parsed JSON object. Unknown keys are ignored so
 * newer config files still load.
 * @param root Parsed JSON document.
 * @return Validated configuration.
 */
ClientConfig ClientConfig::FromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    ClientConfig config;
    ReadKey(root, "host", config.host);
    ReadPort(root, "tcp_port", config.tcpPort, false);
    ReadPort(root, "udp_port", config.udpPort, false);
    ReadPort(root, "local_udp_port", config.localUdpPort, true);

    ReadKey(root, "use_tls", config.useTls);
    ReadKey(root, "allow_self_signed", config.allowSelfSigned);
    ReadKey(root, "ca_file", config.caFile);
    ReadKey(root, "encrypt_udp", config.encryptUdp);
    ReadKey(root, "udp_shared_secret", config.udpSharedSecret);

    ReadKey(root, "player_name", config.playerName);
    ReadKey(root, "password", config.password);

    ReadKey(root, "connect_timeout", config.connectTimeout);
    ReadKey(root, "heartbeat_interval", config.heartbeatInterval);
    ReadKey(root, "heartbeat_timeout", config.heartbeatTimeout);
    ReadKey(root, "ping_interval", config.pingInterval);
    ReadKey(root, "latency_window", config.latencyWindow);

    ReadKey(root, "reconnect_base_delay", config.reconnectBaseDelay);
    ReadKey(root, "reconnect_multiplier", config.reconnectMultiplier);
    ReadKey(root, "reconnect_max_delay", config.reconnectMaxDelay);
    ReadKey(root, "max_reconnect_attempts", config.maxReconnectAttempts);
    ReadKey(root, "reconnect_attempt_timeout", config.reconnectAttemptTimeout);
    ReadKey(root, "auto_reconnect", config.autoReconnect);

    ReadKey(root, "room_list_throttle", config.roomListThrottle);
    ReadKey(root, "desync_threshold", config.desyncThreshold);
    ReadKey(root, "blend_rate", config.blendRate);
    ReadKey(root, "max_dispatch_per_tick", config.maxDispatchPerTick);
    ReadKey(root, "debug_logs", config.debugLogs);

    config.Validate();
    return config;
}

void ClientConfig::Validate() const {
    GetCredentials().Validate();

    if (encryptUdp && udpSharedSecret.empty()) {
        throw ConfigError("encrypt_udp requires udp_shared_secret");
    }
    if (allowSelfSigned && !useTls) {
        Utils::printMsg("allow_self_signed has no effect without use_tls", warning);
    }

    RequirePositive(connectTimeout, "connect_timeout");
    RequirePositive(heartbeatInterval, "heartbeat_interval");
    RequirePositive(heartbeatTimeout, "heartbeat_timeout");
    RequirePositive(pingInterval, "ping_interval");
    if (heartbeatTimeout <= heartbeatInterval) {
        throw ConfigError("heartbeat_timeout must be longer than heartbeat_interval");
    }
    if (latencyWindow == 0) {
        throw ConfigError("latency_window must be at least 1");
    }

    RequirePositive(reconnectBaseDelay, "reconnect_base_delay");
    RequirePositive(reconnectAttemptTimeout, "reconnect_attempt_timeout");
    if (!(reconnectMultiplier >= 1.0f)) {
        throw ConfigError("reconnect_multiplier must be at least 1");
    }
    if (!(reconnectMaxDelay >= reconnectBaseDelay)) {
        throw ConfigError("reconnect_max_delay must not be below reconnect_base_delay");
    }
    if (maxReconnectAttempts < 1) {
        throw ConfigError("max_reconnect_attempts must be at least 1");
    }

    RequirePositive(roomListThrottle, "room_list_throttle");
    RequirePositive(desyncThreshold, "desync_threshold");
    RequirePositive(blendRate, "blend_rate");
    if (maxDispatchPerTick == 0) {
        throw ConfigError("max_dispatch_per_tick must be at least 1");
    }
}

Credentials ClientConfig::GetCredentials() const {
    Credentials credentials;
    credentials.host = host;
    credentials.tcpPort = tcpPort;
    credentials.udpPort = udpPort;
    credentials.playerName = playerName;
    credentials.password = password;
    return credentials;
}
