#include "session_manager.h"
#include "network_errors.h"
#include "network_validation.h"
#include "udp_encryption.h"
#include "utils.h"
#include <algorithm>
#include <memory>

SessionManager::SessionManager(const ClientConfig& config, MainThreadDispatcher& dispatcher,
    NetworkEventBus& events, LatencyMonitor& latency)
    : config(config), dispatcher(dispatcher), events(events), latency(latency),
    hasCredentials(false), generation(0),
    connectingTimer(0), heartbeatTimer(0), pingTimer(0), silenceTimer(0),
    reconnectActive(false), reconnectAwaitingResult(false), reconnectAttempt(0),
    reconnectDelay(config.reconnectBaseDelay), reconnectTimer(0), reconnectAttemptTimer(0),
    nextHandlerId(1) {
}

SessionManager::~SessionManager() {
    Disconnect();
    // Queued closures point at this object
    dispatcher.Clear();
}

void SessionManager::Connect(const Credentials& newCredentials) {
    newCredentials.Validate();

    if (session.connectionState != ConnectionState::Disconnected) {
        Utils::printMsg(std::string("Connect ignored, session is ") +
            ConnectionStateToString(session.connectionState), warning);
        return;
    }

    StartConnection(newCredentials);
}

/**
 * Shared by Connect and the reconnect driver: enters Connecting, opens both
 * channels and sends REGISTER. The Connected transition happens when
 * REGISTERED is drained from the dispatch queue.
 * @param newCredentials Already validated credentials, kept for reconnects.
 */
void SessionManager::StartConnection(const Credentials& newCredentials) {
    credentials = newCredentials;
    hasCredentials = true;

    ++generation;
    session = Session();
    session.connectionState = ConnectionState::Connecting;
    connectingTimer = 0;
    stats.Reset();

    Utils::printMsg("Connecting to relay " + credentials.host + ":" + std::to_string(credentials.tcpPort) +
        " (udp " + std::to_string(credentials.udpPort) + ") as " + credentials.playerName);

    try {
        OpenChannels();

        RegisterCommand registration;
        registration.name = credentials.playerName;
        registration.password = credentials.password;
        if (!reliable.Send(registration)) {
            throw TransportError("Failed to send REGISTER");
        }
        stats.reliablePacketsSent++;
    }
    catch (const std::exception& e) {
        Utils::printMsg("Connection failed: " + std::string(e.what()), error);
        FailConnection(e.what());
    }
}

void SessionManager::OpenChannels() {
    auto address = sf::IpAddress::resolve(credentials.host);
    if (!address) {
        throw TransportError("Failed to resolve server address: " + credentials.host);
    }

    TlsOptions tls;
    tls.enabled = config.useTls;
    tls.serverName = credentials.host;
    tls.allowSelfSigned = config.allowSelfSigned;
    tls.caFile = config.caFile;

    reliable.Open(*address, credentials.tcpPort, sf::seconds(config.connectTimeout), tls);
    unreliable.Open(*address, credentials.udpPort, config.localUdpPort);

    const uint64_t connection = generation;

    reliable.StartReceiving(
        [this, connection](ServerMessage message) {
            dispatcher.Enqueue([this, connection, message = std::move(message)]() {
                HandleMessage(connection, message, false);
            });
        },
        [this, connection](const DecodeError& e) {
            std::string what = std::string(DecodeErrorKindToString(e.GetKind())) + ": " + e.what();
            dispatcher.Enqueue([this, connection, what]() { HandleDecodeError(connection, what); });
        },
        [this, connection](const std::string& reason) {
            dispatcher.Enqueue([this, connection, reason]() { HandleChannelClosed(connection, reason); });
        });

    unreliable.StartReceiving(
        [this, connection](ServerMessage message) {
            dispatcher.Enqueue([this, connection, message = std::move(message)]() {
                HandleMessage(connection, message, true);
            });
        },
        [this, connection](const DecodeError& e) {
            std::string what = std::string("datagram ") + DecodeErrorKindToString(e.GetKind()) + ": " + e.what();
            dispatcher.Enqueue([this, connection, what]() { HandleDecodeError(connection, what); });
        },
        [this, connection](const std::string& reason) {
            dispatcher.Enqueue([this, connection, reason]() { HandleChannelClosed(connection, reason); });
        });
}

void SessionManager::TeardownChannels() {
    reliable.Close();
    unreliable.Close();
}

/**
 * Single failure path for connect errors, read errors, send errors and
 * heartbeat silence. Publishes ConnectionLostEvent when a live session
 * dropped, ConnectionFailedEvent otherwise.
 * @param reason Human readable cause, kept for ReconnectExhaustedEvent.
 */
void SessionManager::FailConnection(const std::string& reason) {
    bool wasConnected = session.connectionState == ConnectionState::Connected;

    TeardownChannels();
    ++generation;

    session = Session();
    session.connectionState = ConnectionState::Failed;
    lastFailureReason = reason;
    latency.Reset();

    if (wasConnected) {
        Utils::printMsg("Connection lost: " + reason, error);
        events.Publish(ConnectionLostEvent{ reason });
        if (config.autoReconnect && !reconnectActive) {
            BeginReconnect();
        }
    }
    else {
        events.Publish(ConnectionFailedEvent{ reason });
    }
}

void SessionManager::Disconnect() {
    if (session.connectionState == ConnectionState::Disconnected && !reconnectActive) {
        return;
    }

    Utils::printMsg("Disconnecting from relay...", warning);
    reconnectActive = false;
    reconnectAwaitingResult = false;

    // Best effort: the socket is torn down whatever happens here
    if (session.connectionState == ConnectionState::Connected && reliable.IsOpen()) {
        if (!reliable.Send(DisconnectCommand{})) {
            Utils::printMsg("DISCONNECT notification not delivered", debug);
        }
    }

    TeardownChannels();
    ++generation;
    session = Session();
    latency.Reset();

    events.Publish(DisconnectedEvent{});
    Utils::printMsg("Disconnected from relay", success);
}

bool SessionManager::BeginReconnect() {
    if (session.connectionState != ConnectionState::Failed) {
        Utils::printMsg(std::string("Reconnect is only valid after a failure (session is ") +
            ConnectionStateToString(session.connectionState) + ")", warning);
        return false;
    }
    if (reconnectActive) {
        Utils::printMsg("Reconnect already in progress", debug);
        return false;
    }
    if (!hasCredentials) {
        Utils::printMsg("Nothing to reconnect to", warning);
        return false;
    }

    reconnectActive = true;
    reconnectAwaitingResult = false;
    reconnectAttempt = 0;
    reconnectDelay = config.reconnectBaseDelay;
    reconnectTimer = 0;
    reconnectAttemptTimer = 0;

    Utils::printMsg("Reconnecting: up to " + std::to_string(config.maxReconnectAttempts) +
        " attempts, first in " + std::to_string(reconnectDelay) + "s", warning);
    return true;
}

void SessionManager::Update(float deltaTime) {
    switch (session.connectionState) {
    case ConnectionState::Connecting:
        connectingTimer += deltaTime;
        if (connectingTimer >= config.connectTimeout) {
            Utils::printMsg("Registration timed out", error);
            FailConnection("Registration timed out after " + std::to_string(config.connectTimeout) + "s");
        }
        break;
    case ConnectionState::Connected:
        UpdateConnected(deltaTime);
        break;
    default:
        break;
    }

    if (reconnectActive) {
        UpdateReconnect(deltaTime);
    }
}

void SessionManager::UpdateConnected(float deltaTime) {
    heartbeatTimer += deltaTime;
    pingTimer += deltaTime;
    silenceTimer += deltaTime;

    if (silenceTimer >= config.heartbeatTimeout) {
        FailConnection("No traffic from relay for " + std::to_string(config.heartbeatTimeout) + "s");
        return;
    }

    if (heartbeatTimer >= config.heartbeatInterval) {
        heartbeatTimer = 0;
        SendHeartbeat();
        if (!IsConnected()) {
            return;
        }
    }

    if (pingTimer >= config.pingInterval) {
        pingTimer = 0;
        SendPing();
    }
}

/**
 * Reconnect driver. Waits the current backoff delay, makes one attempt, then
 * waits up to reconnectAttemptTimeout for Connected. Delays grow by the
 * multiplier up to the cap. After maxReconnectAttempts the session stays
 * Failed and ReconnectExhaustedEvent is published once.
 */
void SessionManager::UpdateReconnect(float deltaTime) {
    if (reconnectAwaitingResult) {
        reconnectAttemptTimer += deltaTime;
        if (session.connectionState != ConnectionState::Failed &&
            reconnectAttemptTimer < config.reconnectAttemptTimeout) {
            return;
        }

        if (session.connectionState == ConnectionState::Connecting) {
            FailConnection("Reconnect attempt " + std::to_string(reconnectAttempt) + " timed out");
        }
        reconnectAwaitingResult = false;

        if (reconnectAttempt >= config.maxReconnectAttempts) {
            reconnectActive = false;
            Utils::printMsg("Giving up after " + std::to_string(reconnectAttempt) +
                " reconnect attempts: " + lastFailureReason, error);
            events.Publish(ReconnectExhaustedEvent{ reconnectAttempt, lastFailureReason });
            return;
        }

        reconnectDelay = std::min(reconnectDelay * config.reconnectMultiplier, config.reconnectMaxDelay);
        reconnectTimer = 0;
        return;
    }

    reconnectTimer += deltaTime;
    if (reconnectTimer < reconnectDelay) {
        return;
    }

    ++reconnectAttempt;
    reconnectAwaitingResult = true;
    reconnectAttemptTimer = 0;

    Utils::printMsg("Reconnect attempt " + std::to_string(reconnectAttempt) + " of " +
        std::to_string(config.maxReconnectAttempts) + " (after " + std::to_string(reconnectDelay) + "s)", warning);
    events.Publish(ReconnectAttemptEvent{ reconnectAttempt, config.maxReconnectAttempts, reconnectDelay });

    StartConnection(credentials);
}

void SessionManager::HandleMessage(uint64_t connection, const ServerMessage& message, bool datagram) {
    if (connection != generation) {
        Utils::printMsg(std::string("Dropping stale ") + WireCodec::MessageName(message) + " from a previous connection", debug);
        return;
    }

    session.lastActivityTime = GetCurrentTimestamp();
    silenceTimer = 0;
    if (datagram) {
        stats.datagramsReceived++;
    }
    else {
        stats.reliablePacketsReceived++;
    }

    if (const auto* registered = std::get_if<RegisteredMessage>(&message)) {
        HandleRegistered(*registered);
    }
    else if (const auto* pong = std::get_if<PingResponseMessage>(&message)) {
        float rtt = latency.RecordPong(pong->timestamp, GetCurrentTimestamp());
        events.Publish(LatencyUpdatedEvent{ rtt, latency.GetAverage(), latency.GetJitter() });
    }
    else if (std::holds_alternative<HeartbeatAckMessage>(message)) {
        Utils::printMsg("Heartbeat acknowledged", debug);
    }
    else if (const auto* relay = std::get_if<RelayMessage>(&message)) {
        events.Publish(RelayReceivedEvent{ relay->from, relay->message });
    }
    else if (const auto* kicked = std::get_if<KickedMessage>(&message)) {
        Utils::printMsg("Kicked by relay: " + kicked->message, warning);
        events.Publish(KickedEvent{ kicked->message });
    }
    else if (const auto* notice = std::get_if<ServerNoticeMessage>(&message)) {
        Utils::printMsg("Server: " + notice->message);
        events.Publish(ServerNoticeEvent{ notice->message });
    }
    else if (const auto* serverError = std::get_if<ServerErrorMessage>(&message)) {
        Utils::printMsg("Relay error: " + serverError->message, warning);
        events.Publish(ServerErrorEvent{ serverError->message });
    }
    else if (const auto* authFailed = std::get_if<AuthFailedMessage>(&message)) {
        Utils::printMsg("Authentication rejected: " + authFailed->message, error);
        events.Publish(AuthFailedEvent{ authFailed->message });
    }

    // A handler may fail the connection; stop fanning out once it has
    std::vector<std::pair<HandlerId, MessageHandler>> handlers = messageHandlers;
    for (const auto& entry : handlers) {
        if (connection != generation) {
            break;
        }
        entry.second(message);
    }
}

void SessionManager::HandleRegistered(const RegisteredMessage& message) {
    if (session.connectionState == ConnectionState::Connected) {
        // The relay pushes REGISTERED on accept and again in reply to REGISTER
        if (message.clientId != session.clientId) {
            Utils::printMsg("Relay re-registered us as " + message.clientId + ", keeping " + session.clientId, warning);
        }
        return;
    }
    if (session.connectionState != ConnectionState::Connecting) {
        return;
    }

    if (message.protocolVersion && *message.protocolVersion != NetworkConstants::PROTOCOL_VERSION) {
        FailConnection("Protocol version mismatch: relay speaks " + std::to_string(*message.protocolVersion) +
            ", client speaks " + std::to_string(NetworkConstants::PROTOCOL_VERSION));
        return;
    }
    if (!NetworkValidation::IsValidId(message.clientId)) {
        FailConnection("Relay assigned an invalid client id");
        return;
    }

    if (config.encryptUdp) {
        try {
            unreliable.SetEncryption(std::make_shared<UdpEncryption>(message.clientId, config.udpSharedSecret));
        }
        catch (const std::runtime_error& e) {
            FailConnection(e.what());
            return;
        }
    }

    session.clientId = message.clientId;
    session.connectionState = ConnectionState::Connected;
    heartbeatTimer = 0;
    pingTimer = 0;
    silenceTimer = 0;
    latency.Reset();

    Utils::printMsg("Registered with relay as " + session.clientId, success);
    if (reconnectActive) {
        Utils::printMsg("Reconnected after " + std::to_string(reconnectAttempt) + " attempt(s)", success);
        reconnectActive = false;
        reconnectAwaitingResult = false;
    }

    SendReliable(PlayerInfoCommand{ credentials.playerName });
    if (!IsConnected()) {
        return;
    }
    // Let the relay learn our datagram endpoint straight away
    SendUnreliable(HeartbeatCommand{ session.clientId });
    SendPing();
    if (!IsConnected()) {
        return;
    }

    events.Publish(ConnectedEvent{ session.clientId });
}

void SessionManager::HandleDecodeError(uint64_t connection, const std::string& what) {
    if (connection != generation) {
        return;
    }
    stats.decodeErrors++;
    Utils::printMsg("Protocol error, message skipped (" + what + ")", warning);
}

void SessionManager::HandleChannelClosed(uint64_t connection, const std::string& reason) {
    if (connection != generation) {
        Utils::printMsg("Ignoring close of a previous connection: " + reason, debug);
        return;
    }
    if (session.connectionState != ConnectionState::Connected &&
        session.connectionState != ConnectionState::Connecting) {
        return;
    }
    FailConnection(reason);
}

bool SessionManager::SendReliable(const ClientCommand& command) {
    if (!reliable.IsOpen()) {
        Utils::printMsg(std::string("Not connected, ") + WireCodec::CommandName(command) + " not sent", debug);
        return false;
    }

    if (!reliable.Send(command)) {
        FailConnection(std::string("Failed to send ") + WireCodec::CommandName(command));
        return false;
    }
    stats.reliablePacketsSent++;
    return true;
}

bool SessionManager::SendUnreliable(const ClientCommand& command) {
    if (!unreliable.IsOpen()) {
        return false;
    }
    // Datagrams are fire-and-forget: a local drop is not a connection failure
    if (!unreliable.Send(command)) {
        return false;
    }
    stats.datagramsSent++;
    return true;
}

bool SessionManager::SendPlayerState(const PlayerState& state) {
    if (!IsConnected() || !session.roomId) {
        return false;
    }
    GameDataCommand command;
    command.clientId = session.clientId;
    command.roomId = *session.roomId;
    command.data = state;
    return SendUnreliable(command);
}

bool SessionManager::SendPlayerInput(const PlayerInput& input) {
    if (!IsConnected() || !session.roomId) {
        return false;
    }
    GameDataCommand command;
    command.clientId = session.clientId;
    command.roomId = *session.roomId;
    command.data = input;
    return SendUnreliable(command);
}

bool SessionManager::SendRelay(const std::string& message, const std::string& targetId) {
    if (!IsConnected()) {
        return false;
    }
    if (message.empty() || message.size() > NetworkValidation::MAX_RELAY_MESSAGE_LENGTH) {
        Utils::printMsg("Relay message must be 1-" +
            std::to_string(NetworkValidation::MAX_RELAY_MESSAGE_LENGTH) + " bytes", warning);
        return false;
    }

    RelayCommand command;
    command.message = message;
    if (!targetId.empty()) {
        command.targetId = targetId;
    }
    else if (session.roomId) {
        command.roomId = *session.roomId;
    }
    else {
        Utils::printMsg("Relay needs a room or a target player", warning);
        return false;
    }
    return SendReliable(command);
}

bool SessionManager::SendPing() {
    if (!IsConnected()) {
        return false;
    }
    return SendReliable(PingCommand{ GetCurrentTimestamp() });
}

void SessionManager::SendHeartbeat() {
    if (!SendReliable(HeartbeatCommand{})) {
        return;
    }
    // Keeps the NAT mapping for the datagram channel open
    SendUnreliable(HeartbeatCommand{ session.clientId });
}

NetworkStats SessionManager::GetStats() const {
    NetworkStats snapshot = stats;
    snapshot.averageRTT = latency.GetAverage();
    snapshot.jitter = latency.GetJitter();
    snapshot.minRTT = latency.GetMin();
    snapshot.maxRTT = latency.GetMax();
    return snapshot;
}

void SessionManager::SetRoom(const std::string& roomId, bool isHost) {
    session.roomId = roomId;
    session.isHost = isHost;
}

void SessionManager::ClearRoom() {
    session.roomId.reset();
    session.isHost = false;
}

SessionControl::HandlerId SessionManager::AddMessageHandler(MessageHandler handler) {
    HandlerId id = nextHandlerId++;
    messageHandlers.emplace_back(id, std::move(handler));
    return id;
}

void SessionManager::RemoveMessageHandler(HandlerId id) {
    messageHandlers.erase(std::remove_if(messageHandlers.begin(), messageHandlers.end(),
        [id](const auto& entry) { return entry.first == id; }), messageHandlers.end());
}
