#include "wire_codec.h"
#include "network_validation.h"
#include "utils.h"
#include <cmath>
#include <iterator>
#include <limits>

using nlohmann::json;

DecodeError::DecodeError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind(kind) {
}

const char* DecodeErrorKindToString(DecodeError::Kind kind) {
    switch (kind) {
    case DecodeError::Kind::Malformed:    return "malformed";
    case DecodeError::Kind::MissingField: return "missing field";
    case DecodeError::Kind::InvalidValue: return "invalid value";
    case DecodeError::Kind::UnknownType:  return "unknown type";
    }
    return "unknown";
}

namespace {
    const char* const COMMAND_NAMES[] = {
        "REGISTER", "HEARTBEAT", "PING", "HOST_GAME", "JOIN_GAME", "LIST_GAMES",
        "LEAVE_ROOM", "GET_ROOM_PLAYERS", "RELAY_MESSAGE", "GAME_DATA", "DISCONNECT",
        "START_GAME", "PLAYER_INFO"
    };
    static_assert(std::size(COMMAND_NAMES) == std::variant_size_v<ClientCommand>,
        "every command needs a wire name");

    const char* const MESSAGE_NAMES[] = {
        "REGISTERED", "HEARTBEAT_ACK", "PING_RESPONSE", "GAME_HOSTED", "GAME_LIST",
        "JOINED_GAME", "JOIN_FAILED", "PLAYER_JOINED", "PLAYER_DISCONNECTED", "ROOM_PLAYERS",
        "GAME_STARTED", "RELAY", "KICKED", "SERVER_MESSAGE", "GAME_DATA", "AUTH_FAILED", "ERROR"
    };
    static_assert(std::size(MESSAGE_NAMES) == std::variant_size_v<ServerMessage>,
        "every message needs a wire name");

    // -- Reading helpers ------------------------------------------------------

    json ParseObject(const std::string& text) {
        json root;
        try {
            root = json::parse(text);
        }
        catch (const json::parse_error& e) {
            throw DecodeError(DecodeError::Kind::Malformed, std::string("invalid JSON: ") + e.what());
        }
        if (!root.is_object()) {
            throw DecodeError(DecodeError::Kind::Malformed, "payload is not a JSON object");
        }
        return root;
    }

    const json& Require(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            throw DecodeError(DecodeError::Kind::MissingField, std::string("missing field '") + key + "'");
        }
        return *it;
    }

    DecodeError WrongType(const char* key, const char* expected) {
        return DecodeError(DecodeError::Kind::InvalidValue,
            std::string("field '") + key + "' must be " + expected);
    }

    std::string RequireString(const json& object, const char* key) {
        const json& value = Require(object, key);
        if (!value.is_string()) throw WrongType(key, "a string");
        return value.get<std::string>();
    }

    std::string OptionalString(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) return std::string();
        if (!it->is_string()) throw WrongType(key, "a string");
        return it->get<std::string>();
    }

    int64_t ToInteger(const json& value, const char* key) {
        if (value.is_number_integer()) {
            return value.get<int64_t>();
        }
        if (value.is_number_float()) {
            double number = value.get<double>();
            if (std::isfinite(number) && number == std::floor(number) &&
                std::abs(number) < 9.0e15) {
                return static_cast<int64_t>(number);
            }
        }
        throw WrongType(key, "an integer");
    }

    int64_t RequireInt64(const json& object, const char* key) {
        return ToInteger(Require(object, key), key);
    }

    int RequireInt(const json& object, const char* key) {
        int64_t value = RequireInt64(object, key);
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw WrongType(key, "a 32-bit integer");
        }
        return static_cast<int>(value);
    }

    std::optional<int> OptionalInt(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) return std::nullopt;
        return RequireInt(object, key);
    }

    float RequireFloat(const json& object, const char* key) {
        const json& value = Require(object, key);
        if (!value.is_number()) throw WrongType(key, "a number");
        float number = value.get<float>();
        if (!std::isfinite(number)) throw WrongType(key, "finite");
        return number;
    }

    bool OptionalBool(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) return false;
        if (!it->is_boolean()) throw WrongType(key, "a boolean");
        return it->get<bool>();
    }

    const json& RequireObject(const json& object, const char* key) {
        const json& value = Require(object, key);
        if (!value.is_object()) throw WrongType(key, "an object");
        return value;
    }

    std::vector<std::string> StringArray(const json& object, const char* key, bool required) {
        std::vector<std::string> result;
        auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            if (required) {
                throw DecodeError(DecodeError::Kind::MissingField, std::string("missing field '") + key + "'");
            }
            return result;
        }
        if (!it->is_array()) throw WrongType(key, "an array");
        for (const json& entry : *it) {
            if (!entry.is_string()) throw WrongType(key, "an array of strings");
            result.push_back(entry.get<std::string>());
        }
        return result;
    }

    sf::Vector3f ReadVector(const json& object, const char* key) {
        const json& value = RequireObject(object, key);
        return sf::Vector3f(RequireFloat(value, "x"), RequireFloat(value, "y"), RequireFloat(value, "z"));
    }

    Quat ReadQuat(const json& object, const char* key) {
        const json& value = RequireObject(object, key);
        return Quat(RequireFloat(value, "x"), RequireFloat(value, "y"),
            RequireFloat(value, "z"), RequireFloat(value, "w"));
    }

    // -- Writing helpers ------------------------------------------------------

    json WriteVector(const sf::Vector3f& v) {
        return json{ {"x", v.x}, {"y", v.y}, {"z", v.z} };
    }

    json WriteQuat(const Quat& q) {
        return json{ {"x", q.x}, {"y", q.y}, {"z", q.z}, {"w", q.w} };
    }

    std::string Dump(const json& object) {
        // Invalid UTF-8 in user text is replaced rather than thrown
        return object.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    // -- Game data payloads ---------------------------------------------------

    struct PayloadWriter {
        json operator()(const PlayerState& state) const {
            return json{
                {"type", "PLAYER_STATE"},
                {"state", {
                    {"position", WriteVector(state.position)},
                    {"rotation", WriteQuat(state.rotation)},
                    {"velocity", WriteVector(state.velocity)},
                    {"angularVelocity", WriteVector(state.angularVelocity)},
                    {"timestamp", state.timestamp}
                }}
            };
        }

        json operator()(const PlayerInput& input) const {
            return json{
                {"type", "PLAYER_INPUT"},
                {"input", {
                    {"steering", input.steering},
                    {"throttle", input.throttle},
                    {"brake", input.brake},
                    {"timestamp", input.timestamp}
                }}
            };
        }
    };

    /**
     * Decodes the "data" object of a GAME_DATA datagram.
     * @param data JSON object carrying its own "type" tag.
     * @param playerId Sender id taken from the envelope.
     * @return PlayerState or PlayerInput with validated, clamped values.
     */
    GameDataPayload ReadPayload(const json& data, const std::string& playerId) {
        std::string type = RequireString(data, "type");

        if (type == "PLAYER_STATE") {
            const json& body = RequireObject(data, "state");
            PlayerState state;
            state.playerId = playerId;
            state.position = ReadVector(body, "position");
            state.rotation = ReadQuat(body, "rotation");
            state.velocity = ReadVector(body, "velocity");
            state.angularVelocity = ReadVector(body, "angularVelocity");
            state.timestamp = RequireFloat(body, "timestamp");

            if (!NetworkValidation::IsValidPosition(state.position)) {
                throw DecodeError(DecodeError::Kind::InvalidValue, "position out of world bounds");
            }
            if (!NetworkValidation::IsValidRotation(state.rotation)) {
                throw DecodeError(DecodeError::Kind::InvalidValue, "rotation is not a usable quaternion");
            }
            if (!NetworkValidation::IsValidTimestamp(state.timestamp)) {
                throw DecodeError(DecodeError::Kind::InvalidValue, "negative timestamp");
            }
            return state;
        }

        if (type == "PLAYER_INPUT") {
            const json& body = RequireObject(data, "input");
            PlayerInput input;
            input.playerId = playerId;
            input.steering = NetworkValidation::ClampSteering(RequireFloat(body, "steering"));
            input.throttle = NetworkValidation::ClampPedal(RequireFloat(body, "throttle"));
            input.brake = NetworkValidation::ClampPedal(RequireFloat(body, "brake"));
            input.timestamp = RequireFloat(body, "timestamp");
            return input;
        }

        throw DecodeError(DecodeError::Kind::UnknownType, "unknown game data type '" + type + "'");
    }

    // -- Commands -------------------------------------------------------------

    struct CommandWriter {
        json operator()(const RegisterCommand& c) const {
            json j{ {"name", c.name}, {"protocol_version", c.protocolVersion} };
            if (!c.password.empty()) j["password"] = c.password;
            return j;
        }
        json operator()(const HeartbeatCommand& c) const {
            json j = json::object();
            if (!c.clientId.empty()) j["client_id"] = c.clientId;
            return j;
        }
        json operator()(const PingCommand& c) const { return json{ {"timestamp", c.timestamp} }; }
        json operator()(const HostGameCommand& c) const {
            return json{ {"room_name", c.roomName}, {"max_players", c.maxPlayers} };
        }
        json operator()(const JoinGameCommand& c) const { return json{ {"room_id", c.roomId} }; }
        json operator()(const ListGamesCommand&) const { return json::object(); }
        json operator()(const LeaveRoomCommand& c) const { return json{ {"room_id", c.roomId} }; }
        json operator()(const GetRoomPlayersCommand& c) const { return json{ {"room_id", c.roomId} }; }
        json operator()(const RelayCommand& c) const {
            json j{ {"message", c.message} };
            if (!c.targetId.empty()) j["target_id"] = c.targetId;
            else j["room_id"] = c.roomId;
            return j;
        }
        json operator()(const GameDataCommand& c) const {
            json j{ {"client_id", c.clientId}, {"room_id", c.roomId},
                {"data", std::visit(PayloadWriter{}, c.data)} };
            if (!c.targetId.empty()) j["target_id"] = c.targetId;
            return j;
        }
        json operator()(const DisconnectCommand&) const { return json::object(); }
        json operator()(const StartGameCommand& c) const { return json{ {"room_id", c.roomId} }; }
        json operator()(const PlayerInfoCommand& c) const { return json{ {"name", c.name} }; }
    };

    // -- Messages -------------------------------------------------------------

    struct MessageWriter {
        json operator()(const RegisteredMessage& m) const {
            json j{ {"client_id", m.clientId} };
            if (m.protocolVersion) j["protocol_version"] = *m.protocolVersion;
            return j;
        }
        json operator()(const HeartbeatAckMessage&) const { return json::object(); }
        json operator()(const PingResponseMessage& m) const { return json{ {"timestamp", m.timestamp} }; }
        json operator()(const GameHostedMessage& m) const { return json{ {"room_id", m.roomId} }; }
        json operator()(const GameListMessage& m) const {
            json rooms = json::array();
            for (const RoomInfo& room : m.rooms) {
                json entry{ {"room_id", room.roomId}, {"name", room.name},
                    {"player_count", room.playerCount}, {"max_players", room.maxPlayers} };
                if (!room.hostId.empty()) entry["host_id"] = room.hostId;
                rooms.push_back(entry);
            }
            return json{ {"rooms", rooms} };
        }
        json operator()(const JoinedGameMessage& m) const {
            return json{ {"room_id", m.roomId}, {"host_id", m.hostId},
                {"players", m.players}, {"game_started", m.gameStarted} };
        }
        json operator()(const JoinFailedMessage& m) const { return json{ {"reason", m.reason} }; }
        json operator()(const PlayerJoinedMessage& m) const { return json{ {"client_id", m.clientId} }; }
        json operator()(const PlayerDisconnectedMessage& m) const { return json{ {"player_id", m.playerId} }; }
        json operator()(const RoomPlayersMessage& m) const { return json{ {"players", m.players} }; }
        json operator()(const GameStartedMessage& m) const {
            json spawn = WriteVector(m.spawn.position);
            spawn["index"] = m.spawn.index;
            return json{ {"spawn_position", spawn}, {"player_ids", m.playerIds} };
        }
        json operator()(const RelayMessage& m) const { return json{ {"from", m.from}, {"message", m.message} }; }
        json operator()(const KickedMessage& m) const { return json{ {"message", m.message} }; }
        json operator()(const ServerNoticeMessage& m) const { return json{ {"message", m.message} }; }
        json operator()(const GameDataMessage& m) const {
            return json{ {"from", m.from}, {"data", std::visit(PayloadWriter{}, m.data)} };
        }
        json operator()(const AuthFailedMessage& m) const { return json{ {"message", m.message} }; }
        json operator()(const ServerErrorMessage& m) const { return json{ {"message", m.message} }; }
    };

    ClientCommand ReadCommand(const json& j, const std::string& type) {
        if (type == "REGISTER") {
            RegisterCommand c;
            c.name = RequireString(j, "name");
            c.password = OptionalString(j, "password");
            c.protocolVersion = OptionalInt(j, "protocol_version").value_or(0);
            return c;
        }
        if (type == "HEARTBEAT") {
            return HeartbeatCommand{ OptionalString(j, "client_id") };
        }
        if (type == "PING") {
            return PingCommand{ RequireInt64(j, "timestamp") };
        }
        if (type == "HOST_GAME") {
            HostGameCommand c;
            c.roomName = RequireString(j, "room_name");
            c.maxPlayers = RequireInt(j, "max_players");
            return c;
        }
        if (type == "JOIN_GAME") {
            return JoinGameCommand{ RequireString(j, "room_id") };
        }
        if (type == "LIST_GAMES") {
            return ListGamesCommand{};
        }
        if (type == "LEAVE_ROOM") {
            return LeaveRoomCommand{ OptionalString(j, "room_id") };
        }
        if (type == "GET_ROOM_PLAYERS") {
            return GetRoomPlayersCommand{ OptionalString(j, "room_id") };
        }
        if (type == "RELAY_MESSAGE") {
            RelayCommand c;
            c.roomId = OptionalString(j, "room_id");
            c.targetId = OptionalString(j, "target_id");
            c.message = RequireString(j, "message");
            if (c.roomId.empty() && c.targetId.empty()) {
                throw DecodeError(DecodeError::Kind::MissingField, "RELAY_MESSAGE needs room_id or target_id");
            }
            return c;
        }
        if (type == "GAME_DATA") {
            GameDataCommand c;
            c.clientId = RequireString(j, "client_id");
            c.roomId = OptionalString(j, "room_id");
            c.targetId = OptionalString(j, "target_id");
            c.data = ReadPayload(RequireObject(j, "data"), c.clientId);
            return c;
        }
        if (type == "DISCONNECT") {
            return DisconnectCommand{};
        }
        if (type == "START_GAME") {
            return StartGameCommand{ OptionalString(j, "room_id") };
        }
        if (type == "PLAYER_INFO") {
            return PlayerInfoCommand{ RequireString(j, "name") };
        }
        throw DecodeError(DecodeError::Kind::UnknownType, "unknown command type '" + type + "'");
    }

    ServerMessage ReadMessage(const json& j, const std::string& type) {
        if (type == "REGISTERED") {
            RegisteredMessage m;
            m.clientId = RequireString(j, "client_id");
            m.protocolVersion = OptionalInt(j, "protocol_version");
            return m;
        }
        if (type == "HEARTBEAT_ACK") {
            return HeartbeatAckMessage{};
        }
        if (type == "PING_RESPONSE") {
            return PingResponseMessage{ RequireInt64(j, "timestamp") };
        }
        if (type == "GAME_HOSTED") {
            return GameHostedMessage{ RequireString(j, "room_id") };
        }
        if (type == "GAME_LIST") {
            GameListMessage m;
            const json& rooms = Require(j, "rooms");
            if (!rooms.is_array()) throw WrongType("rooms", "an array");
            for (const json& entry : rooms) {
                if (!entry.is_object()) throw WrongType("rooms", "an array of objects");
                RoomInfo room;
                room.roomId = RequireString(entry, "room_id");
                room.name = OptionalString(entry, "name");
                room.hostId = OptionalString(entry, "host_id");
                room.playerCount = RequireInt(entry, "player_count");
                room.maxPlayers = RequireInt(entry, "max_players");
                m.rooms.push_back(room);
            }
            return m;
        }
        if (type == "JOINED_GAME") {
            JoinedGameMessage m;
            m.roomId = RequireString(j, "room_id");
            m.hostId = RequireString(j, "host_id");
            m.players = StringArray(j, "players", false);
            m.gameStarted = OptionalBool(j, "game_started");
            return m;
        }
        if (type == "JOIN_FAILED") {
            return JoinFailedMessage{ OptionalString(j, "reason") };
        }
        if (type == "PLAYER_JOINED") {
            return PlayerJoinedMessage{ RequireString(j, "client_id") };
        }
        if (type == "PLAYER_DISCONNECTED") {
            return PlayerDisconnectedMessage{ RequireString(j, "player_id") };
        }
        if (type == "ROOM_PLAYERS") {
            return RoomPlayersMessage{ StringArray(j, "players", true) };
        }
        if (type == "GAME_STARTED") {
            GameStartedMessage m;
            const json& spawn = RequireObject(j, "spawn_position");
            m.spawn.position = sf::Vector3f(RequireFloat(spawn, "x"), RequireFloat(spawn, "y"), RequireFloat(spawn, "z"));
            m.spawn.index = OptionalInt(spawn, "index").value_or(0);
            m.playerIds = StringArray(j, "player_ids", false);
            return m;
        }
        if (type == "RELAY") {
            RelayMessage m;
            m.from = RequireString(j, "from");
            const json& body = Require(j, "message");
            // Relayed payloads are opaque; non-string bodies are forwarded as JSON text
            m.message = body.is_string() ? body.get<std::string>() : Dump(body);
            return m;
        }
        if (type == "KICKED") {
            return KickedMessage{ OptionalString(j, "message") };
        }
        if (type == "SERVER_MESSAGE") {
            return ServerNoticeMessage{ RequireString(j, "message") };
        }
        if (type == "GAME_DATA") {
            GameDataMessage m;
            m.from = RequireString(j, "from");
            m.data = ReadPayload(RequireObject(j, "data"), m.from);
            return m;
        }
        if (type == "AUTH_FAILED") {
            return AuthFailedMessage{ OptionalString(j, "message") };
        }
        if (type == "ERROR") {
            return ServerErrorMessage{ OptionalString(j, "message") };
        }
        throw DecodeError(DecodeError::Kind::UnknownType, "unknown message type '" + type + "'");
    }

    std::string ReadType(const json& j) {
        auto it = j.find("type");
        if (it == j.end() || !it->is_string()) {
            throw DecodeError(DecodeError::Kind::MissingField, "missing field 'type'");
        }
        return it->get<std::string>();
    }

    ClientCommand DecodeCommandObject(const json& j) {
        try {
            return ReadCommand(j, ReadType(j));
        }
        catch (const json::exception& e) {
            throw DecodeError(DecodeError::Kind::InvalidValue, e.what());
        }
    }

    ServerMessage DecodeMessageObject(const json& j) {
        try {
            return ReadMessage(j, ReadType(j));
        }
        catch (const json::exception& e) {
            throw DecodeError(DecodeError::Kind::InvalidValue, e.what());
        }
    }
}

namespace WireCodec {
    std::string EncodeCommand(const ClientCommand& command) {
        json j = std::visit(CommandWriter{}, command);
        j["type"] = CommandName(command);
        return Dump(j);
    }

    ClientCommand DecodeCommand(const std::string& text) {
        return DecodeCommandObject(ParseObject(text));
    }

    std::string EncodeMessage(const ServerMessage& message) {
        json j = std::visit(MessageWriter{}, message);
        j["type"] = MessageName(message);
        return Dump(j);
    }

    ServerMessage DecodeMessage(const std::string& text) {
        return DecodeMessageObject(ParseObject(text));
    }

    const char* CommandName(const ClientCommand& command) {
        return COMMAND_NAMES[command.index()];
    }

    const char* MessageName(const ServerMessage& message) {
        return MESSAGE_NAMES[message.index()];
    }
}

LineFramer::LineFramer(std::size_t maxLineLength)
    : maxLineLength(maxLineLength), discarding(false), discardedLines(0) {
}

/**
 * Appends a raw chunk read from the stream and extracts complete lines.
 * A line longer than maxLineLength is dropped as a whole: bytes are skipped
 * until its terminating '\n' so the next line starts clean.
 * @param data Bytes just received.
 * @param size Number of bytes.
 * @return Complete lines in arrival order.
 */
std::vector<std::string> LineFramer::Feed(const char* data, std::size_t size) {
    std::vector<std::string> lines;
    std::size_t start = 0;

    for (std::size_t i = 0; i < size; ++i) {
        if (data[i] != '\n') {
            continue;
        }

        if (discarding) {
            discarding = false;
        }
        else {
            pending.append(data + start, i - start);
            if (!pending.empty() && pending.back() == '\r') {
                pending.pop_back();
            }
            if (pending.size() > maxLineLength) {
                ++discardedLines;
                Utils::printMsg("Dropping oversized line (" + std::to_string(pending.size()) + " bytes)", warning);
            }
            else if (!pending.empty()) {
                lines.push_back(std::move(pending));
            }
        }
        pending.clear();
        start = i + 1;
    }

    if (!discarding && start < size) {
        pending.append(data + start, size - start);
        if (pending.size() > maxLineLength) {
            ++discardedLines;
            Utils::printMsg("Dropping oversized line (over " + std::to_string(maxLineLength) + " bytes)", warning);
            pending.clear();
            discarding = true;
        }
    }

    return lines;
}

void LineFramer::Clear() {
    pending.clear();
    discarding = false;
}
