#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <atomic>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include "network_context.h"
#include "network_errors.h"
#include "network_validation.h"
#include "utils.h"

namespace {
    constexpr float STATE_SEND_INTERVAL = 0.05f;    // 20 Hz while driving
    constexpr float DEMO_TRACK_RADIUS = 40.0f;
    constexpr float DEMO_ANGULAR_SPEED = 0.5f;      // rad/s

    struct ConsoleOptions {
        std::string configPath;
        bool hostGiven = false;
        bool nameGiven = false;
        bool verbose = false;
    };

    void PrintUsage() {
        std::cout << "Usage: racenet_client [--config file.json] [--host address] [--port tcp] [--udp-port udp]\n"
            << "                      [--name player] [--tls] [--allow-self-signed] [--verbose]\n";
    }

    void PrintHelp() {
        std::cout << "Commands:\n"
            << "  list                 refresh the room list\n"
            << "  rooms                show the last room list\n"
            << "  host <name> [max]    create a room\n"
            << "  join <room_id>       join a room\n"
            << "  leave                leave the current room\n"
            << "  start                start the game (host only)\n"
            << "  players              show the room roster and remote cars\n"
            << "  say <text>           relay a message to the room\n"
            << "  whisper <id> <text>  relay a message to one player\n"
            << "  drive                toggle sending a demo car state\n"
            << "  ping                 show latency statistics\n"
            << "  reconnect            retry after a connection failure\n"
            << "  connect / disconnect\n"
            << "  quit\n";
    }

    unsigned short ParsePort(const std::string& text) {
        long value = 0;
        try {
            value = std::stol(text);
        }
        catch (const std::exception&) {
            throw ConfigError("Invalid port: " + text);
        }
        if (!NetworkValidation::IsValidPort(value)) {
            throw ConfigError("Port out of range (1-65535): " + text);
        }
        return static_cast<unsigned short>(value);
    }

    /**
     * Applies command-line flags on top of the config file (if any).
     * @return False when the program should exit (help shown).
     */
    bool ParseArguments(int argc, char* argv[], ClientConfig& config, ConsoleOptions& options) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                options.configPath = argv[++i];
                config = ClientConfig::LoadFromFile(options.configPath);
                options.hostGiven = true;
                options.nameGiven = true;
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigError("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--config") { ++i; }
            else if (arg == "--host") { config.host = next(); options.hostGiven = true; }
            else if (arg == "--port") { config.tcpPort = ParsePort(next()); }
            else if (arg == "--udp-port") { config.udpPort = ParsePort(next()); }
            else if (arg == "--name") { config.playerName = next(); options.nameGiven = true; }
            else if (arg == "--tls") { config.useTls = true; }
            else if (arg == "--allow-self-signed") { config.allowSelfSigned = true; }
            else if (arg == "--verbose") { options.verbose = true; }
            else if (arg == "--help" || arg == "-h") { PrintUsage(); return false; }
            else { throw ConfigError("Unknown argument: " + arg); }
        }
        return true;
    }

    void PromptMissing(ClientConfig& config, const ConsoleOptions& options) {
        std::string input;
        if (!options.nameGiven) {
            std::cout << "Enter your player name (default " << config.playerName << "): ";
            std::getline(std::cin, input);
            if (!input.empty()) {
                config.playerName = input;
            }
        }
        if (!options.hostGiven) {
            std::cout << "Enter relay address (default " << config.host << "): ";
            std::getline(std::cin, input);
            if (!input.empty()) {
                config.host = input;
            }
        }
    }

    void SubscribeNotifications(NetworkContext& context) {
        NetworkEventBus& events = context.GetEvents();

        events.Subscribe<ConnectedEvent>([](const ConnectedEvent& e) {
            Utils::printMsg("Connected as " + e.clientId + ". Type 'help' for commands.", success);
        });
        events.Subscribe<ConnectionFailedEvent>([](const ConnectionFailedEvent& e) {
            Utils::printMsg("Connection failed: " + e.reason + " (type 'reconnect' to retry)", error);
        });
        events.Subscribe<ReconnectAttemptEvent>([](const ReconnectAttemptEvent& e) {
            Utils::printMsg("Reconnecting (" + std::to_string(e.attempt) + "/" + std::to_string(e.maxAttempts) + ")...", warning);
        });
        events.Subscribe<ReconnectExhaustedEvent>([](const ReconnectExhaustedEvent& e) {
            Utils::printMsg("Could not reconnect after " + std::to_string(e.attempts) + " attempts: " + e.lastError, error);
        });
        events.Subscribe<RoomListUpdatedEvent>([](const RoomListUpdatedEvent& e) {
            if (e.rooms.empty()) {
                Utils::printMsg("No rooms open. 'host <name>' to create one.");
                return;
            }
            for (const RoomInfo& room : e.rooms) {
                Utils::printMsg("  " + room.roomId + "  " + room.name + "  (" +
                    std::to_string(room.playerCount) + "/" + std::to_string(room.maxPlayers) + ")");
            }
        });
        events.Subscribe<RoomHostedEvent>([](const RoomHostedEvent& e) {
            Utils::printMsg("Hosting room " + e.roomId + ", waiting for players ('start' when ready)", success);
        });
        events.Subscribe<RoomJoinedEvent>([](const RoomJoinedEvent& e) {
            Utils::printMsg("In room " + e.roomId + (e.isHost ? " (host)" : ""), success);
        });
        events.Subscribe<RoomLeftEvent>([](const RoomLeftEvent& e) {
            Utils::printMsg("Back in the lobby (left " + e.roomId + ")");
        });
        events.Subscribe<JoinFailedEvent>([](const JoinFailedEvent& e) {
            Utils::printMsg("Could not join: " + e.reason, warning);
        });
        events.Subscribe<RelayReceivedEvent>([](const RelayReceivedEvent& e) {
            Utils::printMsg("<" + e.from + "> " + e.message);
        });
        events.Subscribe<RemotePlayerSpawnedEvent>([](const RemotePlayerSpawnedEvent& e) {
            Utils::printMsg("Car of " + e.playerId + " appeared");
        });
        events.Subscribe<AuthFailedEvent>([](const AuthFailedEvent& e) {
            Utils::printMsg("Relay refused credentials: " + e.message, error);
        });
    }

    void ShowPlayers(NetworkContext& context) {
        RoomRegistry& rooms = context.GetRooms();
        if (!rooms.IsInRoom()) {
            Utils::printMsg("Not in a room");
            return;
        }
        Utils::printMsg("Room " + rooms.GetCurrentRoomId() + (rooms.IsGameStarted() ? " (racing)" : " (waiting)"));
        for (const std::string& playerId : rooms.GetRoster()) {
            std::string line = "  " + playerId;
            PlayerState state;
            if (context.GetSync().GetRemoteState(playerId, state)) {
                line += "  pos(" + std::to_string(state.position.x) + ", " + std::to_string(state.position.y) +
                    ", " + std::to_string(state.position.z) + ")";
            }
            if (playerId == context.GetSession().GetSession().clientId) {
                line += "  (you)";
            }
            Utils::printMsg(line);
        }
    }

    void ShowLatency(NetworkContext& context) {
        NetworkStats stats = context.GetSession().GetStats();
        Utils::printMsg("RTT avg " + std::to_string(stats.averageRTT) + "ms, jitter " + std::to_string(stats.jitter) +
            "ms, min " + std::to_string(stats.minRTT) + "ms, max " + std::to_string(stats.maxRTT) + "ms");
        Utils::printMsg("TCP sent/recv " + std::to_string(stats.reliablePacketsSent) + "/" +
            std::to_string(stats.reliablePacketsReceived) + ", UDP sent/recv " + std::to_string(stats.datagramsSent) +
            "/" + std::to_string(stats.datagramsReceived) + ", protocol errors " + std::to_string(stats.decodeErrors));
    }

    // Runs on the consumer thread
    void HandleCommand(NetworkContext& context, const std::string& line, bool& driving, std::atomic<bool>& running) {
        std::istringstream stream(line);
        std::string command;
        stream >> command;
        std::string rest;
        std::getline(stream >> std::ws, rest);

        SessionManager& session = context.GetSession();
        RoomRegistry& rooms = context.GetRooms();

        try {
            if (command.empty()) {
                return;
            }
            else if (command == "help") {
                PrintHelp();
            }
            else if (command == "quit" || command == "exit") {
                running = false;
            }
            else if (command == "list") {
                ListRequestResult result = rooms.RequestList();
                if (result != ListRequestResult::Sent) {
                    Utils::printMsg(std::string("Room list: ") + ListRequestResultToString(result), warning);
                }
            }
            else if (command == "rooms") {
                context.GetEvents().Publish(RoomListUpdatedEvent{ rooms.GetRooms() });
            }
            else if (command == "host") {
                std::istringstream args(rest);
                std::string name;
                int maxPlayers = NetworkConstants::DEFAULT_ROOM_PLAYERS;
                args >> name;
                if (!(args >> maxPlayers)) {
                    maxPlayers = NetworkConstants::DEFAULT_ROOM_PLAYERS;
                }
                rooms.HostRoom(name, maxPlayers);
            }
            else if (command == "join") {
                rooms.JoinRoom(rest);
            }
            else if (command == "leave") {
                driving = false;
                if (!rooms.LeaveRoom()) {
                    Utils::printMsg("Not in a room");
                }
            }
            else if (command == "start") {
                rooms.StartGame();
            }
            else if (command == "players") {
                ShowPlayers(context);
            }
            else if (command == "say") {
                session.SendRelay(rest);
            }
            else if (command == "whisper") {
                std::istringstream args(rest);
                std::string target;
                args >> target;
                std::string text;
                std::getline(args >> std::ws, text);
                session.SendRelay(text, target);
            }
            else if (command == "drive") {
                driving = !driving && rooms.IsInRoom();
                Utils::printMsg(driving ? "Driving demo lap" : "Parked");
            }
            else if (command == "ping") {
                ShowLatency(context);
            }
            else if (command == "reconnect") {
                session.BeginReconnect();
            }
            else if (command == "disconnect") {
                driving = false;
                session.Disconnect();
            }
            else if (command == "connect") {
                session.Connect(context.GetConfig().GetCredentials());
            }
            else {
                Utils::printMsg("Unknown command '" + command + "', try 'help'", warning);
            }
        }
        catch (const ConfigError& e) {
            Utils::printMsg(e.what(), error);
        }
    }

    PlayerState DemoLapState(const std::string& playerId, float time) {
        float angle = time * DEMO_ANGULAR_SPEED;
        float speed = DEMO_TRACK_RADIUS * DEMO_ANGULAR_SPEED;
        PlayerState state;
        state.playerId = playerId;
        state.position = sf::Vector3f(DEMO_TRACK_RADIUS * std::cos(angle), 0.0f, DEMO_TRACK_RADIUS * std::sin(angle));
        state.velocity = sf::Vector3f(-speed * std::sin(angle), 0.0f, speed * std::cos(angle));
        state.angularVelocity = sf::Vector3f(0.0f, DEMO_ANGULAR_SPEED, 0.0f);
        // Yaw around +Y, facing along the velocity
        float yaw = -angle * 0.5f;
        state.rotation = Quat(0.0f, std::sin(yaw), 0.0f, std::cos(yaw));
        state.timestamp = time;
        return state;
    }
}

int main(int argc, char* argv[]) {
    Utils::printMsg("RaceNet Client Starting...");

    ClientConfig config;
    ConsoleOptions options;
    try {
        if (!ParseArguments(argc, argv, config, options)) {
            return 0;
        }
        PromptMissing(config, options);
        config.Validate();
    }
    catch (const ConfigError& e) {
        Utils::printMsg(e.what(), error);
        PrintUsage();
        return -1;
    }

    if (options.verbose || config.debugLogs) {
        Utils::setLogLevel(debug);
    }

    NetworkContext context(config);
    SubscribeNotifications(context);

    try {
        context.GetSession().Connect(config.GetCredentials());
    }
    catch (const ConfigError& e) {
        Utils::printMsg("Configuration error: " + std::string(e.what()), error);
        return -1;
    }

    std::atomic<bool> running(true);
    bool driving = false;

    // stdin blocks, so it gets its own thread; lines are handed to the tick loop
    std::thread inputThread([&context, &running, &driving]() {
        std::string line;
        while (running && std::getline(std::cin, line)) {
            context.GetDispatcher().Enqueue([&context, &running, &driving, line]() {
                HandleCommand(context, line, driving, running);
            });
            if (line == "quit" || line == "exit") {
                return;
            }
        }
        running = false;
    });

    sf::Clock clock;
    float raceTime = 0.0f;
    float sendTimer = 0.0f;

    while (running) {
        float deltaTime = clock.restart().asSeconds();
        if (deltaTime < 0 || !std::isfinite(deltaTime)) {
            Utils::printMsg("Invalid delta time, skipping update", warning);
            continue;
        }

        context.Tick(deltaTime);

        if (driving && context.GetRooms().IsInRoom()) {
            raceTime += deltaTime;
            sendTimer += deltaTime;
            if (sendTimer >= STATE_SEND_INTERVAL) {
                sendTimer = 0.0f;
                const std::string& localId = context.GetSession().GetSession().clientId;
                context.GetSession().SendPlayerState(DemoLapState(localId, raceTime));
            }
        }

        sf::sleep(sf::milliseconds(16));
    }

    Utils::printMsg("Shutting down...", warning);
    if (inputThread.joinable()) {
        inputThread.join();
    }
    context.GetSession().Disconnect();
    Utils::printMsg("Client closed", success);
    return 0;
}
