#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "network_messages.h"

// Application-facing notifications. Published on the consumer thread only.

struct ConnectedEvent {
    std::string clientId;
};

struct ConnectionFailedEvent {
    std::string reason;
};

// A live connection dropped (read error, server close, heartbeat silence)
struct ConnectionLostEvent {
    std::string reason;
};

struct DisconnectedEvent {};

struct ReconnectAttemptEvent {
    int attempt;        // 1-based
    int maxAttempts;
    float delay;        // Seconds waited before this attempt
};

struct ReconnectExhaustedEvent {
    int attempts;
    std::string lastError;
};

struct RoomListUpdatedEvent {
    std::vector<RoomInfo> rooms;
};

struct RoomHostedEvent {
    std::string roomId;
};

struct RoomJoinedEvent {
    std::string roomId;
    std::string hostId;
    bool isHost;
};

struct RoomLeftEvent {
    std::string roomId;
};

struct JoinFailedEvent {
    std::string reason;
};

struct PlayerJoinedEvent {
    std::string playerId;
};

struct PlayerLeftEvent {
    std::string playerId;
};

struct RosterUpdatedEvent {
    std::size_t playerCount;
};

struct GameStartedEvent {
    SpawnPoint spawn;
    std::vector<std::string> playerIds;
};

struct RelayReceivedEvent {
    std::string from;
    std::string message;
};

struct KickedEvent {
    std::string message;
};

struct ServerNoticeEvent {
    std::string message;
};

struct ServerErrorEvent {
    std::string message;
};

struct AuthFailedEvent {
    std::string message;
};

struct RemotePlayerSpawnedEvent {
    std::string playerId;
    PlayerState state;
};

struct RemotePlayerRemovedEvent {
    std::string playerId;
};

struct LatencyUpdatedEvent {
    float rtt;
    float average;
    float jitter;
};

// Typed observer registry: one handler list per event struct.
// Not thread-safe; subscribe and publish from the consumer thread.
class NetworkEventBus {
public:
    using SubscriptionId = std::size_t;

    NetworkEventBus() : nextId(1) {}
    NetworkEventBus(const NetworkEventBus&) = delete;
    NetworkEventBus& operator=(const NetworkEventBus&) = delete;

    template <typename Event>
    SubscriptionId Subscribe(std::function<void(const Event&)> handler) {
        SubscriptionId id = nextId++;
        subscribers[std::type_index(typeid(Event))].push_back({ id,
            [handler = std::move(handler)](const void* event) {
                handler(*static_cast<const Event*>(event));
            } });
        return id;
    }

    // Unknown ids are ignored
    void Unsubscribe(SubscriptionId id) {
        for (auto& [type, list] : subscribers) {
            for (auto it = list.begin(); it != list.end(); ++it) {
                if (it->id == id) {
                    list.erase(it);
                    return;
                }
            }
        }
    }

    template <typename Event>
    void Publish(const Event& event) {
        auto found = subscribers.find(std::type_index(typeid(Event)));
        if (found == subscribers.end()) {
            return;
        }
        // Handlers may subscribe or unsubscribe while we iterate
        std::vector<Subscription> snapshot = found->second;
        for (const Subscription& subscription : snapshot) {
            subscription.handler(&event);
        }
    }

    template <typename Event>
    std::size_t GetSubscriberCount() const {
        auto found = subscribers.find(std::type_index(typeid(Event)));
        return found == subscribers.end() ? 0 : found->second.size();
    }

private:
    struct Subscription {
        SubscriptionId id;
        std::function<void(const void*)> handler;
    };

    std::unordered_map<std::type_index, std::vector<Subscription>> subscribers;
    SubscriptionId nextId;
};
