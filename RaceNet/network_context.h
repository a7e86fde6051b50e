#pragma once
#include "client_config.h"
#include "dispatch_queue.h"
#include "latency_monitor.h"
#include "network_events.h"
#include "room_registry.h"
#include "session_manager.h"
#include "state_synchronizer.h"

// Owns every networking component for the lifetime of the application.
// Construct once at startup and pass by reference to the game loop and UI.
// Member order matters: later members depend on earlier ones.
class NetworkContext {
public:
    explicit NetworkContext(const ClientConfig& config);
    ~NetworkContext();

    NetworkContext(const NetworkContext&) = delete;
    NetworkContext& operator=(const NetworkContext&) = delete;

    // Consumer tick: drains queued network work, then runs component timers
    void Tick(float deltaTime);

    const ClientConfig& GetConfig() const { return config; }
    MainThreadDispatcher& GetDispatcher() { return dispatcher; }
    NetworkEventBus& GetEvents() { return events; }
    LatencyMonitor& GetLatency() { return latency; }
    SessionManager& GetSession() { return session; }
    RoomRegistry& GetRooms() { return rooms; }
    StateSynchronizer& GetSync() { return sync; }

private:
    ClientConfig config;
    MainThreadDispatcher dispatcher;
    NetworkEventBus events;
    LatencyMonitor latency;
    SessionManager session;
    RoomRegistry rooms;
    StateSynchronizer sync;
};
