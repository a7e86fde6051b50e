#include "network_context.h"
#include "utils.h"

NetworkContext::NetworkContext(const ClientConfig& config)
    : config(config),
    latency(config.latencyWindow),
    session(config, dispatcher, events, latency),
    rooms(session, events, config.roomListThrottle),
    sync(session, events, config.desyncThreshold, config.blendRate) {
    Utils::printMsg("Network context ready (protocol v" + std::to_string(NetworkConstants::PROTOCOL_VERSION) + ")", debug);
}

NetworkContext::~NetworkContext() {
    session.Disconnect();
}

void NetworkContext::Tick(float deltaTime) {
    std::size_t processed = dispatcher.Drain(config.maxDispatchPerTick);
    if (processed == config.maxDispatchPerTick && dispatcher.GetPendingCount() > 0) {
        Utils::printMsg("Dispatch cap reached, " + std::to_string(dispatcher.GetPendingCount()) +
            " items carried to next tick", debug);
    }

    session.Update(deltaTime);
    rooms.Update(deltaTime);
    sync.Update(deltaTime);
}
