#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include "network_messages.h"

// The slice of the session manager that room and state components depend on.
// They never touch sockets; everything goes through these calls.
class SessionControl {
public:
    using MessageHandler = std::function<void(const ServerMessage&)>;
    using HandlerId = std::size_t;

    virtual ~SessionControl() = default;

    virtual bool SendReliable(const ClientCommand& command) = 0;
    virtual bool SendUnreliable(const ClientCommand& command) = 0;

    virtual const Session& GetSession() const = 0;
    virtual bool IsConnected() const = 0;

    virtual void SetRoom(const std::string& roomId, bool isHost) = 0;
    virtual void ClearRoom() = 0;

    // Handlers see every decoded message on the consumer thread, after the session's own handling
    virtual HandlerId AddMessageHandler(MessageHandler handler) = 0;
    virtual void RemoveMessageHandler(HandlerId id) = 0;
};
