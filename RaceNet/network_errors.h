#pragma once
#include <string>
#include <stdexcept>
#include <SFML/Network/Socket.hpp>

// Local misconfiguration (bad host, port 0, empty name...). Raised synchronously
// before any socket is opened or thread is started.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// A channel could not be opened (resolve, connect, bind or handshake failure)
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

std::string SocketStatusToString(sf::Socket::Status status);
