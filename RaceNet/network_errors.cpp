#include "network_errors.h"

std::string SocketStatusToString(sf::Socket::Status status) {
    switch (status) {
    case sf::Socket::Status::Done:         return "Done";
    case sf::Socket::Status::NotReady:     return "NotReady";
    case sf::Socket::Status::Partial:      return "Partial";
    case sf::Socket::Status::Disconnected: return "Disconnected";
    case sf::Socket::Status::Error:        return "Error";
    }
    return "Unknown";
}
