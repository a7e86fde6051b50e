#include "network_messages.h"

const char* ConnectionStateToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting:   return "Connecting";
    case ConnectionState::Connected:    return "Connected";
    case ConnectionState::Failed:       return "Failed";
    }
    return "Unknown";
}
