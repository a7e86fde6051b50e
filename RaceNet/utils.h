#pragma once
#include <string>

// Severity of a console message
enum MessageType {
    info,
    debug,
    warning,
    error,
    success
};

namespace Utils {
    // Prints a timestamped, colored line to the console. Safe to call from receive threads.
    void printMsg(const std::string& message, MessageType type = info);

    // Messages below this severity are dropped. Debug output is hidden by default.
    void setLogLevel(MessageType minimumLevel);
    MessageType getLogLevel();
}
