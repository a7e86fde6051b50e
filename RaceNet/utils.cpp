#include "utils.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    std::mutex consoleMutex;
    std::atomic<int> minimumSeverity{ 1 };

    int Severity(MessageType type) {
        switch (type) {
        case debug:   return 0;
        case warning: return 2;
        case error:   return 3;
        default:      return 1;
        }
    }

    const char* Color(MessageType type) {
        switch (type) {
        case debug:   return "\033[90m";
        case warning: return "\033[33m";
        case error:   return "\033[31m";
        case success: return "\033[32m";
        default:      return "\033[0m";
        }
    }

    const char* Label(MessageType type) {
        switch (type) {
        case debug:   return "[DEBUG]   ";
        case warning: return "[WARNING] ";
        case error:   return "[ERROR]   ";
        case success: return "[SUCCESS] ";
        default:      return "[INFO]    ";
        }
    }

    // Caller holds consoleMutex (std::localtime is not reentrant)
    std::string TimeOfDay() {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::ostringstream stream;
        stream << std::put_time(std::localtime(&seconds), "%H:%M:%S")
            << '.' << std::setw(3) << std::setfill('0') << millis;
        return stream.str();
    }
}

namespace Utils {
    void printMsg(const std::string& message, MessageType type) {
        if (Severity(type) < minimumSeverity.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(consoleMutex);
        std::ostream& out = (type == error) ? std::cerr : std::cout;
        out << Color(type) << TimeOfDay() << ' ' << Label(type) << message << "\033[0m" << std::endl;
    }

    void setLogLevel(MessageType minimumLevel) {
        minimumSeverity.store(Severity(minimumLevel));
    }

    MessageType getLogLevel() {
        switch (minimumSeverity.load()) {
        case 0:  return debug;
        case 2:  return warning;
        case 3:  return error;
        default: return info;
        }
    }
}
