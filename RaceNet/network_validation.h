#pragma once
#include <string>
#include <cstddef>
#include <cmath>
#include <algorithm>
#include <regex>
#include <SFML/System/Vector3.hpp>
#include "net_math.h"
#include "network_constants.h"

// Validation constants and utilities for network data
namespace NetworkValidation {
    // Sanity checks
    constexpr std::size_t MAX_PLAYER_NAME_LENGTH = 32;
    constexpr std::size_t MAX_ROOM_NAME_LENGTH = 48;
    constexpr std::size_t MAX_ID_LENGTH = 64;
    constexpr std::size_t MAX_HOST_LENGTH = 253;
    constexpr std::size_t MAX_RELAY_MESSAGE_LENGTH = 1024;

    // World coordinates outside this cube are treated as corrupt
    constexpr float MAX_COORDINATE = 100000.0f;

    inline bool IsFinite(const sf::Vector3f& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    inline bool IsValidPosition(const sf::Vector3f& position) {
        return IsFinite(position) &&
            std::abs(position.x) <= MAX_COORDINATE &&
            std::abs(position.y) <= MAX_COORDINATE &&
            std::abs(position.z) <= MAX_COORDINATE;
    }

    inline bool IsValidRotation(const Quat& q) {
        if (!std::isfinite(q.x) || !std::isfinite(q.y) || !std::isfinite(q.z) || !std::isfinite(q.w)) {
            return false;
        }
        return NetMath::Dot(q, q) > 0.0f;
    }

    inline bool IsValidTimestamp(float timestamp) {
        return std::isfinite(timestamp) && timestamp >= 0.0f;
    }

    inline bool IsPrintable(const std::string& text) {
        return std::none_of(text.begin(), text.end(), [](char c) {
            return static_cast<unsigned char>(c) < 0x20 || c == 0x7f;
        });
    }

    inline bool IsValidPlayerName(const std::string& name) {
        return !name.empty() && name.length() <= MAX_PLAYER_NAME_LENGTH && IsPrintable(name);
    }

    inline bool IsValidRoomName(const std::string& name) {
        return !name.empty() && name.length() <= MAX_ROOM_NAME_LENGTH && IsPrintable(name);
    }

    // Client and room identifiers are relay-assigned ("client_3", "room_1")
    inline bool IsValidId(const std::string& id) {
        return !id.empty() && id.length() <= MAX_ID_LENGTH && IsPrintable(id);
    }

    inline bool IsValidMaxPlayers(int maxPlayers) {
        return maxPlayers >= NetworkConstants::MIN_ROOM_PLAYERS &&
            maxPlayers <= NetworkConstants::MAX_ROOM_PLAYERS;
    }

    inline bool IsValidPort(long port) {
        return port > 0 && port <= 65535;
    }

    /**
     * Accepts dotted IPv4 addresses, "localhost" and RFC 1123 host names.
     * @param host Address typed by the user or read from the config file.
     * @return True when the string is syntactically a host; resolution happens later.
     */
    inline bool IsValidHost(const std::string& host) {
        if (host.empty() || host.length() > MAX_HOST_LENGTH) {
            return false;
        }
        static const std::regex ipPattern(
            "^((25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$");
        static const std::regex hostPattern(
            "^([A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)(\\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*$");
        if (std::regex_match(host, ipPattern) || host == "localhost") {
            return true;
        }
        // All-numeric labels that failed the IPv4 pattern are typos, not names
        bool numeric = std::all_of(host.begin(), host.end(), [](char c) {
            return (c >= '0' && c <= '9') || c == '.';
        });
        return !numeric && std::regex_match(host, hostPattern);
    }

    inline float ClampSteering(float steering) {
        if (!std::isfinite(steering)) return 0.0f;
        return std::clamp(steering, -1.0f, 1.0f);
    }

    // Throttle and brake share the [0, 1] range
    inline float ClampPedal(float value) {
        if (!std::isfinite(value)) return 0.0f;
        return std::clamp(value, 0.0f, 1.0f);
    }
}
