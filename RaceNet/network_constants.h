#pragma once
#include <cstddef>

namespace NetworkConstants {
    /* Default relay ports (reliable control channel, datagram state channel) */
    constexpr unsigned short DEFAULT_TCP_PORT = 7777;
    constexpr unsigned short DEFAULT_UDP_PORT = 7778;

    /* Wire protocol revision carried by REGISTER and echoed by REGISTERED */
    constexpr int PROTOCOL_VERSION = 3;

    /* The relay reads datagrams into a 2048 byte buffer */
    constexpr std::size_t MAX_DATAGRAM_SIZE = 2048;

    /* Longest control line accepted before the framer starts discarding */
    constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;

    constexpr std::size_t RECEIVE_BUFFER_SIZE = 4096;

    /* How long a receive loop blocks before re-checking its stop flag */
    constexpr float RECEIVE_POLL_SECONDS = 0.1f;

    // Session timing (seconds)
    constexpr float CONNECT_TIMEOUT = 5.0f;
    constexpr float HEARTBEAT_INTERVAL = 5.0f;
    constexpr float HEARTBEAT_TIMEOUT = 15.0f;
    constexpr float PING_INTERVAL = 2.0f;

    // Reconnect backoff
    constexpr float RECONNECT_BASE_DELAY = 2.0f;
    constexpr float RECONNECT_BACKOFF_MULTIPLIER = 1.5f;
    constexpr float RECONNECT_MAX_DELAY = 10.0f;
    constexpr int MAX_RECONNECT_ATTEMPTS = 5;
    constexpr float RECONNECT_ATTEMPT_TIMEOUT = 5.0f;

    /* Number of round-trip samples kept by the latency window */
    constexpr std::size_t LATENCY_WINDOW_SIZE = 30;

    /* Relay text a leaving host sends so members know the room is gone */
    constexpr const char* ROOM_CLOSED_NOTICE = "ROOM_CLOSED";

    /* Minimum time between two LIST_GAMES requests */
    constexpr float ROOM_LIST_THROTTLE = 2.0f;

    // Remote player smoothing
    constexpr float DESYNC_THRESHOLD = 5.0f;   // metres of drift before snapping
    constexpr float BLEND_RATE = 10.0f;        // fraction of the gap closed per second
    constexpr float SETTLE_DISTANCE = 0.001f;  // below this the blend lands on the target

    /* Closures executed per consumer tick */
    constexpr std::size_t MAX_DISPATCH_PER_TICK = 100;

    // Room sizes accepted by HOST_GAME
    constexpr int MIN_ROOM_PLAYERS = 1;
    constexpr int MAX_ROOM_PLAYERS = 20;
    constexpr int DEFAULT_ROOM_PLAYERS = 8;
}
