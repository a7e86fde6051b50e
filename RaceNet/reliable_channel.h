#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <SFML/Network/IpAddress.hpp>
#include <SFML/System/Time.hpp>
#include "network_messages.h"
#include "tls_stream.h"
#include "wire_codec.h"

// Ordered control channel: newline-terminated JSON over TCP, optionally TLS-wrapped.
// One receive thread decodes lines and hands them to the callbacks; sends happen
// on the caller's thread (single writer).
class ReliableChannel {
public:
    using MessageHandler = std::function<void(ServerMessage)>;
    using DecodeErrorHandler = std::function<void(const DecodeError&)>;
    using ClosedHandler = std::function<void(const std::string& reason)>;

    ReliableChannel();
    ~ReliableChannel();
    ReliableChannel(const ReliableChannel&) = delete;
    ReliableChannel& operator=(const ReliableChannel&) = delete;

    // Connects within timeout and runs the TLS handshake if enabled. Throws TransportError.
    void Open(const sf::IpAddress& address, unsigned short port, sf::Time timeout, const TlsOptions& tls);

    // Callbacks run on the receive thread. onClosed fires once when the loop ends
    // by itself (EOF or error), never after Close().
    void StartReceiving(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed);

    // Encodes, terminates with '\n' and writes immediately
    bool Send(const ClientCommand& command);

    // Stops and joins the receive thread, then releases the socket
    void Close();

    bool IsOpen() const { return open; }
    bool IsEncrypted() const { return tls != nullptr; }

private:
    void ReceiveLoop(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed);
    bool WriteAll(const std::string& data);

    NativeTcpSocket socket;
    std::unique_ptr<TlsStream> tls;
    std::thread receiveThread;
    std::atomic<bool> stopRequested;
    bool open;
};
