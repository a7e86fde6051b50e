#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <SFML/Network/IpAddress.hpp>
#include <SFML/Network/UdpSocket.hpp>
#include "network_messages.h"
#include "udp_encryption.h"
#include "wire_codec.h"

// Fire-and-forget datagram channel for high-frequency state. One JSON message
// per datagram, optionally AES-encrypted. Datagrams from other endpoints are ignored.
class UnreliableChannel {
public:
    using MessageHandler = std::function<void(ServerMessage)>;
    using DecodeErrorHandler = std::function<void(const DecodeError&)>;
    using ClosedHandler = std::function<void(const std::string& reason)>;

    UnreliableChannel();
    ~UnreliableChannel();
    UnreliableChannel(const UnreliableChannel&) = delete;
    UnreliableChannel& operator=(const UnreliableChannel&) = delete;

    // localPort 0 binds an ephemeral port; a fixed port helps symmetric NAT. Throws TransportError.
    void Open(const sf::IpAddress& remoteAddress, unsigned short remotePort, unsigned short localPort);

    void StartReceiving(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed);

    // Applies to datagrams sent and received from now on; nullptr switches back to plaintext
    void SetEncryption(std::shared_ptr<const UdpEncryption> encryption);

    // False only when the datagram was dropped locally (not open, too large, socket error)
    bool Send(const ClientCommand& command);

    void Close();

    bool IsOpen() const { return open; }
    unsigned short GetLocalPort() const { return socket.getLocalPort(); }

private:
    void ReceiveLoop(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed);
    std::shared_ptr<const UdpEncryption> GetEncryption() const;

    sf::UdpSocket socket;
    sf::IpAddress remoteAddress;
    unsigned short remotePort;
    std::thread receiveThread;
    std::atomic<bool> stopRequested;
    bool open;

    mutable std::mutex encryptionMutex;
    std::shared_ptr<const UdpEncryption> encryption;
};
