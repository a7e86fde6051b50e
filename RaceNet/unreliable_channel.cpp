#include "unreliable_channel.h"
#include "network_constants.h"
#include "network_errors.h"
#include "utils.h"
#include <vector>
#include <SFML/Network/SocketSelector.hpp>

UnreliableChannel::UnreliableChannel()
    : remoteAddress(sf::IpAddress::LocalHost), remotePort(0), stopRequested(false), open(false) {
}

UnreliableChannel::~UnreliableChannel() {
    Close();
}

void UnreliableChannel::Open(const sf::IpAddress& address, unsigned short port, unsigned short localPort) {
    Close();

    sf::Socket::Status bindStatus = socket.bind(localPort == 0 ? sf::Socket::AnyPort : localPort);
    if (bindStatus != sf::Socket::Status::Done) {
        throw TransportError("Failed to bind datagram socket on port " + std::to_string(localPort) +
            " - Status: " + SocketStatusToString(bindStatus));
    }
    socket.setBlocking(true);

    remoteAddress = address;
    remotePort = port;
    open = true;
    Utils::printMsg("Datagram channel bound to port " + std::to_string(socket.getLocalPort()) +
        ", relay " + address.toString() + ":" + std::to_string(port));
}

void UnreliableChannel::StartReceiving(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed) {
    if (!open || receiveThread.joinable()) {
        return;
    }
    stopRequested = false;
    receiveThread = std::thread(&UnreliableChannel::ReceiveLoop, this,
        std::move(onMessage), std::move(onDecodeError), std::move(onClosed));
}

void UnreliableChannel::SetEncryption(std::shared_ptr<const UdpEncryption> newEncryption) {
    std::lock_guard<std::mutex> lock(encryptionMutex);
    encryption = std::move(newEncryption);
}

std::shared_ptr<const UdpEncryption> UnreliableChannel::GetEncryption() const {
    std::lock_guard<std::mutex> lock(encryptionMutex);
    return encryption;
}

bool UnreliableChannel::Send(const ClientCommand& command) {
    if (!open) {
        return false;
    }

    std::string text = WireCodec::EncodeCommand(command);
    std::vector<char> packet;
    if (auto cipher = GetEncryption()) {
        if (!cipher->Encrypt(text, packet)) {
            Utils::printMsg("Datagram encryption failed, dropping " + std::string(WireCodec::CommandName(command)), warning);
            return false;
        }
    }
    else {
        packet.assign(text.begin(), text.end());
    }

    if (packet.size() > NetworkConstants::MAX_DATAGRAM_SIZE) {
        Utils::printMsg("Datagram too large (" + std::to_string(packet.size()) + " bytes), dropped", warning);
        return false;
    }

    sf::Socket::Status status = socket.send(packet.data(), packet.size(), remoteAddress, remotePort);
    if (status != sf::Socket::Status::Done) {
        Utils::printMsg("Datagram send failed - Status: " + SocketStatusToString(status), debug);
        return false;
    }
    return true;
}

void UnreliableChannel::ReceiveLoop(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed) {
    sf::SocketSelector selector;
    selector.add(socket);

    // One spare byte so an oversized datagram is detectable instead of silently truncated
    std::vector<char> buffer(NetworkConstants::MAX_DATAGRAM_SIZE + 1);
    std::string closeReason;

    while (!stopRequested) {
        if (!selector.wait(sf::seconds(NetworkConstants::RECEIVE_POLL_SECONDS))) {
            continue;
        }
        if (stopRequested) {
            break;
        }

        std::size_t received = 0;
        std::optional<sf::IpAddress> sender;
        unsigned short senderPort = 0;
        sf::Socket::Status status = socket.receive(buffer.data(), buffer.size(), received, sender, senderPort);

        if (status == sf::Socket::Status::NotReady || status == sf::Socket::Status::Partial) {
            continue;
        }
        if (status != sf::Socket::Status::Done) {
            closeReason = "Datagram receive failed - Status: " + SocketStatusToString(status);
            break;
        }

        if (!sender || *sender != remoteAddress || senderPort != remotePort) {
            Utils::printMsg("Ignoring datagram from unexpected endpoint", debug);
            continue;
        }
        if (received > NetworkConstants::MAX_DATAGRAM_SIZE) {
            onDecodeError(DecodeError(DecodeError::Kind::Malformed, "datagram exceeds maximum size"));
            continue;
        }

        std::string text;
        if (auto cipher = GetEncryption()) {
            if (!cipher->Decrypt(buffer.data(), received, text)) {
                onDecodeError(DecodeError(DecodeError::Kind::Malformed, "datagram failed decryption"));
                continue;
            }
        }
        else {
            text.assign(buffer.data(), received);
        }

        try {
            onMessage(WireCodec::DecodeMessage(text));
        }
        catch (const DecodeError& e) {
            onDecodeError(e);
        }
    }

    if (!stopRequested) {
        onClosed(closeReason);
    }
}

void UnreliableChannel::Close() {
    stopRequested = true;
    if (receiveThread.joinable()) {
        receiveThread.join();
    }
    if (open) {
        socket.unbind();
        open = false;
    }
    SetEncryption(nullptr);
}
