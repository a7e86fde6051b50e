#include "reliable_channel.h"
#include "network_constants.h"
#include "network_errors.h"
#include "utils.h"
#include <vector>
#include <SFML/Network/SocketSelector.hpp>

ReliableChannel::ReliableChannel()
    : stopRequested(false), open(false) {
}

ReliableChannel::~ReliableChannel() {
    Close();
}

void ReliableChannel::Open(const sf::IpAddress& address, unsigned short port, sf::Time timeout, const TlsOptions& tlsOptions) {
    Close();

    socket.setBlocking(true);
    sf::Socket::Status status = socket.connect(address, port, timeout);
    if (status != sf::Socket::Status::Done) {
        socket.disconnect();
        throw TransportError("TCP connect to " + address.toString() + ":" + std::to_string(port) +
            " failed - Status: " + SocketStatusToString(status));
    }

    if (tlsOptions.enabled) {
        auto stream = std::make_unique<TlsStream>(tlsOptions);
        try {
            stream->Handshake(socket);
        }
        catch (const TransportError&) {
            socket.disconnect();
            throw;
        }
        tls = std::move(stream);
    }

    open = true;
    Utils::printMsg("Reliable channel connected to " + address.toString() + ":" + std::to_string(port) +
        (tls ? " (TLS)" : ""));
}

void ReliableChannel::StartReceiving(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed) {
    if (!open || receiveThread.joinable()) {
        return;
    }
    stopRequested = false;
    receiveThread = std::thread(&ReliableChannel::ReceiveLoop, this,
        std::move(onMessage), std::move(onDecodeError), std::move(onClosed));
}

bool ReliableChannel::Send(const ClientCommand& command) {
    if (!open) {
        return false;
    }
    return WriteAll(WireCodec::EncodeCommand(command) + "\n");
}

bool ReliableChannel::WriteAll(const std::string& data) {
    sf::Socket::Status status;
    if (tls) {
        status = tls->Send(data.data(), data.size());
    }
    else {
        std::size_t offset = 0;
        do {
            std::size_t sent = 0;
            status = socket.send(data.data() + offset, data.size() - offset, sent);
            offset += sent;
        } while (status == sf::Socket::Status::Partial && offset < data.size());
    }

    if (status != sf::Socket::Status::Done) {
        Utils::printMsg("Reliable send failed - Status: " + SocketStatusToString(status), warning);
        return false;
    }
    return true;
}

/**
 * Receive thread body. Waits on the socket with a short timeout so a stop
 * request is noticed promptly, feeds the line framer and decodes each line.
 * Decode errors skip the offending line only.
 */
void ReliableChannel::ReceiveLoop(MessageHandler onMessage, DecodeErrorHandler onDecodeError, ClosedHandler onClosed) {
    sf::SocketSelector selector;
    selector.add(socket);

    LineFramer framer;
    std::vector<char> buffer(NetworkConstants::RECEIVE_BUFFER_SIZE);
    std::string closeReason;

    while (!stopRequested) {
        bool ready = (tls && tls->HasPendingData()) ||
            selector.wait(sf::seconds(NetworkConstants::RECEIVE_POLL_SECONDS));
        if (stopRequested) {
            break;
        }
        if (!ready) {
            continue;
        }

        std::size_t received = 0;
        sf::Socket::Status status = tls
            ? tls->Receive(buffer.data(), buffer.size(), received)
            : socket.receive(buffer.data(), buffer.size(), received);

        if (status == sf::Socket::Status::NotReady) {
            continue;
        }
        if (status == sf::Socket::Status::Disconnected ||
            (status == sf::Socket::Status::Done && received == 0)) {
            closeReason = "Server closed the connection";
            break;
        }
        if (status != sf::Socket::Status::Done && status != sf::Socket::Status::Partial) {
            closeReason = "Receive failed - Status: " + SocketStatusToString(status);
            break;
        }

        for (const std::string& line : framer.Feed(buffer.data(), received)) {
            try {
                onMessage(WireCodec::DecodeMessage(line));
            }
            catch (const DecodeError& e) {
                onDecodeError(e);
            }
        }
    }

    if (!stopRequested) {
        onClosed(closeReason);
    }
}

void ReliableChannel::Close() {
    stopRequested = true;
    if (receiveThread.joinable()) {
        receiveThread.join();
    }

    if (tls) {
        tls->Shutdown();
        tls.reset();
    }
    if (open) {
        socket.disconnect();
        open = false;
    }
}
