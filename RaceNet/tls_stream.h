#pragma once
#include <mutex>
#include <string>
#include <SFML/Network/TcpSocket.hpp>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

struct TlsOptions {
    bool enabled = false;
    std::string serverName;         // Checked against the certificate; also sent as SNI
    bool allowSelfSigned = false;   // Development only
    std::string caFile;             // Extra trust anchor, empty for system defaults
};

// TCP socket exposing the OS handle the TLS layer is bound to
class NativeTcpSocket : public sf::TcpSocket {
public:
    sf::SocketHandle GetHandle() const { return getNativeHandle(); }
};

// OpenSSL client session over an already connected socket.
// Send and Receive may be called from different threads.
class TlsStream {
public:
    explicit TlsStream(const TlsOptions& options);
    ~TlsStream();
    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    // Blocking handshake, then switches the socket to non-blocking. Throws TransportError.
    void Handshake(NativeTcpSocket& socket);

    sf::Socket::Status Send(const char* data, std::size_t size);

    // NotReady when no complete record is available yet
    sf::Socket::Status Receive(char* buffer, std::size_t size, std::size_t& received);

    // Decrypted bytes buffered inside OpenSSL that a socket wait would not report
    bool HasPendingData();

    // Sends close_notify, best effort
    void Shutdown();

private:
    TlsOptions options;
    SSL_CTX* context;
    SSL* ssl;
    std::mutex mutex;
};
