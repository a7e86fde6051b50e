#include "tls_stream.h"
#include "network_errors.h"
#include "utils.h"
#include <chrono>
#include <regex>
#include <thread>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

namespace {
    constexpr auto SEND_RETRY_WINDOW = std::chrono::seconds(2);

    std::string LastOpenSslError() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "unknown TLS error";
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        ERR_clear_error();
        return buffer;
    }

    bool IsSelfSignedError(int verifyError) {
        return verifyError == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT ||
            verifyError == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN ||
            verifyError == X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY ||
            verifyError == X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE;
    }

    // Development policy: chain errors caused by a self-signed certificate pass,
    // everything else (hostname mismatch, expiry...) still fails
    int AcceptSelfSignedCallback(int preverified, X509_STORE_CTX* store) {
        if (preverified) {
            return 1;
        }
        int verifyError = X509_STORE_CTX_get_error(store);
        if (IsSelfSignedError(verifyError)) {
            Utils::printMsg("!!! Accepting self-signed server certificate (" +
                std::string(X509_verify_cert_error_string(verifyError)) +
                "). Never enable allow_self_signed in production !!!", warning);
            return 1;
        }
        return 0;
    }
}

TlsStream::TlsStream(const TlsOptions& options)
    : options(options), context(nullptr), ssl(nullptr) {
}

TlsStream::~TlsStream() {
    if (ssl) {
        SSL_free(ssl);
    }
    if (context) {
        SSL_CTX_free(context);
    }
}

/**
 * Runs the client handshake and verifies the server certificate.
 * Production policy rejects hostname mismatches and chain errors; with
 * allowSelfSigned only the self-signed chain errors are tolerated.
 * @param socket Connected blocking socket; left in non-blocking mode on success.
 */
void TlsStream::Handshake(NativeTcpSocket& socket) {
    std::lock_guard<std::mutex> lock(mutex);

    context = SSL_CTX_new(TLS_client_method());
    if (!context) {
        throw TransportError("TLS context creation failed: " + LastOpenSslError());
    }
    SSL_CTX_set_min_proto_version(context, TLS1_2_VERSION);

    if (SSL_CTX_set_default_verify_paths(context) != 1) {
        Utils::printMsg("Could not load system CA certificates", warning);
    }
    if (!options.caFile.empty() &&
        SSL_CTX_load_verify_locations(context, options.caFile.c_str(), nullptr) != 1) {
        throw TransportError("Failed to load CA file " + options.caFile + ": " + LastOpenSslError());
    }

    ssl = SSL_new(context);
    if (!ssl) {
        throw TransportError("TLS session creation failed: " + LastOpenSslError());
    }
    SSL_set_mode(ssl, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (options.allowSelfSigned) {
        Utils::printMsg("TLS running with allow_self_signed: certificate chain is NOT verified", warning);
        SSL_set_verify(ssl, SSL_VERIFY_PEER, AcceptSelfSignedCallback);
    }
    else {
        SSL_set_verify(ssl, SSL_VERIFY_PEER, nullptr);
    }

    // Name check: IP literals match SAN IP entries, names match DNS entries (+ SNI)
    X509_VERIFY_PARAM* param = SSL_get0_param(ssl);
    static const std::regex ipPattern("^[0-9.]+$");
    if (std::regex_match(options.serverName, ipPattern)) {
        if (X509_VERIFY_PARAM_set1_ip_asc(param, options.serverName.c_str()) != 1) {
            throw TransportError("Invalid server address for TLS: " + options.serverName);
        }
    }
    else {
        SSL_set_tlsext_host_name(ssl, options.serverName.c_str());
        if (SSL_set1_host(ssl, options.serverName.c_str()) != 1) {
            throw TransportError("Invalid server name for TLS: " + options.serverName);
        }
    }

    if (SSL_set_fd(ssl, static_cast<int>(socket.GetHandle())) != 1) {
        throw TransportError("Failed to attach TLS to socket: " + LastOpenSslError());
    }

    if (SSL_connect(ssl) != 1) {
        long verifyResult = SSL_get_verify_result(ssl);
        if (verifyResult != X509_V_OK) {
            throw TransportError(std::string("Server certificate rejected: ") +
                X509_verify_cert_error_string(verifyResult));
        }
        throw TransportError("TLS handshake failed: " + LastOpenSslError());
    }

    socket.setBlocking(false);
    Utils::printMsg(std::string("TLS established (") + SSL_get_version(ssl) + ", " +
        SSL_get_cipher_name(ssl) + ")", success);
}

sf::Socket::Status TlsStream::Send(const char* data, std::size_t size) {
    auto deadline = std::chrono::steady_clock::now() + SEND_RETRY_WINDOW;

    while (true) {
        int result = 0;
        int sslError = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!ssl) {
                return sf::Socket::Status::Disconnected;
            }
            result = SSL_write(ssl, data, static_cast<int>(size));
            if (result > 0) {
                return sf::Socket::Status::Done;
            }
            sslError = SSL_get_error(ssl, result);
        }

        if (sslError == SSL_ERROR_WANT_WRITE || sslError == SSL_ERROR_WANT_READ) {
            if (std::chrono::steady_clock::now() >= deadline) {
                Utils::printMsg("TLS send stalled, giving up", error);
                return sf::Socket::Status::Error;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (sslError == SSL_ERROR_ZERO_RETURN) {
            return sf::Socket::Status::Disconnected;
        }
        Utils::printMsg("TLS write failed: " + LastOpenSslError(), error);
        return sf::Socket::Status::Error;
    }
}

sf::Socket::Status TlsStream::Receive(char* buffer, std::size_t size, std::size_t& received) {
    std::lock_guard<std::mutex> lock(mutex);
    received = 0;
    if (!ssl) {
        return sf::Socket::Status::Disconnected;
    }

    int result = SSL_read(ssl, buffer, static_cast<int>(size));
    if (result > 0) {
        received = static_cast<std::size_t>(result);
        return sf::Socket::Status::Done;
    }

    switch (SSL_get_error(ssl, result)) {
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
        return sf::Socket::Status::NotReady;
    case SSL_ERROR_ZERO_RETURN:
        return sf::Socket::Status::Disconnected;
    case SSL_ERROR_SYSCALL:
        // EOF without close_notify
        return ERR_peek_error() == 0 ? sf::Socket::Status::Disconnected : sf::Socket::Status::Error;
    default:
        Utils::printMsg("TLS read failed: " + LastOpenSslError(), error);
        return sf::Socket::Status::Error;
    }
}

bool TlsStream::HasPendingData() {
    std::lock_guard<std::mutex> lock(mutex);
    return ssl && SSL_pending(ssl) > 0;
}

void TlsStream::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (ssl) {
        SSL_shutdown(ssl);
    }
}
