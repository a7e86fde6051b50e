#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>

// AES-256-CBC payload protection for the datagram channel.
// Packet layout: [4-byte little-endian length of the rest][16-byte IV][ciphertext]
class UdpEncryption {
public:
    static constexpr std::size_t KEY_SIZE = 32;
    static constexpr std::size_t IV_SIZE = 16;
    static constexpr std::size_t BLOCK_SIZE = 16;
    static constexpr std::size_t HEADER_SIZE = 4;

    // Key = SHA-256(clientId + sharedSecret). Throws std::runtime_error if OpenSSL fails.
    UdpEncryption(const std::string& clientId, const std::string& sharedSecret);

    // Fresh random IV per packet
    bool Encrypt(const std::string& plaintext, std::vector<char>& outPacket) const;

    // False on bad length, bad padding or any cipher failure
    bool Decrypt(const char* data, std::size_t size, std::string& outPlaintext) const;

private:
    std::array<unsigned char, KEY_SIZE> key;
};
