#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "udp_encryption.h"

namespace {
    uint32_t HeaderLength(const std::vector<char>& packet) {
        const unsigned char* p = reinterpret_cast<const unsigned char*>(packet.data());
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
            (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }
}

TEST_CASE("An encrypted datagram decrypts with the same client id and secret") {
    UdpEncryption sender("c42", "track-day");
    UdpEncryption receiver("c42", "track-day");
    std::string payload = R"({"type":"GAME_DATA","client_id":"c42"})";

    std::vector<char> packet;
    REQUIRE(sender.Encrypt(payload, packet));

    std::string decrypted;
    REQUIRE(receiver.Decrypt(packet.data(), packet.size(), decrypted));
    REQUIRE(decrypted == payload);
}

TEST_CASE("Encrypted packets carry a length header, an IV and whole cipher blocks") {
    UdpEncryption encryption("c1", "secret");
    std::vector<char> packet;
    REQUIRE(encryption.Encrypt("hello", packet));

    REQUIRE(HeaderLength(packet) == packet.size() - UdpEncryption::HEADER_SIZE);
    std::size_t cipherSize = packet.size() - UdpEncryption::HEADER_SIZE - UdpEncryption::IV_SIZE;
    REQUIRE(cipherSize == UdpEncryption::BLOCK_SIZE);
}

TEST_CASE("Each packet uses a fresh IV") {
    UdpEncryption encryption("c1", "secret");
    std::vector<char> first;
    std::vector<char> second;
    REQUIRE(encryption.Encrypt("same text", first));
    REQUIRE(encryption.Encrypt("same text", second));
    REQUIRE(first != second);
}

TEST_CASE("A packet whose length header disagrees with its size is rejected") {
    UdpEncryption encryption("c1", "secret");
    std::vector<char> packet;
    REQUIRE(encryption.Encrypt("lap 2", packet));
    packet.push_back('x');

    std::string decrypted;
    REQUIRE_FALSE(encryption.Decrypt(packet.data(), packet.size(), decrypted));
}

TEST_CASE("Short packets are rejected") {
    UdpEncryption encryption("c1", "secret");
    std::string decrypted;
    const char tiny[] = { 4, 0, 0, 0, 1, 2, 3, 4 };
    REQUIRE_FALSE(encryption.Decrypt(tiny, sizeof(tiny), decrypted));
}

TEST_CASE("A different key never yields the original plaintext") {
    UdpEncryption sender("c1", "secret");
    UdpEncryption other("c2", "secret");
    std::string payload = "{\"type\":\"HEARTBEAT\",\"client_id\":\"c1\"}";

    std::vector<char> packet;
    REQUIRE(sender.Encrypt(payload, packet));

    std::string decrypted;
    bool ok = other.Decrypt(packet.data(), packet.size(), decrypted);
    REQUIRE((!ok || decrypted != payload));
}
