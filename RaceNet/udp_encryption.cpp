#include "udp_encryption.h"
#include "utils.h"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {
    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherContext MakeContext() {
        return CipherContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    }

    void WriteLength(std::vector<char>& out, uint32_t length) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<char>((length >> (8 * i)) & 0xFF));
        }
    }

    uint32_t ReadLength(const char* data) {
        uint32_t length = 0;
        for (int i = 0; i < 4; ++i) {
            length |= static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << (8 * i);
        }
        return length;
    }
}

UdpEncryption::UdpEncryption(const std::string& clientId, const std::string& sharedSecret) {
    std::string material = clientId + sharedSecret;
    unsigned int digestLength = 0;
    if (EVP_Digest(material.data(), material.size(), key.data(), &digestLength, EVP_sha256(), nullptr) != 1 ||
        digestLength != KEY_SIZE) {
        throw std::runtime_error("Failed to derive datagram key");
    }
}

bool UdpEncryption::Encrypt(const std::string& plaintext, std::vector<char>& outPacket) const {
    std::array<unsigned char, IV_SIZE> iv;
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        Utils::printMsg("RAND_bytes failed, datagram not sent", error);
        return false;
    }

    CipherContext context = MakeContext();
    if (!context || EVP_EncryptInit_ex(context.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        return false;
    }

    std::vector<unsigned char> cipherText(plaintext.size() + BLOCK_SIZE);
    int written = 0;
    int finalWritten = 0;
    if (EVP_EncryptUpdate(context.get(), cipherText.data(), &written,
            reinterpret_cast<const unsigned char*>(plaintext.data()), static_cast<int>(plaintext.size())) != 1 ||
        EVP_EncryptFinal_ex(context.get(), cipherText.data() + written, &finalWritten) != 1) {
        return false;
    }
    std::size_t cipherSize = static_cast<std::size_t>(written + finalWritten);

    outPacket.clear();
    outPacket.reserve(HEADER_SIZE + IV_SIZE + cipherSize);
    WriteLength(outPacket, static_cast<uint32_t>(IV_SIZE + cipherSize));
    outPacket.insert(outPacket.end(), iv.begin(), iv.end());
    outPacket.insert(outPacket.end(), cipherText.begin(), cipherText.begin() + cipherSize);
    return true;
}

bool UdpEncryption::Decrypt(const char* data, std::size_t size, std::string& outPlaintext) const {
    if (size < HEADER_SIZE + IV_SIZE + BLOCK_SIZE) {
        return false;
    }

    uint32_t length = ReadLength(data);
    if (length != size - HEADER_SIZE) {
        return false;
    }

    std::size_t cipherSize = length - IV_SIZE;
    if (cipherSize % BLOCK_SIZE != 0) {
        return false;
    }

    const unsigned char* iv = reinterpret_cast<const unsigned char*>(data + HEADER_SIZE);
    const unsigned char* cipherText = iv + IV_SIZE;

    CipherContext context = MakeContext();
    if (!context || EVP_DecryptInit_ex(context.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv) != 1) {
        return false;
    }

    std::vector<unsigned char> plain(cipherSize + BLOCK_SIZE);
    int written = 0;
    int finalWritten = 0;
    if (EVP_DecryptUpdate(context.get(), plain.data(), &written, cipherText, static_cast<int>(cipherSize)) != 1 ||
        EVP_DecryptFinal_ex(context.get(), plain.data() + written, &finalWritten) != 1) {
        return false;
    }

    outPlaintext.assign(reinterpret_cast<const char*>(plain.data()), static_cast<std::size_t>(written + finalWritten));
    return true;
}
