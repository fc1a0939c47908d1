#pragma once

#include <string_view>
#include <vector>
#include "SecureTypes.hpp"

namespace garlic_shell {

struct Ed25519KeyPair {
    std::vector<uint8_t> privateKey;
    std::vector<uint8_t> publicKey;

    Ed25519KeyPair() = default;
    Ed25519KeyPair(Ed25519KeyPair&&) = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) = default;
    ~Ed25519KeyPair();
};

class Crypto {
public:
    // Ed25519 signatures
    static Ed25519KeyPair generateSigningKeyPair();
    static std::vector<uint8_t> derivePublicKey(const std::vector<uint8_t>& privateKey);
    static std::vector<uint8_t> ed25519Sign(
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& privateKey);
    static bool ed25519Verify(
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& signature,
        const std::vector<uint8_t>& publicKey);

    // Hashing
    static Address sha256(const uint8_t* data, size_t length);
    static Address sha256(const std::vector<uint8_t>& data);
    static Address sha256(std::string_view data);

    static std::vector<uint8_t> randomBytes(size_t count);

    // Secure memory wiping
    static void secureWipe(std::vector<uint8_t>& data);

private:
    // Prevent instantiation
    Crypto() = delete;
    ~Crypto() = delete;
    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;
};

} // namespace garlic_shell
