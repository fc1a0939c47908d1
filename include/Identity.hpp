#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "SecureTypes.hpp"

namespace garlic_shell {

/**
 * Ed25519 identity of a shell endpoint.
 *
 * The address is SHA-256 of the public key and is recomputed on every call,
 * so it can never drift from the key. Only the private key is persisted;
 * everything else is re-derived on load.
 */
class Identity {
public:
    static Identity generate();

    // Throws IdentityError unless privateKey is exactly 32 bytes
    static Identity fromBytes(const std::vector<uint8_t>& privateKey);
    static Identity load(const std::vector<uint8_t>& blob) { return fromBytes(blob); }

    static Identity loadFromFile(const std::string& path);
    void saveToFile(const std::string& path) const;

    Identity(const Identity& other) = default;
    Identity& operator=(const Identity& other) = default;
    Identity(Identity&& other) = default;
    Identity& operator=(Identity&& other) = default;
    ~Identity();

    const std::vector<uint8_t>& publicKey() const { return public_key_; }
    const std::vector<uint8_t>& privateKey() const { return private_key_; }
    std::vector<uint8_t> save() const { return private_key_; }

    Address address() const;
    std::string addressHex() const;

    std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const;

    // Throws CryptoError on a malformed or rejected signature
    void verify(const std::vector<uint8_t>& data,
                const std::vector<uint8_t>& signature) const;

    static void verifyExternal(const std::vector<uint8_t>& publicKey,
                               const std::vector<uint8_t>& data,
                               const std::vector<uint8_t>& signature);

    static Address hashFromPublicKey(const std::vector<uint8_t>& publicKey);

private:
    Identity(std::vector<uint8_t> privateKey, std::vector<uint8_t> publicKey);

    std::vector<uint8_t> private_key_;
    std::vector<uint8_t> public_key_;
};

} // namespace garlic_shell
