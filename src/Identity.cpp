#include "Identity.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace garlic_shell {

Identity::Identity(std::vector<uint8_t> privateKey, std::vector<uint8_t> publicKey)
    : private_key_(std::move(privateKey)), public_key_(std::move(publicKey)) {}

Identity::~Identity() {
    Crypto::secureWipe(private_key_);
}

Identity Identity::generate() {
    auto kp = Crypto::generateSigningKeyPair();
    Identity identity(kp.privateKey, kp.publicKey);
    Logger::logEvent(LogLevel::Security,
        "Generated new identity " + Utils::abbreviate(identity.addressHex()));
    return identity;
}

Identity Identity::fromBytes(const std::vector<uint8_t>& privateKey) {
    if (privateKey.size() != SecurityParameters::KEY_SIZE) {
        throw IdentityError("Private key must be 32 bytes, got " +
                            std::to_string(privateKey.size()));
    }

    try {
        auto publicKey = Crypto::derivePublicKey(privateKey);
        return Identity(privateKey, std::move(publicKey));
    }
    catch (const CryptoError& e) {
        throw IdentityError(std::string("Unusable private key: ") + e.what());
    }
}

Identity Identity::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IdentityError("Cannot open identity file " + path);
    }

    std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IdentityError("Failed to read identity file " + path);
    }

    Identity identity = fromBytes(blob);
    Crypto::secureWipe(blob);
    Logger::logEvent(LogLevel::Info,
        "Loaded identity " + Utils::abbreviate(identity.addressHex()) + " from " + path);
    return identity;
}

void Identity::saveToFile(const std::string& path) const {
    namespace fs = std::filesystem;

    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IdentityError("Cannot create identity file " + path);
        }
        file.write(reinterpret_cast<const char*>(private_key_.data()),
                   static_cast<std::streamsize>(private_key_.size()));
        if (!file) {
            throw IdentityError("Failed to write identity file " + path);
        }
    }

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        Logger::logEvent(LogLevel::Warning,
            "Could not restrict permissions on " + path + ": " + ec.message());
    }

    Logger::logEvent(LogLevel::Security, "Identity saved to " + path);
}

Address Identity::address() const {
    return hashFromPublicKey(public_key_);
}

std::string Identity::addressHex() const {
    return Utils::toHex(address());
}

std::vector<uint8_t> Identity::sign(const std::vector<uint8_t>& data) const {
    return Crypto::ed25519Sign(data, private_key_);
}

void Identity::verify(const std::vector<uint8_t>& data,
                      const std::vector<uint8_t>& signature) const {
    verifyExternal(public_key_, data, signature);
}

void Identity::verifyExternal(const std::vector<uint8_t>& publicKey,
                              const std::vector<uint8_t>& data,
                              const std::vector<uint8_t>& signature) {
    if (publicKey.size() != SecurityParameters::KEY_SIZE) {
        throw CryptoError("Public key must be 32 bytes");
    }
    if (signature.size() != SecurityParameters::SIGNATURE_SIZE) {
        throw CryptoError("Signature must be 64 bytes");
    }

    if (!Crypto::ed25519Verify(data, signature, publicKey)) {
        Logger::logEvent(LogLevel::Security,
            "Signature verification failed for key " +
            Utils::abbreviate(Utils::toHex(publicKey)));
        throw CryptoError("Signature verification failed");
    }
}

Address Identity::hashFromPublicKey(const std::vector<uint8_t>& publicKey) {
    return Crypto::sha256(publicKey);
}

} // namespace garlic_shell
