#include "Config.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>

namespace garlic_shell {

namespace {
    void validateSamAddress(const std::string& address) {
        if (address.empty()) {
            throw ConfigError("sam_address must not be empty");
        }
        if (address.find(':') != std::string::npos) {
            Utils::splitHostPort(address);
        }
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

void ServerConfig::validate() const {
    if (max_sessions == 0) {
        throw ConfigError("max_sessions must be at least 1");
    }
    if (command_timeout == 0) {
        throw ConfigError("command_timeout must be at least 1 second");
    }
    if (session_idle_timeout == 0) {
        throw ConfigError("session_idle_timeout must be at least 1 second");
    }
    if (audit_logging && audit_log_path.empty()) {
        throw ConfigError("audit_log_path is required when audit logging is enabled");
    }

    for (const auto& client : allowed_clients) {
        auto key = Utils::fromHex(client);
        if (!key || key->size() != SecurityParameters::KEY_SIZE) {
            throw ConfigError("allowed_clients entry is not a 32-byte hex key: " + client);
        }
    }

    if (enable_i2p) {
        validateSamAddress(sam_address);
    }
}

bool ServerConfig::isClientAllowed(const std::vector<uint8_t>& publicKey) const {
    if (allowed_clients.empty()) {
        return true;
    }

    const std::string keyHex = Utils::toHex(publicKey);
    return std::any_of(allowed_clients.begin(), allowed_clients.end(),
                       [&keyHex](const std::string& allowed) { return toLower(allowed) == keyHex; });
}

const Identity& ServerConfig::ensureIdentity() {
    if (!identity) {
        identity = Identity::generate();
    }
    return *identity;
}

void ClientConfig::validate() const {
    if (connection_timeout == 0) {
        throw ConfigError("connection_timeout must be at least 1 second");
    }
    if (command_timeout == 0) {
        throw ConfigError("command_timeout must be at least 1 second");
    }

    if (enable_i2p) {
        validateSamAddress(sam_address);
        if (!server_i2p_destination || server_i2p_destination->empty()) {
            throw ConfigError("server_i2p_destination is required when I2P is enabled");
        }
    } else {
        parseServerDestination();
    }
}

const Identity& ClientConfig::ensureIdentity() {
    if (!identity) {
        identity = Identity::generate();
    }
    return *identity;
}

Address ClientConfig::parseServerDestination() const {
    auto bytes = Utils::fromHex(server_destination);
    if (!bytes) {
        throw ConfigError("Invalid server destination hex: " + server_destination);
    }
    if (bytes->size() != SecurityParameters::ADDRESS_SIZE) {
        throw ConfigError("Server destination must be 32 bytes, got " +
                          std::to_string(bytes->size()));
    }

    Address address{};
    std::copy(bytes->begin(), bytes->end(), address.begin());
    if (std::all_of(address.begin(), address.end(), [](uint8_t b) { return b == 0; })) {
        throw ConfigError("Server destination is the all-zero placeholder");
    }
    return address;
}

} // namespace garlic_shell
