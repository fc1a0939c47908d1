#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Identity.hpp"
#include "SecureTypes.hpp"

namespace garlic_shell {

constexpr const char* DEFAULT_SAM_ADDRESS = "127.0.0.1:7656";

struct ServerConfig {
    // Unset until loaded, assigned or generated by ensureIdentity()
    std::optional<Identity> identity;
    std::string identity_path = "server.identity";

    size_t max_sessions = 10;
    uint64_t command_timeout = 300;         // seconds
    uint64_t session_idle_timeout = 900;    // seconds

    bool audit_logging = true;
    std::string audit_log_path = "audit.log";

    // Lowercase hex public keys; empty allows every client
    std::vector<std::string> allowed_clients;

    bool enable_i2p = false;
    std::string sam_address = DEFAULT_SAM_ADDRESS;

    // Throws ConfigError on out-of-range values
    void validate() const;

    bool isClientAllowed(const std::vector<uint8_t>& publicKey) const;

    // Generates a throwaway identity when none is set
    const Identity& ensureIdentity();
};

struct ClientConfig {
    std::optional<Identity> identity;
    std::string identity_path = "client.identity";

    // Hex of the server's 32-byte address
    std::string server_destination = std::string(64, '0');

    uint64_t connection_timeout = 30;       // seconds
    uint64_t command_timeout = 300;         // seconds

    std::optional<std::string> auth_token;

    bool enable_i2p = false;
    std::string sam_address = DEFAULT_SAM_ADDRESS;

    // Full overlay destination of the server
    std::optional<std::string> server_i2p_destination;

    void validate() const;

    const Identity& ensureIdentity();

    // Throws ConfigError on bad hex, wrong length or the all-zero placeholder
    Address parseServerDestination() const;
};

} // namespace garlic_shell
