#include <doctest/doctest.h>
#include "Config.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <cctype>

using namespace garlic_shell;

TEST_CASE("Server defaults") {
    ServerConfig config;

    CHECK(config.identity_path == "server.identity");
    CHECK(config.max_sessions == 10);
    CHECK(config.command_timeout == 300);
    CHECK(config.session_idle_timeout == 900);
    CHECK(config.audit_logging);
    CHECK(config.audit_log_path == "audit.log");
    CHECK(config.allowed_clients.empty());
    CHECK_FALSE(config.enable_i2p);
    CHECK(config.sam_address == "127.0.0.1:7656");
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("Client defaults") {
    ClientConfig config;

    CHECK(config.identity_path == "client.identity");
    CHECK(config.server_destination == std::string(64, '0'));
    CHECK(config.connection_timeout == 30);
    CHECK(config.command_timeout == 300);
    CHECK_FALSE(config.auth_token.has_value());
    CHECK_FALSE(config.server_i2p_destination.has_value());
}

TEST_CASE("Identity is only generated on demand") {
    ServerConfig server;
    ClientConfig client;
    CHECK_FALSE(server.identity.has_value());
    CHECK_FALSE(client.identity.has_value());

    const auto serverKey = server.ensureIdentity().publicKey();
    CHECK(serverKey.size() == 32);
    CHECK(server.ensureIdentity().publicKey() == serverKey);

    Identity loaded = Identity::generate();
    client.identity = loaded;
    CHECK(client.ensureIdentity().publicKey() == loaded.publicKey());
}

TEST_CASE("Server validation rejects bad values") {
    ServerConfig config;

    SUBCASE("zero sessions") {
        config.max_sessions = 0;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SUBCASE("zero command timeout") {
        config.command_timeout = 0;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SUBCASE("zero idle timeout") {
        config.session_idle_timeout = 0;
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SUBCASE("audit without a path") {
        config.audit_log_path.clear();
        CHECK_THROWS_AS(config.validate(), ConfigError);
        config.audit_logging = false;
        CHECK_NOTHROW(config.validate());
    }
    SUBCASE("malformed allow-list entry") {
        config.allowed_clients = {"abcd"};
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SUBCASE("bad SAM address with I2P enabled") {
        config.enable_i2p = true;
        config.sam_address = "127.0.0.1:99999";
        CHECK_THROWS_AS(config.validate(), ConfigError);
        config.sam_address = "localhost";
        CHECK_NOTHROW(config.validate());
    }
}

TEST_CASE("Allow-list matching ignores hex case") {
    ServerConfig config;
    Identity allowed = Identity::generate();
    Identity other = Identity::generate();

    CHECK(config.isClientAllowed(other.publicKey()));

    std::string upper = Utils::toHex(allowed.publicKey());
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    config.allowed_clients = {upper};

    CHECK_NOTHROW(config.validate());
    CHECK(config.isClientAllowed(allowed.publicKey()));
    CHECK_FALSE(config.isClientAllowed(other.publicKey()));
}

TEST_CASE("Server destination parsing") {
    ClientConfig config;

    SUBCASE("placeholder is rejected") {
        CHECK_THROWS_AS(config.parseServerDestination(), ConfigError);
        CHECK_THROWS_AS(config.validate(), ConfigError);
    }
    SUBCASE("bad hex") {
        config.server_destination = std::string(63, 'a') + "g";
        CHECK_THROWS_AS(config.parseServerDestination(), ConfigError);
    }
    SUBCASE("wrong length") {
        config.server_destination = std::string(62, 'a');
        CHECK_THROWS_AS(config.parseServerDestination(), ConfigError);
    }
    SUBCASE("valid address") {
        Identity server = Identity::generate();
        config.server_destination = server.addressHex();
        CHECK(config.parseServerDestination() == server.address());
        CHECK_NOTHROW(config.validate());
    }
}

TEST_CASE("I2P client mode needs the server's overlay destination") {
    ClientConfig config;
    config.enable_i2p = true;
    CHECK_THROWS_AS(config.validate(), ConfigError);

    config.server_i2p_destination = "serverDest~~";
    CHECK_NOTHROW(config.validate());

    config.connection_timeout = 0;
    CHECK_THROWS_AS(config.validate(), ConfigError);
}
