#include <doctest/doctest.h>
#include "Client.hpp"
#include "Errors.hpp"
#include "LoopbackInterface.hpp"
#include "Protocol.hpp"
#include "Server.hpp"
#include "Utils.hpp"
#include <thread>

using namespace garlic_shell;

namespace {
    ServerConfig serverConfig() {
        ServerConfig config;
        config.audit_logging = false;
        config.max_sessions = 4;
        return config;
    }

    ClientConfig clientConfig() {
        ClientConfig config;
        config.connection_timeout = 5;
        config.command_timeout = 10;
        return config;
    }

    // Server running on the "server" end of a loopback pair
    struct RunningServer {
        LoopbackInterface::Pair pair = LoopbackInterface::createPair();
        Server server;
        std::thread thread;

        explicit RunningServer(ServerConfig config = serverConfig())
            : server(std::move(config)) {
            thread = std::thread([this] { server.run(pair.second); });
        }

        ~RunningServer() {
            server.stop();
            if (thread.joinable()) {
                thread.join();
            }
        }

        Client makeClient(ClientConfig config = clientConfig()) {
            return Client(std::move(config), pair.first, pair.second->localAddress());
        }
    };

    Message roundTrip(LoopbackInterface& from, const Address& to, const Message& message) {
        from.send(Packet::makeData(to, ProtocolCodec::encode(message)));
        Packet reply = from.receive();
        auto decoded = ProtocolCodec::decode(reply.data);
        REQUIRE(decoded.has_value());
        return *decoded;
    }
}

TEST_CASE("Connect, execute, ping and disconnect") {
    RunningServer running;
    Client client = running.makeClient();

    CHECK(client.state() == ConnectionState::Disconnected);
    client.connect();
    CHECK(client.isConnected());
    REQUIRE(client.sessionId().has_value());
    CHECK(running.server.listener().sessionCount() == 1);

    // Connecting twice is a no-op
    const auto sessionId = *client.sessionId();
    client.connect();
    CHECK(*client.sessionId() == sessionId);

    CommandResponse first = client.executeCommand("echo", {"hello", "garlic"});
    CHECK(first.status == CommandStatus::Success);
    CHECK(first.exit_code == 0);
    CHECK(std::string(first.stdout_data.begin(), first.stdout_data.end()) == "hello garlic\n");

    CommandResponse second = client.executeCommand("sh", {"-c", "echo oops >&2; exit 3"});
    CHECK(second.id == first.id + 1);
    CHECK(second.status == CommandStatus::Error);
    CHECK(second.exit_code == 3);
    CHECK(std::string(second.stderr_data.begin(), second.stderr_data.end()) == "oops\n");

    CHECK(client.ping() < std::chrono::seconds(5));

    client.disconnect();
    CHECK(client.state() == ConnectionState::Disconnected);
    CHECK_FALSE(client.sessionId().has_value());
    client.disconnect();
}

TEST_CASE("Requests before connecting are refused locally") {
    RunningServer running;
    Client client = running.makeClient();

    CHECK_THROWS_AS(client.executeCommand("echo"), NotConnectedError);
    CHECK_THROWS_AS(client.ping(), NotConnectedError);
}

TEST_CASE("Rejected validation comes back as an error response") {
    RunningServer running;
    Client client = running.makeClient();
    client.connect();

    CommandRequest request;
    request.command = "ls";
    request.working_dir = "/tmp/../etc";
    CommandResponse response = client.executeRequest(request);

    CHECK(response.status == CommandStatus::Error);
    CHECK(response.exit_code == -1);
    CHECK(std::string(response.stderr_data.begin(), response.stderr_data.end())
              .find("Path traversal") != std::string::npos);
    CHECK(client.isConnected());
}

TEST_CASE("Reconnect after disconnect gets a new session") {
    RunningServer running;
    Client client = running.makeClient();

    client.connect();
    const auto firstId = *client.sessionId();
    client.disconnect();

    client.connect();
    CHECK(*client.sessionId() != firstId);
    CHECK(client.executeCommand("true").status == CommandStatus::Success);
}

TEST_CASE("Server rejects clients outside the allow-list") {
    ServerConfig config = serverConfig();
    config.allowed_clients = {Utils::toHex(Identity::generate().publicKey())};
    RunningServer running(std::move(config));
    Client client = running.makeClient();

    try {
        client.connect();
        FAIL("expected RejectedError");
    }
    catch (const RejectedError& e) {
        CHECK(e.rejectCode() == reject_code::NOT_AUTHORIZED);
        CHECK(e.reason() == "Client not authorized");
    }
    CHECK(client.state() == ConnectionState::Disconnected);
}

TEST_CASE("Raw requests without a session are rejected") {
    Server server(serverConfig());
    auto [clientEnd, serverEnd] = LoopbackInterface::createPair();

    CommandRequest request;
    request.id = 1;
    request.command = "id";
    clientEnd->send(Packet::makeData(serverEnd->localAddress(), ProtocolCodec::encode(request)));
    server.processPacket(*serverEnd, serverEnd->receive());

    Packet packet = clientEnd->receive();
    auto reply = ProtocolCodec::decode(packet.data);
    REQUIRE(reply.has_value());
    const auto& reject = std::get<RejectMessage>(*reply);
    CHECK(reject.error_code == reject_code::NO_SESSION);
    CHECK(reject.reason == "No active session");

    // Other messages from an unknown peer must start with CONNECT
    clientEnd->send(Packet::makeData(serverEnd->localAddress(), ProtocolCodec::encode(PongMessage{})));
    server.processPacket(*serverEnd, serverEnd->receive());
    packet = clientEnd->receive();
    reply = ProtocolCodec::decode(packet.data);
    REQUIRE(reply.has_value());
    CHECK(std::get<RejectMessage>(*reply).error_code == reject_code::EXPECTED_CONNECT);
}

TEST_CASE("Malformed packets are dropped without a reply") {
    RunningServer running;
    auto& clientEnd = *running.pair.first;
    const Address server = running.pair.second->localAddress();

    clientEnd.send(Packet::makeData(server, {0x00, 0x00, 0x00, 0x02, 0xEE, 0x01}));

    Message reply = roundTrip(clientEnd, server, ConnectMessage{
        CURRENT_PROTOCOL_VERSION, Identity::generate().publicKey(), {"command-exec"}, std::nullopt});
    CHECK(std::holds_alternative<AcceptMessage>(reply));
}

TEST_CASE("Several frames in one packet are answered in order") {
    RunningServer running;
    auto& clientEnd = *running.pair.first;
    const Address server = running.pair.second->localAddress();

    std::vector<uint8_t> data = ProtocolCodec::encode(ConnectMessage{
        CURRENT_PROTOCOL_VERSION, Identity::generate().publicKey(), {"command-exec"}, std::nullopt});
    auto ping = ProtocolCodec::encode(PingMessage{});
    data.insert(data.end(), ping.begin(), ping.end());
    clientEnd.send(Packet::makeData(server, data));

    Packet firstPacket = clientEnd.receive();
    Packet secondPacket = clientEnd.receive();
    auto first = ProtocolCodec::decode(firstPacket.data);
    auto second = ProtocolCodec::decode(secondPacket.data);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(std::holds_alternative<AcceptMessage>(*first));
    CHECK(std::holds_alternative<PongMessage>(*second));
}

TEST_CASE("Connect without a server times out") {
    auto [clientEnd, serverEnd] = LoopbackInterface::createPair();
    ClientConfig config = clientConfig();
    config.connection_timeout = 1;
    Client client(std::move(config), clientEnd, serverEnd->localAddress());

    CHECK_THROWS_AS(client.connect(), TimeoutError);
    CHECK(client.state() == ConnectionState::Disconnected);
    CHECK_FALSE(clientEnd->isReady());
}

TEST_CASE("Stopping the server closes every session") {
    auto running = std::make_unique<RunningServer>();
    Client client = running->makeClient();
    client.connect();
    CHECK(running->server.listener().sessionCount() == 1);

    running->server.stop();
    running->thread.join();
    CHECK_FALSE(running->server.isRunning());
    CHECK(running->server.listener().sessionCount() == 0);

    // run() on a stopped server returns at once
    running->server.run(running->pair.second);
}

TEST_CASE("Client built from config parses the server destination") {
    auto [clientEnd, serverEnd] = LoopbackInterface::createPair();
    ClientConfig config = clientConfig();
    config.server_destination = Utils::toHex(serverEnd->localAddress());

    Client client(std::move(config), clientEnd);
    CHECK(client.serverAddress() == serverEnd->localAddress());

    ClientConfig placeholder = clientConfig();
    CHECK_THROWS_AS(Client(std::move(placeholder), clientEnd), ConfigError);
}
