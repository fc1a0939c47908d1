#include <doctest/doctest.h>
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Identity.hpp"
#include "Logger.hpp"
#include "Session.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace garlic_shell;

namespace {
    std::shared_ptr<Session> makeSession(bool audit = false) {
        return std::make_shared<Session>(
            Session::generateId(),
            Identity::generate().publicKey(),
            Crypto::sha256(std::string_view("client-endpoint")),
            std::make_shared<CommandExecutor>(30),
            audit);
    }

    CommandRequest echoRequest(uint64_t id) {
        CommandRequest request;
        request.id = id;
        request.command = "echo";
        request.args = {"session"};
        return request;
    }
}

TEST_CASE("New session is active and bound") {
    auto session = makeSession();

    CHECK(session->state() == SessionState::Active);
    CHECK(session->isActive());
    CHECK(session->idHex().size() == 32);
    CHECK(session->clientIdentity().size() == 32);
    CHECK(session->boundAddress() == Crypto::sha256(std::string_view("client-endpoint")));
    CHECK(std::string(toString(SessionState::Closed)) == "Closed");
}

TEST_CASE("Generated session ids differ") {
    CHECK(Session::generateId() != Session::generateId());
}

TEST_CASE("Ping is answered with Pong") {
    auto session = makeSession();
    auto reply = session->handleMessage(PingMessage{});
    REQUIRE(reply.has_value());
    CHECK(std::holds_alternative<PongMessage>(*reply));
}

TEST_CASE("Command request runs and echoes the id") {
    auto session = makeSession();
    auto reply = session->handleMessage(echoRequest(17));

    REQUIRE(reply.has_value());
    const auto& response = std::get<CommandResponse>(*reply);
    CHECK(response.id == 17);
    CHECK(response.status == CommandStatus::Success);
    CHECK(std::string(response.stdout_data.begin(), response.stdout_data.end()) == "session\n");
}

TEST_CASE("Invalid request raises ExecutionError and keeps the session") {
    auto session = makeSession();
    CommandRequest request = echoRequest(2);
    request.working_dir = "../secret";

    CHECK_THROWS_AS(session->handleMessage(request), ExecutionError);
    CHECK(session->isActive());
}

TEST_CASE("Disconnect is acknowledged and closes the session") {
    auto session = makeSession();
    auto reply = session->handleMessage(DisconnectMessage{std::string("done")});

    REQUIRE(reply.has_value());
    CHECK(std::get<AckMessage>(*reply).message_id == 0);
    CHECK(session->state() == SessionState::Closed);
    CHECK_FALSE(session->isActive());

    CHECK_THROWS_AS(session->handleMessage(PingMessage{}), SessionError);
}

TEST_CASE("Close is idempotent and final") {
    auto session = makeSession();
    session->close();
    session->close();

    CHECK(session->state() == SessionState::Closed);
    CHECK_THROWS_AS(session->handleMessage(echoRequest(1)), SessionError);
}

TEST_CASE("Messages without a reply") {
    auto session = makeSession();
    CHECK_FALSE(session->handleMessage(PongMessage{}).has_value());
    CHECK_FALSE(session->handleMessage(AckMessage{1}).has_value());
}

TEST_CASE("Activity refreshes the idle clock") {
    auto session = makeSession();
    const auto created = session->lastActivity();
    const std::chrono::seconds idle(900);

    CHECK_FALSE(session->isIdle(created + std::chrono::seconds(900), idle));
    CHECK(session->isIdle(created + std::chrono::seconds(901), idle));

    session->handleMessage(PingMessage{});
    CHECK(session->lastActivity() >= created);
}

TEST_CASE("Executed commands leave an audit record") {
    const std::string auditPath = (std::filesystem::temp_directory_path() /
        ("garlicshell-audit-" + std::to_string(::getpid()) + ".log")).string();
    std::filesystem::remove(auditPath);
    Logger::setAuditFile(auditPath);

    auto session = makeSession(true);
    session->handleMessage(echoRequest(5));

    std::ifstream file(auditPath);
    std::stringstream contents;
    contents << file.rdbuf();
    const std::string record = contents.str();

    CHECK(record.find("session=" + session->idHex()) != std::string::npos);
    CHECK(record.find("command=echo") != std::string::npos);
    CHECK(record.find("status=Success") != std::string::npos);
    CHECK(record.find("exit=0") != std::string::npos);

    Logger::setAuditFile("");
    std::filesystem::remove(auditPath);
}
