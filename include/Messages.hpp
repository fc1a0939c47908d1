#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "SecureTypes.hpp"

namespace garlic_shell {

using ProtocolVersion = uint32_t;

// Client initiates connection
struct ConnectMessage {
    ProtocolVersion protocol_version = 0;
    std::vector<uint8_t> client_identity;   // Ed25519 public key
    std::vector<std::string> capabilities;
    std::optional<std::string> auth_token;

    bool operator==(const ConnectMessage&) const = default;
};

// Server accepts connection
struct AcceptMessage {
    ProtocolVersion protocol_version = 0;
    std::vector<uint8_t> server_identity;
    SessionId session_id{};
    std::vector<std::string> capabilities;

    bool operator==(const AcceptMessage&) const = default;
};

// Server rejects connection
struct RejectMessage {
    std::string reason;
    uint32_t error_code = 0;

    bool operator==(const RejectMessage&) const = default;
};

struct CommandRequest {
    uint64_t id = 0;                         // echoed back in the response
    std::string command;
    std::vector<std::string> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<uint64_t> timeout;         // seconds
    std::optional<std::string> working_dir;

    bool operator==(const CommandRequest&) const = default;
};

enum class CommandStatus : uint8_t {
    Success = 0,
    Timeout = 1,
    Error = 2,
    Killed = 3
};

struct CommandResponse {
    uint64_t id = 0;
    CommandStatus status = CommandStatus::Error;
    std::vector<uint8_t> stdout_data;
    std::vector<uint8_t> stderr_data;
    int32_t exit_code = -1;
    uint64_t execution_time_ms = 0;

    bool operator==(const CommandResponse&) const = default;
};

struct DisconnectMessage {
    std::optional<std::string> reason;

    bool operator==(const DisconnectMessage&) const = default;
};

struct AckMessage {
    uint64_t message_id = 0;

    bool operator==(const AckMessage&) const = default;
};

struct PingMessage {
    bool operator==(const PingMessage&) const = default;
};

struct PongMessage {
    bool operator==(const PongMessage&) const = default;
};

// Alternative order is part of the wire format: the variant index is the
// leading field of every serialized payload
using Message = std::variant<
    ConnectMessage,
    AcceptMessage,
    RejectMessage,
    CommandRequest,
    CommandResponse,
    DisconnectMessage,
    AckMessage,
    PingMessage,
    PongMessage>;

// Advisory frame type byte
enum class MessageType : uint8_t {
    Connect = 0x01,
    Accept = 0x02,
    Reject = 0x03,
    CommandRequest = 0x10,
    CommandResponse = 0x11,
    Disconnect = 0x20,
    Ack = 0x21,
    Ping = 0x30,
    Pong = 0x31
};

MessageType messageType(const Message& message);
const char* messageName(const Message& message);
const char* toString(CommandStatus status);

// Self-describing payload serialization; the codec adds framing
std::vector<uint8_t> serializeMessage(const Message& message);
Message deserializeMessage(const uint8_t* data, size_t length);

} // namespace garlic_shell
