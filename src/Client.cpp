#include "Client.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Packet.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"
#include <future>

namespace garlic_shell {

namespace {
    const std::vector<std::string> CLIENT_CAPABILITIES = {"command-exec"};

    ClientConfig withIdentity(ClientConfig config) {
        config.ensureIdentity();
        return config;
    }
}

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:  return "Disconnected";
        case ConnectionState::Connecting:    return "Connecting";
        case ConnectionState::Connected:     return "Connected";
        case ConnectionState::Disconnecting: return "Disconnecting";
        default:                             return "Unknown";
    }
}

Client::Client(ClientConfig config, std::shared_ptr<NetworkInterface> iface)
    : config_(withIdentity(std::move(config))),
      interface_(std::move(iface)),
      server_address_(config_.parseServerDestination()) {}

Client::Client(ClientConfig config, std::shared_ptr<NetworkInterface> iface, Address serverAddress)
    : config_(withIdentity(std::move(config))),
      interface_(std::move(iface)),
      server_address_(serverAddress) {}

void Client::connect() {
    std::lock_guard<std::mutex> requestLock(request_mutex_);

    {
        std::unique_lock lock(state_mutex_);
        if (state_ == ConnectionState::Connected) {
            return;
        }
        state_ = ConnectionState::Connecting;
    }

    Logger::logEvent(LogLevel::Info,
        "Connecting to server " + Utils::abbreviate(Utils::toHex(server_address_)));

    ConnectMessage connect;
    connect.protocol_version = CURRENT_PROTOCOL_VERSION;
    connect.client_identity = config_.identity->publicKey();
    connect.capabilities = CLIENT_CAPABILITIES;
    connect.auth_token = config_.auth_token;

    Message reply;
    try {
        sendMessage(connect);
        reply = awaitReply(std::chrono::seconds(config_.connection_timeout));
    }
    catch (const TimeoutError&) {
        setState(ConnectionState::Disconnected);
        throw;
    }
    catch (const GarlicError& e) {
        setState(ConnectionState::Disconnected);
        throw NetworkError(std::string("Connection failed: ") + e.what());
    }

    if (const auto* accept = std::get_if<AcceptMessage>(&reply)) {
        {
            std::unique_lock lock(state_mutex_);
            state_ = ConnectionState::Connected;
            session_id_ = accept->session_id;
        }
        Logger::logEvent(LogLevel::Info,
            "Connected, session " + Utils::toHex(accept->session_id));
        return;
    }

    setState(ConnectionState::Disconnected);

    if (const auto* reject = std::get_if<RejectMessage>(&reply)) {
        Logger::logEvent(LogLevel::Warning,
            "Server rejected connection (" + std::to_string(reject->error_code) + "): " +
            reject->reason);
        throw RejectedError(reject->reason, reject->error_code);
    }

    throw NetworkError(std::string("Unexpected ") + messageName(reply) + " reply to CONNECT");
}

CommandResponse Client::executeCommand(const std::string& command,
                                       const std::vector<std::string>& args) {
    CommandRequest request;
    request.command = command;
    request.args = args;
    request.timeout = config_.command_timeout;
    return executeRequest(std::move(request));
}

CommandResponse Client::executeRequest(CommandRequest request) {
    std::lock_guard<std::mutex> requestLock(request_mutex_);
    requireConnected();

    request.id = next_request_id_.fetch_add(1);
    if (!request.timeout) {
        request.timeout = config_.command_timeout;
    }

    Logger::logEvent(LogLevel::Debug,
        "Request " + std::to_string(request.id) + ": " + request.command);

    const uint64_t requestId = request.id;
    // The server may legitimately spend the whole command timeout executing
    const auto waitLimit = std::chrono::seconds(*request.timeout + config_.connection_timeout);

    sendMessage(request);

    Message reply;
    try {
        reply = awaitReply(waitLimit);
    }
    catch (const TimeoutError&) {
        dropConnection();
        throw;
    }

    auto* response = std::get_if<CommandResponse>(&reply);
    if (!response) {
        std::string detail = messageName(reply);
        if (const auto* reject = std::get_if<RejectMessage>(&reply)) {
            detail += " (" + reject->reason + ")";
        }
        throw ProtocolError(ErrorCode::InvalidFormat,
            "Expected COMMAND_RESPONSE, got " + detail);
    }
    if (response->id != requestId) {
        throw ProtocolError(ErrorCode::InvalidFormat,
            "Response id " + std::to_string(response->id) +
            " does not match request " + std::to_string(requestId));
    }

    return std::move(*response);
}

std::chrono::milliseconds Client::ping() {
    std::lock_guard<std::mutex> requestLock(request_mutex_);
    requireConnected();

    const auto start = std::chrono::steady_clock::now();
    sendMessage(PingMessage{});

    Message reply;
    try {
        reply = awaitReply(std::chrono::seconds(config_.connection_timeout));
    }
    catch (const TimeoutError&) {
        dropConnection();
        throw;
    }

    if (!std::holds_alternative<PongMessage>(reply)) {
        throw ProtocolError(ErrorCode::InvalidFormat,
            std::string("Expected PONG, got ") + messageName(reply));
    }

    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

void Client::disconnect() {
    std::lock_guard<std::mutex> requestLock(request_mutex_);

    bool wasConnected = false;
    {
        std::unique_lock lock(state_mutex_);
        if (state_ == ConnectionState::Disconnected) {
            return;
        }
        wasConnected = state_ == ConnectionState::Connected;
        state_ = ConnectionState::Disconnecting;
    }

    if (wasConnected) {
        try {
            sendMessage(DisconnectMessage{std::string("client disconnect")});
        }
        catch (const GarlicError& e) {
            Logger::logEvent(LogLevel::Warning,
                std::string("Could not notify server of disconnect: ") + e.what());
        }
    }

    {
        std::unique_lock lock(state_mutex_);
        state_ = ConnectionState::Disconnected;
        session_id_.reset();
    }
    Logger::logEvent(LogLevel::Info, "Disconnected");
}

bool Client::isConnected() const {
    return state() == ConnectionState::Connected;
}

ConnectionState Client::state() const {
    std::shared_lock lock(state_mutex_);
    return state_;
}

std::optional<SessionId> Client::sessionId() const {
    std::shared_lock lock(state_mutex_);
    return session_id_;
}

void Client::sendMessage(const Message& message) {
    interface_->send(Packet::makeData(server_address_, ProtocolCodec::encode(message)));
}

Message Client::awaitReply(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto iface = interface_;

    for (;;) {
        auto pending = std::async(std::launch::async, [iface] { return iface->receive(); });

        if (pending.wait_until(deadline) != std::future_status::ready) {
            // Unblocks the receiving thread so the future can be released
            interface_->close();
            throw TimeoutError("No reply within " + std::to_string(timeout.count()) + " ms");
        }

        Packet packet = pending.get();
        if (packet.destination != server_address_) {
            Logger::logEvent(LogLevel::Security,
                "Dropping packet from " + Utils::abbreviate(Utils::toHex(packet.destination)) +
                ", not the server");
            continue;
        }
        std::vector<uint8_t> buffer = std::move(packet.data);
        auto message = ProtocolCodec::decode(buffer);
        if (!message) {
            throw ProtocolError(ErrorCode::InvalidFormat, "Reply packet holds an incomplete frame");
        }

        // Acks to an earlier best-effort DISCONNECT are never awaited
        if (std::holds_alternative<AckMessage>(*message)) {
            Logger::logEvent(LogLevel::Debug, "Skipping stray ACK");
            continue;
        }
        return std::move(*message);
    }
}

void Client::setState(ConnectionState state) {
    std::unique_lock lock(state_mutex_);
    state_ = state;
}

void Client::requireConnected() const {
    if (!isConnected()) {
        throw NotConnectedError();
    }
}

void Client::dropConnection() {
    std::unique_lock lock(state_mutex_);
    state_ = ConnectionState::Disconnected;
    session_id_.reset();
}

} // namespace garlic_shell
