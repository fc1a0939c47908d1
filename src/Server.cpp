#include "Server.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"

namespace garlic_shell {

Server::Server(ServerConfig config) : listener_(std::move(config)) {
    const ServerConfig& cfg = listener_.config();
    cfg.validate();

    if (cfg.audit_logging) {
        Logger::setAuditFile(cfg.audit_log_path);
    }

    Logger::logEvent(LogLevel::Info,
        "Server identity " + cfg.identity->addressHex() +
        ", max sessions " + std::to_string(cfg.max_sessions));
}

Server::~Server() {
    stop();
    if (janitor_.joinable()) {
        janitor_.join();
    }
}

void Server::processPacket(NetworkInterface& iface, const Packet& packet) {
    const Address& sender = packet.destination;

    std::vector<Message> messages;
    try {
        std::vector<uint8_t> buffer = packet.data;
        messages = ProtocolCodec::decodeMultiple(buffer);
        if (!buffer.empty()) {
            Logger::logEvent(LogLevel::Warning,
                "Dropping " + std::to_string(buffer.size()) + " trailing bytes from " +
                Utils::abbreviate(Utils::toHex(sender)));
        }
    }
    catch (const ProtocolError& e) {
        Logger::logError(e.code(),
            "Dropping packet from " + Utils::abbreviate(Utils::toHex(sender)) + ": " + e.what());
        return;
    }

    for (const auto& message : messages) {
        dispatch(iface, sender, message);
    }
}

void Server::dispatch(NetworkInterface& iface, const Address& sender, const Message& message) {
    if (std::holds_alternative<ConnectMessage>(message)) {
        reply(iface, sender, listener_.handleConnection(message, sender));
        return;
    }

    const auto* request = std::get_if<CommandRequest>(&message);
    auto session = listener_.sessionFor(sender);

    if (!session) {
        if (request) {
            Logger::logEvent(LogLevel::Security,
                "Command request from " + Utils::abbreviate(Utils::toHex(sender)) +
                " without a session");
            reply(iface, sender, RejectMessage{"No active session", reject_code::NO_SESSION});
        } else if (std::holds_alternative<PingMessage>(message) ||
                   std::holds_alternative<DisconnectMessage>(message)) {
            Logger::logEvent(LogLevel::Debug,
                std::string("Dropping ") + messageName(message) + " from peer without a session");
        } else {
            reply(iface, sender, listener_.handleConnection(message, sender));
        }
        return;
    }

    try {
        if (auto response = session->handleMessage(message)) {
            reply(iface, sender, *response);
        }
    }
    catch (const ExecutionError& e) {
        Logger::logEvent(LogLevel::Warning,
            "Session " + session->idHex() + " request rejected: " + e.what());

        CommandResponse response;
        response.id = request ? request->id : 0;
        response.status = CommandStatus::Error;
        response.exit_code = -1;
        const std::string reason = e.what();
        response.stderr_data.assign(reason.begin(), reason.end());
        reply(iface, sender, response);
    }
    catch (const SessionError& e) {
        Logger::logError(e.code(), e.what());
    }
}

void Server::reply(NetworkInterface& iface, const Address& recipient, const Message& message) {
    try {
        iface.send(Packet::makeData(recipient, ProtocolCodec::encode(message)));
    }
    catch (const GarlicError& e) {
        Logger::logError(e.code(),
            std::string("Failed to send ") + messageName(message) + " to " +
            Utils::abbreviate(Utils::toHex(recipient)) + ": " + e.what());
    }
}

void Server::run(std::shared_ptr<NetworkInterface> iface) {
    {
        std::lock_guard<std::mutex> lock(interface_mutex_);
        if (stopped_) {
            return;
        }
        if (running_.exchange(true)) {
            throw NetworkError("Server is already running");
        }
        interface_ = iface;
    }

    if (janitor_.joinable()) {
        janitor_.join();
    }
    janitor_ = std::thread(&Server::janitorLoop, this);

    Logger::logEvent(LogLevel::Info, "Server listening on " + iface->name());

    while (running_) {
        try {
            Packet packet = iface->receive();
            processPacket(*iface, packet);
        }
        catch (const ConnectionClosedError&) {
            break;
        }
        catch (const GarlicError& e) {
            if (!running_ || !iface->isReady()) {
                break;
            }
            Logger::logError(e.code(), std::string("Receive failed: ") + e.what());
        }
    }

    stop();
    if (janitor_.joinable()) {
        janitor_.join();
    }
    Logger::logEvent(LogLevel::Info, "Server stopped");
}

void Server::stop() {
    std::shared_ptr<NetworkInterface> iface;
    {
        std::lock_guard<std::mutex> lock(interface_mutex_);
        stopped_ = true;
        iface = std::move(interface_);
        interface_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(janitor_mutex_);
        running_ = false;
    }
    janitor_wakeup_.notify_all();

    listener_.closeAll();
    if (iface) {
        iface->close();
    }
}

void Server::janitorLoop() {
    std::unique_lock<std::mutex> lock(janitor_mutex_);
    while (running_) {
        janitor_wakeup_.wait_for(lock, CLEANUP_INTERVAL, [this] { return !running_; });
        if (!running_) {
            break;
        }

        lock.unlock();
        listener_.cleanupSessions();
        lock.lock();
    }
}

} // namespace garlic_shell
