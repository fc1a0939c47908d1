#include "Listener.hpp"
#include "Logger.hpp"
#include "Protocol.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <mutex>

namespace garlic_shell {

namespace {
    const std::vector<std::string> SERVER_CAPABILITIES = {"command-exec"};

    Message reject(const std::string& reason, uint32_t code) {
        return RejectMessage{reason, code};
    }
}

namespace {
    ServerConfig withIdentity(ServerConfig config) {
        config.ensureIdentity();
        return config;
    }
}

Listener::Listener(ServerConfig config)
    : config_(withIdentity(std::move(config))),
      executor_(std::make_shared<CommandExecutor>(config_.command_timeout)) {}

Message Listener::handleConnection(const Message& message, const Address& senderAddress) {
    if (const auto* connect = std::get_if<ConnectMessage>(&message)) {
        return handleConnect(*connect, senderAddress);
    }

    Logger::logEvent(LogLevel::Warning,
        std::string("Expected CONNECT from unknown peer, got ") + messageName(message));
    return reject("Expected CONNECT message", reject_code::EXPECTED_CONNECT);
}

Message Listener::handleConnect(const ConnectMessage& connect, const Address& senderAddress) {
    const std::string clientHex = Utils::toHex(connect.client_identity);

    Logger::logEvent(LogLevel::Debug,
        "CONNECT from " + Utils::abbreviate(clientHex) +
        " version " + std::to_string(connect.protocol_version));

    if (connect.protocol_version != CURRENT_PROTOCOL_VERSION) {
        Logger::logEvent(LogLevel::Security,
            "Rejected " + Utils::abbreviate(clientHex) + ": protocol version " +
            std::to_string(connect.protocol_version));
        return reject("Protocol version mismatch: expected " +
                      std::to_string(CURRENT_PROTOCOL_VERSION) + ", got " +
                      std::to_string(connect.protocol_version),
                      reject_code::VERSION_MISMATCH);
    }

    if (!config_.isClientAllowed(connect.client_identity)) {
        Logger::logEvent(LogLevel::Security,
            "Rejected " + Utils::abbreviate(clientHex) + ": not in allowed clients");
        return reject("Client not authorized", reject_code::NOT_AUTHORIZED);
    }

    std::shared_ptr<Session> session;
    {
        std::unique_lock lock(sessions_mutex_);

        // A reconnect frees the earlier slot before the limit is checked
        auto previous = by_address_.find(senderAddress);
        if (previous != by_address_.end()) {
            const SessionId previousId = previous->second;
            auto it = sessions_.find(previousId);
            if (it != sessions_.end()) {
                Logger::logEvent(LogLevel::Info,
                    "Replacing session " + it->second->idHex() + " on reconnect");
                it->second->close();
            }
            eraseLocked(previousId);
        }

        const size_t active = std::count_if(sessions_.begin(), sessions_.end(),
            [](const auto& entry) { return entry.second->isActive(); });
        if (active >= config_.max_sessions) {
            Logger::logEvent(LogLevel::Warning,
                "Rejected " + Utils::abbreviate(clientHex) + ": session limit " +
                std::to_string(config_.max_sessions) + " reached");
            return reject("Maximum sessions reached", reject_code::MAX_SESSIONS);
        }

        SessionId id = Session::generateId();
        while (sessions_.count(id) != 0) {
            id = Session::generateId();
        }

        session = std::make_shared<Session>(id, connect.client_identity, senderAddress,
                                            executor_, config_.audit_logging);
        sessions_[id] = session;
        by_address_[senderAddress] = id;
    }

    Logger::logEvent(LogLevel::Info,
        "Accepted " + Utils::abbreviate(clientHex) + " as session " + session->idHex());

    AcceptMessage accept;
    accept.protocol_version = CURRENT_PROTOCOL_VERSION;
    accept.server_identity = config_.identity->publicKey();
    accept.session_id = session->id();
    accept.capabilities = SERVER_CAPABILITIES;
    return accept;
}

size_t Listener::sessionCount() const {
    std::shared_lock lock(sessions_mutex_);
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(),
        [](const auto& entry) { return entry.second->isActive(); }));
}

std::shared_ptr<Session> Listener::sessionFor(const Address& address) const {
    std::shared_lock lock(sessions_mutex_);
    auto bound = by_address_.find(address);
    if (bound == by_address_.end()) {
        return nullptr;
    }
    auto it = sessions_.find(bound->second);
    if (it == sessions_.end() || !it->second->isActive()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Session> Listener::session(const SessionId& id) const {
    std::shared_lock lock(sessions_mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void Listener::removeSession(const SessionId& id) {
    std::unique_lock lock(sessions_mutex_);
    eraseLocked(id);
}

void Listener::eraseLocked(const SessionId& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return;
    }

    auto bound = by_address_.find(it->second->boundAddress());
    if (bound != by_address_.end() && bound->second == id) {
        by_address_.erase(bound);
    }
    sessions_.erase(it);
}

size_t Listener::cleanupSessions(Session::Clock::time_point now) {
    const std::chrono::seconds idleTimeout(config_.session_idle_timeout);

    std::unique_lock lock(sessions_mutex_);
    std::vector<SessionId> expired;
    for (const auto& [id, session] : sessions_) {
        if (!session->isActive()) {
            expired.push_back(id);
        } else if (session->isIdle(now, idleTimeout)) {
            Logger::logEvent(LogLevel::Info, "Session " + session->idHex() + " idle, closing");
            session->close();
            expired.push_back(id);
        }
    }

    for (const auto& id : expired) {
        eraseLocked(id);
    }

    if (!expired.empty()) {
        Logger::logEvent(LogLevel::Debug,
            "Evicted " + std::to_string(expired.size()) + " sessions, " +
            std::to_string(sessions_.size()) + " remain");
    }
    return expired.size();
}

void Listener::closeAll() {
    std::unique_lock lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        session->close();
    }
    sessions_.clear();
    by_address_.clear();
}

} // namespace garlic_shell
