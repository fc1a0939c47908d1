#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include "CommandExecutor.hpp"
#include "Config.hpp"
#include "Messages.hpp"
#include "Session.hpp"

namespace garlic_shell {

// Reject codes carried in RejectMessage::error_code
namespace reject_code {
    constexpr uint32_t EXPECTED_CONNECT = 1;
    constexpr uint32_t VERSION_MISMATCH = 2;
    constexpr uint32_t NOT_AUTHORIZED = 3;
    constexpr uint32_t MAX_SESSIONS = 4;
    constexpr uint32_t NO_SESSION = 5;
}

/**
 * Admits clients and owns the session registry.
 *
 * Each overlay address maps to at most one session. A client that connects
 * again from the same address replaces its earlier session.
 */
class Listener {
public:
    explicit Listener(ServerConfig config);

    // Connect goes to handleConnect, anything else is rejected with code 1
    Message handleConnection(const Message& message, const Address& senderAddress);
    Message handleConnect(const ConnectMessage& connect, const Address& senderAddress);

    // Counts Active sessions only
    size_t sessionCount() const;

    // Active session bound to address, or nullptr
    std::shared_ptr<Session> sessionFor(const Address& address) const;
    std::shared_ptr<Session> session(const SessionId& id) const;

    void removeSession(const SessionId& id);

    // Drops Closed sessions and those idle past session_idle_timeout
    size_t cleanupSessions(Session::Clock::time_point now = Session::Clock::now());

    void closeAll();

    const ServerConfig& config() const { return config_; }
    std::shared_ptr<const CommandExecutor> executor() const { return executor_; }

private:
    void eraseLocked(const SessionId& id);

    const ServerConfig config_;
    std::shared_ptr<const CommandExecutor> executor_;

    mutable std::shared_mutex sessions_mutex_;
    std::map<SessionId, std::shared_ptr<Session>> sessions_;
    std::unordered_map<Address, SessionId, AddressHash> by_address_;
};

} // namespace garlic_shell
