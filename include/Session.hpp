#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "CommandExecutor.hpp"
#include "Messages.hpp"
#include "SecureTypes.hpp"

namespace garlic_shell {

enum class SessionState {
    Active,
    Disconnecting,
    Closed
};

const char* toString(SessionState state);

// One authenticated client, bound to the overlay address it connected from
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(SessionId id,
            std::vector<uint8_t> clientIdentity,
            Address boundAddress,
            std::shared_ptr<const CommandExecutor> executor,
            bool auditEnabled);

    static SessionId generateId();

    /**
     * Handles one message from the bound client.
     * Throws SessionError unless the session is Active and ExecutionError
     * when a CommandRequest fails validation. Returns nullopt for messages
     * that need no reply.
     */
    std::optional<Message> handleMessage(const Message& message);

    // Idempotent; a closed session never becomes Active again
    void close();

    SessionState state() const;
    bool isActive() const { return state() == SessionState::Active; }
    bool isIdle(Clock::time_point now, std::chrono::seconds idleTimeout) const;
    Clock::time_point lastActivity() const;

    const SessionId& id() const { return id_; }
    std::string idHex() const;
    const std::vector<uint8_t>& clientIdentity() const { return client_identity_; }
    const Address& boundAddress() const { return bound_address_; }

private:
    CommandResponse runCommand(const CommandRequest& request);
    void touch();

    const SessionId id_;
    const std::vector<uint8_t> client_identity_;
    const Address bound_address_;
    std::shared_ptr<const CommandExecutor> executor_;
    const bool audit_enabled_;

    mutable std::shared_mutex state_mutex_;
    SessionState state_ = SessionState::Active;
    Clock::time_point last_activity_;
};

} // namespace garlic_shell
