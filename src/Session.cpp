#include "Session.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <mutex>
#include <sstream>

namespace garlic_shell {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Active:        return "Active";
        case SessionState::Disconnecting: return "Disconnecting";
        case SessionState::Closed:        return "Closed";
        default:                          return "Unknown";
    }
}

Session::Session(SessionId id,
                 std::vector<uint8_t> clientIdentity,
                 Address boundAddress,
                 std::shared_ptr<const CommandExecutor> executor,
                 bool auditEnabled)
    : id_(id),
      client_identity_(std::move(clientIdentity)),
      bound_address_(boundAddress),
      executor_(std::move(executor)),
      audit_enabled_(auditEnabled),
      last_activity_(Clock::now()) {
    Logger::logEvent(LogLevel::Info,
        "Session " + idHex() + " created for client " +
        Utils::abbreviate(Utils::toHex(client_identity_)));
}

SessionId Session::generateId() {
    auto random = Crypto::randomBytes(SecurityParameters::SESSION_ID_SIZE);
    SessionId id{};
    std::copy(random.begin(), random.end(), id.begin());
    return id;
}

std::string Session::idHex() const {
    return Utils::toHex(id_);
}

std::optional<Message> Session::handleMessage(const Message& message) {
    {
        std::shared_lock lock(state_mutex_);
        if (state_ != SessionState::Active) {
            throw SessionError("Session " + idHex() + " is " + toString(state_));
        }
    }
    touch();

    if (const auto* request = std::get_if<CommandRequest>(&message)) {
        executor_->validateRequest(*request);
        return runCommand(*request);
    }

    if (const auto* disconnect = std::get_if<DisconnectMessage>(&message)) {
        {
            std::unique_lock lock(state_mutex_);
            state_ = SessionState::Disconnecting;
        }
        Logger::logEvent(LogLevel::Info,
            "Client disconnecting from session " + idHex() +
            (disconnect->reason ? ": " + *disconnect->reason : std::string()));
        close();
        return AckMessage{0};
    }

    if (std::holds_alternative<PingMessage>(message)) {
        return PongMessage{};
    }

    Logger::logEvent(LogLevel::Debug,
        std::string("Session ") + idHex() + " ignoring " + messageName(message));
    return std::nullopt;
}

CommandResponse Session::runCommand(const CommandRequest& request) {
    Logger::logEvent(LogLevel::Info,
        "Session " + idHex() + " request " + std::to_string(request.id) + ": " + request.command);

    CommandResponse response = executor_->execute(request);

    if (audit_enabled_) {
        std::ostringstream record;
        record << "session=" << idHex()
               << " client=" << Utils::toHex(client_identity_)
               << " command=" << request.command
               << " args=[";
        for (size_t i = 0; i < request.args.size(); ++i) {
            record << (i ? "," : "") << request.args[i];
        }
        record << "] status=" << toString(response.status)
               << " exit=" << response.exit_code
               << " duration_ms=" << response.execution_time_ms;
        Logger::logAudit(record.str());
    }

    touch();
    return response;
}

void Session::close() {
    std::unique_lock lock(state_mutex_);
    if (state_ == SessionState::Closed) {
        return;
    }
    state_ = SessionState::Closed;
    lock.unlock();

    Logger::logEvent(LogLevel::Info, "Session " + idHex() + " closed");
}

SessionState Session::state() const {
    std::shared_lock lock(state_mutex_);
    return state_;
}

bool Session::isIdle(Clock::time_point now, std::chrono::seconds idleTimeout) const {
    std::shared_lock lock(state_mutex_);
    return now - last_activity_ > idleTimeout;
}

Session::Clock::time_point Session::lastActivity() const {
    std::shared_lock lock(state_mutex_);
    return last_activity_;
}

void Session::touch() {
    std::unique_lock lock(state_mutex_);
    last_activity_ = Clock::now();
}

} // namespace garlic_shell
