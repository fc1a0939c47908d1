#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Messages.hpp"
#include "NetworkInterface.hpp"

namespace garlic_shell {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

const char* toString(ConnectionState state);

/**
 * Shell client speaking to one server over a NetworkInterface.
 *
 * One request is outstanding at a time. Every reply wait is bounded; when
 * it expires the interface is closed, the client drops to Disconnected and
 * TimeoutError is thrown.
 */
class Client {
public:
    // Server address taken from config.server_destination
    Client(ClientConfig config, std::shared_ptr<NetworkInterface> iface);
    Client(ClientConfig config, std::shared_ptr<NetworkInterface> iface, Address serverAddress);

    // No-op when already connected. Throws RejectedError, NetworkError or TimeoutError
    void connect();

    CommandResponse executeCommand(const std::string& command,
                                   const std::vector<std::string>& args = {});

    // id is assigned by the client; timeout defaults to command_timeout
    CommandResponse executeRequest(CommandRequest request);

    // Returns the round-trip time
    std::chrono::milliseconds ping();

    void disconnect();

    bool isConnected() const;
    ConnectionState state() const;
    std::optional<SessionId> sessionId() const;
    const Address& serverAddress() const { return server_address_; }

private:
    void sendMessage(const Message& message);
    Message awaitReply(std::chrono::milliseconds timeout);
    void setState(ConnectionState state);
    void requireConnected() const;
    void dropConnection();

    const ClientConfig config_;
    std::shared_ptr<NetworkInterface> interface_;
    const Address server_address_;

    mutable std::shared_mutex state_mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::optional<SessionId> session_id_;

    std::atomic<uint64_t> next_request_id_{1};
    std::mutex request_mutex_;
};

} // namespace garlic_shell
