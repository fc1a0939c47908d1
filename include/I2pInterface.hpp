#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "NetworkInterface.hpp"
#include "SamConnection.hpp"

namespace garlic_shell {

/**
 * Transport over an I2P DATAGRAM session.
 *
 * Packets carry 32-byte addresses, the overlay wants full destination
 * strings, so the interface keeps a map from SHA-256(destination) to the
 * destination. Peers become reachable by registering them or by sending
 * to us first.
 */
class I2pInterface : public NetworkInterface {
public:
    // Connects to the SAM bridge, generates a destination and opens a session
    explicit I2pInterface(const std::string& samAddress);
    ~I2pInterface() override;

    Address registerDestination(const std::string& destination);

    const std::string& localDestination() const { return local_destination_; }
    Address localAddress() const;
    const std::string& sessionId() const { return session_id_; }

    void send(const Packet& packet) override;
    Packet receive() override;
    std::string name() const override { return "i2p"; }
    // False once closed or after the bridge connection drops
    bool isReady() const override { return ready_.load() && sam_->isOpen(); }
    void close() override;

    static Address addressOf(const std::string& destination);

private:
    std::unique_ptr<SamConnection> sam_;
    std::string session_id_;
    std::string local_destination_;
    std::atomic<bool> ready_{false};

    std::unordered_map<Address, std::string, AddressHash> destinations_;
    mutable std::shared_mutex destinations_mutex_;

    I2pInterface(const I2pInterface&) = delete;
    I2pInterface& operator=(const I2pInterface&) = delete;
};

} // namespace garlic_shell
