#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include "NetworkInterface.hpp"

namespace garlic_shell {

// In-memory point-to-point transport for tests and local runs
class LoopbackInterface : public NetworkInterface {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackInterface>, std::shared_ptr<LoopbackInterface>>;

    // first is "loopback-client", second is "loopback-server"
    static Pair createPair();

    void send(const Packet& packet) override;
    Packet receive() override;
    std::string name() const override { return name_; }
    bool isReady() const override;

    // Closes both directions of the pair
    void close() override;

    const Address& localAddress() const { return local_address_; }

private:
    struct Channel {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<Packet> packets;
        bool closed = false;
    };

    struct SharedState {
        Channel toFirst;
        Channel toSecond;
    };

    LoopbackInterface(std::string name, Address localAddress,
                      std::shared_ptr<SharedState> state, Channel& inbox, Channel& outbox);

    std::string name_;
    Address local_address_;
    std::shared_ptr<SharedState> state_;
    Channel& inbox_;
    Channel& outbox_;
};

} // namespace garlic_shell
