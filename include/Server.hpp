#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "Config.hpp"
#include "Listener.hpp"
#include "NetworkInterface.hpp"

namespace garlic_shell {

/**
 * Dispatch loop of the shell server.
 *
 * Packets are processed one at a time on the thread that calls run(), so
 * responses to one client leave in request order. Messages other than
 * CONNECT are routed by the sender's address to the session bound to it.
 */
class Server {
public:
    static constexpr std::chrono::seconds CLEANUP_INTERVAL{30};

    explicit Server(ServerConfig config);
    ~Server();

    void processPacket(NetworkInterface& iface, const Packet& packet);

    // Blocks until stop() is called or the interface closes.
    // Returns at once on a server that was already stopped
    void run(std::shared_ptr<NetworkInterface> iface);

    // Closes every session and the running interface; safe from any thread
    void stop();

    bool isRunning() const { return running_.load(); }
    Listener& listener() { return listener_; }

private:
    void dispatch(NetworkInterface& iface, const Address& sender, const Message& message);
    void reply(NetworkInterface& iface, const Address& recipient, const Message& message);
    void janitorLoop();

    Listener listener_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::mutex interface_mutex_;
    std::shared_ptr<NetworkInterface> interface_;

    std::mutex janitor_mutex_;
    std::condition_variable janitor_wakeup_;
    std::thread janitor_;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
};

} // namespace garlic_shell
