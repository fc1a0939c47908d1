#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace garlic_shell {

/**
 * Blocking TCP byte stream with buffered reads.
 *
 * Reads and writes take separate locks, so one thread may sit in readLine()
 * while another sends. close() may be called from any thread and wakes a
 * blocked reader, which then throws ConnectionClosedError.
 */
class NetworkStack {
public:
    NetworkStack() = default;
    explicit NetworkStack(int connectedSocket);
    ~NetworkStack();

    void connect(std::string_view host, uint16_t port);

    void sendAll(const uint8_t* data, size_t length);
    void sendAll(const std::vector<uint8_t>& data);
    void sendAll(std::string_view text);

    // Returns the line without its trailing "\n" (and "\r", if present).
    // timeoutMs < 0 waits forever; expiry throws TimeoutError
    std::string readLine(int timeoutMs = -1);
    std::vector<uint8_t> readExact(size_t length, int timeoutMs = -1);
    void discard(size_t length, int timeoutMs = -1);

    void close();
    bool isOpen() const { return socket_.load() >= 0 && !closed_.load(); }

private:
    static constexpr size_t READ_CHUNK_SIZE = 4096;
    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

    std::atomic<int> socket_{-1};
    std::atomic<bool> closed_{false};
    std::vector<uint8_t> read_buffer_;
    bool discarding_line_ = false;
    std::mutex read_mutex_;
    std::mutex write_mutex_;

    void fillBuffer(int timeoutMs);
    static void setSocketOptions(int socket);

    NetworkStack(const NetworkStack&) = delete;
    NetworkStack& operator=(const NetworkStack&) = delete;
};

// Listening socket bound to a local address; port 0 picks an ephemeral port
class TcpListener {
public:
    TcpListener(std::string_view host, uint16_t port);
    ~TcpListener();

    uint16_t port() const { return port_; }

    // Blocks until a peer connects or close() is called
    std::unique_ptr<NetworkStack> accept();
    void close();

private:
    static constexpr int MAX_PENDING_CONNECTIONS = 10;

    std::atomic<int> socket_{-1};
    uint16_t port_ = 0;

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
};

} // namespace garlic_shell
