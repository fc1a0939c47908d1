#include "NetworkStack.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>
#include <errno.h>
#include <string.h>
#include <algorithm>

namespace garlic_shell {

namespace {
    std::string errnoMessage(const std::string& what) {
        return what + ": " + strerror(errno);
    }
}

NetworkStack::NetworkStack(int connectedSocket) : socket_(connectedSocket) {
    setSocketOptions(connectedSocket);
}

NetworkStack::~NetworkStack() {
    close();
}

void NetworkStack::setSocketOptions(int socket) {
    int enable = 1;
    if (setsockopt(socket, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) < 0 ||
        setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) < 0) {
        Logger::logEvent(LogLevel::Warning, errnoMessage("Failed to set socket options"));
    }
}

void NetworkStack::connect(std::string_view host, uint16_t port) {
    if (socket_.load() >= 0) {
        throw NetworkError("Already connected");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const std::string hostName(host);
    const std::string service = std::to_string(port);
    const int rc = getaddrinfo(hostName.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        throw NetworkError("Cannot resolve " + hostName + ": " + gai_strerror(rc));
    }

    int sock = -1;
    std::string lastError = "no usable address";
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            lastError = strerror(errno);
            continue;
        }
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        lastError = strerror(errno);
        ::close(sock);
        sock = -1;
    }
    freeaddrinfo(results);

    if (sock < 0) {
        throw NetworkError("Connection to " + hostName + ":" + service + " failed: " + lastError);
    }

    setSocketOptions(sock);
    closed_ = false;
    socket_ = sock;
    Logger::logEvent(LogLevel::Debug, "Connected to " + hostName + ":" + service);
}

void NetworkStack::sendAll(const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const int sock = socket_.load();
    if (sock < 0 || closed_) {
        throw ConnectionClosedError("Send on closed stream");
    }

    size_t totalSent = 0;
    while (totalSent < length) {
        const ssize_t sent = ::send(sock, data + totalSent, length - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE || errno == ECONNRESET) {
                throw ConnectionClosedError(errnoMessage("Send failed"));
            }
            throw NetworkError(errnoMessage("Send failed"));
        }
        totalSent += static_cast<size_t>(sent);
    }
}

void NetworkStack::sendAll(const std::vector<uint8_t>& data) {
    sendAll(data.data(), data.size());
}

void NetworkStack::sendAll(std::string_view text) {
    sendAll(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

void NetworkStack::fillBuffer(int timeoutMs) {
    const int sock = socket_.load();
    if (sock < 0 || closed_) {
        throw ConnectionClosedError("Read on closed stream");
    }

    pollfd pfd{sock, POLLIN, 0};
    for (;;) {
        const int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw NetworkError(errnoMessage("Poll failed"));
        }
        if (ready == 0) {
            throw TimeoutError("No data within " + std::to_string(timeoutMs) + " ms");
        }
        break;
    }

    uint8_t chunk[READ_CHUNK_SIZE];
    for (;;) {
        const ssize_t received = ::recv(sock, chunk, sizeof(chunk), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw NetworkError(errnoMessage("Receive failed"));
        }
        if (received == 0 || closed_) {
            throw ConnectionClosedError("Peer closed the stream");
        }
        read_buffer_.insert(read_buffer_.end(), chunk, chunk + received);
        return;
    }
}

std::string NetworkStack::readLine(int timeoutMs) {
    std::lock_guard<std::mutex> lock(read_mutex_);

    for (;;) {
        auto newline = std::find(read_buffer_.begin(), read_buffer_.end(), '\n');
        if (newline != read_buffer_.end()) {
            std::string line(read_buffer_.begin(), newline);
            read_buffer_.erase(read_buffer_.begin(), newline + 1);
            if (discarding_line_ || line.size() > MAX_LINE_LENGTH) {
                discarding_line_ = false;
                throw NetworkError("Line exceeds " + std::to_string(MAX_LINE_LENGTH) + " bytes");
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        // Drop the overlong line up to its newline so the next read starts
        // on a fresh line
        if (discarding_line_ || read_buffer_.size() > MAX_LINE_LENGTH) {
            discarding_line_ = true;
            read_buffer_.clear();
        }
        fillBuffer(timeoutMs);
    }
}

std::vector<uint8_t> NetworkStack::readExact(size_t length, int timeoutMs) {
    std::lock_guard<std::mutex> lock(read_mutex_);

    while (read_buffer_.size() < length) {
        fillBuffer(timeoutMs);
    }

    std::vector<uint8_t> out(read_buffer_.begin(), read_buffer_.begin() + length);
    read_buffer_.erase(read_buffer_.begin(), read_buffer_.begin() + length);
    return out;
}

void NetworkStack::discard(size_t length, int timeoutMs) {
    std::lock_guard<std::mutex> lock(read_mutex_);

    while (length > 0) {
        if (read_buffer_.empty()) {
            fillBuffer(timeoutMs);
        }
        const size_t chunk = std::min(length, read_buffer_.size());
        read_buffer_.erase(read_buffer_.begin(), read_buffer_.begin() + chunk);
        length -= chunk;
    }
}

void NetworkStack::close() {
    if (closed_.exchange(true)) {
        return;
    }

    const int sock = socket_.load();
    if (sock < 0) {
        return;
    }

    // Wakes any reader blocked in poll() before the descriptor goes away
    ::shutdown(sock, SHUT_RDWR);

    std::scoped_lock lock(read_mutex_, write_mutex_);
    ::close(sock);
    socket_ = -1;
    read_buffer_.clear();
}

TcpListener::TcpListener(std::string_view host, uint16_t port) {
    const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        throw NetworkError(errnoMessage("Failed to create listening socket"));
    }

    int reuse = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        ::close(sock);
        throw NetworkError(errnoMessage("Failed to set SO_REUSEADDR"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    const std::string hostName(host);
    if (inet_pton(AF_INET, hostName.c_str(), &addr.sin_addr) != 1) {
        ::close(sock);
        throw NetworkError("Invalid listen address " + hostName);
    }

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(sock);
        throw NetworkError(errnoMessage("Failed to bind " + hostName + ":" + std::to_string(port)));
    }
    if (::listen(sock, MAX_PENDING_CONNECTIONS) < 0) {
        ::close(sock);
        throw NetworkError(errnoMessage("Failed to listen"));
    }

    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        ::close(sock);
        throw NetworkError(errnoMessage("getsockname failed"));
    }

    port_ = ntohs(addr.sin_port);
    socket_ = sock;
}

TcpListener::~TcpListener() {
    close();
}

std::unique_ptr<NetworkStack> TcpListener::accept() {
    for (;;) {
        const int sock = socket_.load();
        if (sock < 0) {
            throw ConnectionClosedError("Listener closed");
        }
        const int client = ::accept(sock, nullptr, nullptr);
        if (client >= 0) {
            return std::make_unique<NetworkStack>(client);
        }
        if (errno == EINTR) {
            continue;
        }
        if (socket_.load() < 0) {
            throw ConnectionClosedError("Listener closed");
        }
        throw NetworkError(errnoMessage("Accept failed"));
    }
}

void TcpListener::close() {
    const int sock = socket_.exchange(-1);
    if (sock >= 0) {
        ::shutdown(sock, SHUT_RDWR);
        ::close(sock);
    }
}

} // namespace garlic_shell
