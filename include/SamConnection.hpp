#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "NetworkStack.hpp"
#include "Packet.hpp"

namespace garlic_shell {

constexpr uint16_t DEFAULT_SAM_PORT = 7656;

struct GeneratedDestination {
    std::string priv;            // private descriptor, used to open sessions
    std::string pub;             // public destination handed to peers
};

struct ReceivedDatagram {
    std::string source;          // full overlay destination of the sender
    std::vector<uint8_t> data;
};

/**
 * Client for the SAM v3.1 bridge of an I2P router.
 *
 * Every reply that does not match what the command expects raises a
 * NetworkError quoting the offending line. Nothing is retried.
 */
class SamConnection {
public:
    // Largest signed packet: header, full payload, flag and signature
    static constexpr size_t MAX_DATAGRAM_SIZE = Packet::HEADER_SIZE +
        SecurityParameters::MAX_PACKET_PAYLOAD + 1 + SecurityParameters::SIGNATURE_SIZE;
    // Oversized datagrams up to this size are skipped; beyond it the
    // bridge connection is dropped
    static constexpr size_t MAX_DISCARD_SIZE = SecurityParameters::MAX_MESSAGE_SIZE;

    // "host:port" or bare "host" (port 7656); performs the HELLO handshake
    static std::unique_ptr<SamConnection> connect(std::string_view address);

    // PRIV= is mandatory; a reply without PUB= publishes the PRIV= value
    GeneratedDestination destGenerate();

    void sessionCreateDatagram(const std::string& sessionId,
                               const std::optional<std::string>& destination);

    void datagramSend(const std::string& sessionId,
                      const std::string& destination,
                      const std::vector<uint8_t>& data);

    // Blocks until the bridge forwards a datagram to this session
    ReceivedDatagram datagramReceive();

    void close();
    bool isOpen() const { return stream_->isOpen(); }

private:
    explicit SamConnection(std::unique_ptr<NetworkStack> stream);

    void handshake();
    std::string command(const std::string& line);

    std::unique_ptr<NetworkStack> stream_;
};

} // namespace garlic_shell
