#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "Messages.hpp"
#include "SecureTypes.hpp"

namespace garlic_shell {

constexpr ProtocolVersion CURRENT_PROTOCOL_VERSION = 1;

// Frame layout: [ 4 bytes BE: 1 + payload length ][ 1 byte: type ][ payload ]
namespace protocol {
    constexpr size_t LENGTH_PREFIX_SIZE = 4;
    constexpr size_t TYPE_SIZE = 1;
    // Ceiling on the serialized payload; the length field may be one more
    constexpr size_t MAX_MESSAGE_SIZE = SecurityParameters::MAX_MESSAGE_SIZE;
    constexpr size_t MAX_FRAME_LENGTH = TYPE_SIZE + MAX_MESSAGE_SIZE;
}

class ProtocolCodec {
public:
    static std::vector<uint8_t> encode(const Message& message);

    /**
     * Decodes the first complete frame in buffer and erases it.
     * Returns nullopt and leaves the buffer untouched while the frame is
     * incomplete. Throws ProtocolError on an oversized or malformed frame.
     */
    static std::optional<Message> decode(std::vector<uint8_t>& buffer);

    static std::vector<Message> decodeMultiple(std::vector<uint8_t>& buffer);

    static void checkVersion(ProtocolVersion version);

private:
    ProtocolCodec() = delete;
};

} // namespace garlic_shell
