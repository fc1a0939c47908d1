#include "Protocol.hpp"
#include "Errors.hpp"

namespace garlic_shell {

std::vector<uint8_t> ProtocolCodec::encode(const Message& message) {
    std::vector<uint8_t> payload = serializeMessage(message);
    if (payload.size() > protocol::MAX_MESSAGE_SIZE) {
        throw ProtocolError(ErrorCode::MessageTooLarge,
            "Payload of " + std::to_string(payload.size()) + " bytes exceeds " +
            std::to_string(protocol::MAX_MESSAGE_SIZE));
    }

    const auto length = static_cast<uint32_t>(payload.size() + protocol::TYPE_SIZE);

    std::vector<uint8_t> frame;
    frame.reserve(protocol::LENGTH_PREFIX_SIZE + length);
    frame.push_back(static_cast<uint8_t>(length >> 24));
    frame.push_back(static_cast<uint8_t>(length >> 16));
    frame.push_back(static_cast<uint8_t>(length >> 8));
    frame.push_back(static_cast<uint8_t>(length));
    frame.push_back(static_cast<uint8_t>(messageType(message)));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::optional<Message> ProtocolCodec::decode(std::vector<uint8_t>& buffer) {
    if (buffer.size() < protocol::LENGTH_PREFIX_SIZE) {
        return std::nullopt;
    }

    const uint32_t length = (static_cast<uint32_t>(buffer[0]) << 24) |
                            (static_cast<uint32_t>(buffer[1]) << 16) |
                            (static_cast<uint32_t>(buffer[2]) << 8) |
                            static_cast<uint32_t>(buffer[3]);

    // Checked before waiting for the body so a bogus prefix cannot stall the reader
    if (length > protocol::MAX_FRAME_LENGTH) {
        throw ProtocolError(ErrorCode::MessageTooLarge,
            "Frame length " + std::to_string(length) + " exceeds " +
            std::to_string(protocol::MAX_FRAME_LENGTH));
    }
    if (length == 0) {
        throw ProtocolError(ErrorCode::InvalidFormat, "Empty frame");
    }

    if (buffer.size() < protocol::LENGTH_PREFIX_SIZE + length) {
        return std::nullopt;
    }

    // The frame is consumed even when its payload turns out to be malformed
    const uint8_t typeByte = buffer[protocol::LENGTH_PREFIX_SIZE];
    const auto payloadBegin = buffer.begin() + protocol::LENGTH_PREFIX_SIZE + protocol::TYPE_SIZE;
    const auto frameEnd = buffer.begin() + protocol::LENGTH_PREFIX_SIZE + length;
    std::vector<uint8_t> payload(payloadBegin, frameEnd);
    buffer.erase(buffer.begin(), frameEnd);

    Message message = deserializeMessage(payload.data(), payload.size());

    if (static_cast<uint8_t>(messageType(message)) != typeByte) {
        throw ProtocolError(ErrorCode::InvalidFormat,
            "Type byte " + std::to_string(typeByte) + " does not match " +
            messageName(message) + " payload");
    }

    return message;
}

std::vector<Message> ProtocolCodec::decodeMultiple(std::vector<uint8_t>& buffer) {
    std::vector<Message> messages;
    while (auto message = decode(buffer)) {
        messages.push_back(std::move(*message));
    }
    return messages;
}

void ProtocolCodec::checkVersion(ProtocolVersion version) {
    if (version != CURRENT_PROTOCOL_VERSION) {
        throw ProtocolError(ErrorCode::VersionMismatch,
            "Protocol version mismatch: expected " +
            std::to_string(CURRENT_PROTOCOL_VERSION) + ", got " + std::to_string(version));
    }
}

} // namespace garlic_shell
