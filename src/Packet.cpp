#include "Packet.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Identity.hpp"
#include <algorithm>

namespace garlic_shell {

namespace {
    constexpr uint8_t FLAG_UNSIGNED = 0x00;
    constexpr uint8_t FLAG_SIGNED = 0x01;
    constexpr size_t SIGNATURE_SIZE = SecurityParameters::SIGNATURE_SIZE;

    PacketType packetTypeFromByte(uint8_t value) {
        switch (value) {
            case 0x00: return PacketType::Data;
            case 0x01: return PacketType::Announce;
            case 0x02: return PacketType::LinkRequest;
            case 0x03: return PacketType::LinkResponse;
            case 0x04: return PacketType::Proof;
            default:
                throw PacketError("Invalid packet type: " + std::to_string(value));
        }
    }

    void writeHeaderAndData(std::vector<uint8_t>& out, const Packet& packet) {
        if (packet.data.size() > SecurityParameters::MAX_PACKET_PAYLOAD) {
            throw PacketError("Packet data exceeds 65535 bytes: " +
                              std::to_string(packet.data.size()));
        }

        const auto length = static_cast<uint16_t>(packet.data.size());
        out.push_back(static_cast<uint8_t>(packet.type));
        out.insert(out.end(), packet.destination.begin(), packet.destination.end());
        out.push_back(static_cast<uint8_t>(length >> 8));
        out.push_back(static_cast<uint8_t>(length & 0xFF));
        out.insert(out.end(), packet.data.begin(), packet.data.end());
    }
}

Packet Packet::makeData(const Address& destination, std::vector<uint8_t> payload) {
    Packet packet;
    packet.type = PacketType::Data;
    packet.destination = destination;
    packet.data = std::move(payload);
    return packet;
}

Packet Packet::makeAnnounce(const Address& destination, std::vector<uint8_t> payload) {
    Packet packet = makeData(destination, std::move(payload));
    packet.type = PacketType::Announce;
    return packet;
}

Packet& Packet::withSignature(std::vector<uint8_t> sig) {
    if (sig.size() != SIGNATURE_SIZE) {
        throw PacketError("Signature must be 64 bytes, got " + std::to_string(sig.size()));
    }
    signature = std::move(sig);
    return *this;
}

std::vector<uint8_t> Packet::encode() const {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + data.size() + 1 + (signature ? SIGNATURE_SIZE : 0));

    writeHeaderAndData(out, *this);

    if (signature) {
        if (signature->size() != SIGNATURE_SIZE) {
            throw PacketError("Signature must be 64 bytes");
        }
        out.push_back(FLAG_SIGNED);
        out.insert(out.end(), signature->begin(), signature->end());
    } else {
        out.push_back(FLAG_UNSIGNED);
    }

    return out;
}

Packet Packet::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < MIN_SIZE) {
        throw PacketError("Packet too short: " + std::to_string(bytes.size()) + " bytes");
    }

    Packet packet;
    size_t offset = 0;

    packet.type = packetTypeFromByte(bytes[offset++]);

    std::copy(bytes.begin() + offset, bytes.begin() + offset + packet.destination.size(),
              packet.destination.begin());
    offset += packet.destination.size();

    const size_t length = (static_cast<size_t>(bytes[offset]) << 8) | bytes[offset + 1];
    offset += 2;

    // Data plus the signature flag byte must fit
    if (bytes.size() - offset < length + 1) {
        throw PacketError("Invalid data length " + std::to_string(length));
    }

    packet.data.assign(bytes.begin() + offset, bytes.begin() + offset + length);
    offset += length;

    const uint8_t flag = bytes[offset++];
    if (flag == FLAG_SIGNED) {
        if (bytes.size() - offset != SIGNATURE_SIZE) {
            throw PacketError("Invalid signature length " + std::to_string(bytes.size() - offset));
        }
        packet.signature.emplace(bytes.begin() + offset, bytes.end());
    } else if (flag != FLAG_UNSIGNED) {
        throw PacketError("Invalid signature flag " + std::to_string(flag));
    } else if (offset != bytes.size()) {
        throw PacketError("Trailing bytes after unsigned packet");
    }

    return packet;
}

std::vector<uint8_t> Packet::signableData() const {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + data.size());
    writeHeaderAndData(out, *this);
    return out;
}

void Packet::sign(const Identity& identity) {
    signature = identity.sign(signableData());
}

bool Packet::verifySignature(const std::vector<uint8_t>& publicKey) const {
    if (!signature) {
        return false;
    }
    return Crypto::ed25519Verify(signableData(), *signature, publicKey);
}

bool Packet::operator==(const Packet& other) const {
    return type == other.type &&
           destination == other.destination &&
           data == other.data &&
           signature == other.signature;
}

const char* toString(PacketType type) {
    switch (type) {
        case PacketType::Data:         return "Data";
        case PacketType::Announce:     return "Announce";
        case PacketType::LinkRequest:  return "LinkRequest";
        case PacketType::LinkResponse: return "LinkResponse";
        case PacketType::Proof:        return "Proof";
        default:                       return "Unknown";
    }
}

} // namespace garlic_shell
