#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "SecureTypes.hpp"

namespace garlic_shell {

class Identity;

enum class PacketType : uint8_t {
    Data = 0x00,
    Announce = 0x01,
    LinkRequest = 0x02,
    LinkResponse = 0x03,
    Proof = 0x04
};

/**
 * Transport envelope.
 *
 * Wire layout (big-endian):
 *   [ 1 byte: type ][ 32 bytes: destination ][ 2 bytes: data length ]
 *   [ N bytes: data ][ 1 byte: signature flag ][ 64 bytes: signature, iff flag == 1 ]
 */
struct Packet {
    static constexpr size_t HEADER_SIZE = 1 + SecurityParameters::ADDRESS_SIZE + 2;
    static constexpr size_t MIN_SIZE = HEADER_SIZE;

    PacketType type = PacketType::Data;
    Address destination{};
    std::vector<uint8_t> data;
    std::optional<std::vector<uint8_t>> signature;

    static Packet makeData(const Address& destination, std::vector<uint8_t> payload);
    static Packet makeAnnounce(const Address& destination, std::vector<uint8_t> payload);

    // Throws PacketError unless the signature is exactly 64 bytes
    Packet& withSignature(std::vector<uint8_t> sig);

    std::vector<uint8_t> encode() const;
    static Packet decode(const std::vector<uint8_t>& bytes);

    // type || destination || length || data; never includes the signature
    std::vector<uint8_t> signableData() const;

    void sign(const Identity& identity);
    bool verifySignature(const std::vector<uint8_t>& publicKey) const;

    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const { return !(*this == other); }
};

const char* toString(PacketType type);

} // namespace garlic_shell
