#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace garlic_shell {

// Error codes shared by every layer of the shell
enum class ErrorCode {
    None = 0,
    IdentityError,
    CryptoError,
    InvalidSignature,
    PacketError,
    VersionMismatch,
    MessageTooLarge,
    InvalidFormat,
    NetworkError,
    ConnectionClosed,
    SessionError,
    ExecutionError,
    AuthError,
    Timeout,
    ConfigError,
    NotConnected,
    Rejected,
    ProcessingError
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error";
        case ErrorCode::IdentityError:
            return "Identity Error";
        case ErrorCode::CryptoError:
            return "Cryptographic Error";
        case ErrorCode::InvalidSignature:
            return "Invalid Signature";
        case ErrorCode::PacketError:
            return "Packet Error";
        case ErrorCode::VersionMismatch:
            return "Protocol Version Mismatch";
        case ErrorCode::MessageTooLarge:
            return "Message Too Large";
        case ErrorCode::InvalidFormat:
            return "Invalid Message Format";
        case ErrorCode::NetworkError:
            return "Network Error";
        case ErrorCode::ConnectionClosed:
            return "Connection Closed";
        case ErrorCode::SessionError:
            return "Session Error";
        case ErrorCode::ExecutionError:
            return "Command Execution Error";
        case ErrorCode::AuthError:
            return "Authentication Failed";
        case ErrorCode::Timeout:
            return "Operation Timed Out";
        case ErrorCode::ConfigError:
            return "Configuration Error";
        case ErrorCode::NotConnected:
            return "Not Connected";
        case ErrorCode::Rejected:
            return "Connection Rejected";
        case ErrorCode::ProcessingError:
            return "Processing Error";
        default:
            return "Unknown error";
    }
}

// Compact routing key: SHA-256 of a public key or of an overlay destination
using Address = std::array<uint8_t, 32>;

// Server-assigned identifier of an application session
using SessionId = std::array<uint8_t, 16>;

struct AddressHash {
    std::size_t operator()(const Address& address) const noexcept {
        // Addresses are digests already, the first word is well mixed
        std::size_t value = 0;
        for (size_t i = 0; i < sizeof(value); ++i) {
            value = (value << 8) | address[i];
        }
        return value;
    }
};

struct SecurityParameters {
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;
    static constexpr size_t ADDRESS_SIZE = 32;
    static constexpr size_t SESSION_ID_SIZE = 16;
    static constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024; // 1MB
    static constexpr size_t MAX_PACKET_PAYLOAD = 0xFFFF;
};

} // namespace garlic_shell
