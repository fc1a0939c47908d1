#pragma once

#include <stdexcept>
#include <string>
#include "SecureTypes.hpp"

namespace garlic_shell {

class GarlicError : public std::runtime_error {
public:
    GarlicError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message),
          code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class IdentityError : public GarlicError {
public:
    explicit IdentityError(const std::string& message)
        : GarlicError(ErrorCode::IdentityError, message) {}

protected:
    IdentityError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class CryptoError : public GarlicError {
public:
    explicit CryptoError(const std::string& message)
        : GarlicError(ErrorCode::CryptoError, message) {}

protected:
    CryptoError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class PacketError : public GarlicError {
public:
    explicit PacketError(const std::string& message)
        : GarlicError(ErrorCode::PacketError, message) {}

protected:
    PacketError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class NetworkError : public GarlicError {
public:
    explicit NetworkError(const std::string& message)
        : GarlicError(ErrorCode::NetworkError, message) {}

protected:
    NetworkError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class SessionError : public GarlicError {
public:
    explicit SessionError(const std::string& message)
        : GarlicError(ErrorCode::SessionError, message) {}

protected:
    SessionError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class ExecutionError : public GarlicError {
public:
    explicit ExecutionError(const std::string& message)
        : GarlicError(ErrorCode::ExecutionError, message) {}

protected:
    ExecutionError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class AuthError : public GarlicError {
public:
    explicit AuthError(const std::string& message)
        : GarlicError(ErrorCode::AuthError, message) {}

protected:
    AuthError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class TimeoutError : public GarlicError {
public:
    explicit TimeoutError(const std::string& message)
        : GarlicError(ErrorCode::Timeout, message) {}

protected:
    TimeoutError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class ConfigError : public GarlicError {
public:
    explicit ConfigError(const std::string& message)
        : GarlicError(ErrorCode::ConfigError, message) {}

protected:
    ConfigError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

// Raised by the wire codec; code() tells MessageTooLarge, VersionMismatch
// and InvalidFormat apart
class ProtocolError : public GarlicError {
public:
    ProtocolError(ErrorCode code, const std::string& message)
        : GarlicError(code, message) {}
};

class ConnectionClosedError : public NetworkError {
public:
    explicit ConnectionClosedError(const std::string& message)
        : NetworkError(ErrorCode::ConnectionClosed, message) {}
};

class NotConnectedError : public GarlicError {
public:
    NotConnectedError()
        : GarlicError(ErrorCode::NotConnected, "not connected to server") {}
};

class RejectedError : public GarlicError {
public:
    RejectedError(const std::string& reason, uint32_t errorCode)
        : GarlicError(ErrorCode::Rejected, reason),
          reason_(reason), reject_code_(errorCode) {}

    const std::string& reason() const noexcept { return reason_; }
    uint32_t rejectCode() const noexcept { return reject_code_; }

private:
    std::string reason_;
    uint32_t reject_code_;
};

} // namespace garlic_shell
