#include "Messages.hpp"
#include "Errors.hpp"
#include <type_traits>

namespace garlic_shell {

namespace {
    // Big-endian, length-prefixed field writer
    class PayloadWriter {
    public:
        void u8(uint8_t value) { out_.push_back(value); }

        void u32(uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out_.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void u64(uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out_.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void i32(int32_t value) { u32(static_cast<uint32_t>(value)); }

        void bytes(const std::vector<uint8_t>& value) {
            u64(value.size());
            out_.insert(out_.end(), value.begin(), value.end());
        }

        void string(const std::string& value) {
            u64(value.size());
            out_.insert(out_.end(), value.begin(), value.end());
        }

        void strings(const std::vector<std::string>& values) {
            u64(values.size());
            for (const auto& value : values) {
                string(value);
            }
        }

        template <typename T, typename Fn>
        void optional(const std::optional<T>& value, Fn writeValue) {
            u8(value ? 1 : 0);
            if (value) {
                writeValue(*value);
            }
        }

        std::vector<uint8_t> take() { return std::move(out_); }

    private:
        std::vector<uint8_t> out_;
    };

    class PayloadReader {
    public:
        PayloadReader(const uint8_t* data, size_t length)
            : data_(data), length_(length) {}

        uint8_t u8() {
            require(1);
            return data_[offset_++];
        }

        uint32_t u32() {
            require(4);
            uint32_t value = 0;
            for (int i = 0; i < 4; ++i) {
                value = (value << 8) | data_[offset_++];
            }
            return value;
        }

        uint64_t u64() {
            require(8);
            uint64_t value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | data_[offset_++];
            }
            return value;
        }

        int32_t i32() { return static_cast<int32_t>(u32()); }

        std::vector<uint8_t> bytes() {
            const size_t size = length();
            std::vector<uint8_t> value(data_ + offset_, data_ + offset_ + size);
            offset_ += size;
            return value;
        }

        std::string string() {
            const size_t size = length();
            std::string value(reinterpret_cast<const char*>(data_ + offset_), size);
            offset_ += size;
            return value;
        }

        std::vector<std::string> strings() {
            const uint64_t count = u64();
            // Every element needs at least its 8-byte length prefix
            if (count > remaining() / 8) {
                throw ProtocolError(ErrorCode::InvalidFormat, "String list count exceeds payload");
            }
            std::vector<std::string> values;
            values.reserve(static_cast<size_t>(count));
            for (uint64_t i = 0; i < count; ++i) {
                values.push_back(string());
            }
            return values;
        }

        template <typename T, typename Fn>
        std::optional<T> optional(Fn readValue) {
            const uint8_t tag = u8();
            if (tag == 0) {
                return std::nullopt;
            }
            if (tag != 1) {
                throw ProtocolError(ErrorCode::InvalidFormat,
                    "Invalid optional tag " + std::to_string(tag));
            }
            return readValue();
        }

        size_t remaining() const { return length_ - offset_; }

        void expectEnd() const {
            if (offset_ != length_) {
                throw ProtocolError(ErrorCode::InvalidFormat,
                    std::to_string(length_ - offset_) + " trailing bytes in payload");
            }
        }

    private:
        void require(size_t count) const {
            if (remaining() < count) {
                throw ProtocolError(ErrorCode::InvalidFormat, "Truncated message payload");
            }
        }

        size_t length() {
            const uint64_t size = u64();
            if (size > remaining()) {
                throw ProtocolError(ErrorCode::InvalidFormat,
                    "Field length " + std::to_string(size) + " exceeds payload");
            }
            return static_cast<size_t>(size);
        }

        const uint8_t* data_;
        size_t length_;
        size_t offset_ = 0;
    };

    void writeBody(PayloadWriter& w, const ConnectMessage& m) {
        w.u32(m.protocol_version);
        w.bytes(m.client_identity);
        w.strings(m.capabilities);
        w.optional(m.auth_token, [&](const std::string& v) { w.string(v); });
    }

    void writeBody(PayloadWriter& w, const AcceptMessage& m) {
        w.u32(m.protocol_version);
        w.bytes(m.server_identity);
        for (uint8_t b : m.session_id) {
            w.u8(b);
        }
        w.strings(m.capabilities);
    }

    void writeBody(PayloadWriter& w, const RejectMessage& m) {
        w.string(m.reason);
        w.u32(m.error_code);
    }

    void writeBody(PayloadWriter& w, const CommandRequest& m) {
        w.u64(m.id);
        w.string(m.command);
        w.strings(m.args);
        w.optional(m.env, [&](const std::map<std::string, std::string>& env) {
            w.u64(env.size());
            for (const auto& [key, value] : env) {
                w.string(key);
                w.string(value);
            }
        });
        w.optional(m.timeout, [&](uint64_t v) { w.u64(v); });
        w.optional(m.working_dir, [&](const std::string& v) { w.string(v); });
    }

    void writeBody(PayloadWriter& w, const CommandResponse& m) {
        w.u64(m.id);
        w.u8(static_cast<uint8_t>(m.status));
        w.bytes(m.stdout_data);
        w.bytes(m.stderr_data);
        w.i32(m.exit_code);
        w.u64(m.execution_time_ms);
    }

    void writeBody(PayloadWriter& w, const DisconnectMessage& m) {
        w.optional(m.reason, [&](const std::string& v) { w.string(v); });
    }

    void writeBody(PayloadWriter& w, const AckMessage& m) {
        w.u64(m.message_id);
    }

    void writeBody(PayloadWriter&, const PingMessage&) {}
    void writeBody(PayloadWriter&, const PongMessage&) {}

    ConnectMessage readConnect(PayloadReader& r) {
        ConnectMessage m;
        m.protocol_version = r.u32();
        m.client_identity = r.bytes();
        m.capabilities = r.strings();
        m.auth_token = r.optional<std::string>([&] { return r.string(); });
        return m;
    }

    AcceptMessage readAccept(PayloadReader& r) {
        AcceptMessage m;
        m.protocol_version = r.u32();
        m.server_identity = r.bytes();
        for (auto& b : m.session_id) {
            b = r.u8();
        }
        m.capabilities = r.strings();
        return m;
    }

    RejectMessage readReject(PayloadReader& r) {
        RejectMessage m;
        m.reason = r.string();
        m.error_code = r.u32();
        return m;
    }

    CommandRequest readCommandRequest(PayloadReader& r) {
        CommandRequest m;
        m.id = r.u64();
        m.command = r.string();
        m.args = r.strings();
        m.env = r.optional<std::map<std::string, std::string>>([&] {
            const uint64_t count = r.u64();
            if (count > r.remaining() / 16) {
                throw ProtocolError(ErrorCode::InvalidFormat, "Environment count exceeds payload");
            }
            std::map<std::string, std::string> env;
            for (uint64_t i = 0; i < count; ++i) {
                std::string key = r.string();
                env[std::move(key)] = r.string();
            }
            return env;
        });
        m.timeout = r.optional<uint64_t>([&] { return r.u64(); });
        m.working_dir = r.optional<std::string>([&] { return r.string(); });
        return m;
    }

    CommandStatus readStatus(uint8_t value) {
        if (value > static_cast<uint8_t>(CommandStatus::Killed)) {
            throw ProtocolError(ErrorCode::InvalidFormat,
                "Invalid command status " + std::to_string(value));
        }
        return static_cast<CommandStatus>(value);
    }

    CommandResponse readCommandResponse(PayloadReader& r) {
        CommandResponse m;
        m.id = r.u64();
        m.status = readStatus(r.u8());
        m.stdout_data = r.bytes();
        m.stderr_data = r.bytes();
        m.exit_code = r.i32();
        m.execution_time_ms = r.u64();
        return m;
    }
}

MessageType messageType(const Message& message) {
    return std::visit([](const auto& m) -> MessageType {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ConnectMessage>) return MessageType::Connect;
        else if constexpr (std::is_same_v<T, AcceptMessage>) return MessageType::Accept;
        else if constexpr (std::is_same_v<T, RejectMessage>) return MessageType::Reject;
        else if constexpr (std::is_same_v<T, CommandRequest>) return MessageType::CommandRequest;
        else if constexpr (std::is_same_v<T, CommandResponse>) return MessageType::CommandResponse;
        else if constexpr (std::is_same_v<T, DisconnectMessage>) return MessageType::Disconnect;
        else if constexpr (std::is_same_v<T, AckMessage>) return MessageType::Ack;
        else if constexpr (std::is_same_v<T, PingMessage>) return MessageType::Ping;
        else return MessageType::Pong;
    }, message);
}

const char* messageName(const Message& message) {
    switch (messageType(message)) {
        case MessageType::Connect:         return "CONNECT";
        case MessageType::Accept:          return "ACCEPT";
        case MessageType::Reject:          return "REJECT";
        case MessageType::CommandRequest:  return "COMMAND_REQUEST";
        case MessageType::CommandResponse: return "COMMAND_RESPONSE";
        case MessageType::Disconnect:      return "DISCONNECT";
        case MessageType::Ack:             return "ACK";
        case MessageType::Ping:            return "PING";
        case MessageType::Pong:            return "PONG";
        default:                           return "UNKNOWN";
    }
}

const char* toString(CommandStatus status) {
    switch (status) {
        case CommandStatus::Success: return "Success";
        case CommandStatus::Timeout: return "Timeout";
        case CommandStatus::Error:   return "Error";
        case CommandStatus::Killed:  return "Killed";
        default:                     return "Unknown";
    }
}

std::vector<uint8_t> serializeMessage(const Message& message) {
    PayloadWriter writer;
    writer.u32(static_cast<uint32_t>(message.index()));
    std::visit([&writer](const auto& m) { writeBody(writer, m); }, message);
    return writer.take();
}

Message deserializeMessage(const uint8_t* data, size_t length) {
    PayloadReader reader(data, length);
    const uint32_t index = reader.u32();

    Message message;
    switch (index) {
        case 0: message = readConnect(reader); break;
        case 1: message = readAccept(reader); break;
        case 2: message = readReject(reader); break;
        case 3: message = readCommandRequest(reader); break;
        case 4: message = readCommandResponse(reader); break;
        case 5: message = DisconnectMessage{reader.optional<std::string>([&] { return reader.string(); })}; break;
        case 6: message = AckMessage{reader.u64()}; break;
        case 7: message = PingMessage{}; break;
        case 8: message = PongMessage{}; break;
        default:
            throw ProtocolError(ErrorCode::InvalidFormat,
                "Unknown message variant " + std::to_string(index));
    }

    reader.expectEnd();
    return message;
}

} // namespace garlic_shell
