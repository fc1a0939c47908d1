#include "SamConnection.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <charconv>
#include <sstream>
#include <tuple>

namespace garlic_shell {

namespace {
    constexpr const char* SAM_VERSION = "3.1";
    constexpr int SIGNATURE_TYPE_ED25519 = 7;

    bool startsWith(std::string_view line, std::string_view prefix) {
        return line.substr(0, prefix.size()) == prefix;
    }

    bool hasToken(const std::string& line, std::string_view token) {
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            if (word == token) {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> tokenValue(const std::string& line, std::string_view key) {
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            if (startsWith(word, key)) {
                return word.substr(key.size());
            }
        }
        return std::nullopt;
    }

    void expectReply(const std::string& reply, std::string_view prefix, bool requireOk) {
        if (!startsWith(reply, prefix)) {
            throw NetworkError("Unexpected SAM reply: " + reply);
        }
        if (requireOk && !hasToken(reply, "RESULT=OK")) {
            throw NetworkError("SAM command failed: " + reply);
        }
    }
}

SamConnection::SamConnection(std::unique_ptr<NetworkStack> stream)
    : stream_(std::move(stream)) {}

std::unique_ptr<SamConnection> SamConnection::connect(std::string_view address) {
    std::string host;
    uint16_t port = DEFAULT_SAM_PORT;

    if (address.find(':') == std::string_view::npos) {
        host = std::string(address);
    } else {
        try {
            std::tie(host, port) = Utils::splitHostPort(address);
        }
        catch (const ConfigError& e) {
            throw NetworkError(std::string("Bad SAM address: ") + e.what());
        }
    }

    Logger::logEvent(LogLevel::Info, "Connecting to SAM bridge at " + std::string(address));

    auto stream = std::make_unique<NetworkStack>();
    stream->connect(host, port);

    std::unique_ptr<SamConnection> connection(new SamConnection(std::move(stream)));
    connection->handshake();
    return connection;
}

std::string SamConnection::command(const std::string& line) {
    stream_->sendAll(line);
    std::string reply = stream_->readLine();
    Logger::logEvent(LogLevel::Debug, "SAM reply: " + Utils::abbreviate(reply, 80));
    return reply;
}

void SamConnection::handshake() {
    const std::string reply = command(std::string("HELLO VERSION MIN=") + SAM_VERSION +
                                      " MAX=" + SAM_VERSION + "\n");
    expectReply(reply, "HELLO REPLY", true);
    Logger::logEvent(LogLevel::Info, "SAM handshake complete");
}

GeneratedDestination SamConnection::destGenerate() {
    const std::string reply = command("DEST GENERATE SIGNATURE_TYPE=" +
                                      std::to_string(SIGNATURE_TYPE_ED25519) + "\n");
    expectReply(reply, "DEST REPLY", false);

    auto priv = tokenValue(reply, "PRIV=");
    if (!priv || priv->empty()) {
        throw NetworkError("No PRIV= in SAM reply: " + reply);
    }

    GeneratedDestination generated;
    generated.priv = std::move(*priv);
    auto pub = tokenValue(reply, "PUB=");
    if (pub && !pub->empty()) {
        generated.pub = std::move(*pub);
    } else {
        Logger::logEvent(LogLevel::Warning, "SAM reply carries no PUB=, publishing PRIV= value");
        generated.pub = generated.priv;
    }
    return generated;
}

void SamConnection::sessionCreateDatagram(const std::string& sessionId,
                                          const std::optional<std::string>& destination) {
    // PORT and HOST are required by bridges that forward datagrams
    std::string line = "SESSION CREATE STYLE=DATAGRAM ID=" + sessionId +
                       " DESTINATION=" + destination.value_or("TRANSIENT") +
                       " SIGNATURE_TYPE=" + std::to_string(SIGNATURE_TYPE_ED25519) +
                       " PORT=0 HOST=127.0.0.1 FROM_PORT=0\n";

    expectReply(command(line), "SESSION STATUS", true);
    Logger::logEvent(LogLevel::Info, "SAM datagram session " + sessionId + " created");
}

void SamConnection::datagramSend(const std::string& sessionId,
                                 const std::string& destination,
                                 const std::vector<uint8_t>& data) {
    const std::string header = "DATAGRAM SEND ID=" + sessionId +
                               " DESTINATION=" + destination +
                               " SIZE=" + std::to_string(data.size()) + "\n";

    std::vector<uint8_t> message;
    message.reserve(header.size() + data.size());
    message.insert(message.end(), header.begin(), header.end());
    message.insert(message.end(), data.begin(), data.end());

    stream_->sendAll(message);
    Logger::logEvent(LogLevel::Debug,
        "Sent " + std::to_string(data.size()) + " byte datagram to " + Utils::abbreviate(destination));
}

ReceivedDatagram SamConnection::datagramReceive() {
    const std::string line = stream_->readLine();
    if (!startsWith(line, "DATAGRAM RECEIVED")) {
        throw NetworkError("Unexpected SAM datagram line: " + line);
    }

    // Without a usable SIZE the payload boundary is lost and the stream
    // cannot be resynchronised
    auto sizeText = tokenValue(line, "SIZE=");
    if (!sizeText) {
        stream_->close();
        throw ConnectionClosedError("Missing SIZE in: " + line);
    }
    size_t size = 0;
    auto [ptr, ec] = std::from_chars(sizeText->data(), sizeText->data() + sizeText->size(), size);
    if (ec != std::errc() || ptr != sizeText->data() + sizeText->size()) {
        stream_->close();
        throw ConnectionClosedError("Invalid SIZE in: " + line);
    }
    if (size > MAX_DISCARD_SIZE) {
        stream_->close();
        throw ConnectionClosedError("Datagram SIZE exceeds " + std::to_string(MAX_DISCARD_SIZE) + ": " + line);
    }

    // From here on the payload is consumed before any error is raised
    auto source = tokenValue(line, "DESTINATION=");
    if (size > MAX_DATAGRAM_SIZE) {
        stream_->discard(size);
        throw NetworkError("Datagram SIZE exceeds " + std::to_string(MAX_DATAGRAM_SIZE) + ": " + line);
    }
    if (!source || source->empty()) {
        stream_->discard(size);
        throw NetworkError("Missing DESTINATION in: " + line);
    }

    ReceivedDatagram datagram;
    datagram.source = std::move(*source);
    datagram.data = stream_->readExact(size);
    Logger::logEvent(LogLevel::Debug,
        "Received " + std::to_string(size) + " byte datagram from " + Utils::abbreviate(datagram.source));
    return datagram;
}

void SamConnection::close() {
    stream_->close();
}

} // namespace garlic_shell
