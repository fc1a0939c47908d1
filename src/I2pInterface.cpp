#include "I2pInterface.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <mutex>

namespace garlic_shell {

namespace {
    constexpr size_t SESSION_SUFFIX_BYTES = 8;
}

I2pInterface::I2pInterface(const std::string& samAddress)
    : sam_(SamConnection::connect(samAddress)) {
    GeneratedDestination generated = sam_->destGenerate();
    local_destination_ = std::move(generated.pub);
    session_id_ = "garlic-" + Utils::toHex(Crypto::randomBytes(SESSION_SUFFIX_BYTES));
    sam_->sessionCreateDatagram(session_id_, generated.priv);

    registerDestination(local_destination_);
    ready_ = true;

    Logger::logEvent(LogLevel::Info,
        "I2P interface ready, destination " + Utils::abbreviate(local_destination_, 20));
}

I2pInterface::~I2pInterface() {
    close();
}

Address I2pInterface::addressOf(const std::string& destination) {
    return Crypto::sha256(std::string_view(destination));
}

Address I2pInterface::registerDestination(const std::string& destination) {
    const Address address = addressOf(destination);
    std::unique_lock lock(destinations_mutex_);
    destinations_[address] = destination;
    return address;
}

Address I2pInterface::localAddress() const {
    return addressOf(local_destination_);
}

void I2pInterface::send(const Packet& packet) {
    if (!ready_) {
        throw NetworkError("I2P interface is closed");
    }

    std::string destination;
    {
        std::shared_lock lock(destinations_mutex_);
        auto it = destinations_.find(packet.destination);
        if (it == destinations_.end()) {
            throw NetworkError("Unknown destination " +
                Utils::abbreviate(Utils::toHex(packet.destination)) + " is not registered");
        }
        destination = it->second;
    }

    sam_->datagramSend(session_id_, destination, packet.encode());
}

Packet I2pInterface::receive() {
    ReceivedDatagram datagram = sam_->datagramReceive();

    const Address source = registerDestination(datagram.source);

    Packet packet;
    try {
        packet = Packet::decode(datagram.data);
    }
    catch (const PacketError& e) {
        throw NetworkError("Undecodable datagram from " +
            Utils::abbreviate(datagram.source, 20) + ": " + e.what());
    }

    packet.destination = source;
    return packet;
}

void I2pInterface::close() {
    if (ready_.exchange(false)) {
        sam_->close();
        Logger::logEvent(LogLevel::Info, "I2P interface closed");
    }
}

} // namespace garlic_shell
