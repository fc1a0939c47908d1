#include "LoopbackInterface.hpp"
#include "Crypto.hpp"
#include "Errors.hpp"

namespace garlic_shell {

namespace {
    void closeChannel(auto& channel) {
        {
            std::lock_guard<std::mutex> lock(channel.mutex);
            channel.closed = true;
        }
        channel.ready.notify_all();
    }
}

LoopbackInterface::LoopbackInterface(std::string name, Address localAddress,
                                     std::shared_ptr<SharedState> state,
                                     Channel& inbox, Channel& outbox)
    : name_(std::move(name)), local_address_(localAddress),
      state_(std::move(state)), inbox_(inbox), outbox_(outbox) {}

LoopbackInterface::Pair LoopbackInterface::createPair() {
    auto state = std::make_shared<SharedState>();

    std::shared_ptr<LoopbackInterface> first(new LoopbackInterface(
        "loopback-client", Crypto::sha256(std::string_view("loopback-client")),
        state, state->toFirst, state->toSecond));
    std::shared_ptr<LoopbackInterface> second(new LoopbackInterface(
        "loopback-server", Crypto::sha256(std::string_view("loopback-server")),
        state, state->toSecond, state->toFirst));

    return {first, second};
}

void LoopbackInterface::send(const Packet& packet) {
    // The peer sees our address as the packet's return address
    Packet delivered = packet;
    delivered.destination = local_address_;

    {
        std::lock_guard<std::mutex> lock(outbox_.mutex);
        if (outbox_.closed) {
            throw NetworkError("channel closed");
        }
        outbox_.packets.push_back(std::move(delivered));
    }
    outbox_.ready.notify_one();
}

Packet LoopbackInterface::receive() {
    std::unique_lock<std::mutex> lock(inbox_.mutex);
    inbox_.ready.wait(lock, [this] { return !inbox_.packets.empty() || inbox_.closed; });

    if (inbox_.packets.empty()) {
        throw ConnectionClosedError("channel closed");
    }

    Packet packet = std::move(inbox_.packets.front());
    inbox_.packets.pop_front();
    return packet;
}

bool LoopbackInterface::isReady() const {
    std::lock_guard<std::mutex> lock(outbox_.mutex);
    return !outbox_.closed;
}

void LoopbackInterface::close() {
    closeChannel(state_->toFirst);
    closeChannel(state_->toSecond);
}

} // namespace garlic_shell
