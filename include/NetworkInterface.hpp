#pragma once

#include <string>
#include "Packet.hpp"

namespace garlic_shell {

/**
 * Packet transport between shell endpoints.
 *
 * send() delivers to packet.destination and throws NetworkError on failure.
 * receive() blocks until a packet arrives; the returned packet's destination
 * holds the sender's address so replies can be addressed back to it.
 * Once the interface is closed receive() throws NetworkError.
 */
class NetworkInterface {
public:
    virtual ~NetworkInterface() = default;

    virtual void send(const Packet& packet) = 0;
    virtual Packet receive() = 0;
    virtual std::string name() const = 0;
    virtual bool isReady() const = 0;
    virtual void close() = 0;
};

} // namespace garlic_shell
