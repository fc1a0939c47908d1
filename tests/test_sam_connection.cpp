#include <doctest/doctest.h>
#include "Errors.hpp"
#include "I2pInterface.hpp"
#include "NetworkStack.hpp"
#include "Packet.hpp"
#include "SamConnection.hpp"
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace garlic_shell;

namespace {
    const std::string HELLO_OK = "HELLO REPLY RESULT=OK VERSION=3.1\n";
    const std::string SESSION_OK = "SESSION STATUS RESULT=OK\n";
    const std::string DEST_OK = "DEST REPLY PUB=peerPub~ PRIV=peerPriv~~\n";

    // Scripted stand-in for an I2P router's SAM bridge. The script runs on
    // its own thread against the first accepted connection and records the
    // lines it read.
    class FakeSamBridge {
    public:
        using Script = std::function<void(NetworkStack&, std::vector<std::string>&)>;

        explicit FakeSamBridge(Script script)
            : listener_("127.0.0.1", 0) {
            thread_ = std::thread([this, script = std::move(script)]() {
                try {
                    auto peer = listener_.accept();
                    script(*peer, received_);
                    peer->close();
                }
                catch (const GarlicError& e) {
                    error_ = e.what();
                }
            });
        }

        ~FakeSamBridge() {
            join();
        }

        void join() {
            if (thread_.joinable()) {
                listener_.close();
                thread_.join();
            }
        }

        std::string address() const {
            return "127.0.0.1:" + std::to_string(listener_.port());
        }

        const std::vector<std::string>& received() const { return received_; }
        const std::string& error() const { return error_; }

    private:
        TcpListener listener_;
        std::vector<std::string> received_;
        std::string error_;
        std::thread thread_;
    };

    void reply(NetworkStack& peer, std::vector<std::string>& lines, const std::string& answer) {
        lines.push_back(peer.readLine(5000));
        peer.sendAll(answer);
    }
}

TEST_CASE("Handshake, destination and session setup") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, DEST_OK);
        reply(peer, lines, SESSION_OK);
    });

    auto sam = SamConnection::connect(bridge.address());
    REQUIRE(sam->isOpen());

    GeneratedDestination dest = sam->destGenerate();
    CHECK(dest.priv == "peerPriv~~");
    CHECK(dest.pub == "peerPub~");

    sam->sessionCreateDatagram("garlic-test", dest.priv);
    sam->close();
    CHECK_FALSE(sam->isOpen());

    bridge.join();
    CHECK(bridge.error().empty());
    REQUIRE(bridge.received().size() == 3);
    CHECK(bridge.received()[0] == "HELLO VERSION MIN=3.1 MAX=3.1");
    CHECK(bridge.received()[1] == "DEST GENERATE SIGNATURE_TYPE=7");
    CHECK(bridge.received()[2] ==
          "SESSION CREATE STYLE=DATAGRAM ID=garlic-test DESTINATION=peerPriv~~ "
          "SIGNATURE_TYPE=7 PORT=0 HOST=127.0.0.1 FROM_PORT=0");
}

TEST_CASE("Transient session when no destination is given") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, SESSION_OK);
    });

    auto sam = SamConnection::connect(bridge.address());
    sam->sessionCreateDatagram("t1", std::nullopt);
    bridge.join();

    REQUIRE(bridge.received().size() == 2);
    CHECK(bridge.received()[1].find("DESTINATION=TRANSIENT") != std::string::npos);
}

TEST_CASE("Handshake failures are reported") {
    SUBCASE("wrong reply") {
        FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
            reply(peer, lines, "SESSION STATUS RESULT=OK\n");
        });
        CHECK_THROWS_AS(SamConnection::connect(bridge.address()), NetworkError);
    }
    SUBCASE("no RESULT=OK") {
        FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
            reply(peer, lines, "HELLO REPLY RESULT=NOVERSION\n");
        });
        CHECK_THROWS_AS(SamConnection::connect(bridge.address()), NetworkError);
    }
}

TEST_CASE("DEST REPLY without PRIV fails") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, "DEST REPLY PUB=abc\n");
    });

    auto sam = SamConnection::connect(bridge.address());
    CHECK_THROWS_AS(sam->destGenerate(), NetworkError);
}

TEST_CASE("DEST REPLY without PUB publishes PRIV") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, "DEST REPLY PRIV=onlyPriv\n");
    });

    auto sam = SamConnection::connect(bridge.address());
    GeneratedDestination dest = sam->destGenerate();
    CHECK(dest.priv == "onlyPriv");
    CHECK(dest.pub == "onlyPriv");
}

TEST_CASE("Failed session creation throws") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, "SESSION STATUS RESULT=DUPLICATED_ID\n");
    });

    auto sam = SamConnection::connect(bridge.address());
    CHECK_THROWS_AS(sam->sessionCreateDatagram("dup", std::nullopt), NetworkError);
}

TEST_CASE("Datagram send writes header followed by payload") {
    std::vector<uint8_t> payload;
    FakeSamBridge bridge([&payload](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        lines.push_back(peer.readLine(5000));
        payload = peer.readExact(4, 5000);
    });

    auto sam = SamConnection::connect(bridge.address());
    sam->datagramSend("s1", "remoteDest", {0x00, 0x0A, 0xFF, 0x0D});
    bridge.join();

    REQUIRE(bridge.received().size() == 2);
    CHECK(bridge.received()[1] == "DATAGRAM SEND ID=s1 DESTINATION=remoteDest SIZE=4");
    CHECK(payload == std::vector<uint8_t>{0x00, 0x0A, 0xFF, 0x0D});
}

TEST_CASE("Datagram receive parses source and exact payload") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        std::string frame = "DATAGRAM RECEIVED DESTINATION=senderDest SIZE=3\nabc";
        frame += "DATAGRAM RECEIVED DESTINATION=other SIZE=0\n";
        peer.sendAll(frame);
    });

    auto sam = SamConnection::connect(bridge.address());

    ReceivedDatagram first = sam->datagramReceive();
    CHECK(first.source == "senderDest");
    CHECK(first.data == std::vector<uint8_t>{'a', 'b', 'c'});

    ReceivedDatagram second = sam->datagramReceive();
    CHECK(second.source == "other");
    CHECK(second.data.empty());
}

TEST_CASE("Malformed datagram headers are rejected") {
    auto expectFailure = [](const std::string& header) {
        FakeSamBridge bridge([header](NetworkStack& peer, std::vector<std::string>& lines) {
            reply(peer, lines, HELLO_OK);
            peer.sendAll(header);
        });
        auto sam = SamConnection::connect(bridge.address());
        CHECK_THROWS_AS(sam->datagramReceive(), NetworkError);
    };

    SUBCASE("oversized") {
        expectFailure("DATAGRAM RECEIVED DESTINATION=x SIZE=70000\n");
    }
    SUBCASE("not a number") {
        expectFailure("DATAGRAM RECEIVED DESTINATION=x SIZE=12ab\n");
    }
    SUBCASE("missing size") {
        expectFailure("DATAGRAM RECEIVED DESTINATION=x\n");
    }
    SUBCASE("missing destination") {
        expectFailure("DATAGRAM RECEIVED SIZE=1\nz");
    }
    SUBCASE("wrong verb") {
        expectFailure("STREAM STATUS RESULT=OK\n");
    }
}

TEST_CASE("Largest signed packet fits in one datagram") {
    const size_t largest = Packet::HEADER_SIZE + SecurityParameters::MAX_PACKET_PAYLOAD + 1 +
                           SecurityParameters::SIGNATURE_SIZE;
    CHECK(SamConnection::MAX_DATAGRAM_SIZE == largest);

    FakeSamBridge bridge([largest](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        peer.sendAll("DATAGRAM RECEIVED DESTINATION=big SIZE=" + std::to_string(largest) + "\n");
        peer.sendAll(std::vector<uint8_t>(largest, 0x5A));
    });

    auto sam = SamConnection::connect(bridge.address());
    ReceivedDatagram datagram = sam->datagramReceive();
    CHECK(datagram.source == "big");
    CHECK(datagram.data.size() == largest);
}

TEST_CASE("Oversized datagram is skipped and the next one delivered") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        peer.sendAll("DATAGRAM RECEIVED DESTINATION=flood SIZE=70000\n");
        // Newlines inside the payload must not be taken for a header
        peer.sendAll(std::vector<uint8_t>(70000, '\n'));
        peer.sendAll("DATAGRAM RECEIVED DESTINATION=good SIZE=2\nok");
    });

    auto sam = SamConnection::connect(bridge.address());
    CHECK_THROWS_AS(sam->datagramReceive(), NetworkError);
    CHECK(sam->isOpen());

    ReceivedDatagram next = sam->datagramReceive();
    CHECK(next.source == "good");
    CHECK(next.data == std::vector<uint8_t>{'o', 'k'});
}

TEST_CASE("Datagram without DESTINATION is skipped") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        peer.sendAll("DATAGRAM RECEIVED SIZE=4\n\n\n\n\n");
        peer.sendAll("DATAGRAM RECEIVED DESTINATION=good SIZE=1\nz");
    });

    auto sam = SamConnection::connect(bridge.address());
    CHECK_THROWS_AS(sam->datagramReceive(), NetworkError);

    ReceivedDatagram next = sam->datagramReceive();
    CHECK(next.source == "good");
    CHECK(next.data == std::vector<uint8_t>{'z'});
}

TEST_CASE("Overlong line is dropped through its newline") {
    FakeSamBridge bridge([](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        peer.sendAll(std::string(200000, 'x') + "\n");
        peer.sendAll("DATAGRAM RECEIVED DESTINATION=good SIZE=1\nz");
    });

    auto sam = SamConnection::connect(bridge.address());
    CHECK_THROWS_AS(sam->datagramReceive(), NetworkError);

    ReceivedDatagram next = sam->datagramReceive();
    CHECK(next.source == "good");
    CHECK(next.data == std::vector<uint8_t>{'z'});
}

TEST_CASE("Unusable SIZE drops the bridge connection") {
    auto expectDropped = [](const std::string& header) {
        FakeSamBridge bridge([header](NetworkStack& peer, std::vector<std::string>& lines) {
            reply(peer, lines, HELLO_OK);
            peer.sendAll(header);
            peer.readLine(5000);
        });
        auto sam = SamConnection::connect(bridge.address());
        CHECK_THROWS_AS(sam->datagramReceive(), ConnectionClosedError);
        CHECK_FALSE(sam->isOpen());
    };

    SUBCASE("not a number") {
        expectDropped("DATAGRAM RECEIVED DESTINATION=x SIZE=12ab\n");
    }
    SUBCASE("beyond what can be skipped") {
        expectDropped("DATAGRAM RECEIVED DESTINATION=x SIZE=" +
                      std::to_string(SamConnection::MAX_DISCARD_SIZE + 1) + "\n");
    }
}

TEST_CASE("Unreachable bridge and bad address") {
    CHECK_THROWS_AS(SamConnection::connect("127.0.0.1:notaport"), NetworkError);

    uint16_t freePort = 0;
    {
        TcpListener scratch("127.0.0.1", 0);
        freePort = scratch.port();
    }
    CHECK_THROWS_AS(SamConnection::connect("127.0.0.1:" + std::to_string(freePort)), NetworkError);
}

TEST_CASE("I2P interface maps destinations to addresses") {
    const std::vector<uint8_t> outgoing = Packet::makeData(
        I2pInterface::addressOf("serverDest"), {7, 7, 7}).encode();
    const std::vector<uint8_t> incoming = Packet::makeData(
        I2pInterface::addressOf("ignored"), {1, 2}).encode();

    std::vector<uint8_t> sentBytes;
    FakeSamBridge bridge([&](NetworkStack& peer, std::vector<std::string>& lines) {
        reply(peer, lines, HELLO_OK);
        reply(peer, lines, "DEST REPLY PUB=myPub PRIV=myPriv\n");
        reply(peer, lines, SESSION_OK);

        lines.push_back(peer.readLine(5000));
        sentBytes = peer.readExact(outgoing.size(), 5000);

        std::string header = "DATAGRAM RECEIVED DESTINATION=clientDest SIZE=" +
                             std::to_string(incoming.size()) + "\n";
        peer.sendAll(header);
        peer.sendAll(incoming);
    });

    I2pInterface iface(bridge.address());
    CHECK(iface.isReady());
    CHECK(iface.name() == "i2p");
    CHECK(iface.localDestination() == "myPub");
    CHECK(iface.localAddress() == I2pInterface::addressOf("myPub"));
    CHECK(iface.sessionId().rfind("garlic-", 0) == 0);

    Packet unknown = Packet::makeData(I2pInterface::addressOf("nobody"), {1});
    CHECK_THROWS_AS(iface.send(unknown), NetworkError);

    const Address server = iface.registerDestination("serverDest");
    iface.send(Packet::makeData(server, {7, 7, 7}));

    Packet received = iface.receive();
    CHECK(received.destination == I2pInterface::addressOf("clientDest"));
    CHECK(received.data == std::vector<uint8_t>{1, 2});

    CHECK_NOTHROW(iface.close());
    CHECK_FALSE(iface.isReady());
    CHECK_THROWS_AS(iface.send(Packet::makeData(server, {})), NetworkError);

    bridge.join();
    CHECK(bridge.error().empty());
    REQUIRE(bridge.received().size() == 4);
    CHECK(bridge.received()[2].find("DESTINATION=myPriv") != std::string::npos);
    CHECK(bridge.received()[3].rfind("DATAGRAM SEND ID=garlic-", 0) == 0);
    CHECK(bridge.received()[3].find("DESTINATION=serverDest SIZE=" +
                                    std::to_string(outgoing.size())) != std::string::npos);
    CHECK(sentBytes == outgoing);
}
