#include <doctest/doctest.h>
#include "Crypto.hpp"
#include "Errors.hpp"
#include "Identity.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace garlic_shell;

namespace {
    std::string tempPath(const std::string& name) {
        return (std::filesystem::temp_directory_path() /
                (name + "-" + std::to_string(::getpid()))).string();
    }
}

TEST_CASE("Generated identity has 32-byte keys and a SHA-256 address") {
    Identity id = Identity::generate();

    CHECK(id.publicKey().size() == 32);
    CHECK(id.privateKey().size() == 32);
    CHECK(id.address() == Crypto::sha256(id.publicKey()));
    CHECK(id.addressHex() == Utils::toHex(id.address()));
    CHECK(id.addressHex().size() == 64);
}

TEST_CASE("Two generated identities differ") {
    Identity a = Identity::generate();
    Identity b = Identity::generate();
    CHECK(a.publicKey() != b.publicKey());
    CHECK(a.address() != b.address());
}

TEST_CASE("Signature verifies and rejects tampering") {
    Identity id = Identity::generate();
    const std::vector<uint8_t> data = {'r', 'u', 'n', ' ', 'l', 's'};

    auto signature = id.sign(data);
    REQUIRE(signature.size() == 64);
    CHECK_NOTHROW(id.verify(data, signature));
    CHECK_NOTHROW(Identity::verifyExternal(id.publicKey(), data, signature));

    auto tampered = data;
    tampered[0] ^= 0x01;
    CHECK_THROWS_AS(id.verify(tampered, signature), CryptoError);

    auto badSig = signature;
    badSig[10] ^= 0xFF;
    CHECK_THROWS_AS(id.verify(data, badSig), CryptoError);
}

TEST_CASE("Signature from another identity is rejected") {
    Identity alice = Identity::generate();
    Identity mallory = Identity::generate();
    const std::vector<uint8_t> data = {1, 2, 3};

    CHECK_THROWS_AS(Identity::verifyExternal(alice.publicKey(), data, mallory.sign(data)),
                    CryptoError);
}

TEST_CASE("verifyExternal rejects malformed keys and signatures") {
    Identity id = Identity::generate();
    const std::vector<uint8_t> data = {9};
    auto signature = id.sign(data);

    CHECK_THROWS_AS(Identity::verifyExternal(std::vector<uint8_t>(31, 1), data, signature),
                    CryptoError);
    CHECK_THROWS_AS(Identity::verifyExternal(id.publicKey(), data, std::vector<uint8_t>(63, 0)),
                    CryptoError);
    CHECK_THROWS_AS(id.verify(data, {}), CryptoError);
}

TEST_CASE("fromBytes restores the same identity") {
    Identity original = Identity::generate();
    Identity restored = Identity::fromBytes(original.save());

    CHECK(restored.publicKey() == original.publicKey());
    CHECK(restored.address() == original.address());

    Identity loaded = Identity::load(original.save());
    CHECK(loaded.publicKey() == original.publicKey());
}

TEST_CASE("fromBytes rejects wrong key sizes") {
    CHECK_THROWS_AS(Identity::fromBytes({}), IdentityError);
    CHECK_THROWS_AS(Identity::fromBytes(std::vector<uint8_t>(31, 7)), IdentityError);
    CHECK_THROWS_AS(Identity::fromBytes(std::vector<uint8_t>(64, 7)), IdentityError);
}

TEST_CASE("hashFromPublicKey matches address") {
    Identity id = Identity::generate();
    CHECK(Identity::hashFromPublicKey(id.publicKey()) == id.address());
}

TEST_CASE("Identity file round trip with owner-only permissions") {
    const std::string path = tempPath("garlicshell-identity");
    std::filesystem::remove(path);

    Identity original = Identity::generate();
    original.saveToFile(path);

    REQUIRE(std::filesystem::exists(path));
    CHECK(std::filesystem::file_size(path) == 32);

    namespace fs = std::filesystem;
    const auto perms = fs::status(path).permissions();
    CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);

    Identity loaded = Identity::loadFromFile(path);
    CHECK(loaded.publicKey() == original.publicKey());

    std::filesystem::remove(path);
}

TEST_CASE("Loading a missing or truncated identity file fails") {
    CHECK_THROWS_AS(Identity::loadFromFile("/nonexistent/garlicshell.identity"), IdentityError);

    const std::string path = tempPath("garlicshell-short");
    {
        std::ofstream file(path, std::ios::binary);
        file << "too short";
    }
    CHECK_THROWS_AS(Identity::loadFromFile(path), IdentityError);
    std::filesystem::remove(path);
}
