#include "Crypto.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/crypto.h>
#include <algorithm>

namespace garlic_shell {

namespace {
    constexpr size_t KEY_SIZE = SecurityParameters::KEY_SIZE;
    constexpr size_t SIGNATURE_SIZE = SecurityParameters::SIGNATURE_SIZE;

    [[noreturn]] void handleOpenSSLError(const std::string& operation) {
        std::string error;
        while (unsigned long err = ERR_get_error()) {
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            if (!error.empty()) error += "; ";
            error += err_buf;
        }
        throw CryptoError(operation + " failed: " + error);
    }

    class ScopedEVP_PKEY {
    public:
        ScopedEVP_PKEY(EVP_PKEY* key = nullptr) : key_(key) {}
        ~ScopedEVP_PKEY() { EVP_PKEY_free(key_); }
        ScopedEVP_PKEY(const ScopedEVP_PKEY&) = delete;
        ScopedEVP_PKEY& operator=(const ScopedEVP_PKEY&) = delete;
        EVP_PKEY* get() { return key_; }
        EVP_PKEY** ptr() { return &key_; }
    private:
        EVP_PKEY* key_;
    };

    class ScopedEVP_PKEY_CTX {
    public:
        explicit ScopedEVP_PKEY_CTX(EVP_PKEY_CTX* ctx) : ctx_(ctx) {}
        ~ScopedEVP_PKEY_CTX() { EVP_PKEY_CTX_free(ctx_); }
        ScopedEVP_PKEY_CTX(const ScopedEVP_PKEY_CTX&) = delete;
        ScopedEVP_PKEY_CTX& operator=(const ScopedEVP_PKEY_CTX&) = delete;
        EVP_PKEY_CTX* get() { return ctx_; }
    private:
        EVP_PKEY_CTX* ctx_;
    };

    class ScopedEVP_MD_CTX {
    public:
        ScopedEVP_MD_CTX() : ctx_(EVP_MD_CTX_new()) {
            if (!ctx_) handleOpenSSLError("EVP_MD_CTX_new");
        }
        ~ScopedEVP_MD_CTX() { EVP_MD_CTX_free(ctx_); }
        ScopedEVP_MD_CTX(const ScopedEVP_MD_CTX&) = delete;
        ScopedEVP_MD_CTX& operator=(const ScopedEVP_MD_CTX&) = delete;
        EVP_MD_CTX* get() { return ctx_; }
    private:
        EVP_MD_CTX* ctx_;
    };

    EVP_PKEY* loadPrivateKey(const std::vector<uint8_t>& privateKey) {
        if (privateKey.size() != KEY_SIZE) {
            throw CryptoError("Private key must be 32 bytes");
        }
        EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(
            EVP_PKEY_ED25519, nullptr, privateKey.data(), privateKey.size());
        if (!pkey) handleOpenSSLError("EVP_PKEY_new_raw_private_key");
        return pkey;
    }
}

Ed25519KeyPair::~Ed25519KeyPair() {
    Crypto::secureWipe(privateKey);
}

Ed25519KeyPair Crypto::generateSigningKeyPair() {
    ScopedEVP_PKEY_CTX pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!pctx.get()) handleOpenSSLError("EVP_PKEY_CTX_new_id");

    if (EVP_PKEY_keygen_init(pctx.get()) <= 0)
        handleOpenSSLError("EVP_PKEY_keygen_init");

    ScopedEVP_PKEY pkey;
    if (EVP_PKEY_keygen(pctx.get(), pkey.ptr()) <= 0)
        handleOpenSSLError("EVP_PKEY_keygen");

    Ed25519KeyPair kp;
    kp.privateKey.resize(KEY_SIZE);
    kp.publicKey.resize(KEY_SIZE);
    size_t privLen = KEY_SIZE;
    size_t pubLen = KEY_SIZE;

    if (EVP_PKEY_get_raw_private_key(pkey.get(), kp.privateKey.data(), &privLen) <= 0)
        handleOpenSSLError("EVP_PKEY_get_raw_private_key");

    if (EVP_PKEY_get_raw_public_key(pkey.get(), kp.publicKey.data(), &pubLen) <= 0)
        handleOpenSSLError("EVP_PKEY_get_raw_public_key");

    Logger::logEvent(LogLevel::Debug, "Generated Ed25519 signing key pair");
    return kp;
}

std::vector<uint8_t> Crypto::derivePublicKey(const std::vector<uint8_t>& privateKey) {
    ScopedEVP_PKEY pkey(loadPrivateKey(privateKey));

    std::vector<uint8_t> publicKey(KEY_SIZE);
    size_t pubLen = KEY_SIZE;
    if (EVP_PKEY_get_raw_public_key(pkey.get(), publicKey.data(), &pubLen) <= 0)
        handleOpenSSLError("EVP_PKEY_get_raw_public_key");

    return publicKey;
}

std::vector<uint8_t> Crypto::ed25519Sign(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& privateKey)
{
    ScopedEVP_PKEY pkey(loadPrivateKey(privateKey));
    ScopedEVP_MD_CTX ctx;

    // Ed25519 is a one-shot scheme: no digest, sign the message directly
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0)
        handleOpenSSLError("EVP_DigestSignInit");

    size_t sig_len = SIGNATURE_SIZE;
    std::vector<uint8_t> signature(SIGNATURE_SIZE);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len,
                       data.data(), data.size()) <= 0)
        handleOpenSSLError("EVP_DigestSign");

    signature.resize(sig_len);
    return signature;
}

bool Crypto::ed25519Verify(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature,
    const std::vector<uint8_t>& publicKey)
{
    if (publicKey.size() != KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
        return false;
    }

    ScopedEVP_PKEY pkey(EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()));
    if (!pkey.get()) {
        // Not a valid curve point
        ERR_clear_error();
        return false;
    }

    ScopedEVP_MD_CTX ctx;
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0)
        handleOpenSSLError("EVP_DigestVerifyInit");

    int ret = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                               data.data(), data.size());
    if (ret != 1) {
        ERR_clear_error();
    }
    return ret == 1;
}

Address Crypto::sha256(const uint8_t* data, size_t length) {
    ScopedEVP_MD_CTX ctx;

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
        handleOpenSSLError("EVP_DigestInit_ex");

    if (!EVP_DigestUpdate(ctx.get(), data, length))
        handleOpenSSLError("EVP_DigestUpdate");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len))
        handleOpenSSLError("EVP_DigestFinal_ex");

    Address result{};
    std::copy(hash, hash + result.size(), result.begin());
    return result;
}

Address Crypto::sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Address Crypto::sha256(std::string_view data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        handleOpenSSLError("RAND_bytes");
    }
    return bytes;
}

void Crypto::secureWipe(std::vector<uint8_t>& data) {
    if (data.empty()) return;

    OPENSSL_cleanse(data.data(), data.size());
    data.clear();
    data.shrink_to_fit();
}

} // namespace garlic_shell
