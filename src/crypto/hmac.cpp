// SIGIL - HMAC Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// HMAC-SHA256 and HMAC-SHA512 on top of OpenSSL EVP_MAC.

#include "sigil/crypto/hmac.h"
#include <cstring>
#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace sigil {

namespace {

struct MacDeleter {
    void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
};
struct MacCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};

/// Owns an EVP_MAC_CTX configured for HMAC with a fixed digest and key
class MacContext {
public:
    MacContext(const char* digest, const Byte* key, size_t keyLen)
        : digest_(digest), key_(key, key + keyLen) {
        mac_.reset(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
        if (!mac_) {
            throw std::runtime_error("HMAC: EVP_MAC_fetch failed");
        }
        ctx_.reset(EVP_MAC_CTX_new(mac_.get()));
        if (!ctx_) {
            throw std::runtime_error("HMAC: EVP_MAC_CTX_new failed");
        }
        Init();
    }

    ~MacContext() {
        if (!key_.empty()) {
            OPENSSL_cleanse(key_.data(), key_.size());
        }
    }

    MacContext(const MacContext&) = delete;
    MacContext& operator=(const MacContext&) = delete;

    void Init() {
        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(
            OSSL_MAC_PARAM_DIGEST, const_cast<char*>(digest_), 0);
        params[1] = OSSL_PARAM_construct_end();

        // A zero-length key is still passed as a non-null pointer
        static const Byte EMPTY_KEY[1] = {0};
        const Byte* key = key_.empty() ? EMPTY_KEY : key_.data();
        if (EVP_MAC_init(ctx_.get(), key, key_.size(), params) != 1) {
            throw std::runtime_error("HMAC: EVP_MAC_init failed");
        }
    }

    void Update(const Byte* data, size_t len) {
        if (len == 0) return;
        if (EVP_MAC_update(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("HMAC: EVP_MAC_update failed");
        }
    }

    void Final(Byte* out, size_t outSize) {
        size_t written = 0;
        if (EVP_MAC_final(ctx_.get(), out, &written, outSize) != 1 || written != outSize) {
            throw std::runtime_error("HMAC: EVP_MAC_final failed");
        }
    }

private:
    const char* digest_;
    std::vector<Byte> key_;
    std::unique_ptr<EVP_MAC, MacDeleter> mac_;
    std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter> ctx_;
};

} // anonymous namespace

// ============================================================================
// Hmac<N>
// ============================================================================

template<size_t N>
struct Hmac<N>::Impl {
    MacContext mac;
    Impl(const Byte* key, size_t keyLen) : mac(N == 32 ? "SHA256" : "SHA512", key, keyLen) {}
};

template<size_t N>
Hmac<N>::Hmac(const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>(key, keyLen)) {}

template<size_t N>
Hmac<N>::~Hmac() = default;

template<size_t N>
Hmac<N>& Hmac<N>::Write(const Byte* data, size_t len) {
    impl_->mac.Update(data, len);
    return *this;
}

template<size_t N>
void Hmac<N>::Finalize(Byte* mac) {
    impl_->mac.Final(mac, N);
}

template<size_t N>
Hmac<N>& Hmac<N>::Reset() {
    impl_->mac.Init();
    return *this;
}

template class Hmac<32>;
template class Hmac<64>;

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash256 result;
    HMAC_SHA256(key, keyLen).Write(data, dataLen).Finalize(result.data());
    return result;
}

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash512 result;
    HMAC_SHA512(key, keyLen).Write(data, dataLen).Finalize(result.data());
    return result;
}

// ============================================================================
// PBKDF2
// ============================================================================

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen) {
    std::vector<Byte> result(keyLen);
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               salt.data(), static_cast<int>(salt.size()),
                               static_cast<int>(iterations), EVP_sha512(),
                               static_cast<int>(keyLen), result.data());
    if (ok != 1) {
        OPENSSL_cleanse(result.data(), result.size());
        return {};
    }
    return result;
}

} // namespace sigil
