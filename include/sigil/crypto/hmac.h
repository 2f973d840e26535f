// SIGIL - HMAC and Key Stretching
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// HMAC-SHA256 / HMAC-SHA512 (RFC 2104) and PBKDF2-HMAC-SHA512 (RFC 8018),
// backed by the OpenSSL 3 EVP_MAC and PKCS5 interfaces.

#ifndef SIGIL_CRYPTO_HMAC_H
#define SIGIL_CRYPTO_HMAC_H

#include "sigil/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sigil {

/**
 * Incremental HMAC whose digest is chosen by output size: 32 bytes selects
 * SHA-256, 64 bytes selects SHA-512. Only those two are instantiated.
 *
 * The key is copied and wiped on destruction. OpenSSL failures throw
 * std::runtime_error.
 */
template<size_t N>
class Hmac {
public:
    static constexpr size_t OUTPUT_SIZE = N;

    Hmac(const Byte* key, size_t keyLen);
    ~Hmac();

    Hmac(const Hmac&) = delete;
    Hmac& operator=(const Hmac&) = delete;

    Hmac& Write(const Byte* data, size_t len);

    /// Writes OUTPUT_SIZE bytes; call Reset() before reusing
    void Finalize(Byte* mac);

    /// Restart with the same key
    Hmac& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

extern template class Hmac<32>;
extern template class Hmac<64>;

using HMAC_SHA256 = Hmac<32>;
using HMAC_SHA512 = Hmac<64>;

Hash256 ComputeHMAC_SHA256(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

inline Hash512 ComputeHMAC_SHA512(const std::vector<Byte>& key,
                                  const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

/// PBKDF2 with HMAC-SHA512. The password is used as given (no normalisation).
/// Returns an empty vector if OpenSSL rejects the parameters.
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen);

} // namespace sigil

#endif // SIGIL_CRYPTO_HMAC_H
