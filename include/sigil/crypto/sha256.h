// SIGIL - SHA256 Hash Function
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// SHA-256 (FIPS 180-4) and Hash160 through OpenSSL EVP digests.

#ifndef SIGIL_CRYPTO_SHA256_H
#define SIGIL_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "sigil/core/types.h"

namespace sigil {

/// Compute SHA256 hash of data in a single call
/// @param data Input data
/// @param len Length of input
/// @return Hash256 containing the result
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// RIPEMD160(SHA256(data)), used for BIP32 key fingerprints
/// @return 20-byte digest
std::array<Byte, 20> Hash160(const Byte* data, size_t len);

} // namespace sigil

#endif // SIGIL_CRYPTO_SHA256_H
