// SIGIL - Keccak-256 Hash Function
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Keccak-256 as used for account addresses and typed-data hashing.
// This is the original Keccak submission padding (0x01), not FIPS 202 SHA3-256.

#ifndef SIGIL_CRYPTO_KECCAK_H
#define SIGIL_CRYPTO_KECCAK_H

#include <cstddef>
#include <string>
#include <vector>
#include "sigil/core/types.h"

namespace sigil {

Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Hashes the string's bytes
inline Hash256 Keccak256Hash(const std::string& data) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace sigil

#endif // SIGIL_CRYPTO_KECCAK_H
