// SIGIL - Keccak-256 Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Thin wrapper over the ethash Keccak implementation.

#include "sigil/crypto/keccak.h"

#include <ethash/keccak.hpp>

namespace sigil {

Hash256 Keccak256Hash(const Byte* data, size_t len) {
    const ethash::hash256 hash = ethash::keccak256(data, len);
    return Hash256(hash.bytes, sizeof(hash.bytes));
}

} // namespace sigil
