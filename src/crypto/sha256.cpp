// SIGIL - SHA256 Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/crypto/sha256.h"
#include <stdexcept>

#include <openssl/evp.h>

namespace sigil {

namespace {

void Digest(const EVP_MD* md, const Byte* data, size_t len, Byte* out, size_t outLen) {
    unsigned int written = 0;
    if (!md || EVP_Digest(data, len, out, &written, md, nullptr) != 1 ||
        written != outLen) {
        throw std::runtime_error("EVP_Digest failed");
    }
}

} // anonymous namespace

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Digest(EVP_sha256(), data, len, result.data(), Hash256::SIZE);
    return result;
}

std::array<Byte, 20> Hash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    std::array<Byte, 20> result{};
    Digest(EVP_ripemd160(), sha.data(), sha.size(), result.data(), result.size());
    return result;
}

} // namespace sigil
