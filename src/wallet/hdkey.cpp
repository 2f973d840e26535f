// SIGIL - Hierarchical Deterministic Keys (BIP32)
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/wallet/hdkey.h"
#include "sigil/crypto/hmac.h"
#include "sigil/crypto/sha256.h"

#include <algorithm>
#include <vector>

#include <openssl/crypto.h>

namespace sigil {
namespace wallet {

namespace {

const char SEED_KEY[] = "Bitcoin seed";

/// Splits I = HMAC-SHA512(...) into IL and IR, wiping I
void SplitHmacOutput(Hash512& out, Hash256& left, ExtendedKey::ChainCode& right) {
    left = Hash256(out.data(), 32);
    std::copy(out.begin() + 32, out.end(), right.begin());
    OPENSSL_cleanse(out.data(), out.size());
}

uint32_t ReadBE32(const Byte* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
}

} // anonymous namespace

ExtendedKey::ExtendedKey() {
    secret_.fill(0);
    chainCode_.fill(0);
}

ExtendedKey::ExtendedKey(const PrivateKey& key, const ChainCode& chainCode, uint8_t depth,
                         uint32_t parentFingerprint, uint32_t childIndex)
    : chainCode_(chainCode)
    , depth_(depth)
    , parentFingerprint_(parentFingerprint)
    , childIndex_(childIndex)
    , valid_(key.IsValid()) {
    secret_.fill(0);
    if (valid_) {
        std::copy(key.data(), key.data() + PrivateKey::SIZE, secret_.begin());
    }
}

ExtendedKey::~ExtendedKey() {
    OPENSSL_cleanse(secret_.data(), secret_.size());
    OPENSSL_cleanse(chainCode_.data(), chainCode_.size());
}

ExtendedKey ExtendedKey::FromSeed(const Byte* seed, size_t seedLen) {
    if (!seed || seedLen < MIN_SEED_SIZE || seedLen > MAX_SEED_SIZE) {
        return ExtendedKey();
    }

    Hash512 i = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(SEED_KEY),
                                   sizeof(SEED_KEY) - 1, seed, seedLen);
    Hash256 il;
    ChainCode ir;
    SplitHmacOutput(i, il, ir);

    PrivateKey key(il.data());
    OPENSSL_cleanse(il.data(), il.size());
    ExtendedKey master = key.IsValid() ? ExtendedKey(key, ir) : ExtendedKey();
    OPENSSL_cleanse(ir.data(), ir.size());
    return master;
}

std::optional<ExtendedKey> ExtendedKey::DeriveChild(uint32_t index) const {
    if (!valid_ || depth_ == MAX_DEPTH) {
        return std::nullopt;
    }

    // hardened: 0x00 || k || index, normal: serP(K) || index
    std::vector<Byte> data;
    data.reserve(1 + PrivateKey::SIZE + 4);
    if (index & HARDENED_FLAG) {
        data.push_back(0);
        data.insert(data.end(), secret_.begin(), secret_.end());
    } else {
        PublicKey pub = GetPublicKey();
        data.insert(data.end(), pub.begin(), pub.end());
    }
    for (int shift = 24; shift >= 0; shift -= 8) {
        data.push_back(static_cast<Byte>(index >> shift));
    }

    Hash512 i = ComputeHMAC_SHA512(chainCode_.data(), chainCode_.size(), data.data(), data.size());
    OPENSSL_cleanse(data.data(), data.size());
    Hash256 il;
    ChainCode ir;
    SplitHmacOutput(i, il, ir);

    std::optional<PrivateKey> childKey = PrivateKey(secret_.data()).TweakAdd(il);
    OPENSSL_cleanse(il.data(), il.size());

    std::optional<ExtendedKey> child;
    if (childKey) {
        child.emplace(*childKey, ir, static_cast<uint8_t>(depth_ + 1), GetFingerprint(), index);
    }
    OPENSSL_cleanse(ir.data(), ir.size());
    return child;
}

std::optional<ExtendedKey> ExtendedKey::DerivePath(const DerivationPath& path) const {
    std::optional<ExtendedKey> key(*this);
    for (uint32_t index : path.GetIndices()) {
        key = key->DeriveChild(index);
        if (!key) break;
    }
    return key;
}

std::optional<PrivateKey> ExtendedKey::GetPrivateKey() const {
    if (!valid_) {
        return std::nullopt;
    }
    PrivateKey key(secret_.data());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return std::optional<PrivateKey>(std::move(key));
}

PublicKey ExtendedKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    return PrivateKey(secret_.data()).GetPublicKey(true);
}

uint32_t ExtendedKey::GetFingerprint() const {
    if (!valid_) {
        return 0;
    }
    PublicKey pub = GetPublicKey();
    return ReadBE32(Hash160(pub.data(), pub.size()).data());
}

} // namespace wallet
} // namespace sigil
