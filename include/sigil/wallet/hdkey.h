// SIGIL - Hierarchical Deterministic Keys (BIP32)
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Private derivation only. Extended keys are never serialised, so there is
// no xprv/xpub encoding and no public-parent derivation.

#ifndef SIGIL_WALLET_HDKEY_H
#define SIGIL_WALLET_HDKEY_H

#include <sigil/core/types.h>
#include <sigil/crypto/keys.h>
#include <sigil/wallet/mnemonic.h>
#include <sigil/wallet/path.h>

#include <array>
#include <cstdint>
#include <optional>

namespace sigil {
namespace wallet {

constexpr size_t MIN_SEED_SIZE = 16;
constexpr size_t MAX_SEED_SIZE = 64;

class ExtendedKey {
public:
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    static constexpr uint8_t MAX_DEPTH = 255;
    using ChainCode = std::array<Byte, CHAIN_CODE_SIZE>;

    /// Invalid key
    ExtendedKey();

    ExtendedKey(const PrivateKey& key, const ChainCode& chainCode, uint8_t depth = 0,
                uint32_t parentFingerprint = 0, uint32_t childIndex = 0);

    /// Wipes the scalar and chain code
    ~ExtendedKey();

    ExtendedKey(const ExtendedKey&) = default;
    ExtendedKey& operator=(const ExtendedKey&) = default;
    ExtendedKey(ExtendedKey&&) noexcept = default;
    ExtendedKey& operator=(ExtendedKey&&) noexcept = default;

    /**
     * Master key: I = HMAC-SHA512("Bitcoin seed", seed), scalar = I[0..32),
     * chain code = I[32..64). The result is invalid for a seed outside 16..64
     * bytes or a scalar of zero or >= n.
     */
    static ExtendedKey FromSeed(const Byte* seed, size_t seedLen);
    static ExtendedKey FromBIP39Seed(const std::array<Byte, BIP39_SEED_SIZE>& seed) {
        return FromSeed(seed.data(), seed.size());
    }

    /// CKDpriv. `index` carries HARDENED_FLAG for hardened children.
    /// nullopt when IL >= n, the child scalar is zero or depth is MAX_DEPTH.
    std::optional<ExtendedKey> DeriveChild(uint32_t index) const;
    std::optional<ExtendedKey> DerivePath(const DerivationPath& path) const;

    bool IsValid() const { return valid_; }

    std::optional<PrivateKey> GetPrivateKey() const;

    /// Compressed
    PublicKey GetPublicKey() const;

    const ChainCode& GetChainCode() const { return chainCode_; }
    uint8_t GetDepth() const { return depth_; }
    uint32_t GetParentFingerprint() const { return parentFingerprint_; }
    uint32_t GetChildIndex() const { return childIndex_; }

    /// First four bytes of Hash160(compressed public key), big-endian
    uint32_t GetFingerprint() const;

private:
    std::array<Byte, PrivateKey::SIZE> secret_;
    ChainCode chainCode_;
    uint8_t depth_{0};
    uint32_t parentFingerprint_{0};
    uint32_t childIndex_{0};
    bool valid_{false};
};

} // namespace wallet
} // namespace sigil

#endif // SIGIL_WALLET_HDKEY_H
