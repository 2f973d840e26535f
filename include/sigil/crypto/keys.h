// Copyright (c) 2024 The SIGIL developers
// Distributed under the MIT software license

#pragma once

#include <sigil/core/types.h>
#include <sigil/crypto/secp256k1.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil {

namespace secp256k1 {
constexpr size_t PRIVATE_KEY_SIZE = 32;
/// r (32) || s (32) || recovery byte
constexpr size_t RECOVERABLE_SIGNATURE_SIZE = 65;
} // namespace secp256k1

/**
 * secp256k1 public key, held in SEC1 form: 33 bytes compressed or 65 bytes
 * uncompressed. A default-constructed key is empty and invalid.
 *
 * BIP32 fingerprints hash the compressed form; account addresses hash the
 * uncompressed X || Y.
 */
class PublicKey {
public:
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_SIZE;
    static constexpr size_t UNCOMPRESSED_SIZE = secp256k1::UNCOMPRESSED_SIZE;

    PublicKey() { data_.fill(0); }

    /// Any length other than 33 or 65 yields an empty key
    explicit PublicKey(const uint8_t* data, size_t len);
    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// True if the bytes decode to a point on the curve
    bool IsValid() const;
    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }

    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }
    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + size_; }

    PublicKey GetCompressed() const;
    PublicKey GetUncompressed() const;

    /// Last 20 bytes of Keccak-256(X || Y)
    Address GetAddress() const;

    /// Recover the signing key from r || s || v. v is the recovery id,
    /// optionally offset by 27. Returns nullopt for malformed signatures.
    static std::optional<PublicKey> RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature);

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;

private:
    std::array<uint8_t, UNCOMPRESSED_SIZE> data_;
    uint8_t size_{0};
};

/**
 * secp256k1 secret scalar in [1, n-1]. Move-only; the bytes are cleansed on
 * destruction, on Clear(), and in the moved-from object.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    PrivateKey() { data_.fill(0); }

    /// Reads SIZE bytes; out-of-range scalars give an invalid key
    explicit PrivateKey(const uint8_t* data);
    explicit PrivateKey(const std::array<uint8_t, SIZE>& data)
        : PrivateKey(data.data()) {}

    ~PrivateKey();

    PrivateKey(PrivateKey&& other) noexcept;
    PrivateKey& operator=(PrivateKey&& other) noexcept;

    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }
    static constexpr size_t size() { return SIZE; }

    PublicKey GetPublicKey(bool compressed = true) const;

    /// Deterministic (RFC 6979) low-s signature over a 32-byte hash:
    /// r || s || recid with recid in [0, 3]. Empty on failure.
    std::vector<uint8_t> SignCompact(const Hash256& hash) const;

    /// (key + tweak) mod n; nullopt if the tweak is >= n or the sum is zero
    std::optional<PrivateKey> TweakAdd(const Hash256& tweak) const;

    /// Constant-time
    bool operator==(const PrivateKey& other) const;
    bool operator!=(const PrivateKey& other) const { return !(*this == other); }

    std::string ToHex() const;

    /// Optional 0x prefix, then exactly 64 hex digits of a scalar in [1, n-1]
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    void Clear();

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

} // namespace sigil
