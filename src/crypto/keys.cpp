// Copyright (c) 2024 The SIGIL developers
// Distributed under the MIT software license

#include <sigil/crypto/keys.h>
#include <sigil/crypto/keccak.h>
#include <sigil/core/hex.h>

#include <cstring>
#include <utility>

#include <openssl/crypto.h>

namespace sigil {

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) : size_(0) {
    data_.fill(0);
    if (data && (len == COMPRESSED_SIZE || len == UNCOMPRESSED_SIZE)) {
        std::memcpy(data_.data(), data, len);
        size_ = static_cast<uint8_t>(len);
    }
}

bool PublicKey::IsValid() const {
    if (size_ == 0) return false;
    uint8_t scratch[UNCOMPRESSED_SIZE];
    return secp256k1::ConvertPublicKey(data_.data(), size_, true, scratch);
}

PublicKey PublicKey::GetCompressed() const {
    if (IsCompressed()) return *this;
    uint8_t out[COMPRESSED_SIZE];
    if (!secp256k1::ConvertPublicKey(data_.data(), size_, true, out)) {
        return PublicKey();
    }
    return PublicKey(out, COMPRESSED_SIZE);
}

PublicKey PublicKey::GetUncompressed() const {
    if (size_ == UNCOMPRESSED_SIZE) return *this;
    uint8_t out[UNCOMPRESSED_SIZE];
    if (!secp256k1::ConvertPublicKey(data_.data(), size_, false, out)) {
        return PublicKey();
    }
    return PublicKey(out, UNCOMPRESSED_SIZE);
}

Address PublicKey::GetAddress() const {
    PublicKey full = GetUncompressed();
    if (full.size() != UNCOMPRESSED_SIZE) {
        return Address();
    }

    // Hash x || y, skipping the 0x04 prefix
    Hash256 hash = Keccak256Hash(full.data() + 1, UNCOMPRESSED_SIZE - 1);
    return Address(hash.data() + (Hash256::SIZE - Address::SIZE), Address::SIZE);
}

std::optional<PublicKey> PublicKey::RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature) {
    if (signature.size() != secp256k1::RECOVERABLE_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    int v = signature[64];
    int recid = v >= 27 ? v - 27 : v;
    if (recid < 0 || recid > 3) {
        return std::nullopt;
    }

    uint8_t pub[UNCOMPRESSED_SIZE];
    if (!secp256k1::ECDSARecover(hash.data(), signature.data(), recid, pub)) {
        return std::nullopt;
    }
    return PublicKey(pub, UNCOMPRESSED_SIZE);
}

bool PublicKey::operator==(const PublicKey& other) const {
    return size_ == other.size_ &&
           std::memcmp(data_.data(), other.data_.data(), size_) == 0;
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) {
    data_.fill(0);
    if (data) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = secp256k1::IsValidPrivateKey(data_.data());
    } else {
        valid_ = false;
    }
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : data_(other.data_), valid_(other.valid_) {
    other.Clear();
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        Clear();
        data_ = other.data_;
        valid_ = other.valid_;
        other.Clear();
    }
    return *this;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

PublicKey PrivateKey::GetPublicKey(bool compressed) const {
    if (!valid_) return PublicKey();

    uint8_t out[PublicKey::UNCOMPRESSED_SIZE];
    size_t len = compressed ? PublicKey::COMPRESSED_SIZE : PublicKey::UNCOMPRESSED_SIZE;
    if (!secp256k1::ComputePublicKey(data_.data(), compressed, out)) {
        return PublicKey();
    }
    return PublicKey(out, len);
}

std::vector<uint8_t> PrivateKey::SignCompact(const Hash256& hash) const {
    if (!valid_) return {};

    std::vector<uint8_t> signature(secp256k1::RECOVERABLE_SIGNATURE_SIZE, 0);
    int recid = 0;
    if (!secp256k1::ECDSASignRecoverable(hash.data(), data_.data(),
                                         signature.data(), &recid)) {
        return {};
    }
    signature[64] = static_cast<uint8_t>(recid);
    return signature;
}

std::optional<PrivateKey> PrivateKey::TweakAdd(const Hash256& tweak) const {
    if (!valid_) return std::nullopt;

    uint8_t result[SIZE];
    if (!secp256k1::PrivateKeyTweakAdd(data_.data(), tweak.data(), result)) {
        OPENSSL_cleanse(result, SIZE);
        return std::nullopt;
    }

    PrivateKey tweaked(result);
    OPENSSL_cleanse(result, SIZE);
    if (!tweaked.IsValid()) return std::nullopt;
    return std::optional<PrivateKey>(std::move(tweaked));
}

bool PrivateKey::operator==(const PrivateKey& other) const {
    if (!valid_ && !other.valid_) {
        return true;
    }
    if (!valid_ || !other.valid_) {
        return false;
    }
    return CRYPTO_memcmp(data_.data(), other.data_.data(), SIZE) == 0;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.size() != SIZE * 2 || !IsValidHex(digits)) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes = HexToBytes(digits);
    PrivateKey key(bytes.data());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!key.IsValid()) return std::nullopt;
    return std::optional<PrivateKey>(std::move(key));
}

} // namespace sigil
