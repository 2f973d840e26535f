// SIGIL - Core Types Header
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Fixed-size byte strings shared by the crypto, wallet and signer layers.

#ifndef SIGIL_CORE_TYPES_H
#define SIGIL_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace sigil {

using Byte = uint8_t;

/**
 * BITS/8 bytes kept in the order they were given. Hex conversion is in that
 * same order (no byte reversal).
 */
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { data_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copies min(len, SIZE) bytes and zero-fills the rest
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        size_t n = len < SIZE ? len : SIZE;
        if (data && n) {
            std::memcpy(data_.data(), data, n);
        }
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const BaseHash& other) const noexcept { return data_ != other.data_; }

    /// Lowercase, no prefix
    std::string ToHex() const;

    /// Exactly 2*SIZE hex digits after an optional 0x.
    /// @throws std::invalid_argument otherwise
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

extern template class BaseHash<160>;
extern template class BaseHash<256>;
extern template class BaseHash<512>;

class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) { return BaseHash<256>::FromHex(hex); }
};

class Hash512 : public BaseHash<512> {
public:
    using BaseHash<512>::BaseHash;
};

/// 20-byte account address
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Address FromHex(const std::string& hex) { return BaseHash<160>::FromHex(hex); }

    /// "0x" plus EIP-55 mixed case: a letter is upper-cased when the matching
    /// nibble of Keccak-256(lowercase hex) is 8 or more
    std::string ToChecksumString() const;
};

} // namespace sigil

#endif // SIGIL_CORE_TYPES_H
