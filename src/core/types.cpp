// SIGIL - Core Types Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/core/types.h"
#include "sigil/core/hex.h"
#include "sigil/crypto/keccak.h"

#include <stdexcept>

namespace sigil {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.size() != 2 * SIZE) {
        throw std::invalid_argument("expected " + std::to_string(2 * SIZE) +
                                    " hex digits, got " + std::to_string(digits.size()));
    }
    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<160>;
template class BaseHash<256>;
template class BaseHash<512>;

std::string Address::ToChecksumString() const {
    const std::string lower = ToHex();
    const Hash256 hash = Keccak256Hash(reinterpret_cast<const Byte*>(lower.data()), lower.size());

    std::string out = "0x" + lower;
    for (size_t i = 0; i < lower.size(); ++i) {
        const int nibble = (i & 1) ? (hash[i / 2] & 0xf) : (hash[i / 2] >> 4);
        char& c = out[2 + i];
        if (nibble >= 8 && c >= 'a' && c <= 'f') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

} // namespace sigil
