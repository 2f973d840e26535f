// SIGIL - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_CORE_HEX_H
#define SIGIL_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace sigil {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. An empty string decodes to no bytes.
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid non-empty hex
bool IsValidHex(const std::string& str);

/// Return true if the string starts with 0x or 0X
bool HasHexPrefix(const std::string& str);

/// Remove a leading 0x / 0X if present
std::string StripHexPrefix(const std::string& str);

} // namespace sigil

#endif // SIGIL_CORE_HEX_H
