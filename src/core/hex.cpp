// SIGIL - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/core/hex.h"

namespace sigil {

namespace {

const char DIGITS[] = "0123456789abcdef";

/// Value of one hex digit, or -1
int DigitValue(char c) {
    switch (c) {
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return c - '0';
        case 'a': case 'b': case 'c': case 'd': case 'e': case 'f':
            return 10 + (c - 'a');
        case 'A': case 'B': case 'C': case 'D': case 'E': case 'F':
            return 10 + (c - 'A');
        default:
            return -1;
    }
}

} // anonymous namespace

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0xf];
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    if (hex.size() & 1) {
        throw std::invalid_argument("odd number of hex digits (" +
                                    std::to_string(hex.size()) + ")");
    }

    std::vector<HexByte> out(hex.size() / 2);
    for (size_t pos = 0; pos < hex.size(); ++pos) {
        int value = DigitValue(hex[pos]);
        if (value < 0) {
            throw std::invalid_argument("invalid hex digit at offset " + std::to_string(pos));
        }
        out[pos / 2] = static_cast<HexByte>((out[pos / 2] << 4) | value);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || (str.size() & 1)) {
        return false;
    }
    for (char c : str) {
        if (DigitValue(c) < 0) return false;
    }
    return true;
}

bool HasHexPrefix(const std::string& str) {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

std::string StripHexPrefix(const std::string& str) {
    if (!HasHexPrefix(str)) {
        return str;
    }
    return str.substr(2);
}

} // namespace sigil
