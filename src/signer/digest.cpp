// SIGIL - Digest Validation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/signer/digest.h"

#include "sigil/core/error.h"
#include "sigil/core/hex.h"
#include "sigil/crypto/keccak.h"

#include <iterator>
#include <stdexcept>
#include <string>

namespace sigil {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

Digest ValidateDigest(const std::vector<Byte>& bytes) {
    if (bytes.size() != DIGEST_SIZE) {
        throw DigestLengthException(DIGEST_SIZE, bytes.size());
    }
    return Digest(bytes.data(), bytes.size());
}

Digest HashTypedDataEncoding(const std::vector<Byte>& encoding) {
    if (encoding.size() != TYPED_DATA_ENCODING_SIZE) {
        throw DigestLengthException(TYPED_DATA_ENCODING_SIZE, encoding.size());
    }
    if (encoding[0] != 0x19 || encoding[1] != 0x01) {
        throw SignerException(SignerError::INVALID_TYPED_DATA,
                              "typed data encoding must start with 0x1901");
    }
    return Keccak256Hash(encoding);
}

Digest ReadDigest(std::istream& in, std::vector<Byte>& data) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("error reading digest input");
    }

    std::string hex = StripHexPrefix(Trim(text));
    try {
        data = HexToBytes(hex);
    } catch (const std::invalid_argument& e) {
        throw SignerException(SignerError::INVALID_DIGEST_ENCODING,
                              std::string("input is not hex: ") + e.what());
    }

    if (data.size() == TYPED_DATA_ENCODING_SIZE) {
        return HashTypedDataEncoding(data);
    }
    return ValidateDigest(data);
}

} // namespace sigil
