// SIGIL - Recoverable Signatures
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_SIGNER_SIGNATURE_H
#define SIGIL_SIGNER_SIGNATURE_H

#include <sigil/core/types.h>
#include <sigil/signer/digest.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil {

/// Offset added to the raw recovery id in the emitted v byte
constexpr uint8_t RECOVERY_ID_OFFSET = 27;

/**
 * 65-byte recoverable ECDSA signature r || s || v.
 * Signatures produced by a signer always carry v = 27 or 28.
 */
struct Signature {
    static constexpr size_t SIZE = 65;

    std::array<Byte, 32> r{};
    std::array<Byte, 32> s{};
    uint8_t v{0};

    /// Split 65 bytes into r, s and v (v copied verbatim)
    static std::optional<Signature> FromBytes(const std::vector<Byte>& bytes);

    /// Serialize as r || s || v
    std::vector<Byte> ToBytes() const;

    /// Lowercase hex of ToBytes(), no prefix
    std::string ToHex() const;

    bool operator==(const Signature& other) const {
        return r == other.r && s == other.s && v == other.v;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }
};

/// Recover the address that produced a signature over a digest
/// @throws SignerException(SIGNING) if no public key can be recovered
Address RecoverSigner(const Digest& digest, const Signature& signature);

/// Check that a signature recovers to the expected address. Never throws for
/// a malformed signature; returns false and describes the mismatch instead.
bool VerifyRecoveredSigner(const Digest& digest, const Signature& signature,
                           const Address& expected, std::string& problem);

} // namespace sigil

#endif // SIGIL_SIGNER_SIGNATURE_H
