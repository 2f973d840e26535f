// SIGIL - Recoverable Signatures
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/signer/signature.h"

#include "sigil/core/error.h"
#include "sigil/core/hex.h"
#include "sigil/crypto/keys.h"

#include <algorithm>

namespace sigil {

std::optional<Signature> Signature::FromBytes(const std::vector<Byte>& bytes) {
    if (bytes.size() != SIZE) {
        return std::nullopt;
    }
    Signature sig;
    std::copy(bytes.begin(), bytes.begin() + 32, sig.r.begin());
    std::copy(bytes.begin() + 32, bytes.begin() + 64, sig.s.begin());
    sig.v = bytes[64];
    return sig;
}

std::vector<Byte> Signature::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(SIZE);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(v);
    return out;
}

std::string Signature::ToHex() const {
    return BytesToHex(ToBytes());
}

Address RecoverSigner(const Digest& digest, const Signature& signature) {
    auto pubkey = PublicKey::RecoverCompact(digest, signature.ToBytes());
    if (!pubkey) {
        throw SignerException(SignerError::SIGNING,
                              "could not recover a public key from the signature");
    }
    return pubkey->GetAddress();
}

bool VerifyRecoveredSigner(const Digest& digest, const Signature& signature,
                           const Address& expected, std::string& problem) {
    auto pubkey = PublicKey::RecoverCompact(digest, signature.ToBytes());
    if (!pubkey) {
        problem = "signature does not recover to any public key";
        return false;
    }
    Address recovered = pubkey->GetAddress();
    if (recovered != expected) {
        problem = "signature recovers to " + recovered.ToChecksumString() +
                  ", expected " + expected.ToChecksumString();
        return false;
    }
    return true;
}

} // namespace sigil
