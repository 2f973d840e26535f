// SIGIL - Signers
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// A signer turns a 32-byte digest into a 65-byte recoverable signature for a
// fixed address. Two backends exist: an in-memory secp256k1 key and a
// hardware wallet session.

#ifndef SIGIL_SIGNER_SIGNER_H
#define SIGIL_SIGNER_SIGNER_H

#include <sigil/core/types.h>
#include <sigil/crypto/keys.h>
#include <sigil/signer/device.h>
#include <sigil/signer/digest.h>
#include <sigil/signer/signature.h>

#include <string>

namespace sigil {

/// Common signing interface
class ISigner {
public:
    virtual ~ISigner() = default;

    /// Address the signatures recover to; fixed for the signer's lifetime
    virtual Address GetAddress() const = 0;

    /// Sign a digest; v of the result is 27 or 28
    virtual Signature Sign(const Digest& digest) = 0;

    /// Short description of the backend for logs
    virtual std::string Describe() const = 0;
};

/**
 * Signs with an owned private key (RFC 6979 nonces, low-s).
 * The key is wiped when the signer is destroyed.
 */
class KeySigner : public ISigner {
public:
    /// @throws SignerException(KEY_DECODE) if the key is invalid
    explicit KeySigner(PrivateKey key, std::string description = "private key");

    Address GetAddress() const override { return address_; }
    Signature Sign(const Digest& digest) override;
    std::string Describe() const override { return description_; }

private:
    PrivateKey key_;
    Address address_;
    std::string description_;
};

/**
 * Signs through a hardware wallet session it owns.
 * The session is closed when the signer is destroyed.
 */
class DeviceSigner : public ISigner {
public:
    DeviceSigner(DeviceSession session, DeviceAccount account);

    Address GetAddress() const override { return account_.address; }
    Signature Sign(const Digest& digest) override;
    std::string Describe() const override;

private:
    DeviceSession session_;
    DeviceAccount account_;
    std::string name_;
};

} // namespace sigil

#endif // SIGIL_SIGNER_SIGNER_H
