// SIGIL - Signers
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/signer/signer.h"

#include "sigil/core/error.h"
#include "sigil/util/logging.h"

namespace sigil {

// ============================================================================
// KeySigner
// ============================================================================

KeySigner::KeySigner(PrivateKey key, std::string description)
    : key_(std::move(key)), description_(std::move(description)) {
    if (!key_.IsValid()) {
        throw SignerException(SignerError::KEY_DECODE, "signer requires a valid private key");
    }
    address_ = key_.GetPublicKey(false).GetAddress();
}

Signature KeySigner::Sign(const Digest& digest) {
    std::vector<Byte> compact = key_.SignCompact(digest);
    auto sig = Signature::FromBytes(compact);
    if (!sig || sig->v > 1) {
        throw SignerException(SignerError::SIGNING, "ECDSA signing failed");
    }
    sig->v += RECOVERY_ID_OFFSET;

    LOG_DEBUG(util::LogCategory::Signer) << "Signed " << digest.ToHex()
                                         << " with " << description_;
    return *sig;
}

// ============================================================================
// DeviceSigner
// ============================================================================

DeviceSigner::DeviceSigner(DeviceSession session, DeviceAccount account)
    : session_(std::move(session)), account_(std::move(account)) {
    if (session_.IsOpen()) {
        name_ = session_->GetName();
    }
}

std::string DeviceSigner::Describe() const {
    return "device " + name_ + " " + account_.path.ToString();
}

Signature DeviceSigner::Sign(const Digest& digest) {
    if (!session_.IsOpen()) {
        throw SignerException(SignerError::DEVICE_SIGNING, "device session is closed");
    }

    LOG_INFO(util::LogCategory::Device) << "Waiting for approval on " << name_;

    std::vector<Byte> raw;
    std::string error;
    if (!session_->SignTypedData(account_, digest, raw, error)) {
        throw SignerException(SignerError::DEVICE_SIGNING, "device signing failed: " + error);
    }

    auto sig = Signature::FromBytes(raw);
    if (!sig) {
        throw SignerException(SignerError::DEVICE_SIGNING,
                              "device returned a " + std::to_string(raw.size()) +
                              "-byte signature");
    }

    // Devices differ on whether v carries the 27 offset
    if (sig->v == 0 || sig->v == 1) {
        sig->v += RECOVERY_ID_OFFSET;
    } else if (sig->v != 27 && sig->v != 28) {
        throw SignerException(SignerError::DEVICE_SIGNING,
                              "device returned recovery byte " + std::to_string(sig->v));
    }
    return *sig;
}

} // namespace sigil
