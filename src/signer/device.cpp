// SIGIL - Hardware Wallet Interface
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/signer/device.h"

#include "sigil/crypto/keys.h"
#include "sigil/util/logging.h"

#include <openssl/crypto.h>

namespace sigil {

// ============================================================================
// DebugDevice
// ============================================================================

DebugDevice::DebugDevice(std::string mnemonic, std::string name)
    : mnemonic_(std::move(mnemonic)), name_(std::move(name)) {}

DebugDevice::~DebugDevice() {
    Close();
    OPENSSL_cleanse(&mnemonic_[0], mnemonic_.size());
}

bool DebugDevice::Open(const std::string& passphrase, std::string& error) {
    wallet::MnemonicStatus status = wallet::Mnemonic::Check(mnemonic_);
    if (status != wallet::MnemonicStatus::OK) {
        error = std::string("device not initialised: ") + wallet::MnemonicStatusString(status);
        return false;
    }

    auto seed = wallet::Mnemonic::ToSeed(mnemonic_, passphrase);
    master_ = wallet::ExtendedKey::FromBIP39Seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());

    if (!master_.IsValid()) {
        error = "device seed is unusable";
        return false;
    }
    return true;
}

void DebugDevice::Close() {
    master_ = wallet::ExtendedKey();
}

std::optional<wallet::ExtendedKey> DebugDevice::Derive(const wallet::DerivationPath& path,
                                                       std::string& error) const {
    if (!master_.IsValid()) {
        error = "device not open";
        return std::nullopt;
    }
    if (path.Depth() > MAX_BIP32_PATH) {
        error = "Path depth out of range";
        return std::nullopt;
    }
    auto key = master_.DerivePath(path);
    if (!key) {
        error = "ExtendedKey derive failed";
    }
    return key;
}

bool DebugDevice::DeriveAccount(const wallet::DerivationPath& path,
                                DeviceAccount& account, std::string& error) {
    auto key = Derive(path, error);
    if (!key) {
        return false;
    }
    account.address = key->GetPublicKey().GetAddress();
    account.path = path;
    return true;
}

bool DebugDevice::SignTypedData(const DeviceAccount& account, const Digest& digest,
                                std::vector<Byte>& signature, std::string& error) {
    auto key = Derive(account.path, error);
    if (!key) {
        return false;
    }
    auto priv = key->GetPrivateKey();
    if (!priv) {
        error = "derived key is invalid";
        return false;
    }
    if (priv->GetPublicKey().GetAddress() != account.address) {
        error = "account does not belong to this device";
        return false;
    }

    std::vector<Byte> sig = priv->SignCompact(digest);
    if (sig.size() != secp256k1::RECOVERABLE_SIGNATURE_SIZE) {
        error = "signing failed";
        return false;
    }
    sig[64] += 27;
    signature = std::move(sig);
    return true;
}

// ============================================================================
// DeviceSession
// ============================================================================

DeviceSession& DeviceSession::operator=(DeviceSession&& other) noexcept {
    if (this != &other) {
        Close();
        device_ = std::move(other.device_);
    }
    return *this;
}

void DeviceSession::Close() {
    if (device_) {
        LOG_DEBUG(util::LogCategory::Device) << "Closing " << device_->GetName();
        device_->Close();
        device_.reset();
    }
}

} // namespace sigil
