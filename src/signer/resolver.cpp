// SIGIL - Credential Resolution
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/signer/resolver.h"

#include "sigil/core/error.h"
#include "sigil/util/logging.h"
#include "sigil/wallet/derivation.h"

namespace sigil {

namespace {

std::unique_ptr<ISigner> ResolveDevice(const wallet::DerivationPath& path,
                                       const std::string& passphrase, IDeviceHub& hub) {
    auto devices = hub.Enumerate();
    if (devices.empty()) {
        throw SignerException(SignerError::NO_DEVICE_FOUND,
                              "no hardware wallet found, please connect your device");
    }
    if (devices.size() > 1) {
        throw SignerException(SignerError::AMBIGUOUS_DEVICE,
                              std::to_string(devices.size()) +
                              " hardware wallets found, please use one device at a time");
    }

    std::shared_ptr<IHardwareWallet> device = devices.front();
    LOG_DEBUG(util::LogCategory::Device) << "Opening " << device->GetName();

    std::string error;
    if (!device->Open(passphrase, error)) {
        throw SignerException(SignerError::DEVICE_LOCKED_OR_UNAVAILABLE,
                              "error opening " + device->GetName() +
                              " (is it unlocked?): " + error);
    }
    DeviceSession session(device);

    DeviceAccount account;
    if (!session->DeriveAccount(path, account, error)) {
        throw SignerException(SignerError::DEVICE_DERIVATION,
                              "error deriving device account " + path.ToString() + ": " + error);
    }

    LOG_DEBUG(util::LogCategory::Device) << "Device account " << account.address.ToChecksumString();
    return std::make_unique<DeviceSigner>(std::move(session), std::move(account));
}

} // anonymous namespace

void CheckCredentialSelection(const CredentialOptions& options) {
    int selected = 0;
    if (!options.privateKeyHex.empty()) ++selected;
    if (!options.mnemonic.empty()) ++selected;
    if (options.useDevice) ++selected;
    if (selected != 1) {
        throw SignerException(SignerError::AMBIGUOUS_CREDENTIAL_SELECTION,
                              "one (and only one) of --private-key, --ledger, --mnemonic must be set");
    }
}

std::unique_ptr<ISigner> ResolveSigner(const CredentialOptions& options, IDeviceHub& hub) {
    CheckCredentialSelection(options);

    std::string pathError;
    auto path = wallet::DerivationPath::FromString(options.derivationPath, &pathError);
    if (!path) {
        throw SignerException(SignerError::INVALID_DERIVATION_PATH, pathError);
    }

    if (!options.privateKeyHex.empty()) {
        auto key = PrivateKey::FromHex(options.privateKeyHex);
        if (!key) {
            throw SignerException(SignerError::INVALID_PRIVATE_KEY_ENCODING,
                                  "private key must be 64 hex digits encoding a scalar in [1, n-1]");
        }
        LOG_DEBUG(util::LogCategory::Signer) << "Using raw private key";
        return std::make_unique<KeySigner>(std::move(*key));
    }

    if (!options.mnemonic.empty()) {
        PrivateKey key = wallet::DeriveKeyFromMnemonic(options.mnemonic, *path);
        return std::make_unique<KeySigner>(std::move(key), "mnemonic " + path->ToString());
    }

    return ResolveDevice(*path, options.devicePassphrase, hub);
}

} // namespace sigil
