// SIGIL - Credential Resolution
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_SIGNER_RESOLVER_H
#define SIGIL_SIGNER_RESOLVER_H

#include <sigil/signer/device.h>
#include <sigil/signer/signer.h>

#include <memory>
#include <string>

namespace sigil {

/// First account of the first Ethereum wallet
constexpr const char* DEFAULT_DERIVATION_PATH = "m/44'/60'/0'/0/0";

/// Credential selection; exactly one source must be set
struct CredentialOptions {
    std::string privateKeyHex;
    std::string mnemonic;
    bool useDevice{false};
    std::string derivationPath{DEFAULT_DERIVATION_PATH};
    std::string devicePassphrase;
};

/// @throws SignerException(AMBIGUOUS_CREDENTIAL_SELECTION) unless exactly one source is set
void CheckCredentialSelection(const CredentialOptions& options);

/**
 * Build the signer for the selected credential source.
 *
 * The derivation path is parsed for every source, even the raw key, which
 * ignores it. With a device, more than one connected device is rejected
 * before any of them is opened.
 *
 * @throws SignerException on any selection, credential or device failure
 */
std::unique_ptr<ISigner> ResolveSigner(const CredentialOptions& options, IDeviceHub& hub);

} // namespace sigil

#endif // SIGIL_SIGNER_RESOLVER_H
