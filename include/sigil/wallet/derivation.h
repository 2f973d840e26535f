// SIGIL - Mnemonic Key Derivation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_WALLET_DERIVATION_H
#define SIGIL_WALLET_DERIVATION_H

#include <sigil/crypto/keys.h>
#include <sigil/wallet/hdkey.h>

#include <string>

namespace sigil {
namespace wallet {

/**
 * Derive the account private key for a BIP39 mnemonic along a BIP32 path.
 *
 * Deterministic in (mnemonic, path, passphrase).
 *
 * @throws SignerException with INVALID_MNEMONIC, SEED_DERIVATION, DERIVATION
 *         or KEY_DECODE
 */
PrivateKey DeriveKeyFromMnemonic(const std::string& mnemonic,
                                 const DerivationPath& path,
                                 const std::string& passphrase = "");

} // namespace wallet
} // namespace sigil

#endif // SIGIL_WALLET_DERIVATION_H
