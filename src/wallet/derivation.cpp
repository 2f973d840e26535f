// SIGIL - Mnemonic Key Derivation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/wallet/derivation.h"

#include "sigil/core/error.h"
#include "sigil/util/logging.h"

#include <openssl/crypto.h>

#include <algorithm>

namespace sigil {
namespace wallet {

PrivateKey DeriveKeyFromMnemonic(const std::string& mnemonic,
                                 const DerivationPath& path,
                                 const std::string& passphrase) {
    std::string badWord;
    MnemonicStatus status = Mnemonic::Check(mnemonic, &badWord);
    if (status != MnemonicStatus::OK) {
        std::string message = std::string("invalid mnemonic: ") + MnemonicStatusString(status);
        // Word count and checksum failures say nothing about the words themselves
        if (status == MnemonicStatus::UNKNOWN_WORD) {
            message += " \"" + badWord + "\"";
        }
        throw SignerException(SignerError::INVALID_MNEMONIC, message);
    }

    std::array<Byte, BIP39_SEED_SIZE> seed;
    {
        SIGIL_LOG_TIMER(util::LogCategory::Derive, "BIP39 seed stretch");
        seed = Mnemonic::ToSeed(mnemonic, passphrase);
    }

    bool seedOk = std::any_of(seed.begin(), seed.end(), [](Byte b) { return b != 0; });
    ExtendedKey master;
    if (seedOk) {
        master = ExtendedKey::FromBIP39Seed(seed);
    }
    OPENSSL_cleanse(seed.data(), seed.size());

    if (!seedOk) {
        throw SignerException(SignerError::SEED_DERIVATION, "mnemonic seed stretch failed");
    }
    if (!master.IsValid()) {
        throw SignerException(SignerError::SEED_DERIVATION, "seed produced an invalid master key");
    }

    LOG_DEBUG(util::LogCategory::Derive) << "Deriving " << path.ToString()
                                         << " (depth " << path.Depth() << ")";

    std::optional<ExtendedKey> child = master.DerivePath(path);
    if (!child) {
        throw SignerException(SignerError::DERIVATION,
                              "child key derivation failed along " + path.ToString());
    }

    std::optional<PrivateKey> key = child->GetPrivateKey();
    if (!key || !key->IsValid()) {
        throw SignerException(SignerError::KEY_DECODE,
                              "derived scalar is not a valid private key");
    }

    LOG_DEBUG(util::LogCategory::Derive) << "Derived key at depth "
                                         << static_cast<int>(child->GetDepth())
                                         << ", child " << child->GetChildIndex()
                                         << ", parent fingerprint " << child->GetParentFingerprint();
    return std::move(*key);
}

} // namespace wallet
} // namespace sigil
