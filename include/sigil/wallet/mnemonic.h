// SIGIL - BIP39 Mnemonics
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// English wordlist only. Words are matched case-insensitively and any run of
// whitespace separates them; seeds are computed over the normalised phrase.

#ifndef SIGIL_WALLET_MNEMONIC_H
#define SIGIL_WALLET_MNEMONIC_H

#include <sigil/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sigil {
namespace wallet {

constexpr size_t BIP39_SEED_SIZE = 64;
constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;

enum class MnemonicStatus {
    OK = 0,
    BAD_WORD_COUNT,
    UNKNOWN_WORD,
    BAD_CHECKSUM,
};

/// Lower-case reason, suitable after "invalid mnemonic: "
const char* MnemonicStatusString(MnemonicStatus status);

class Mnemonic {
public:
    static constexpr size_t WORDLIST_SIZE = 2048;

    /// Lower-case words joined by single spaces
    static std::string Normalize(const std::string& mnemonic);

    /**
     * Word count (12/15/18/21/24), then wordlist membership, then checksum.
     * For UNKNOWN_WORD, *badWord (if given) receives the offending word.
     */
    static MnemonicStatus Check(const std::string& mnemonic, std::string* badWord = nullptr);

    static bool Validate(const std::string& mnemonic) {
        return Check(mnemonic) == MnemonicStatus::OK;
    }

    /// 16, 20, 24, 28 or 32 bytes of entropy; "" for any other length
    static std::string FromEntropy(const Byte* entropy, size_t len);

    /// Inverse of FromEntropy; empty if the phrase fails Check()
    static std::vector<Byte> ToEntropy(const std::string& mnemonic);

    /// PBKDF2-HMAC-SHA512(phrase, "mnemonic" + passphrase, 2048). All zero
    /// if the KDF fails.
    static std::array<Byte, BIP39_SEED_SIZE> ToSeed(const std::string& mnemonic,
                                                    const std::string& passphrase = "");

    /// "" when out of range
    static std::string GetWord(uint16_t index);

    /// -1 when not in the list
    static int GetWordIndex(const std::string& word);

    static constexpr size_t WordCount() { return WORDLIST_SIZE; }

private:
    static const char* const WORDLIST[WORDLIST_SIZE];

    static std::vector<std::string> SplitWords(const std::string& mnemonic);

    /// 11-bit word indices packed MSB first, or empty on an unknown word
    static std::vector<Byte> PackIndices(const std::vector<std::string>& words,
                                         std::string* badWord);
};

} // namespace wallet
} // namespace sigil

#endif // SIGIL_WALLET_MNEMONIC_H
