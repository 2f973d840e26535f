// SIGIL - BIP39 Mnemonics
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/wallet/mnemonic.h"
#include "sigil/crypto/hmac.h"
#include "sigil/crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

#include <openssl/crypto.h>

namespace sigil {
namespace wallet {

namespace {

std::string ToLower(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

bool GetBit(const std::vector<Byte>& bits, size_t pos) {
    return (bits[pos / 8] >> (7 - pos % 8)) & 1;
}

void SetBit(std::vector<Byte>& bits, size_t pos) {
    bits[pos / 8] |= static_cast<Byte>(0x80 >> (pos % 8));
}

bool ValidWordCount(size_t count) {
    return count >= 12 && count <= 24 && count % 3 == 0;
}

} // anonymous namespace

const char* MnemonicStatusString(MnemonicStatus status) {
    switch (status) {
        case MnemonicStatus::OK: return "ok";
        case MnemonicStatus::BAD_WORD_COUNT: return "word count must be 12, 15, 18, 21 or 24";
        case MnemonicStatus::UNKNOWN_WORD: return "word not in the BIP39 English wordlist";
        case MnemonicStatus::BAD_CHECKSUM: return "checksum mismatch";
    }
    return "unknown";
}

std::vector<std::string> Mnemonic::SplitWords(const std::string& mnemonic) {
    std::vector<std::string> words;
    std::istringstream in(mnemonic);
    for (std::string word; in >> word;) {
        words.push_back(ToLower(std::move(word)));
    }
    return words;
}

std::string Mnemonic::Normalize(const std::string& mnemonic) {
    std::string out;
    for (const std::string& word : SplitWords(mnemonic)) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::vector<Byte> Mnemonic::PackIndices(const std::vector<std::string>& words,
                                        std::string* badWord) {
    std::vector<Byte> bits((words.size() * 11 + 7) / 8, 0);
    size_t pos = 0;
    for (const std::string& word : words) {
        int index = GetWordIndex(word);
        if (index < 0) {
            if (badWord) *badWord = word;
            return {};
        }
        for (int bit = 10; bit >= 0; --bit, ++pos) {
            if (index & (1 << bit)) SetBit(bits, pos);
        }
    }
    return bits;
}

// Entropy of ENT bits carries a checksum of ENT/32 bits taken from the top of
// SHA-256(entropy); every 11 bits of entropy || checksum select one word.

std::string Mnemonic::FromEntropy(const Byte* entropy, size_t len) {
    if (!entropy || len < 16 || len > 32 || len % 4 != 0) {
        return "";
    }

    std::vector<Byte> bits(entropy, entropy + len);
    bits.push_back(SHA256Hash(entropy, len)[0]);

    const size_t wordCount = (len * 8 + len / 4) / 11;
    std::string out;
    for (size_t w = 0; w < wordCount; ++w) {
        uint16_t index = 0;
        for (size_t pos = w * 11; pos < w * 11 + 11; ++pos) {
            index = static_cast<uint16_t>((index << 1) | GetBit(bits, pos));
        }
        if (w) out += ' ';
        out += WORDLIST[index];
    }

    OPENSSL_cleanse(bits.data(), bits.size());
    return out;
}

MnemonicStatus Mnemonic::Check(const std::string& mnemonic, std::string* badWord) {
    const std::vector<std::string> words = SplitWords(mnemonic);
    if (!ValidWordCount(words.size())) {
        return MnemonicStatus::BAD_WORD_COUNT;
    }

    std::vector<Byte> bits = PackIndices(words, badWord);
    if (bits.empty()) {
        return MnemonicStatus::UNKNOWN_WORD;
    }

    const size_t checksumBits = words.size() / 3;
    const size_t entropyBytes = (words.size() * 11 - checksumBits) / 8;
    const Byte expected = SHA256Hash(bits.data(), entropyBytes)[0] >> (8 - checksumBits);
    const Byte actual = bits[entropyBytes] >> (8 - checksumBits);
    OPENSSL_cleanse(bits.data(), bits.size());

    if (expected != actual) {
        return MnemonicStatus::BAD_CHECKSUM;
    }
    return MnemonicStatus::OK;
}

std::vector<Byte> Mnemonic::ToEntropy(const std::string& mnemonic) {
    if (Check(mnemonic) != MnemonicStatus::OK) {
        return {};
    }
    const std::vector<std::string> words = SplitWords(mnemonic);
    std::vector<Byte> bits = PackIndices(words, nullptr);

    const size_t entropyBytes = (words.size() * 11 - words.size() / 3) / 8;
    std::vector<Byte> entropy(bits.begin(), bits.begin() + entropyBytes);
    OPENSSL_cleanse(bits.data(), bits.size());
    return entropy;
}

std::array<Byte, BIP39_SEED_SIZE> Mnemonic::ToSeed(const std::string& mnemonic,
                                                   const std::string& passphrase) {
    std::string phrase = Normalize(mnemonic);
    const std::string salt = "mnemonic" + passphrase;

    std::vector<Byte> derived = PBKDF2_SHA512(phrase, std::vector<Byte>(salt.begin(), salt.end()),
                                              BIP39_PBKDF2_ROUNDS, BIP39_SEED_SIZE);
    OPENSSL_cleanse(phrase.data(), phrase.size());

    std::array<Byte, BIP39_SEED_SIZE> seed{};
    if (derived.size() == seed.size()) {
        std::copy(derived.begin(), derived.end(), seed.begin());
        OPENSSL_cleanse(derived.data(), derived.size());
    }
    return seed;
}

std::string Mnemonic::GetWord(uint16_t index) {
    return index < WORDLIST_SIZE ? WORDLIST[index] : "";
}

int Mnemonic::GetWordIndex(const std::string& word) {
    const std::string key = ToLower(word);
    const char* const* first = std::begin(WORDLIST);
    const char* const* last = std::end(WORDLIST);
    const char* const* it = std::lower_bound(first, last, key,
        [](const char* entry, const std::string& value) { return value.compare(entry) > 0; });
    if (it == last || key != *it) {
        return -1;
    }
    return static_cast<int>(it - first);
}

} // namespace wallet
} // namespace sigil
