// SIGIL - BIP32 Derivation Paths
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_WALLET_PATH_H
#define SIGIL_WALLET_PATH_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil {
namespace wallet {

constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// One path step. `index` never carries the hardened bit.
struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx & ~HARDENED_FLAG), hardened(hard || (idx & HARDENED_FLAG) != 0) {}

    uint32_t GetFullIndex() const { return hardened ? (index | HARDENED_FLAG) : index; }

    /**
     * "44'", "44h", "44H" or "44". A marked number must be below 2^31. An
     * unmarked one may go up to 2^32 - 1, and values from 2^31 up are taken
     * as hardened.
     */
    static std::optional<PathComponent> FromString(const std::string& str);

    /// Decimal index with a trailing ' when hardened
    std::string ToString() const;
};

/// "m" followed by zero or more components; m alone is the master key
class DerivationPath {
public:
    DerivationPath() = default;
    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /**
     * Parse "m/44'/60'/0'/0/0". Needs the "m/" prefix and at least one
     * component; empty segments are rejected. On failure *error (if given)
     * holds a one-line reason.
     */
    static std::optional<DerivationPath> FromString(const std::string& path,
                                                    std::string* error = nullptr);

    const std::vector<PathComponent>& GetComponents() const { return components_; }
    std::vector<uint32_t> GetIndices() const;
    size_t Depth() const { return components_.size(); }
    bool IsEmpty() const { return components_.empty(); }

    /// Canonical form with ' markers
    std::string ToString() const;

    bool operator==(const DerivationPath& other) const;
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

} // namespace wallet
} // namespace sigil

#endif // SIGIL_WALLET_PATH_H
