// SIGIL - BIP32 Derivation Paths
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/wallet/path.h"

namespace sigil {
namespace wallet {

namespace {

bool IsHardenedMarker(char c) {
    return c == '\'' || c == 'h' || c == 'H';
}

/// Plain decimal digits only; anything above 2^32 - 1 is rejected
std::optional<uint32_t> ParseIndex(const std::string& digits) {
    if (digits.empty() || digits.size() > 10) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > 0xFFFFFFFFull) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

} // anonymous namespace

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    const bool marked = !str.empty() && IsHardenedMarker(str.back());
    auto value = ParseIndex(marked ? str.substr(0, str.size() - 1) : str);
    if (!value || (marked && *value >= HARDENED_FLAG)) {
        return std::nullopt;
    }
    return PathComponent(*value, marked);
}

std::string PathComponent::ToString() const {
    std::string out = std::to_string(index);
    if (hardened) {
        out += '\'';
    }
    return out;
}

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path,
                                                         std::string* error) {
    std::string reason;
    std::vector<PathComponent> components;

    if (path.empty()) {
        reason = "empty derivation path";
    } else if (path.compare(0, 2, "m/") != 0) {
        reason = "derivation path must start with \"m/\"";
    } else {
        size_t pos = 2;
        while (reason.empty()) {
            size_t next = path.find('/', pos);
            std::string segment = path.substr(pos, next == std::string::npos ? next : next - pos);
            if (segment.empty()) {
                reason = "empty component in derivation path";
            } else if (auto component = PathComponent::FromString(segment)) {
                components.push_back(*component);
            } else {
                reason = "invalid component \"" + segment + "\" in derivation path";
            }
            if (next == std::string::npos) {
                break;
            }
            pos = next + 1;
        }
    }

    if (!reason.empty()) {
        if (error) *error = reason;
        return std::nullopt;
    }
    return DerivationPath(std::move(components));
}

std::vector<uint32_t> DerivationPath::GetIndices() const {
    std::vector<uint32_t> indices;
    indices.reserve(components_.size());
    for (const PathComponent& component : components_) {
        indices.push_back(component.GetFullIndex());
    }
    return indices;
}

std::string DerivationPath::ToString() const {
    std::string out = "m";
    for (const PathComponent& component : components_) {
        out += '/';
        out += component.ToString();
    }
    return out;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
    return GetIndices() == other.GetIndices();
}

} // namespace wallet
} // namespace sigil
