// SIGIL - Scriptable Hardware Wallet for Tests
// Copyright (c) 2024 SIGIL Developers
// MIT License

#ifndef SIGIL_TESTS_SIGNER_FAKE_DEVICE_H
#define SIGIL_TESTS_SIGNER_FAKE_DEVICE_H

#include "sigil/crypto/keys.h"
#include "sigil/signer/device.h"

#include <string>
#include <vector>

namespace sigil {
namespace test {

/// Device that signs with a fixed key and fails on request
class FakeWallet : public IHardwareWallet {
public:
    explicit FakeWallet(const std::string& keyHex, std::string name = "fake")
        : name_(std::move(name)) {
        auto key = PrivateKey::FromHex(keyHex);
        if (key) {
            key_ = std::move(*key);
        }
    }

    std::string GetName() const override { return name_; }

    bool Open(const std::string& passphrase, std::string& error) override {
        ++openCount;
        lastPassphrase = passphrase;
        if (!openError.empty()) {
            error = openError;
            return false;
        }
        open_ = true;
        return true;
    }

    void Close() override {
        ++closeCount;
        open_ = false;
    }

    bool DeriveAccount(const wallet::DerivationPath& path,
                       DeviceAccount& account, std::string& error) override {
        if (!deriveError.empty()) {
            error = deriveError;
            return false;
        }
        account.address = key_.GetPublicKey().GetAddress();
        account.path = path;
        return true;
    }

    bool SignTypedData(const DeviceAccount& account, const Digest& digest,
                       std::vector<Byte>& signature, std::string& error) override {
        ++signCount;
        if (!open_) {
            error = "not open";
            return false;
        }
        if (!signError.empty()) {
            error = signError;
            return false;
        }
        if (!overrideSignature.empty()) {
            signature = overrideSignature;
            return true;
        }
        (void)account;
        signature = key_.SignCompact(digest);
        if (signature.size() == 65) {
            signature[64] += vOffset;
        }
        return true;
    }

    bool IsOpen() const { return open_; }
    Address GetKeyAddress() const { return key_.GetPublicKey().GetAddress(); }

    // Failure injection
    std::string openError;
    std::string deriveError;
    std::string signError;
    std::vector<Byte> overrideSignature;
    Byte vOffset{27};

    // Observed calls
    int openCount{0};
    int closeCount{0};
    int signCount{0};
    std::string lastPassphrase;

private:
    std::string name_;
    PrivateKey key_;
    bool open_{false};
};

} // namespace test
} // namespace sigil

#endif // SIGIL_TESTS_SIGNER_FAKE_DEVICE_H
