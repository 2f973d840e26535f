// SIGIL - Hardware Wallet Interface
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Abstraction over hardware signing devices. Device calls report failure
// with bool + error string; the signer layer converts those into
// SignerException.

#ifndef SIGIL_SIGNER_DEVICE_H
#define SIGIL_SIGNER_DEVICE_H

#include <sigil/core/types.h>
#include <sigil/signer/digest.h>
#include <sigil/wallet/hdkey.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sigil {

/// An account the device derived, identified by its address
struct DeviceAccount {
    Address address;
    wallet::DerivationPath path;
};

/**
 * A connected hardware wallet.
 *
 * Open must succeed before DeriveAccount or SignTypedData are called.
 * SignTypedData may block until the user approves on the device.
 */
class IHardwareWallet {
public:
    virtual ~IHardwareWallet() = default;

    /// Short device name for logs and descriptions
    virtual std::string GetName() const = 0;

    /// Open a session; passphrase may unlock a hidden wallet
    virtual bool Open(const std::string& passphrase, std::string& error) = 0;

    /// Close the session (no-op when not open)
    virtual void Close() = 0;

    /// Derive the account at path
    virtual bool DeriveAccount(const wallet::DerivationPath& path,
                               DeviceAccount& account, std::string& error) = 0;

    /// Sign a typed-data digest; signature receives r || s || v
    virtual bool SignTypedData(const DeviceAccount& account, const Digest& digest,
                               std::vector<Byte>& signature, std::string& error) = 0;
};

/// Source of connected devices
class IDeviceHub {
public:
    virtual ~IDeviceHub() = default;

    /// Currently connected devices
    virtual std::vector<std::shared_ptr<IHardwareWallet>> Enumerate() = 0;
};

/// Hub over a fixed list of devices
class StaticDeviceHub : public IDeviceHub {
public:
    StaticDeviceHub() = default;
    explicit StaticDeviceHub(std::vector<std::shared_ptr<IHardwareWallet>> devices)
        : devices_(std::move(devices)) {}

    void AddDevice(std::shared_ptr<IHardwareWallet> device) {
        devices_.push_back(std::move(device));
    }

    std::vector<std::shared_ptr<IHardwareWallet>> Enumerate() override { return devices_; }

private:
    std::vector<std::shared_ptr<IHardwareWallet>> devices_;
};

/**
 * Software-emulated hardware wallet backed by a mnemonic.
 *
 * Derivation and signing happen "on device", so the host only ever sees
 * addresses and signatures. The passphrase given to Open is used as the
 * BIP39 passphrase. Signatures carry v = 27/28.
 */
class DebugDevice : public IHardwareWallet {
public:
    /// Maximum supported depth for BIP32-derived keys
    static constexpr size_t MAX_BIP32_PATH = 10;

    explicit DebugDevice(std::string mnemonic, std::string name = "debug");
    ~DebugDevice() override;

    std::string GetName() const override { return name_; }
    bool Open(const std::string& passphrase, std::string& error) override;
    void Close() override;
    bool DeriveAccount(const wallet::DerivationPath& path,
                       DeviceAccount& account, std::string& error) override;
    bool SignTypedData(const DeviceAccount& account, const Digest& digest,
                       std::vector<Byte>& signature, std::string& error) override;

    bool IsOpen() const { return master_.IsValid(); }

private:
    std::optional<wallet::ExtendedKey> Derive(const wallet::DerivationPath& path,
                                              std::string& error) const;

    std::string mnemonic_;
    std::string name_;
    wallet::ExtendedKey master_;
};

/**
 * Owns an opened device and closes it when destroyed.
 * Move-only; a moved-from session owns nothing.
 */
class DeviceSession {
public:
    DeviceSession() = default;

    /// Adopt a device whose Open already succeeded
    explicit DeviceSession(std::shared_ptr<IHardwareWallet> device)
        : device_(std::move(device)) {}

    ~DeviceSession() { Close(); }

    DeviceSession(DeviceSession&& other) noexcept : device_(std::move(other.device_)) {}
    DeviceSession& operator=(DeviceSession&& other) noexcept;

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    bool IsOpen() const { return device_ != nullptr; }
    IHardwareWallet* operator->() const { return device_.get(); }
    IHardwareWallet& operator*() const { return *device_; }

    /// Close the device now
    void Close();

private:
    std::shared_ptr<IHardwareWallet> device_;
};

} // namespace sigil

#endif // SIGIL_SIGNER_DEVICE_H
