// SIGIL Sign Tool
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Signs an EIP-712 digest read from stdin with exactly one credential source:
// - a raw private key (--private-key)
// - a BIP39 mnemonic and derivation path (--mnemonic, --hd-paths)
// - a hardware wallet (--ledger, --hd-paths)
//
// stdin carries either the 32-byte digest or the 66-byte encoding
// 0x1901 || domainSeparator || structHash, hex encoded.

#include <sigil/core/error.h>
#include <sigil/core/hex.h>
#include <sigil/signer/digest.h>
#include <sigil/signer/resolver.h>
#include <sigil/util/config.h>
#include <sigil/util/logging.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sigil;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_LOG_LEVEL = "warn";

// ============================================================================
// Help
// ============================================================================

void PrintVersion() {
    std::cout << "sigil-sign v" << VERSION << "\n";
}

void PrintUsage() {
    std::cout << "SIGIL Sign Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: sigil-sign [options] < digest.hex\n";
    std::cout << "\n";
    std::cout << "Reads a hex digest (32 bytes) or EIP-712 encoding (66 bytes, 0x1901...)\n";
    std::cout << "from stdin and prints the signer address and a 65-byte signature.\n";
    std::cout << "\n";
    std::cout << "Credential (exactly one):\n";
    std::cout << "  --private-key=<hex>    Private key to use for signing\n";
    std::cout << "  --mnemonic=\"<words>\"   Mnemonic to use for signing\n";
    std::cout << "  --ledger               Use a hardware wallet for signing\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --hd-paths=<path>      Derivation path for mnemonic or device\n";
    std::cout << "                         (default: " << DEFAULT_DERIVATION_PATH << ")\n";
    std::cout << "  --passphrase=<text>    Passphrase used when opening the device\n";
    std::cout << "  --debugdevice=\"<words>\" Emulate a device holding this mnemonic\n";
    std::cout << "  --conf=<file>          Read options from a config file\n";
    std::cout << "  --loglevel=<level>     trace, debug, info, warn, error, off (default: "
              << DEFAULT_LOG_LEVEL << ")\n";
    std::cout << "  --debug=<category>     Debug output for signer, derive, device, config\n";
    std::cout << "                         or all; may be repeated\n";
    std::cout << "  -noprinttoconsole      Disable log output\n";
    std::cout << "  --help                 Show this help message\n";
    std::cout << "  --version              Show version\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  echo 0x1901... | sigil-sign --ledger\n";
    std::cout << "  echo 0x1901... | sigil-sign --mnemonic=\"test test ... junk\" --hd-paths=\"m/44'/60'/0'/0/1\"\n";
    std::cout << "\n";
}

// ============================================================================
// Setup
// ============================================================================

/// Returns false after printing an error if -loglevel or -debug is unknown
bool SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();

    const std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, DEFAULT_LOG_LEVEL);
    std::optional<util::LogLevel> level = util::ParseLogLevel(levelName);
    if (!level) {
        std::cerr << "Error: unknown log level '" << levelName << "'\n";
        return false;
    }

    // -debug=<category> (repeatable) narrows output to those categories at DEBUG
    std::vector<std::string> debugNames = config.GetList(util::ConfigKeys::DEBUG);
    if (!debugNames.empty()) {
        uint32_t mask = 0;
        for (const auto& name : debugNames) {
            if (name == "1" || name == "true" || name == "all") {
                mask = util::ALL_LOG_CATEGORIES;
                continue;
            }
            auto category = util::ParseLogCategory(name);
            if (!category) {
                std::cerr << "Error: unknown debug category '" << name << "'\n";
                return false;
            }
            mask |= util::LogCategoryBit(*category);
        }
        logger.SetCategoryMask(mask | util::LogCategoryBit(util::LogCategory::Default));
        if (*level > util::LogLevel::Debug) {
            level = util::LogLevel::Debug;
        }
    }
    logger.SetLevel(*level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::StderrSink::Options options;
        options.timestamps = *level <= util::LogLevel::Debug;
        logger.AddSink(std::make_shared<util::StderrSink>(options));
    }
    return true;
}

void RegisterKeys(util::ConfigManager& config) {
    for (const char* key : {util::ConfigKeys::PRIVATE_KEY, util::ConfigKeys::MNEMONIC,
                            util::ConfigKeys::LEDGER, util::ConfigKeys::HD_PATHS,
                            util::ConfigKeys::PASSPHRASE, util::ConfigKeys::DEBUG_DEVICE,
                            util::ConfigKeys::CONF, util::ConfigKeys::LOGLEVEL,
                            util::ConfigKeys::DEBUG, util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::HELP,
                            util::ConfigKeys::VERSION}) {
        config.AllowKey(key);
    }
}

CredentialOptions BuildOptions(const util::ConfigManager& config) {
    CredentialOptions options;
    options.privateKeyHex = config.GetString(util::ConfigKeys::PRIVATE_KEY, "");
    options.mnemonic = config.GetString(util::ConfigKeys::MNEMONIC, "");
    options.derivationPath = config.GetString(util::ConfigKeys::HD_PATHS, DEFAULT_DERIVATION_PATH);
    options.devicePassphrase = config.GetString(util::ConfigKeys::PASSPHRASE, "");

    if (config.HasKey(util::ConfigKeys::LEDGER)) {
        auto ledger = config.TryGetBool(util::ConfigKeys::LEDGER);
        if (!ledger) {
            throw std::invalid_argument("--ledger takes no value");
        }
        options.useDevice = *ledger;
    }
    return options;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    RegisterKeys(config);

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }
    if (!config.GetPositional().empty()) {
        std::cerr << "Error: unexpected argument '" << config.GetPositional().front()
                  << "' (the digest is read from stdin)\n";
        return 1;
    }

    if (config.GetBool(util::ConfigKeys::VERSION, false)) {
        PrintVersion();
        return 0;
    }
    if (config.GetBool(util::ConfigKeys::HELP, false)) {
        PrintUsage();
        return 0;
    }

    if (auto confPath = config.TryGetString(util::ConfigKeys::CONF)) {
        auto fileResult = config.ParseFile(*confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.errorMessage;
            if (fileResult.errorLine > 0) {
                std::cerr << " (" << fileResult.errorSource << ":" << fileResult.errorLine << ")";
            }
            std::cerr << "\n";
            return 1;
        }
    }

    if (!SetupLogging(config)) {
        return 1;
    }
    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::Config) << warning;
    }

    int status = 0;
    try {
        CredentialOptions options = BuildOptions(config);
        CheckCredentialSelection(options);

        StaticDeviceHub hub;
        if (auto debugMnemonic = config.TryGetString(util::ConfigKeys::DEBUG_DEVICE)) {
            LOG_INFO(util::LogCategory::Device) << "Registering debug device";
            hub.AddDevice(std::make_shared<DebugDevice>(*debugMnemonic));
        }

        std::vector<Byte> data;
        Digest digest = ReadDigest(std::cin, data);

        std::unique_ptr<ISigner> signer = ResolveSigner(options, hub);
        LOG_INFO(util::LogCategory::Signer) << "Signing with " << signer->Describe();

        Signature signature = signer->Sign(digest);

        std::string problem;
        if (!VerifyRecoveredSigner(digest, signature, signer->GetAddress(), problem)) {
            LOG_WARN(util::LogCategory::Signer) << "Self-check failed: " << problem;
        }

        std::cout << "Data: " << BytesToHex(data) << "\n";
        std::cout << "Signer: " << signer->GetAddress().ToChecksumString() << "\n";
        std::cout << "Signature: " << signature.ToHex() << "\n";
    } catch (const SignerException& e) {
        LOG_ERROR(util::LogCategory::Signer) << SignerErrorString(e.code()) << " ("
                                             << ErrorCategoryString(e.category()) << ")";
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        status = 1;
    }

    util::Logger::Instance().Reset();
    return status;
}
