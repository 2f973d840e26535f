// SIGIL - Error Codes
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/core/error.h"

namespace sigil {

const char* SignerErrorString(SignerError error) {
    switch (error) {
        case SignerError::AMBIGUOUS_CREDENTIAL_SELECTION: return "AMBIGUOUS_CREDENTIAL_SELECTION";
        case SignerError::DIGEST_LENGTH: return "DIGEST_LENGTH";
        case SignerError::INVALID_DIGEST_ENCODING: return "INVALID_DIGEST_ENCODING";
        case SignerError::INVALID_TYPED_DATA: return "INVALID_TYPED_DATA";
        case SignerError::INVALID_MNEMONIC: return "INVALID_MNEMONIC";
        case SignerError::INVALID_DERIVATION_PATH: return "INVALID_DERIVATION_PATH";
        case SignerError::INVALID_PRIVATE_KEY_ENCODING: return "INVALID_PRIVATE_KEY_ENCODING";
        case SignerError::SEED_DERIVATION: return "SEED_DERIVATION";
        case SignerError::DERIVATION: return "DERIVATION";
        case SignerError::KEY_DECODE: return "KEY_DECODE";
        case SignerError::NO_DEVICE_FOUND: return "NO_DEVICE_FOUND";
        case SignerError::AMBIGUOUS_DEVICE: return "AMBIGUOUS_DEVICE";
        case SignerError::DEVICE_LOCKED_OR_UNAVAILABLE: return "DEVICE_LOCKED_OR_UNAVAILABLE";
        case SignerError::DEVICE_DERIVATION: return "DEVICE_DERIVATION";
        case SignerError::DEVICE_SIGNING: return "DEVICE_SIGNING";
        case SignerError::SIGNING: return "SIGNING";
        default: return "UNKNOWN";
    }
}

const char* ErrorCategoryString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Input: return "Input";
        case ErrorCategory::Credential: return "Credential";
        case ErrorCategory::Device: return "Device";
        case ErrorCategory::Crypto: return "Crypto";
        default: return "Unknown";
    }
}

ErrorCategory GetErrorCategory(SignerError error) {
    switch (error) {
        case SignerError::AMBIGUOUS_CREDENTIAL_SELECTION:
        case SignerError::DIGEST_LENGTH:
        case SignerError::INVALID_DIGEST_ENCODING:
        case SignerError::INVALID_TYPED_DATA:
            return ErrorCategory::Input;

        case SignerError::INVALID_MNEMONIC:
        case SignerError::INVALID_DERIVATION_PATH:
        case SignerError::INVALID_PRIVATE_KEY_ENCODING:
        case SignerError::SEED_DERIVATION:
        case SignerError::DERIVATION:
        case SignerError::KEY_DECODE:
            return ErrorCategory::Credential;

        case SignerError::NO_DEVICE_FOUND:
        case SignerError::AMBIGUOUS_DEVICE:
        case SignerError::DEVICE_LOCKED_OR_UNAVAILABLE:
        case SignerError::DEVICE_DERIVATION:
        case SignerError::DEVICE_SIGNING:
            return ErrorCategory::Device;

        case SignerError::SIGNING:
        default:
            return ErrorCategory::Crypto;
    }
}

DigestLengthException::DigestLengthException(size_t expected, size_t actual)
    : SignerException(SignerError::DIGEST_LENGTH,
                      "invalid digest length: expected " + std::to_string(expected) +
                      " bytes, got " + std::to_string(actual))
    , expected_(expected)
    , actual_(actual) {}

} // namespace sigil
