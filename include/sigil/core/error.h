// SIGIL - Error Codes
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Typed errors raised by the credential, derivation and signing components.
// Low-level primitives report failure through bool/optional; the component
// layer converts those into SignerException.

#ifndef SIGIL_CORE_ERROR_H
#define SIGIL_CORE_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sigil {

/// Broad grouping of signer errors
enum class ErrorCategory {
    Input,
    Credential,
    Device,
    Crypto,
};

/// Every failure a signing operation can end with
enum class SignerError {
    // Input
    AMBIGUOUS_CREDENTIAL_SELECTION,
    DIGEST_LENGTH,
    INVALID_DIGEST_ENCODING,
    INVALID_TYPED_DATA,

    // Credential
    INVALID_MNEMONIC,
    INVALID_DERIVATION_PATH,
    INVALID_PRIVATE_KEY_ENCODING,
    SEED_DERIVATION,
    DERIVATION,
    KEY_DECODE,

    // Device
    NO_DEVICE_FOUND,
    AMBIGUOUS_DEVICE,
    DEVICE_LOCKED_OR_UNAVAILABLE,
    DEVICE_DERIVATION,
    DEVICE_SIGNING,

    // Crypto
    SIGNING,
};

/// Stable name of an error code (e.g. "DIGEST_LENGTH")
const char* SignerErrorString(SignerError error);

/// Stable name of a category (e.g. "Input")
const char* ErrorCategoryString(ErrorCategory category);

/// Category an error code belongs to
ErrorCategory GetErrorCategory(SignerError error);

/**
 * Exception carrying a SignerError code.
 * what() holds the human-readable message only.
 */
class SignerException : public std::runtime_error {
public:
    SignerException(SignerError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    SignerError code() const { return code_; }
    ErrorCategory category() const { return GetErrorCategory(code_); }

private:
    SignerError code_;
};

/// Raised when a digest or typed-data encoding has the wrong length
class DigestLengthException : public SignerException {
public:
    DigestLengthException(size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

} // namespace sigil

#endif // SIGIL_CORE_ERROR_H
