// SIGIL - Digest Validation
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// A digest is the 32-byte Keccak-256 hash of an EIP-712 encoding. The caller
// either supplies the digest directly or the 66-byte encoding
// 0x19 0x01 || domainSeparator || structHash.

#ifndef SIGIL_SIGNER_DIGEST_H
#define SIGIL_SIGNER_DIGEST_H

#include <sigil/core/types.h>

#include <istream>
#include <vector>

namespace sigil {

/// 32-byte message digest handed to a signer
using Digest = Hash256;

/// Digest size in bytes
constexpr size_t DIGEST_SIZE = Digest::SIZE;

/// Size of the typed-data encoding 0x19 0x01 || domain || struct
constexpr size_t TYPED_DATA_ENCODING_SIZE = 2 + 2 * DIGEST_SIZE;

/// Check that decoded input is exactly one digest
/// @throws DigestLengthException {expected 32, actual bytes.size()}
Digest ValidateDigest(const std::vector<Byte>& bytes);

/// Hash a 66-byte typed-data encoding into its digest
/// @throws DigestLengthException on a size other than 66
/// @throws SignerException(INVALID_TYPED_DATA) when the 0x19 0x01 prefix is missing
Digest HashTypedDataEncoding(const std::vector<Byte>& encoding);

/**
 * Read a hex digest or typed-data encoding until end of stream. Surrounding
 * whitespace and a 0x prefix are ignored. 66 bytes go through
 * HashTypedDataEncoding, anything else through ValidateDigest.
 *
 * @param data Receives the decoded input bytes
 * @throws SignerException(INVALID_DIGEST_ENCODING) when the text is not hex
 * @throws std::runtime_error when the stream fails
 */
Digest ReadDigest(std::istream& in, std::vector<Byte>& data);

} // namespace sigil

#endif // SIGIL_SIGNER_DIGEST_H
