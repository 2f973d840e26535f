// SIGIL - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Low-level secp256k1 operations on raw big-endian buffers, built on the
// OpenSSL BN / EC_POINT interfaces.
// For high-level key operations, see keys.h instead.

#ifndef SIGIL_CRYPTO_SECP256K1_H
#define SIGIL_CRYPTO_SECP256K1_H

#include <cstdint>
#include <cstddef>
#include <array>
#include "sigil/core/types.h"

namespace sigil {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// floor(n / 2), the largest accepted low-s value
extern const std::array<uint8_t, 32> HALF_ORDER;

/// Scalar size in bytes
constexpr size_t SCALAR_SIZE = 32;

/// Compressed point size (02/03 || x)
constexpr size_t COMPRESSED_SIZE = 33;

/// Uncompressed point size (04 || x || y)
constexpr size_t UNCOMPRESSED_SIZE = 65;

/// Compact signature size (r || s)
constexpr size_t COMPACT_SIGNATURE_SIZE = 64;

// ============================================================================
// Scalar Operations
// ============================================================================

/**
 * Verify that a scalar is a valid private key.
 * Must be in range [1, n-1].
 *
 * @param key 32-byte big-endian scalar
 * @return true if valid
 */
bool IsValidPrivateKey(const uint8_t* key);

/**
 * Tweak a private key by adding a scalar.
 * result = (key + tweak) mod n
 *
 * @param key Original private key (32 bytes)
 * @param tweak Tweak value (32 bytes), must be < n
 * @param result Output buffer (32 bytes)
 * @return false if the tweak is out of range or the result would be zero
 */
bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result);

// ============================================================================
// Point Operations
// ============================================================================

/**
 * Compute the public key key*G.
 *
 * @param privateKey 32-byte private key
 * @param compressed Select 33-byte compressed or 65-byte uncompressed output
 * @param publicKey Output buffer of the selected size
 * @return false if the key is invalid
 */
bool ComputePublicKey(const uint8_t* privateKey, bool compressed, uint8_t* publicKey);

/**
 * Parse a serialized public key and re-serialize it in the requested form.
 * Fails for points not on the curve or at infinity.
 *
 * @param input Serialized public key (33 or 65 bytes)
 * @param len Length of input
 * @param compressed Output form
 * @param output Output buffer of the selected size
 * @return true if the input is a valid point
 */
bool ConvertPublicKey(const uint8_t* input, size_t len, bool compressed, uint8_t* output);

// ============================================================================
// ECDSA Operations
// ============================================================================

/**
 * RFC 6979 deterministic nonce (HMAC-SHA256 DRBG).
 * The message is reduced mod n before seeding, matching libsecp256k1.
 *
 * @param hash 32-byte message hash
 * @param privateKey 32-byte private key
 * @param attempt Retry counter; 0 yields the first candidate
 * @param nonce Output: 32-byte candidate (may be out of range)
 * @return true if the DRBG ran
 */
bool NonceRFC6979(const uint8_t* hash, const uint8_t* privateKey,
                  unsigned int attempt, uint8_t nonce[32]);

/**
 * Sign a 32-byte hash with a recoverable, low-s ECDSA signature.
 * The recovery id is (R.y odd) | (R.x >= n ? 2 : 0), flipped with s.
 *
 * @param hash 32-byte message hash
 * @param privateKey 32-byte private key
 * @param signature Output: 64-byte compact signature (r || s)
 * @param recid Output: recovery id in [0, 3]
 * @return true if successful
 */
bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t signature[COMPACT_SIGNATURE_SIZE], int* recid);

/**
 * Recover the signing public key from a compact signature.
 *
 * @param hash 32-byte message hash
 * @param signature 64-byte compact signature (r || s)
 * @param recid Recovery id in [0, 3]
 * @param publicKey Output: 65-byte uncompressed public key
 * @return true if recovery successful
 */
bool ECDSARecover(const uint8_t* hash, const uint8_t signature[COMPACT_SIGNATURE_SIZE],
                  int recid, uint8_t publicKey[UNCOMPRESSED_SIZE]);

} // namespace secp256k1
} // namespace sigil

#endif // SIGIL_CRYPTO_SECP256K1_H
